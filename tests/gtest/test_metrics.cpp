// =============================================================================
// Metric Library Tests
// =============================================================================

#include <gtest/gtest.h>
#include "clam/error.hpp"
#include "clam/metrics.hpp"

#include <algorithm>
#include <cmath>

using namespace clam;
using namespace clam::metrics;

class MetricsTest : public ::testing::Test {
protected:
    const DenseVector origin{0.0f, 0.0f};
    const DenseVector three_four{3.0f, 4.0f};
};

TEST_F(MetricsTest, Euclidean) {
    EuclideanMetric metric;
    EXPECT_DOUBLE_EQ(metric.distance(origin, three_four), 5.0);
    EXPECT_DOUBLE_EQ(metric.distance(three_four, three_four), 0.0);
    EXPECT_EQ(metric.name(), "euclidean");
}

TEST_F(MetricsTest, Manhattan) {
    ManhattanMetric metric;
    EXPECT_DOUBLE_EQ(metric.distance(origin, three_four), 7.0);
}

TEST_F(MetricsTest, Chebyshev) {
    ChebyshevMetric metric;
    EXPECT_DOUBLE_EQ(metric.distance(origin, three_four), 4.0);
}

TEST_F(MetricsTest, Cosine) {
    CosineMetric metric;
    EXPECT_NEAR(metric.distance({1.0f, 0.0f}, {0.0f, 1.0f}), 1.0, 1e-12);
    EXPECT_NEAR(metric.distance({1.0f, 1.0f}, {2.0f, 2.0f}), 0.0, 1e-7);
    EXPECT_NEAR(metric.distance({1.0f, 0.0f}, {-1.0f, 0.0f}), 2.0, 1e-12);

    // Parallel vectors of different length are at distance 0
    EXPECT_FALSE(metric.has_identity());
    EXPECT_TRUE(metric.has_non_negativity());
    EXPECT_TRUE(metric.has_symmetry());
    EXPECT_FALSE(metric.obeys_triangle_inequality());
}

TEST_F(MetricsTest, CosineZeroVector) {
    CosineMetric metric;
    EXPECT_DOUBLE_EQ(metric.distance(origin, origin), 0.0);
    EXPECT_DOUBLE_EQ(metric.distance(origin, three_four), 1.0);
}

TEST_F(MetricsTest, DenseDimensionMismatch) {
    EuclideanMetric euclidean;
    ManhattanMetric manhattan;
    ChebyshevMetric chebyshev;
    CosineMetric cosine;
    const DenseVector longer{1.0f, 2.0f, 3.0f};

    EXPECT_THROW(euclidean.distance(origin, longer), InvalidArgumentError);
    EXPECT_THROW(manhattan.distance(origin, longer), InvalidArgumentError);
    EXPECT_THROW(chebyshev.distance(origin, longer), InvalidArgumentError);
    EXPECT_THROW(cosine.distance(origin, longer), InvalidArgumentError);
}

TEST_F(MetricsTest, Hamming) {
    HammingMetric metric;
    EXPECT_DOUBLE_EQ(metric.distance("karolin", "kathrin"), 3.0);
    EXPECT_DOUBLE_EQ(metric.distance("abc", "abcde"), 2.0);
    EXPECT_DOUBLE_EQ(metric.distance("", ""), 0.0);
}

TEST_F(MetricsTest, Levenshtein) {
    LevenshteinMetric metric;
    EXPECT_DOUBLE_EQ(metric.distance("kitten", "sitting"), 3.0);
    EXPECT_DOUBLE_EQ(metric.distance("sitting", "kitten"), 3.0);
    EXPECT_DOUBLE_EQ(metric.distance("", "abc"), 3.0);
    EXPECT_DOUBLE_EQ(metric.distance("flaw", "lawn"), 2.0);
    EXPECT_DOUBLE_EQ(metric.distance("same", "same"), 0.0);
    EXPECT_TRUE(metric.is_expensive());
}

TEST_F(MetricsTest, Jaccard) {
    JaccardMetric metric;
    EXPECT_DOUBLE_EQ(metric.distance({1, 2, 3}, {2, 3, 4}), 0.5);
    EXPECT_DOUBLE_EQ(metric.distance({}, {}), 0.0);
    EXPECT_DOUBLE_EQ(metric.distance({1}, {}), 1.0);
    EXPECT_DOUBLE_EQ(metric.distance({5, 9}, {5, 9}), 0.0);
}

// Duplicates or unsorted ids would break identity, so they are rejected
TEST_F(MetricsTest, JaccardRejectsMalformedSets) {
    JaccardMetric metric;
    EXPECT_THROW(metric.distance({1, 1}, {1}), InvalidArgumentError);
    EXPECT_THROW(metric.distance({1}, {3, 1}), InvalidArgumentError);
    EXPECT_THROW(metric.distance({2, 4, 4, 7}, {}), InvalidArgumentError);
    EXPECT_DOUBLE_EQ(metric.distance({1}, {1}), 0.0);
}

TEST_F(MetricsTest, FunctionMetricWrapsCallable) {
    auto metric = make_function_metric<double>("absolute", [](const double& a, const double& b) {
        return std::abs(a - b);
    }, true);

    EXPECT_EQ(metric->name(), "absolute");
    EXPECT_DOUBLE_EQ(metric->distance(2.0, -1.5), 3.5);
    EXPECT_TRUE(metric->is_expensive());
    EXPECT_TRUE(metric->obeys_triangle_inequality());
}

TEST_F(MetricsTest, Registry) {
    auto names = dense_metric_names();
    EXPECT_NE(std::find(names.begin(), names.end(), "euclidean"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "cosine"), names.end());

    auto strings = string_metric_names();
    EXPECT_NE(std::find(strings.begin(), strings.end(), "levenshtein"), strings.end());

    EXPECT_EQ(make_dense_metric("manhattan")->name(), "manhattan");
    EXPECT_EQ(make_string_metric("hamming")->name(), "hamming");
}

TEST_F(MetricsTest, RegistryRejectsUnknownName) {
    EXPECT_THROW(make_dense_metric("levenshtein"), InvalidArgumentError);
    EXPECT_THROW(make_string_metric("nope"), InvalidArgumentError);
}
