// =============================================================================
// Cakes Facade Tests
// =============================================================================

#include <gtest/gtest.h>
#include "clam/cakes.hpp"
#include "test_helpers.hpp"

using namespace clam;

class CakesTest : public ::testing::Test {
protected:
    void SetUp() override {
        points = test_support::random_points(300, 4, 41);
        dataset = test_support::dense_dataset(points);
    }

    std::vector<DenseVector> points;
    std::shared_ptr<const Dataset<DenseVector>> dataset;
};

TEST_F(CakesTest, BuildAndQuery) {
    auto index = Cakes<DenseVector>::build(dataset, test_support::euclidean(), BuildConfig(),
                                           CacheConfig(), 2);
    EXPECT_EQ(index.cardinality(), 300u);
    EXPECT_EQ(index.pool().num_threads(), 2u);
    EXPECT_EQ(index.tree().cardinality(), 300u);

    DenseVector query = {0.5f, 0.5f, 0.5f, 0.5f};
    QueryDistance reference = index.space().bind(query);
    auto expected = test_support::brute_force(reference, 300, 8);

    for (KnnAlgorithm algorithm : all_knn_algorithms()) {
        EXPECT_EQ(index.knn(query, 8, algorithm).hits, expected);
    }
    EXPECT_EQ(index.approximate_knn(query, 8, 0.0).hits, expected);

    auto within = index.range(query, 0.4);
    EXPECT_EQ(within.hits, index.range(query, 0.4, RangeAlgorithm::Linear).hits);
}

TEST_F(CakesTest, ItemQueries) {
    auto index = Cakes<DenseVector>::build(dataset, test_support::euclidean());

    auto neighbors = index.knn_of(12, 4);
    ASSERT_EQ(neighbors.hits.size(), 4u);
    EXPECT_EQ(neighbors.hits[0].index, 12u);

    auto self = index.range_of(12, 0.0);
    ASSERT_EQ(self.hits.size(), 1u);
    EXPECT_EQ(self.hits[0].index, 12u);
}

TEST_F(CakesTest, BatchMethods) {
    auto index = Cakes<DenseVector>::build(dataset, test_support::euclidean(), BuildConfig(),
                                           CacheConfig(), 3);
    auto queries = test_support::random_points(12, 4, 42);
    queries.push_back({1.0f, 2.0f});   // dimension mismatch

    auto knn = index.batch_knn(queries, 5);
    auto approximate = index.batch_approximate_knn(queries, 5, 0.0);
    auto range = index.batch_range(queries, 0.3);
    ASSERT_EQ(knn.size(), queries.size());

    for (size_t i = 0; i + 1 < queries.size(); ++i) {
        ASSERT_TRUE(knn[i].ok());
        EXPECT_EQ(knn[i].result->hits, index.knn(queries[i], 5).hits);
        EXPECT_EQ(approximate[i].result->hits, knn[i].result->hits);
        EXPECT_EQ(range[i].result->hits, index.range(queries[i], 0.3).hits);
    }

    const size_t bad = queries.size() - 1;
    EXPECT_EQ(knn[bad].error, ErrorCode::DISTANCE_COMPUTATION_FAILURE);
    EXPECT_EQ(range[bad].error, ErrorCode::DISTANCE_COMPUTATION_FAILURE);
}

TEST_F(CakesTest, FreeFunctions) {
    auto index = clam::build(dataset, test_support::euclidean());
    DenseVector query = points[99];

    auto hits = clam::knn(index, query, 3);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].index, 99u);

    auto within = clam::range(index, query, 0.0);
    ASSERT_EQ(within.size(), 1u);
    EXPECT_EQ(within[0].index, 99u);
}

TEST_F(CakesTest, StringIndex) {
    auto words = test_support::random_words(120, 6, 43);
    std::shared_ptr<const Dataset<std::string>> corpus = std::make_shared<const StringDataset>(words);
    auto index = clam::build<std::string>(corpus, std::make_shared<metrics::LevenshteinMetric>());

    auto result = index.knn("abc", 5);
    EXPECT_EQ(result.hits, test_support::brute_force(index.space().bind("abc"), 120, 5));
}

TEST_F(CakesTest, MovedIndexStillAnswers) {
    auto first = Cakes<DenseVector>::build(dataset, test_support::euclidean(), BuildConfig(),
                                           CacheConfig(), 2);
    auto expected = first.knn_of(7, 5).hits;

    Cakes<DenseVector> second = std::move(first);
    EXPECT_EQ(second.knn_of(7, 5).hits, expected);
}

TEST_F(CakesTest, InvalidInputs) {
    EXPECT_THROW(Cakes<DenseVector>::build(test_support::dense_dataset({}), test_support::euclidean()),
                 EmptyDatasetError);

    BuildConfig bad;
    bad.min_cardinality = 0;
    EXPECT_THROW(Cakes<DenseVector>::build(dataset, test_support::euclidean(), bad), InvalidConfigError);

    auto index = Cakes<DenseVector>::build(dataset, test_support::euclidean());
    EXPECT_THROW(index.knn_of(0, 301), InvalidKError);
    EXPECT_THROW(index.range_of(0, -1.0), InvalidArgumentError);
}
