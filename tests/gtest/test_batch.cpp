// =============================================================================
// Batch Query Tests
// =============================================================================

#include <gtest/gtest.h>
#include "clam/batch.hpp"
#include "clam/thread_pool.hpp"
#include "clam/tree.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <stdexcept>

using namespace clam;

class BatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool = std::make_unique<ThreadPool>(4);
        dataset = test_support::dense_dataset(test_support::random_points(500, 3, 31));
        space = std::make_unique<GenericMetricSpace<DenseVector>>(dataset, test_support::euclidean());
        tree = std::make_unique<Tree>(Tree::build(*space, BuildConfig(), pool.get()));
        engine = std::make_unique<SearchEngine>(*tree);
    }

    void TearDown() override {
        engine.reset();
        tree.reset();
        space.reset();
        pool.reset();
    }

    std::vector<QueryDistance> bind_all(const std::vector<DenseVector>& points) const {
        std::vector<QueryDistance> queries;
        for (const auto& point : points) queries.push_back(space->bind(point));
        return queries;
    }

    std::unique_ptr<ThreadPool> pool;
    std::shared_ptr<const Dataset<DenseVector>> dataset;
    std::unique_ptr<GenericMetricSpace<DenseVector>> space;
    std::unique_ptr<Tree> tree;
    std::unique_ptr<SearchEngine> engine;
};

TEST_F(BatchTest, OutcomesFollowQueryOrder) {
    auto queries = bind_all(test_support::random_points(64, 3, 32));
    BatchRunner runner(*engine, *pool);

    auto outcomes = runner.knn(queries, 7, KnnAlgorithm::BestFirst);
    ASSERT_EQ(outcomes.size(), queries.size());
    for (size_t i = 0; i < queries.size(); ++i) {
        ASSERT_TRUE(outcomes[i].ok()) << outcomes[i].message;
        EXPECT_EQ(outcomes[i].result->hits, engine->knn(queries[i], 7).hits) << "query " << i;
        EXPECT_EQ(outcomes[i].result->algorithm, "best-first");
    }
}

TEST_F(BatchTest, RangeAndApproximateBatches) {
    auto queries = bind_all(test_support::random_points(20, 3, 33));
    BatchRunner runner(*engine, *pool);

    auto ranges = runner.range(queries, 0.2);
    auto approximate = runner.approximate_knn(queries, 5, 0.0);
    for (size_t i = 0; i < queries.size(); ++i) {
        ASSERT_TRUE(ranges[i].ok());
        EXPECT_EQ(ranges[i].result->hits, engine->range(queries[i], 0.2, RangeAlgorithm::Linear).hits);
        ASSERT_TRUE(approximate[i].ok());
        EXPECT_EQ(approximate[i].result->hits, test_support::brute_force(queries[i], 500, 5));
    }
}

TEST_F(BatchTest, FailingQueryIsIsolated) {
    auto queries = bind_all(test_support::random_points(10, 3, 34));
    queries[3] = [](Index) -> Distance { throw std::runtime_error("query source went away"); };
    queries[6] = space->bind({1.0f, 2.0f});   // wrong dimensionality

    BatchRunner runner(*engine, *pool);
    auto outcomes = runner.knn(queries, 3);

    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (i == 3) {
            EXPECT_EQ(outcomes[i].error, ErrorCode::INTERNAL_ERROR);
            EXPECT_NE(outcomes[i].message.find("query source went away"), std::string::npos);
            EXPECT_FALSE(outcomes[i].result.has_value());
        } else if (i == 6) {
            EXPECT_EQ(outcomes[i].error, ErrorCode::DISTANCE_COMPUTATION_FAILURE);
        } else {
            ASSERT_TRUE(outcomes[i].ok()) << outcomes[i].message;
            EXPECT_EQ(outcomes[i].result->hits.size(), 3u);
        }
    }

    BatchSummary summary = BatchRunner::summarize(outcomes);
    EXPECT_EQ(summary.queries, 10u);
    EXPECT_EQ(summary.failures, 2u);
    EXPECT_GT(summary.distance_calls, 0u);
}

// Metrics that throw something other than std::exception still fail only
// their own query
TEST_F(BatchTest, NonStandardMetricExceptionIsIsolated) {
    auto throwing = make_function_metric<DenseVector>("throws-int",
        [](const DenseVector& a, const DenseVector& b) -> Distance {
            if (a[0] > 5.0f) throw 42;
            double sum = 0.0;
            for (size_t d = 0; d < a.size(); ++d) {
                const double diff = static_cast<double>(a[d]) - b[d];
                sum += diff * diff;
            }
            return std::sqrt(sum);
        });
    GenericMetricSpace<DenseVector> fragile(dataset, throwing);

    auto points = test_support::random_points(8, 3, 37);
    points[2][0] = 9.0f;
    std::vector<QueryDistance> queries;
    for (const auto& point : points) queries.push_back(fragile.bind(point));

    BatchRunner runner(*engine, *pool);
    auto outcomes = runner.knn(queries, 4);
    ASSERT_EQ(outcomes.size(), points.size());
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (i == 2) {
            EXPECT_EQ(outcomes[i].error, ErrorCode::DISTANCE_COMPUTATION_FAILURE);
            EXPECT_NE(outcomes[i].message.find("non-standard exception"), std::string::npos);
        } else {
            ASSERT_TRUE(outcomes[i].ok()) << outcomes[i].message;
            EXPECT_EQ(outcomes[i].result->hits, engine->knn(queries[i], 4).hits);
        }
    }
}

TEST_F(BatchTest, NonStandardQueryExceptionIsInternalError) {
    auto queries = bind_all(test_support::random_points(6, 3, 38));
    queries[4] = [](Index) -> Distance { throw 42; };

    BatchRunner runner(*engine, *pool);
    auto outcomes = runner.knn(queries, 3);
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (i == 4) {
            EXPECT_EQ(outcomes[i].error, ErrorCode::INTERNAL_ERROR);
            EXPECT_FALSE(outcomes[i].result.has_value());
        } else {
            EXPECT_TRUE(outcomes[i].ok()) << outcomes[i].message;
        }
    }
    EXPECT_EQ(BatchRunner::summarize(outcomes).failures, 1u);
}

TEST_F(BatchTest, InvalidKFailsEveryQuery) {
    auto queries = bind_all(test_support::random_points(5, 3, 35));
    BatchRunner runner(*engine, *pool);

    auto outcomes = runner.knn(queries, 0);
    for (const auto& outcome : outcomes) {
        EXPECT_FALSE(outcome.ok());
        EXPECT_EQ(outcome.error, ErrorCode::INVALID_K);
    }
    EXPECT_EQ(BatchRunner::summarize(outcomes).failures, 5u);
}

TEST_F(BatchTest, EmptyBatch) {
    BatchRunner runner(*engine, *pool);
    auto outcomes = runner.knn({}, 3);
    EXPECT_TRUE(outcomes.empty());

    BatchSummary summary = BatchRunner::summarize(outcomes);
    EXPECT_EQ(summary.queries, 0u);
    EXPECT_EQ(summary.failures, 0u);
}

// Single-threaded pool runs the batch inline with identical results
TEST_F(BatchTest, SingleWorkerPool) {
    auto queries = bind_all(test_support::random_points(16, 3, 36));
    ThreadPool single(1);
    BatchRunner serial(*engine, single);
    BatchRunner parallel(*engine, *pool);

    auto a = serial.knn(queries, 4);
    auto b = parallel.knn(queries, 4);
    for (size_t i = 0; i < queries.size(); ++i) {
        EXPECT_EQ(a[i].result->hits, b[i].result->hits);
    }
}
