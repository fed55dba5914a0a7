// =============================================================================
// Thread Pool Tests
// =============================================================================

#include <gtest/gtest.h>
#include "clam/thread_config.hpp"
#include "clam/thread_pool.hpp"
#include "clam/util/threading.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <numeric>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace clam;

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool = std::make_unique<ThreadPool>(4);
    }

    void TearDown() override {
        pool.reset();
    }

    std::unique_ptr<ThreadPool> pool;
};

TEST_F(ThreadPoolTest, SubmitReturnsValue) {
    auto future = pool->submit([](int a, int b) { return a * b; }, 6, 7);
    EXPECT_EQ(future.get(), 42);
    EXPECT_EQ(pool->num_threads(), 4u);
}

TEST_F(ThreadPoolTest, ZeroThreadsMeansOne) {
    ThreadPool single(0);
    EXPECT_EQ(single.num_threads(), 1u);
    EXPECT_EQ(single.submit([] { return 5; }).get(), 5);
}

TEST_F(ThreadPoolTest, ParallelForVisitsEveryIndexOnce) {
    std::vector<std::atomic<int>> visits(10000);
    pool->parallel_for(0, visits.size(), [&](size_t i) { visits[i].fetch_add(1); });

    for (size_t i = 0; i < visits.size(); ++i) {
        ASSERT_EQ(visits[i].load(), 1) << "index " << i;
    }
}

TEST_F(ThreadPoolTest, ParallelForEmptyRange) {
    bool called = false;
    pool->parallel_for(5, 5, [&](size_t) { called = true; });
    EXPECT_FALSE(called);
}

// A nested loop from a worker runs inline instead of waiting on the pool
TEST_F(ThreadPoolTest, NestedParallelForRunsInline) {
    std::atomic<size_t> total{0};
    std::atomic<bool> saw_worker{false};

    pool->parallel_for(0, 16, [&](size_t) {
        if (pool->in_worker_thread()) saw_worker = true;
        pool->parallel_for(0, 100, [&](size_t j) { total += j; });
    });

    EXPECT_EQ(total.load(), 16u * 4950u);
    EXPECT_TRUE(saw_worker.load());
    EXPECT_FALSE(pool->in_worker_thread());
}

TEST_F(ThreadPoolTest, ExceptionsReachTheCaller) {
    auto future = pool->submit([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    EXPECT_THROW(pool->parallel_for(0, 1000, [](size_t i) {
        if (i == 517) throw std::invalid_argument("bad index");
    }), std::invalid_argument);

    // Still usable afterwards
    EXPECT_EQ(pool->submit([] { return 1; }).get(), 1);
}

// A non-std exception is rethrown only after every other chunk has finished
TEST_F(ThreadPoolTest, ParallelForWaitsForAllChunksBeforeRethrow) {
    std::atomic<int> active{0};
    std::atomic<size_t> finished{0};

    EXPECT_THROW(pool->parallel_for(0, 64, [&](size_t i) {
        if (i == 0) throw 42;
        ++active;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --active;
        ++finished;
    }), int);

    EXPECT_EQ(active.load(), 0);
    EXPECT_GE(finished.load(), 62u);
    EXPECT_EQ(pool->submit([] { return 1; }).get(), 1);
}

// The pending count is raised before a task becomes stealable, so it never
// wraps below zero while workers race the submitters
TEST_F(ThreadPoolTest, PendingCountNeverWraps) {
    constexpr size_t submitters = 4;
    constexpr size_t per_submitter = 2000;
    constexpr size_t total = submitters * per_submitter;

    std::atomic<bool> done{false};
    std::atomic<size_t> max_seen{0};
    std::thread watcher([&] {
        while (!done.load()) {
            const size_t seen = pool->pending();
            size_t prev = max_seen.load();
            while (seen > prev && !max_seen.compare_exchange_weak(prev, seen)) {}
        }
    });

    std::atomic<size_t> ran{0};
    std::vector<std::thread> threads;
    for (size_t t = 0; t < submitters; ++t) {
        threads.emplace_back([&] {
            std::vector<std::future<void>> futures;
            futures.reserve(per_submitter);
            for (size_t i = 0; i < per_submitter; ++i) {
                futures.push_back(pool->submit([&ran] { ++ran; }));
            }
            for (auto& future : futures) future.get();
        });
    }
    for (auto& thread : threads) thread.join();
    done = true;
    watcher.join();

    EXPECT_EQ(ran.load(), total);
    EXPECT_LE(max_seen.load(), total);
    EXPECT_EQ(pool->pending(), 0u);
}

TEST_F(ThreadPoolTest, DestructorDrainsQueuedTasks) {
    std::atomic<int> done{0};
    {
        ThreadPool local(2);
        for (int i = 0; i < 200; ++i) {
            local.submit([&done] {
                std::this_thread::sleep_for(std::chrono::microseconds(50));
                ++done;
            });
        }
    }
    EXPECT_EQ(done.load(), 200);
}

TEST_F(ThreadPoolTest, TasksRunOnSeveralWorkers) {
    std::mutex mutex;
    std::set<std::thread::id> ids;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 64; ++i) {
        futures.push_back(pool->submit([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            std::lock_guard<std::mutex> lock(mutex);
            ids.insert(std::this_thread::get_id());
        }));
    }
    for (auto& future : futures) future.get();

    EXPECT_GT(ids.size(), 1u);
    EXPECT_EQ(ids.count(std::this_thread::get_id()), 0u);
    EXPECT_EQ(pool->pending(), 0u);
}

// =============================================================================
// Cancellation and exception propagation
// =============================================================================

TEST(ThreadingTest, CancellationToken) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    token.cancel();
    EXPECT_TRUE(token.is_cancelled());
    token.reset();
    EXPECT_FALSE(token.is_cancelled());
}

TEST(ThreadingTest, PropagatorKeepsFirstException) {
    ExceptionPropagator propagator;
    EXPECT_FALSE(propagator.has_exception());
    EXPECT_NO_THROW(propagator.propagate());

    propagator.set_exception(std::make_exception_ptr(std::out_of_range("first")));
    propagator.set_exception(std::make_exception_ptr(std::runtime_error("second")));
    EXPECT_TRUE(propagator.has_exception());
    EXPECT_THROW(propagator.propagate(), std::out_of_range);

    propagator.reset();
    EXPECT_FALSE(propagator.has_exception());
}

TEST(ThreadingTest, ThreadConfigOverride) {
    ThreadConfig& config = ThreadConfig::instance();
    EXPECT_GE(config.get_recommended_max_threads(), 1u);

    config.set_thread_count_override(3);
    EXPECT_EQ(config.get_thread_count(), 3u);
    EXPECT_EQ(config.get_thread_count_override(), 3u);

    config.clear_thread_count_override();
    EXPECT_EQ(config.get_thread_count_override(), 0u);
    EXPECT_GE(config.get_thread_count(), 1u);
}
