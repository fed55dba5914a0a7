// =============================================================================
// Distance Cache Tests
// =============================================================================

#include <gtest/gtest.h>
#include "clam/distance_cache.hpp"
#include "clam/error.hpp"

#include <thread>
#include <vector>

using namespace clam;

class DistanceCacheTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// d(i, j) and d(j, i) share one entry
TEST_F(DistanceCacheTest, UnorderedPairKey) {
    DistanceCache cache;
    cache.insert(3, 7, 1.5);

    ASSERT_TRUE(cache.find(7, 3).has_value());
    EXPECT_DOUBLE_EQ(*cache.find(7, 3), 1.5);
    EXPECT_TRUE(cache.contains(3, 7));
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(DistanceCacheTest, MissingPair) {
    DistanceCache cache;
    EXPECT_FALSE(cache.find(0, 1).has_value());
    EXPECT_FALSE(cache.contains(1, 0));
}

// A second insert of the same pair keeps the first value
TEST_F(DistanceCacheTest, InsertIfAbsent) {
    DistanceCache cache;
    EXPECT_DOUBLE_EQ(cache.insert(1, 2, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(cache.insert(2, 1, 5.0), 1.0);
    EXPECT_DOUBLE_EQ(*cache.find(1, 2), 1.0);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(DistanceCacheTest, LargeIdsDoNotCollide) {
    DistanceCache cache;
    const Index big = Index(1) << 40;
    cache.insert(big, 1, 2.0);
    cache.insert(big + 1, 0, 3.0);

    EXPECT_DOUBLE_EQ(*cache.find(1, big), 2.0);
    EXPECT_DOUBLE_EQ(*cache.find(0, big + 1), 3.0);
    EXPECT_FALSE(cache.contains(0, big));
}

TEST_F(DistanceCacheTest, Clear) {
    DistanceCache cache(4);
    for (Index i = 0; i < 100; ++i) {
        cache.insert(i, i + 1, static_cast<Distance>(i));
    }
    EXPECT_EQ(cache.size(), 100u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.contains(0, 1));
}

// A full shard is flushed before the next insert
TEST_F(DistanceCacheTest, BoundedCacheEvicts) {
    DistanceCache cache(1, 4);
    for (Index i = 0; i < 4; ++i) {
        cache.insert(i, 100, 1.0);
    }
    EXPECT_EQ(cache.size(), 4u);
    EXPECT_EQ(cache.evictions(), 0u);

    cache.insert(5, 100, 1.0);
    EXPECT_EQ(cache.evictions(), 1u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.contains(5, 100));
}

TEST_F(DistanceCacheTest, ZeroShardsRejected) {
    EXPECT_THROW(DistanceCache(0), InvalidArgumentError);
}

// Racing writers of identical values leave one entry per pair
TEST_F(DistanceCacheTest, ConcurrentInserts) {
    DistanceCache cache;
    const Index pairs = 2000;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t, pairs]() {
            for (Index i = 0; i < pairs; ++i) {
                // Alternate argument order across threads
                if (t % 2 == 0) {
                    cache.insert(i, i + pairs, static_cast<Distance>(i) * 0.5);
                } else {
                    cache.insert(i + pairs, i, static_cast<Distance>(i) * 0.5);
                }
                (void)cache.find(i, i + pairs);
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(cache.size(), pairs);
    for (Index i = 0; i < pairs; ++i) {
        ASSERT_TRUE(cache.contains(i, i + pairs));
        EXPECT_DOUBLE_EQ(*cache.find(i + pairs, i), static_cast<Distance>(i) * 0.5);
    }
}
