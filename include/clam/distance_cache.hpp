/**
 * Sharded pairwise distance memo
 *
 * Keys are canonical (min(i, j), max(i, j)) pairs, so d(i, j) and d(j, i)
 * share one entry. Each shard has its own reader/writer lock: lookups in
 * different shards never contend, and lookups in the same shard only wait
 * for an in-progress insert. Values are written at most once; a racing
 * second insert of the same pair keeps the first value.
 */

#pragma once

#include "clam/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace clam {

class DistanceCache {
public:
    static constexpr size_t DEFAULT_SHARDS = 64;

    // max_entries == 0 means unbounded
    explicit DistanceCache(size_t num_shards = DEFAULT_SHARDS, size_t max_entries = 0);

    DistanceCache(const DistanceCache&) = delete;
    DistanceCache& operator=(const DistanceCache&) = delete;

    std::optional<Distance> find(Index i, Index j) const;

    bool contains(Index i, Index j) const { return find(i, j).has_value(); }

    // Insert if absent; returns the value now stored for the pair
    Distance insert(Index i, Index j, Distance distance);

    size_t size() const;
    void clear();

    size_t num_shards() const { return shards_.size(); }
    size_t max_entries() const { return max_entries_; }

    // Number of shard flushes triggered by the entry bound
    size_t evictions() const { return evictions_.load(std::memory_order_relaxed); }

private:
    using Key = std::pair<Index, Index>;

    struct KeyHash {
        size_t operator()(const Key& key) const noexcept;
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<Key, Distance, KeyHash> entries;
    };

    static Key make_key(Index i, Index j) noexcept {
        return i < j ? Key(i, j) : Key(j, i);
    }

    Shard& shard_for(const Key& key) const;

    std::vector<std::unique_ptr<Shard>> shards_;
    size_t max_entries_;
    size_t shard_capacity_;
    std::atomic<size_t> evictions_;
};

} // namespace clam
