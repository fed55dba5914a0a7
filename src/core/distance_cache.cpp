#include "clam/distance_cache.hpp"
#include "clam/error.hpp"
#include "clam/logging.hpp"

#include <algorithm>
#include <mutex>

namespace clam {

DistanceCache::DistanceCache(size_t num_shards, size_t max_entries)
    : max_entries_(max_entries)
    , shard_capacity_(0)
    , evictions_(0) {
    CLAM_CHECK_ARGUMENT(num_shards > 0, "Distance cache needs at least one shard");

    shards_.reserve(num_shards);
    for (size_t i = 0; i < num_shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }

    if (max_entries_ > 0) {
        shard_capacity_ = std::max(size_t(1), max_entries_ / num_shards);
    }
}

size_t DistanceCache::KeyHash::operator()(const Key& key) const noexcept {
    // splitmix-style mixing so that consecutive ids spread across shards
    uint64_t h = static_cast<uint64_t>(key.first) * 0x9E3779B97F4A7C15ull;
    h ^= static_cast<uint64_t>(key.second) + 0x7F4A7C15ull + (h << 6) + (h >> 2);
    h ^= h >> 33;
    h *= 0xff51afd7ed558ccdull;
    h ^= h >> 33;
    return static_cast<size_t>(h);
}

DistanceCache::Shard& DistanceCache::shard_for(const Key& key) const {
    return *shards_[KeyHash{}(key) % shards_.size()];
}

std::optional<Distance> DistanceCache::find(Index i, Index j) const {
    const Key key = make_key(i, j);
    const Shard& shard = shard_for(key);

    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

Distance DistanceCache::insert(Index i, Index j, Distance distance) {
    const Key key = make_key(i, j);
    Shard& shard = shard_for(key);

    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(key);
    if (it != shard.entries.end()) {
        return it->second;
    }

    if (shard_capacity_ > 0 && shard.entries.size() >= shard_capacity_) {
        shard.entries.clear();
        evictions_.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("Distance cache shard flushed at ", shard_capacity_, " entries");
    }

    shard.entries.emplace(key, distance);
    return distance;
}

size_t DistanceCache::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

void DistanceCache::clear() {
    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard->mutex);
        shard->entries.clear();
    }
}

} // namespace clam
