#include "clam/metric_space.hpp"
#include "clam/config.hpp"

namespace clam {

CacheConfig CacheConfig::from_config(const Config& config) {
    CacheConfig cache;
    cache.enabled = config.get<bool>("cache.enabled", true);
    cache.max_entries = config.get<size_t>("cache.max_entries", 0);
    return cache;
}

MetricSpace::MetricSpace(const CacheConfig& cache_config)
    : distance_count_(0) {
    if (cache_config.enabled) {
        cache_ = std::make_unique<DistanceCache>(cache_config.num_shards, cache_config.max_entries);
    }
}

void MetricSpace::check_index(Index i) const {
    if (i >= cardinality()) {
        throw InvalidArgumentError(
            "Item index out of range: " + std::to_string(i),
            "cardinality " + std::to_string(cardinality()));
    }
}

std::string MetricSpace::describe_pair(const char* left_label, Index left, Index right) {
    return std::string("d(") + left_label + " " + std::to_string(left) +
           ", item " + std::to_string(right) + ")";
}

Distance MetricSpace::distance(Index i, Index j) const {
    return lookup(i, j, true);
}

Distance MetricSpace::scan_distance(Index i, Index j) const {
    return lookup(i, j, is_expensive());
}

Distance MetricSpace::lookup(Index i, Index j, bool store) const {
    check_index(i);
    check_index(j);

    if (i == j) {
        return 0.0;
    }

    if (cache_) {
        if (auto cached = cache_->find(i, j)) {
            return *cached;
        }
    }

    const Distance result = evaluate([&]() { return compute_distance(i, j); }, "item", i, j);

    if (cache_ && store) {
        // Another thread may have stored the pair first; both values agree
        return cache_->insert(i, j, result);
    }
    return result;
}

std::vector<Distance> MetricSpace::distances_from(Index i, std::span<const Index> others) const {
    std::vector<Distance> distances;
    distances.reserve(others.size());
    for (Index j : others) {
        distances.push_back(distance(i, j));
    }
    return distances;
}

void MetricSpace::clear_cache() {
    if (cache_) {
        cache_->clear();
    }
}

} // namespace clam
