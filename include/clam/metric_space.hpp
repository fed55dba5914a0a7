/**
 * MetricSpace: the single source of distances between dataset items
 *
 * The untyped base class is what the tree builder and search engine work
 * against; GenericMetricSpace<T> binds it to a Dataset<T> and Metric<T>.
 * Item-to-item distances go through the shared DistanceCache; distances to
 * out-of-dataset queries are never cached. Scans made while building a tree
 * populate the cache only for expensive metrics.
 *
 * Every metric result is validated (negative or NaN raises
 * InvalidMetricError) and any other exception escaping the metric is
 * wrapped in DistanceComputationError with the offending ids as context.
 */

#pragma once

#include "clam/dataset.hpp"
#include "clam/distance_cache.hpp"
#include "clam/error.hpp"
#include "clam/metric.hpp"
#include "clam/types.hpp"

#include <atomic>
#include <cmath>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace clam {

class Config;

struct CacheConfig {
    bool enabled = true;
    size_t num_shards = DistanceCache::DEFAULT_SHARDS;
    size_t max_entries = 0;   // 0 = unbounded

    static CacheConfig from_config(const Config& config);
};

class MetricSpace {
public:
    explicit MetricSpace(const CacheConfig& cache_config = CacheConfig());
    virtual ~MetricSpace() = default;

    MetricSpace(const MetricSpace&) = delete;
    MetricSpace& operator=(const MetricSpace&) = delete;

    virtual size_t cardinality() const = 0;
    virtual std::string metric_name() const = 0;
    virtual bool obeys_triangle_inequality() const = 0;
    virtual bool has_identity() const = 0;
    virtual bool has_non_negativity() const = 0;
    virtual bool has_symmetry() const = 0;
    virtual bool is_expensive() const = 0;

    /**
     * Distance between two dataset items. d(i, i) is 0 without evaluating
     * the metric. Safe to call concurrently.
     * @throws InvalidArgumentError for an index outside the dataset
     * @throws InvalidMetricError, DistanceComputationError
     */
    Distance distance(Index i, Index j) const;

    /**
     * Same value as distance(), for one-off scans such as the tree builder's
     * center and pole sweeps. A cached value is reused, but a fresh result
     * is stored only when the metric is expensive.
     */
    Distance scan_distance(Index i, Index j) const;

    std::vector<Distance> distances_from(Index i, std::span<const Index> others) const;

    // Metric evaluations so far (cache hits are not counted)
    size_t distance_count() const { return distance_count_.load(std::memory_order_relaxed); }
    void reset_distance_count() { distance_count_.store(0, std::memory_order_relaxed); }

    bool uses_cache() const { return cache_ != nullptr; }
    size_t cache_size() const { return cache_ ? cache_->size() : 0; }
    void clear_cache();
    const DistanceCache* cache() const { return cache_.get(); }

protected:
    virtual Distance compute_distance(Index i, Index j) const = 0;

    // Runs compute under the validation and wrapping rules described above
    template<typename Compute>
    Distance evaluate(Compute&& compute, const char* left_label, Index left, Index right) const {
        distance_count_.fetch_add(1, std::memory_order_relaxed);

        Distance result;
        try {
            result = compute();
        } catch (const InvalidMetricError&) {
            throw;
        } catch (const DistanceComputationError&) {
            throw;
        } catch (const std::exception& e) {
            throw DistanceComputationError(
                std::string("Metric '") + metric_name() + "' failed: " + e.what(),
                describe_pair(left_label, left, right));
        } catch (...) {
            throw DistanceComputationError(
                std::string("Metric '") + metric_name() + "' failed with a non-standard exception",
                describe_pair(left_label, left, right));
        }

        if (std::isnan(result) || result < 0.0) {
            throw InvalidMetricError(
                std::string("Metric '") + metric_name() + "' returned " + std::to_string(result),
                describe_pair(left_label, left, right),
                "Distances must be non-negative real numbers");
        }
        return result;
    }

    void check_index(Index i) const;

private:
    static std::string describe_pair(const char* left_label, Index left, Index right);
    Distance lookup(Index i, Index j, bool store) const;

    std::unique_ptr<DistanceCache> cache_;
    mutable std::atomic<size_t> distance_count_;
};

template<typename T>
class GenericMetricSpace : public MetricSpace {
public:
    GenericMetricSpace(std::shared_ptr<const Dataset<T>> dataset,
                       std::shared_ptr<const Metric<T>> metric,
                       const CacheConfig& cache_config = CacheConfig())
        : MetricSpace(cache_config)
        , dataset_(std::move(dataset))
        , metric_(std::move(metric)) {
        CLAM_CHECK_POINTER(dataset_.get(), "dataset");
        CLAM_CHECK_POINTER(metric_.get(), "metric");
    }

    size_t cardinality() const override { return dataset_->cardinality(); }
    std::string metric_name() const override { return metric_->name(); }
    bool obeys_triangle_inequality() const override { return metric_->obeys_triangle_inequality(); }
    bool has_identity() const override { return metric_->has_identity(); }
    bool has_non_negativity() const override { return metric_->has_non_negativity(); }
    bool has_symmetry() const override { return metric_->has_symmetry(); }
    bool is_expensive() const override { return metric_->is_expensive(); }

    const Dataset<T>& dataset() const { return *dataset_; }
    const Metric<T>& metric() const { return *metric_; }
    std::shared_ptr<const Dataset<T>> shared_dataset() const { return dataset_; }

    // Distance from an out-of-dataset instance to item i (uncached)
    Distance query_distance(const T& query, Index i) const {
        check_index(i);
        const T& item = dataset_->instance(i);
        return evaluate([&]() { return metric_->distance(query, item); }, "query", i, i);
    }

    // Distance function for one query; the space must outlive it
    QueryDistance bind(const T& query) const {
        auto owned = std::make_shared<const T>(query);
        return [this, owned](Index i) { return query_distance(*owned, i); };
    }

    // Distance function for a dataset item used as a query (cached)
    QueryDistance bind_item(Index item) const {
        check_index(item);
        return [this, item](Index i) { return distance(item, i); };
    }

protected:
    Distance compute_distance(Index i, Index j) const override {
        return metric_->distance(dataset_->instance(i), dataset_->instance(j));
    }

private:
    std::shared_ptr<const Dataset<T>> dataset_;
    std::shared_ptr<const Metric<T>> metric_;
};

} // namespace clam
