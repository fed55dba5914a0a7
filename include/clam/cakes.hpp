/**
 * Cakes: build-once, query-many facade
 *
 * Owns the metric space (with its distance cache), the cluster tree and the
 * search engine over it. Typed queries are instances of T that need not be
 * in the dataset; *_of variants query with a dataset item and reuse the
 * shared cache.
 *
 *   auto index = clam::build(dataset, metric, config);
 *   auto hits  = clam::knn(index, query, 10);
 */

#pragma once

#include "clam/batch.hpp"
#include "clam/dataset.hpp"
#include "clam/metric.hpp"
#include "clam/metric_space.hpp"
#include "clam/search/search_engine.hpp"
#include "clam/thread_pool.hpp"
#include "clam/tree.hpp"

#include <memory>
#include <vector>

namespace clam {

template<typename T>
class Cakes {
public:
    /**
     * Build an index over every item of dataset
     * @param num_threads Dedicated pool size; 0 uses the shared pool
     */
    static Cakes build(std::shared_ptr<const Dataset<T>> dataset,
                       std::shared_ptr<const Metric<T>> metric,
                       const BuildConfig& build_config = BuildConfig(),
                       const CacheConfig& cache_config = CacheConfig(),
                       size_t num_threads = 0,
                       const CancellationToken* cancel = nullptr) {
        Cakes index;
        if (num_threads > 0) {
            index.own_pool_ = std::make_unique<ThreadPool>(num_threads);
            index.pool_ = index.own_pool_.get();
        } else {
            index.pool_ = &ThreadPool::instance();
        }

        index.space_ = std::make_unique<GenericMetricSpace<T>>(
            std::move(dataset), std::move(metric), cache_config);
        index.tree_ = std::make_unique<Tree>(
            Tree::build(*index.space_, build_config, index.pool_, cancel));
        index.engine_ = std::make_unique<SearchEngine>(*index.tree_);
        return index;
    }

    Cakes(Cakes&&) noexcept = default;
    Cakes& operator=(Cakes&&) noexcept = default;

    const Tree& tree() const { return *tree_; }
    const GenericMetricSpace<T>& space() const { return *space_; }
    const SearchEngine& engine() const { return *engine_; }
    ThreadPool& pool() const { return *pool_; }
    size_t cardinality() const { return tree_->cardinality(); }

    SearchResult knn(const T& query, size_t k,
                     KnnAlgorithm algorithm = KnnAlgorithm::DepthFirst,
                     const CancellationToken* cancel = nullptr) const {
        return engine_->knn(space_->bind(query), k, algorithm, cancel);
    }

    SearchResult knn_of(Index item, size_t k,
                        KnnAlgorithm algorithm = KnnAlgorithm::DepthFirst,
                        const CancellationToken* cancel = nullptr) const {
        return engine_->knn(space_->bind_item(item), k, algorithm, cancel);
    }

    SearchResult approximate_knn(const T& query, size_t k, double tolerance,
                                 const CancellationToken* cancel = nullptr) const {
        return engine_->approximate_knn(space_->bind(query), k, tolerance, cancel);
    }

    SearchResult range(const T& query, Distance radius,
                       RangeAlgorithm algorithm = RangeAlgorithm::Clustered,
                       const CancellationToken* cancel = nullptr) const {
        return engine_->range(space_->bind(query), radius, algorithm, cancel);
    }

    SearchResult range_of(Index item, Distance radius,
                          RangeAlgorithm algorithm = RangeAlgorithm::Clustered,
                          const CancellationToken* cancel = nullptr) const {
        return engine_->range(space_->bind_item(item), radius, algorithm, cancel);
    }

    std::vector<QueryOutcome> batch_knn(const std::vector<T>& queries, size_t k,
                                        KnnAlgorithm algorithm = KnnAlgorithm::DepthFirst,
                                        const CancellationToken* cancel = nullptr) const {
        return runner().knn(bind_all(queries), k, algorithm, cancel);
    }

    std::vector<QueryOutcome> batch_approximate_knn(const std::vector<T>& queries, size_t k,
                                                    double tolerance,
                                                    const CancellationToken* cancel = nullptr) const {
        return runner().approximate_knn(bind_all(queries), k, tolerance, cancel);
    }

    std::vector<QueryOutcome> batch_range(const std::vector<T>& queries, Distance radius,
                                          RangeAlgorithm algorithm = RangeAlgorithm::Clustered,
                                          const CancellationToken* cancel = nullptr) const {
        return runner().range(bind_all(queries), radius, algorithm, cancel);
    }

private:
    Cakes() = default;

    BatchRunner runner() const { return BatchRunner(*engine_, *pool_); }

    std::vector<QueryDistance> bind_all(const std::vector<T>& queries) const {
        std::vector<QueryDistance> bound;
        bound.reserve(queries.size());
        for (const T& query : queries) {
            bound.push_back(space_->bind(query));
        }
        return bound;
    }

    // Declared before the space so it is destroyed last
    std::unique_ptr<ThreadPool> own_pool_;
    ThreadPool* pool_ = nullptr;
    std::unique_ptr<GenericMetricSpace<T>> space_;
    std::unique_ptr<Tree> tree_;
    std::unique_ptr<SearchEngine> engine_;
};

template<typename T>
Cakes<T> build(std::shared_ptr<const Dataset<T>> dataset,
               std::shared_ptr<const Metric<T>> metric,
               const BuildConfig& config = BuildConfig()) {
    return Cakes<T>::build(std::move(dataset), std::move(metric), config);
}

template<typename T>
std::vector<Hit> knn(const Cakes<T>& index, const T& query, size_t k) {
    return index.knn(query, k).hits;
}

template<typename T>
std::vector<Hit> range(const Cakes<T>& index, const T& query, Distance radius) {
    return index.range(query, radius).hits;
}

} // namespace clam
