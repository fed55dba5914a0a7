/**
 * Cluster tree construction and inspection
 *
 * Tree::build partitions a MetricSpace top-down:
 *   1. center  = geometric median of a deterministic sample of members
 *   2. radius  = max distance from the center (arg_radius realises it)
 *   3. poles   = arg_radius, then the member farthest from it
 *   4. members go to the closer pole (equal distances go to the pole with
 *      the lower item id)
 * until a stopping criterion holds. Pending subtrees are dispatched to the
 * thread pool; the result does not depend on the number of threads.
 */

#pragma once

#include "clam/cluster.hpp"
#include "clam/metric_space.hpp"
#include "clam/types.hpp"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <stack>
#include <string>
#include <vector>

namespace clam {

class Config;
class ThreadPool;
class CancellationToken;

struct BuildConfig {
    size_t min_cardinality = 1;   // leaf when cardinality <= this
    Distance min_radius = 0.0;    // leaf when radius <= this
    size_t max_depth = 0;         // 0 = unlimited
    double min_lfd = 0.0;         // leaf when lfd < this; 0 = off
    uint64_t seed = 42;           // center sampling

    // Subtrees smaller than this are finished inside one pool task
    size_t parallel_threshold = 512;

    static BuildConfig from_config(const Config& config);

    // Throws InvalidConfigError
    void validate() const;
};

struct TreeStats {
    size_t cardinality = 0;
    size_t num_clusters = 0;
    size_t num_leaves = 0;
    size_t height = 0;
    size_t min_leaf_cardinality = 0;
    size_t max_leaf_cardinality = 0;
    double mean_leaf_cardinality = 0.0;
    double mean_leaf_radius = 0.0;
    Distance root_radius = 0.0;
    double build_seconds = 0.0;
    size_t build_distance_calls = 0;
};

class Tree {
public:
    /**
     * Build the tree over every item of the space
     * @param space Metric space; must outlive the tree
     * @param config Stopping criteria and seed
     * @param pool Workers to use (shared pool when null)
     * @param cancel Optional token; cancellation aborts the build
     * @throws EmptyDatasetError, InvalidConfigError, CancelledError, and
     *         any distance error raised while building
     */
    static Tree build(const MetricSpace& space,
                      const BuildConfig& config = BuildConfig(),
                      ThreadPool* pool = nullptr,
                      const CancellationToken* cancel = nullptr);

    Tree(Tree&&) noexcept = default;
    Tree& operator=(Tree&&) noexcept = default;
    Tree(const Tree&) = delete;
    Tree& operator=(const Tree&) = delete;

    const Cluster& root() const { return *root_; }
    const MetricSpace& space() const { return *space_; }
    const BuildConfig& config() const { return config_; }

    size_t cardinality() const { return permutation_.size(); }

    // Item ids in tree order; every cluster is a contiguous slice
    const std::vector<Index>& permutation() const { return permutation_; }

    size_t num_clusters() const { return stats_.num_clusters; }
    size_t num_leaves() const { return stats_.num_leaves; }
    size_t height() const { return stats_.height; }
    const TreeStats& stats() const { return stats_; }

    std::vector<const Cluster*> leaves() const;

    // Pre-order, left child before right
    template<typename Visitor>
    void for_each_cluster(Visitor&& visit) const {
        std::stack<const Cluster*> pending;
        pending.push(root_.get());
        while (!pending.empty()) {
            const Cluster* cluster = pending.top();
            pending.pop();
            visit(*cluster);
            if (!cluster->is_leaf()) {
                pending.push(cluster->right());
                pending.push(cluster->left());
            }
        }
    }

    // Cluster with the given binary-path name, or null
    const Cluster* find(const std::string& name) const;

    // One row per cluster in pre-order
    void write_csv(std::ostream& out) const;

private:
    friend class TreeBuilder;

    Tree(const MetricSpace& space, const BuildConfig& config);

    void compute_stats();

    const MetricSpace* space_;
    BuildConfig config_;
    std::vector<Index> permutation_;
    std::unique_ptr<Cluster> root_;
    TreeStats stats_;
};

} // namespace clam
