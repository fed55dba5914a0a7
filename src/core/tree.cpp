#include "clam/tree.hpp"
#include "clam/config.hpp"
#include "clam/error.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <ostream>

namespace clam {

// =============================================================================
// BuildConfig
// =============================================================================

BuildConfig BuildConfig::from_config(const Config& config) {
    BuildConfig build;
    build.min_cardinality = config.get<size_t>("tree.min_cardinality", build.min_cardinality);
    build.min_radius = config.get<double>("tree.min_radius", build.min_radius);
    build.max_depth = config.get<size_t>("tree.max_depth", build.max_depth);
    build.min_lfd = config.get<double>("tree.min_lfd", build.min_lfd);
    build.seed = config.get<uint64_t>("tree.seed", build.seed);
    return build;
}

void BuildConfig::validate() const {
    if (min_cardinality == 0) {
        throw InvalidConfigError("min_cardinality must be at least 1", "BuildConfig");
    }
    if (std::isnan(min_radius) || min_radius < 0.0) {
        throw InvalidConfigError("min_radius must be a non-negative number",
                                 "BuildConfig: min_radius = " + std::to_string(min_radius));
    }
    if (std::isnan(min_lfd) || min_lfd < 0.0) {
        throw InvalidConfigError("min_lfd must be a non-negative number",
                                 "BuildConfig: min_lfd = " + std::to_string(min_lfd));
    }
    if (parallel_threshold == 0) {
        throw InvalidConfigError("parallel_threshold must be at least 1", "BuildConfig");
    }
}

// =============================================================================
// Tree
// =============================================================================

Tree::Tree(const MetricSpace& space, const BuildConfig& config)
    : space_(&space)
    , config_(config) {}

std::vector<const Cluster*> Tree::leaves() const {
    std::vector<const Cluster*> result;
    result.reserve(stats_.num_leaves);
    for_each_cluster([&result](const Cluster& cluster) {
        if (cluster.is_leaf()) result.push_back(&cluster);
    });
    return result;
}

const Cluster* Tree::find(const std::string& name) const {
    if (name.empty() || name[0] != '1') {
        return nullptr;
    }

    const Cluster* cluster = root_.get();
    for (size_t i = 1; i < name.size(); ++i) {
        if (cluster->is_leaf()) return nullptr;
        switch (name[i]) {
            case '0': cluster = cluster->left(); break;
            case '1': cluster = cluster->right(); break;
            default:  return nullptr;
        }
    }
    return cluster;
}

void Tree::write_csv(std::ostream& out) const {
    out << "name,depth,cardinality,center,radius,lfd,arg_radius,is_leaf\n";
    for_each_cluster([&out](const Cluster& cluster) {
        out << cluster.name() << ','
            << cluster.depth() << ','
            << cluster.cardinality() << ','
            << cluster.center() << ','
            << cluster.radius() << ','
            << cluster.lfd() << ','
            << cluster.arg_radius() << ','
            << (cluster.is_leaf() ? "true" : "false") << '\n';
    });
}

void Tree::compute_stats() {
    TreeStats stats;
    stats.cardinality = permutation_.size();
    stats.root_radius = root_->radius();
    stats.min_leaf_cardinality = std::numeric_limits<size_t>::max();

    double leaf_cardinality_sum = 0.0;
    double leaf_radius_sum = 0.0;

    for_each_cluster([&](const Cluster& cluster) {
        ++stats.num_clusters;
        stats.height = std::max(stats.height, cluster.depth());
        if (cluster.is_leaf()) {
            ++stats.num_leaves;
            stats.min_leaf_cardinality = std::min(stats.min_leaf_cardinality, cluster.cardinality());
            stats.max_leaf_cardinality = std::max(stats.max_leaf_cardinality, cluster.cardinality());
            leaf_cardinality_sum += static_cast<double>(cluster.cardinality());
            leaf_radius_sum += cluster.radius();
        }
    });

    stats.mean_leaf_cardinality = leaf_cardinality_sum / static_cast<double>(stats.num_leaves);
    stats.mean_leaf_radius = leaf_radius_sum / static_cast<double>(stats.num_leaves);

    // Build timings are filled in by the builder
    stats.build_seconds = stats_.build_seconds;
    stats.build_distance_calls = stats_.build_distance_calls;
    stats_ = stats;
}

} // namespace clam
