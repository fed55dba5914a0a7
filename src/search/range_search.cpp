#include "clam/search/search_engine.hpp"
#include "clam/error.hpp"
#include "query_context.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace clam {

namespace detail {

void collect_range(const Tree& tree, QueryContext& distance_to, Distance radius, std::vector<Hit>& hits) {
    SearchStats& stats = distance_to.stats();

    struct Pending {
        const Cluster* cluster;
        Distance to_center;
    };

    const Cluster& root = tree.root();
    std::vector<Pending> stack{{&root, distance_to(root.center())}};

    while (!stack.empty()) {
        if (distance_to.cancelled()) return;

        const Pending current = stack.back();
        stack.pop_back();

        const Cluster& cluster = *current.cluster;
        if (exceeds(cluster_lower_bound(current.to_center, cluster), radius)) {
            ++stats.clusters_pruned;
            continue;
        }
        ++stats.clusters_visited;

        // A leaf, or a cluster wholly inside the query ball, is scanned
        // without descending further
        const bool inside = current.to_center + cluster.radius() <= radius;
        if (cluster.is_leaf() || inside) {
            ++stats.leaves_scanned;
            for (Index item : cluster.indices()) {
                const Distance d = distance_to(item);
                if (d <= radius) {
                    hits.emplace_back(item, d);
                }
            }
            continue;
        }

        stack.push_back({cluster.right(), distance_to(cluster.right()->center())});
        stack.push_back({cluster.left(), distance_to(cluster.left()->center())});
    }
}

} // namespace detail

SearchResult SearchEngine::range(const QueryDistance& query, Distance radius,
                                 RangeAlgorithm algorithm, const CancellationToken* cancel) const {
    if (std::isnan(radius) || radius < 0.0) {
        throw InvalidArgumentError("Range radius must be a non-negative number",
                                   "range: radius = " + std::to_string(radius));
    }

    SearchResult result = algorithm == RangeAlgorithm::Clustered
        ? range_clustered(query, radius, cancel)
        : range_linear(query, radius, cancel);

    std::sort(result.hits.begin(), result.hits.end());
    result.mode = SearchMode::Exact;
    result.tolerance = 0.0;
    result.algorithm = range_algorithm_name(algorithm);
    return result;
}

SearchResult SearchEngine::range_clustered(const QueryDistance& query, Distance radius,
                                           const CancellationToken* cancel) const {
    SearchResult result;
    detail::QueryContext distance_to(query, result.stats, cancel);
    detail::collect_range(tree_, distance_to, radius, result.hits);
    return result;
}

SearchResult SearchEngine::range_linear(const QueryDistance& query, Distance radius,
                                        const CancellationToken* cancel) const {
    SearchResult result;
    detail::QueryContext distance_to(query, result.stats, cancel);

    for (Index item = 0; item < tree_.cardinality(); ++item) {
        if (distance_to.cancelled()) break;
        const Distance d = distance_to(item);
        if (d <= radius) {
            result.hits.emplace_back(item, d);
        }
    }
    return result;
}

} // namespace clam
