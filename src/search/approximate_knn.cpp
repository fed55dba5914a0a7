/**
 * Approximate k-NN
 *
 * Best-first over lower bounds with two relaxations controlled by the
 * tolerance epsilon:
 *   - a cluster is discarded once lower > kth / (1 + epsilon);
 *   - an internal cluster is skipped when the number of its members
 *     expected to beat the current k-th best is below epsilon. The expected
 *     count scales the cardinality by the fraction of the cluster's
 *     diameter that lies inside the improving shell, raised to the LFD.
 * The first rule alone bounds each hit to (1 + epsilon) of the true
 * distance at its rank; the second gives that bound up for fewer calls.
 * With epsilon == 0 neither relaxation applies and the search is exact.
 */

#include "clam/search/search_engine.hpp"
#include "clam/search/knn_heap.hpp"
#include "clam/error.hpp"
#include "query_context.hpp"

#include <algorithm>
#include <cmath>
#include <queue>

namespace clam {

namespace {

double expected_improving(const Cluster& cluster, Distance lower, Distance kth) {
    if (cluster.radius() <= 0.0) {
        return static_cast<double>(cluster.cardinality());
    }
    const double fraction = std::clamp((kth - lower) / (2.0 * cluster.radius()), 0.0, 1.0);
    return static_cast<double>(cluster.cardinality()) * std::pow(fraction, cluster.lfd());
}

} // namespace

SearchResult SearchEngine::approximate_knn(const QueryDistance& query, size_t k, double tolerance,
                                           const CancellationToken* cancel) const {
    if (std::isnan(tolerance) || tolerance < 0.0) {
        throw InvalidArgumentError("Tolerance must be a non-negative number",
                                   "approximate_knn: tolerance = " + std::to_string(tolerance));
    }
    check_k(k);

    SearchResult result;
    result.mode = tolerance > 0.0 ? SearchMode::Approximate : SearchMode::Exact;
    result.tolerance = tolerance;
    result.algorithm = "approximate-best-first";

    detail::QueryContext distance_to(query, result.stats, cancel);
    KnnHeap best(k);

    auto relaxed_threshold = [&best, tolerance]() {
        return best.threshold() / (1.0 + tolerance);
    };

    struct Candidate {
        Distance lower;
        size_t sequence;
        const Cluster* cluster;

        bool operator>(const Candidate& other) const {
            if (lower != other.lower) return lower > other.lower;
            return sequence > other.sequence;
        }
    };

    std::priority_queue<Candidate, std::vector<Candidate>, std::greater<Candidate>> frontier;
    size_t sequence = 0;

    const Cluster& root = tree_.root();
    frontier.push({detail::cluster_lower_bound(distance_to(root.center()), root), sequence++, &root});

    while (!frontier.empty()) {
        if (distance_to.cancelled()) break;

        const Candidate current = frontier.top();
        if (best.full() && detail::exceeds(current.lower, relaxed_threshold())) {
            result.stats.clusters_pruned += frontier.size();
            break;
        }
        frontier.pop();

        const Cluster& cluster = *current.cluster;
        if (!cluster.is_leaf() && best.full() && tolerance > 0.0
            && expected_improving(cluster, current.lower, best.threshold()) < tolerance) {
            ++result.stats.clusters_pruned;
            continue;
        }
        ++result.stats.clusters_visited;

        if (cluster.is_leaf()) {
            ++result.stats.leaves_scanned;
            for (Index item : cluster.indices()) {
                best.push(item, distance_to(item));
            }
            continue;
        }

        for (const Cluster* child : {cluster.left(), cluster.right()}) {
            const Distance lower = detail::cluster_lower_bound(distance_to(child->center()), *child);
            if (best.full() && detail::exceeds(lower, relaxed_threshold())) {
                ++result.stats.clusters_pruned;
            } else {
                frontier.push({lower, sequence++, child});
            }
        }
    }

    result.hits = best.sorted();
    return result;
}

} // namespace clam
