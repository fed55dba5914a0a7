#include "clam/search/search_engine.hpp"
#include "clam/search/knn_heap.hpp"
#include "clam/config.hpp"
#include "clam/error.hpp"
#include "query_context.hpp"

#include <algorithm>
#include <cmath>
#include <queue>
#include <vector>

namespace clam {

using detail::QueryContext;
using detail::exceeds;
using detail::cluster_lower_bound;

// =============================================================================
// Names and configuration
// =============================================================================

const char* knn_algorithm_name(KnnAlgorithm algorithm) {
    switch (algorithm) {
        case KnnAlgorithm::DepthFirst:  return "depth-first";
        case KnnAlgorithm::BestFirst:   return "best-first";
        case KnnAlgorithm::RepeatedRnn: return "repeated-rnn";
        case KnnAlgorithm::Linear:      return "linear";
    }
    return "unknown";
}

const char* range_algorithm_name(RangeAlgorithm algorithm) {
    switch (algorithm) {
        case RangeAlgorithm::Clustered: return "clustered";
        case RangeAlgorithm::Linear:    return "linear";
    }
    return "unknown";
}

std::optional<KnnAlgorithm> parse_knn_algorithm(const std::string& name) {
    for (KnnAlgorithm algorithm : all_knn_algorithms()) {
        if (name == knn_algorithm_name(algorithm)) return algorithm;
    }
    return std::nullopt;
}

std::optional<RangeAlgorithm> parse_range_algorithm(const std::string& name) {
    if (name == "clustered") return RangeAlgorithm::Clustered;
    if (name == "linear") return RangeAlgorithm::Linear;
    return std::nullopt;
}

std::vector<KnnAlgorithm> all_knn_algorithms() {
    return {KnnAlgorithm::DepthFirst, KnnAlgorithm::BestFirst,
            KnnAlgorithm::RepeatedRnn, KnnAlgorithm::Linear};
}

SearchConfig SearchConfig::from_config(const Config& config) {
    SearchConfig search;
    search.tolerance = config.get<double>("search.tolerance", search.tolerance);
    return search;
}

void SearchConfig::validate() const {
    if (std::isnan(tolerance) || tolerance < 0.0) {
        throw InvalidConfigError("tolerance must be a non-negative number",
                                 "SearchConfig: tolerance = " + std::to_string(tolerance));
    }
}

// =============================================================================
// Exact k-NN
// =============================================================================

void SearchEngine::check_k(size_t k) const {
    const size_t n = tree_.cardinality();
    if (k == 0 || k > n) {
        throw InvalidKError("k must be in [1, " + std::to_string(n) + "], got " + std::to_string(k),
                            "knn");
    }
}

SearchResult SearchEngine::knn(const QueryDistance& query, size_t k,
                               KnnAlgorithm algorithm, const CancellationToken* cancel) const {
    check_k(k);

    SearchResult result;
    switch (algorithm) {
        case KnnAlgorithm::DepthFirst:  result = knn_depth_first(query, k, cancel); break;
        case KnnAlgorithm::BestFirst:   result = knn_best_first(query, k, cancel); break;
        case KnnAlgorithm::RepeatedRnn: result = knn_repeated_rnn(query, k, cancel); break;
        case KnnAlgorithm::Linear:      result = knn_linear(query, k, cancel); break;
    }
    result.mode = SearchMode::Exact;
    result.tolerance = 0.0;
    result.algorithm = knn_algorithm_name(algorithm);
    return result;
}

SearchResult SearchEngine::knn_depth_first(const QueryDistance& query, size_t k,
                                           const CancellationToken* cancel) const {
    SearchResult result;
    QueryContext distance_to(query, result.stats, cancel);
    KnnHeap best(k);

    struct Pending {
        const Cluster* cluster;
        Distance to_center;
    };

    const Cluster& root = tree_.root();
    std::vector<Pending> stack{{&root, distance_to(root.center())}};

    while (!stack.empty()) {
        if (distance_to.cancelled()) break;

        const Pending current = stack.back();
        stack.pop_back();

        const Cluster& cluster = *current.cluster;
        if (best.full() && exceeds(cluster_lower_bound(current.to_center, cluster), best.threshold())) {
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

        const Cluster* left = cluster.left();
        const Cluster* right = cluster.right();
        const Distance to_left = distance_to(left->center());
        const Distance to_right = distance_to(right->center());

        // Farther child goes on the stack first so the closer one is visited first
        if (to_right < to_left) {
            stack.push_back({left, to_left});
            stack.push_back({right, to_right});
        } else {
            stack.push_back({right, to_right});
            stack.push_back({left, to_left});
        }
    }

    result.hits = best.sorted();
    return result;
}

SearchResult SearchEngine::knn_best_first(const QueryDistance& query, size_t k,
                                          const CancellationToken* cancel) const {
    SearchResult result;
    QueryContext distance_to(query, result.stats, cancel);
    KnnHeap best(k);

    struct Candidate {
        Distance lower;
        size_t sequence;   // insertion order keeps the traversal deterministic
        const Cluster* cluster;

        bool operator>(const Candidate& other) const {
            if (lower != other.lower) return lower > other.lower;
            return sequence > other.sequence;
        }
    };

    std::priority_queue<Candidate, std::vector<Candidate>, std::greater<Candidate>> frontier;
    size_t sequence = 0;

    const Cluster& root = tree_.root();
    frontier.push({cluster_lower_bound(distance_to(root.center()), root), sequence++, &root});

    while (!frontier.empty()) {
        if (distance_to.cancelled()) break;

        const Candidate current = frontier.top();
        if (best.full() && exceeds(current.lower, best.threshold())) {
            // Every remaining candidate has an equal or larger bound
            result.stats.clusters_pruned += frontier.size();
            break;
        }
        frontier.pop();
        ++result.stats.clusters_visited;

        const Cluster& cluster = *current.cluster;
        if (cluster.is_leaf()) {
            ++result.stats.leaves_scanned;
            for (Index item : cluster.indices()) {
                best.push(item, distance_to(item));
            }
            continue;
        }

        for (const Cluster* child : {cluster.left(), cluster.right()}) {
            const Distance lower = cluster_lower_bound(distance_to(child->center()), *child);
            if (best.full() && exceeds(lower, best.threshold())) {
                ++result.stats.clusters_pruned;
            } else {
                frontier.push({lower, sequence++, child});
            }
        }
    }

    result.hits = best.sorted();
    return result;
}

SearchResult SearchEngine::knn_repeated_rnn(const QueryDistance& query, size_t k,
                                            const CancellationToken* cancel) const {
    SearchResult result;
    QueryContext distance_to(query, result.stats, cancel);

    const Cluster& root = tree_.root();
    const size_t n = tree_.cardinality();
    const Distance to_root = distance_to(root.center());

    // Any radius at or beyond this covers the whole dataset
    const Distance covering = to_root + root.radius();

    Distance radius = root.radius() * static_cast<double>(k) / static_cast<double>(n);
    if (radius <= 0.0) {
        radius = covering;
    }

    const double lfd = root.lfd() > 0.0 ? root.lfd() : 1.0;

    std::vector<Hit> hits;
    while (true) {
        hits.clear();
        detail::collect_range(tree_, distance_to, radius, hits);
        if (result.stats.cancelled || hits.size() >= k || radius >= covering) {
            break;
        }

        const double ratio = static_cast<double>(k) / static_cast<double>(std::max<size_t>(hits.size(), 1));
        const double factor = std::clamp(std::pow(ratio, 1.0 / lfd), 1.1, 2.0);
        radius = std::min(radius * factor, covering);
    }

    // Only reachable when rounding or a non-metric puts items beyond the
    // covering radius
    if (!result.stats.cancelled && hits.size() < k) {
        hits.clear();
        for (Index item = 0; item < n; ++item) {
            hits.emplace_back(item, distance_to(item));
        }
    }

    std::sort(hits.begin(), hits.end());
    if (hits.size() > k) {
        hits.resize(k);
    }
    result.hits = std::move(hits);
    return result;
}

SearchResult SearchEngine::knn_linear(const QueryDistance& query, size_t k,
                                      const CancellationToken* cancel) const {
    SearchResult result;
    QueryContext distance_to(query, result.stats, cancel);
    KnnHeap best(k);

    for (Index item = 0; item < tree_.cardinality(); ++item) {
        if (distance_to.cancelled()) break;
        best.push(item, distance_to(item));
    }

    result.hits = best.sorted();
    return result;
}

} // namespace clam
