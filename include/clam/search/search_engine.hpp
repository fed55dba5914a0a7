/**
 * Branch-and-bound search over a cluster tree
 *
 * For a query q and cluster C with center c and radius r, every member m
 * satisfies d(q, m) >= d(q, c) - r by the triangle inequality. Exact
 * searches discard C only when that bound exceeds the current k-th best
 * distance (or the range radius), so their results equal brute force,
 * including the order of ties.
 *
 * Queries are given as a QueryDistance: the distance from the query to a
 * dataset item. The engine never mutates the tree and can be shared across
 * threads; each call keeps its own state.
 */

#pragma once

#include "clam/tree.hpp"
#include "clam/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace clam {

class Config;
class CancellationToken;

enum class KnnAlgorithm {
    DepthFirst,    // closer child first, explicit stack
    BestFirst,     // priority queue on the lower bound
    RepeatedRnn,   // range searches with a growing radius
    Linear         // brute force
};

enum class RangeAlgorithm {
    Clustered,
    Linear
};

const char* knn_algorithm_name(KnnAlgorithm algorithm);
const char* range_algorithm_name(RangeAlgorithm algorithm);
std::optional<KnnAlgorithm> parse_knn_algorithm(const std::string& name);
std::optional<RangeAlgorithm> parse_range_algorithm(const std::string& name);
std::vector<KnnAlgorithm> all_knn_algorithms();

struct SearchConfig {
    KnnAlgorithm knn_algorithm = KnnAlgorithm::DepthFirst;
    RangeAlgorithm range_algorithm = RangeAlgorithm::Clustered;
    double tolerance = 0.0;   // approximate k-NN; 0 = exact

    static SearchConfig from_config(const Config& config);

    // Throws InvalidConfigError
    void validate() const;
};

struct SearchStats {
    size_t clusters_visited = 0;
    size_t clusters_pruned = 0;
    size_t leaves_scanned = 0;
    size_t distance_calls = 0;   // evaluations of the query distance
    bool cancelled = false;
};

struct SearchResult {
    std::vector<Hit> hits;       // ascending (distance, index)
    SearchMode mode = SearchMode::Exact;
    double tolerance = 0.0;
    std::string algorithm;
    SearchStats stats;
};

class SearchEngine {
public:
    explicit SearchEngine(const Tree& tree) : tree_(tree) {}

    const Tree& tree() const { return tree_; }

    /**
     * Exact k nearest neighbors
     * @throws InvalidKError when k == 0 or k > cardinality (before any
     *         distance is computed)
     */
    SearchResult knn(const QueryDistance& query, size_t k,
                     KnnAlgorithm algorithm = KnnAlgorithm::DepthFirst,
                     const CancellationToken* cancel = nullptr) const;

    /**
     * Approximate k nearest neighbors with tolerance epsilon >= 0
     *
     * Best-first traversal that discards clusters whose lower bound exceeds
     * kth / (1 + epsilon), and skips internal clusters whose LFD-estimated
     * number of improving members, card * min(1, (kth - lower) / 2r)^lfd,
     * is below epsilon. epsilon == 0 is exact and reported as such.
     */
    SearchResult approximate_knn(const QueryDistance& query, size_t k, double tolerance,
                                 const CancellationToken* cancel = nullptr) const;

    /**
     * All items within radius of the query
     * @throws InvalidArgumentError for a negative or NaN radius
     */
    SearchResult range(const QueryDistance& query, Distance radius,
                       RangeAlgorithm algorithm = RangeAlgorithm::Clustered,
                       const CancellationToken* cancel = nullptr) const;

private:
    void check_k(size_t k) const;

    SearchResult knn_depth_first(const QueryDistance& query, size_t k, const CancellationToken* cancel) const;
    SearchResult knn_best_first(const QueryDistance& query, size_t k, const CancellationToken* cancel) const;
    SearchResult knn_repeated_rnn(const QueryDistance& query, size_t k, const CancellationToken* cancel) const;
    SearchResult knn_linear(const QueryDistance& query, size_t k, const CancellationToken* cancel) const;

    SearchResult range_clustered(const QueryDistance& query, Distance radius, const CancellationToken* cancel) const;
    SearchResult range_linear(const QueryDistance& query, Distance radius, const CancellationToken* cancel) const;

    const Tree& tree_;
};

} // namespace clam
