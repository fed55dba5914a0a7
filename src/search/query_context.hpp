/**
 * Per-query state shared by the search algorithms
 */

#pragma once

#include "clam/search/search_engine.hpp"
#include "clam/util/threading.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace clam {
namespace detail {

// Relative slack on pruning comparisons, so that rounding in d(q, c) - r
// never discards a cluster holding a true neighbor
constexpr double BOUND_SLACK = 1e-9;

inline bool exceeds(Distance lower, Distance bound) {
    return lower > bound + BOUND_SLACK * (1.0 + std::abs(bound));
}

inline Distance cluster_lower_bound(Distance to_center, const Cluster& cluster) {
    return std::max(0.0, to_center - cluster.radius());
}

// Memoized query distance with call accounting
class QueryContext {
public:
    QueryContext(const QueryDistance& query, SearchStats& stats, const CancellationToken* cancel)
        : query_(query), stats_(stats), cancel_(cancel) {}

    Distance operator()(Index item) {
        auto it = memo_.find(item);
        if (it != memo_.end()) {
            return it->second;
        }
        const Distance d = query_(item);
        ++stats_.distance_calls;
        memo_.emplace(item, d);
        return d;
    }

    // Sets the cancelled flag on the first positive check
    bool cancelled() {
        if (cancel_ && cancel_->is_cancelled()) {
            stats_.cancelled = true;
            return true;
        }
        return false;
    }

    SearchStats& stats() { return stats_; }

private:
    const QueryDistance& query_;
    SearchStats& stats_;
    const CancellationToken* cancel_;
    std::unordered_map<Index, Distance> memo_;
};

// Clustered range traversal; hits are appended unsorted
void collect_range(const Tree& tree, QueryContext& context, Distance radius, std::vector<Hit>& hits);

} // namespace detail
} // namespace clam
