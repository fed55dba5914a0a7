#include "clam/metrics.hpp"
#include "clam/error.hpp"

#include <algorithm>
#include <functional>
#include <numeric>
#include <vector>

namespace clam {
namespace metrics {

namespace {

// The merge below counts duplicates twice and misses out-of-order ids
void check_id_set(const IdSet& set) {
    auto bad = std::adjacent_find(set.begin(), set.end(), std::greater_equal<>());
    if (bad != set.end()) {
        throw InvalidArgumentError(
            "Id set is not strictly increasing at position " + std::to_string(bad - set.begin()),
            "jaccard",
            "Sort each set and remove duplicate ids before loading");
    }
}

} // namespace

Distance HammingMetric::distance(const std::string& a, const std::string& b) const {
    const size_t common = std::min(a.size(), b.size());
    size_t mismatches = a.size() > b.size() ? a.size() - b.size() : b.size() - a.size();
    for (size_t i = 0; i < common; ++i) {
        if (a[i] != b[i]) ++mismatches;
    }
    return static_cast<Distance>(mismatches);
}

Distance LevenshteinMetric::distance(const std::string& a, const std::string& b) const {
    // Iterate over the longer string so the rows hold the shorter one
    const std::string& longer = a.size() >= b.size() ? a : b;
    const std::string& shorter = a.size() >= b.size() ? b : a;

    if (shorter.empty()) return static_cast<Distance>(longer.size());

    std::vector<size_t> previous(shorter.size() + 1);
    std::vector<size_t> current(shorter.size() + 1);
    std::iota(previous.begin(), previous.end(), size_t(0));

    for (size_t i = 1; i <= longer.size(); ++i) {
        current[0] = i;
        for (size_t j = 1; j <= shorter.size(); ++j) {
            const size_t substitution = previous[j - 1] + (longer[i - 1] == shorter[j - 1] ? 0 : 1);
            const size_t deletion = previous[j] + 1;
            const size_t insertion = current[j - 1] + 1;
            current[j] = std::min({substitution, deletion, insertion});
        }
        std::swap(previous, current);
    }

    return static_cast<Distance>(previous[shorter.size()]);
}

Distance JaccardMetric::distance(const IdSet& a, const IdSet& b) const {
    check_id_set(a);
    check_id_set(b);
    if (a.empty() && b.empty()) return 0.0;

    // Sorted-merge intersection count
    size_t intersection = 0;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) {
            ++ia;
        } else if (*ib < *ia) {
            ++ib;
        } else {
            ++intersection;
            ++ia;
            ++ib;
        }
    }

    const size_t union_size = a.size() + b.size() - intersection;
    return 1.0 - static_cast<Distance>(intersection) / static_cast<Distance>(union_size);
}

} // namespace metrics
} // namespace clam
