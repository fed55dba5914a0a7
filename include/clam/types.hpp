#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <vector>

namespace clam {

// Position of an item in its dataset. Stable for the dataset's lifetime.
using Index = std::size_t;

// All metrics report distances in double precision
using Distance = double;

// Dense numeric instance (one row of a tabular dataset)
using DenseVector = std::vector<float>;

// Sorted set of integer ids, the instance type of the Jaccard metric
using IdSet = std::vector<uint32_t>;

// Distance from a fixed query to the dataset item with the given index
using QueryDistance = std::function<Distance(Index)>;

constexpr Distance INFINITE_DISTANCE = std::numeric_limits<Distance>::infinity();

// One search result: a dataset item and its distance to the query
struct Hit {
    Index index;
    Distance distance;

    constexpr Hit() noexcept : index(0), distance(0.0) {}
    constexpr Hit(Index index_, Distance distance_) noexcept
        : index(index_), distance(distance_) {}
};

constexpr bool operator==(const Hit& lhs, const Hit& rhs) noexcept {
    return lhs.index == rhs.index && lhs.distance == rhs.distance;
}

constexpr bool operator!=(const Hit& lhs, const Hit& rhs) noexcept {
    return !(lhs == rhs);
}

// Total order used for ranking: closer first, lower index breaks ties
constexpr bool operator<(const Hit& lhs, const Hit& rhs) noexcept {
    if (lhs.distance != rhs.distance) return lhs.distance < rhs.distance;
    return lhs.index < rhs.index;
}

enum class SearchMode {
    Exact,
    Approximate
};

inline const char* search_mode_name(SearchMode mode) {
    switch (mode) {
        case SearchMode::Exact:       return "exact";
        case SearchMode::Approximate: return "approximate";
    }
    return "unknown";
}

} // namespace clam
