#include "clam/dataset.hpp"

#include <algorithm>
#include <random>

namespace clam {

std::vector<Index> choose_unique(std::span<const Index> indices, size_t n, uint64_t seed) {
    std::vector<Index> chosen(indices.begin(), indices.end());
    if (n >= chosen.size()) {
        return chosen;
    }

    // Partial Fisher-Yates: the first n slots end up a uniform sample
    std::mt19937_64 rng(seed);
    for (size_t i = 0; i < n; ++i) {
        std::uniform_int_distribution<size_t> pick(i, chosen.size() - 1);
        std::swap(chosen[i], chosen[pick(rng)]);
    }
    chosen.resize(n);
    return chosen;
}

} // namespace clam
