#pragma once

#include "clam/types.hpp"

#include <algorithm>
#include <vector>

namespace clam {

/**
 * Bounded "current best k" set
 *
 * A max-heap under the Hit ordering (distance, then index), so the set it
 * converges to is exactly the first k items of a brute-force sort.
 */
class KnnHeap {
public:
    explicit KnnHeap(size_t k) : k_(k) {
        heap_.reserve(k);
    }

    size_t k() const { return k_; }
    size_t size() const { return heap_.size(); }
    bool full() const { return heap_.size() >= k_; }

    // Distance of the current k-th best, infinite until full
    Distance threshold() const {
        return full() ? heap_.front().distance : INFINITE_DISTANCE;
    }

    // Returns true when the candidate entered the set
    bool push(Index index, Distance distance) {
        const Hit candidate(index, distance);
        if (!full()) {
            heap_.push_back(candidate);
            std::push_heap(heap_.begin(), heap_.end());
            return true;
        }
        if (candidate < heap_.front()) {
            std::pop_heap(heap_.begin(), heap_.end());
            heap_.back() = candidate;
            std::push_heap(heap_.begin(), heap_.end());
            return true;
        }
        return false;
    }

    // Closest first
    std::vector<Hit> sorted() const {
        std::vector<Hit> hits = heap_;
        std::sort_heap(hits.begin(), hits.end());
        return hits;
    }

private:
    size_t k_;
    std::vector<Hit> heap_;
};

} // namespace clam
