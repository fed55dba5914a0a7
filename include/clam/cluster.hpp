/**
 * Cluster: one node of the partition tree
 *
 * A cluster views a contiguous slice of the tree's index permutation, so the
 * members of any subtree are adjacent. It records a center item, the radius
 * (largest center-to-member distance), the member realising that radius and
 * the local fractal dimension. Children are owned exclusively; there are
 * either none (leaf) or exactly two.
 */

#pragma once

#include "clam/types.hpp"

#include <array>
#include <memory>
#include <span>
#include <string>

namespace clam {

class TreeBuilder;

class Cluster {
public:
    Cluster(std::string name, size_t depth, size_t offset, std::span<const Index> indices);

    // Iterative, so degenerate (near-linear) trees cannot overflow the stack
    ~Cluster();

    Cluster(const Cluster&) = delete;
    Cluster& operator=(const Cluster&) = delete;

    // Binary path from the root: "1", then "0" for left and "1" for right
    const std::string& name() const { return name_; }
    size_t depth() const { return depth_; }

    // Position of the first member in the tree's permutation
    size_t offset() const { return offset_; }
    size_t cardinality() const { return indices_.size(); }
    std::span<const Index> indices() const { return indices_; }

    Index center() const { return center_; }
    Distance radius() const { return radius_; }
    Index arg_radius() const { return arg_radius_; }
    double lfd() const { return lfd_; }

    bool is_leaf() const { return !children_[0]; }
    bool is_singleton() const { return radius_ == 0.0; }

    const Cluster* left() const { return children_[0].get(); }
    const Cluster* right() const { return children_[1].get(); }

    // Invariant checks used by tests and diagnostics
    bool contains(Index item) const;

private:
    friend class TreeBuilder;

    std::string name_;
    size_t depth_;
    size_t offset_;
    std::span<const Index> indices_;

    Index center_ = 0;
    Distance radius_ = 0.0;
    Index arg_radius_ = 0;
    double lfd_ = 1.0;

    std::array<std::unique_ptr<Cluster>, 2> children_;
};

} // namespace clam
