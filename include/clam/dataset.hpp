/**
 * Dataset abstraction
 *
 * The engine only needs indexed, read-only access to instances. Callers
 * plug in their own storage by implementing Dataset<T>; VectorDataset<T>
 * covers the in-memory case.
 */

#pragma once

#include "clam/error.hpp"
#include "clam/types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace clam {

template<typename T>
class Dataset {
public:
    using value_type = T;

    virtual ~Dataset() = default;

    virtual size_t cardinality() const = 0;

    // Throws InvalidArgumentError for an index outside [0, cardinality)
    virtual const T& instance(Index index) const = 0;

    virtual const std::string& name() const = 0;

    bool empty() const { return cardinality() == 0; }
};

template<typename T>
class VectorDataset : public Dataset<T> {
public:
    explicit VectorDataset(std::vector<T> instances, std::string name = "dataset")
        : instances_(std::move(instances)), name_(std::move(name)) {}

    size_t cardinality() const override { return instances_.size(); }

    const T& instance(Index index) const override {
        if (index >= instances_.size()) {
            throw InvalidArgumentError(
                "Instance index out of range: " + std::to_string(index),
                name_ + " has " + std::to_string(instances_.size()) + " instances");
        }
        return instances_[index];
    }

    const std::string& name() const override { return name_; }

    const std::vector<T>& instances() const { return instances_; }

private:
    std::vector<T> instances_;
    std::string name_;
};

using DenseDataset = VectorDataset<DenseVector>;
using StringDataset = VectorDataset<std::string>;

// Up to n distinct entries of indices, drawn deterministically from seed.
// Returns all of indices (in order) when n >= indices.size().
std::vector<Index> choose_unique(std::span<const Index> indices, size_t n, uint64_t seed);

} // namespace clam
