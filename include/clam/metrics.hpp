/**
 * Built-in metrics and name-based registries
 *
 * Dense metrics operate on DenseVector through Eigen maps; string metrics on
 * std::string; Jaccard on sorted IdSet instances.
 */

#pragma once

#include "clam/metric.hpp"
#include "clam/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace clam {
namespace metrics {

class EuclideanMetric : public Metric<DenseVector> {
public:
    std::string name() const override { return "euclidean"; }
    Distance distance(const DenseVector& a, const DenseVector& b) const override;
};

class ManhattanMetric : public Metric<DenseVector> {
public:
    std::string name() const override { return "manhattan"; }
    Distance distance(const DenseVector& a, const DenseVector& b) const override;
};

class ChebyshevMetric : public Metric<DenseVector> {
public:
    std::string name() const override { return "chebyshev"; }
    Distance distance(const DenseVector& a, const DenseVector& b) const override;
};

// 1 - cos(a, b). Not a true metric; exact search is best-effort under it.
class CosineMetric : public Metric<DenseVector> {
public:
    std::string name() const override { return "cosine"; }
    Distance distance(const DenseVector& a, const DenseVector& b) const override;
    bool has_identity() const override { return false; }
    bool obeys_triangle_inequality() const override { return false; }
};

// Mismatched positions plus the difference in length
class HammingMetric : public Metric<std::string> {
public:
    std::string name() const override { return "hamming"; }
    Distance distance(const std::string& a, const std::string& b) const override;
};

class LevenshteinMetric : public Metric<std::string> {
public:
    std::string name() const override { return "levenshtein"; }
    Distance distance(const std::string& a, const std::string& b) const override;
    bool is_expensive() const override { return true; }
};

// 1 - |A ∩ B| / |A ∪ B| over sorted id sets; two empty sets are at distance 0
class JaccardMetric : public Metric<IdSet> {
public:
    std::string name() const override { return "jaccard"; }
    Distance distance(const IdSet& a, const IdSet& b) const override;
};

} // namespace metrics

// Throws InvalidArgumentError for an unknown name
std::shared_ptr<const Metric<DenseVector>> make_dense_metric(const std::string& name);
std::shared_ptr<const Metric<std::string>> make_string_metric(const std::string& name);

std::vector<std::string> dense_metric_names();
std::vector<std::string> string_metric_names();

} // namespace clam
