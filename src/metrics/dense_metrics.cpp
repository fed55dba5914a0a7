/**
 * Dense vector metrics
 *
 * Instances are mapped in place with Eigen::Map and reduced in double
 * precision, so float storage does not lose accuracy in the distance.
 */

#include "clam/metrics.hpp"
#include "clam/error.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <string>

namespace clam {
namespace metrics {

namespace {

using ConstVectorMap = Eigen::Map<const Eigen::VectorXf>;

void check_dimensions(const DenseVector& a, const DenseVector& b, const char* metric) {
    if (a.size() != b.size()) {
        throw InvalidArgumentError(
            "Dimension mismatch: " + std::to_string(a.size()) + " vs " + std::to_string(b.size()),
            metric,
            "All instances of a dense dataset must have the same length");
    }
}

Eigen::VectorXd difference(const DenseVector& a, const DenseVector& b) {
    ConstVectorMap va(a.data(), static_cast<Eigen::Index>(a.size()));
    ConstVectorMap vb(b.data(), static_cast<Eigen::Index>(b.size()));
    return va.cast<double>() - vb.cast<double>();
}

} // namespace

// =============================================================================
// Minkowski family
// =============================================================================

Distance EuclideanMetric::distance(const DenseVector& a, const DenseVector& b) const {
    check_dimensions(a, b, "euclidean");
    if (a.empty()) return 0.0;
    return difference(a, b).norm();
}

Distance ManhattanMetric::distance(const DenseVector& a, const DenseVector& b) const {
    check_dimensions(a, b, "manhattan");
    if (a.empty()) return 0.0;
    return difference(a, b).lpNorm<1>();
}

Distance ChebyshevMetric::distance(const DenseVector& a, const DenseVector& b) const {
    check_dimensions(a, b, "chebyshev");
    if (a.empty()) return 0.0;
    return difference(a, b).lpNorm<Eigen::Infinity>();
}

// =============================================================================
// Angular
// =============================================================================

Distance CosineMetric::distance(const DenseVector& a, const DenseVector& b) const {
    check_dimensions(a, b, "cosine");

    ConstVectorMap va(a.data(), static_cast<Eigen::Index>(a.size()));
    ConstVectorMap vb(b.data(), static_cast<Eigen::Index>(b.size()));
    const Eigen::VectorXd da = va.cast<double>();
    const Eigen::VectorXd db = vb.cast<double>();

    const double norms = da.norm() * db.norm();
    // Zero vectors have no direction; treat them as maximally dissimilar
    if (norms == 0.0) {
        return (da.isZero() && db.isZero()) ? 0.0 : 1.0;
    }

    const double similarity = std::clamp(da.dot(db) / norms, -1.0, 1.0);
    return std::max(0.0, 1.0 - similarity);
}

} // namespace metrics
} // namespace clam
