/**
 * Distance Metric Interface
 * =========================
 *
 * A metric computes d(a, b) between two instances of type T. Implementations
 * declare which metric axioms they honour; the tree and search code rely on
 * the triangle inequality for every pruning decision, so a metric that does
 * not obey it still works but exact search may miss neighbours.
 */

#pragma once

#include "clam/types.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace clam {

template<typename T>
class Metric {
public:
    using value_type = T;

    virtual ~Metric() = default;

    virtual std::string name() const = 0;

    /**
     * Compute the distance between two instances
     * @param a First instance
     * @param b Second instance
     * @return Non-negative distance
     * @throws any exception for malformed input (wrapped by the metric space)
     */
    virtual Distance distance(const T& a, const T& b) const = 0;

    /**
     * Metric axioms honoured by this implementation
     */
    virtual bool has_identity() const { return true; }
    virtual bool has_non_negativity() const { return true; }
    virtual bool has_symmetry() const { return true; }
    virtual bool obeys_triangle_inequality() const { return true; }

    // Hint that each call is costly enough to be worth caching
    virtual bool is_expensive() const { return false; }
};

/**
 * Adapts any callable `Distance(const T&, const T&)` to the Metric interface
 */
template<typename T>
class FunctionMetric : public Metric<T> {
public:
    using Function = std::function<Distance(const T&, const T&)>;

    FunctionMetric(std::string name, Function function,
                   bool expensive = false, bool triangle_inequality = true)
        : name_(std::move(name))
        , function_(std::move(function))
        , expensive_(expensive)
        , triangle_inequality_(triangle_inequality) {}

    std::string name() const override { return name_; }

    Distance distance(const T& a, const T& b) const override {
        return function_(a, b);
    }

    bool obeys_triangle_inequality() const override { return triangle_inequality_; }
    bool is_expensive() const override { return expensive_; }

private:
    std::string name_;
    Function function_;
    bool expensive_;
    bool triangle_inequality_;
};

template<typename T, typename F>
std::shared_ptr<const Metric<T>> make_function_metric(std::string name, F&& function,
                                                      bool expensive = false) {
    return std::make_shared<FunctionMetric<T>>(
        std::move(name), typename FunctionMetric<T>::Function(std::forward<F>(function)), expensive);
}

} // namespace clam
