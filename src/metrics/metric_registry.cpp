/**
 * Name-based metric lookup used by the CLI and config-driven callers
 */

#include "clam/metrics.hpp"
#include "clam/error.hpp"

#include <functional>
#include <map>

namespace clam {

namespace {

template<typename T>
using Factory = std::function<std::shared_ptr<const Metric<T>>()>;

const std::map<std::string, Factory<DenseVector>>& dense_registry() {
    static const std::map<std::string, Factory<DenseVector>> registry = {
        {"euclidean", [] { return std::make_shared<metrics::EuclideanMetric>(); }},
        {"manhattan", [] { return std::make_shared<metrics::ManhattanMetric>(); }},
        {"chebyshev", [] { return std::make_shared<metrics::ChebyshevMetric>(); }},
        {"cosine",    [] { return std::make_shared<metrics::CosineMetric>(); }},
    };
    return registry;
}

const std::map<std::string, Factory<std::string>>& string_registry() {
    static const std::map<std::string, Factory<std::string>> registry = {
        {"hamming",     [] { return std::make_shared<metrics::HammingMetric>(); }},
        {"levenshtein", [] { return std::make_shared<metrics::LevenshteinMetric>(); }},
    };
    return registry;
}

template<typename Registry>
std::string joined_names(const Registry& registry) {
    std::string names;
    for (const auto& [name, factory] : registry) {
        if (!names.empty()) names += ", ";
        names += name;
    }
    return names;
}

template<typename Registry>
auto lookup(const Registry& registry, const std::string& name, const char* kind) {
    auto it = registry.find(name);
    if (it == registry.end()) {
        throw InvalidArgumentError("Unknown " + std::string(kind) + " metric: " + name,
                                   "",
                                   "Available: " + joined_names(registry));
    }
    return it->second();
}

} // namespace

std::shared_ptr<const Metric<DenseVector>> make_dense_metric(const std::string& name) {
    return lookup(dense_registry(), name, "dense");
}

std::shared_ptr<const Metric<std::string>> make_string_metric(const std::string& name) {
    return lookup(string_registry(), name, "string");
}

std::vector<std::string> dense_metric_names() {
    std::vector<std::string> names;
    for (const auto& entry : dense_registry()) names.push_back(entry.first);
    return names;
}

std::vector<std::string> string_metric_names() {
    std::vector<std::string> names;
    for (const auto& entry : string_registry()) names.push_back(entry.first);
    return names;
}

} // namespace clam
