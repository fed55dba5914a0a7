/**
 * Concurrent execution of independent queries
 *
 * Every query runs against the same read-only tree; outcomes come back in
 * query order whatever the completion order. A failing query records its
 * error code and message and does not affect the others.
 */

#pragma once

#include "clam/error.hpp"
#include "clam/search/search_engine.hpp"

#include <optional>
#include <string>
#include <vector>

namespace clam {

class ThreadPool;
class CancellationToken;

struct QueryOutcome {
    std::optional<SearchResult> result;
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool ok() const { return error == ErrorCode::SUCCESS && result.has_value(); }
};

struct BatchSummary {
    size_t queries = 0;
    size_t failures = 0;
    size_t distance_calls = 0;
};

class BatchRunner {
public:
    BatchRunner(const SearchEngine& engine, ThreadPool& pool)
        : engine_(engine), pool_(pool) {}

    std::vector<QueryOutcome> knn(const std::vector<QueryDistance>& queries, size_t k,
                                  KnnAlgorithm algorithm = KnnAlgorithm::DepthFirst,
                                  const CancellationToken* cancel = nullptr) const;

    std::vector<QueryOutcome> approximate_knn(const std::vector<QueryDistance>& queries, size_t k,
                                              double tolerance,
                                              const CancellationToken* cancel = nullptr) const;

    std::vector<QueryOutcome> range(const std::vector<QueryDistance>& queries, Distance radius,
                                    RangeAlgorithm algorithm = RangeAlgorithm::Clustered,
                                    const CancellationToken* cancel = nullptr) const;

    static BatchSummary summarize(const std::vector<QueryOutcome>& outcomes);

private:
    template<typename Search>
    std::vector<QueryOutcome> run(const char* label, size_t count, Search&& search) const;

    const SearchEngine& engine_;
    ThreadPool& pool_;
};

} // namespace clam
