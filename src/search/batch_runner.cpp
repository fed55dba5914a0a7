#include "clam/batch.hpp"
#include "clam/logging.hpp"
#include "clam/thread_pool.hpp"
#include "clam/util/timer.hpp"

namespace clam {

template<typename Search>
std::vector<QueryOutcome> BatchRunner::run(const char* label, size_t count, Search&& search) const {
    std::vector<QueryOutcome> outcomes(count);

    Timer timer;
    timer.start();

    pool_.parallel_for(0, count, [&](size_t i) {
        QueryOutcome& outcome = outcomes[i];
        try {
            outcome.result = search(i);
        } catch (const ClamException& e) {
            outcome.error = e.code();
            outcome.message = e.what();
        } catch (const std::exception& e) {
            outcome.error = ErrorCode::INTERNAL_ERROR;
            outcome.message = e.what();
        } catch (...) {
            outcome.error = ErrorCode::INTERNAL_ERROR;
            outcome.message = "Query failed with a non-standard exception";
        }
    });

    timer.stop();

    BatchSummary summary = summarize(outcomes);
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (!outcomes[i].ok()) {
            LOG_WARN("Query ", i, " of ", label, " batch failed: ", outcomes[i].message);
        }
    }
    LOG_INFO("Batch ", label, ": ", summary.queries, " queries, ", summary.failures, " failed, ",
             summary.distance_calls, " distance calls in ", timer.elapsed_ms(), " ms");

    return outcomes;
}

std::vector<QueryOutcome> BatchRunner::knn(const std::vector<QueryDistance>& queries, size_t k,
                                           KnnAlgorithm algorithm, const CancellationToken* cancel) const {
    return run("knn", queries.size(), [&](size_t i) {
        return engine_.knn(queries[i], k, algorithm, cancel);
    });
}

std::vector<QueryOutcome> BatchRunner::approximate_knn(const std::vector<QueryDistance>& queries, size_t k,
                                                       double tolerance, const CancellationToken* cancel) const {
    return run("approximate-knn", queries.size(), [&](size_t i) {
        return engine_.approximate_knn(queries[i], k, tolerance, cancel);
    });
}

std::vector<QueryOutcome> BatchRunner::range(const std::vector<QueryDistance>& queries, Distance radius,
                                             RangeAlgorithm algorithm, const CancellationToken* cancel) const {
    return run("range", queries.size(), [&](size_t i) {
        return engine_.range(queries[i], radius, algorithm, cancel);
    });
}

BatchSummary BatchRunner::summarize(const std::vector<QueryOutcome>& outcomes) {
    BatchSummary summary;
    summary.queries = outcomes.size();
    for (const auto& outcome : outcomes) {
        if (outcome.ok()) {
            summary.distance_calls += outcome.result->stats.distance_calls;
        } else {
            ++summary.failures;
        }
    }
    return summary;
}

} // namespace clam
