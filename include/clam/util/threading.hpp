/**
 * Cooperative cancellation and cross-thread exception propagation
 *
 * Tree construction hands every pending subtree to a pool worker; the first
 * worker failure is stored in an ExceptionPropagator and cancels the rest of
 * the build through a shared CancellationToken. Searches poll a token between
 * cluster visits.
 */

#pragma once

#include <atomic>
#include <exception>
#include <mutex>

namespace clam {

/**
 * Cancellation token for cooperative cancellation across threads
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    // Request cancellation
    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    // Check if cancellation was requested
    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    // Reset the token
    void reset() noexcept {
        cancelled_.store(false, std::memory_order_release);
    }

private:
    std::atomic<bool> cancelled_;
};

/**
 * Keeps the first exception raised by any worker for rethrow on the caller
 */
class ExceptionPropagator {
public:
    ExceptionPropagator() : has_exception_(false) {}

    // Store an exception; later ones are dropped
    void set_exception(std::exception_ptr ex) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!has_exception_) {
            exception_ = ex;
            has_exception_ = true;
        }
    }

    // Re-throw stored exception if any
    void propagate() {
        if (has_exception_) {
            std::exception_ptr ex;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ex = exception_;
            }
            std::rethrow_exception(ex);
        }
    }

    bool has_exception() const {
        return has_exception_;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        has_exception_ = false;
        exception_ = nullptr;
    }

private:
    std::exception_ptr exception_;
    std::atomic<bool> has_exception_;
    mutable std::mutex mutex_;
};

} // namespace clam
