#pragma once

#include <chrono>

namespace clam {

using Duration = std::chrono::nanoseconds;

// Wall-clock stopwatch used for build and query timings
class Timer {
public:
    void start() {
        start_time_ = std::chrono::steady_clock::now();
        elapsed_ = Duration::zero();
        running_ = true;
    }

    void stop() {
        if (!running_) return;
        elapsed_ = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - start_time_);
        running_ = false;
    }

    Duration get_elapsed() const {
        if (running_) {
            return std::chrono::duration_cast<Duration>(
                std::chrono::steady_clock::now() - start_time_);
        }
        return elapsed_;
    }

    double elapsed_seconds() const {
        return std::chrono::duration<double>(get_elapsed()).count();
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(get_elapsed()).count();
    }

    bool is_running() const { return running_; }

private:
    std::chrono::steady_clock::time_point start_time_;
    Duration elapsed_ = Duration::zero();
    bool running_ = false;
};

// Starts on construction, stops on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(Timer& timer) : timer_(timer) {
        timer_.start();
    }

    ~ScopedTimer() {
        timer_.stop();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Timer& timer_;
};

} // namespace clam
