#pragma once
/**
 * Thread count management for tree construction and query batches.
 *
 * All CLAM work is CPU-bound distance computation, so the default is one
 * worker per hardware thread. CLAM_MAX_THREADS or an explicit override caps it.
 */

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace clam {

class ThreadConfig {
public:
    static ThreadConfig& instance();

    // Threads to use for compute work (override, else environment, else hardware)
    size_t get_thread_count() const;
    void set_thread_count_override(size_t count);
    void clear_thread_count_override();
    size_t get_thread_count_override() const;

    // Hardware detection
    size_t get_hardware_concurrency() const;
    size_t get_recommended_max_threads() const;

    // Validation
    bool validate_configuration() const;
    std::vector<std::string> get_validation_errors() const;

private:
    ThreadConfig();
    ~ThreadConfig() = default;

    ThreadConfig(const ThreadConfig&) = delete;
    ThreadConfig& operator=(const ThreadConfig&) = delete;

    void detect_hardware_capabilities();
    void load_from_environment();

    size_t hardware_concurrency_;
    size_t environment_limit_;
    std::atomic<size_t> max_threads_override_;
};

} // namespace clam
