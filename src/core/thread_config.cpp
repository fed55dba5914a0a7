/**
 * Thread Configuration Implementation
 */

#include "clam/thread_config.hpp"
#include "clam/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <thread>

namespace clam {

static constexpr const char* ENV_MAX_THREADS = "CLAM_MAX_THREADS";

// Used when the platform cannot report its concurrency
static constexpr size_t FALLBACK_THREAD_COUNT = 4;

ThreadConfig& ThreadConfig::instance() {
    static ThreadConfig instance;
    return instance;
}

ThreadConfig::ThreadConfig()
    : hardware_concurrency_(0)
    , environment_limit_(0)
    , max_threads_override_(0) {

    detect_hardware_capabilities();
    load_from_environment();

    if (!validate_configuration()) {
        for (const auto& error : get_validation_errors()) {
            LOG_WARN("ThreadConfig: ", error);
        }
    }
}

size_t ThreadConfig::get_thread_count() const {
    size_t base_count = get_hardware_concurrency();
    if (base_count == 0) base_count = FALLBACK_THREAD_COUNT;

    size_t override = max_threads_override_.load(std::memory_order_acquire);
    if (override > 0) {
        return override;
    }

    if (environment_limit_ > 0) {
        return std::min(environment_limit_, base_count);
    }

    return std::max(size_t(1), base_count);
}

void ThreadConfig::set_thread_count_override(size_t count) {
    max_threads_override_.store(count, std::memory_order_release);
}

void ThreadConfig::clear_thread_count_override() {
    max_threads_override_.store(0, std::memory_order_release);
}

size_t ThreadConfig::get_thread_count_override() const {
    return max_threads_override_.load(std::memory_order_acquire);
}

size_t ThreadConfig::get_hardware_concurrency() const {
    return hardware_concurrency_;
}

size_t ThreadConfig::get_recommended_max_threads() const {
    size_t hw = get_hardware_concurrency();
    return std::max(size_t(1), hw > 1 ? hw - 1 : hw);  // Leave one core for the system
}

bool ThreadConfig::validate_configuration() const {
    return get_validation_errors().empty();
}

std::vector<std::string> ThreadConfig::get_validation_errors() const {
    std::vector<std::string> errors;

    size_t hw = get_hardware_concurrency();
    if (hw == 0) {
        errors.push_back("Unable to detect hardware concurrency");
    }

    size_t override = max_threads_override_.load();
    if (override > 0 && hw > 0 && override > 4 * hw) {
        errors.push_back("Thread count override (" + std::to_string(override) +
                         ") oversubscribes hardware concurrency (" + std::to_string(hw) + ")");
    }

    return errors;
}

void ThreadConfig::detect_hardware_capabilities() {
    hardware_concurrency_ = std::thread::hardware_concurrency();
}

void ThreadConfig::load_from_environment() {
    const char* value = std::getenv(ENV_MAX_THREADS);
    if (!value || !*value) return;

    try {
        long long parsed = std::stoll(value);
        if (parsed > 0) {
            environment_limit_ = static_cast<size_t>(parsed);
        }
    } catch (const std::exception&) {
        LOG_WARN("Ignoring invalid ", ENV_MAX_THREADS, " value: ", value);
    }
}

} // namespace clam
