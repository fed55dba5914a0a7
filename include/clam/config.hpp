#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <type_traits>
#include "logging.hpp"

namespace clam {

/**
 * Process-wide key/value configuration.
 *
 * Values come from CLAM_* environment variables first, then from an optional
 * "key = value" file. Typed access goes through get<T>(key, default).
 */
class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            load_from_env();

            if (!config_file.empty()) {
                if (std::filesystem::exists(config_file)) {
                    load_from_file(config_file);
                } else {
                    LOG_WARN("Config file not found: ", config_file);
                }
            }
        }

        return validate();
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_unlocked<T>(key, default_value);
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    // Drop every value (tests and re-initialization)
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    // Print current configuration (for debugging)
    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

    bool validate() const {
        std::lock_guard<std::mutex> lock(mutex_);
        bool valid = true;

        if (get_unlocked<long long>("tree.min_cardinality", 1) < 1) {
            LOG_ERROR("tree.min_cardinality must be at least 1");
            valid = false;
        }

        double min_radius = get_unlocked<double>("tree.min_radius", 0.0);
        if (std::isnan(min_radius) || min_radius < 0.0) {
            LOG_ERROR("tree.min_radius must be a non-negative number");
            valid = false;
        }

        if (get_unlocked<long long>("tree.max_depth", 0) < 0) {
            LOG_ERROR("tree.max_depth must be non-negative");
            valid = false;
        }

        double min_lfd = get_unlocked<double>("tree.min_lfd", 0.0);
        if (std::isnan(min_lfd) || min_lfd < 0.0) {
            LOG_ERROR("tree.min_lfd must be a non-negative number");
            valid = false;
        }

        double tolerance = get_unlocked<double>("search.tolerance", 0.0);
        if (std::isnan(tolerance) || tolerance < 0.0) {
            LOG_ERROR("search.tolerance must be a non-negative number");
            valid = false;
        }

        if (get_unlocked<long long>("perf.max_threads", 0) < 0) {
            LOG_ERROR("perf.max_threads must be non-negative");
            valid = false;
        }

        std::string log_level = get_unlocked<std::string>("log.level", "info");
        if (!parse_log_level(log_level)) {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        return valid;
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template<typename T>
    T get_unlocked(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
                if (it->second.find('-') != std::string::npos) {
                    throw std::invalid_argument("negative value for unsigned key");
                }
                return static_cast<T>(std::stoull(it->second));
            } else if constexpr (std::is_integral_v<T>) {
                return static_cast<T>(std::stoll(it->second));
            } else if constexpr (std::is_floating_point_v<T>) {
                return static_cast<T>(std::stod(it->second));
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void load_from_env() {
        // Tree construction
        set_if_env("tree.min_cardinality", "CLAM_MIN_CARDINALITY", "1");
        set_if_env("tree.min_radius", "CLAM_MIN_RADIUS", "0");
        set_if_env("tree.max_depth", "CLAM_MAX_DEPTH", "0");        // 0 = unlimited
        set_if_env("tree.min_lfd", "CLAM_MIN_LFD", "0");            // 0 = disabled
        set_if_env("tree.seed", "CLAM_SEED", "42");

        // Search
        set_if_env("search.tolerance", "CLAM_TOLERANCE", "0");

        // Distance cache
        set_if_env("cache.enabled", "CLAM_CACHE", "true");
        set_if_env("cache.max_entries", "CLAM_CACHE_MAX_ENTRIES", "0");  // 0 = unbounded

        // Performance
        set_if_env("perf.max_threads", "CLAM_MAX_THREADS", "0");  // 0 = auto-detect

        // Logging
        set_if_env("log.level", "CLAM_LOG_LEVEL", "info");
        set_if_env("log.file", "CLAM_LOG_FILE", "");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.count(key) == 0) {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        auto trim = [](std::string& s) {
            s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
            s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(), s.end());
        };

        std::string line;
        while (std::getline(file, line)) {
            trim(line);
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) {
                LOG_WARN("Ignoring malformed config line: ", line);
                continue;
            }

            std::string key = line.substr(0, equals_pos);
            std::string value = line.substr(equals_pos + 1);
            trim(key);
            trim(value);

            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    mutable std::mutex mutex_;
    mutable std::map<std::string, std::string> values_;
};

// Initialize configuration and logging on startup
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    // Honor the log level before anything else is logged
    if (const char* log_level_env = std::getenv("CLAM_LOG_LEVEL")) {
        set_log_level(std::string(log_level_env));
    }

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    set_log_level(config.get<std::string>("log.level", "info"));

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream;
        if (log_stream.is_open()) log_stream.close();
        log_stream.open(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace clam
