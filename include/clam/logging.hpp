#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace clam {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

// Accepts debug/info/warn/warning/error/fatal, case-insensitive
inline std::optional<LogLevel> parse_log_level(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    bool enabled(LogLevel level) const {
        return level >= this->level();
    }

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        if (!enabled(level)) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count();

        const char* level_str = "UNKN";
        switch (level) {
            case LogLevel::DEBUG: level_str = "DEBG"; break;
            case LogLevel::INFO:  level_str = "INFO"; break;
            case LogLevel::WARN:  level_str = "WARN"; break;
            case LogLevel::ERROR: level_str = "EROR"; break;
            case LogLevel::FATAL: level_str = "FATL"; break;
        }

        // Extract filename from path
        const char* filename = std::strrchr(file, '/');
        if (!filename) filename = std::strrchr(file, '\\');
        filename = filename ? filename + 1 : file;

        std::stringstream msg;
        msg << "[" << ss.str() << "] " << level_str << " "
            << filename << ":" << line << " " << func << "() - ";
        format_message(msg, std::forward<Args>(args)...);

        std::lock_guard<std::mutex> lock(mutex_);
        *output_ << msg.str() << std::endl;

        if (level == LogLevel::FATAL) {
            *output_ << std::flush;
            std::abort();
        }
    }

private:
    Logger() : level_(LogLevel::INFO), output_(&std::clog) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void format_message(std::stringstream&) {}

    template<typename T, typename... Args>
    void format_message(std::stringstream& ss, T&& value, Args&&... args) {
        ss << value;
        format_message(ss, std::forward<Args>(args)...);
    }

    LogLevel level_;
    std::ostream* output_;
    mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) clam::Logger::getInstance().log(clam::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  clam::Logger::getInstance().log(clam::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  clam::Logger::getInstance().log(clam::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) clam::Logger::getInstance().log(clam::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_FATAL(...) clam::Logger::getInstance().log(clam::LogLevel::FATAL, __FILE__, __LINE__, __func__, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

// Returns false (and leaves the level untouched) for unknown names
inline bool set_log_level(const std::string& name) {
    auto level = parse_log_level(name);
    if (!level) return false;
    Logger::getInstance().setLevel(*level);
    return true;
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

} // namespace clam
