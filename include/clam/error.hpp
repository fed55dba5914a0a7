#pragma once

#include <stdexcept>
#include <string>

namespace clam {

/**
 * Structured error reporting for the CLAM engine.
 * Every failure surfaces as a ClamException carrying an ErrorCode plus
 * optional context and a recovery suggestion.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    INVALID_CONFIG = 2,
    CANCELLED = 3,

    // Dataset and metric errors
    EMPTY_DATASET = 100,
    INVALID_METRIC = 101,
    DISTANCE_COMPUTATION_FAILURE = 102,

    // Query errors
    INVALID_K = 200,

    // I/O errors
    FILE_NOT_FOUND = 300,
    IO_FAILURE = 301,
    PARSE_ERROR = 302,

    // Internal errors
    INTERNAL_ERROR = 500
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:                      return "Success";
        case ErrorCode::INVALID_ARGUMENT:             return "InvalidArgument";
        case ErrorCode::INVALID_CONFIG:               return "InvalidConfig";
        case ErrorCode::CANCELLED:                    return "Cancelled";
        case ErrorCode::EMPTY_DATASET:                return "EmptyDataset";
        case ErrorCode::INVALID_METRIC:               return "InvalidMetric";
        case ErrorCode::DISTANCE_COMPUTATION_FAILURE: return "DistanceComputationFailure";
        case ErrorCode::INVALID_K:                    return "InvalidK";
        case ErrorCode::FILE_NOT_FOUND:               return "FileNotFound";
        case ErrorCode::IO_FAILURE:                   return "IOFailure";
        case ErrorCode::PARSE_ERROR:                  return "ParseError";
        case ErrorCode::INTERNAL_ERROR:               return "InternalError";
    }
    return "Unknown";
}

class ClamException : public std::runtime_error {
public:
    explicit ClamException(ErrorCode code, const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = std::string("CLAM error [") + error_code_name(code) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class InvalidArgumentError : public ClamException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : ClamException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class InvalidConfigError : public ClamException {
public:
    explicit InvalidConfigError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : ClamException(ErrorCode::INVALID_CONFIG, message, context, suggestion) {}
};

class EmptyDatasetError : public ClamException {
public:
    explicit EmptyDatasetError(const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : ClamException(ErrorCode::EMPTY_DATASET, message, context, suggestion) {}
};

// The metric broke its contract (negative or NaN distance)
class InvalidMetricError : public ClamException {
public:
    explicit InvalidMetricError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : ClamException(ErrorCode::INVALID_METRIC, message, context, suggestion) {}
};

// The caller-supplied distance function threw
class DistanceComputationError : public ClamException {
public:
    explicit DistanceComputationError(const std::string& message,
                                      const std::string& context = "",
                                      const std::string& suggestion = "")
        : ClamException(ErrorCode::DISTANCE_COMPUTATION_FAILURE, message, context, suggestion) {}
};

class InvalidKError : public ClamException {
public:
    explicit InvalidKError(const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : ClamException(ErrorCode::INVALID_K, message, context, suggestion) {}
};

class CancelledError : public ClamException {
public:
    explicit CancelledError(const std::string& message,
                            const std::string& context = "")
        : ClamException(ErrorCode::CANCELLED, message, context) {}
};

class IOError : public ClamException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "",
                     ErrorCode code = ErrorCode::FILE_NOT_FOUND)
        : ClamException(code, message, context, suggestion) {}
};

class ParseError : public ClamException {
public:
    explicit ParseError(const std::string& message,
                        const std::string& context = "",
                        const std::string& suggestion = "")
        : ClamException(ErrorCode::PARSE_ERROR, message, context, suggestion) {}
};

// Error handling utilities
class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }

    static void check_pointer(const void* ptr, const std::string& name) {
        if (!ptr) {
            throw InvalidArgumentError("Null pointer: " + name);
        }
    }
};

// Macros for common error checking
#define CLAM_CHECK_ARGUMENT(condition, message) \
    clam::ErrorHandler::check_argument(condition, message, __func__)

#define CLAM_CHECK_POINTER(ptr, name) \
    clam::ErrorHandler::check_pointer(ptr, name)

} // namespace clam
