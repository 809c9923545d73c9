#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace voicegate {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories for better classification
 */
enum class ErrorCategory {
    CLASSIFICATION,
    STRUCTURED_MESSAGE,
    OBSERVED_SYSTEM,
    STATE_MACHINE,
    METRICS,
    CONFIGURATION,
    UNKNOWN
};

std::string categoryToString(ErrorCategory category);
std::string severityToString(ErrorSeverity severity);

/**
 * Structured error information.
 * timestampMs is on the telemetry stream's clock, not wall time.
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    int64_t timestampMs;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              int64_t tsMs = 0);
};

/**
 * Base exception carrying structured error information
 */
class VoiceGateException : public std::exception {
public:
    explicit VoiceGateException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

class ConfigurationException : public VoiceGateException {
public:
    ConfigurationException(const std::string& message, const std::string& config_path = "");
};

class MessageFormatException : public VoiceGateException {
public:
    MessageFormatException(const std::string& message, const std::string& details = "");
};

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Error history for one engine instance.
 *
 * Every TelemetryEngine owns its own handler so that parallel test
 * executions never observe each other's errors. Not thread-safe.
 */
class ErrorHandler {
public:
    explicit ErrorHandler(size_t max_history_size = 1000);

    // Error reporting
    const ErrorInfo& reportError(ErrorInfo error);
    const ErrorInfo& reportError(const std::exception& e, const std::string& context = "",
                                 int64_t timestampMs = 0);

    void setErrorCallback(ErrorCallback callback);

    // Error statistics
    size_t getErrorCount() const { return total_reported_; }
    size_t getErrorCount(ErrorCategory category) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

private:
    void logError(const ErrorInfo& error) const;
    std::string generateErrorId();

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    std::map<ErrorCategory, size_t> category_counts_;
    size_t max_history_size_;
    size_t total_reported_ = 0;
    uint64_t next_id_ = 1;
};

} // namespace utils
} // namespace voicegate
