#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <iomanip>
#include <sstream>

namespace voicegate {
namespace utils {

std::string categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::CLASSIFICATION: return "classification";
        case ErrorCategory::STRUCTURED_MESSAGE: return "structured_message";
        case ErrorCategory::OBSERVED_SYSTEM: return "observed_system";
        case ErrorCategory::STATE_MACHINE: return "state_machine";
        case ErrorCategory::METRICS: return "metrics";
        case ErrorCategory::CONFIGURATION: return "configuration";
        case ErrorCategory::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "info";
        case ErrorSeverity::WARNING: return "warning";
        case ErrorSeverity::ERROR: return "error";
        case ErrorSeverity::CRITICAL: return "critical";
    }
    return "error";
}

// ErrorInfo implementation
ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, int64_t tsMs)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestampMs(tsMs) {
}

// VoiceGateException implementation
VoiceGateException::VoiceGateException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* VoiceGateException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& config_path)
    : VoiceGateException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::CRITICAL,
                                  message, config_path, "Configuration")) {
}

MessageFormatException::MessageFormatException(const std::string& message, const std::string& details)
    : VoiceGateException(ErrorInfo(ErrorCategory::STRUCTURED_MESSAGE, ErrorSeverity::WARNING,
                                  message, details, "StructuredMessage")) {
}

// ErrorHandler implementation
ErrorHandler::ErrorHandler(size_t max_history_size)
    : max_history_size_(max_history_size == 0 ? 1 : max_history_size) {
}

const ErrorInfo& ErrorHandler::reportError(ErrorInfo error) {
    if (error.id.empty()) {
        error.id = generateErrorId();
    }

    logError(error);

    ++total_reported_;
    ++category_counts_[error.category];

    error_history_.push_back(error);
    if (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }

    if (error_callback_) {
        try {
            error_callback_(error_history_.back());
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }

    return error_history_.back();
}

const ErrorInfo& ErrorHandler::reportError(const std::exception& e, const std::string& context,
                                           int64_t timestampMs) {
    if (const auto* vg = dynamic_cast<const VoiceGateException*>(&e)) {
        ErrorInfo info = vg->getErrorInfo();
        if (!context.empty()) {
            info.context = context;
        }
        info.timestampMs = timestampMs;
        return reportError(info);
    }

    return reportError(ErrorInfo(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR,
                                 e.what(), "", context, timestampMs));
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    auto it = category_counts_.find(category);
    return it != category_counts_.end() ? it->second : 0;
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    size_t start = error_history_.size() > count ? error_history_.size() - count : 0;
    return std::vector<ErrorInfo>(error_history_.begin() + static_cast<std::ptrdiff_t>(start),
                                  error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    error_history_.clear();
    category_counts_.clear();
    total_reported_ = 0;
}

void ErrorHandler::logError(const ErrorInfo& error) const {
    std::string line = "[" + categoryToString(error.category) + "] " + error.message;
    if (!error.details.empty()) {
        line += " (" + error.details + ")";
    }
    if (!error.context.empty()) {
        line += " in " + error.context;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(line);
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(line);
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(line);
            break;
    }
}

std::string ErrorHandler::generateErrorId() {
    std::ostringstream ss;
    ss << "err_" << std::setw(6) << std::setfill('0') << next_id_++;
    return ss.str();
}

} // namespace utils
} // namespace voicegate
