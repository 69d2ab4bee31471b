#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace affectrt {
namespace utils {

namespace {

thread_local std::string t_context;
thread_local std::string t_session_id;

std::string nextErrorId() {
    static std::atomic<uint64_t> counter{0};
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "err-%06llu",
                  static_cast<unsigned long long>(counter.fetch_add(1) + 1));
    return buffer;
}

std::string formatForLog(const ErrorInfo& error) {
    std::string line = error.id + " " + toString(error.category) + ": " + error.message;
    if (!error.details.empty()) {
        line += " (" + error.details + ")";
    }
    if (!error.context.empty()) {
        line += " stage=" + error.context;
    }
    if (!error.session_id.empty()) {
        line += " session=" + error.session_id;
    }
    return line;
}

} // namespace

std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::VALIDATION: return "Validation";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::AUDIO_SIGNAL: return "AudioSignal";
        case ErrorCategory::EMOTION_FUSION: return "EmotionFusion";
        case ErrorCategory::SESSION_MEMORY: return "SessionMemory";
        case ErrorCategory::CRISIS_ASSESSMENT: return "CrisisAssessment";
        case ErrorCategory::CONVERSATION_FLOW: return "ConversationFlow";
        case ErrorCategory::INTERRUPTION: return "Interruption";
        case ErrorCategory::VOICE_MAPPING: return "VoiceMapping";
        case ErrorCategory::PIPELINE: return "Pipeline";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

std::string toString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& sid)
    : id(nextErrorId()), category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), session_id(sid) {
}

AffectRTException::AffectRTException(ErrorInfo error_info)
    : error_info_(std::move(error_info)), what_message_(error_info_.message) {
    if (!error_info_.details.empty()) {
        what_message_ += ": " + error_info_.details;
    }
}

ValidationException::ValidationException(const std::string& message, const std::string& session_id)
    : AffectRTException(ErrorInfo(ErrorCategory::VALIDATION, ErrorSeverity::WARNING,
                                  message, "", "Validation", session_id)) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& details)
    : AffectRTException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                  message, details, "Configuration")) {
}

SessionException::SessionException(const std::string& message, const std::string& session_id)
    : AffectRTException(ErrorInfo(ErrorCategory::SESSION_MEMORY, ErrorSeverity::ERROR,
                                  message, "", "SessionMemory", session_id)) {
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    const std::string line = formatForLog(error);
    switch (error.severity) {
        case ErrorSeverity::INFO: Logger::info(line); break;
        case ErrorSeverity::WARNING: Logger::warn(line); break;
        case ErrorSeverity::ERROR: Logger::error(line); break;
        case ErrorSeverity::CRITICAL: Logger::error("CRITICAL " + line); break;
    }

    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(error);
        trimLocked();
        callback = callback_;
    }

    // outside the lock: callbacks may query the handler
    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error(std::string("Error callback threw: ") + e.what());
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context,
                               const std::string& session_id) {
    const auto* own = dynamic_cast<const AffectRTException*>(&e);
    ErrorInfo info = own ? own->getErrorInfo()
                         : ErrorInfo(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what());
    if (!context.empty()) {
        info.context = context;
    }
    if (!session_id.empty()) {
        info.session_id = session_id;
    }
    reportError(info);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (category == ErrorCategory::UNKNOWN) {
        return history_.size();
    }
    return static_cast<size_t>(std::count_if(history_.begin(), history_.end(),
        [category](const ErrorInfo& error) { return error.category == category; }));
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t skip = history_.size() > count ? history_.size() - count : 0;
    return std::vector<ErrorInfo>(history_.begin() + static_cast<std::ptrdiff_t>(skip),
                                  history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = std::max<size_t>(1, max_size);
    trimLocked();
}

void ErrorHandler::trimLocked() {
    while (history_.size() > capacity_) {
        history_.pop_front();
    }
}

ErrorContext::ErrorContext(const std::string& context, const std::string& session_id)
    : saved_context_(t_context), saved_session_id_(t_session_id) {
    t_context = context;
    if (!session_id.empty()) {
        t_session_id = session_id;
    }
}

ErrorContext::~ErrorContext() {
    t_context = saved_context_;
    t_session_id = saved_session_id_;
}

void ErrorContext::setContext(const std::string& context) {
    t_context = context;
}

void ErrorContext::setSessionId(const std::string& session_id) {
    t_session_id = session_id;
}

std::string ErrorContext::getCurrentContext() {
    return t_context;
}

std::string ErrorContext::getCurrentSessionId() {
    return t_session_id;
}

} // namespace utils
} // namespace affectrt
