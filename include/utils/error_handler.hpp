#pragma once

#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace affectrt {
namespace utils {

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * One category per dialogue component, plus the boundary concerns.
 * UNKNOWN doubles as "all categories" in ErrorHandler::getErrorCount.
 */
enum class ErrorCategory {
    VALIDATION,
    CONFIGURATION,
    AUDIO_SIGNAL,
    EMOTION_FUSION,
    SESSION_MEMORY,
    CRISIS_ASSESSMENT,
    CONVERSATION_FLOW,
    INTERRUPTION,
    VOICE_MAPPING,
    PIPELINE,
    SYSTEM,
    UNKNOWN
};

std::string toString(ErrorCategory category);
std::string toString(ErrorSeverity severity);

/**
 * A reported fault. `context` names the stage it happened in.
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;
    std::string session_id;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              const std::string& sid = "");
};

/**
 * Base exception for everything thrown by the dialogue core
 */
class AffectRTException : public std::exception {
public:
    explicit AffectRTException(ErrorInfo error_info);
    const char* what() const noexcept override { return what_message_.c_str(); }
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    std::string what_message_;
};

/**
 * Rejected input at the pipeline boundary. Never degraded, always surfaced.
 */
class ValidationException : public AffectRTException {
public:
    ValidationException(const std::string& message, const std::string& session_id = "");
};

class ConfigurationException : public AffectRTException {
public:
    ConfigurationException(const std::string& message, const std::string& details = "");
};

class SessionException : public AffectRTException {
public:
    SessionException(const std::string& message, const std::string& session_id = "");
};

/**
 * Fault raised inside one component. The context defaults to the category name.
 */
template<ErrorCategory Category, ErrorSeverity Severity = ErrorSeverity::ERROR>
class ComponentException : public AffectRTException {
public:
    explicit ComponentException(const std::string& message, const std::string& context = "")
        : AffectRTException(ErrorInfo(Category, Severity, message, "",
                                       context.empty() ? toString(Category) : context)) {}
};

using AudioSignalException = ComponentException<ErrorCategory::AUDIO_SIGNAL>;
using FusionException = ComponentException<ErrorCategory::EMOTION_FUSION>;
using CrisisAssessmentException =
    ComponentException<ErrorCategory::CRISIS_ASSESSMENT, ErrorSeverity::CRITICAL>;
using FlowException = ComponentException<ErrorCategory::CONVERSATION_FLOW>;
using InterruptionException = ComponentException<ErrorCategory::INTERRUPTION>;
using VoiceMappingException = ComponentException<ErrorCategory::VOICE_MAPPING>;
using PipelineException = ComponentException<ErrorCategory::PIPELINE>;

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Process-wide error sink. Every report is logged at its severity, kept in a
 * bounded history and handed to the optional callback.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);

    /**
     * Reports an exception. AffectRTExceptions keep their own category;
     * anything else is filed as UNKNOWN.
     */
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& session_id = "");

    void setErrorCallback(ErrorCallback callback);

    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();
    void setMaxHistorySize(size_t max_size);

private:
    ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void trimLocked();

    ErrorCallback callback_;
    std::deque<ErrorInfo> history_;
    size_t capacity_ = 1000;
    mutable std::mutex mutex_;
};

/**
 * Scoped stage name and session id for the calling thread. Nested scopes
 * restore the outer values on exit.
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& session_id = "");
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    void setContext(const std::string& context);
    void setSessionId(const std::string& session_id);

    static std::string getCurrentContext();
    static std::string getCurrentSessionId();

private:
    std::string saved_context_;
    std::string saved_session_id_;
};

#define AFFECTRT_HANDLE_ERROR(category, severity, message, details) \
    ::affectrt::utils::ErrorHandler::getInstance().reportError( \
        ::affectrt::utils::ErrorInfo(category, severity, message, details, \
                                     ::affectrt::utils::ErrorContext::getCurrentContext(), \
                                     ::affectrt::utils::ErrorContext::getCurrentSessionId()))

#define AFFECTRT_HANDLE_EXCEPTION(e, context) \
    ::affectrt::utils::ErrorHandler::getInstance().reportError( \
        e, context, ::affectrt::utils::ErrorContext::getCurrentSessionId())

} // namespace utils
} // namespace affectrt
