#pragma once

#include <string>
#include <exception>
#include <chrono>
#include <mutex>
#include <vector>

namespace printvoice {
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
 * Error categories, one per pipeline stage plus transport and system
 */
enum class ErrorCategory {
    WEBSOCKET,
    PROTOCOL,
    TRANSCRIPTION,
    LANGUAGE_MODEL,
    TOOL_EXECUTION,
    SYNTHESIS,
    PIPELINE,
    CONFIGURATION,
    SYSTEM,
    UNKNOWN
};

/**
 * Structured error information
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
 * Base exception. what() returns the message only, so it can be shown to
 * clients as-is; details stay in the ErrorInfo for logging.
 */
class PrintVoiceException : public std::exception {
public:
    explicit PrintVoiceException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
};

class WebSocketException : public PrintVoiceException {
public:
    WebSocketException(const std::string& message, const std::string& session_id = "");
};

class ProtocolException : public PrintVoiceException {
public:
    ProtocolException(const std::string& message, const std::string& details = "");
};

class TranscriptionException : public PrintVoiceException {
public:
    TranscriptionException(const std::string& message, const std::string& details = "");
};

class LanguageModelException : public PrintVoiceException {
public:
    LanguageModelException(const std::string& message, const std::string& details = "");
};

class ToolExecutionException : public PrintVoiceException {
public:
    ToolExecutionException(const std::string& message, const std::string& tool_name = "");
};

class SynthesisException : public PrintVoiceException {
public:
    SynthesisException(const std::string& message, const std::string& details = "");
};

class PipelineException : public PrintVoiceException {
public:
    PipelineException(const std::string& message, const std::string& stage = "");
};

class ConfigurationException : public PrintVoiceException {
public:
    ConfigurationException(const std::string& message, const std::string& details = "");
};

std::string categoryToString(ErrorCategory category);

/**
 * Central error recorder. Pipeline stages report here before the error is
 * turned into a client-facing error event.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();
    
    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "", 
                    const std::string& session_id = "");
    
    // UNKNOWN counts every category
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;
    
    void logError(const ErrorInfo& error);
    
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;
    
    mutable std::mutex mutex_;
};

/**
 * RAII error context manager
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& session_id = "");
    ~ErrorContext();
    
    static std::string getCurrentContext();
    static std::string getCurrentSessionId();

private:
    std::string previous_context_;
    std::string previous_session_id_;
    
    static thread_local std::string current_context_;
    static thread_local std::string current_session_id_;
};

#define PRINTVOICE_REPORT_ERROR(category, severity, message, details) \
    do { \
        ::printvoice::utils::ErrorInfo error_( \
            category, severity, message, details, \
            ::printvoice::utils::ErrorContext::getCurrentContext(), \
            ::printvoice::utils::ErrorContext::getCurrentSessionId()); \
        ::printvoice::utils::ErrorHandler::getInstance().reportError(error_); \
    } while(0)

} // namespace utils
} // namespace printvoice
