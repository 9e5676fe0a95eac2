#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <algorithm>

namespace printvoice {
namespace utils {

thread_local std::string ErrorContext::current_context_;
thread_local std::string ErrorContext::current_session_id_;

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg, 
                     const std::string& det, const std::string& ctx, const std::string& sid)
    : category(cat), severity(sev), message(msg), details(det), context(ctx), 
      timestamp(std::chrono::steady_clock::now()), session_id(sid) {
    
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    
    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

PrintVoiceException::PrintVoiceException(const ErrorInfo& error_info) 
    : error_info_(error_info) {
}

const char* PrintVoiceException::what() const noexcept {
    return error_info_.message.c_str();
}

WebSocketException::WebSocketException(const std::string& message, const std::string& session_id)
    : PrintVoiceException(ErrorInfo(ErrorCategory::WEBSOCKET, ErrorSeverity::ERROR, 
                                    message, "", "WebSocket", session_id)) {
}

ProtocolException::ProtocolException(const std::string& message, const std::string& details)
    : PrintVoiceException(ErrorInfo(ErrorCategory::PROTOCOL, ErrorSeverity::WARNING, 
                                    message, details, "Protocol")) {
}

TranscriptionException::TranscriptionException(const std::string& message, const std::string& details)
    : PrintVoiceException(ErrorInfo(ErrorCategory::TRANSCRIPTION, ErrorSeverity::ERROR, 
                                    message, details, "Transcription")) {
}

LanguageModelException::LanguageModelException(const std::string& message, const std::string& details)
    : PrintVoiceException(ErrorInfo(ErrorCategory::LANGUAGE_MODEL, ErrorSeverity::ERROR, 
                                    message, details, "LanguageModel")) {
}

ToolExecutionException::ToolExecutionException(const std::string& message, const std::string& tool_name)
    : PrintVoiceException(ErrorInfo(ErrorCategory::TOOL_EXECUTION, ErrorSeverity::WARNING, 
                                    message, tool_name, "ToolExecution")) {
}

SynthesisException::SynthesisException(const std::string& message, const std::string& details)
    : PrintVoiceException(ErrorInfo(ErrorCategory::SYNTHESIS, ErrorSeverity::ERROR, 
                                    message, details, "Synthesis")) {
}

PipelineException::PipelineException(const std::string& message, const std::string& stage)
    : PrintVoiceException(ErrorInfo(ErrorCategory::PIPELINE, ErrorSeverity::ERROR, 
                                    message, "", stage.empty() ? "Pipeline" : stage)) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& details)
    : PrintVoiceException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::CRITICAL, 
                                    message, details, "Configuration")) {
}

std::string categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::WEBSOCKET: return "WebSocket";
        case ErrorCategory::PROTOCOL: return "Protocol";
        case ErrorCategory::TRANSCRIPTION: return "Transcription";
        case ErrorCategory::LANGUAGE_MODEL: return "LanguageModel";
        case ErrorCategory::TOOL_EXECUTION: return "ToolExecution";
        case ErrorCategory::SYNTHESIS: return "Synthesis";
        case ErrorCategory::PIPELINE: return "Pipeline";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    logError(error);
    
    error_history_.push_back(error);
    if (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context, 
                              const std::string& session_id) {
    if (auto* known = dynamic_cast<const PrintVoiceException*>(&e)) {
        ErrorInfo error = known->getErrorInfo();
        if (!context.empty()) {
            error.context = context;
        }
        if (!session_id.empty()) {
            error.session_id = session_id;
        }
        reportError(error);
        return;
    }
    
    ErrorInfo error(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context, session_id);
    reportError(error);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (category == ErrorCategory::UNKNOWN) {
        return error_history_.size();
    }
    
    return std::count_if(error_history_.begin(), error_history_.end(),
                        [category](const ErrorInfo& error) {
                            return error.category == category;
                        });
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (error_history_.size() <= count) {
        return error_history_;
    }
    
    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << categoryToString(error.category) << " - " << error.message;
    
    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }
    
    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }
    
    if (!error.session_id.empty()) {
        log_message << " | Session: " << error.session_id;
    }
    
    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

ErrorContext::ErrorContext(const std::string& context, const std::string& session_id) 
    : previous_context_(current_context_), previous_session_id_(current_session_id_) {
    current_context_ = context;
    if (!session_id.empty()) {
        current_session_id_ = session_id;
    }
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
    current_session_id_ = previous_session_id_;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

std::string ErrorContext::getCurrentSessionId() {
    return current_session_id_;
}

} // namespace utils
} // namespace printvoice
