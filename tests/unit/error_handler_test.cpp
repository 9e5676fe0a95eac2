#include <gtest/gtest.h>
#include "utils/error_handler.hpp"
#include <stdexcept>
#include <thread>

using namespace printvoice::utils;

class ErrorHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorHandler::getInstance().clearErrorHistory();
    }

    void TearDown() override {
        ErrorHandler::getInstance().clearErrorHistory();
    }
};

TEST_F(ErrorHandlerTest, ErrorInfoCreation) {
    ErrorInfo error(ErrorCategory::WEBSOCKET, ErrorSeverity::ERROR,
                   "Test message", "Test details", "Test context", "session123");

    EXPECT_EQ(error.category, ErrorCategory::WEBSOCKET);
    EXPECT_EQ(error.severity, ErrorSeverity::ERROR);
    EXPECT_EQ(error.message, "Test message");
    EXPECT_EQ(error.details, "Test details");
    EXPECT_EQ(error.context, "Test context");
    EXPECT_EQ(error.session_id, "session123");
    EXPECT_FALSE(error.id.empty());
}

TEST_F(ErrorHandlerTest, ErrorInfoUniqueIds) {
    ErrorInfo error1(ErrorCategory::TRANSCRIPTION, ErrorSeverity::WARNING, "Message 1");
    ErrorInfo error2(ErrorCategory::TRANSCRIPTION, ErrorSeverity::WARNING, "Message 2");

    EXPECT_NE(error1.id, error2.id);
}

// what() is shown to clients, so details must not leak into it
TEST_F(ErrorHandlerTest, WhatCarriesMessageOnly) {
    LanguageModelException exception("Language model request failed", "HTTP 529: overloaded");

    EXPECT_STREQ(exception.what(), "Language model request failed");
    EXPECT_EQ(exception.getErrorInfo().details, "HTTP 529: overloaded");
}

TEST_F(ErrorHandlerTest, SpecificExceptions) {
    WebSocketException ws_ex("Connection lost", "session123");
    EXPECT_EQ(ws_ex.getErrorInfo().category, ErrorCategory::WEBSOCKET);
    EXPECT_EQ(ws_ex.getErrorInfo().session_id, "session123");

    ProtocolException protocol_ex("Unsupported control message", "ping");
    EXPECT_EQ(protocol_ex.getErrorInfo().category, ErrorCategory::PROTOCOL);
    EXPECT_EQ(protocol_ex.getErrorInfo().severity, ErrorSeverity::WARNING);

    TranscriptionException stt_ex("Transcription request failed");
    EXPECT_EQ(stt_ex.getErrorInfo().category, ErrorCategory::TRANSCRIPTION);

    ToolExecutionException tool_ex("boom", "create_quote");
    EXPECT_EQ(tool_ex.getErrorInfo().category, ErrorCategory::TOOL_EXECUTION);
    EXPECT_EQ(tool_ex.getErrorInfo().details, "create_quote");

    SynthesisException tts_ex("Speech synthesis request failed");
    EXPECT_EQ(tts_ex.getErrorInfo().category, ErrorCategory::SYNTHESIS);

    ConfigurationException config_ex("Invalid port", "port=0");
    EXPECT_EQ(config_ex.getErrorInfo().category, ErrorCategory::CONFIGURATION);
    EXPECT_EQ(config_ex.getErrorInfo().severity, ErrorSeverity::CRITICAL);

    PipelineException pipeline_ex("No speech detected in audio", "transcription");
    EXPECT_EQ(pipeline_ex.getErrorInfo().category, ErrorCategory::PIPELINE);
    EXPECT_EQ(pipeline_ex.getErrorInfo().context, "transcription");
}

TEST_F(ErrorHandlerTest, ErrorReporting) {
    auto& handler = ErrorHandler::getInstance();

    ErrorInfo error(ErrorCategory::SYNTHESIS, ErrorSeverity::WARNING, "Stream interrupted");
    handler.reportError(error);

    EXPECT_EQ(handler.getErrorCount(), 1u);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::SYNTHESIS), 1u);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::WEBSOCKET), 0u);
}

TEST_F(ErrorHandlerTest, ErrorHistory) {
    auto& handler = ErrorHandler::getInstance();

    for (int i = 0; i < 5; ++i) {
        handler.reportError(ErrorInfo(ErrorCategory::PIPELINE, ErrorSeverity::INFO,
                                      "Error " + std::to_string(i)));
    }

    EXPECT_EQ(handler.getErrorCount(), 5u);

    auto recent_errors = handler.getRecentErrors(3);
    ASSERT_EQ(recent_errors.size(), 3u);
    EXPECT_EQ(recent_errors[2].message, "Error 4"); // Most recent

    handler.clearErrorHistory();
    EXPECT_EQ(handler.getErrorCount(), 0u);
}

TEST_F(ErrorHandlerTest, ExceptionReporting) {
    auto& handler = ErrorHandler::getInstance();

    TranscriptionException exception("Transcription request failed");
    handler.reportError(exception, "voice_pipeline", "session456");

    EXPECT_EQ(handler.getErrorCount(ErrorCategory::TRANSCRIPTION), 1u);

    auto recent_errors = handler.getRecentErrors(1);
    ASSERT_EQ(recent_errors.size(), 1u);
    EXPECT_EQ(recent_errors[0].context, "voice_pipeline");
    EXPECT_EQ(recent_errors[0].session_id, "session456");
}

TEST_F(ErrorHandlerTest, ForeignExceptionReportedAsUnknown) {
    auto& handler = ErrorHandler::getInstance();

    handler.reportError(std::runtime_error("bad_alloc somewhere"), "message_handling", "s1");

    auto recent_errors = handler.getRecentErrors(1);
    ASSERT_EQ(recent_errors.size(), 1u);
    EXPECT_EQ(recent_errors[0].category, ErrorCategory::UNKNOWN);
    EXPECT_EQ(recent_errors[0].message, "bad_alloc somewhere");
}

TEST_F(ErrorHandlerTest, ReportMacroUsesCurrentContext) {
    auto& handler = ErrorHandler::getInstance();

    {
        ErrorContext ctx("macro_test", "session789");
        PRINTVOICE_REPORT_ERROR(ErrorCategory::PIPELINE, ErrorSeverity::WARNING,
                                "Test macro error", "Additional details");
    }

    auto recent_errors = handler.getRecentErrors(1);
    ASSERT_EQ(recent_errors.size(), 1u);
    EXPECT_EQ(recent_errors[0].message, "Test macro error");
    EXPECT_EQ(recent_errors[0].details, "Additional details");
    EXPECT_EQ(recent_errors[0].context, "macro_test");
    EXPECT_EQ(recent_errors[0].session_id, "session789");
}

class ErrorContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        EXPECT_TRUE(ErrorContext::getCurrentContext().empty());
        EXPECT_TRUE(ErrorContext::getCurrentSessionId().empty());
    }
};

TEST_F(ErrorContextTest, NestedContexts) {
    {
        ErrorContext ctx1("outer_context", "session1");
        EXPECT_EQ(ErrorContext::getCurrentContext(), "outer_context");

        {
            // An empty session id keeps the enclosing one
            ErrorContext ctx2("inner_context");
            EXPECT_EQ(ErrorContext::getCurrentContext(), "inner_context");
            EXPECT_EQ(ErrorContext::getCurrentSessionId(), "session1");
        }

        EXPECT_EQ(ErrorContext::getCurrentContext(), "outer_context");
    }

    EXPECT_TRUE(ErrorContext::getCurrentContext().empty());
    EXPECT_TRUE(ErrorContext::getCurrentSessionId().empty());
}

TEST_F(ErrorContextTest, ThreadLocalStorage) {
    std::string thread_context;
    bool thread_started_empty = false;

    {
        ErrorContext ctx("main_context");

        std::thread t([&]() {
            thread_started_empty = ErrorContext::getCurrentContext().empty();
            ErrorContext thread_ctx("thread_context");
            thread_context = ErrorContext::getCurrentContext();
        });
        t.join();

        EXPECT_EQ(ErrorContext::getCurrentContext(), "main_context");
    }

    EXPECT_TRUE(thread_started_empty);
    EXPECT_EQ(thread_context, "thread_context");
}
