#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "utils/error_handler.hpp"
#include <thread>
#include <chrono>
#include <stdexcept>

using namespace affectrt::utils;
using ::testing::HasSubstr;

class ErrorHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorHandler::getInstance().clearErrorHistory();
    }

    void TearDown() override {
        ErrorHandler::getInstance().clearErrorHistory();
        ErrorHandler::getInstance().setErrorCallback(nullptr);
        ErrorHandler::getInstance().setMaxHistorySize(1000);
    }
};

TEST_F(ErrorHandlerTest, ErrorInfoCreation) {
    ErrorInfo error(ErrorCategory::EMOTION_FUSION, ErrorSeverity::ERROR,
                   "Test message", "Test details", "Test context", "session123");

    EXPECT_EQ(error.category, ErrorCategory::EMOTION_FUSION);
    EXPECT_EQ(error.severity, ErrorSeverity::ERROR);
    EXPECT_EQ(error.message, "Test message");
    EXPECT_EQ(error.details, "Test details");
    EXPECT_EQ(error.context, "Test context");
    EXPECT_EQ(error.session_id, "session123");
    EXPECT_FALSE(error.id.empty());
    EXPECT_GT(error.timestamp.time_since_epoch().count(), 0);
}

TEST_F(ErrorHandlerTest, ErrorInfoUniqueIds) {
    ErrorInfo error1(ErrorCategory::CRISIS_ASSESSMENT, ErrorSeverity::WARNING, "Message 1");
    ErrorInfo error2(ErrorCategory::CRISIS_ASSESSMENT, ErrorSeverity::WARNING, "Message 2");

    EXPECT_NE(error1.id, error2.id);
}

TEST_F(ErrorHandlerTest, AffectRTExceptionBasic) {
    ErrorInfo error(ErrorCategory::VOICE_MAPPING, ErrorSeverity::ERROR,
                   "Mapping failed", "No preset");

    AffectRTException exception(error);

    EXPECT_STREQ(exception.what(), "Mapping failed: No preset");
    EXPECT_EQ(exception.getErrorInfo().category, ErrorCategory::VOICE_MAPPING);
}

TEST_F(ErrorHandlerTest, SpecificExceptions) {
    ValidationException validation_ex("Empty session id", "session123");
    EXPECT_EQ(validation_ex.getErrorInfo().category, ErrorCategory::VALIDATION);
    EXPECT_EQ(validation_ex.getErrorInfo().session_id, "session123");

    ConfigurationException config_ex("Bad threshold", "fusion.confidenceThreshold");
    EXPECT_EQ(config_ex.getErrorInfo().category, ErrorCategory::CONFIGURATION);
    EXPECT_EQ(config_ex.getErrorInfo().details, "fusion.confidenceThreshold");
    EXPECT_THAT(config_ex.what(), HasSubstr("Bad threshold"));

    AudioSignalException audio_ex("Frame too short", "frame_analysis");
    EXPECT_EQ(audio_ex.getErrorInfo().category, ErrorCategory::AUDIO_SIGNAL);
    EXPECT_EQ(audio_ex.getErrorInfo().context, "frame_analysis");

    FusionException fusion_ex("Strategy failed");
    EXPECT_EQ(fusion_ex.getErrorInfo().category, ErrorCategory::EMOTION_FUSION);
    EXPECT_EQ(fusion_ex.getErrorInfo().context, "EmotionFusion");

    CrisisAssessmentException crisis_ex("Assessor failed");
    EXPECT_EQ(crisis_ex.getErrorInfo().category, ErrorCategory::CRISIS_ASSESSMENT);
    EXPECT_EQ(crisis_ex.getErrorInfo().severity, ErrorSeverity::CRITICAL);

    SessionException session_ex("Store closed", "s9");
    EXPECT_EQ(session_ex.getErrorInfo().category, ErrorCategory::SESSION_MEMORY);
    EXPECT_EQ(session_ex.getErrorInfo().session_id, "s9");

    PipelineException pipeline_ex("Pipeline stage failed", "flow");
    EXPECT_EQ(pipeline_ex.getErrorInfo().category, ErrorCategory::PIPELINE);
    EXPECT_EQ(pipeline_ex.getErrorInfo().context, "flow");
}

TEST_F(ErrorHandlerTest, ErrorReporting) {
    auto& handler = ErrorHandler::getInstance();

    ErrorInfo error(ErrorCategory::AUDIO_SIGNAL, ErrorSeverity::WARNING, "Clipped frame");
    handler.reportError(error);

    EXPECT_EQ(handler.getErrorCount(), 1u);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::AUDIO_SIGNAL), 1u);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::CONVERSATION_FLOW), 0u);
}

TEST_F(ErrorHandlerTest, ErrorCallback) {
    auto& handler = ErrorHandler::getInstance();

    bool callback_called = false;
    ErrorInfo received_error(ErrorCategory::UNKNOWN, ErrorSeverity::INFO, "");

    handler.setErrorCallback([&](const ErrorInfo& error) {
        callback_called = true;
        received_error = error;
    });

    ErrorInfo test_error(ErrorCategory::INTERRUPTION, ErrorSeverity::ERROR, "Monitor failed");
    handler.reportError(test_error);

    EXPECT_TRUE(callback_called);
    EXPECT_EQ(received_error.category, ErrorCategory::INTERRUPTION);
    EXPECT_EQ(received_error.message, "Monitor failed");
}

// A callback may query the handler without deadlocking
TEST_F(ErrorHandlerTest, CallbackCanQueryHandler) {
    auto& handler = ErrorHandler::getInstance();
    size_t seen = 0;

    handler.setErrorCallback([&](const ErrorInfo&) {
        seen = ErrorHandler::getInstance().getErrorCount();
    });
    handler.reportError(ErrorInfo(ErrorCategory::PIPELINE, ErrorSeverity::INFO, "stage timing"));

    EXPECT_EQ(seen, 1u);
}

TEST_F(ErrorHandlerTest, ThrowingCallbackIsContained) {
    auto& handler = ErrorHandler::getInstance();
    handler.setErrorCallback([](const ErrorInfo&) {
        throw std::runtime_error("callback failure");
    });

    EXPECT_NO_THROW(handler.reportError(
        ErrorInfo(ErrorCategory::PIPELINE, ErrorSeverity::ERROR, "stage failed")));
    EXPECT_EQ(handler.getErrorCount(), 1u);
}

TEST_F(ErrorHandlerTest, ErrorHistory) {
    auto& handler = ErrorHandler::getInstance();

    for (int i = 0; i < 5; ++i) {
        ErrorInfo error(ErrorCategory::PIPELINE, ErrorSeverity::INFO,
                       "Error " + std::to_string(i));
        handler.reportError(error);
    }

    EXPECT_EQ(handler.getErrorCount(), 5u);

    auto recent_errors = handler.getRecentErrors(3);
    ASSERT_EQ(recent_errors.size(), 3u);
    EXPECT_EQ(recent_errors[2].message, "Error 4"); // Most recent

    handler.clearErrorHistory();
    EXPECT_EQ(handler.getErrorCount(), 0u);
}

TEST_F(ErrorHandlerTest, HistoryIsBounded) {
    auto& handler = ErrorHandler::getInstance();
    handler.setMaxHistorySize(3);

    for (int i = 0; i < 6; ++i) {
        handler.reportError(ErrorInfo(ErrorCategory::SYSTEM, ErrorSeverity::INFO,
                                      "Error " + std::to_string(i)));
    }

    auto recent_errors = handler.getRecentErrors(10);
    ASSERT_EQ(recent_errors.size(), 3u);
    EXPECT_EQ(recent_errors.front().message, "Error 3");
}

TEST_F(ErrorHandlerTest, ExceptionReporting) {
    auto& handler = ErrorHandler::getInstance();

    FlowException flow_exception("Decision failed");
    handler.reportError(flow_exception, "flow_stage", "session456");

    EXPECT_EQ(handler.getErrorCount(ErrorCategory::CONVERSATION_FLOW), 1u);

    auto recent_errors = handler.getRecentErrors(1);
    ASSERT_EQ(recent_errors.size(), 1u);
    EXPECT_EQ(recent_errors[0].context, "flow_stage");
    EXPECT_EQ(recent_errors[0].session_id, "session456");
}

TEST_F(ErrorHandlerTest, ForeignExceptionReportedAsUnknown) {
    auto& handler = ErrorHandler::getInstance();

    handler.reportError(std::out_of_range("index"), "voice", "s1");

    auto recent_errors = handler.getRecentErrors(1);
    ASSERT_EQ(recent_errors.size(), 1u);
    EXPECT_EQ(recent_errors[0].category, ErrorCategory::UNKNOWN);
    EXPECT_EQ(recent_errors[0].message, "index");
}

TEST(ErrorNamesTest, CategoryAndSeverityStrings) {
    EXPECT_EQ(toString(ErrorCategory::CRISIS_ASSESSMENT), "CrisisAssessment");
    EXPECT_EQ(toString(ErrorCategory::SESSION_MEMORY), "SessionMemory");
    EXPECT_EQ(toString(ErrorSeverity::WARNING), "WARN");
    EXPECT_EQ(toString(ErrorSeverity::CRITICAL), "CRITICAL");
}

class ErrorContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        EXPECT_TRUE(ErrorContext::getCurrentContext().empty());
        EXPECT_TRUE(ErrorContext::getCurrentSessionId().empty());
    }
};

TEST_F(ErrorContextTest, BasicContextManagement) {
    {
        ErrorContext ctx("test_context");
        EXPECT_EQ(ErrorContext::getCurrentContext(), "test_context");
    }

    EXPECT_TRUE(ErrorContext::getCurrentContext().empty());
}

TEST_F(ErrorContextTest, NestedContexts) {
    {
        ErrorContext ctx1("outer_context");
        EXPECT_EQ(ErrorContext::getCurrentContext(), "outer_context");

        {
            ErrorContext ctx2("inner_context");
            EXPECT_EQ(ErrorContext::getCurrentContext(), "inner_context");
        }

        EXPECT_EQ(ErrorContext::getCurrentContext(), "outer_context");
    }

    EXPECT_TRUE(ErrorContext::getCurrentContext().empty());
}

TEST_F(ErrorContextTest, SessionIdManagement) {
    {
        ErrorContext ctx("test_context", "session123");
        EXPECT_EQ(ErrorContext::getCurrentContext(), "test_context");
        EXPECT_EQ(ErrorContext::getCurrentSessionId(), "session123");
    }

    EXPECT_TRUE(ErrorContext::getCurrentContext().empty());
    EXPECT_TRUE(ErrorContext::getCurrentSessionId().empty());
}

TEST_F(ErrorContextTest, ThreadLocalStorage) {
    std::string main_context;
    std::string thread_context;

    {
        ErrorContext ctx("main_context");
        main_context = ErrorContext::getCurrentContext();

        std::thread t([&]() {
            EXPECT_TRUE(ErrorContext::getCurrentContext().empty());

            ErrorContext thread_ctx("thread_context");
            thread_context = ErrorContext::getCurrentContext();
        });

        t.join();
    }

    EXPECT_EQ(main_context, "main_context");
    EXPECT_EQ(thread_context, "thread_context");
}

TEST_F(ErrorHandlerTest, ErrorHandlingMacros) {
    auto& handler = ErrorHandler::getInstance();

    bool callback_called = false;
    handler.setErrorCallback([&](const ErrorInfo& error) {
        callback_called = true;
        EXPECT_EQ(error.category, ErrorCategory::PIPELINE);
        EXPECT_EQ(error.severity, ErrorSeverity::WARNING);
        EXPECT_EQ(error.message, "Test macro error");
        EXPECT_EQ(error.details, "Additional details");
        EXPECT_EQ(error.context, "macro_test");
        EXPECT_EQ(error.session_id, "s7");
    });

    {
        ErrorContext ctx("macro_test", "s7");
        AFFECTRT_HANDLE_ERROR(ErrorCategory::PIPELINE, ErrorSeverity::WARNING,
                              "Test macro error", "Additional details");
    }

    EXPECT_TRUE(callback_called);
}
