#include <gtest/gtest.h>
#include "core/session_timeout_supervisor.hpp"
#include "fixtures/pipeline_fixtures.hpp"

#include <atomic>
#include <thread>

using namespace printvoice;
using namespace printvoice::core;
using fixtures::RecordingTransport;
using namespace std::chrono_literals;

class SessionTimeoutSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        supervisor_ = std::make_unique<SessionTimeoutSupervisor>(scheduler_, 100ms);
        supervisor_->setExpiryCallback([this](const std::string& sessionId) {
            expired_.push_back(sessionId);
            expiredCount_++;
        });
        transport_ = std::make_shared<RecordingTransport>();
        session_ = std::make_shared<VoiceSession>("idle-1", transport_, settings_);
    }

    void TearDown() override {
        scheduler_.stop();
    }

    TimerScheduler scheduler_;
    std::unique_ptr<SessionTimeoutSupervisor> supervisor_;
    utils::SessionSettings settings_;
    std::shared_ptr<RecordingTransport> transport_;
    std::shared_ptr<VoiceSession> session_;
    // Only written from the scheduler thread
    std::vector<std::string> expired_;
    std::atomic<int> expiredCount_{0};
};

TEST_F(SessionTimeoutSupervisorTest, ExpiryNotifiesAndClosesOnce) {
    supervisor_->arm(session_);

    ASSERT_TRUE(transport_->waitForClose(2s));
    std::this_thread::sleep_for(50ms);

    auto errors = transport_->eventsOfType("error");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["message"], SessionTimeoutSupervisor::kTimeoutMessage);

    EXPECT_EQ(transport_->closeCount(), 1);
    EXPECT_EQ(transport_->closeCode(), 1000);
    EXPECT_EQ(transport_->closeReason(), "Session timeout");
    EXPECT_TRUE(session_->isClosed());

    EXPECT_EQ(expiredCount_.load(), 1);
    EXPECT_EQ(expired_, (std::vector<std::string>{"idle-1"}));
    EXPECT_EQ(supervisor_->getExpiredCount(), 1u);
    EXPECT_EQ(session_->getIdleTimer(), TimerScheduler::kInvalidTimer);
}

TEST_F(SessionTimeoutSupervisorTest, RearmPostponesExpiry) {
    supervisor_->arm(session_);
    for (int i = 0; i < 4; ++i) {
        std::this_thread::sleep_for(50ms);
        supervisor_->arm(session_);
    }

    // 200ms have passed, more than the idle timeout, but never idle for long
    EXPECT_FALSE(session_->isClosed());
    EXPECT_EQ(scheduler_.pendingCount(), 1u);

    ASSERT_TRUE(transport_->waitForClose(2s));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(expiredCount_.load(), 1);
}

TEST_F(SessionTimeoutSupervisorTest, DisarmPreventsExpiry) {
    supervisor_->arm(session_);
    supervisor_->disarm(*session_);

    EXPECT_FALSE(transport_->waitForClose(300ms));
    EXPECT_EQ(expiredCount_.load(), 0);
    EXPECT_EQ(scheduler_.pendingCount(), 0u);
}

TEST_F(SessionTimeoutSupervisorTest, ClosedSessionIsNotArmed) {
    session_->close(1000, "bye");
    supervisor_->arm(session_);

    EXPECT_EQ(scheduler_.pendingCount(), 0u);
    EXPECT_EQ(session_->getIdleTimer(), TimerScheduler::kInvalidTimer);
}

TEST_F(SessionTimeoutSupervisorTest, DestroyedSessionIsIgnored) {
    supervisor_->arm(session_);
    session_.reset();

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(expiredCount_.load(), 0);
    EXPECT_EQ(transport_->closeCount(), 0);
}

TEST_F(SessionTimeoutSupervisorTest, ArmRefreshesActivity) {
    auto before = session_->getLastActivity();
    std::this_thread::sleep_for(5ms);
    supervisor_->arm(session_);

    EXPECT_GT(session_->getLastActivity(), before);
    supervisor_->disarm(*session_);
}
