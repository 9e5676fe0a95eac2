#pragma once

#include "core/timer_scheduler.hpp"
#include "core/voice_session.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace printvoice {
namespace core {

/**
 * Idle-timeout enforcement. Every session has at most one pending idle
 * timer; arming cancels the previous one first.
 *
 * On expiry the client gets a best-effort error event, the transport is
 * closed with 1000 "Session timeout" and the expiry callback runs the
 * regular session cleanup.
 */
class SessionTimeoutSupervisor {
public:
    using ExpiryCallback = std::function<void(const std::string& sessionId)>;

    static constexpr int kTimeoutCloseCode = 1000;
    static constexpr const char* kTimeoutCloseReason = "Session timeout";
    static constexpr const char* kTimeoutMessage = "Session timed out due to inactivity";

    SessionTimeoutSupervisor(TimerScheduler& scheduler, std::chrono::milliseconds idleTimeout);

    void setExpiryCallback(ExpiryCallback callback) { expiryCallback_ = std::move(callback); }

    // Cancel-then-rearm; also refreshes the session's activity timestamp
    void arm(const std::shared_ptr<VoiceSession>& session);
    void disarm(VoiceSession& session);

    std::chrono::milliseconds getIdleTimeout() const { return idleTimeout_; }
    uint64_t getExpiredCount() const { return expiredCount_.load(); }

private:
    void onExpired(const std::weak_ptr<VoiceSession>& weakSession,
                   const std::atomic<TimerScheduler::TimerId>& timerId);

    TimerScheduler& scheduler_;
    const std::chrono::milliseconds idleTimeout_;
    ExpiryCallback expiryCallback_;
    std::atomic<uint64_t> expiredCount_{0};
    std::mutex armMutex_;
};

} // namespace core
} // namespace printvoice
