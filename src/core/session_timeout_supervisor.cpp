#include "core/session_timeout_supervisor.hpp"
#include "utils/logging.hpp"

namespace printvoice {
namespace core {

SessionTimeoutSupervisor::SessionTimeoutSupervisor(TimerScheduler& scheduler,
                                                   std::chrono::milliseconds idleTimeout)
    : scheduler_(scheduler), idleTimeout_(idleTimeout) {
}

void SessionTimeoutSupervisor::arm(const std::shared_ptr<VoiceSession>& session) {
    if (!session || session->isClosed()) {
        return;
    }
    session->touch();

    // The callback needs its own id, which is only known after scheduling;
    // holding armMutex_ keeps an early firing from seeing a half-armed timer
    std::lock_guard<std::mutex> lock(armMutex_);
    auto timerId = std::make_shared<std::atomic<TimerScheduler::TimerId>>(TimerScheduler::kInvalidTimer);
    std::weak_ptr<VoiceSession> weakSession = session;
    TimerScheduler::TimerId id = scheduler_.schedule(idleTimeout_, [this, weakSession, timerId]() {
        onExpired(weakSession, *timerId);
    });
    timerId->store(id);

    TimerScheduler::TimerId previous = session->exchangeIdleTimer(id);
    if (previous != TimerScheduler::kInvalidTimer) {
        scheduler_.cancel(previous);
    }
}

void SessionTimeoutSupervisor::disarm(VoiceSession& session) {
    TimerScheduler::TimerId previous = session.exchangeIdleTimer(TimerScheduler::kInvalidTimer);
    if (previous != TimerScheduler::kInvalidTimer) {
        scheduler_.cancel(previous);
    }
}

void SessionTimeoutSupervisor::onExpired(const std::weak_ptr<VoiceSession>& weakSession,
                                         const std::atomic<TimerScheduler::TimerId>& timerId) {
    auto session = weakSession.lock();
    if (!session) {
        return;
    }
    {
        // A timer that was replaced after it started firing must not act
        std::lock_guard<std::mutex> lock(armMutex_);
        TimerScheduler::TimerId timer = timerId.load();
        if (timer == TimerScheduler::kInvalidTimer || !session->releaseIdleTimer(timer)) {
            return;
        }
    }

    expiredCount_++;
    utils::Logger::info("Session timed out due to inactivity: " + session->getSessionId());

    if (!session->sendError(kTimeoutMessage)) {
        utils::Logger::warn("Could not deliver timeout notice to session " + session->getSessionId());
    }
    session->close(kTimeoutCloseCode, kTimeoutCloseReason);

    if (expiryCallback_) {
        expiryCallback_(session->getSessionId());
    }
}

} // namespace core
} // namespace printvoice
