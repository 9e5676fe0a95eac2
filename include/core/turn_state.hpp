#pragma once

#include "core/message_protocol.hpp"
#include "core/timer_scheduler.hpp"
#include "utils/cancellation.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>

namespace printvoice {
namespace core {

/**
 * Shared state of one pipeline turn, raced by the stage sequence and the
 * processing deadline.
 *
 * Exactly one party finishes the turn. Events are only emitted while the
 * turn is unfinished, and the check and the send happen under the same
 * lock, so nothing from the losing side can follow the winner's final
 * event.
 */
class TurnState {
public:
    using Emitter = std::function<bool(const Message&)>;

    explicit TurnState(uint64_t turnId) : turnId_(turnId), finished_(false) {}

    uint64_t getTurnId() const { return turnId_; }
    const utils::CancellationToken& getCancelToken() const { return cancel_; }

    // Emit while the turn is still open; false if the turn is finished
    bool emitIfActive(const Emitter& emit, const Message& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return false;
        }
        return emit(message);
    }

    /**
     * Finish the turn with a final event. Returns true for the first caller
     * only; that caller owns the cleanup.
     */
    bool finishWith(const Emitter& emit, const Message& finalMessage) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return false;
        }
        finished_ = true;
        emit(finalMessage);
        return true;
    }

    // Finish silently and cancel in-flight work (reset, disconnect)
    bool abandon() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (finished_) {
                return false;
            }
            finished_ = true;
        }
        cancel_.cancel();
        return true;
    }

    void cancel() { cancel_.cancel(); }

    bool isFinished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_;
    }

    void setDeadlineTimer(TimerScheduler::TimerId id) { deadlineTimer_.store(id); }
    TimerScheduler::TimerId takeDeadlineTimer() {
        return deadlineTimer_.exchange(TimerScheduler::kInvalidTimer);
    }

private:
    const uint64_t turnId_;
    utils::CancellationToken cancel_;
    std::atomic<TimerScheduler::TimerId> deadlineTimer_{TimerScheduler::kInvalidTimer};

    mutable std::mutex mutex_;
    bool finished_;
};

} // namespace core
} // namespace printvoice
