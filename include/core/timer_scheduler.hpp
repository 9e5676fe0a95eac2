#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace printvoice {
namespace core {

/**
 * Single-thread scheduler for cancellable one-shot callbacks.
 *
 * Callbacks run on the scheduler thread, outside the internal lock, so a
 * callback may schedule or cancel other timers. Once cancel(id) has returned
 * true the callback for id is guaranteed not to run.
 */
class TimerScheduler {
public:
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;

    static constexpr TimerId kInvalidTimer = 0;

    TimerScheduler();
    ~TimerScheduler();

    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> callback);

    // Returns true if the timer was still pending
    bool cancel(TimerId id);

    size_t pendingCount() const;

    /**
     * Stop the scheduler thread. Pending timers are discarded without firing.
     */
    void stop();

private:
    struct PendingTimer {
        Clock::time_point deadline;
        std::function<void()> callback;
    };

    void run();

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::map<TimerId, PendingTimer> timers_;
    std::multimap<Clock::time_point, TimerId> deadlines_;
    TimerId nextId_;
    bool stopping_;
    std::thread worker_;
};

} // namespace core
} // namespace printvoice
