#include "core/timer_scheduler.hpp"
#include "utils/logging.hpp"

namespace printvoice {
namespace core {

TimerScheduler::TimerScheduler() : nextId_(1), stopping_(false) {
    worker_ = std::thread(&TimerScheduler::run, this);
}

TimerScheduler::~TimerScheduler() {
    stop();
}

TimerScheduler::TimerId TimerScheduler::schedule(std::chrono::milliseconds delay,
                                                 std::function<void()> callback) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return kInvalidTimer;
        }
        id = nextId_++;
        auto deadline = Clock::now() + delay;
        timers_[id] = PendingTimer{deadline, std::move(callback)};
        deadlines_.emplace(deadline, id);
    }
    condition_.notify_one();
    return id;
}

bool TimerScheduler::cancel(TimerId id) {
    if (id == kInvalidTimer) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return false;
    }

    auto range = deadlines_.equal_range(it->second.deadline);
    for (auto d = range.first; d != range.second; ++d) {
        if (d->second == id) {
            deadlines_.erase(d);
            break;
        }
    }
    timers_.erase(it);
    return true;
}

size_t TimerScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void TimerScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        timers_.clear();
        deadlines_.clear();
    }
    condition_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TimerScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (deadlines_.empty()) {
            condition_.wait(lock);
            continue;
        }

        auto next = deadlines_.begin();
        if (Clock::now() < next->first) {
            condition_.wait_until(lock, next->first);
            continue;
        }

        TimerId id = next->second;
        deadlines_.erase(next);
        auto it = timers_.find(id);
        if (it == timers_.end()) {
            continue;
        }
        std::function<void()> callback = std::move(it->second.callback);
        timers_.erase(it);

        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            utils::Logger::error("Timer callback " + std::to_string(id) + " threw: " + e.what());
        }
        lock.lock();
    }
}

} // namespace core
} // namespace printvoice
