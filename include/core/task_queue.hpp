#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace printvoice {
namespace core {

/**
 * Base task interface
 */
class Task {
public:
    explicit Task(std::string label = "task")
        : label_(std::move(label)), created_at_(std::chrono::steady_clock::now()) {}
    
    virtual ~Task() = default;
    virtual void execute() = 0;
    
    const std::string& getLabel() const { return label_; }
    std::chrono::steady_clock::time_point getCreatedAt() const { return created_at_; }

private:
    std::string label_;
    std::chrono::steady_clock::time_point created_at_;
};

/**
 * Function-based task implementation
 */
class FunctionTask : public Task {
public:
    FunctionTask(std::function<void()> func, std::string label = "task")
        : Task(std::move(label)), func_(std::move(func)) {}
    
    void execute() override {
        if (func_) {
            func_();
        }
    }

private:
    std::function<void()> func_;
};

/**
 * Thread-safe FIFO task queue. Turns from different sessions are independent,
 * so arrival order is the only ordering kept.
 */
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();
    
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;
    TaskQueue(TaskQueue&&) = delete;
    TaskQueue& operator=(TaskQueue&&) = delete;
    
    /**
     * Add a task to the queue. Returns false once the queue is shutting down.
     */
    bool enqueue(std::shared_ptr<Task> task);
    bool enqueue(std::function<void()> func, const std::string& label = "task");
    
    /**
     * Get the next task from the queue (blocks if empty)
     * Returns nullptr if queue is shutting down
     */
    std::shared_ptr<Task> dequeue();
    
    /**
     * Try to get the next task without blocking
     * Returns nullptr if queue is empty
     */
    std::shared_ptr<Task> tryDequeue();
    
    size_t size() const;
    bool empty() const;
    void clear();
    
    /**
     * Shutdown the queue (wake up all waiting threads). Tasks still queued
     * are drained by the workers before they exit.
     */
    void shutdown();
    bool isShuttingDown() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<std::shared_ptr<Task>> queue_;
    std::atomic<bool> shutdown_;
};

/**
 * Thread pool for executing tasks from TaskQueue
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();
    
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;
    
    void start(std::shared_ptr<TaskQueue> task_queue);
    
    /**
     * Stop the thread pool and wait for all threads to finish
     */
    void stop();
    
    size_t getNumThreads() const { return num_threads_; }
    size_t getActiveThreads() const;
    size_t getFailedTasks() const { return failed_tasks_; }
    bool isRunning() const { return running_; }

private:
    void workerLoop();
    
    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::shared_ptr<TaskQueue> task_queue_;
    std::atomic<bool> running_;
    std::atomic<size_t> active_threads_;
    std::atomic<size_t> failed_tasks_;
};

} // namespace core
} // namespace printvoice
