#pragma once

#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace affectrt {
namespace core {

/**
 * Scheduling class of a queued job
 */
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    CRITICAL = 3
};

/**
 * A unit of work popped from the TaskQueue
 */
class Task {
public:
    Task(std::function<void()> job, TaskPriority priority)
        : job_(std::move(job)), priority_(priority) {}

    void execute() {
        if (job_) {
            job_();
        }
    }

    TaskPriority getPriority() const { return priority_; }

private:
    std::function<void()> job_;
    TaskPriority priority_;
};

/**
 * Blocking multi-producer job queue. Jobs are served highest priority first
 * and in submission order within one priority.
 */
class TaskQueue {
public:
    TaskQueue() = default;
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /**
     * Queue a job. Returns false once shutdown() has been called.
     */
    bool enqueue(std::function<void()> job, TaskPriority priority = TaskPriority::NORMAL);

    /**
     * Queue a callable and return a future for its result or exception
     */
    template<typename F>
    auto enqueueWithFuture(TaskPriority priority, F&& f)
        -> std::future<typename std::invoke_result<F>::type>;

    /**
     * Block until a job is available. Returns nullptr when the queue is shut
     * down and empty.
     */
    std::shared_ptr<Task> dequeue();
    std::shared_ptr<Task> tryDequeue();

    size_t size() const;
    bool empty() const;
    void clear();

    void shutdown();
    bool isShuttingDown() const { return closed_; }

private:
    static constexpr size_t kPriorityLevels = 4;

    std::shared_ptr<Task> popLocked();

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::array<std::deque<std::shared_ptr<Task>>, kPriorityLevels> buckets_;
    size_t pending_ = 0;
    std::atomic<bool> closed_{false};
};

/**
 * Fixed set of workers draining one TaskQueue
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t workers = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void start(std::shared_ptr<TaskQueue> queue);

    /**
     * Close the queue and join the workers. Jobs already queued still run.
     */
    void stop();

    size_t getNumThreads() const { return size_; }
    size_t getActiveThreads() const { return busy_; }
    bool isRunning() const { return running_; }

private:
    void run();

    size_t size_;
    std::vector<std::thread> threads_;
    std::shared_ptr<TaskQueue> queue_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> busy_{0};
};

/**
 * Per-key serialization on top of a TaskQueue. Jobs sharing a key run one
 * at a time in submission order; jobs with different keys run in parallel.
 */
class SessionStrand {
public:
    explicit SessionStrand(std::shared_ptr<TaskQueue> queue);

    SessionStrand(const SessionStrand&) = delete;
    SessionStrand& operator=(const SessionStrand&) = delete;

    template<typename F>
    auto submit(const std::string& key, F&& f)
        -> std::future<typename std::invoke_result<F>::type>;

    /**
     * Keys with queued or running jobs
     */
    size_t activeKeys() const;

private:
    struct Lane {
        std::deque<std::function<void()>> jobs;
        bool scheduled = false;
    };

    void post(const std::string& key, std::function<void()> job);
    void drain(const std::string& key);

    std::shared_ptr<TaskQueue> queue_;
    std::map<std::string, Lane> lanes_;
    mutable std::mutex mutex_;
};

namespace detail {

template<typename F>
auto packageJob(F&& f)
    -> std::pair<std::function<void()>, std::future<typename std::invoke_result<F>::type>> {
    using R = typename std::invoke_result<F>::type;
    auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    auto future = packaged->get_future();
    return {[packaged]() { (*packaged)(); }, std::move(future)};
}

} // namespace detail

template<typename F>
auto TaskQueue::enqueueWithFuture(TaskPriority priority, F&& f)
    -> std::future<typename std::invoke_result<F>::type> {
    auto job = detail::packageJob(std::forward<F>(f));
    enqueue(std::move(job.first), priority);
    return std::move(job.second);
}

template<typename F>
auto SessionStrand::submit(const std::string& key, F&& f)
    -> std::future<typename std::invoke_result<F>::type> {
    auto job = detail::packageJob(std::forward<F>(f));
    post(key, std::move(job.first));
    return std::move(job.second);
}

} // namespace core
} // namespace affectrt
