#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace affectrt {
namespace core {

using TimePoint = std::chrono::steady_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

/**
 * Time source. Production code uses SteadyClock, tests use VirtualClock.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

/**
 * Manually advanced clock. Starts at an arbitrary fixed epoch.
 */
class VirtualClock : public Clock {
public:
    VirtualClock();
    TimePoint now() const override;
    void advance(Milliseconds delta);
    void set(TimePoint time);

private:
    std::atomic<int64_t> nowMs_;
};

/**
 * Shared cancel flag. Copies observe the same state; cancel() is idempotent.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { cancelled_->store(true); }
    bool isCancelled() const { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

/**
 * Cooperative scheduler for polling loops and one-shot timers
 */
class Scheduler {
public:
    using Callback = std::function<void()>;

    virtual ~Scheduler() = default;

    /**
     * Run tick every interval until the returned token is cancelled.
     * The first tick fires one interval after scheduling.
     */
    virtual CancellationToken scheduleEvery(Milliseconds interval, Callback tick) = 0;

    /**
     * Run fn once after delay unless the returned token is cancelled first.
     */
    virtual CancellationToken scheduleAfter(Milliseconds delay, Callback fn) = 0;

    virtual const Clock& clock() const = 0;
};

namespace detail {

struct ScheduledTask {
    uint64_t id = 0;
    TimePoint due;
    Milliseconds interval{0};  // zero for one-shot timers
    Scheduler::Callback callback;
    CancellationToken token;
};

/**
 * Runs a task callback; exceptions are logged and swallowed per tick so the
 * task keeps its schedule.
 */
void runTask(const ScheduledTask& task);

} // namespace detail

/**
 * Deterministic scheduler driven by advance(). Due tasks run on the calling
 * thread in due-time order.
 */
class VirtualScheduler : public Scheduler {
public:
    explicit VirtualScheduler(std::shared_ptr<VirtualClock> clock = nullptr);

    CancellationToken scheduleEvery(Milliseconds interval, Callback tick) override;
    CancellationToken scheduleAfter(Milliseconds delay, Callback fn) override;
    const Clock& clock() const override { return *clock_; }

    /**
     * Shared handle so other components can read the same virtual time
     */
    std::shared_ptr<VirtualClock> sharedClock() const { return clock_; }

    /**
     * Move virtual time forward, running every task that becomes due on the way.
     * Returns the number of callbacks executed.
     */
    size_t advance(Milliseconds delta);

    size_t pendingCount() const;

private:
    CancellationToken add(Milliseconds delay, Milliseconds interval, Callback fn);

    std::shared_ptr<VirtualClock> clock_;
    std::vector<detail::ScheduledTask> tasks_;
    uint64_t nextId_ = 0;
    mutable std::mutex mutex_;
};

/**
 * Real-time scheduler with a single background thread
 */
class ThreadScheduler : public Scheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_; }

    CancellationToken scheduleEvery(Milliseconds interval, Callback tick) override;
    CancellationToken scheduleAfter(Milliseconds delay, Callback fn) override;
    const Clock& clock() const override { return clock_; }

private:
    CancellationToken add(Milliseconds delay, Milliseconds interval, Callback fn);
    void run();

    SteadyClock clock_;
    std::vector<detail::ScheduledTask> tasks_;
    uint64_t nextId_ = 0;
    std::mutex mutex_;
    std::condition_variable condition_;
    std::thread worker_;
    std::atomic<bool> running_;
};

} // namespace core
} // namespace affectrt
