#include "core/scheduler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace affectrt {
namespace core {

namespace {

// Fixed epoch so virtual timestamps never collide with steady_clock's zero
constexpr int64_t kVirtualEpochMs = 1000000;

Milliseconds atLeastOne(Milliseconds interval) {
    return interval.count() > 0 ? interval : Milliseconds(1);
}

} // namespace

VirtualClock::VirtualClock() : nowMs_(kVirtualEpochMs) {
}

TimePoint VirtualClock::now() const {
    return TimePoint(Milliseconds(nowMs_.load()));
}

void VirtualClock::advance(Milliseconds delta) {
    if (delta.count() > 0) {
        nowMs_.fetch_add(delta.count());
    }
}

void VirtualClock::set(TimePoint time) {
    nowMs_.store(std::chrono::duration_cast<Milliseconds>(time.time_since_epoch()).count());
}

namespace detail {

void runTask(const ScheduledTask& task) {
    if (task.token.isCancelled()) {
        return;
    }
    try {
        task.callback();
    } catch (const std::exception& e) {
        utils::Logger::error("Scheduled task " + std::to_string(task.id) +
                             " failed: " + e.what());
    }
}

} // namespace detail

// VirtualScheduler

VirtualScheduler::VirtualScheduler(std::shared_ptr<VirtualClock> clock)
    : clock_(clock ? std::move(clock) : std::make_shared<VirtualClock>()) {
}

CancellationToken VirtualScheduler::scheduleEvery(Milliseconds interval, Callback tick) {
    return add(atLeastOne(interval), atLeastOne(interval), std::move(tick));
}

CancellationToken VirtualScheduler::scheduleAfter(Milliseconds delay, Callback fn) {
    return add(delay, Milliseconds(0), std::move(fn));
}

CancellationToken VirtualScheduler::add(Milliseconds delay, Milliseconds interval, Callback fn) {
    if (!fn) {
        throw std::invalid_argument("Scheduled callback must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    detail::ScheduledTask task;
    task.id = nextId_++;
    task.due = clock_->now() + std::max(delay, Milliseconds(0));
    task.interval = interval;
    task.callback = std::move(fn);
    tasks_.push_back(task);
    return task.token;
}

size_t VirtualScheduler::advance(Milliseconds delta) {
    const TimePoint target = clock_->now() + std::max(delta, Milliseconds(0));
    size_t executed = 0;

    while (true) {
        detail::ScheduledTask next;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                        [](const detail::ScheduledTask& t) {
                                            return t.token.isCancelled();
                                        }),
                         tasks_.end());

            auto it = std::min_element(tasks_.begin(), tasks_.end(),
                                       [](const detail::ScheduledTask& a, const detail::ScheduledTask& b) {
                                           return a.due != b.due ? a.due < b.due : a.id < b.id;
                                       });
            if (it == tasks_.end() || it->due > target) {
                break;
            }

            next = *it;
            if (it->interval.count() > 0) {
                it->due += it->interval;
            } else {
                tasks_.erase(it);
            }
        }

        // Clock moves to the task's due time before it runs
        if (next.due > clock_->now()) {
            clock_->set(next.due);
        }
        detail::runTask(next);
        executed++;
    }

    clock_->set(target);
    return executed;
}

size_t VirtualScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
                                             [](const detail::ScheduledTask& t) {
                                                 return !t.token.isCancelled();
                                             }));
}

// ThreadScheduler

ThreadScheduler::ThreadScheduler() : running_(false) {
}

ThreadScheduler::~ThreadScheduler() {
    stop();
}

void ThreadScheduler::start() {
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread(&ThreadScheduler::run, this);
}

void ThreadScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    condition_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.clear();
}

CancellationToken ThreadScheduler::scheduleEvery(Milliseconds interval, Callback tick) {
    return add(atLeastOne(interval), atLeastOne(interval), std::move(tick));
}

CancellationToken ThreadScheduler::scheduleAfter(Milliseconds delay, Callback fn) {
    return add(delay, Milliseconds(0), std::move(fn));
}

CancellationToken ThreadScheduler::add(Milliseconds delay, Milliseconds interval, Callback fn) {
    if (!fn) {
        throw std::invalid_argument("Scheduled callback must not be empty");
    }
    detail::ScheduledTask task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task.id = nextId_++;
        task.due = clock_.now() + std::max(delay, Milliseconds(0));
        task.interval = interval;
        task.callback = std::move(fn);
        tasks_.push_back(task);
    }
    condition_.notify_all();
    return task.token;
}

void ThreadScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                    [](const detail::ScheduledTask& t) {
                                        return t.token.isCancelled();
                                    }),
                     tasks_.end());

        auto it = std::min_element(tasks_.begin(), tasks_.end(),
                                   [](const detail::ScheduledTask& a, const detail::ScheduledTask& b) {
                                       return a.due < b.due;
                                   });
        if (it == tasks_.end()) {
            condition_.wait(lock);
            continue;
        }

        if (it->due > clock_.now()) {
            condition_.wait_until(lock, it->due);
            continue;
        }

        detail::ScheduledTask next = *it;
        if (it->interval.count() > 0) {
            it->due = clock_.now() + it->interval;
        } else {
            tasks_.erase(it);
        }

        lock.unlock();
        if (!next.token.isCancelled()) {
            detail::runTask(next);
        }
        lock.lock();
    }
}

} // namespace core
} // namespace affectrt
