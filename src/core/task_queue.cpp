#include "core/task_queue.hpp"
#include "utils/logging.hpp"

namespace affectrt {
namespace core {

TaskQueue::~TaskQueue() {
    shutdown();
}

bool TaskQueue::enqueue(std::function<void()> job, TaskPriority priority) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        buckets_[static_cast<size_t>(priority)].push_back(
            std::make_shared<Task>(std::move(job), priority));
        ++pending_;
    }
    ready_.notify_one();
    return true;
}

std::shared_ptr<Task> TaskQueue::popLocked() {
    for (size_t level = kPriorityLevels; level-- > 0;) {
        auto& bucket = buckets_[level];
        if (!bucket.empty()) {
            auto task = std::move(bucket.front());
            bucket.pop_front();
            --pending_;
            return task;
        }
    }
    return nullptr;
}

std::shared_ptr<Task> TaskQueue::dequeue() {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return pending_ > 0 || closed_; });
    return popLocked();
}

std::shared_ptr<Task> TaskQueue::tryDequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    return popLocked();
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

bool TaskQueue::empty() const {
    return size() == 0;
}

void TaskQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& bucket : buckets_) {
        bucket.clear();
    }
    pending_ = 0;
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    ready_.notify_all();
}

ThreadPool::ThreadPool(size_t workers) : size_(workers == 0 ? 1 : workers) {
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::start(std::shared_ptr<TaskQueue> queue) {
    if (running_ || !queue) {
        return;
    }

    queue_ = std::move(queue);
    running_ = true;
    threads_.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        threads_.emplace_back(&ThreadPool::run, this);
    }
    utils::Logger::debug("Thread pool started with " + std::to_string(size_) + " workers");
}

void ThreadPool::stop() {
    if (!running_) {
        return;
    }

    queue_->shutdown();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    queue_.reset();
    running_ = false;
}

void ThreadPool::run() {
    while (auto task = queue_->dequeue()) {
        ++busy_;
        try {
            task->execute();
        } catch (const std::exception& e) {
            utils::Logger::error(std::string("Worker task failed: ") + e.what());
        }
        --busy_;
    }
}

SessionStrand::SessionStrand(std::shared_ptr<TaskQueue> queue) : queue_(std::move(queue)) {
}

size_t SessionStrand::activeKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lanes_.size();
}

void SessionStrand::post(const std::string& key, std::function<void()> job) {
    bool needsDrain = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Lane& lane = lanes_[key];
        lane.jobs.push_back(std::move(job));
        needsDrain = !lane.scheduled;
        lane.scheduled = true;
    }

    if (!needsDrain) {
        return;
    }
    if (!queue_->enqueue([this, key]() { drain(key); })) {
        utils::Logger::warn("Task queue closed, running job for '" + key + "' inline");
        drain(key);
    }
}

void SessionStrand::drain(const std::string& key) {
    for (;;) {
        std::function<void()> job;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = lanes_.find(key);
            if (it == lanes_.end()) {
                return;
            }
            if (it->second.jobs.empty()) {
                lanes_.erase(it);
                return;
            }
            job = std::move(it->second.jobs.front());
            it->second.jobs.pop_front();
        }
        // packaged tasks deliver their own exceptions
        job();
    }
}

} // namespace core
} // namespace affectrt
