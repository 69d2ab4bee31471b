#include "core/task_queue.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <atomic>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <vector>
#include <thread>

using namespace affectrt::core;

class TaskQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        task_queue = std::make_shared<TaskQueue>();
    }

    void TearDown() override {
        task_queue->shutdown();
    }

    std::shared_ptr<TaskQueue> task_queue;
};

// Test basic task enqueueing and dequeueing
TEST_F(TaskQueueTest, BasicEnqueueDequeue) {
    std::atomic<int> counter{0};

    task_queue->enqueue([&counter]() {
        counter++;
    });

    EXPECT_EQ(task_queue->size(), 1u);
    EXPECT_FALSE(task_queue->empty());

    auto task = task_queue->tryDequeue();
    ASSERT_NE(task, nullptr);
    task->execute();

    EXPECT_EQ(counter.load(), 1);
    EXPECT_EQ(task_queue->size(), 0u);
    EXPECT_TRUE(task_queue->empty());
}

// Test priority ordering
TEST_F(TaskQueueTest, PriorityOrdering) {
    std::vector<int> execution_order;

    task_queue->enqueue([&]() { execution_order.push_back(1); }, TaskPriority::LOW);
    task_queue->enqueue([&]() { execution_order.push_back(2); }, TaskPriority::HIGH);
    task_queue->enqueue([&]() { execution_order.push_back(3); }, TaskPriority::CRITICAL);
    task_queue->enqueue([&]() { execution_order.push_back(4); }, TaskPriority::NORMAL);

    while (!task_queue->empty()) {
        auto task = task_queue->tryDequeue();
        if (task) {
            task->execute();
        }
    }

    // CRITICAL(3), HIGH(2), NORMAL(4), LOW(1)
    ASSERT_EQ(execution_order.size(), 4u);
    EXPECT_EQ(execution_order[0], 3);
    EXPECT_EQ(execution_order[1], 2);
    EXPECT_EQ(execution_order[2], 4);
    EXPECT_EQ(execution_order[3], 1);
}

// Tasks of equal priority keep submission order
TEST_F(TaskQueueTest, FIFOWithinSamePriority) {
    std::vector<int> execution_order;

    for (int i = 0; i < 5; ++i) {
        task_queue->enqueue([&execution_order, i]() { execution_order.push_back(i); });
    }

    while (auto task = task_queue->tryDequeue()) {
        task->execute();
    }

    ASSERT_EQ(execution_order.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(execution_order[i], i);
    }
}

TEST_F(TaskQueueTest, FutureBasedTasks) {
    auto future = task_queue->enqueueWithFuture(TaskPriority::NORMAL, []() {
        return 21 * 2;
    });

    auto task = task_queue->tryDequeue();
    ASSERT_NE(task, nullptr);
    task->execute();

    EXPECT_EQ(future.get(), 42);
}

TEST_F(TaskQueueTest, FutureCarriesException) {
    auto future = task_queue->enqueueWithFuture(TaskPriority::NORMAL, []() -> int {
        throw std::runtime_error("boom");
    });

    auto task = task_queue->tryDequeue();
    ASSERT_NE(task, nullptr);
    task->execute();

    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(TaskQueueTest, ShutdownRejectsNewTasks) {
    task_queue->shutdown();

    EXPECT_TRUE(task_queue->isShuttingDown());
    EXPECT_FALSE(task_queue->enqueue([]() {}));
    EXPECT_TRUE(task_queue->empty());
    EXPECT_EQ(task_queue->dequeue(), nullptr);
}

TEST_F(TaskQueueTest, Clear) {
    for (int i = 0; i < 3; ++i) {
        task_queue->enqueue([]() {});
    }
    EXPECT_EQ(task_queue->size(), 3u);

    task_queue->clear();
    EXPECT_TRUE(task_queue->empty());
}

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        task_queue = std::make_shared<TaskQueue>();
        thread_pool = std::make_unique<ThreadPool>(2);
    }

    void TearDown() override {
        thread_pool->stop();
    }

    std::shared_ptr<TaskQueue> task_queue;
    std::unique_ptr<ThreadPool> thread_pool;
};

TEST_F(ThreadPoolTest, BasicExecution) {
    std::atomic<int> counter{0};
    thread_pool->start(task_queue);
    EXPECT_TRUE(thread_pool->isRunning());

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(task_queue->enqueueWithFuture(TaskPriority::NORMAL, [&counter]() {
            counter++;
        }));
    }
    for (auto& f : futures) {
        f.get();
    }

    EXPECT_EQ(counter.load(), 10);
}

// A throwing task must not take its worker down
TEST_F(ThreadPoolTest, ExceptionHandling) {
    thread_pool->start(task_queue);

    task_queue->enqueue([]() { throw std::runtime_error("worker failure"); });
    auto after = task_queue->enqueueWithFuture(TaskPriority::LOW, []() { return 7; });

    ASSERT_EQ(after.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(after.get(), 7);
}

TEST_F(ThreadPoolTest, StopDrainsPendingTasks) {
    std::atomic<int> counter{0};
    for (int i = 0; i < 20; ++i) {
        task_queue->enqueue([&counter]() { counter++; });
    }

    thread_pool->start(task_queue);
    thread_pool->stop();

    EXPECT_FALSE(thread_pool->isRunning());
    EXPECT_EQ(counter.load(), 20);
}

class SessionStrandTest : public ::testing::Test {
protected:
    void SetUp() override {
        task_queue = std::make_shared<TaskQueue>();
        thread_pool = std::make_unique<ThreadPool>(4);
        thread_pool->start(task_queue);
        strand = std::make_unique<SessionStrand>(task_queue);
    }

    void TearDown() override {
        thread_pool->stop();
    }

    std::shared_ptr<TaskQueue> task_queue;
    std::unique_ptr<ThreadPool> thread_pool;
    std::unique_ptr<SessionStrand> strand;
};

TEST_F(SessionStrandTest, SameKeyRunsInSubmissionOrder) {
    std::vector<int> order;
    std::atomic<int> in_flight{0};
    std::atomic<bool> overlapped{false};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 50; ++i) {
        futures.push_back(strand->submit("s1", [&, i]() {
            if (in_flight.fetch_add(1) != 0) {
                overlapped = true;
            }
            order.push_back(i);
            in_flight.fetch_sub(1);
        }));
    }
    for (auto& f : futures) {
        f.get();
    }

    EXPECT_FALSE(overlapped.load());
    ASSERT_EQ(order.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

TEST_F(SessionStrandTest, DifferentKeysRunInParallel) {
    std::mutex mutex;
    std::condition_variable cv;
    int arrived = 0;

    // Each job waits for the other; only parallel execution lets both finish
    auto rendezvous = [&]() {
        std::unique_lock<std::mutex> lock(mutex);
        ++arrived;
        cv.notify_all();
        return cv.wait_for(lock, std::chrono::seconds(5), [&] { return arrived == 2; });
    };

    auto a = strand->submit("alpha", rendezvous);
    auto b = strand->submit("beta", rendezvous);

    EXPECT_TRUE(a.get());
    EXPECT_TRUE(b.get());
}

TEST_F(SessionStrandTest, ResultsAndExceptionsReachTheCaller) {
    auto ok = strand->submit("s1", []() { return std::string("done"); });
    auto failed = strand->submit("s1", []() -> int { throw std::logic_error("bad turn"); });
    auto next = strand->submit("s1", []() { return 3; });

    EXPECT_EQ(ok.get(), "done");
    EXPECT_THROW(failed.get(), std::logic_error);
    EXPECT_EQ(next.get(), 3);
}

TEST_F(SessionStrandTest, IdleLanesAreReleased) {
    strand->submit("s1", []() {}).get();
    strand->submit("s2", []() {}).get();

    // The lane is erased by the worker right after the last job returns
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (strand->activeKeys() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(strand->activeKeys(), 0u);
}

TEST_F(SessionStrandTest, RunsInlineAfterQueueShutdown) {
    thread_pool->stop();

    auto future = strand->submit("late", []() { return 11; });
    EXPECT_EQ(future.get(), 11);
}
