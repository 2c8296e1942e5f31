// VERISCORE - Thread Pool Tests
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include <gtest/gtest.h>

#include "veriscore/util/threadpool.h"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace veriscore {
namespace util {
namespace {

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        ThreadPool::Config config;
        config.numThreads = 4;
        config.name = "test";
        pool_ = std::make_unique<ThreadPool>(config);
    }

    void TearDown() override {
        pool_->Shutdown();
    }

    std::unique_ptr<ThreadPool> pool_;
};

TEST_F(ThreadPoolTest, Construction) {
    EXPECT_TRUE(pool_->IsRunning());
    EXPECT_EQ(pool_->ThreadCount(), 4u);
}

TEST_F(ThreadPoolTest, SubmitReturnsValue) {
    auto future = pool_->Submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(future.get(), 5);
}

TEST_F(ThreadPoolTest, MultipleTasks) {
    const int numTasks = 100;
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < numTasks; ++i) {
        futures.push_back(pool_->Submit([&counter]() { counter++; }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(counter.load(), numTasks);
}

TEST_F(ThreadPoolTest, ExceptionPropagatesToFuture) {
    auto future = pool_->Submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // Worker survives the throwing task
    EXPECT_EQ(pool_->Submit([]() { return 7; }).get(), 7);
}

TEST_F(ThreadPoolTest, WaitDrainsQueue) {
    std::atomic<int> counter{0};
    for (int i = 0; i < 20; ++i) {
        pool_->Submit([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            counter++;
        });
    }
    pool_->Wait();
    EXPECT_EQ(counter.load(), 20);
    EXPECT_EQ(pool_->PendingTasks(), 0u);
    EXPECT_EQ(pool_->ActiveTasks(), 0u);
}

TEST_F(ThreadPoolTest, SubmitAfterShutdownThrows) {
    pool_->Shutdown();
    EXPECT_FALSE(pool_->IsRunning());
    EXPECT_THROW(pool_->Submit([]() {}), std::runtime_error);
}

TEST_F(ThreadPoolTest, StatsCountTasks) {
    for (int i = 0; i < 5; ++i) {
        pool_->Submit([]() {});
    }
    pool_->Wait();

    ThreadPool::Stats stats = pool_->GetStats();
    EXPECT_EQ(stats.submitted, 5u);
    EXPECT_EQ(stats.completed, 5u);
    EXPECT_EQ(stats.rejected, 0u);

    pool_->Shutdown();
    EXPECT_THROW(pool_->Submit([]() {}), std::runtime_error);
    EXPECT_EQ(pool_->GetStats().rejected, 1u);
}

/// Pool with one worker held busy until Release()
class BlockedPool {
public:
    explicit BlockedPool(size_t maxQueue) {
        ThreadPool::Config config;
        config.numThreads = 1;
        config.maxQueueSize = maxQueue;
        config.name = "blocked";
        pool = std::make_unique<ThreadPool>(config);

        auto started = std::make_shared<std::promise<void>>();
        std::future<void> startedFuture = started->get_future();
        std::shared_future<void> gate = gate_.get_future().share();
        blocker_ = pool->Submit([gate, started]() {
            started->set_value();
            gate.wait();
        });
        startedFuture.wait();
    }

    void Release() {
        gate_.set_value();
        blocker_.get();
    }

    std::unique_ptr<ThreadPool> pool;

private:
    std::promise<void> gate_;
    std::future<void> blocker_;
};

TEST(ThreadPoolShutdownTest, DropPendingBreaksFutures) {
    BlockedPool blocked(4);
    auto queued = blocked.pool->Submit([]() { return 1; });

    std::thread releaser([&blocked]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        blocked.Release();
    });
    blocked.pool->Shutdown(false);
    releaser.join();

    try {
        queued.get();
        FAIL() << "expected broken promise";
    } catch (const std::future_error& e) {
        EXPECT_EQ(e.code(), std::make_error_code(std::future_errc::broken_promise));
    }
    EXPECT_EQ(blocked.pool->GetStats().dropped, 1u);
}

TEST(ThreadPoolShutdownTest, DrainRunsPending) {
    BlockedPool blocked(4);
    auto queued = blocked.pool->Submit([]() { return 42; });

    std::thread releaser([&blocked]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        blocked.Release();
    });
    blocked.pool->Shutdown(true);
    releaser.join();

    EXPECT_EQ(queued.get(), 42);
    EXPECT_EQ(blocked.pool->GetStats().dropped, 0u);
    EXPECT_FALSE(blocked.pool->IsRunning());
}

TEST(ThreadPoolQueueTest, QueueFullThrows) {
    ThreadPool::Config config;
    config.numThreads = 1;
    config.maxQueueSize = 1;
    ThreadPool pool(config);

    std::promise<void> gate;
    auto gateFuture = gate.get_future().share();
    auto started = std::make_shared<std::promise<void>>();
    auto startedFuture = started->get_future();

    auto blocker = pool.Submit([gateFuture, started]() {
        started->set_value();
        gateFuture.wait();
    });
    startedFuture.wait();

    auto queued = pool.Submit([]() {});
    EXPECT_THROW(pool.Submit([]() {}), std::runtime_error);

    gate.set_value();
    blocker.get();
    queued.get();
}

} // namespace
} // namespace util
} // namespace veriscore
