// VERISCORE - Thread Pool Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/util/threadpool.h"
#include "veriscore/util/logging.h"

#include <algorithm>

namespace veriscore {
namespace util {

ThreadPool::ThreadPool() : ThreadPool(Config{}) {}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    size_t count = config_.numThreads;
    if (count == 0) {
        count = std::max<size_t>(std::thread::hardware_concurrency(), 2);
    }
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
    LOG_DEBUG(LogCategory::SERVICE) << "Thread pool '" << config_.name << "' started with "
                                    << count << " workers";
}

ThreadPool::~ThreadPool() {
    Shutdown(false);
}

void ThreadPool::Enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            ++stats_.rejected;
            throw std::runtime_error("thread pool '" + config_.name + "' is stopped");
        }
        if (queue_.size() >= config_.maxQueueSize) {
            ++stats_.rejected;
            throw std::runtime_error("thread pool '" + config_.name + "' queue is full (" +
                                     std::to_string(config_.maxQueueSize) + " tasks)");
        }
        queue_.push_back(std::move(job));
        ++stats_.submitted;
    }
    wake_.notify_one();
}

void ThreadPool::WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty() || (stopping_ && !draining_)) {
            return;
        }

        std::function<void()> job = std::move(queue_.front());
        queue_.pop_front();
        ++active_;

        lock.unlock();
        // Jobs wrap packaged_tasks, which capture their own exceptions
        job();
        lock.lock();

        --active_;
        ++stats_.completed;
        if (queue_.empty() && active_ == 0) {
            idle_.notify_all();
        }
    }
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

void ThreadPool::Shutdown(bool drain) {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        draining_ = drain;
        if (!drain) {
            dropped = queue_.size();
            stats_.dropped += dropped;
            queue_.clear();
        }
    }
    wake_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    idle_.notify_all();

    if (dropped > 0) {
        LOG_WARN(LogCategory::SERVICE) << "Thread pool '" << config_.name << "' dropped "
                                       << dropped << " queued tasks on shutdown";
    }
}

bool ThreadPool::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t ThreadPool::ActiveTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

ThreadPool::Stats ThreadPool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace util
} // namespace veriscore
