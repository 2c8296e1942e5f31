// VERISCORE - Thread Pool
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Fixed-size worker pool for independent prove/verify calls. Results and
// exceptions travel through futures. The queue is bounded: a proving backlog
// is rejected at submission instead of growing without limit.

#ifndef VERISCORE_UTIL_THREADPOOL_H
#define VERISCORE_UTIL_THREADPOOL_H

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace veriscore {
namespace util {

class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};       // 0 = hardware concurrency
        size_t maxQueueSize{1024};  // tasks waiting for a worker
        std::string name{"pool"};
    };

    struct Stats {
        size_t submitted{0};
        size_t completed{0};
        size_t rejected{0};
        size_t dropped{0};
    };

    ThreadPool();
    explicit ThreadPool(const Config& config);

    /// Same as Shutdown(false)
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Block until nothing is queued or running
    void Wait();

    /**
     * Stop accepting tasks and join the workers. With drain set, queued
     * tasks run first; otherwise they are dropped and their futures report
     * std::future_errc::broken_promise. Running tasks always finish.
     */
    void Shutdown(bool drain = false);

    bool IsRunning() const;
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    size_t ActiveTasks() const;
    Stats GetStats() const;
    const std::string& Name() const { return config_.name; }

    /**
     * Queue f(args...) for execution.
     *
     * @throws std::runtime_error if the pool is stopped or the queue is full
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>> {
        using Result = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

        auto task = std::make_shared<std::packaged_task<Result()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<Result> future = task->get_future();
        Enqueue([task]() { (*task)(); });
        return future;
    }

private:
    void Enqueue(std::function<void()> job);
    void WorkerLoop();

    Config config_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::deque<std::function<void()>> queue_;
    size_t active_{0};
    bool stopping_{false};
    bool draining_{false};
    Stats stats_;
};

} // namespace util
} // namespace veriscore

#endif // VERISCORE_UTIL_THREADPOOL_H
