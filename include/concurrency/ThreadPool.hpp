#pragma once

#include "concurrency/Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include <chrono>

namespace fl::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void stop(std::chrono::milliseconds gracefulTimeout = std::chrono::milliseconds(1200));

    void submit(std::shared_ptr<Task> task);

    // Wraps fn into a PromisedTask and queues it.
    template <typename Fn>
    auto async(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using R = std::invoke_result_t<Fn>;
        auto task = std::make_shared<PromisedTask<R>>(std::function<R()>(std::forward<Fn>(fn)));
        auto future = task->getFuture();
        submit(task);
        return future;
    }

    size_t queueDepth() const;

    bool hasIdleWorker() const;

    [[nodiscard]] bool isStopped() const { return stopFlag.load(); }

    [[nodiscard]] unsigned int workerCount() const;

private:
    void spawnWorker();

    std::vector<std::thread> threads_;
    std::vector<std::shared_ptr<std::atomic<bool>>> idleFlags_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace fl::concurrency
