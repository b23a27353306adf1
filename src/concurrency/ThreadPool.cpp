#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace fl::concurrency;

ThreadPool::ThreadPool(unsigned int nThreads) {
    if (nThreads == 0) nThreads = std::max(2u, std::thread::hardware_concurrency());
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop(std::chrono::milliseconds gracefulTimeout) {
    if (stopFlag.exchange(true)) return;

    // Let already queued work drain for up to gracefulTimeout, then drop the rest.
    {
        std::unique_lock lock(mutex);
        const auto deadline = std::chrono::steady_clock::now() + gracefulTimeout;
        while (!queue.empty() && std::chrono::steady_clock::now() < deadline) {
            lock.unlock();
            cv.notify_all();
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            lock.lock();
        }
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
    }

    cv.notify_all();

    for (auto& t : threads_) {
        if (!t.joinable()) continue;
        if (t.get_id() == std::this_thread::get_id()) t.detach();
        else t.join();
    }

    threads_.clear();
    idleFlags_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    if (stopFlag.load()) throw std::runtime_error("ThreadPool is stopped, cannot accept new tasks");
    {
        std::scoped_lock lock(mutex);
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

bool ThreadPool::hasIdleWorker() const {
    return std::ranges::any_of(idleFlags_, [](auto& flag) { return flag->load(); });
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    auto flag = std::make_shared<std::atomic<bool>>(true); // idle at start
    idleFlags_.push_back(flag);

    threads_.emplace_back([this, flag] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (task) {
                flag->store(false);
                try {
                    (*task)();
                } catch (const std::exception& e) {
                    log::Registry::folderlink()->error("[ThreadPool] Task threw: {}", e.what());
                }
                flag->store(true);
            }
        }
    });
}
