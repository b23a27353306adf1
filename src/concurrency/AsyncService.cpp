#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace fl::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::folderlink()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::folderlink()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log::Registry::folderlink()->info("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    log::Registry::folderlink()->info("[{}] Service stopped.", serviceName_);
}

bool AsyncService::sleepFor(const std::chrono::milliseconds d) {
    std::unique_lock lock(sleepMutex_);
    return !sleepCv_.wait_for(lock, d, [this] { return interruptFlag_.load(std::memory_order_acquire); });
}
