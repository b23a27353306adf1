#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <memory>

namespace fl::folder {

class UpdatesEngine;

// Periodically polls every shared folder of one account. The engine's debounce keeps this to
// at most one remote call per folder and refresh interval.
class PollingService final : public concurrency::AsyncService {
public:
    PollingService(std::shared_ptr<UpdatesEngine> engine, std::chrono::milliseconds interval);

    // Interval from ConfigRegistry (polling.background_interval).
    explicit PollingService(std::shared_ptr<UpdatesEngine> engine);

    ~PollingService() override;

    // One pass over the shared folders; returns how many were handed to the engine.
    size_t pollOnce();

protected:
    void runLoop() override;

private:
    std::shared_ptr<UpdatesEngine> engine_;
    std::chrono::milliseconds interval_;
};

}
