#include "folder/PollingService.hpp"
#include "folder/UpdatesEngine.hpp"
#include "config/ConfigRegistry.hpp"
#include "store/FilterStore.hpp"
#include "log/Registry.hpp"

#include <future>
#include <vector>

using namespace fl::folder;
using namespace fl::types;

PollingService::PollingService(std::shared_ptr<UpdatesEngine> engine, const std::chrono::milliseconds interval)
    : AsyncService("PollingService"), engine_(std::move(engine)), interval_(interval) {}

PollingService::PollingService(std::shared_ptr<UpdatesEngine> engine)
    : PollingService(std::move(engine), config::ConfigRegistry::get().polling.background_interval) {}

PollingService::~PollingService() { stop(); }

size_t PollingService::pollOnce() {
    const auto folders = engine_->account()->store->read("PollingService::sharedFolders", [](store::Transaction& txn) {
        std::vector<FolderId> ids;
        for (const auto& f : txn.filters())
            if (f.is_shared) ids.push_back(f.id);
        return ids;
    });

    std::vector<std::future<void>> pending;
    pending.reserve(folders.size());
    for (const auto id : folders) pending.push_back(engine_->poll(id));

    for (size_t i = 0; i < pending.size(); ++i) {
        try {
            pending[i].get();
        } catch (const std::exception& e) {
            log::Registry::updates()->warn("[PollingService] Poll of folder {} failed: {}", folders[i], e.what());
        }
    }

    return folders.size();
}

void PollingService::runLoop() {
    while (!interruptFlag_.load()) {
        try {
            const auto polled = pollOnce();
            log::Registry::updates()->trace("[PollingService] Polled {} shared folders", polled);
        } catch (const std::exception& e) {
            log::Registry::updates()->error("[PollingService] Polling pass failed: {}", e.what());
        }

        if (!sleepFor(interval_)) break;
    }
}
