#include "folder/UpdatesEngine.hpp"
#include "folder/helpers.hpp"
#include "folder/UpdateSink.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/ConfigRegistry.hpp"
#include "net/FolderInviteApi.hpp"
#include "store/FilterStore.hpp"
#include "log/Registry.hpp"

using namespace fl::folder;
using namespace fl::types;

UpdatesEngine::Options UpdatesEngine::Options::fromConfig(const config::PollingConfig& cfg) {
    Options options;
    options.refresh_interval = cfg.effectiveRefreshInterval();
    options.failure_policy = cfg.absorb_errors ? FailurePolicy::AbsorbAndCacheEmpty : FailurePolicy::Propagate;
    return options;
}

UpdatesEngine::UpdatesEngine(std::shared_ptr<Account> account, Options options,
                             std::shared_ptr<DebounceCache> debounce)
    : account_(std::move(account)), options_(std::move(options)), debounce_(std::move(debounce)) {
    if (!debounce_) debounce_ = std::make_shared<DebounceCache>();
}

UpdatesEngine::UpdatesEngine(std::shared_ptr<Account> account)
    : UpdatesEngine(std::move(account), Options::fromConfig(config::ConfigRegistry::get().polling)) {}

std::time_t UpdatesEngine::now() const {
    if (options_.clock) return options_.clock();
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}


// ##########################################
// ################ Polling #################
// ##########################################

std::future<void> UpdatesEngine::poll(const FolderId folderId) {
    return account_->pool->async([self = shared_from_this(), folderId] { self->doPoll(folderId); });
}

void UpdatesEngine::doPoll(const FolderId folderId) const {
    const auto logger = log::Registry::updates();
    const auto& store = account_->store;

    if (!debounce_->markObserved({account_->id, folderId})) {
        const auto timestamp = now();
        const bool fresh = store->read("UpdatesEngine::poll::debounce", [&](store::Transaction& txn) {
            const auto record = txn.pendingUpdate(folderId);
            return record && record->timestamp + options_.refresh_interval.count() >= timestamp;
        });
        if (fresh) {
            logger->trace("[UpdatesEngine] Folder {} polled recently, skipping", folderId);
            return;
        }
    }

    std::optional<net::FolderUpdatesPayload> payload;
    try {
        payload = account_->api->getUpdates(folderId).get();
    } catch (const std::exception& e) {
        if (options_.failure_policy == FailurePolicy::Propagate) {
            logger->debug("[UpdatesEngine] Poll of folder {} failed: {}", folderId, e.what());
            throw error::FolderError("Polling folder updates failed");
        }
        logger->debug("[UpdatesEngine] Poll of folder {} failed, caching empty result: {}", folderId, e.what());
    }

    const auto timestamp = static_cast<int32_t>(now());
    store->exec("UpdatesEngine::poll::record", [&](store::Transaction& txn) {
        PendingUpdateRecord record;
        record.folder_id = folderId;
        record.timestamp = timestamp;
        if (payload) {
            record.member_counts = mergePeerBundle(txn, payload->bundle);
            record.missing_entity_ids = payload->missing_peers;
        }
        txn.replacePendingUpdate(std::move(record));
    });

    logger->debug("[UpdatesEngine] Folder {} polled, {} missing chats", folderId,
                  payload ? payload->missing_peers.size() : 0);
}


// ##########################################
// ############## Subscription ##############
// ##########################################

std::unique_ptr<UpdatesFeed> UpdatesEngine::subscribe(const FolderId folderId, UpdatesFeed::Callback cb) const {
    return std::make_unique<UpdatesFeed>(account_->store, folderId, std::move(cb));
}

std::future<void> UpdatesEngine::acceptAvailable(const FolderUpdates& updates, std::vector<EntityId> entityIds) {
    return account_->pool->async([self = shared_from_this(), folderId = updates.folder_id,
                                  entityIds = std::move(entityIds)] {
        self->doAccept(folderId, entityIds);
    });
}

void UpdatesEngine::doAccept(const FolderId folderId, const std::vector<EntityId>& entityIds) const {
    const auto peers = account_->store->read("UpdatesEngine::acceptAvailable::resolve", [&](store::Transaction& txn) {
        return resolveInputPeers(txn, entityIds);
    });

    const auto result = awaitRemote(*account_, account_->api->joinUpdates(folderId, peers),
                                    QuotaScope::JoinUpdates, "UpdatesEngine::acceptAvailable",
                                    log::Registry::updates());

    account_->updates->apply(result);
    log::Registry::updates()->info("[UpdatesEngine] Joined {} chats of folder {}", peers.size(), folderId);
}


// ##########################################
// ######### Dismiss / Leave Folder #########
// ##########################################

std::future<void> UpdatesEngine::dismiss(const FolderId folderId) {
    account_->store->exec("UpdatesEngine::dismiss", [folderId](store::Transaction& txn) {
        txn.removePendingUpdate(folderId);
    });

    try {
        return account_->pool->async([self = shared_from_this(), folderId] { self->doHide(folderId); });
    } catch (const std::exception& e) {
        log::Registry::updates()->warn("[UpdatesEngine] Not notifying server about dismissed folder {}: {}",
                                       folderId, e.what());
    }

    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

void UpdatesEngine::doHide(const FolderId folderId) const {
    try {
        account_->api->hideUpdates(folderId).get();
    } catch (const std::exception& e) {
        log::Registry::updates()->debug("[UpdatesEngine] Hiding updates of folder {} failed remotely: {}",
                                        folderId, e.what());
    }
}

std::future<void> UpdatesEngine::leave(const FolderId folderId, std::vector<EntityId> removeEntityIds) {
    return account_->pool->async([self = shared_from_this(), folderId, ids = std::move(removeEntityIds)] {
        self->doLeave(folderId, ids);
    });
}

void UpdatesEngine::doLeave(const FolderId folderId, const std::vector<EntityId>& removeEntityIds) const {
    const auto peers = account_->store->read("UpdatesEngine::leave::resolve", [&](store::Transaction& txn) {
        return resolveInputPeers(txn, removeEntityIds);
    });

    net::Updates result;
    try {
        result = account_->api->leave(folderId, peers).get();
    } catch (const std::exception& e) {
        log::Registry::updates()->warn("[UpdatesEngine] Leaving folder {} failed: {}", folderId, e.what());
        return;
    }

    account_->updates->apply(result);
    log::Registry::updates()->info("[UpdatesEngine] Left folder {} ({} chats removed)", folderId, peers.size());
}

std::future<std::vector<EntityId>> UpdatesEngine::leaveSuggestions(const FolderId folderId) {
    return account_->pool->async([self = shared_from_this(), folderId] { return self->doLeaveSuggestions(folderId); });
}

std::vector<EntityId> UpdatesEngine::doLeaveSuggestions(const FolderId folderId) const {
    try {
        return account_->api->getLeaveSuggestions(folderId).get();
    } catch (const std::exception& e) {
        log::Registry::updates()->debug("[UpdatesEngine] Leave suggestions for folder {} failed: {}",
                                        folderId, e.what());
        return {};
    }
}
