#include "folder/Client.hpp"
#include "folder/JoinEngine.hpp"
#include "folder/LinkManager.hpp"
#include "folder/PollingService.hpp"
#include "folder/UpdateSink.hpp"
#include "folder/UpdatesEngine.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/ConfigRegistry.hpp"
#include "net/FolderInviteApi.hpp"
#include "store/FilterStore.hpp"
#include "log/Registry.hpp"

using namespace fl::folder;

Client::Client(const types::AccountId accountId, std::shared_ptr<net::FolderInviteApi> api,
               std::function<bool()> isPremium, const config::Config& cfg)
    : account_(std::make_shared<Account>()), snapshotPath_(cfg.store.snapshot_path) {
    account_->id = accountId;
    account_->store = std::make_shared<store::FilterStore>();
    account_->api = std::move(api);
    account_->updates = std::make_shared<StoreUpdateSink>(account_->store);
    account_->pool = std::make_shared<concurrency::ThreadPool>(cfg.workers.threads);
    account_->isPremium = std::move(isPremium);

    if (!snapshotPath_.empty() && std::filesystem::exists(snapshotPath_)) account_->store->load(snapshotPath_);

    links_ = std::make_shared<LinkManager>(account_);
    joins_ = std::make_shared<JoinEngine>(account_, cfg.join.confirm_timeout);
    updates_ = std::make_shared<UpdatesEngine>(account_, UpdatesEngine::Options::fromConfig(cfg.polling));
    polling_ = std::make_shared<PollingService>(updates_, cfg.polling.background_interval);

    log::Registry::folderlink()->info("[Client] Account {} ready ({} workers)", accountId, cfg.workers.threads);
}

Client::Client(const types::AccountId accountId, std::shared_ptr<net::FolderInviteApi> api,
               std::function<bool()> isPremium)
    : Client(accountId, std::move(api), std::move(isPremium), config::ConfigRegistry::get()) {}

Client::~Client() {
    polling_->stop();
    joins_->shutdown();
    account_->pool->stop();

    try {
        persist();
    } catch (const std::exception& e) {
        log::Registry::folderlink()->error("[Client] Failed to persist store of account {}: {}", account_->id, e.what());
    }
}

void Client::startPolling() { polling_->start(); }

void Client::stopPolling() { polling_->stop(); }

void Client::persist() const {
    if (snapshotPath_.empty()) return;
    account_->store->save(snapshotPath_);
}
