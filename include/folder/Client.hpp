#pragma once

#include "folder/Account.hpp"

#include <filesystem>
#include <functional>
#include <memory>

namespace fl::config { struct Config; }
namespace fl::net { class FolderInviteApi; }

namespace fl::folder {

class LinkManager;
class JoinEngine;
class UpdatesEngine;
class PollingService;

// Wires the folder engines of one account: worker pool, store (restored from the configured
// snapshot if there is one), update sink and background polling.
class Client {
public:
    Client(types::AccountId accountId, std::shared_ptr<net::FolderInviteApi> api,
           std::function<bool()> isPremium, const config::Config& cfg);

    // Uses ConfigRegistry::get().
    Client(types::AccountId accountId, std::shared_ptr<net::FolderInviteApi> api, std::function<bool()> isPremium);

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    [[nodiscard]] const std::shared_ptr<Account>& account() const { return account_; }
    [[nodiscard]] const std::shared_ptr<LinkManager>& links() const { return links_; }
    [[nodiscard]] const std::shared_ptr<JoinEngine>& joins() const { return joins_; }
    [[nodiscard]] const std::shared_ptr<UpdatesEngine>& updates() const { return updates_; }
    [[nodiscard]] const std::shared_ptr<PollingService>& polling() const { return polling_; }

    void startPolling();
    void stopPolling();

    // Writes the store snapshot; no-op without a configured snapshot path.
    void persist() const;

private:
    std::shared_ptr<Account> account_;
    std::shared_ptr<LinkManager> links_;
    std::shared_ptr<JoinEngine> joins_;
    std::shared_ptr<UpdatesEngine> updates_;
    std::shared_ptr<PollingService> polling_;
    std::filesystem::path snapshotPath_;
};

}
