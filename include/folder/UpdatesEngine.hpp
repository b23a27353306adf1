#pragma once

#include "folder/Account.hpp"
#include "folder/DebounceCache.hpp"
#include "folder/UpdatesFeed.hpp"
#include "types/FolderUpdates.hpp"

#include <chrono>
#include <ctime>
#include <functional>
#include <future>
#include <memory>
#include <vector>

namespace fl::config { struct PollingConfig; }

namespace fl::folder {

// What a failed poll does.
enum class FailurePolicy : uint8_t {
    AbsorbAndCacheEmpty,    // cache an empty result, report nothing
    Propagate               // cache nothing, fail the poll with FolderError
};

// Polls shared folders for chats their owner added, and lets the user import or dismiss them.
class UpdatesEngine : public std::enable_shared_from_this<UpdatesEngine> {
public:
    struct Options {
        std::chrono::seconds refresh_interval{60 * 60};
        FailurePolicy failure_policy{FailurePolicy::AbsorbAndCacheEmpty};
        std::function<std::time_t()> clock{};          // unix seconds; system clock when empty

        static Options fromConfig(const config::PollingConfig& cfg);
    };

    UpdatesEngine(std::shared_ptr<Account> account, Options options,
                  std::shared_ptr<DebounceCache> debounce = std::make_shared<DebounceCache>());

    // Options from ConfigRegistry (polling section).
    explicit UpdatesEngine(std::shared_ptr<Account> account);

    // The first poll of a folder always goes remote; later ones only once the cached record
    // is older than the refresh interval.
    std::future<void> poll(types::FolderId folderId);

    [[nodiscard]] std::unique_ptr<UpdatesFeed> subscribe(types::FolderId folderId, UpdatesFeed::Callback cb) const;

    std::future<void> acceptAvailable(const types::FolderUpdates& updates, std::vector<types::EntityId> entityIds);

    // The pending record is gone when this returns; the server is told afterwards, best effort.
    std::future<void> dismiss(types::FolderId folderId);

    std::future<void> leave(types::FolderId folderId, std::vector<types::EntityId> removeEntityIds);

    std::future<std::vector<types::EntityId>> leaveSuggestions(types::FolderId folderId);

    [[nodiscard]] const std::shared_ptr<DebounceCache>& debounce() const { return debounce_; }
    [[nodiscard]] const std::shared_ptr<Account>& account() const { return account_; }

private:
    std::shared_ptr<Account> account_;
    Options options_;
    std::shared_ptr<DebounceCache> debounce_;

    [[nodiscard]] std::time_t now() const;

    void doPoll(types::FolderId folderId) const;
    void doAccept(types::FolderId folderId, const std::vector<types::EntityId>& entityIds) const;
    void doHide(types::FolderId folderId) const;
    void doLeave(types::FolderId folderId, const std::vector<types::EntityId>& removeEntityIds) const;
    std::vector<types::EntityId> doLeaveSuggestions(types::FolderId folderId) const;
};

}
