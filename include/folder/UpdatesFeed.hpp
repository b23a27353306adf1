#pragma once

#include "store/FilterStore.hpp"
#include "types/FolderUpdates.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace fl::folder {

// Live view of the chats a shared folder gained remotely but which are not imported yet.
// Delivers the current value on construction, then every change under FolderUpdates equality.
// Destroying the feed detaches it from the store.
class UpdatesFeed {
public:
    using Callback = std::function<void(const std::optional<types::FolderUpdates>&)>;

    UpdatesFeed(std::shared_ptr<store::FilterStore> store, types::FolderId folderId, Callback cb);

    UpdatesFeed(const UpdatesFeed&) = delete;
    UpdatesFeed& operator=(const UpdatesFeed&) = delete;

    ~UpdatesFeed();

    void cancel();

    [[nodiscard]] bool isActive() const { return watch_.isActive(); }

    [[nodiscard]] types::FolderId folderId() const { return folderId_; }

    [[nodiscard]] std::optional<types::FolderUpdates> latest() const;

    static std::optional<types::FolderUpdates> derive(store::FilterStore& store, const store::FilterState& state,
                                                      types::FolderId folderId);

private:
    std::shared_ptr<store::FilterStore> store_;
    types::FolderId folderId_;
    Callback cb_;

    mutable std::mutex mutex_;
    bool emitted_{false};
    uint64_t lastVersion_{0};
    std::optional<types::FolderUpdates> last_;

    store::FilterStore::Watch watch_;

    void onSnapshot(const store::FilterStore::Snapshot& snapshot, uint64_t version);
};

}
