#include "folder/UpdatesFeed.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <iterator>

using namespace fl::folder;
using namespace fl::types;

UpdatesFeed::UpdatesFeed(std::shared_ptr<store::FilterStore> store, const FolderId folderId, Callback cb)
    : store_(std::move(store)), folderId_(folderId), cb_(std::move(cb)) {
    watch_ = store_->watch([this](const store::FilterStore::Snapshot& snapshot, const uint64_t version) {
        onSnapshot(snapshot, version);
    });
}

UpdatesFeed::~UpdatesFeed() { cancel(); }

void UpdatesFeed::cancel() { watch_.cancel(); }

std::optional<FolderUpdates> UpdatesFeed::latest() const {
    std::scoped_lock lock(mutex_);
    return last_;
}

std::optional<FolderUpdates> UpdatesFeed::derive(store::FilterStore& store, const store::FilterState& state,
                                                 const FolderId folderId) {
    const auto* record = state.pendingUpdate(folderId);
    if (!record) return std::nullopt;

    const auto* folder = state.filter(folderId);
    if (!folder || !folder->is_shared) return std::nullopt;

    std::vector<EntityId> missing;
    std::ranges::copy_if(record->missing_entity_ids, std::back_inserter(missing),
                         [folder](const EntityId id) { return !folder->includes(id); });
    if (missing.empty()) return std::nullopt;

    FolderUpdates updates;
    updates.folder_id = folderId;
    updates.title = folder->title;
    updates.member_counts = record->member_counts;
    updates.missing_peers = store.read("UpdatesFeed::derive", [&](store::Transaction& txn) {
        std::vector<Peer> peers;
        peers.reserve(missing.size());
        for (const auto id : missing)
            if (auto peer = txn.peer(id)) peers.push_back(std::move(*peer));
        return peers;
    });
    return updates;
}

void UpdatesFeed::onSnapshot(const store::FilterStore::Snapshot& snapshot, const uint64_t version) {
    std::optional<FolderUpdates> next;
    {
        std::scoped_lock lock(mutex_);
        // Concurrent commits may be delivered out of order; keep the newest only.
        if (emitted_ && version <= lastVersion_) return;
        lastVersion_ = version;

        next = derive(*store_, *snapshot, folderId_);
        if (emitted_ && next == last_) return;

        emitted_ = true;
        last_ = next;
    }

    log::Registry::updates()->trace("[UpdatesFeed] Folder {}: {} chats available at version {}",
                                    folderId_, next ? next->availableChatsToJoin() : 0, version);
    cb_(next);
}
