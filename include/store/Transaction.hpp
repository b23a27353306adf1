#pragma once

#include "store/FilterState.hpp"
#include "types/Peer.hpp"

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace fl::store {

struct StoreData {
    FilterState filters{};
    std::unordered_map<types::EntityId, types::Peer> peers{};
    std::unordered_map<types::EntityId, types::Presence> presences{};
    std::unordered_set<types::EntityId> chat_list{};           // peers with a chat list entry
    nlohmann::json app_config = nlohmann::json::object();
};

// Handle passed to FilterStore::exec / FilterStore::read callbacks. Only valid inside the callback.
class Transaction {
public:
    Transaction(StoreData& data, bool readOnly) : data_(data), readOnly_(readOnly) {}

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] bool isReadOnly() const { return readOnly_; }

    // Filters
    [[nodiscard]] const FilterState& filterState() const { return data_.filters; }
    [[nodiscard]] std::optional<types::FolderDefinition> filter(types::FolderId id) const;
    [[nodiscard]] const std::vector<types::FolderDefinition>& filters() const { return data_.filters.filters; }
    void upsertFilter(const types::FolderDefinition& filter);
    bool removeFilter(types::FolderId id);
    void setRemoteFilters(std::vector<types::FolderDefinition> filters);

    // Pending updates, at most one record per folder
    [[nodiscard]] std::optional<types::PendingUpdateRecord> pendingUpdate(types::FolderId id) const;
    void replacePendingUpdate(types::PendingUpdateRecord record);
    bool removePendingUpdate(types::FolderId id);

    // Peer cache
    [[nodiscard]] std::optional<types::Peer> peer(types::EntityId id) const;
    [[nodiscard]] std::optional<types::Presence> presence(types::EntityId id) const;
    void upsertPeers(const std::vector<types::Peer>& peers);
    void upsertPresences(const std::vector<types::Presence>& presences);
    [[nodiscard]] bool hasChatListPresence(types::EntityId id) const;
    void setChatListPresence(types::EntityId id, bool present);

    // App configuration snapshot
    [[nodiscard]] const nlohmann::json& appConfiguration() const { return data_.app_config; }
    void setAppConfiguration(nlohmann::json config);

    [[nodiscard]] bool touchedFilterState() const { return touchedFilters_; }

private:
    friend class FilterStore;

    void beginWrite(bool touchesFilters);
    void rollback();
    void release() { backup_.reset(); }
    [[nodiscard]] const FilterState* filterStateBefore() const { return backup_ ? &backup_->filters : nullptr; }

    StoreData& data_;
    bool readOnly_;
    std::optional<StoreData> backup_;
    bool touchedFilters_{false};
};

}
