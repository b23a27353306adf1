#include "store/Transaction.hpp"

#include <algorithm>
#include <stdexcept>

using namespace fl::store;
using namespace fl::types;

void Transaction::beginWrite(const bool touchesFilters) {
    if (readOnly_) throw std::logic_error("Attempt to modify the store inside a read-only transaction");
    if (!backup_) backup_.emplace(data_);
    if (touchesFilters) touchedFilters_ = true;
}

void Transaction::rollback() {
    if (!backup_) return;
    data_ = std::move(*backup_);
    backup_.reset();
    touchedFilters_ = false;
}

std::optional<FolderDefinition> Transaction::filter(const FolderId id) const {
    if (const auto* f = data_.filters.filter(id)) return *f;
    return std::nullopt;
}

void Transaction::upsertFilter(const FolderDefinition& filter) {
    beginWrite(true);
    auto& filters = data_.filters.filters;
    const auto it = std::ranges::find_if(filters, [&](const auto& f) { return f.id == filter.id; });
    if (it != filters.end()) *it = filter;
    else filters.push_back(filter);
}

bool Transaction::removeFilter(const FolderId id) {
    beginWrite(true);
    return std::erase_if(data_.filters.filters, [id](const auto& f) { return f.id == id; }) > 0;
}

void Transaction::setRemoteFilters(std::vector<FolderDefinition> filters) {
    beginWrite(true);
    data_.filters.remote_filters = std::move(filters);
}

std::optional<PendingUpdateRecord> Transaction::pendingUpdate(const FolderId id) const {
    if (const auto* r = data_.filters.pendingUpdate(id)) return *r;
    return std::nullopt;
}

void Transaction::replacePendingUpdate(PendingUpdateRecord record) {
    beginWrite(true);
    auto& updates = data_.filters.updates;
    std::erase_if(updates, [&](const auto& u) { return u.folder_id == record.folder_id; });
    updates.push_back(std::move(record));
}

bool Transaction::removePendingUpdate(const FolderId id) {
    beginWrite(true);
    return std::erase_if(data_.filters.updates, [id](const auto& u) { return u.folder_id == id; }) > 0;
}

std::optional<Peer> Transaction::peer(const EntityId id) const {
    if (const auto it = data_.peers.find(id); it != data_.peers.end()) return it->second;
    return std::nullopt;
}

std::optional<Presence> Transaction::presence(const EntityId id) const {
    if (const auto it = data_.presences.find(id); it != data_.presences.end()) return it->second;
    return std::nullopt;
}

void Transaction::upsertPeers(const std::vector<Peer>& peers) {
    if (peers.empty()) return;
    beginWrite(false);
    for (const auto& p : peers) data_.peers.insert_or_assign(p.id, p);
}

void Transaction::upsertPresences(const std::vector<Presence>& presences) {
    if (presences.empty()) return;
    beginWrite(false);
    for (const auto& p : presences) data_.presences.insert_or_assign(p.id, p);
}

bool Transaction::hasChatListPresence(const EntityId id) const {
    return data_.chat_list.contains(id);
}

void Transaction::setChatListPresence(const EntityId id, const bool present) {
    beginWrite(false);
    if (present) data_.chat_list.insert(id);
    else data_.chat_list.erase(id);
}

void Transaction::setAppConfiguration(nlohmann::json config) {
    beginWrite(false);
    data_.app_config = std::move(config);
}
