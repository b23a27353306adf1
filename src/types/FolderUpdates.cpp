#include "types/FolderUpdates.hpp"

#include <nlohmann/json.hpp>

using namespace fl::types;

std::vector<EntityId> FolderUpdates::missingIds() const {
    std::vector<EntityId> ids;
    ids.reserve(missing_peers.size());
    for (const auto& peer : missing_peers) ids.push_back(peer.id);
    return ids;
}

LinkPreview FolderUpdates::toPreview() const {
    LinkPreview preview;
    preview.local_filter_id = folder_id;
    preview.title = title;
    preview.peers = missing_peers;
    preview.member_counts = member_counts;
    return preview;
}

bool fl::types::operator==(const FolderUpdates& lhs, const FolderUpdates& rhs) {
    return lhs.folder_id == rhs.folder_id && lhs.missingIds() == rhs.missingIds();
}

void fl::types::to_json(nlohmann::json& j, const FolderUpdates& u) {
    auto counts = nlohmann::json::array();
    for (const auto& [id, count] : u.member_counts) counts.push_back({id, count});

    j = {
        {"folder_id", u.folder_id},
        {"title", u.title},
        {"missing_peers", u.missing_peers},
        {"member_counts", counts}
    };
}
