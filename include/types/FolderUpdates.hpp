#pragma once

#include "types/LinkPreview.hpp"

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fl::types {

struct FolderUpdates {
    FolderId folder_id{};
    std::string title{};
    std::vector<Peer> missing_peers{};
    std::map<EntityId, int32_t> member_counts{};

    [[nodiscard]] size_t availableChatsToJoin() const { return missing_peers.size(); }

    [[nodiscard]] std::vector<EntityId> missingIds() const;

    [[nodiscard]] LinkPreview toPreview() const;
};

// Title and member counts do not take part in equality.
bool operator==(const FolderUpdates& lhs, const FolderUpdates& rhs);

void to_json(nlohmann::json& j, const FolderUpdates& u);

}
