#pragma once

#include "types/ids.hpp"

#include <map>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fl::types {

// Chats the owner added to a shared folder that are not imported locally yet.
struct PendingUpdateRecord {
    FolderId folder_id{};
    int32_t timestamp{};                            // unix seconds of the poll that produced it
    std::vector<EntityId> missing_entity_ids{};
    std::map<EntityId, int32_t> member_counts{};

    bool operator==(const PendingUpdateRecord&) const = default;
};

void to_json(nlohmann::json& j, const PendingUpdateRecord& r);
void from_json(const nlohmann::json& j, PendingUpdateRecord& r);

}
