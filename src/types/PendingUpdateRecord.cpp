#include "types/PendingUpdateRecord.hpp"

#include <nlohmann/json.hpp>

using namespace fl::types;

void fl::types::to_json(nlohmann::json& j, const PendingUpdateRecord& r) {
    // JSON object keys must be strings, so counts go out as [id, count] pairs
    auto counts = nlohmann::json::array();
    for (const auto& [id, count] : r.member_counts) counts.push_back({id, count});

    j = {
        {"folder_id", r.folder_id},
        {"timestamp", r.timestamp},
        {"missing_entity_ids", r.missing_entity_ids},
        {"member_counts", counts}
    };
}

void fl::types::from_json(const nlohmann::json& j, PendingUpdateRecord& r) {
    r.folder_id = j.at("folder_id").get<FolderId>();
    r.timestamp = j.value("timestamp", 0);
    r.missing_entity_ids = j.value("missing_entity_ids", std::vector<EntityId>{});
    r.member_counts.clear();
    if (j.contains("member_counts"))
        for (const auto& pair : j.at("member_counts"))
            r.member_counts[pair.at(0).get<EntityId>()] = pair.at(1).get<int32_t>();
}
