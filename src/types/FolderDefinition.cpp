#include "types/FolderDefinition.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace fl::types;

FolderDefinition::FolderDefinition(const FolderId id, std::string title, const bool isShared,
                                   std::vector<EntityId> included)
    : id(id), title(std::move(title)), is_shared(isShared) {
    for (const auto entityId : included) include(entityId);
}

bool FolderDefinition::includes(const EntityId id) const {
    return std::ranges::find(included_entity_ids, id) != included_entity_ids.end();
}

bool FolderDefinition::include(const EntityId id) {
    if (includes(id)) return false;
    included_entity_ids.push_back(id);
    return true;
}

void fl::types::to_json(nlohmann::json& j, const FolderDefinition& f) {
    j = {
        {"id", f.id},
        {"title", f.title},
        {"is_shared", f.is_shared},
        {"included_entity_ids", f.included_entity_ids}
    };
    if (f.emoticon) j["emoticon"] = *f.emoticon;
    else j["emoticon"] = nullptr;
}

void fl::types::from_json(const nlohmann::json& j, FolderDefinition& f) {
    f.id = j.at("id").get<FolderId>();
    f.title = j.value("title", "");
    f.is_shared = j.value("is_shared", false);
    f.included_entity_ids.clear();
    if (j.contains("included_entity_ids"))
        for (const auto& id : j.at("included_entity_ids")) f.include(id.get<EntityId>());
    if (j.contains("emoticon") && !j["emoticon"].is_null()) f.emoticon = j["emoticon"].get<std::string>();
    else f.emoticon.reset();
}
