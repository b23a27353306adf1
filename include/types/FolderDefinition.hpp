#pragma once

#include "types/ids.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fl::types {

struct FolderDefinition {
    FolderId id{};
    std::string title{};
    std::optional<std::string> emoticon{};
    bool is_shared{false};
    std::vector<EntityId> included_entity_ids{};   // insertion ordered, no duplicates

    FolderDefinition() = default;
    FolderDefinition(FolderId id, std::string title, bool isShared, std::vector<EntityId> included = {});

    [[nodiscard]] bool includes(EntityId id) const;

    // Appends id unless already present; returns whether it was added.
    bool include(EntityId id);

    bool operator==(const FolderDefinition&) const = default;
};

void to_json(nlohmann::json& j, const FolderDefinition& f);
void from_json(const nlohmann::json& j, FolderDefinition& f);

}
