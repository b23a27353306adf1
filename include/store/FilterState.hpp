#pragma once

#include "types/FolderDefinition.hpp"
#include "types/PendingUpdateRecord.hpp"

#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fl::store {

// Folder-related part of the store; published to watchers as an immutable snapshot.
struct FilterState {
    std::vector<types::FolderDefinition> filters{};
    std::vector<types::FolderDefinition> remote_filters{};   // last list acknowledged by the server
    std::vector<types::PendingUpdateRecord> updates{};

    [[nodiscard]] const types::FolderDefinition* filter(types::FolderId id) const;
    [[nodiscard]] const types::PendingUpdateRecord* pendingUpdate(types::FolderId id) const;
    [[nodiscard]] bool hasFilter(types::FolderId id) const { return filter(id) != nullptr; }

    bool operator==(const FilterState&) const = default;
};

void to_json(nlohmann::json& j, const FilterState& s);
void from_json(const nlohmann::json& j, FilterState& s);

}
