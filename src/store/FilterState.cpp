#include "store/FilterState.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace fl::store;
using namespace fl::types;

const FolderDefinition* FilterState::filter(const FolderId id) const {
    const auto it = std::ranges::find_if(filters, [id](const auto& f) { return f.id == id; });
    return it == filters.end() ? nullptr : &*it;
}

const PendingUpdateRecord* FilterState::pendingUpdate(const FolderId id) const {
    const auto it = std::ranges::find_if(updates, [id](const auto& u) { return u.folder_id == id; });
    return it == updates.end() ? nullptr : &*it;
}

void fl::store::to_json(nlohmann::json& j, const FilterState& s) {
    j = {
        {"filters", s.filters},
        {"remote_filters", s.remote_filters},
        {"updates", s.updates}
    };
}

void fl::store::from_json(const nlohmann::json& j, FilterState& s) {
    s.filters = j.value("filters", std::vector<FolderDefinition>{});
    s.remote_filters = j.value("remote_filters", std::vector<FolderDefinition>{});
    s.updates = j.value("updates", std::vector<PendingUpdateRecord>{});
}
