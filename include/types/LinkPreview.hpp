#pragma once

#include "types/Peer.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fl::types {

// What a folder invite link would add, as shown before joining.
struct LinkPreview {
    std::optional<FolderId> local_filter_id{};     // set when the folder is already adopted locally
    std::optional<std::string> title{};
    std::vector<Peer> peers{};
    std::set<EntityId> already_member_peer_ids{};
    std::map<EntityId, int32_t> member_counts{};
};

void to_json(nlohmann::json& j, const LinkPreview& p);

}
