#include "types/LinkPreview.hpp"

#include <nlohmann/json.hpp>

void fl::types::to_json(nlohmann::json& j, const LinkPreview& p) {
    auto counts = nlohmann::json::array();
    for (const auto& [id, count] : p.member_counts) counts.push_back({id, count});

    j = {
        {"peers", p.peers},
        {"already_member_peer_ids", p.already_member_peer_ids},
        {"member_counts", counts}
    };
    j["local_filter_id"] = p.local_filter_id ? nlohmann::json(*p.local_filter_id) : nlohmann::json(nullptr);
    j["title"] = p.title ? nlohmann::json(*p.title) : nlohmann::json(nullptr);
}
