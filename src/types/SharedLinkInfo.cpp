#include "types/SharedLinkInfo.hpp"

#include <nlohmann/json.hpp>

using namespace fl::types;

std::string SharedLinkInfo::slug() const { return slugFromLink(link); }

std::string fl::types::slugFromLink(const std::string_view link) {
    if (link.starts_with(FOLDER_LINK_PREFIX)) return std::string(link.substr(FOLDER_LINK_PREFIX.size()));
    return std::string(link);
}

std::string fl::types::linkFromSlug(const std::string_view slug) {
    std::string link(FOLDER_LINK_PREFIX);
    link += slug;
    return link;
}

void fl::types::to_json(nlohmann::json& j, const SharedLinkInfo& l) {
    j = {
        {"title", l.title},
        {"link", l.link},
        {"member_entity_ids", l.member_entity_ids},
        {"revoked", l.revoked}
    };
}

void fl::types::from_json(const nlohmann::json& j, SharedLinkInfo& l) {
    l.title = j.value("title", "");
    l.link = j.at("link").get<std::string>();
    l.member_entity_ids = j.value("member_entity_ids", std::vector<EntityId>{});
    l.revoked = j.value("revoked", false);
}
