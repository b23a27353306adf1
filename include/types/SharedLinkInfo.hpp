#pragma once

#include "types/ids.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fl::types {

constexpr std::string_view FOLDER_LINK_PREFIX = "https://t.me/folder/";

struct SharedLinkInfo {
    std::string title{};
    std::string link{};                             // full URL as returned by the server
    std::vector<EntityId> member_entity_ids{};
    bool revoked{false};

    // Path component of the link, used to address it remotely.
    [[nodiscard]] std::string slug() const;

    bool operator==(const SharedLinkInfo&) const = default;
};

std::string slugFromLink(std::string_view link);
std::string linkFromSlug(std::string_view slug);

void to_json(nlohmann::json& j, const SharedLinkInfo& l);
void from_json(const nlohmann::json& j, SharedLinkInfo& l);

}
