#pragma once

#include "types/ids.hpp"

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace fl::types {

struct JoinFolderResult {
    FolderId folder_id{};
    std::string title{};
    int32_t new_chat_count{};      // counted against the cache before the join was sent

    bool operator==(const JoinFolderResult&) const = default;
};

void to_json(nlohmann::json& j, const JoinFolderResult& r);

}
