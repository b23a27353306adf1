#include "types/JoinFolderResult.hpp"

#include <nlohmann/json.hpp>

void fl::types::to_json(nlohmann::json& j, const JoinFolderResult& r) {
    j = {
        {"folder_id", r.folder_id},
        {"title", r.title},
        {"new_chat_count", r.new_chat_count}
    };
}
