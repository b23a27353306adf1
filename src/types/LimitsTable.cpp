#include "types/LimitsTable.hpp"

#include <nlohmann/json.hpp>

void fl::types::to_json(nlohmann::json& j, const LimitsTable& t) {
    j = {
        {"max_shared_folder_links", t.max_shared_folder_links},
        {"max_shared_folder_joins", t.max_shared_folder_joins},
        {"max_folders", t.max_folders},
        {"max_folder_chats", t.max_folder_chats}
    };
}
