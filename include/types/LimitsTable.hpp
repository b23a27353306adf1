#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace fl::types {

struct LimitsTable {
    int32_t max_shared_folder_links{};
    int32_t max_shared_folder_joins{};
    int32_t max_folders{};
    int32_t max_folder_chats{};

    bool operator==(const LimitsTable&) const = default;
};

struct TierLimits {
    LimitsTable standard{};
    LimitsTable premium{};
    bool caller_is_premium{false};

    // Table of the tier the caller currently belongs to.
    [[nodiscard]] const LimitsTable& current() const { return caller_is_premium ? premium : standard; }
};

void to_json(nlohmann::json& j, const LimitsTable& t);

}
