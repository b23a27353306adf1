#include "limits/LimitsResolver.hpp"

#include <limits>
#include <string>
#include <nlohmann/json.hpp>

namespace fl::limits {

namespace {

int32_t readLimit(const nlohmann::json& appConfig, const std::string& stem, const bool premium, const int32_t def) {
    if (!appConfig.is_object()) return def;

    const auto key = stem + (premium ? "_premium" : "_default");
    const auto it = appConfig.find(key);
    if (it == appConfig.end() || !it->is_number()) return def;

    const auto value = it->get<double>();
    if (value < 0 || value > std::numeric_limits<int32_t>::max()) return def;
    return static_cast<int32_t>(value);
}

}

types::LimitsTable resolveTable(const nlohmann::json& appConfig, const bool premium) {
    const auto& def = premium ? DEFAULT_PREMIUM_LIMITS : DEFAULT_STANDARD_LIMITS;

    types::LimitsTable table;
    table.max_shared_folder_links = readLimit(appConfig, "chatlist_invites_limit", premium, def.max_shared_folder_links);
    table.max_shared_folder_joins = readLimit(appConfig, "chatlists_joined_limit", premium, def.max_shared_folder_joins);
    table.max_folders = readLimit(appConfig, "dialog_filters_limit", premium, def.max_folders);
    table.max_folder_chats = readLimit(appConfig, "dialog_filters_chats_limit", premium, def.max_folder_chats);
    return table;
}

types::TierLimits resolveLimits(const nlohmann::json& appConfig, const bool isPremiumCaller) {
    return {
        .standard = resolveTable(appConfig, false),
        .premium = resolveTable(appConfig, true),
        .caller_is_premium = isPremiumCaller
    };
}

}
