#pragma once

#include "types/LimitsTable.hpp"

#include <nlohmann/json_fwd.hpp>

namespace fl::limits {

// Fallbacks used when the app configuration lacks a key or carries garbage.
constexpr types::LimitsTable DEFAULT_STANDARD_LIMITS{3, 2, 10, 100};
constexpr types::LimitsTable DEFAULT_PREMIUM_LIMITS{100, 20, 20, 200};

types::LimitsTable resolveTable(const nlohmann::json& appConfig, bool premium);

// Standard and premium tables plus the caller's tier. Pure; never throws.
types::TierLimits resolveLimits(const nlohmann::json& appConfig, bool isPremiumCaller);

}
