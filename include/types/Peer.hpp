#pragma once

#include "types/ids.hpp"

#include <ctime>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json_fwd.hpp>

namespace fl::types {

struct Peer {
    enum class Kind : uint8_t { User, BasicGroup, Channel };

    EntityId id{};
    Kind kind{Kind::User};
    std::string title{};
    std::optional<std::string> username{};
    int64_t access_hash{};

    // Caller's standing in the chat
    bool is_creator{false};
    bool can_invite_users{false};       // admin right, channels only
    bool banned_add_members{false};     // default banned right, basic groups only

    bool is_premium{false};             // users only

    Peer() = default;
    Peer(EntityId id, Kind kind, std::string title) : id(id), kind(kind), title(std::move(title)) {}

    bool operator==(const Peer&) const = default;
};

struct Presence {
    EntityId id{};
    std::time_t last_seen{};
    bool online{false};

    bool operator==(const Presence&) const = default;
};

void to_json(nlohmann::json& j, const Peer& p);
void from_json(const nlohmann::json& j, Peer& p);
void to_json(nlohmann::json& j, const Presence& p);
void from_json(const nlohmann::json& j, Presence& p);

std::string to_string(const Peer::Kind& kind);
Peer::Kind peerKindFromString(const std::string& str);

}
