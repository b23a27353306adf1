#include "types/Peer.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace fl::types;

void fl::types::to_json(nlohmann::json& j, const Peer& p) {
    j = {
        {"id", p.id},
        {"kind", to_string(p.kind)},
        {"title", p.title},
        {"access_hash", p.access_hash},
        {"is_creator", p.is_creator},
        {"can_invite_users", p.can_invite_users},
        {"banned_add_members", p.banned_add_members},
        {"is_premium", p.is_premium}
    };
    if (p.username) j["username"] = *p.username;
    else j["username"] = nullptr;
}

void fl::types::from_json(const nlohmann::json& j, Peer& p) {
    p.id = j.at("id").get<EntityId>();
    p.kind = peerKindFromString(j.at("kind").get<std::string>());
    p.title = j.value("title", "");
    p.access_hash = j.value("access_hash", static_cast<int64_t>(0));
    p.is_creator = j.value("is_creator", false);
    p.can_invite_users = j.value("can_invite_users", false);
    p.banned_add_members = j.value("banned_add_members", false);
    p.is_premium = j.value("is_premium", false);
    if (j.contains("username") && !j["username"].is_null()) p.username = j["username"].get<std::string>();
    else p.username.reset();
}

void fl::types::to_json(nlohmann::json& j, const Presence& p) {
    j = {
        {"id", p.id},
        {"last_seen", p.last_seen},
        {"online", p.online}
    };
}

void fl::types::from_json(const nlohmann::json& j, Presence& p) {
    p.id = j.at("id").get<EntityId>();
    p.last_seen = j.value("last_seen", static_cast<std::time_t>(0));
    p.online = j.value("online", false);
}

std::string fl::types::to_string(const Peer::Kind& kind) {
    switch (kind) {
    case Peer::Kind::User: return "user";
    case Peer::Kind::BasicGroup: return "basic_group";
    case Peer::Kind::Channel: return "channel";
    default: throw std::invalid_argument("Unknown peer kind");
    }
}

Peer::Kind fl::types::peerKindFromString(const std::string& str) {
    if (str == "user") return Peer::Kind::User;
    if (str == "basic_group") return Peer::Kind::BasicGroup;
    if (str == "channel") return Peer::Kind::Channel;
    throw std::invalid_argument("Unknown peer kind: " + str);
}
