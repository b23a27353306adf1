#pragma once

#include "types/FolderDefinition.hpp"
#include "types/Peer.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fl::net {

// Remote-addressable reference to a cached peer.
struct InputPeer {
    types::EntityId id{};
    types::Peer::Kind kind{types::Peer::Kind::User};
    int64_t access_hash{};

    bool operator==(const InputPeer&) const = default;
};

struct RemoteChat {
    types::Peer peer{};
    std::optional<int32_t> participants_count{};
};

struct RemoteUser {
    types::Peer peer{};
    types::Presence presence{};
};

// Peer objects accompanying a response.
struct PeerBundle {
    std::vector<RemoteChat> chats{};
    std::vector<RemoteUser> users{};
};

struct ExportedInvite {
    std::string title{};
    std::string url{};
    std::vector<types::EntityId> peers{};
    bool revoked{false};
};

struct ExportedInviteResult {
    types::FolderDefinition filter{};
    ExportedInvite invite{};
};

struct ExportedInvites {
    std::vector<ExportedInvite> invites{};
    PeerBundle bundle{};
};

// Partial update of an exported invite; only engaged fields are sent.
struct InviteEdit {
    std::optional<std::string> title{};
    std::optional<std::vector<InputPeer>> peers{};
    std::optional<bool> revoke{};
};

// checkInvite: the folder is not adopted locally yet.
struct FreshInvite {
    std::string title{};
    std::optional<std::string> emoticon{};
    std::vector<types::EntityId> peers{};
    PeerBundle bundle{};
};

// checkInvite: the folder maps onto an existing local filter.
struct AdoptedInvite {
    types::FolderId filter_id{};
    std::vector<types::EntityId> missing_peers{};
    std::vector<types::EntityId> already_peers{};
    PeerBundle bundle{};
};

using CheckedInvite = std::variant<FreshInvite, AdoptedInvite>;

struct FolderUpdatesPayload {
    std::vector<types::EntityId> missing_peers{};
    PeerBundle bundle{};
};

// A filter was created, changed or (without definition) deleted.
struct FilterUpdate {
    types::FolderId id{};
    std::optional<types::FolderDefinition> filter{};
};

// A chat appeared in or vanished from the chat list.
struct ChatListUpdate {
    types::EntityId id{};
    bool present{true};
};

using Update = std::variant<FilterUpdate, ChatListUpdate>;

struct Updates {
    std::vector<Update> updates{};
    PeerBundle bundle{};
};

}
