#include "folder/helpers.hpp"
#include "limits/LimitsResolver.hpp"
#include "store/FilterStore.hpp"

#include <nlohmann/json.hpp>

using namespace fl::folder;
using namespace fl::types;
using Kind = fl::error::QuotaExceededError::Kind;

std::optional<fl::net::InputPeer> fl::folder::toInputPeer(const Peer& peer) {
    if (peer.kind != Peer::Kind::BasicGroup && peer.access_hash == 0) return std::nullopt;
    return net::InputPeer{peer.id, peer.kind, peer.access_hash};
}

std::vector<fl::net::InputPeer> fl::folder::resolveInputPeers(const store::Transaction& txn,
                                                              const std::vector<EntityId>& ids) {
    std::vector<net::InputPeer> peers;
    peers.reserve(ids.size());
    for (const auto id : ids) {
        const auto peer = txn.peer(id);
        if (!peer) continue;
        if (auto input = toInputPeer(*peer)) peers.push_back(*input);
    }
    return peers;
}

std::map<EntityId, int32_t> fl::folder::mergePeerBundle(store::Transaction& txn, const net::PeerBundle& bundle) {
    std::map<EntityId, int32_t> memberCounts;
    if (bundle.chats.empty() && bundle.users.empty()) return memberCounts;

    std::vector<Peer> peers;
    std::vector<Presence> presences;
    peers.reserve(bundle.chats.size() + bundle.users.size());
    presences.reserve(bundle.users.size());

    for (const auto& user : bundle.users) {
        peers.push_back(user.peer);
        presences.push_back(user.presence);
    }

    for (const auto& chat : bundle.chats) {
        peers.push_back(chat.peer);
        if (chat.peer.kind == Peer::Kind::Channel && chat.participants_count)
            memberCounts[chat.peer.id] = *chat.participants_count;
    }

    txn.upsertPeers(peers);
    txn.upsertPresences(presences);
    return memberCounts;
}

std::optional<Kind> fl::folder::quotaKindFor(const std::string_view code, const QuotaScope scope) {
    switch (scope) {
        case QuotaScope::None:
            return std::nullopt;
        case QuotaScope::Export:
            if (code == "INVITES_TOO_MUCH") return Kind::SharedFolderInviteLinkCount;
            if (code == "COMMUNITIES_TOO_MUCH") return Kind::SharedFolderJoinCount;
            return std::nullopt;
        case QuotaScope::Join:
        case QuotaScope::JoinUpdates:
            if (code == "USER_CHANNELS_TOO_MUCH") return Kind::ChannelCount;
            if (code == "DIALOG_FILTERS_TOO_MUCH") return Kind::DialogFilterCount;
            if (code == "COMMUNITIES_TOO_MUCH") return Kind::SharedFolderJoinCount;
            if (scope == QuotaScope::JoinUpdates && code == "FILTERS_TOO_MUCH") return Kind::SharedFolderJoinCount;
            return std::nullopt;
    }
    return std::nullopt;
}

fl::error::QuotaExceededError fl::folder::makeQuotaError(const Kind kind, const TierLimits& limits) {
    const auto pick = [kind](const LimitsTable& t) {
        switch (kind) {
            case Kind::DialogFilterCount: return t.max_folders;
            case Kind::SharedFolderJoinCount: return t.max_shared_folder_joins;
            case Kind::SharedFolderInviteLinkCount: return t.max_shared_folder_links;
            case Kind::ChannelCount: return t.max_folder_chats;
        }
        return int32_t{0};
    };
    return {kind, pick(limits.current()), pick(limits.premium)};
}

TierLimits fl::folder::currentLimits(const Account& account) {
    const auto appConfig = account.store->read("limits::appConfiguration", [](store::Transaction& txn) {
        return txn.appConfiguration();
    });
    return limits::resolveLimits(appConfig, account.premium());
}

void fl::folder::throwTranslated(const Account& account, const net::RpcError& e, const QuotaScope scope,
                                 const std::string_view ctx, const std::shared_ptr<spdlog::logger>& logger) {
    if (const auto kind = quotaKindFor(e.description(), scope)) {
        auto quota = makeQuotaError(*kind, currentLimits(account));
        logger->info("[{}] Quota exceeded: {}", ctx, quota.what());
        throw quota;
    }

    log::Registry::net()->debug("[{}] Remote call failed with {}: {}", ctx, e.code(), e.description());
    throw error::FolderError();
}
