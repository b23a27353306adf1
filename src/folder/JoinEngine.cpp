#include "folder/JoinEngine.hpp"
#include "folder/helpers.hpp"
#include "folder/UpdateSink.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/ConfigRegistry.hpp"
#include "net/FolderInviteApi.hpp"
#include "store/FilterStore.hpp"
#include "types/SharedLinkInfo.hpp"
#include "log/Registry.hpp"

#include <set>
#include <variant>

using namespace fl::folder;
using namespace fl::types;

namespace {

struct PreparedJoin {
    std::vector<fl::net::InputPeer> peers;
    int32_t newChatCount{0};
};

// Forwards engine shutdown to one join's token for as long as the join runs.
struct ShutdownLink {
    ShutdownLink(const fl::concurrency::CancellationToken& shutdown, const fl::concurrency::CancellationToken& token)
        : shutdown(shutdown), id(shutdown.onCancel([token] { token.cancel(); })) {}
    ~ShutdownLink() { shutdown.unsubscribe(id); }

    ShutdownLink(const ShutdownLink&) = delete;
    ShutdownLink& operator=(const ShutdownLink&) = delete;

    const fl::concurrency::CancellationToken& shutdown;
    uint64_t id;
};

}

JoinEngine::JoinEngine(std::shared_ptr<Account> account, const std::chrono::milliseconds confirmTimeout)
    : account_(std::move(account)), confirmTimeout_(confirmTimeout) {}

JoinEngine::JoinEngine(std::shared_ptr<Account> account)
    : JoinEngine(std::move(account), config::ConfigRegistry::get().join.confirm_timeout) {}

std::future<LinkPreview> JoinEngine::check(std::string slug) {
    return account_->pool->async([self = shared_from_this(), slug = std::move(slug)] {
        return self->doCheck(slug);
    });
}

std::future<JoinFolderResult> JoinEngine::join(std::string slug, std::vector<EntityId> entityIds,
                                               concurrency::CancellationToken token) {
    return account_->pool->async([self = shared_from_this(), slug = std::move(slug),
                                  entityIds = std::move(entityIds), token = std::move(token)] {
        return self->doJoin(slug, entityIds, token);
    });
}

void JoinEngine::shutdown() {
    log::Registry::join()->debug("[JoinEngine] Cancelling pending joins of account {}", account_->id);
    shutdown_.cancel();
}

bool JoinEngine::canShareLinkToPeer(const Peer& peer) {
    switch (peer.kind) {
    case Peer::Kind::Channel:
        return peer.is_creator || peer.can_invite_users || (peer.username && !peer.username->empty());
    case Peer::Kind::BasicGroup:
        return !peer.banned_add_members;
    default:
        return false;
    }
}

LinkPreview JoinEngine::doCheck(const std::string& slug) const {
    const auto checked = awaitRemote(*account_, account_->api->checkInvite(slugFromLink(slug)),
                                     QuotaScope::None, "JoinEngine::check", log::Registry::join());

    return account_->store->exec("JoinEngine::check", [&](store::Transaction& txn) {
        LinkPreview preview;

        if (const auto* fresh = std::get_if<net::FreshInvite>(&checked)) {
            preview.member_counts = mergePeerBundle(txn, fresh->bundle);
            preview.title = fresh->title;

            for (const auto id : fresh->peers) {
                const auto peer = txn.peer(id);
                if (!peer) continue;
                preview.peers.push_back(*peer);
                if (txn.hasChatListPresence(id)) preview.already_member_peer_ids.insert(id);
            }

            // Cleared on purpose: a folder that is not adopted yet reports no joined chats,
            // even those already in the chat list. Callers rely on the empty set.
            preview.already_member_peer_ids.clear();
            return preview;
        }

        const auto& adopted = std::get<net::AdoptedInvite>(checked);
        preview.member_counts = mergePeerBundle(txn, adopted.bundle);
        preview.local_filter_id = adopted.filter_id;

        const auto local = txn.filter(adopted.filter_id);
        if (local) preview.title = local->title;

        std::set<EntityId> listed;
        for (const auto id : adopted.missing_peers) {
            const auto peer = txn.peer(id);
            if (!peer) continue;
            preview.peers.push_back(*peer);
            listed.insert(id);
            if (local && local->includes(id) && txn.hasChatListPresence(id))
                preview.already_member_peer_ids.insert(id);
        }

        if (!local) return preview;

        for (const auto id : local->included_entity_ids) {
            if (listed.contains(id)) continue;
            const auto peer = txn.peer(id);
            if (!peer || !canShareLinkToPeer(*peer)) continue;
            preview.peers.push_back(*peer);
            listed.insert(id);
            if (txn.hasChatListPresence(id)) preview.already_member_peer_ids.insert(id);
        }

        return preview;
    });
}

JoinFolderResult JoinEngine::doJoin(const std::string& slug, const std::vector<EntityId>& entityIds,
                                    const concurrency::CancellationToken& token) const {
    const auto logger = log::Registry::join();
    const ShutdownLink link(shutdown_, token);

    const auto prepared = account_->store->read("JoinEngine::join::prepare", [&](store::Transaction& txn) {
        PreparedJoin p;
        p.peers = resolveInputPeers(txn, entityIds);
        for (const auto id : entityIds)
            if (txn.hasChatListPresence(id)) ++p.newChatCount;
        return p;
    });

    if (token.isCancelled()) throw error::CancelledError("Join cancelled before it was sent");

    const auto updates = awaitRemote(*account_, account_->api->joinInvite(slugFromLink(slug), prepared.peers),
                                     QuotaScope::Join, "JoinEngine::join", logger);

    account_->updates->apply(updates);

    std::optional<JoinFolderResult> result;
    for (const auto& update : updates.updates) {
        const auto* filterUpdate = std::get_if<net::FilterUpdate>(&update);
        if (!filterUpdate) continue;
        if (filterUpdate->filter)
            result = JoinFolderResult{filterUpdate->id, filterUpdate->filter->title, prepared.newChatCount};
        break;
    }

    if (!result) {
        logger->warn("[JoinEngine] Join of {} succeeded remotely but carried no folder", slug);
        throw error::FolderError("Joined folder missing from server response");
    }

    const auto folderId = result->folder_id;
    const bool visible = account_->store->waitUntil(
        [folderId](const store::FilterState& state) { return state.hasFilter(folderId); },
        confirmTimeout_, token);

    if (!visible) {
        logger->warn("[JoinEngine] Folder {} not visible locally after {} ms", folderId, confirmTimeout_.count());
        throw error::FolderError("Timed out waiting for the joined folder");
    }

    logger->info("[JoinEngine] Joined folder {} '{}' ({} chats already present)",
                 folderId, result->title, result->new_chat_count);
    return *result;
}
