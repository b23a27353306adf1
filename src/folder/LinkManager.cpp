#include "folder/LinkManager.hpp"
#include "folder/helpers.hpp"
#include "concurrency/ThreadPool.hpp"
#include "net/FolderInviteApi.hpp"
#include "store/FilterStore.hpp"
#include "log/Registry.hpp"

using namespace fl::folder;
using namespace fl::types;

namespace {

SharedLinkInfo toLinkInfo(const fl::net::ExportedInvite& invite) {
    return {
        .title = invite.title,
        .link = invite.url,
        .member_entity_ids = invite.peers,
        .revoked = invite.revoked
    };
}

}

LinkManager::LinkManager(std::shared_ptr<Account> account) : account_(std::move(account)) {}


// ##########################################
// ############### Public API ###############
// ##########################################

std::future<SharedLinkInfo> LinkManager::exportLink(const FolderId folderId, std::string title,
                                                    std::vector<EntityId> entityIds) {
    return account_->pool->async([self = shared_from_this(), folderId, title = std::move(title),
                                  entityIds = std::move(entityIds)] {
        return self->doExport(folderId, title, entityIds);
    });
}

std::future<std::optional<std::vector<SharedLinkInfo>>> LinkManager::listLinks(const FolderId folderId) {
    return account_->pool->async([self = shared_from_this(), folderId] { return self->doList(folderId); });
}

std::future<SharedLinkInfo> LinkManager::editLink(const FolderId folderId, SharedLinkInfo link,
                                                  std::optional<std::string> title,
                                                  std::optional<std::vector<EntityId>> entityIds,
                                                  const bool revoke) {
    return account_->pool->async([self = shared_from_this(), folderId, link = std::move(link),
                                  title = std::move(title), entityIds = std::move(entityIds), revoke] {
        return self->doEdit(folderId, link, title, entityIds, revoke);
    });
}

std::future<void> LinkManager::revokeLink(const FolderId folderId, SharedLinkInfo link) {
    return account_->pool->async([self = shared_from_this(), folderId, link = std::move(link)] {
        self->doRevoke(folderId, link);
    });
}


// ##########################################
// ############ Implementation ##############
// ##########################################

SharedLinkInfo LinkManager::doExport(const FolderId folderId, const std::string& title,
                                     const std::vector<EntityId>& entityIds) const {
    const auto& store = account_->store;
    const auto logger = log::Registry::links();

    const auto peers = store->read("LinkManager::exportLink::resolve", [&](store::Transaction& txn) {
        return resolveInputPeers(txn, entityIds);
    });

    auto result = awaitRemote(*account_, account_->api->exportInvite(folderId, title, peers),
                              QuotaScope::Export, "LinkManager::exportLink", logger);

    store->exec("LinkManager::exportLink::merge", [&](store::Transaction& txn) {
        txn.upsertFilter(result.filter);
        txn.setRemoteFilters(txn.filters());
    });

    logger->info("[LinkManager] Exported link for folder {} ({} chats)", result.filter.id, result.invite.peers.size());
    return toLinkInfo(result.invite);
}

std::optional<std::vector<SharedLinkInfo>> LinkManager::doList(const FolderId folderId) const {
    const auto logger = log::Registry::links();

    net::ExportedInvites result;
    try {
        result = account_->api->getExportedInvites(folderId).get();
    } catch (const std::exception& e) {
        logger->debug("[LinkManager] Listing links of folder {} failed: {}", folderId, e.what());
        return std::nullopt;
    }

    account_->store->exec("LinkManager::listLinks::merge", [&](store::Transaction& txn) {
        mergePeerBundle(txn, result.bundle);
    });

    std::vector<SharedLinkInfo> links;
    links.reserve(result.invites.size());
    for (const auto& invite : result.invites) links.push_back(toLinkInfo(invite));
    return links;
}

SharedLinkInfo LinkManager::doEdit(const FolderId folderId, const SharedLinkInfo& link,
                                   const std::optional<std::string>& title,
                                   const std::optional<std::vector<EntityId>>& entityIds,
                                   const bool revoke) const {
    net::InviteEdit edit;
    edit.title = title;
    if (entityIds) {
        edit.peers = account_->store->read("LinkManager::editLink::resolve", [&](store::Transaction& txn) {
            return resolveInputPeers(txn, *entityIds);
        });
    }
    if (revoke) edit.revoke = true;

    const auto invite = awaitRemote(*account_, account_->api->editExportedInvite(folderId, link.slug(), edit),
                                    QuotaScope::None, "LinkManager::editLink", log::Registry::links());

    log::Registry::links()->debug("[LinkManager] Edited link {} of folder {}", link.slug(), folderId);
    return toLinkInfo(invite);
}

void LinkManager::doRevoke(const FolderId folderId, const SharedLinkInfo& link) const {
    awaitRemote(*account_, account_->api->deleteExportedInvite(folderId, link.slug()),
                QuotaScope::None, "LinkManager::revokeLink", log::Registry::links());

    log::Registry::links()->info("[LinkManager] Revoked link {} of folder {}", link.slug(), folderId);
}
