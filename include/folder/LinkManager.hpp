#pragma once

#include "folder/Account.hpp"
#include "types/SharedLinkInfo.hpp"

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fl::folder {

// Export, edit and revoke invite links of folders the account owns.
class LinkManager : public std::enable_shared_from_this<LinkManager> {
public:
    explicit LinkManager(std::shared_ptr<Account> account);

    // Fails with QuotaExceededError on INVITES_TOO_MUCH / COMMUNITIES_TOO_MUCH, FolderError otherwise.
    std::future<types::SharedLinkInfo> exportLink(types::FolderId folderId, std::string title,
                                                  std::vector<types::EntityId> entityIds);

    // Empty optional when the remote call fails.
    std::future<std::optional<std::vector<types::SharedLinkInfo>>> listLinks(types::FolderId folderId);

    // Only engaged fields are sent; revoke is sent only when true.
    std::future<types::SharedLinkInfo> editLink(types::FolderId folderId, types::SharedLinkInfo link,
                                                std::optional<std::string> title,
                                                std::optional<std::vector<types::EntityId>> entityIds,
                                                bool revoke);

    std::future<void> revokeLink(types::FolderId folderId, types::SharedLinkInfo link);

private:
    std::shared_ptr<Account> account_;

    types::SharedLinkInfo doExport(types::FolderId folderId, const std::string& title,
                                   const std::vector<types::EntityId>& entityIds) const;

    std::optional<std::vector<types::SharedLinkInfo>> doList(types::FolderId folderId) const;

    types::SharedLinkInfo doEdit(types::FolderId folderId, const types::SharedLinkInfo& link,
                                 const std::optional<std::string>& title,
                                 const std::optional<std::vector<types::EntityId>>& entityIds, bool revoke) const;

    void doRevoke(types::FolderId folderId, const types::SharedLinkInfo& link) const;
};

}
