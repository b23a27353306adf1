#pragma once

#include "net/Payloads.hpp"

#include <future>
#include <string>
#include <vector>

namespace fl::net {

// Remote folder-invite service. Every call is asynchronous; failures arrive as RpcError
// through the returned future.
class FolderInviteApi {
public:
    virtual ~FolderInviteApi() = default;

    virtual std::future<ExportedInviteResult> exportInvite(types::FolderId folderId, const std::string& title,
                                                           const std::vector<InputPeer>& peers) = 0;

    virtual std::future<ExportedInvites> getExportedInvites(types::FolderId folderId) = 0;

    virtual std::future<ExportedInvite> editExportedInvite(types::FolderId folderId, const std::string& slug,
                                                           const InviteEdit& edit) = 0;

    virtual std::future<void> deleteExportedInvite(types::FolderId folderId, const std::string& slug) = 0;

    virtual std::future<CheckedInvite> checkInvite(const std::string& slug) = 0;

    virtual std::future<Updates> joinInvite(const std::string& slug, const std::vector<InputPeer>& peers) = 0;

    virtual std::future<FolderUpdatesPayload> getUpdates(types::FolderId folderId) = 0;

    virtual std::future<Updates> joinUpdates(types::FolderId folderId, const std::vector<InputPeer>& peers) = 0;

    virtual std::future<bool> hideUpdates(types::FolderId folderId) = 0;

    virtual std::future<Updates> leave(types::FolderId folderId, const std::vector<InputPeer>& peers) = 0;

    virtual std::future<std::vector<types::EntityId>> getLeaveSuggestions(types::FolderId folderId) = 0;
};

}
