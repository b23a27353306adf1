#pragma once

#include "folder/Account.hpp"
#include "concurrency/CancellationToken.hpp"
#include "types/JoinFolderResult.hpp"
#include "types/LinkPreview.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace fl::folder {

// Resolves folder invite links into previews and joins them.
class JoinEngine : public std::enable_shared_from_this<JoinEngine> {
public:
    // confirmTimeout bounds how long join() waits for the joined folder to show up locally.
    JoinEngine(std::shared_ptr<Account> account, std::chrono::milliseconds confirmTimeout);

    // Timeout taken from ConfigRegistry (join.confirm_timeout).
    explicit JoinEngine(std::shared_ptr<Account> account);

    std::future<types::LinkPreview> check(std::string slug);

    // Completes once the joined folder is visible in the local filter list.
    std::future<types::JoinFolderResult> join(std::string slug, std::vector<types::EntityId> entityIds,
                                              concurrency::CancellationToken token = {});

    // Cancels every pending and future join; waiting joins fail with CancelledError.
    void shutdown();

    static bool canShareLinkToPeer(const types::Peer& peer);

private:
    std::shared_ptr<Account> account_;
    std::chrono::milliseconds confirmTimeout_;
    concurrency::CancellationToken shutdown_;

    types::LinkPreview doCheck(const std::string& slug) const;

    types::JoinFolderResult doJoin(const std::string& slug, const std::vector<types::EntityId>& entityIds,
                                   const concurrency::CancellationToken& token) const;
};

}
