#include <gtest/gtest.h>
#include "support/TestAccount.hpp"
#include "support/DeferredUpdateSink.hpp"
#include "folder/JoinEngine.hpp"
#include "error/FolderError.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include <sstream>

using namespace fl;
using namespace fl::types;
using namespace std::chrono_literals;
using fl::error::QuotaExceededError;

namespace {

net::Updates joinedFolderUpdates(const FolderId id, const std::string& title, const std::vector<EntityId>& chats) {
    net::Updates u;
    u.updates.emplace_back(net::FilterUpdate{id, FolderDefinition(id, title, true, chats)});
    for (const auto c : chats) u.updates.emplace_back(net::ChatListUpdate{c, true});
    return u;
}

}

class JoinEngineTest : public ::testing::Test {
protected:
    test::TestAccount t;
    std::shared_ptr<test::DeferredUpdateSink> deferred;

    void SetUp() override {
        t.store->exec("seed", [](store::Transaction& txn) {
            txn.upsertPeers({test::channel(10, "Ten"), test::channel(11, "Eleven"), test::channel(12, "Twelve")});
            txn.setChatListPresence(10, true);
            txn.setAppConfiguration({
                {"dialog_filters_limit_default", 10}, {"dialog_filters_limit_premium", 20},
                {"dialog_filters_chats_limit_default", 100}, {"dialog_filters_chats_limit_premium", 200},
                {"chatlists_joined_limit_default", 2}, {"chatlists_joined_limit_premium", 20}
            });
        });
    }

    std::shared_ptr<folder::JoinEngine> engine(const std::chrono::milliseconds timeout = 2s) {
        return std::make_shared<folder::JoinEngine>(t.account, timeout);
    }

    void deferUpdates() {
        deferred = std::make_shared<test::DeferredUpdateSink>(t.account->updates);
        t.account->updates = deferred;
    }

    QuotaExceededError joinExpectingQuota(const std::string& code) {
        t.api->onJoin = [code](const std::string&, const test::FakeFolderInviteApi::Peers&) -> net::Updates {
            throw test::FakeFolderInviteApi::error(code);
        };
        try {
            engine()->join("abc", {10, 11}).get();
        } catch (const QuotaExceededError& e) {
            return e;
        }
        throw std::runtime_error("join did not fail with a quota error for " + code);
    }
};

TEST_F(JoinEngineTest, FreshPreviewNeverReportsAlreadyJoinedChats) {
    t.api->onCheck = [](const std::string& slug) -> net::CheckedInvite {
        EXPECT_EQ(slug, "abc");
        net::FreshInvite invite;
        invite.title = "Crypto";
        invite.peers = {10, 20, 21};
        invite.bundle.chats = {test::remoteChat(test::channel(20, "Twenty"), 1500), test::remoteChat(test::basicGroup(10, "Ten"))};
        invite.bundle.users = {{Peer(40, Peer::Kind::User, "Admin"), Presence{40, 1'700'000'000, true}}};
        return invite;
    };

    const auto preview = engine()->check("https://t.me/folder/abc").get();

    EXPECT_FALSE(preview.local_filter_id.has_value());
    EXPECT_EQ(preview.title, "Crypto");
    ASSERT_EQ(preview.peers.size(), 2u);   // 21 stays uncached
    EXPECT_EQ(preview.peers[0].id, 10);
    EXPECT_EQ(preview.peers[0].kind, Peer::Kind::BasicGroup);
    EXPECT_EQ(preview.peers[1].id, 20);
    EXPECT_TRUE(preview.already_member_peer_ids.empty());
    EXPECT_EQ(preview.member_counts, (std::map<EntityId, int32_t>{{20, 1500}}));

    EXPECT_TRUE(t.store->read("verify", [](store::Transaction& txn) { return txn.peer(20).has_value(); }));
    const auto presence = t.store->read("verify", [](store::Transaction& txn) { return txn.presence(40); });
    ASSERT_TRUE(presence.has_value());
    EXPECT_TRUE(presence->online);
}

TEST_F(JoinEngineTest, AdoptedPreviewListsMissingThenShareableIncludedChats) {
    t.store->exec("local folder", [](store::Transaction& txn) {
        auto creator = test::channel(21, "Mine");
        creator.is_creator = true;
        auto plain = test::channel(22, "Read only");
        auto group = test::basicGroup(23, "Group");
        txn.upsertPeers({creator, plain, group, test::channel(20, "Twenty")});
        txn.setChatListPresence(20, true);
        txn.setChatListPresence(21, true);
        txn.upsertFilter({5, "Local", true, {20, 21, 22, 23}});
    });

    t.api->onCheck = [](const std::string&) -> net::CheckedInvite {
        net::AdoptedInvite invite;
        invite.filter_id = 5;
        invite.missing_peers = {30, 20, 31};
        invite.bundle.chats = {test::remoteChat(test::channel(30, "Thirty"), 500)};
        return invite;
    };

    const auto preview = engine()->check("abc").get();

    EXPECT_EQ(preview.local_filter_id, 5);
    EXPECT_EQ(preview.title, "Local");
    std::vector<EntityId> ids;
    for (const auto& p : preview.peers) ids.push_back(p.id);
    EXPECT_EQ(ids, (std::vector<EntityId>{30, 20, 21, 23}));
    EXPECT_EQ(preview.already_member_peer_ids, (std::set<EntityId>{20, 21}));
    EXPECT_EQ(preview.member_counts.at(30), 500);
}

TEST_F(JoinEngineTest, AdoptedPreviewOfUnknownLocalFolderHasNoTitle) {
    t.api->onCheck = [](const std::string&) -> net::CheckedInvite {
        net::AdoptedInvite invite;
        invite.filter_id = 77;
        invite.missing_peers = {10};
        return invite;
    };

    const auto preview = engine()->check("abc").get();
    EXPECT_EQ(preview.local_filter_id, 77);
    EXPECT_FALSE(preview.title.has_value());
    EXPECT_TRUE(preview.already_member_peer_ids.empty());
    ASSERT_EQ(preview.peers.size(), 1u);
}

TEST_F(JoinEngineTest, CheckFailureIsGeneric) {
    t.api->onCheck = [](const std::string&) -> net::CheckedInvite {
        throw test::FakeFolderInviteApi::error("INVITE_SLUG_EXPIRED");
    };
    EXPECT_THROW(engine()->check("abc").get(), error::FolderError);
}

TEST_F(JoinEngineTest, RemoteFailureDetailIsLoggedOnNetLogger) {
    std::ostringstream out;
    const auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    sink->set_pattern("[%n] %v");
    const auto netLogger = log::Registry::net();
    const auto previousLevel = netLogger->level();
    netLogger->sinks().push_back(sink);
    netLogger->set_level(spdlog::level::debug);

    t.api->onCheck = [](const std::string&) -> net::CheckedInvite {
        throw test::FakeFolderInviteApi::error("INVITE_SLUG_EXPIRED");
    };
    EXPECT_THROW(engine()->check("abc").get(), error::FolderError);

    netLogger->set_level(previousLevel);
    netLogger->sinks().pop_back();

    EXPECT_NE(out.str().find("[net] [JoinEngine::check] Remote call failed with 400: INVITE_SLUG_EXPIRED"),
              std::string::npos) << out.str();
}

TEST_F(JoinEngineTest, CanShareLinkToPeer) {
    using folder::JoinEngine;

    auto ch = test::channel(1, "c");
    EXPECT_FALSE(JoinEngine::canShareLinkToPeer(ch));
    ch.is_creator = true;
    EXPECT_TRUE(JoinEngine::canShareLinkToPeer(ch));
    ch.is_creator = false;
    ch.can_invite_users = true;
    EXPECT_TRUE(JoinEngine::canShareLinkToPeer(ch));
    ch.can_invite_users = false;
    ch.username = "public_handle";
    EXPECT_TRUE(JoinEngine::canShareLinkToPeer(ch));

    auto group = test::basicGroup(2, "g");
    EXPECT_TRUE(JoinEngine::canShareLinkToPeer(group));
    group.banned_add_members = true;
    EXPECT_FALSE(JoinEngine::canShareLinkToPeer(group));

    Peer user(3, Peer::Kind::User, "u");
    user.is_creator = true;
    EXPECT_FALSE(JoinEngine::canShareLinkToPeer(user));
}

TEST_F(JoinEngineTest, JoinCompletesWithResultAndCountsCachedChats) {
    test::FakeFolderInviteApi::Peers sent;
    t.api->onJoin = [&](const std::string& slug, const test::FakeFolderInviteApi::Peers& peers) {
        EXPECT_EQ(slug, "abc");
        sent = peers;
        return joinedFolderUpdates(8, "Joined", {10, 11});
    };

    const auto result = engine()->join("https://t.me/folder/abc", {10, 11, 99}).get();

    EXPECT_EQ(result.folder_id, 8);
    EXPECT_EQ(result.title, "Joined");
    EXPECT_EQ(result.new_chat_count, 1);    // only 10 had a chat list entry before the join
    EXPECT_EQ(sent.size(), 2u);
    EXPECT_TRUE(t.store->current().first->hasFilter(8));
}

TEST_F(JoinEngineTest, JoinStaysPendingUntilFolderIsVisibleLocally) {
    deferUpdates();
    t.api->onJoin = [](const std::string&, const test::FakeFolderInviteApi::Peers&) {
        return joinedFolderUpdates(8, "Joined", {11});
    };

    auto future = engine(10s)->join("abc", {11});

    ASSERT_TRUE(deferred->waitForPending(1, 5s));
    EXPECT_EQ(future.wait_for(200ms), std::future_status::timeout);

    deferred->flush();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(future.get().folder_id, 8);
}

TEST_F(JoinEngineTest, JoinTimesOutWhenFolderNeverAppears) {
    deferUpdates();
    t.api->onJoin = [](const std::string&, const test::FakeFolderInviteApi::Peers&) {
        return joinedFolderUpdates(8, "Joined", {11});
    };
    EXPECT_THROW(engine(100ms)->join("abc", {11}).get(), error::FolderError);
}

TEST_F(JoinEngineTest, JoinWaitIsCancellable) {
    deferUpdates();
    t.api->onJoin = [](const std::string&, const test::FakeFolderInviteApi::Peers&) {
        return joinedFolderUpdates(8, "Joined", {11});
    };

    concurrency::CancellationToken token;
    auto future = engine(30s)->join("abc", {11}, token);
    ASSERT_TRUE(deferred->waitForPending(1, 5s));

    token.cancel();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_THROW(future.get(), error::CancelledError);
}

TEST_F(JoinEngineTest, ShutdownCancelsWaitingJoins) {
    deferUpdates();
    t.api->onJoin = [](const std::string&, const test::FakeFolderInviteApi::Peers&) {
        return joinedFolderUpdates(8, "Joined", {11});
    };

    const auto e = engine(30s);
    auto future = e->join("abc", {11});
    ASSERT_TRUE(deferred->waitForPending(1, 5s));

    e->shutdown();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_THROW(future.get(), error::CancelledError);

    EXPECT_THROW(e->join("abc", {11}).get(), error::CancelledError);
    EXPECT_EQ(t.api->calls("joinInvite"), 1);
}

TEST_F(JoinEngineTest, JoinWithoutFolderInResponseFails) {
    t.api->onJoin = [](const std::string&, const test::FakeFolderInviteApi::Peers&) {
        net::Updates u;
        u.updates.emplace_back(net::ChatListUpdate{11, true});
        u.updates.emplace_back(net::FilterUpdate{9, std::nullopt});
        u.updates.emplace_back(net::FilterUpdate{8, FolderDefinition(8, "Late", true, {11})});
        return u;
    };

    EXPECT_THROW(engine()->join("abc", {11}).get(), error::FolderError);
    // The batch is still applied
    EXPECT_TRUE(t.store->read("verify", [](store::Transaction& txn) { return txn.hasChatListPresence(11); }));
}

TEST_F(JoinEngineTest, JoinQuotaCodesMapToCurrentTier) {
    auto channels = joinExpectingQuota("USER_CHANNELS_TOO_MUCH");
    EXPECT_EQ(channels.kind(), QuotaExceededError::Kind::ChannelCount);
    EXPECT_EQ(channels.limit(), 100);
    EXPECT_EQ(channels.premiumLimit(), 200);

    auto folders = joinExpectingQuota("DIALOG_FILTERS_TOO_MUCH");
    EXPECT_EQ(folders.kind(), QuotaExceededError::Kind::DialogFilterCount);
    EXPECT_EQ(folders.limit(), 10);
    EXPECT_EQ(folders.premiumLimit(), 20);

    t.premium->store(true);
    auto joins = joinExpectingQuota("COMMUNITIES_TOO_MUCH");
    EXPECT_EQ(joins.kind(), QuotaExceededError::Kind::SharedFolderJoinCount);
    EXPECT_EQ(joins.limit(), 20);
    EXPECT_EQ(joins.premiumLimit(), 20);
}

TEST_F(JoinEngineTest, OtherJoinCodesAreGeneric) {
    for (const auto* code : {"INVITES_TOO_MUCH", "FILTERS_TOO_MUCH", "INVITE_SLUG_EXPIRED"}) {
        t.api->onJoin = [code](const std::string&, const test::FakeFolderInviteApi::Peers&) -> net::Updates {
            throw test::FakeFolderInviteApi::error(code);
        };
        try {
            engine()->join("abc", {10}).get();
            ADD_FAILURE() << "join succeeded for " << code;
        } catch (const QuotaExceededError&) {
            ADD_FAILURE() << "quota error for " << code;
        } catch (const error::FolderError&) {
        }
    }
}
