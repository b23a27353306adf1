#include <gtest/gtest.h>
#include "support/TestAccount.hpp"
#include "folder/UpdatesEngine.hpp"
#include "config/Config.hpp"
#include "error/FolderError.hpp"

#include <atomic>
#include <nlohmann/json.hpp>

using namespace fl;
using namespace fl::types;
using namespace std::chrono_literals;
using fl::error::QuotaExceededError;
using folder::FailurePolicy;
using folder::UpdatesEngine;

class UpdatesEngineTest : public ::testing::Test {
protected:
    test::TestAccount t;
    std::shared_ptr<std::atomic<std::time_t>> clock = std::make_shared<std::atomic<std::time_t>>(1'700'000'000);

    void SetUp() override {
        t.store->exec("seed", [](store::Transaction& txn) {
            txn.upsertPeers({test::channel(10, "Ten"), test::channel(11, "Eleven")});
            txn.upsertFilter({4, "Shared", true, {10}});
            txn.setAppConfiguration({
                {"dialog_filters_limit_default", 10}, {"dialog_filters_limit_premium", 20},
                {"chatlists_joined_limit_default", 2}, {"chatlists_joined_limit_premium", 20}
            });
        });

        t.api->onGetUpdates = [](FolderId) {
            net::FolderUpdatesPayload payload;
            payload.missing_peers = {11, 12};
            payload.bundle.chats = {test::remoteChat(test::channel(12, "Twelve"), 321)};
            return payload;
        };
    }

    UpdatesEngine::Options options(const FailurePolicy policy = FailurePolicy::AbsorbAndCacheEmpty) const {
        UpdatesEngine::Options o;
        o.refresh_interval = 3600s;
        o.failure_policy = policy;
        o.clock = [c = clock] { return c->load(); };
        return o;
    }

    std::shared_ptr<UpdatesEngine> engine(const FailurePolicy policy = FailurePolicy::AbsorbAndCacheEmpty,
                                          std::shared_ptr<folder::DebounceCache> cache = std::make_shared<folder::DebounceCache>()) {
        return std::make_shared<UpdatesEngine>(t.account, options(policy), std::move(cache));
    }

    std::optional<PendingUpdateRecord> record(const FolderId id) const {
        return t.store->read("record", [id](store::Transaction& txn) { return txn.pendingUpdate(id); });
    }
};

TEST_F(UpdatesEngineTest, PollStoresMissingChatsAndCounts) {
    engine()->poll(4).get();

    const auto r = record(4);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->timestamp, 1'700'000'000);
    EXPECT_EQ(r->missing_entity_ids, (std::vector<EntityId>{11, 12}));
    EXPECT_EQ(r->member_counts, (std::map<EntityId, int32_t>{{12, 321}}));
    EXPECT_TRUE(t.store->read("peer", [](store::Transaction& txn) { return txn.peer(12).has_value(); }));
}

TEST_F(UpdatesEngineTest, SecondPollWithinIntervalStaysLocal) {
    const auto e = engine();
    e->poll(4).get();
    ASSERT_EQ(t.api->calls("getUpdates"), 1);

    *clock += 3600;     // timestamp + interval >= now still counts as fresh
    e->poll(4).get();
    EXPECT_EQ(t.api->calls("getUpdates"), 1);

    *clock += 1;
    e->poll(4).get();
    EXPECT_EQ(t.api->calls("getUpdates"), 2);
    EXPECT_EQ(record(4)->timestamp, 1'700'003'601);
}

TEST_F(UpdatesEngineTest, FirstObservationAlwaysPollsRemotely) {
    t.store->exec("fresh record", [this](store::Transaction& txn) {
        txn.replacePendingUpdate({4, static_cast<int32_t>(clock->load()), {11}, {}});
    });

    const auto cache = std::make_shared<folder::DebounceCache>();
    engine(FailurePolicy::AbsorbAndCacheEmpty, cache)->poll(4).get();
    EXPECT_EQ(t.api->calls("getUpdates"), 1);
    EXPECT_TRUE(cache->isObserved({t.account->id, 4}));

    // A second engine sharing the cache sees the folder as observed and fresh
    engine(FailurePolicy::AbsorbAndCacheEmpty, cache)->poll(4).get();
    EXPECT_EQ(t.api->calls("getUpdates"), 1);

    // A separate cache starts unobserved
    engine()->poll(4).get();
    EXPECT_EQ(t.api->calls("getUpdates"), 2);

    cache->reset();
    engine(FailurePolicy::AbsorbAndCacheEmpty, cache)->poll(4).get();
    EXPECT_EQ(t.api->calls("getUpdates"), 3);
}

TEST_F(UpdatesEngineTest, DebounceKeysAreScopedPerAccount) {
    folder::DebounceCache cache;
    EXPECT_TRUE(cache.markObserved({1, 4}));
    EXPECT_FALSE(cache.markObserved({1, 4}));
    EXPECT_TRUE(cache.markObserved({2, 4}));
    EXPECT_TRUE(cache.markObserved({1, 5}));
    EXPECT_EQ(cache.size(), 3u);
}

TEST_F(UpdatesEngineTest, FailedPollIsAbsorbedAndCachedEmpty) {
    t.store->exec("old record", [](store::Transaction& txn) { txn.replacePendingUpdate({4, 5, {11}, {{11, 9}}}); });
    t.api->onGetUpdates = [](FolderId) -> net::FolderUpdatesPayload { throw test::FakeFolderInviteApi::error("CHATLIST_INVALID"); };

    const auto e = engine();
    EXPECT_NO_THROW(e->poll(4).get());

    const auto r = record(4);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->missing_entity_ids.empty());
    EXPECT_TRUE(r->member_counts.empty());
    EXPECT_EQ(r->timestamp, 1'700'000'000);

    // The empty record debounces the next poll as well
    e->poll(4).get();
    EXPECT_EQ(t.api->calls("getUpdates"), 1);
}

TEST_F(UpdatesEngineTest, PropagatePolicySurfacesFailure) {
    t.api->onGetUpdates = [](FolderId) -> net::FolderUpdatesPayload { throw test::FakeFolderInviteApi::error("CHATLIST_INVALID"); };
    EXPECT_THROW(engine(FailurePolicy::Propagate)->poll(4).get(), error::FolderError);
    EXPECT_FALSE(record(4).has_value());
}

TEST_F(UpdatesEngineTest, OptionsFollowPollingConfig) {
    config::PollingConfig cfg;
    cfg.debug = true;
    cfg.absorb_errors = false;
    const auto o = UpdatesEngine::Options::fromConfig(cfg);
    EXPECT_EQ(o.refresh_interval, 5s);
    EXPECT_EQ(o.failure_policy, FailurePolicy::Propagate);
}

TEST_F(UpdatesEngineTest, DismissRemovesRecordEvenWhenServerRefuses) {
    t.store->exec("record", [](store::Transaction& txn) { txn.replacePendingUpdate({4, 5, {11}, {}}); });
    t.api->onHide = [](FolderId) -> bool { throw test::FakeFolderInviteApi::error("INTERNAL"); };

    auto done = engine()->dismiss(4);
    EXPECT_FALSE(record(4).has_value());
    EXPECT_NO_THROW(done.get());
    EXPECT_EQ(t.api->calls("hideUpdates"), 1);
}

TEST_F(UpdatesEngineTest, DismissAfterPoolStopStillSucceeds) {
    t.store->exec("record", [](store::Transaction& txn) { txn.replacePendingUpdate({4, 5, {11}, {}}); });
    const auto e = engine();
    t.account->pool->stop();

    std::future<void> done;
    ASSERT_NO_THROW(done = e->dismiss(4));
    EXPECT_FALSE(record(4).has_value());
    ASSERT_EQ(done.wait_for(0s), std::future_status::ready);
    EXPECT_NO_THROW(done.get());
    EXPECT_EQ(t.api->calls("hideUpdates"), 0);
}

TEST_F(UpdatesEngineTest, AcceptAvailableJoinsSelectedChats) {
    test::FakeFolderInviteApi::Peers sent;
    FolderId sentFolder = 0;
    t.api->onJoinUpdates = [&](const FolderId id, const test::FakeFolderInviteApi::Peers& peers) {
        sentFolder = id;
        sent = peers;
        net::Updates u;
        u.updates.emplace_back(net::FilterUpdate{4, FolderDefinition(4, "Shared", true, {10, 11})});
        u.updates.emplace_back(net::ChatListUpdate{11, true});
        return u;
    };

    FolderUpdates updates;
    updates.folder_id = 4;
    updates.title = "Shared";
    updates.missing_peers = {test::channel(11, "Eleven")};

    engine()->acceptAvailable(updates, {11}).get();

    EXPECT_EQ(sentFolder, 4);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].id, 11);
    EXPECT_TRUE(t.store->current().first->filter(4)->includes(11));
}

TEST_F(UpdatesEngineTest, AcceptAvailableQuotaCodes) {
    const auto expectQuota = [&](const std::string& code, const QuotaExceededError::Kind kind,
                                 const int32_t limit, const int32_t premiumLimit) {
        t.api->onJoinUpdates = [code](FolderId, const test::FakeFolderInviteApi::Peers&) -> net::Updates {
            throw test::FakeFolderInviteApi::error(code);
        };
        FolderUpdates updates;
        updates.folder_id = 4;
        try {
            engine()->acceptAvailable(updates, {11}).get();
            ADD_FAILURE() << "no error for " << code;
        } catch (const QuotaExceededError& e) {
            EXPECT_EQ(e.kind(), kind) << code;
            EXPECT_EQ(e.limit(), limit) << code;
            EXPECT_EQ(e.premiumLimit(), premiumLimit) << code;
        }
    };

    expectQuota("DIALOG_FILTERS_TOO_MUCH", QuotaExceededError::Kind::DialogFilterCount, 10, 20);
    expectQuota("FILTERS_TOO_MUCH", QuotaExceededError::Kind::SharedFolderJoinCount, 2, 20);
    expectQuota("COMMUNITIES_TOO_MUCH", QuotaExceededError::Kind::SharedFolderJoinCount, 2, 20);
    expectQuota("USER_CHANNELS_TOO_MUCH", QuotaExceededError::Kind::ChannelCount, 100, 200);

    t.api->onJoinUpdates = [](FolderId, const test::FakeFolderInviteApi::Peers&) -> net::Updates {
        throw test::FakeFolderInviteApi::error("INVITES_TOO_MUCH");
    };
    EXPECT_THROW(engine()->acceptAvailable(FolderUpdates{}, {11}).get(), error::FolderError);
}

TEST_F(UpdatesEngineTest, LeaveAppliesResultAndSwallowsFailures) {
    t.api->onLeave = [](const FolderId id, const test::FakeFolderInviteApi::Peers& peers) {
        EXPECT_EQ(peers.size(), 1u);
        net::Updates u;
        u.updates.emplace_back(net::FilterUpdate{id, std::nullopt});
        return u;
    };
    engine()->leave(4, {10}).get();
    EXPECT_FALSE(t.store->current().first->hasFilter(4));

    t.api->onLeave = [](FolderId, const test::FakeFolderInviteApi::Peers&) -> net::Updates {
        throw test::FakeFolderInviteApi::error("FILTER_NOT_FOUND");
    };
    EXPECT_NO_THROW(engine()->leave(4, {}).get());
}

TEST_F(UpdatesEngineTest, LeaveSuggestionsFallBackToEmpty) {
    t.api->onLeaveSuggestions = [](FolderId) { return std::vector<EntityId>{10, 11}; };
    EXPECT_EQ(engine()->leaveSuggestions(4).get(), (std::vector<EntityId>{10, 11}));

    t.api->onLeaveSuggestions = [](FolderId) -> std::vector<EntityId> { throw test::FakeFolderInviteApi::error("INTERNAL"); };
    EXPECT_TRUE(engine()->leaveSuggestions(4).get().empty());
}
