// tests/test_session_data_store.cpp
// Tests for load/store/exists/remove and the expiry scans of the SQL data store

#include <gtest/gtest.h>
#include "sessiondb/sessiondb.hpp"
#include <algorithm>
#include <cstdio>

using namespace sessiondb;

namespace {

std::string temp_db_path() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = std::string("sessiondb_") + info->test_suite_name() + "_" + info->name() + ".db";
    std::replace(name.begin(), name.end(), '/', '_');
    return ::testing::TempDir() + name;
}

void remove_db_files(const std::string& path) {
    std::remove(path.c_str());
    std::remove((path + "-journal").c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

} // anonymous namespace

class SessionDataStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = temp_db_path();
        remove_db_files(db_path_);
        store_ = make_store(SaveConflictPolicy::LAST_WRITER_WINS);
        store_->initialize();
    }

    void TearDown() override {
        store_.reset();
        remove_db_files(db_path_);
    }

    std::unique_ptr<SqlSessionDataStore> make_store(SaveConflictPolicy policy,
                                                    const NodeId& node = "node0",
                                                    bool empty_string_null = false) {
        StoreConfig config = ConfigBuilder(db_path_)
            .dialect(Dialect::SQLITE)
            .pool(2, std::chrono::milliseconds(1000))
            .empty_string_null(empty_string_null)
            .node(node)
            .expiry(std::chrono::seconds(10), std::chrono::seconds(1))
            .conflict_policy(policy)
            .system_logging(SystemLogLevel::NONE)
            .build();
        return std::make_unique<SqlSessionDataStore>(config);
    }

    SessionData new_session(const SessionId& id, Timestamp now, int64_t max_inactive_secs = 60) {
        SessionData data(id, now, now, now, max_inactive_secs);
        data.set_attribute("user", std::string("alice"));
        data.set_attribute("visits", int64_t(3));
        return data;
    }

    std::string db_path_;
    std::unique_ptr<SqlSessionDataStore> store_;
};

TEST_F(SessionDataStoreTest, TestInitializePreparesSchema) {
    EXPECT_TRUE(store_->is_initialized());
    EXPECT_TRUE(store_->is_healthy());
    EXPECT_EQ(store_->schema().state(), SchemaState::READY);
    EXPECT_EQ(store_->codec().name(), "json");
}

TEST_F(SessionDataStoreTest, TestStoreThenLoad) {
    SessionContext ctx = store_->make_context("/app");
    SessionData data = new_session("s1", 1000);
    data.cookie_set = 1000;

    EXPECT_EQ(store_->store(data, ctx, 1500), SaveResult::INSERTED);
    EXPECT_EQ(data.last_saved, 1500);
    EXPECT_EQ(data.last_node, "node0");
    EXPECT_FALSE(data.dirty);

    auto loaded = store_->load("s1", ctx);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->id, "s1");
    EXPECT_EQ(loaded->context_path, "_app");
    EXPECT_EQ(loaded->vhost, "0.0.0.0");
    EXPECT_EQ(loaded->last_node, "node0");
    EXPECT_EQ(loaded->created, 1000);
    EXPECT_EQ(loaded->cookie_set, 1000);
    EXPECT_EQ(loaded->last_saved, 1500);
    EXPECT_EQ(loaded->expiry, 61000);
    EXPECT_EQ(loaded->max_inactive_secs, 60);
    EXPECT_EQ(loaded->attributes, data.attributes);
    EXPECT_FALSE(loaded->dirty);
}

TEST_F(SessionDataStoreTest, TestLoadMissingReturnsNullopt) {
    SessionContext ctx = store_->make_context("/app");
    EXPECT_FALSE(store_->load("nope", ctx).has_value());
    EXPECT_FALSE(store_->exists("nope", ctx, 1000));
    EXPECT_FALSE(store_->remove("nope", ctx));
}

TEST_F(SessionDataStoreTest, TestScopesAreIsolated) {
    SessionContext app = store_->make_context("/app");
    SessionContext shop = store_->make_context("/shop");

    SessionData data = new_session("s1", 1000);
    store_->store(data, app, 1000);

    EXPECT_TRUE(store_->load("s1", app).has_value());
    EXPECT_FALSE(store_->load("s1", shop).has_value());
    EXPECT_FALSE(store_->load("s1", store_->make_context("/app", "other.host")).has_value());
}

TEST_F(SessionDataStoreTest, TestExistsHonorsExpiry) {
    SessionContext ctx = store_->make_context("/app");
    SessionData data = new_session("s1", 1000, 1);   // expires at 2000
    store_->store(data, ctx, 1000);

    EXPECT_TRUE(store_->exists("s1", ctx, 1999));
    EXPECT_FALSE(store_->exists("s1", ctx, 2000));

    SessionData forever = new_session("s2", 1000, -1);
    store_->store(forever, ctx, 1000);
    EXPECT_TRUE(store_->exists("s2", ctx, 999999999));
}

TEST_F(SessionDataStoreTest, TestRemove) {
    SessionContext ctx = store_->make_context("/app");
    SessionData data = new_session("s1", 1000);
    store_->store(data, ctx, 1000);

    EXPECT_TRUE(store_->remove("s1", ctx));
    EXPECT_FALSE(store_->exists("s1", ctx, 1000));
    EXPECT_FALSE(store_->remove("s1", ctx));
    EXPECT_EQ(store_->get_stats().removes, 1u);
}

TEST_F(SessionDataStoreTest, TestUpdateExistingSession) {
    SessionContext ctx = store_->make_context("/app");
    SessionData data = new_session("s1", 1000);
    store_->store(data, ctx, 1000);

    data.accessed = 5000;
    data.expiry = data.calc_expiry(5000);
    data.set_attribute("visits", int64_t(4));
    EXPECT_EQ(store_->store(data, ctx, 5000), SaveResult::UPDATED);

    auto loaded = store_->load("s1", ctx);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(std::get<int64_t>(loaded->attributes.at("visits")), 4);
    EXPECT_EQ(loaded->expiry, 65000);
    EXPECT_EQ(loaded->last_saved, 5000);
}

TEST_F(SessionDataStoreTest, TestAccessOnlySaveKeepsAttributes) {
    SessionContext ctx = store_->make_context("/app");
    SessionData data = new_session("s1", 1000);
    store_->store(data, ctx, 1000);

    // Not dirty: only timestamps are written
    data.attributes["user"] = std::string("mallory");
    data.accessed = 3000;
    EXPECT_EQ(store_->store(data, ctx, 3000), SaveResult::UPDATED);

    auto loaded = store_->load("s1", ctx);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(std::get<std::string>(loaded->attributes.at("user")), "alice");
    EXPECT_EQ(loaded->accessed, 3000);
}

TEST_F(SessionDataStoreTest, TestNewSessionAlreadyStoredFallsBackToUpdate) {
    SessionContext ctx = store_->make_context("/app");
    SessionData first = new_session("s1", 1000);
    store_->store(first, ctx, 1000);

    SessionData again = new_session("s1", 1000);
    again.set_attribute("visits", int64_t(9));
    EXPECT_EQ(store_->store(again, ctx, 2000), SaveResult::UPDATED);

    auto loaded = store_->load("s1", ctx);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(std::get<int64_t>(loaded->attributes.at("visits")), 9);
}

TEST_F(SessionDataStoreTest, TestVanishedRowIsReinserted) {
    SessionContext ctx = store_->make_context("/app");
    SessionData data = new_session("s1", 1000);
    store_->store(data, ctx, 1000);

    // Another node reaped it in between
    ASSERT_TRUE(store_->remove("s1", ctx));

    EXPECT_EQ(store_->store(data, ctx, 2000), SaveResult::INSERTED);
    EXPECT_TRUE(store_->load("s1", ctx).has_value());
}

TEST_F(SessionDataStoreTest, TestCompareLastSavedDetectsConflict) {
    store_.reset();
    auto node_a = make_store(SaveConflictPolicy::COMPARE_LAST_SAVED, "nodeA");
    auto node_b = make_store(SaveConflictPolicy::COMPARE_LAST_SAVED, "nodeB");
    node_a->initialize();
    node_b->initialize();

    SessionContext ctx_a = node_a->make_context("/app");
    SessionContext ctx_b = node_b->make_context("/app");

    SessionData on_a = new_session("s1", 1000);
    ASSERT_EQ(node_a->store(on_a, ctx_a, 1000), SaveResult::INSERTED);

    auto loaded = node_b->load("s1", ctx_b);
    ASSERT_TRUE(loaded.has_value());
    SessionData on_b = *loaded;
    on_b.set_attribute("cart", std::string("book"));
    ASSERT_EQ(node_b->store(on_b, ctx_b, 2000), SaveResult::UPDATED);

    // nodeA still holds the copy saved at 1000
    on_a.set_attribute("cart", std::string("pen"));
    EXPECT_EQ(node_a->store(on_a, ctx_a, 3000), SaveResult::CONFLICT);
    EXPECT_EQ(on_a.last_saved, 1000);
    EXPECT_TRUE(on_a.dirty);
    EXPECT_EQ(node_a->get_stats().conflicts, 1u);

    auto current = node_a->load("s1", ctx_a);
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(std::get<std::string>(current->attributes.at("cart")), "book");
    EXPECT_EQ(current->last_node, "nodeB");
}

TEST_F(SessionDataStoreTest, TestLastWriterWinsOverwrites) {
    store_.reset();
    auto node_a = make_store(SaveConflictPolicy::LAST_WRITER_WINS, "nodeA");
    auto node_b = make_store(SaveConflictPolicy::LAST_WRITER_WINS, "nodeB");
    node_a->initialize();
    node_b->initialize();

    SessionContext ctx_a = node_a->make_context("/app");
    SessionData on_a = new_session("s1", 1000);
    node_a->store(on_a, ctx_a, 1000);

    auto on_b = node_b->load("s1", node_b->make_context("/app"));
    ASSERT_TRUE(on_b.has_value());
    on_b->set_attribute("cart", std::string("book"));
    node_b->store(*on_b, node_b->make_context("/app"), 2000);

    on_a.set_attribute("cart", std::string("pen"));
    EXPECT_EQ(node_a->store(on_a, ctx_a, 3000), SaveResult::UPDATED);

    auto current = node_a->load("s1", ctx_a);
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(std::get<std::string>(current->attributes.at("cart")), "pen");
}

TEST_F(SessionDataStoreTest, TestDefaultPolicyNeverLowersExpiry) {
    store_.reset();
    auto make_default = [this](const NodeId& node) {
        StoreConfig config = ConfigBuilder(db_path_)
            .pool(2, std::chrono::milliseconds(1000))
            .node(node)
            .system_logging(SystemLogLevel::NONE)
            .build();
        return std::make_unique<SqlSessionDataStore>(config);
    };
    auto node_a = make_default("nodeA");
    auto node_b = make_default("nodeB");
    node_a->initialize();
    node_b->initialize();

    SessionContext ctx_a = node_a->make_context("/app");
    SessionContext ctx_b = node_b->make_context("/app");

    SessionData on_a = new_session("s1", 1000);
    ASSERT_EQ(node_a->store(on_a, ctx_a, 1000), SaveResult::INSERTED);

    auto on_b = node_b->load("s1", ctx_b);
    ASSERT_TRUE(on_b.has_value());
    on_b->accessed = 50000;
    on_b->expiry = 110000;
    ASSERT_EQ(node_b->store(*on_b, ctx_b, 50000), SaveResult::UPDATED);

    // nodeA still carries the earlier expiry
    on_a.set_attribute("cart", std::string("pen"));
    EXPECT_EQ(node_a->store(on_a, ctx_a, 60000), SaveResult::CONFLICT);

    auto current = node_a->load("s1", ctx_a);
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->expiry, 110000);
    EXPECT_EQ(current->last_node, "nodeB");
}

TEST_F(SessionDataStoreTest, TestCompareLastSavedReinsertsVanishedRow) {
    store_.reset();
    auto node = make_store(SaveConflictPolicy::COMPARE_LAST_SAVED);
    node->initialize();

    SessionContext ctx = node->make_context("/app");
    SessionData data = new_session("s1", 1000);
    ASSERT_EQ(node->store(data, ctx, 1000), SaveResult::INSERTED);
    ASSERT_TRUE(node->remove("s1", ctx));

    EXPECT_EQ(node->store(data, ctx, 2000), SaveResult::INSERTED);
    EXPECT_EQ(node->get_stats().conflicts, 0u);

    auto loaded = node->load("s1", ctx);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->last_saved, 2000);
}

TEST_F(SessionDataStoreTest, TestLogLevelAppliedOnlyWhenConfigured) {
    Utils::set_log_level(SystemLogLevel::WARN);

    SqlSessionDataStore unset_level(ConfigBuilder(db_path_).node("node1").build());
    unset_level.initialize();
    EXPECT_EQ(Utils::get_log_level(), SystemLogLevel::WARN);

    SqlSessionDataStore explicit_level(ConfigBuilder(db_path_)
        .node("node2")
        .system_logging(SystemLogLevel::ERROR)
        .build());
    explicit_level.initialize();
    EXPECT_EQ(Utils::get_log_level(), SystemLogLevel::ERROR);

    SqlSessionDataStore silent(ConfigBuilder(db_path_)
        .node("node3")
        .system_logging(SystemLogLevel::ERROR, false)
        .build());
    silent.initialize();
    EXPECT_EQ(Utils::get_log_level(), SystemLogLevel::NONE);
}

TEST_F(SessionDataStoreTest, TestGetExpiredFindsMineCandidatesAndOrphans) {
    store_.reset();
    auto mine = make_store(SaveConflictPolicy::LAST_WRITER_WINS, "node0");
    auto other = make_store(SaveConflictPolicy::LAST_WRITER_WINS, "node1");
    mine->initialize();
    other->initialize();

    SessionContext ctx = mine->make_context("/app");
    SessionContext other_ctx = other->make_context("/app");

    // grace period is 10s
    SessionData my_expired = new_session("mine", 0, 1);          // expiry 1000
    SessionData my_live = new_session("live", 0, 3600);          // expiry 3600000
    SessionData orphan = new_session("orphan", 0, 1);            // expiry 1000, node1
    SessionData recent = new_session("recent", 50000, 1);        // expiry 51000, node1
    mine->store(my_expired, ctx, 1);
    mine->store(my_live, ctx, 1);
    other->store(orphan, other_ctx, 1);
    other->store(recent, other_ctx, 1);

    Timestamp now = 52000;
    std::set<SessionId> expired = mine->get_expired({"recent", "live", "ghost"}, ctx, now);

    // "recent" is a candidate that expired, "ghost" is no longer in the table,
    // "orphan" belongs to node1 and expired more than a grace period ago
    EXPECT_EQ(expired, (std::set<SessionId>{"mine", "recent", "ghost", "orphan"}));
}

TEST_F(SessionDataStoreTest, TestOrphanScanRunsOncePerGracePeriod) {
    auto other = make_store(SaveConflictPolicy::LAST_WRITER_WINS, "node1");
    other->initialize();
    SessionContext ctx = store_->make_context("/app");

    EXPECT_TRUE(store_->get_expired({}, ctx, 100000).empty());

    SessionData orphan = new_session("orphan", 0, 1);
    other->store(orphan, other->make_context("/app"), 1);

    // Within the grace period of the last scan: only own sessions are checked
    EXPECT_TRUE(store_->get_expired({}, ctx, 105000).empty());
    EXPECT_EQ(store_->get_expired({}, ctx, 110000), (std::set<SessionId>{"orphan"}));
}

TEST_F(SessionDataStoreTest, TestPurgeAncientRemovesAnyScope) {
    SessionData a = new_session("a", 0, 1);
    SessionData b = new_session("b", 0, 1);
    SessionData c = new_session("c", 100000, 1);
    store_->store(a, store_->make_context("/app"), 1);
    store_->store(b, store_->make_context("/shop", "example.com"), 1);
    store_->store(c, store_->make_context("/app"), 1);

    // 3 x 10s grace before 40000 is 10000
    EXPECT_EQ(store_->purge_ancient(40000), 2u);
    EXPECT_FALSE(store_->load("a", store_->make_context("/app")).has_value());
    EXPECT_FALSE(store_->load("b", store_->make_context("/shop", "example.com")).has_value());
    EXPECT_TRUE(store_->load("c", store_->make_context("/app")).has_value());
    EXPECT_EQ(store_->get_stats().ancient_purged, 2u);
}

TEST_F(SessionDataStoreTest, TestRootContextWithEmptyStringNull) {
    store_.reset();
    auto oracle_like = make_store(SaveConflictPolicy::LAST_WRITER_WINS, "node0", true);
    oracle_like->initialize();
    EXPECT_TRUE(oracle_like->adaptor().is_empty_string_null());

    SessionData data = new_session("root", 1000);
    oracle_like->store(data, oracle_like->make_context(""), 1000);

    auto loaded = oracle_like->load("root", oracle_like->make_context("/"));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->context_path, "");
    EXPECT_TRUE(oracle_like->exists("root", oracle_like->make_context("/", "0.0.0.0"), 1000));
    EXPECT_TRUE(oracle_like->remove("root", oracle_like->make_context("")));
}

TEST_F(SessionDataStoreTest, TestInvalidSessionIdRejected) {
    SessionContext ctx = store_->make_context("/app");
    EXPECT_THROW(store_->load("", ctx), ValidationError);
    EXPECT_THROW(store_->exists("has space", ctx, 0), ValidationError);

    SessionData data = new_session(std::string(121, 'x'), 1000);
    EXPECT_THROW(store_->store(data, ctx, 1000), ValidationError);
}

TEST_F(SessionDataStoreTest, TestUninitializedStoreIsUnavailable) {
    store_.reset();
    auto fresh = make_store(SaveConflictPolicy::LAST_WRITER_WINS);
    EXPECT_FALSE(fresh->is_healthy());
    EXPECT_THROW(fresh->load("s1", fresh->make_context("/app")), StorageUnavailable);
}
