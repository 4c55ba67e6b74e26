// tests/test_foundation.cpp
// Basic tests for foundation components (types, config, errors, utils)

#include <gtest/gtest.h>
#include "sessiondb/sessiondb.hpp"
#include <cstdlib>

using namespace sessiondb;

// Test fixture for foundation tests
class FoundationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Utils::set_log_level(SystemLogLevel::NONE);
    }

    void TearDown() override {
        for (const char* name : {"SDB_DATABASE_URL", "SDB_DIALECT", "SDB_NODE_ID", "SDB_POOL_SIZE",
                                 "SDB_TABLE_NAME", "SDB_LOG_LEVEL", "SDB_GRACE_PERIOD_SEC"}) {
            unsetenv(name);
        }
    }
};

// Tests for Types and Utilities
TEST_F(FoundationTest, TestDialectConversion) {
    EXPECT_EQ(Utils::dialect_to_string(Dialect::SQLITE), "SQLITE");
    EXPECT_EQ(Utils::dialect_to_string(Dialect::ORACLE), "ORACLE");
    EXPECT_EQ(Utils::dialect_to_string(Dialect::POSTGRESQL), "POSTGRESQL");

    EXPECT_EQ(Utils::string_to_dialect("sqlite3"), Dialect::SQLITE);
    EXPECT_EQ(Utils::string_to_dialect("Postgres"), Dialect::POSTGRESQL);
    EXPECT_EQ(Utils::string_to_dialect("mariadb"), Dialect::MYSQL);
    EXPECT_EQ(Utils::string_to_dialect("oracle"), Dialect::ORACLE);
    EXPECT_EQ(Utils::string_to_dialect("invalid"), Dialect::GENERIC); // fallback
}

TEST_F(FoundationTest, TestSaveResultConversion) {
    EXPECT_EQ(Utils::save_result_to_string(SaveResult::INSERTED), "INSERTED");
    EXPECT_EQ(Utils::save_result_to_string(SaveResult::UPDATED), "UPDATED");
    EXPECT_EQ(Utils::save_result_to_string(SaveResult::CONFLICT), "CONFLICT");
}

TEST_F(FoundationTest, TestSessionIdValidation) {
    EXPECT_TRUE(Utils::is_valid_session_id("1234"));
    EXPECT_TRUE(Utils::is_valid_session_id("node0abcDEF.x-y_z"));

    // Invalid cases
    EXPECT_FALSE(Utils::is_valid_session_id(""));
    EXPECT_FALSE(Utils::is_valid_session_id("has space"));
    EXPECT_FALSE(Utils::is_valid_session_id("tab\there"));
    EXPECT_FALSE(Utils::is_valid_session_id(std::string(121, 'x'))); // too long
    EXPECT_TRUE(Utils::is_valid_session_id(std::string(120, 'x')));
}

TEST_F(FoundationTest, TestTimestamp) {
    Timestamp now = Utils::now_milliseconds();
    EXPECT_GT(now, 1577836800000LL); // 2020-01-01 00:00:00 UTC
}

TEST_F(FoundationTest, TestSessionDataExpiry) {
    SessionData data("abc", 1000, 1000, 1000, 30);
    EXPECT_EQ(data.expiry, 31000);
    EXPECT_EQ(data.calc_expiry(5000), 35000);
    EXPECT_FALSE(data.is_expired_at(30999));
    EXPECT_TRUE(data.is_expired_at(31000));

    SessionData immortal("def", 1000, 1000, 1000, 0);
    EXPECT_EQ(immortal.expiry, 0);
    EXPECT_FALSE(immortal.is_expired_at(INT64_MAX));
}

TEST_F(FoundationTest, TestSessionDataAttributesMarkDirty) {
    SessionData data("abc", 1000, 1000, 1000, 30);
    EXPECT_FALSE(data.dirty);

    data.set_attribute("user", std::string("alice"));
    EXPECT_TRUE(data.dirty);

    data.dirty = false;
    EXPECT_EQ(data.remove_attribute("missing"), 0u);
    EXPECT_FALSE(data.dirty);
    EXPECT_EQ(data.remove_attribute("user"), 1u);
    EXPECT_TRUE(data.dirty);
}

// Tests for Properties
TEST_F(FoundationTest, TestPropertiesBasicOperations) {
    Properties props;
    EXPECT_TRUE(props.empty());

    props["string_prop"] = std::string("test");
    props["int_prop"] = int64_t(123);
    props["double_prop"] = 45.67;
    props["bool_prop"] = true;
    props["null_prop"] = nullptr;

    EXPECT_EQ(props.size(), 5u);
    EXPECT_TRUE(props.contains("string_prop"));
    EXPECT_FALSE(props.contains("missing_prop"));

    Properties copy = props;
    EXPECT_EQ(copy, props);
    copy.erase("bool_prop");
    EXPECT_NE(copy, props);
}

// Tests for Error Handling
TEST_F(FoundationTest, TestErrorCategory) {
    std::error_code ec = ErrorCode::SCHEMA_NOT_READY;
    EXPECT_EQ(ec.category().name(), std::string("sessiondb"));
    EXPECT_EQ(ec.message(), "Session table not prepared");
    EXPECT_EQ(ec.value(), 103);
}

TEST_F(FoundationTest, TestSchemaError) {
    auto error = Errors::create_table_failed("ClusterSessions", "disk full");
    EXPECT_EQ(error.code(), ErrorCode::SCHEMA_CREATE_FAILED);
    EXPECT_EQ(error.table(), "ClusterSessions");
    EXPECT_NE(std::string(error.what()).find("disk full"), std::string::npos);
    EXPECT_EQ(error.category(), "sessiondb::SchemaError");
}

TEST_F(FoundationTest, TestStorageUnavailableIsStorageError) {
    auto error = Errors::pool_exhausted(4, std::chrono::milliseconds(500));
    EXPECT_EQ(error.code(), ErrorCode::POOL_EXHAUSTED);
    EXPECT_EQ(error.operation(), "acquire");

    try {
        throw error;
    } catch (const StorageError& e) {
        EXPECT_EQ(e.category(), "sessiondb::StorageUnavailable");
    }
}

TEST_F(FoundationTest, TestStatementError) {
    auto error = Errors::bind_out_of_range(11, 10);
    EXPECT_EQ(error.code(), ErrorCode::BIND_INDEX_OUT_OF_RANGE);

    auto prepare = Errors::prepare_failed("SELEKT 1", "syntax error");
    EXPECT_EQ(prepare.sql(), "SELEKT 1");
    EXPECT_EQ(prepare.code(), ErrorCode::PREPARE_FAILED);
}

TEST_F(FoundationTest, TestValidationError) {
    auto error = Errors::invalid_session_id("");
    EXPECT_EQ(error.code(), ErrorCode::INVALID_SESSION_ID);
    EXPECT_EQ(error.field(), "session_id");
}

// Tests for Configuration
TEST_F(FoundationTest, TestConfigBasic) {
    StoreConfig config("sessions.db");

    EXPECT_EQ(config.database().url, "sessions.db");
    EXPECT_EQ(config.database().dialect, Dialect::SQLITE);
    EXPECT_FALSE(config.database().empty_string_null.has_value());
    EXPECT_EQ(config.schema().table_name, "ClusterSessions");
    EXPECT_EQ(config.schema().max_interval_column, "maxInterval");
    EXPECT_EQ(config.behavior().grace_period, std::chrono::seconds(3600));
    EXPECT_EQ(config.behavior().conflict_policy, SaveConflictPolicy::COMPARE_LAST_SAVED);
    EXPECT_FALSE(config.logging().level.has_value());
    EXPECT_FALSE(config.effective_node_id().empty());
}

TEST_F(FoundationTest, TestConfigValidation) {
    StoreConfig valid_config("sessions.db");
    EXPECT_TRUE(valid_config.is_valid());
    EXPECT_NO_THROW(valid_config.validate());

    StoreConfig bad_pool("sessions.db");
    bad_pool.set_pool_size(0);
    EXPECT_FALSE(bad_pool.is_valid());
    EXPECT_THROW(bad_pool.validate(), ConfigError);

    StoreConfig bad_table("sessions.db");
    bad_table.set_table_name("sessions; DROP TABLE x");
    EXPECT_FALSE(bad_table.is_valid());

    StoreConfig bad_url("");
    bad_url.set_node_id(std::string(61, 'n'));
    EXPECT_EQ(bad_url.validation_errors().size(), 2u);
}

TEST_F(FoundationTest, TestConfigBuilder) {
    auto config = ConfigBuilder("file:sessions.db?mode=rwc")
        .dialect(Dialect::ORACLE)
        .pool(4, std::chrono::milliseconds(250))
        .table("web_sessions", "app")
        .node("node7")
        .expiry(std::chrono::seconds(120), std::chrono::seconds(15))
        .conflict_policy(SaveConflictPolicy::COMPARE_LAST_SAVED)
        .system_logging(SystemLogLevel::DEBUG)
        .build();

    EXPECT_EQ(config.database().pool_size, 4u);
    EXPECT_EQ(config.database().acquire_timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(config.schema().table_name, "web_sessions");
    EXPECT_EQ(config.schema().schema_name, "app");
    EXPECT_EQ(config.effective_node_id(), "node7");
    EXPECT_EQ(config.behavior().sweep_interval, std::chrono::seconds(15));
    EXPECT_EQ(config.behavior().conflict_policy, SaveConflictPolicy::COMPARE_LAST_SAVED);
    EXPECT_EQ(config.logging().level.value_or(SystemLogLevel::NONE), SystemLogLevel::DEBUG);

    EXPECT_THROW(ConfigBuilder("sessions.db").pool(0, std::chrono::milliseconds(10)).build(), ConfigError);
}

TEST_F(FoundationTest, TestConfigPresets) {
    auto dev_config = Presets::development("dev.db");
    EXPECT_EQ(dev_config.logging().level.value_or(SystemLogLevel::NONE), SystemLogLevel::DEBUG);
    EXPECT_EQ(dev_config.database().pool_size, 2u);

    auto prod_config = Presets::production("prod.db");
    EXPECT_EQ(prod_config.logging().level.value_or(SystemLogLevel::NONE), SystemLogLevel::ERROR);
    EXPECT_EQ(prod_config.behavior().conflict_policy, SaveConflictPolicy::COMPARE_LAST_SAVED);
    EXPECT_GT(prod_config.database().pool_size, dev_config.database().pool_size);

    auto oracle_config = Presets::oracle_compatible("oracle.db");
    ASSERT_TRUE(oracle_config.database().empty_string_null.has_value());
    EXPECT_TRUE(*oracle_config.database().empty_string_null);
}

TEST_F(FoundationTest, TestEnvConfig) {
    EXPECT_FALSE(EnvConfig::from_environment().has_value());

    setenv("SDB_DATABASE_URL", "env.db", 1);
    setenv("SDB_DIALECT", "oracle", 1);
    setenv("SDB_NODE_ID", "envnode", 1);
    setenv("SDB_POOL_SIZE", "3", 1);
    setenv("SDB_GRACE_PERIOD_SEC", "90", 1);

    auto config = EnvConfig::from_environment();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->database().url, "env.db");
    EXPECT_EQ(config->database().dialect, Dialect::ORACLE);
    EXPECT_EQ(config->effective_node_id(), "envnode");
    EXPECT_EQ(config->database().pool_size, 3u);
    EXPECT_EQ(config->behavior().grace_period, std::chrono::seconds(90));
}

// Tests for Utility Functions
TEST_F(FoundationTest, TestStringUtils) {
    EXPECT_EQ(Utils::trim("  hello  "), "hello");
    EXPECT_EQ(Utils::trim(""), "");
    EXPECT_EQ(Utils::trim("   "), "");

    EXPECT_EQ(Utils::to_lower("HELLO"), "hello");
    EXPECT_EQ(Utils::to_upper("hello"), "HELLO");

    EXPECT_TRUE(Utils::is_blank(" \t "));
    EXPECT_FALSE(Utils::is_blank(" x "));
}

TEST_F(FoundationTest, TestIdentifierValidation) {
    EXPECT_TRUE(Utils::is_valid_identifier("ClusterSessions"));
    EXPECT_TRUE(Utils::is_valid_identifier("_private1"));
    EXPECT_FALSE(Utils::is_valid_identifier(""));
    EXPECT_FALSE(Utils::is_valid_identifier("1table"));
    EXPECT_FALSE(Utils::is_valid_identifier("bad-name"));
    EXPECT_FALSE(Utils::is_valid_identifier("x\"; DROP"));
}

TEST_F(FoundationTest, TestDefaultNodeId) {
    NodeId node = Utils::default_node_id();
    EXPECT_FALSE(node.empty());
    EXPECT_LE(node.size(), 60u);
    EXPECT_EQ(node.find('.'), std::string::npos);
    EXPECT_EQ(node.find('-'), std::string::npos);
}

TEST_F(FoundationTest, TestLogLevels) {
    Utils::set_log_level(SystemLogLevel::WARN);
    EXPECT_TRUE(Utils::is_log_enabled(SystemLogLevel::ERROR));
    EXPECT_TRUE(Utils::is_log_enabled(SystemLogLevel::WARN));
    EXPECT_FALSE(Utils::is_log_enabled(SystemLogLevel::DEBUG));
    EXPECT_EQ(Utils::log_level_to_string(SystemLogLevel::TRACE), "TRACE");
    Utils::set_log_level(SystemLogLevel::NONE);
    EXPECT_FALSE(Utils::is_log_enabled(SystemLogLevel::ERROR));
}

TEST_F(FoundationTest, TestScopedTimer) {
    Utils::ScopedTimer::Duration measured{-1};
    {
        Utils::ScopedTimer timer(measured);
    }
    EXPECT_GE(measured.count(), 0);
}

TEST_F(FoundationTest, TestVersion) {
    EXPECT_EQ(version(), "1.0.0");
    EXPECT_EQ(VERSION_MAJOR, 1);
}
