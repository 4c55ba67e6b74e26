// tests/test_session_context.cpp
// Tests for scope canonicalization and descriptor equality

#include <gtest/gtest.h>
#include "sessiondb/sessiondb.hpp"

using namespace sessiondb;

class SessionContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        Utils::set_log_level(SystemLogLevel::NONE);
    }
};

TEST_F(SessionContextTest, TestRootContextCanonicalizesToEmptyToken) {
    EXPECT_EQ(SessionContext::canonicalize_context_path(""), "");
    EXPECT_EQ(SessionContext::canonicalize_context_path("/"), "");
    EXPECT_EQ(SessionContext::canonicalize_context_path("  /  "), "");

    SessionContext empty_root("node0", "", "0.0.0.0");
    SessionContext slash_root("node0", "/", "0.0.0.0");
    EXPECT_TRUE(empty_root.is_root());
    EXPECT_EQ(empty_root, slash_root);
}

TEST_F(SessionContextTest, TestContextPathSeparatorsReplaced) {
    EXPECT_EQ(SessionContext::canonicalize_context_path("/app"), "_app");
    EXPECT_EQ(SessionContext::canonicalize_context_path("/app/v1"), "_app_v1");
    EXPECT_EQ(SessionContext::canonicalize_context_path("/app/v1/"), "_app_v1");
    EXPECT_EQ(SessionContext::canonicalize_context_path("\\shop\\cart"), "_shop_cart");
    EXPECT_EQ(SessionContext::canonicalize_context_path("/my.app"), "_my_app");
}

TEST_F(SessionContextTest, TestCanonicalizationIsIdempotent) {
    for (const std::string raw : {"", "/", "/app", "/app/v1/", "/my.app", "\\x\\y"}) {
        ContextPath once = SessionContext::canonicalize_context_path(raw);
        EXPECT_EQ(SessionContext::canonicalize_context_path(once), once) << "input: " << raw;
    }
}

TEST_F(SessionContextTest, TestVirtualHostCanonicalization) {
    EXPECT_EQ(SessionContext::canonicalize_vhost(""), "0.0.0.0");
    EXPECT_EQ(SessionContext::canonicalize_vhost("   "), "0.0.0.0");
    EXPECT_EQ(SessionContext::canonicalize_vhost("WWW.Example.COM"), "www.example.com");
    EXPECT_EQ(SessionContext::canonicalize_vhost(" 10.0.0.1 "), "10.0.0.1");
}

TEST_F(SessionContextTest, TestEqualityIgnoresNode) {
    SessionContext a("node0", "/app", "host");
    SessionContext b("node1", "/app/", "HOST");
    SessionContext c("node0", "/other", "host");
    SessionContext d("node0", "/app", "otherhost");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_NE(a.node_id(), b.node_id());
}

TEST_F(SessionContextTest, TestWithNodeKeepsScope) {
    SessionContext original("node0", "/app", "host");
    SessionContext moved = original.with_node("node7");

    EXPECT_EQ(moved, original);
    EXPECT_EQ(moved.node_id(), "node7");
    EXPECT_EQ(original.node_id(), "node0");
    EXPECT_EQ(moved.canonical_context_path(), "_app");
}

TEST_F(SessionContextTest, TestToString) {
    SessionContext ctx("node0", "/app", "");
    EXPECT_EQ(ctx.to_string(), "_app_0.0.0.0");

    SessionContext root("node0", "/", "example.com");
    EXPECT_EQ(root.to_string(), "_example.com");
}

TEST_F(SessionContextTest, TestInvalidNodeIdRejected) {
    EXPECT_THROW(SessionContext("", "/app"), ConfigError);
    EXPECT_THROW(SessionContext("   ", "/app"), ConfigError);
    EXPECT_THROW(SessionContext(std::string(61, 'n'), "/app"), ConfigError);

    SessionContext ctx("node0", "/app");
    try {
        ctx.with_node("");
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_NODE_ID);
        EXPECT_EQ(e.field(), "node_id");
    }
}
