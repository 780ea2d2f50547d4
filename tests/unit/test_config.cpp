#include <gtest/gtest.h>
#include <agentcoord/agentcoord.hpp>

#include <cstdlib>

using namespace agentcoord;
using namespace std::chrono_literals;

// ===========================================================================
// Fixture: clean environment for every test
// ===========================================================================

class ConfigFromEnvTest : public ::testing::Test {
protected:
    static constexpr const char* kVariables[] = {
        "AGENTCOORD_STORE", "AGENTCOORD_DB_PATH", "LOCK_TTL_MINUTES",
        "GUARDRAILS_CACHE_TTL", "GUARDRAILS_CODE_FALLBACK", "PROFILES_DEFAULT_TRUST",
        "PROFILES_ENFORCE_LIMITS", "PROFILES_CACHE_TTL", "AUDIT_RETENTION_DAYS",
        "AUDIT_ASYNC", "NETWORK_DEFAULT_POLICY", "POLICY_ENGINE", "POLICY_CACHE_TTL",
        "STALE_THRESHOLD_MINUTES", "AGENT_ID", "AGENT_TYPE", "SESSION_ID",
    };

    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : kVariables) {
            ::unsetenv(name);
        }
    }

    static void set(const char* name, const char* value) {
        ::setenv(name, value, 1);
    }
};

TEST_F(ConfigFromEnvTest, DefaultsWithoutEnvironment) {
    auto config = Config::from_env();

    EXPECT_EQ(config.store.backend, StoreBackend::Memory);
    EXPECT_EQ(config.locks.default_ttl, Duration(120min));
    EXPECT_EQ(config.queue.retry_policy, RetryPolicy::ExplicitResubmit);
    EXPECT_TRUE(config.guardrails.fallback_to_baseline);
    EXPECT_EQ(config.profiles.default_trust_level, TRUST_STANDARD);
    EXPECT_EQ(config.audit.retention_days, 90);
    EXPECT_EQ(config.network.default_action, NetworkAction::Deny);
    EXPECT_EQ(config.policy.engine, PolicyEngineKind::Native);
    EXPECT_EQ(config.liveness.stale_threshold, Duration(15min));
}

TEST_F(ConfigFromEnvTest, OverlaysEnvironment) {
    set("AGENTCOORD_STORE", "SQLite");
    set("AGENTCOORD_DB_PATH", "/tmp/coord.db");
    set("LOCK_TTL_MINUTES", "30");
    set("GUARDRAILS_CODE_FALLBACK", "off");
    set("PROFILES_DEFAULT_TRUST", "1");
    set("AUDIT_RETENTION_DAYS", "7");
    set("AUDIT_ASYNC", "false");
    set("NETWORK_DEFAULT_POLICY", "allow");
    set("POLICY_ENGINE", "cedar");
    set("POLICY_CACHE_TTL", "10");
    set("STALE_THRESHOLD_MINUTES", "5");

    auto config = Config::from_env();
    EXPECT_EQ(config.store.backend, StoreBackend::Sqlite);
    EXPECT_EQ(config.store.database_path, "/tmp/coord.db");
    EXPECT_EQ(config.locks.default_ttl, Duration(30min));
    EXPECT_FALSE(config.guardrails.fallback_to_baseline);
    EXPECT_EQ(config.profiles.default_trust_level, TRUST_RESTRICTED);
    EXPECT_EQ(config.audit.retention_days, 7);
    EXPECT_FALSE(config.audit.async);
    EXPECT_EQ(config.network.default_action, NetworkAction::Allow);
    EXPECT_EQ(config.policy.engine, PolicyEngineKind::Declarative);
    EXPECT_EQ(config.policy.cache_ttl, Duration(10s));
    EXPECT_EQ(config.liveness.stale_threshold, Duration(5min));
}

TEST_F(ConfigFromEnvTest, LongLockTtlRaisesCeiling) {
    set("LOCK_TTL_MINUTES", "600");
    auto config = Config::from_env();
    EXPECT_EQ(config.locks.default_ttl, Duration(600min));
    EXPECT_EQ(config.locks.max_ttl, Duration(600min));
}

TEST_F(ConfigFromEnvTest, EmptyValueMeansUnset) {
    set("LOCK_TTL_MINUTES", "");
    EXPECT_EQ(Config::from_env().locks.default_ttl, Duration(120min));
}

// ===========================================================================
// Malformed values
// ===========================================================================

TEST_F(ConfigFromEnvTest, MalformedValuesThrow) {
    const std::vector<std::pair<const char*, const char*>> bad = {
        {"AGENTCOORD_STORE", "redis"},
        {"LOCK_TTL_MINUTES", "ten"},
        {"LOCK_TTL_MINUTES", "0"},
        {"LOCK_TTL_MINUTES", "-5"},
        {"LOCK_TTL_MINUTES", "12abc"},
        {"GUARDRAILS_CODE_FALLBACK", "maybe"},
        {"PROFILES_DEFAULT_TRUST", "9"},
        {"AUDIT_RETENTION_DAYS", "0"},
        {"NETWORK_DEFAULT_POLICY", "sometimes"},
        {"POLICY_ENGINE", "opa"},
    };

    for (const auto& [name, value] : bad) {
        clear();
        set(name, value);
        try {
            Config::from_env();
            ADD_FAILURE() << name << "=" << value << " was accepted";
        } catch (const ConfigurationException& e) {
            EXPECT_EQ(e.variable(), name);
        }
    }
}

// ===========================================================================
// Agent identity
// ===========================================================================

TEST_F(ConfigFromEnvTest, IdentityFromEnvironment) {
    set("AGENT_ID", "worker-7");
    set("AGENT_TYPE", "codex");
    set("SESSION_ID", "worker-7-s1");

    auto identity = AgentIdentity::from_env();
    EXPECT_EQ(identity.agent_id, "worker-7");
    EXPECT_EQ(identity.agent_type, "codex");
    EXPECT_EQ(identity.session_id, "worker-7-s1");
}

TEST_F(ConfigFromEnvTest, IdentityDefaults) {
    auto identity = AgentIdentity::from_env();
    EXPECT_EQ(identity.agent_id.rfind("agent-", 0), 0u);
    EXPECT_EQ(identity.agent_type, "unknown");
    EXPECT_EQ(identity.session_id.rfind(identity.agent_id + "-", 0), 0u);
}
