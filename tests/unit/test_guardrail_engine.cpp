#include <gtest/gtest.h>
#include <agentcoord/agentcoord.hpp>

#include "../test_helpers.hpp"

using namespace agentcoord;
using namespace agentcoord::testing;
using namespace std::chrono_literals;

namespace {

// Registry reads fail, everything else is delegated
class UnreadableStore : public MemoryStore {
public:
    std::vector<GuardrailPattern> load_guardrail_patterns() const override {
        throw StoreException("pattern registry unreachable");
    }
    void record_violations(const std::vector<GuardrailViolation>&) override {
        throw StoreException("violation table unreachable");
    }
};

bool has_pattern(const std::vector<GuardrailViolation>& list, const std::string& name) {
    for (const auto& v : list) {
        if (v.pattern_name == name) return true;
    }
    return false;
}

} // anonymous namespace

// ===========================================================================
// Fixture: engine over a seeded in-memory store
// ===========================================================================

class GuardrailEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryStore> store;
    std::shared_ptr<RecordingMonitor> monitor;
    std::unique_ptr<GuardrailEngine> engine;

    void SetUp() override {
        store = std::make_shared<MemoryStore>();
        seed_defaults(*store);
        monitor = std::make_shared<RecordingMonitor>();
        engine = std::make_unique<GuardrailEngine>(store, GuardrailConfig{}, monitor);
    }
};

// ===========================================================================
// Verdicts
// ===========================================================================

TEST_F(GuardrailEngineTest, BenignTextIsSafe) {
    auto result = engine->check("git commit -m 'fix parser'", TRUST_STANDARD);
    EXPECT_TRUE(result.safe);
    EXPECT_TRUE(result.violations.empty());
    EXPECT_FALSE(result.used_baseline);
}

TEST_F(GuardrailEngineTest, ForcePushBlockedBelowThreshold) {
    auto result = engine->check("git push origin main --force", TRUST_STANDARD, {}, "alice");
    EXPECT_FALSE(result.safe);
    ASSERT_EQ(result.violations.size(), 1u);
    EXPECT_EQ(result.violations[0].pattern_name, "git_force_push");
    EXPECT_TRUE(result.violations[0].blocked);
    EXPECT_EQ(result.violations[0].agent_id, "alice");
    EXPECT_EQ(monitor->count(EventType::GuardrailViolationDetected), 1u);
}

TEST_F(GuardrailEngineTest, TrustAtThresholdBypasses) {
    auto result = engine->check("git push origin main --force", TRUST_ELEVATED);
    EXPECT_TRUE(result.safe);
    EXPECT_TRUE(result.violations.empty());
    ASSERT_EQ(result.bypassed.size(), 1u);
    EXPECT_TRUE(result.bypassed[0].bypassed);
    EXPECT_EQ(monitor->count(EventType::GuardrailBypassed), 1u);
}

TEST_F(GuardrailEngineTest, MatchingIsCaseInsensitive) {
    auto result = engine->check("drop table users;", TRUST_ELEVATED);
    EXPECT_FALSE(result.safe);
    EXPECT_TRUE(has_pattern(result.violations, "drop_table"));
}

TEST_F(GuardrailEngineTest, WarnSeverityDoesNotBlock) {
    auto result = engine->check("edit config", TRUST_RESTRICTED, {".env.local"});
    EXPECT_TRUE(result.safe);
    ASSERT_FALSE(result.violations.empty());
    EXPECT_TRUE(has_pattern(result.violations, "env_file_modify"));
    EXPECT_FALSE(result.violations[0].blocked);
}

TEST_F(GuardrailEngineTest, FilePathsAreScanned) {
    auto result = engine->check("update keys", TRUST_ELEVATED, {"src/main.cpp", "~/.ssh/id_rsa"});
    EXPECT_FALSE(result.safe);
    EXPECT_TRUE(has_pattern(result.violations, "ssh_key_modify"));
}

TEST_F(GuardrailEngineTest, AllMatchesAreReported) {
    auto result = engine->check("rm -rf build && git reset --hard && npm publish", TRUST_STANDARD);
    EXPECT_FALSE(result.safe);
    EXPECT_TRUE(has_pattern(result.violations, "rm_rf"));
    EXPECT_TRUE(has_pattern(result.violations, "git_reset_hard"));
    EXPECT_TRUE(has_pattern(result.violations, "npm_publish"));
}

TEST_F(GuardrailEngineTest, ViolationsAreRecordedWithTruncatedText) {
    std::string text = "DROP TABLE audit; " + std::string(1000, 'x');
    engine->check(text, TRUST_STANDARD, {}, "mallory");

    auto recorded = store->list_violations(std::string("mallory"), 10);
    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_EQ(recorded[0].operation_text.size(), GuardrailEngine::MAX_OPERATION_TEXT);
    EXPECT_EQ(recorded[0].matched_text, "DROP TABLE");
}

TEST_F(GuardrailEngineTest, TruncationKeepsUtf8SequencesWhole) {
    // 17-byte prefix, then two-byte characters: byte 500 falls mid-character
    std::string text = "DROP TABLE audit;";
    for (int i = 0; i < 600; ++i) {
        text += "\xC3\xA9";
    }
    engine->check(text, TRUST_STANDARD, {}, "mallory");

    auto recorded = store->list_violations(std::string("mallory"), 10);
    ASSERT_EQ(recorded.size(), 1u);
    const auto& stored = recorded[0].operation_text;
    EXPECT_EQ(stored.size(), GuardrailEngine::MAX_OPERATION_TEXT - 1);
    EXPECT_EQ(stored.compare(0, 17, "DROP TABLE audit;"), 0);
    EXPECT_EQ(stored.substr(stored.size() - 2), "\xC3\xA9");
}

TEST_F(GuardrailEngineTest, VerdictIsDeterministic) {
    auto a = engine->check("terraform apply -auto-approve", TRUST_STANDARD);
    auto b = engine->check("terraform apply -auto-approve", TRUST_STANDARD);
    EXPECT_EQ(a.safe, b.safe);
    ASSERT_EQ(a.violations.size(), b.violations.size());
    EXPECT_EQ(a.violations[0].pattern_name, b.violations[0].pattern_name);
}

// ===========================================================================
// Registry and fallback
// ===========================================================================

TEST_F(GuardrailEngineTest, StoreFailureFallsBackToBaseline) {
    auto broken = std::make_shared<UnreadableStore>();
    GuardrailEngine fallback(broken, GuardrailConfig{}, monitor);

    auto result = fallback.check("git reset --hard HEAD~3", TRUST_STANDARD);
    EXPECT_TRUE(result.used_baseline);
    EXPECT_FALSE(result.safe);
    EXPECT_EQ(monitor->count(EventType::GuardrailFallbackActivated), 1u);
    // The violation record could not be written, the verdict stands
    EXPECT_EQ(monitor->count(EventType::AuditWriteFailed), 1u);
}

TEST_F(GuardrailEngineTest, FallbackDisabledPropagatesStoreError) {
    GuardrailConfig cfg;
    cfg.fallback_to_baseline = false;
    GuardrailEngine strict(std::make_shared<UnreadableStore>(), cfg);
    EXPECT_THROW(strict.check("ls", TRUST_STANDARD), StoreException);
}

TEST_F(GuardrailEngineTest, EmptyRegistryUsesBaseline) {
    GuardrailEngine fresh(std::make_shared<MemoryStore>());
    EXPECT_EQ(fresh.active_patterns().size(), baseline_guardrail_patterns().size());
    EXPECT_TRUE(fresh.check("ls", TRUST_STANDARD).used_baseline);
}

TEST_F(GuardrailEngineTest, CustomPatternAfterInvalidate) {
    ASSERT_EQ(engine->active_patterns().size(), 15u);  // warms the cache

    GuardrailPattern p;
    p.name = "prod_db";
    p.category = "database";
    p.regex = R"(psql\s+.*prod)";
    p.severity = Severity::Block;
    p.min_trust_to_bypass = TRUST_ADMIN;
    store->upsert_guardrail_pattern(p);

    // Cached set does not see the new pattern yet
    EXPECT_TRUE(engine->check("psql -h prod-db", TRUST_ELEVATED).safe);

    engine->invalidate_cache();
    auto result = engine->check("psql -h prod-db", TRUST_ELEVATED);
    EXPECT_FALSE(result.safe);
    EXPECT_TRUE(has_pattern(result.violations, "prod_db"));
}

TEST_F(GuardrailEngineTest, InvalidRegexIsSkipped) {
    GuardrailPattern bad;
    bad.name = "broken";
    bad.category = "test";
    bad.regex = "([unclosed";
    store->upsert_guardrail_pattern(bad);
    engine->invalidate_cache();

    EXPECT_EQ(engine->active_patterns().size(), 15u);
    EXPECT_EQ(monitor->count(EventType::GuardrailPatternInvalid), 1u);
    EXPECT_FALSE(engine->check("git clean -fd", TRUST_STANDARD).safe);
}
