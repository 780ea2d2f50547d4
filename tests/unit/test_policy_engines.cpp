#include <gtest/gtest.h>
#include <agentcoord/agentcoord.hpp>

#include "../test_helpers.hpp"

using namespace agentcoord;
using namespace agentcoord::testing;

namespace {

class UnreadablePolicyStore : public MemoryStore {
public:
    std::vector<PolicyDocument> load_policy_documents() const override {
        throw StoreException("policy table unreachable");
    }
};

PolicyRequest make_request(const std::string& agent, const std::string& action,
                           std::optional<TrustLevel> trust = std::nullopt,
                           const std::string& resource = "",
                           const std::string& agent_type = "custom_bot") {
    PolicyRequest request;
    request.principal.agent_id = agent;
    request.principal.agent_type = agent_type;
    request.action = action;
    request.resource = resource;
    request.context.trust_level = trust;
    return request;
}

} // anonymous namespace

// ===========================================================================
// Fixture: both engines over the same seeded store
// ===========================================================================

class PolicyEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryStore> store;
    std::shared_ptr<RecordingMonitor> monitor;
    std::shared_ptr<ProfileService> profiles;
    std::shared_ptr<NetworkPolicyEvaluator> network;
    std::shared_ptr<NativePolicyEngine> native;
    std::shared_ptr<DeclarativePolicyEngine> declarative;

    void SetUp() override {
        store = std::make_shared<MemoryStore>();
        seed_defaults(*store);
        monitor = std::make_shared<RecordingMonitor>();
        profiles = std::make_shared<ProfileService>(store);
        network = std::make_shared<NetworkPolicyEvaluator>(store);
        native = std::make_shared<NativePolicyEngine>(profiles, network);
        declarative = std::make_shared<DeclarativePolicyEngine>(store, profiles, PolicyConfig{}, monitor);
    }

    void add_document(const std::string& name, const std::string& text, int priority) {
        PolicyDocument d;
        d.name = name;
        d.text = text;
        d.priority = priority;
        store->upsert_policy_document(d);
        declarative->invalidate_cache();
    }
};

// ===========================================================================
// Equivalence of the default rule set
// ===========================================================================

TEST_F(PolicyEngineTest, EnginesAgreeAcrossTrustAndActionMatrix) {
    const std::vector<std::string> actions = {
        "check_locks", "get_work", "query_audit", "heartbeat",
        "acquire_lock", "submit_work", "check_guardrails", "complete_work",
        "force_push", "cleanup_agents", "purge_audit",
        "launch_missiles", "get_my_profile",
    };

    for (TrustLevel trust = TRUST_SUSPENDED; trust <= TRUST_ADMIN; ++trust) {
        for (const auto& action : actions) {
            auto request = make_request("agent-1", action, trust);
            auto a = native->evaluate(request);
            auto b = declarative->evaluate(request);
            EXPECT_EQ(a.allowed, b.allowed)
                << "action=" << action << " trust=" << trust
                << " native=" << a.reason << " declarative=" << b.reason;
        }
    }
}

TEST_F(PolicyEngineTest, ExpectedOutcomesOfDefaultRules) {
    for (auto* engine : {static_cast<PolicyEngine*>(native.get()),
                         static_cast<PolicyEngine*>(declarative.get())}) {
        SCOPED_TRACE(engine->name());
        EXPECT_FALSE(engine->evaluate(make_request("a", "check_locks", TRUST_SUSPENDED)).allowed);
        EXPECT_TRUE(engine->evaluate(make_request("a", "check_locks", TRUST_RESTRICTED)).allowed);
        EXPECT_FALSE(engine->evaluate(make_request("a", "acquire_lock", TRUST_RESTRICTED)).allowed);
        EXPECT_TRUE(engine->evaluate(make_request("a", "acquire_lock", TRUST_STANDARD)).allowed);
        EXPECT_FALSE(engine->evaluate(make_request("a", "purge_audit", TRUST_STANDARD)).allowed);
        EXPECT_TRUE(engine->evaluate(make_request("a", "purge_audit", TRUST_ELEVATED)).allowed);
        EXPECT_FALSE(engine->evaluate(make_request("a", "launch_missiles", TRUST_ADMIN)).allowed);
    }
}

TEST_F(PolicyEngineTest, EnginesAgreeOnNetworkAccess) {
    const std::vector<std::string> domains = {
        "github.com", "api.github.com", "raw.githubusercontent.com",
        "registry.npmjs.org", "pypi.org", "evil.example.com", "gist.github.com",
    };

    for (const auto& domain : domains) {
        auto request = make_request("agent-1", NETWORK_ACCESS_ACTION, TRUST_RESTRICTED, domain);
        auto a = native->evaluate(request);
        auto b = declarative->evaluate(request);
        EXPECT_EQ(a.allowed, b.allowed) << domain;
    }

    EXPECT_TRUE(native->evaluate(make_request("a", NETWORK_ACCESS_ACTION, TRUST_STANDARD,
                                              "pypi.org")).allowed);
    EXPECT_FALSE(declarative->evaluate(make_request("a", NETWORK_ACCESS_ACTION, TRUST_STANDARD,
                                                    "evil.example.com")).allowed);
}

TEST_F(PolicyEngineTest, DefaultTrustAppliesWithoutOverride) {
    // No profile for this type: configured default trust (standard)
    auto write = make_request("bot", "submit_work");
    auto admin = make_request("bot", "cleanup_agents");

    EXPECT_TRUE(native->evaluate(write).allowed);
    EXPECT_TRUE(declarative->evaluate(write).allowed);
    EXPECT_FALSE(native->evaluate(admin).allowed);
    EXPECT_FALSE(declarative->evaluate(admin).allowed);
}

// ===========================================================================
// Native engine specifics
// ===========================================================================

TEST_F(PolicyEngineTest, NativeRequiresCollaborators) {
    EXPECT_THROW(NativePolicyEngine(nullptr, network), InvalidRequestException);
    EXPECT_THROW(NativePolicyEngine(profiles, nullptr), InvalidRequestException);
}

TEST_F(PolicyEngineTest, NativeReportsReasons) {
    auto suspended = native->evaluate(make_request("a", "check_locks", TRUST_SUSPENDED));
    EXPECT_EQ(suspended.reason, "agent_suspended: trust_level=0");
    EXPECT_EQ(suspended.engine, "native");

    auto write = native->evaluate(make_request("a", "acquire_lock", TRUST_RESTRICTED));
    EXPECT_EQ(write.reason, "write_denied: trust_level=1 < 2");

    auto unknown = native->evaluate(make_request("a", "launch_missiles", TRUST_ADMIN));
    EXPECT_EQ(unknown.reason, "unknown_action: launch_missiles");
}

TEST_F(PolicyEngineTest, NativeHonorsProfileBlockedOps) {
    AgentProfile p;
    p.name = "no-handoffs";
    p.agent_type = "sandbox";
    p.trust_level = TRUST_ELEVATED;
    p.blocked_ops = {"write_handoff"};
    store->upsert_profile(p);

    auto decision = native->evaluate(make_request("s", "write_handoff", std::nullopt, "", "sandbox"));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "operation_blocked: write_handoff");
}

TEST_F(PolicyEngineTest, NativeEnforcesFileLimit) {
    store->assign_profile("impl", "claude-code-web-implementer");
    auto request = make_request("impl", "complete_work", std::nullopt, "", "claude_code");
    request.context.files_modified = 80;

    auto decision = native->evaluate(request);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "resource_limit_exceeded: max_file_modifications=50");
}

TEST_F(PolicyEngineTest, NativeUnknownActionFromProfileAllowlist) {
    auto request = make_request("cli", "get_my_profile", std::nullopt, "", "claude_code");
    auto decision = native->evaluate(request);
    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(decision.matched_policy, std::string("claude-code-cli"));
}

// ===========================================================================
// Declarative engine specifics
// ===========================================================================

TEST_F(PolicyEngineTest, DeclarativeNamesMatchedDocument) {
    auto decision = declarative->evaluate(make_request("a", "acquire_lock", TRUST_STANDARD));
    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(decision.reason, "policy_permit");
    EXPECT_EQ(decision.matched_policy, std::string("write-operations"));
    EXPECT_EQ(decision.engine, "declarative");

    auto denied = declarative->evaluate(make_request("a", "launch_missiles", TRUST_ADMIN));
    EXPECT_EQ(denied.reason, "no_matching_permit");
    EXPECT_FALSE(denied.matched_policy.has_value());
}

TEST_F(PolicyEngineTest, ForbidWinsRegardlessOfOrder) {
    add_document("quarantine", "forbid(principal == Agent::\"mallory\", action, resource);", 500);

    auto decision = declarative->evaluate(make_request("mallory", "check_locks", TRUST_ADMIN));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, "policy_forbid");
    EXPECT_EQ(decision.matched_policy, std::string("quarantine"));

    EXPECT_TRUE(declarative->evaluate(make_request("alice", "check_locks", TRUST_ADMIN)).allowed);
}

TEST_F(PolicyEngineTest, CustomPermitExtendsDefaults) {
    EXPECT_FALSE(declarative->evaluate(make_request("a", "deploy", TRUST_ADMIN)).allowed);

    add_document("deployers", "permit(principal, action == Action::\"deploy\", resource) "
                              "when { principal.trust_level >= 4 };", 60);

    EXPECT_TRUE(declarative->evaluate(make_request("a", "deploy", TRUST_ADMIN)).allowed);
    EXPECT_FALSE(declarative->evaluate(make_request("a", "deploy", TRUST_ELEVATED)).allowed);
}

TEST_F(PolicyEngineTest, RulesAreCachedUntilInvalidated) {
    auto before = declarative->rule_count();

    PolicyDocument d;
    d.name = "extra";
    d.text = "permit(principal, action == Action::\"deploy\", resource);";
    store->upsert_policy_document(d);
    EXPECT_EQ(declarative->rule_count(), before);

    declarative->invalidate_cache();
    EXPECT_EQ(declarative->rule_count(), before + 1);
}

TEST_F(PolicyEngineTest, InvalidDocumentIsSkipped) {
    auto before = declarative->rule_count();
    add_document("broken", "permit(principal, action, resource", 5);

    EXPECT_EQ(declarative->rule_count(), before);
    EXPECT_EQ(monitor->count(EventType::PolicyDocumentInvalid), 1u);
    EXPECT_TRUE(declarative->evaluate(make_request("a", "check_locks", TRUST_STANDARD)).allowed);
}

TEST_F(PolicyEngineTest, DisabledDocumentIsIgnored) {
    PolicyDocument d;
    d.name = "lockdown";
    d.text = "forbid(principal, action, resource);";
    d.enabled = false;
    store->upsert_policy_document(d);
    declarative->invalidate_cache();

    EXPECT_TRUE(declarative->evaluate(make_request("a", "check_locks", TRUST_STANDARD)).allowed);
}

TEST_F(PolicyEngineTest, EmptyStoreFallsBackToEmbeddedDocuments) {
    auto empty = std::make_shared<MemoryStore>();
    DeclarativePolicyEngine engine(empty, std::make_shared<ProfileService>(empty),
                                   PolicyConfig{}, monitor);

    EXPECT_TRUE(engine.evaluate(make_request("a", "acquire_lock", TRUST_STANDARD)).allowed);
    EXPECT_FALSE(engine.evaluate(make_request("a", "purge_audit", TRUST_STANDARD)).allowed);
    EXPECT_EQ(monitor->count(EventType::PolicyFallbackActivated), 1u);
}

TEST_F(PolicyEngineTest, UnreadableStoreFallsBackOrThrows) {
    auto broken = std::make_shared<UnreadablePolicyStore>();
    auto broken_profiles = std::make_shared<ProfileService>(broken);

    DeclarativePolicyEngine lenient(broken, broken_profiles, PolicyConfig{}, monitor);
    EXPECT_TRUE(lenient.evaluate(make_request("a", "check_locks", TRUST_STANDARD)).allowed);
    EXPECT_EQ(monitor->count(EventType::PolicyFallbackActivated), 1u);

    PolicyConfig cfg;
    cfg.fallback_to_defaults = false;
    DeclarativePolicyEngine strict(broken, broken_profiles, cfg);
    EXPECT_THROW(strict.evaluate(make_request("a", "check_locks", TRUST_STANDARD)), StoreException);
}

// ===========================================================================
// Factory
// ===========================================================================

TEST_F(PolicyEngineTest, FactorySelectsEngine) {
    PolicyConfig cfg;
    EXPECT_EQ(make_policy_engine(cfg, store, profiles, network)->name(), "native");

    cfg.engine = PolicyEngineKind::Declarative;
    EXPECT_EQ(make_policy_engine(cfg, store, profiles, network)->name(), "declarative");
}
