#pragma once

#include "agentcoord/types.hpp"
#include "agentcoord/config.hpp"
#include "agentcoord/monitor.hpp"
#include "agentcoord/network_policy.hpp"
#include "agentcoord/policy_parser.hpp"
#include "agentcoord/profile_service.hpp"
#include "agentcoord/store.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentcoord {

struct Principal {
    AgentId agent_id;
    std::string agent_type = "unknown";
};

struct PolicyContext {
    // Overrides the profile's trust level when set
    std::optional<TrustLevel> trust_level;
    std::optional<std::int64_t> files_modified;
    std::map<std::string, std::string> attributes;
};

struct PolicyRequest {
    Principal principal;
    std::string action;
    std::string resource;
    PolicyContext context;
};

// Abstract authorization backend. Implementations must agree on the
// default rule set.
class PolicyEngine {
public:
    virtual ~PolicyEngine() = default;

    virtual PolicyDecision evaluate(const PolicyRequest& request) = 0;

    virtual std::string name() const = 0;
};

// Attribute checks against the agent profile and trust level
class NativePolicyEngine : public PolicyEngine {
public:
    NativePolicyEngine(std::shared_ptr<ProfileService> profiles,
                       std::shared_ptr<NetworkPolicyEvaluator> network);

    PolicyDecision evaluate(const PolicyRequest& request) override;
    std::string name() const override { return "native"; }

private:
    std::shared_ptr<ProfileService> profiles_;
    std::shared_ptr<NetworkPolicyEvaluator> network_;
};

// Rule documents from the store, evaluated with default-deny semantics.
// Any matching forbid wins; otherwise the first matching permit in
// document priority order.
class DeclarativePolicyEngine : public PolicyEngine {
public:
    DeclarativePolicyEngine(std::shared_ptr<CoordinationStore> store,
                            std::shared_ptr<ProfileService> profiles,
                            PolicyConfig config = {},
                            std::shared_ptr<Monitor> monitor = nullptr);

    PolicyDecision evaluate(const PolicyRequest& request) override;
    std::string name() const override { return "declarative"; }

    void set_monitor(std::shared_ptr<Monitor> monitor);
    void invalidate_cache();

    // Rules currently in effect, loading them if the cache is cold
    std::size_t rule_count();

private:
    std::shared_ptr<CoordinationStore> store_;
    std::shared_ptr<ProfileService> profiles_;
    PolicyConfig config_;

    std::mutex mutex_;
    std::shared_ptr<const std::vector<PolicyRule>> rules_;
    Timestamp rules_expire_{};
    std::shared_ptr<Monitor> monitor_;

    std::shared_ptr<const std::vector<PolicyRule>> rules();
    void emit_event(EventType type, const std::string& message,
                    std::optional<std::string> resource = std::nullopt);
};

// Trust from the request context, else the profile, else the configured default
TrustLevel resolve_trust(const PolicyRequest& request, ProfileService& profiles);

std::shared_ptr<PolicyEngine> make_policy_engine(const PolicyConfig& config,
                                                 std::shared_ptr<CoordinationStore> store,
                                                 std::shared_ptr<ProfileService> profiles,
                                                 std::shared_ptr<NetworkPolicyEvaluator> network,
                                                 std::shared_ptr<Monitor> monitor = nullptr);

} // namespace agentcoord
