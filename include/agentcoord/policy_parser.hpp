#pragma once

#include "agentcoord/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace agentcoord {

// ==================== Declarative rule language ====================
//
//   permit(principal, action in [Action::"a", Action::"b"], resource)
//   when { principal.trust_level >= 2 };
//   forbid(principal, action, resource) when { principal.trust_level == 0 };
//   permit(principal, action == Action::"network_access", resource == Domain::"github.com");
//
// A bare scope variable matches anything. `//` starts a comment.

enum class PolicyEffect {
    Permit,
    Forbid
};

enum class Comparison {
    Equal,
    NotEqual,
    GreaterEqual,
    Greater,
    LessEqual,
    Less
};

struct TrustCondition {
    Comparison op{Comparison::Equal};
    TrustLevel value{0};

    bool holds(TrustLevel trust) const noexcept;
};

// Type::"id"
struct EntityRef {
    std::string type;
    std::string id;
};

struct PolicyRule {
    std::string policy_name;
    PolicyEffect effect{PolicyEffect::Permit};
    std::optional<EntityRef> principal;  // unset = any principal
    std::vector<std::string> actions;    // empty = any action
    std::optional<EntityRef> resource;   // unset = any resource
    std::vector<TrustCondition> conditions;

    bool matches(const AgentId& agent_id, const std::string& action,
                 const std::string& resource_id, TrustLevel trust) const;
};

// Parse every rule in `text`. Throws PolicyParseException with the byte
// offset of the first error.
std::vector<PolicyRule> parse_policy(const std::string& policy_name, const std::string& text);

const char* to_string(PolicyEffect effect);
const char* to_string(Comparison op);

} // namespace agentcoord
