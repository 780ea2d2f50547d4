#pragma once

#include "agentcoord/types.hpp"
#include "agentcoord/store.hpp"

#include <string>
#include <vector>

namespace agentcoord {

// ==================== Action vocabulary ====================

// How the native policy engine treats an action name
enum class ActionClass {
    Read,
    Write,
    Admin,
    Network,
    Unknown
};

inline const char* to_string(ActionClass c) {
    switch (c) {
        case ActionClass::Read:    return "read";
        case ActionClass::Write:   return "write";
        case ActionClass::Admin:   return "admin";
        case ActionClass::Network: return "network";
        case ActionClass::Unknown: return "unknown";
    }
    return "unknown";
}

constexpr const char* NETWORK_ACCESS_ACTION = "network_access";

const std::vector<std::string>& read_actions();
const std::vector<std::string>& write_actions();
const std::vector<std::string>& admin_actions();

ActionClass classify_action(const std::string& action);

// Minimum trust for write and admin actions
constexpr TrustLevel WRITE_MIN_TRUST = TRUST_STANDARD;
constexpr TrustLevel ADMIN_MIN_TRUST = TRUST_ELEVATED;

// ==================== Embedded registries ====================

// Destructive-operation patterns used when the store cannot be read
std::vector<GuardrailPattern> baseline_guardrail_patterns();

std::vector<AgentProfile> default_profiles();

// Global allow list for outbound network access
std::vector<NetworkAccessPolicy> default_network_policies();

// Declarative documents equivalent to the native engine's built-in rules
std::vector<PolicyDocument> default_policy_documents();

// Install every embedded registry into `store`. Existing rows with the same
// names are overwritten.
void seed_defaults(CoordinationStore& store);

} // namespace agentcoord
