#pragma once

#include "agentcoord/types.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace agentcoord {

// Backing store selection
enum class StoreBackend {
    Memory,  // single process, nothing persisted
    Sqlite   // shared database file, safe across processes
};

struct StoreConfig {
    StoreBackend backend = StoreBackend::Memory;
    std::string database_path = "agentcoord.db";
    std::chrono::milliseconds busy_timeout{5000};
};

struct LockConfig {
    Duration default_ttl = std::chrono::minutes(120);
    Duration max_ttl = std::chrono::minutes(480);
};

// What happens when a claimant reports failure
enum class RetryPolicy {
    ExplicitResubmit,       // failure is terminal; orchestrator calls resubmit()
    RequeueUntilExhausted   // back to pending while attempt_count < max_attempts
};

struct QueueConfig {
    TaskPriority default_priority = PRIORITY_DEFAULT;
    std::int32_t default_max_attempts = 3;
    RetryPolicy retry_policy = RetryPolicy::ExplicitResubmit;
    std::size_t pending_listing_limit = 20;

    // Scan successful results with the guardrail engine before recording them
    bool guardrail_check_results = true;
};

struct GuardrailConfig {
    Duration cache_ttl = std::chrono::seconds(300);

    // Use the embedded baseline when the store cannot be read
    bool fallback_to_baseline = true;

    // Short cache so the store is retried soon after a fallback
    Duration fallback_cache_ttl = std::chrono::seconds(30);

    // Persist a violation record for every match, including bypassed ones
    bool record_violations = true;
};

struct ProfileConfig {
    TrustLevel default_trust_level = TRUST_STANDARD;
    bool enforce_resource_limits = true;
    Duration cache_ttl = std::chrono::seconds(300);
};

// Audit queue behaviour when full
enum class AuditBackpressure {
    DropNewest,  // caller never waits; the entry is counted as dropped
    Block        // caller waits for queue space
};

struct AuditConfig {
    bool async = true;
    std::size_t queue_capacity = 4096;
    AuditBackpressure backpressure = AuditBackpressure::DropNewest;
    std::size_t batch_size = 64;
    Duration flush_interval = std::chrono::milliseconds(50);
    std::int32_t retention_days = 90;
};

struct NetworkConfig {
    NetworkAction default_action = NetworkAction::Deny;
    Duration cache_ttl = std::chrono::seconds(300);
};

enum class PolicyEngineKind {
    Native,
    Declarative
};

struct PolicyConfig {
    PolicyEngineKind engine = PolicyEngineKind::Native;
    Duration cache_ttl = std::chrono::seconds(300);

    // Evaluate the embedded default documents when the store cannot be read
    bool fallback_to_defaults = true;

    // Gate every service operation through the policy engine
    bool gate_operations = true;

    // Write a policy_decision audit entry for every evaluation
    bool audit_decisions = true;
};

struct LivenessConfig {
    Duration stale_threshold = std::chrono::minutes(15);
    Duration reaper_interval = std::chrono::seconds(60);
    bool background_reaper = false;
};

struct Config {
    StoreConfig store;
    LockConfig locks;
    QueueConfig queue;
    GuardrailConfig guardrails;
    ProfileConfig profiles;
    AuditConfig audit;
    NetworkConfig network;
    PolicyConfig policy;
    LivenessConfig liveness;

    // Defaults overlaid with environment variables.
    // Throws ConfigurationException on a malformed value.
    static Config from_env();
};

// Identity of the calling agent process
struct AgentIdentity {
    AgentId agent_id;
    std::string agent_type = "unknown";
    SessionId session_id;

    // Reads AGENT_ID, AGENT_TYPE and SESSION_ID
    static AgentIdentity from_env();
};

inline const char* to_string(StoreBackend b) {
    switch (b) {
        case StoreBackend::Memory: return "memory";
        case StoreBackend::Sqlite: return "sqlite";
    }
    return "unknown";
}

inline const char* to_string(RetryPolicy p) {
    switch (p) {
        case RetryPolicy::ExplicitResubmit:      return "ExplicitResubmit";
        case RetryPolicy::RequeueUntilExhausted: return "RequeueUntilExhausted";
    }
    return "Unknown";
}

inline const char* to_string(PolicyEngineKind k) {
    switch (k) {
        case PolicyEngineKind::Native:      return "native";
        case PolicyEngineKind::Declarative: return "declarative";
    }
    return "unknown";
}

} // namespace agentcoord
