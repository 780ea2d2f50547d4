#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentcoord {

// Identifiers are opaque strings asserted by the caller
using AgentId = std::string;
using SessionId = std::string;
using TaskId = std::string;
using ResourceKey = std::string;

// Wall-clock time: timestamps are persisted and compared across processes
using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Current time truncated to the microsecond precision every store keeps
inline Timestamp current_time() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

// Task priority (lower value = claimed first)
using TaskPriority = std::int32_t;

constexpr TaskPriority PRIORITY_HIGHEST = 1;
constexpr TaskPriority PRIORITY_DEFAULT = 5;
constexpr TaskPriority PRIORITY_LOWEST  = 10;

// Agent trust level (0 = suspended, 4 = fully trusted)
using TrustLevel = std::int32_t;

constexpr TrustLevel TRUST_SUSPENDED  = 0;
constexpr TrustLevel TRUST_RESTRICTED = 1;
constexpr TrustLevel TRUST_STANDARD   = 2;
constexpr TrustLevel TRUST_ELEVATED   = 3;
constexpr TrustLevel TRUST_ADMIN      = 4;

// Task lifecycle
enum class TaskStatus {
    Pending,
    Claimed,
    Completed,
    Failed,
    Cancelled
};

// Agent session liveness
enum class SessionStatus {
    Active,
    Idle,
    Disconnected
};

// Guardrail pattern severity
enum class Severity {
    Block,
    Warn,
    Log
};

enum class NetworkAction {
    Allow,
    Deny
};

// Outcome of a lock acquisition
enum class LockOutcome {
    Granted,
    Refreshed,
    Denied
};

// Machine-readable reason carried by every operation result
enum class ReasonCode {
    Ok,
    InvalidRequest,
    InvalidPriority,
    InvalidTtl,
    UnknownDependency,
    LockedByOther,
    LockNotFoundOrNotOwner,
    NoTasksAvailable,
    TaskNotFound,
    TaskNotClaimedByAgent,
    TaskAlreadyTerminal,
    TaskNotFailed,
    GuardrailViolation,
    SessionNotFound,
    PolicyDenied,
    StoreUnavailable
};

// ==================== Records ====================

struct Lock {
    ResourceKey resource_key;
    AgentId     holder_id;
    std::string holder_type;
    SessionId   session_id;
    Timestamp   acquired_at{};
    Timestamp   expires_at{};
    std::string reason;
    std::string metadata;  // opaque, stored verbatim

    bool is_live(Timestamp now) const noexcept { return expires_at > now; }
};

struct Task {
    TaskId       id;
    std::string  type;
    std::string  description;
    std::string  input;    // opaque payload, stored byte-for-byte
    TaskPriority priority{PRIORITY_DEFAULT};
    std::vector<TaskId> dependency_ids;
    TaskStatus   status{TaskStatus::Pending};
    std::optional<AgentId>   claimant;
    std::optional<Timestamp> claimed_at;
    std::int32_t attempt_count{0};
    std::int32_t max_attempts{3};
    std::optional<std::string> result;
    std::optional<std::string> error;
    std::optional<Timestamp> deadline;
    Timestamp    created_at{};
    std::optional<Timestamp> completed_at;
};

struct AgentSession {
    SessionId     id;
    AgentId       agent_id;
    std::string   agent_type;
    std::vector<std::string> capabilities;
    SessionStatus status{SessionStatus::Active};
    Timestamp     started_at{};
    Timestamp     last_heartbeat{};
    std::optional<std::string> current_task;
};

struct GuardrailPattern {
    std::string name;
    std::string category;
    std::string regex;
    Severity    severity{Severity::Block};
    TrustLevel  min_trust_to_bypass{TRUST_ELEVATED};
    std::string description;
    bool        enabled{true};
};

struct GuardrailViolation {
    AgentId     agent_id;
    std::string pattern_name;
    std::string category;
    Severity    severity{Severity::Block};
    std::string operation_text;  // first 500 characters
    std::string matched_text;    // first 200 characters
    bool        blocked{false};
    bool        bypassed{false};  // matched, but the trust level was high enough
    TrustLevel  trust_level{TRUST_STANDARD};
    Timestamp   created_at{};
};

struct ResourceLimits {
    std::int64_t max_file_modifications{50};
    std::int64_t max_execution_time_seconds{300};
    std::int64_t max_api_calls_per_hour{1000};
};

struct NetworkAccessPolicy {
    std::string   domain_pattern;  // '*' matches any run of characters
    NetworkAction action{NetworkAction::Allow};
    std::int32_t  priority{100};   // lower value wins
    std::optional<std::string> profile_name;  // unset = global
    std::string   description;
    bool          enabled{true};
};

struct AgentProfile {
    std::string name;
    std::string agent_type;
    TrustLevel  trust_level{TRUST_STANDARD};
    std::vector<std::string> allowed_ops;  // empty = no allowlist
    std::vector<std::string> blocked_ops;
    ResourceLimits resource_limits;
    std::vector<NetworkAccessPolicy> network_overrides;
    std::string description;
    bool        enabled{true};
};

// Declarative rule text plus its ordering metadata
struct PolicyDocument {
    std::string  name;
    std::string  text;
    std::int32_t priority{100};  // lower value = evaluated first
    std::string  description;
    bool         enabled{true};
};

struct PolicyDecision {
    bool allowed{false};
    std::string reason;
    std::optional<std::string> matched_policy;
    std::string engine;
};

using AuditFields = std::map<std::string, std::string>;

struct AuditEntry {
    std::string id;
    AgentId     agent_id;
    std::string agent_type;
    std::string operation;
    AuditFields parameters;
    AuditFields result;
    Duration    duration{};
    bool        success{true};
    std::optional<std::string> error_message;
    Timestamp   created_at{};
};

// Snapshot of shared coordination state for monitoring
struct CoordinationSnapshot {
    Timestamp   timestamp{};
    std::size_t live_locks{0};
    std::size_t pending_tasks{0};
    std::size_t claimed_tasks{0};
    std::size_t active_sessions{0};
    std::size_t audit_queue_depth{0};
};

// ==================== String conversions ====================
// Lower-case tokens are the persisted and wire representation.

inline const char* to_string(TaskStatus s) {
    switch (s) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Claimed:   return "claimed";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

inline const char* to_string(SessionStatus s) {
    switch (s) {
        case SessionStatus::Active:       return "active";
        case SessionStatus::Idle:         return "idle";
        case SessionStatus::Disconnected: return "disconnected";
    }
    return "unknown";
}

inline const char* to_string(Severity s) {
    switch (s) {
        case Severity::Block: return "block";
        case Severity::Warn:  return "warn";
        case Severity::Log:   return "log";
    }
    return "unknown";
}

inline const char* to_string(NetworkAction a) {
    switch (a) {
        case NetworkAction::Allow: return "allow";
        case NetworkAction::Deny:  return "deny";
    }
    return "unknown";
}

inline const char* to_string(LockOutcome o) {
    switch (o) {
        case LockOutcome::Granted:   return "granted";
        case LockOutcome::Refreshed: return "refreshed";
        case LockOutcome::Denied:    return "denied";
    }
    return "unknown";
}

inline const char* to_string(ReasonCode r) {
    switch (r) {
        case ReasonCode::Ok:                     return "ok";
        case ReasonCode::InvalidRequest:         return "invalid_request";
        case ReasonCode::InvalidPriority:        return "invalid_priority";
        case ReasonCode::InvalidTtl:             return "invalid_ttl";
        case ReasonCode::UnknownDependency:      return "unknown_dependency";
        case ReasonCode::LockedByOther:          return "locked_by_other";
        case ReasonCode::LockNotFoundOrNotOwner: return "lock_not_found_or_not_owner";
        case ReasonCode::NoTasksAvailable:       return "no_tasks_available";
        case ReasonCode::TaskNotFound:           return "task_not_found";
        case ReasonCode::TaskNotClaimedByAgent:  return "task_not_claimed_by_agent";
        case ReasonCode::TaskAlreadyTerminal:    return "task_already_terminal";
        case ReasonCode::TaskNotFailed:          return "task_not_failed";
        case ReasonCode::GuardrailViolation:     return "guardrail_violation";
        case ReasonCode::SessionNotFound:        return "session_not_found";
        case ReasonCode::PolicyDenied:           return "policy_denied";
        case ReasonCode::StoreUnavailable:       return "store_unavailable";
    }
    return "unknown";
}

inline std::optional<TaskStatus> parse_task_status(std::string_view s) {
    if (s == "pending")   return TaskStatus::Pending;
    if (s == "claimed")   return TaskStatus::Claimed;
    if (s == "completed") return TaskStatus::Completed;
    if (s == "failed")    return TaskStatus::Failed;
    if (s == "cancelled") return TaskStatus::Cancelled;
    return std::nullopt;
}

inline std::optional<SessionStatus> parse_session_status(std::string_view s) {
    if (s == "active")       return SessionStatus::Active;
    if (s == "idle")         return SessionStatus::Idle;
    if (s == "disconnected") return SessionStatus::Disconnected;
    return std::nullopt;
}

inline std::optional<Severity> parse_severity(std::string_view s) {
    if (s == "block") return Severity::Block;
    if (s == "warn")  return Severity::Warn;
    if (s == "log")   return Severity::Log;
    return std::nullopt;
}

inline std::optional<NetworkAction> parse_network_action(std::string_view s) {
    if (s == "allow") return NetworkAction::Allow;
    if (s == "deny")  return NetworkAction::Deny;
    return std::nullopt;
}

inline bool is_terminal(TaskStatus s) noexcept {
    return s == TaskStatus::Completed || s == TaskStatus::Failed ||
           s == TaskStatus::Cancelled;
}

} // namespace agentcoord
