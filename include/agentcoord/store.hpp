#pragma once

#include "agentcoord/types.hpp"
#include "agentcoord/config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentcoord {

// ==================== Filters ====================

struct LockFilter {
    std::vector<ResourceKey> keys;   // empty = all keys
    std::optional<AgentId> holder;
};

struct TaskFilter {
    std::optional<TaskStatus> status;
    std::optional<AgentId> claimant;
    std::size_t limit{0};  // 0 = unlimited
};

struct SessionFilter {
    std::optional<std::string> capability;
    std::optional<SessionStatus> status;  // unset = everything but disconnected
    std::optional<AgentId> agent_id;
};

struct AuditFilter {
    std::optional<AgentId> agent_id;
    std::optional<std::string> operation;
    std::optional<Timestamp> since;
    std::optional<Timestamp> until;
    std::size_t limit{50};
};

// ==================== Primitive outcomes ====================

struct LockAcquireOutcome {
    LockOutcome outcome{LockOutcome::Denied};
    Lock lock;             // the held lock, or the conflicting one on denial
    std::size_t expired_purged{0};
};

struct ClaimRequest {
    AgentId claimant;
    std::vector<std::string> accepted_types;  // empty = any type
    Timestamp now{};
};

struct ClaimOutcome {
    std::optional<Task> task;
    std::vector<TaskId> deadline_expired;  // pending tasks failed by this claim
};

struct TaskCompletion {
    TaskId task_id;
    AgentId claimant;
    bool success{true};
    std::string result;
    std::string error;
    bool requeue_on_failure{false};
    Timestamp now{};
};

enum class CompletionOutcome {
    Completed,
    Failed,
    Requeued,
    NotFound,
    NotClaimant
};

struct CompletionRecord {
    CompletionOutcome outcome{CompletionOutcome::NotFound};
    std::optional<Task> task;  // state after the update
};

// One agent whose stale sessions were disconnected by a reap
struct ReapedAgent {
    AgentId agent_id;
    std::size_t locks_released{0};
};

enum class CancelOutcome {
    Cancelled,
    NotFound,
    AlreadyTerminal
};

enum class ReplaceOutcome {
    Replaced,
    NotFound,
    NotFailed
};

// Every mutating primitive is a single atomic step in the backing store.
// Implementations never expose read-then-write sequences to callers.
class CoordinationStore {
public:
    virtual ~CoordinationStore() = default;

    virtual std::string backend_name() const = 0;

    // ==================== Locks ====================

    // Purge expired locks, insert `candidate` if the key is free, refresh it
    // if the key is held by the same holder, otherwise report the holder.
    virtual LockAcquireOutcome acquire_lock(const Lock& candidate, Timestamp now) = 0;

    // Delete the lock iff `holder` owns it.
    virtual bool release_lock(const ResourceKey& key, const AgentId& holder) = 0;

    virtual std::size_t release_locks_held_by(const AgentId& holder) = 0;
    virtual std::size_t purge_expired_locks(Timestamp now) = 0;

    // Live locks, newest first
    virtual std::vector<Lock> list_live_locks(const LockFilter& filter, Timestamp now) const = 0;

    // ==================== Tasks ====================

    virtual void insert_task(const Task& task) = 0;

    // Ids from `ids` that do not name an existing task
    virtual std::vector<TaskId> missing_tasks(const std::vector<TaskId>& ids) const = 0;

    // Select and claim the best eligible pending task; concurrent callers
    // never receive the same task.
    virtual ClaimOutcome claim_task(const ClaimRequest& request) = 0;

    // Conditional on status=claimed and claimant matching.
    virtual CompletionRecord complete_task(const TaskCompletion& completion) = 0;

    virtual CancelOutcome cancel_task(const TaskId& id, Timestamp now) = 0;

    // Insert `replacement` for a failed or cancelled task and point pending
    // dependents at it.
    virtual ReplaceOutcome replace_task(const TaskId& old_id, const Task& replacement) = 0;

    virtual std::optional<Task> get_task(const TaskId& id) const = 0;

    // Claim order: priority, then creation time
    virtual std::vector<Task> list_tasks(const TaskFilter& filter) const = 0;

    // ==================== Sessions ====================

    virtual void upsert_session(const AgentSession& session) = 0;

    // Refresh last_heartbeat; returns the updated session, or nullopt if unknown.
    virtual std::optional<AgentSession> touch_session(
        const SessionId& id, Timestamp now,
        std::optional<SessionStatus> status,
        std::optional<std::string> current_task) = 0;

    virtual std::optional<AgentSession> get_session(const SessionId& id) const = 0;

    // Most recent heartbeat first
    virtual std::vector<AgentSession> list_sessions(const SessionFilter& filter) const = 0;

    // Mark active/idle sessions older than `cutoff` as disconnected and
    // release every lock held by their agents, in one atomic step. A
    // heartbeat is ordered entirely before or after the whole reap.
    // Returns the distinct agents affected, ordered by id.
    virtual std::vector<ReapedAgent> reap_stale_sessions(Timestamp cutoff) = 0;

    // ==================== Audit ====================

    // Append-only; there is no update or delete primitive.
    virtual void append_audit(const std::vector<AuditEntry>& entries) = 0;

    // Newest first
    virtual std::vector<AuditEntry> query_audit(const AuditFilter& filter) const = 0;

    // Retention sweep: the only removal path. Entries younger than
    // min_retention always survive; a later cutoff is clamped to
    // now - min_retention before anything is written or removed.
    virtual std::size_t purge_audit_before(Timestamp cutoff, Duration min_retention) = 0;

    // ==================== Registries ====================

    // Enabled patterns ordered by name
    virtual std::vector<GuardrailPattern> load_guardrail_patterns() const = 0;
    virtual void upsert_guardrail_pattern(const GuardrailPattern& pattern) = 0;
    virtual void record_violations(const std::vector<GuardrailViolation>& violations) = 0;
    virtual std::vector<GuardrailViolation> list_violations(
        const std::optional<AgentId>& agent_id, std::size_t limit) const = 0;

    // Explicit assignment first, then the earliest enabled profile for the type
    virtual std::optional<AgentProfile> find_profile(const AgentId& agent_id,
                                                     const std::string& agent_type) const = 0;
    virtual void upsert_profile(const AgentProfile& profile) = 0;
    virtual void assign_profile(const AgentId& agent_id, const std::string& profile_name) = 0;

    // Enabled policies, global and profile-specific
    virtual std::vector<NetworkAccessPolicy> load_network_policies() const = 0;
    virtual void upsert_network_policy(const NetworkAccessPolicy& policy) = 0;

    // Enabled documents ordered by priority
    virtual std::vector<PolicyDocument> load_policy_documents() const = 0;
    virtual void upsert_policy_document(const PolicyDocument& document) = 0;
};

// Creates the backend named by `config`
std::shared_ptr<CoordinationStore> make_store(const StoreConfig& config);

} // namespace agentcoord
