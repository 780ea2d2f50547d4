#pragma once

#include "agentcoord/store.hpp"

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace agentcoord {

// In-process store. A single mutex makes every primitive atomic, which
// is sufficient when all agents share one address space (tests, embedding).
class MemoryStore : public CoordinationStore {
public:
    MemoryStore();

    // Non-copyable
    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::string backend_name() const override { return "memory"; }

    // ==================== Locks ====================
    LockAcquireOutcome acquire_lock(const Lock& candidate, Timestamp now) override;
    bool release_lock(const ResourceKey& key, const AgentId& holder) override;
    std::size_t release_locks_held_by(const AgentId& holder) override;
    std::size_t purge_expired_locks(Timestamp now) override;
    std::vector<Lock> list_live_locks(const LockFilter& filter, Timestamp now) const override;

    // ==================== Tasks ====================
    void insert_task(const Task& task) override;
    std::vector<TaskId> missing_tasks(const std::vector<TaskId>& ids) const override;
    ClaimOutcome claim_task(const ClaimRequest& request) override;
    CompletionRecord complete_task(const TaskCompletion& completion) override;
    CancelOutcome cancel_task(const TaskId& id, Timestamp now) override;
    ReplaceOutcome replace_task(const TaskId& old_id, const Task& replacement) override;
    std::optional<Task> get_task(const TaskId& id) const override;
    std::vector<Task> list_tasks(const TaskFilter& filter) const override;

    // ==================== Sessions ====================
    void upsert_session(const AgentSession& session) override;
    std::optional<AgentSession> touch_session(
        const SessionId& id, Timestamp now,
        std::optional<SessionStatus> status,
        std::optional<std::string> current_task) override;
    std::optional<AgentSession> get_session(const SessionId& id) const override;
    std::vector<AgentSession> list_sessions(const SessionFilter& filter) const override;
    std::vector<ReapedAgent> reap_stale_sessions(Timestamp cutoff) override;

    // ==================== Audit ====================
    void append_audit(const std::vector<AuditEntry>& entries) override;
    std::vector<AuditEntry> query_audit(const AuditFilter& filter) const override;
    std::size_t purge_audit_before(Timestamp cutoff, Duration min_retention) override;

    // ==================== Registries ====================
    std::vector<GuardrailPattern> load_guardrail_patterns() const override;
    void upsert_guardrail_pattern(const GuardrailPattern& pattern) override;
    void record_violations(const std::vector<GuardrailViolation>& violations) override;
    std::vector<GuardrailViolation> list_violations(
        const std::optional<AgentId>& agent_id, std::size_t limit) const override;

    std::optional<AgentProfile> find_profile(const AgentId& agent_id,
                                             const std::string& agent_type) const override;
    void upsert_profile(const AgentProfile& profile) override;
    void assign_profile(const AgentId& agent_id, const std::string& profile_name) override;

    std::vector<NetworkAccessPolicy> load_network_policies() const override;
    void upsert_network_policy(const NetworkAccessPolicy& policy) override;

    std::vector<PolicyDocument> load_policy_documents() const override;
    void upsert_policy_document(const PolicyDocument& document) override;

private:
    mutable std::mutex mutex_;

    std::unordered_map<ResourceKey, Lock> locks_;

    // Insertion order doubles as the final tie-breaker for claims
    std::vector<Task> tasks_;
    std::unordered_map<TaskId, std::size_t> task_index_;

    std::unordered_map<SessionId, AgentSession> sessions_;
    std::vector<AuditEntry> audit_;

    std::map<std::string, GuardrailPattern> patterns_;
    std::vector<GuardrailViolation> violations_;
    std::vector<AgentProfile> profiles_;  // creation order
    std::unordered_map<AgentId, std::string> assignments_;
    std::vector<NetworkAccessPolicy> network_policies_;
    std::map<std::string, PolicyDocument> policy_documents_;

    std::size_t purge_expired_locks_locked(Timestamp now);
    Task* find_task_locked(const TaskId& id);
    const Task* find_task_locked(const TaskId& id) const;
    bool dependencies_completed_locked(const Task& task) const;
    void insert_task_locked(const Task& task);
};

} // namespace agentcoord
