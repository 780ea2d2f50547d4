#pragma once

#include "agentcoord/store.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

struct sqlite3;

namespace agentcoord {

// Store backed by a SQLite database file. Any number of processes may open
// the same file: composite mutations run inside BEGIN IMMEDIATE transactions
// and rely on conditional writes, so the database write lock is the only
// coordination point. Audit rows are protected by triggers.
class SqliteStore : public CoordinationStore {
public:
    explicit SqliteStore(const std::string& path,
                         std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
    ~SqliteStore() override;

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }
    const std::string& path() const noexcept { return path_; }

    // Run administrative SQL on this connection. Statements rejected by the
    // audit triggers throw AuditImmutableException.
    void execute(const std::string& sql);

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
    struct ConnectionCloser {
        void operator()(sqlite3* db) const noexcept;
    };

    std::string path_;
    // One connection per store; the mutex serializes threads of this process
    mutable std::mutex mutex_;
    std::unique_ptr<sqlite3, ConnectionCloser> db_;

    void create_schema();
    void insert_task_locked(const Task& task);
    std::optional<Task> load_task_locked(const TaskId& id) const;
    std::vector<TaskId> load_dependencies_locked(const TaskId& id) const;
    std::optional<AgentSession> load_session_locked(const SessionId& id) const;
    std::vector<std::string> load_capabilities_locked(const SessionId& id) const;
};

} // namespace agentcoord
