#pragma once

#include "agentcoord/types.hpp"
#include "agentcoord/config.hpp"
#include "agentcoord/audit_trail.hpp"
#include "agentcoord/guardrail_engine.hpp"
#include "agentcoord/liveness_tracker.hpp"
#include "agentcoord/lock_manager.hpp"
#include "agentcoord/monitor.hpp"
#include "agentcoord/network_policy.hpp"
#include "agentcoord/policy_engine.hpp"
#include "agentcoord/profile_service.hpp"
#include "agentcoord/store.hpp"
#include "agentcoord/work_queue.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentcoord {

// Uniform result of every service operation
template<typename T>
struct OperationResult {
    bool success{false};
    ReasonCode reason{ReasonCode::Ok};
    std::string message;
    T payload{};
};

// Operation surface over one store. Every call is gated through the policy
// engine (when enabled), runs the component operation and is audited.
// Validation and conflict outcomes come back as results; StoreException
// propagates to the caller.
class CoordinationService {
public:
    // Store created from config.store
    explicit CoordinationService(Config config = {},
                                 std::shared_ptr<Monitor> monitor = nullptr);

    CoordinationService(std::shared_ptr<CoordinationStore> store,
                        Config config = {},
                        std::shared_ptr<Monitor> monitor = nullptr);

    ~CoordinationService();

    // Non-copyable
    CoordinationService(const CoordinationService&) = delete;
    CoordinationService& operator=(const CoordinationService&) = delete;

    // ==================== Lifecycle ====================

    // Starts the audit worker, and the reaper when background_reaper is set
    void start();
    void stop();
    bool is_running() const noexcept { return running_; }

    // Install the embedded registries and drop every cache
    void seed_defaults();
    void invalidate_caches();

    // ==================== Locks ====================

    OperationResult<LockResult> acquire_lock(const AgentIdentity& caller,
                                             const ResourceKey& key,
                                             std::optional<Duration> ttl = std::nullopt,
                                             const std::string& reason = "",
                                             const std::string& metadata = "");

    OperationResult<bool> release_lock(const AgentIdentity& caller, const ResourceKey& key);

    OperationResult<std::vector<Lock>> check_locks(const AgentIdentity& caller,
                                                   const LockFilter& filter = {});

    // ==================== Work queue ====================

    OperationResult<SubmitResult> submit_task(const AgentIdentity& caller, const TaskSpec& spec);

    // reason no_tasks_available when nothing is eligible
    OperationResult<std::optional<Task>> claim_task(const AgentIdentity& caller,
                                                    const std::vector<std::string>& accepted_types = {});

    // Successful results are scanned at the caller's trust level
    OperationResult<CompleteResult> complete_task(const AgentIdentity& caller,
                                                  const TaskId& task_id,
                                                  bool success,
                                                  const std::string& result = "",
                                                  const std::string& error = "");

    OperationResult<bool> cancel_task(const AgentIdentity& caller, const TaskId& task_id);
    OperationResult<SubmitResult> resubmit_task(const AgentIdentity& caller, const TaskId& task_id);
    OperationResult<std::optional<Task>> get_task(const AgentIdentity& caller, const TaskId& task_id);

    // ==================== Authorization ====================

    // success reports that the scan ran; payload.safe carries the verdict.
    // trust_level overrides the caller's profile trust.
    OperationResult<GuardrailResult> check_guardrails(const AgentIdentity& caller,
                                                      const std::string& operation_text,
                                                      const std::vector<std::string>& file_paths = {},
                                                      std::optional<TrustLevel> trust_level = std::nullopt);

    OperationResult<PolicyDecision> check_policy(const AgentIdentity& caller,
                                                 const PolicyRequest& request);

    // Evaluated as action network_access on resource `domain`
    OperationResult<PolicyDecision> check_network_access(const AgentIdentity& caller,
                                                         const std::string& domain);

    // ==================== Audit ====================

    // Flushes queued entries first
    OperationResult<std::vector<AuditEntry>> query_audit(const AgentIdentity& caller,
                                                         const AuditFilter& filter = {});

    // Removes entries older than config.audit.retention_days
    OperationResult<std::size_t> purge_audit(const AgentIdentity& caller);

    // ==================== Liveness ====================

    // Session id taken from caller.session_id when set
    OperationResult<AgentSession> register_session(const AgentIdentity& caller,
                                                   const std::vector<std::string>& capabilities,
                                                   std::optional<std::string> current_task = std::nullopt);

    OperationResult<AgentSession> heartbeat(const AgentIdentity& caller,
                                            std::optional<SessionStatus> status = std::nullopt,
                                            std::optional<std::string> current_task = std::nullopt);

    OperationResult<std::vector<AgentSession>> discover_agents(
        const AgentIdentity& caller,
        const std::optional<std::string>& capability = std::nullopt,
        const std::optional<SessionStatus>& status = std::nullopt);

    OperationResult<ReapResult> reap_dead_agents(const AgentIdentity& caller,
                                                 std::optional<Duration> threshold = std::nullopt);

    // ==================== Monitoring ====================

    void set_monitor(std::shared_ptr<Monitor> monitor);

    // Replace the configured engine (e.g., a custom implementation)
    void set_policy_engine(std::shared_ptr<PolicyEngine> engine);
    std::shared_ptr<PolicyEngine> policy_engine() const;

    CoordinationSnapshot snapshot();

    // ==================== Components ====================

    const Config& config() const noexcept { return config_; }
    std::shared_ptr<CoordinationStore> store() const noexcept { return store_; }
    LockManager& locks() noexcept { return *locks_; }
    WorkQueue& queue() noexcept { return *queue_; }
    GuardrailEngine& guardrails() noexcept { return *guardrails_; }
    ProfileService& profiles() noexcept { return *profiles_; }
    NetworkPolicyEvaluator& network() noexcept { return *network_; }
    AuditTrail& audit() noexcept { return *audit_; }
    LivenessTracker& liveness() noexcept { return *liveness_; }

private:
    std::shared_ptr<CoordinationStore> store_;
    Config config_;

    std::shared_ptr<GuardrailEngine> guardrails_;
    std::shared_ptr<WorkQueue> queue_;
    std::shared_ptr<LockManager> locks_;
    std::shared_ptr<ProfileService> profiles_;
    std::shared_ptr<NetworkPolicyEvaluator> network_;
    std::shared_ptr<AuditTrail> audit_;
    std::shared_ptr<LivenessTracker> liveness_;

    mutable std::mutex mutex_;
    std::shared_ptr<PolicyEngine> policy_;
    std::shared_ptr<Monitor> monitor_;
    std::atomic<bool> running_{false};

    // Gate, run `body`, audit. Body signature: void(OperationResult<T>&, AuditTimer&)
    template<typename T, typename Body>
    OperationResult<T> run(const AgentIdentity& caller, const char* operation,
                           const std::string& action, const std::string& resource,
                           Body&& body);

    // Evaluate, emit and audit one policy decision
    PolicyDecision decide(const PolicyRequest& request);

    void emit_event(EventType type, const std::string& message,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<std::string> resource = std::nullopt,
                    std::optional<std::string> reason = std::nullopt,
                    std::optional<double> duration_us = std::nullopt);
};

} // namespace agentcoord
