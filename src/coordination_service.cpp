#include "agentcoord/coordination_service.hpp"
#include "agentcoord/defaults.hpp"
#include "agentcoord/exceptions.hpp"
#include "util.hpp"

#include <chrono>

namespace agentcoord {

namespace {

std::string format_ttl(const std::optional<Duration>& ttl) {
    if (!ttl) {
        return "default";
    }
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(*ttl).count()) + "s";
}

} // anonymous namespace

CoordinationService::CoordinationService(Config config, std::shared_ptr<Monitor> monitor)
    : CoordinationService(make_store(config.store), config, std::move(monitor))
{
}

CoordinationService::CoordinationService(std::shared_ptr<CoordinationStore> store,
                                         Config config,
                                         std::shared_ptr<Monitor> monitor)
    : store_(std::move(store))
    , config_(std::move(config))
    , monitor_(std::move(monitor))
{
    if (!store_) {
        throw InvalidRequestException("CoordinationService requires a store");
    }

    guardrails_ = std::make_shared<GuardrailEngine>(store_, config_.guardrails, monitor_);
    queue_ = std::make_shared<WorkQueue>(store_, config_.queue, guardrails_, monitor_);
    locks_ = std::make_shared<LockManager>(store_, config_.locks, monitor_);
    profiles_ = std::make_shared<ProfileService>(store_, config_.profiles);
    network_ = std::make_shared<NetworkPolicyEvaluator>(store_, config_.network, monitor_);
    policy_ = make_policy_engine(config_.policy, store_, profiles_, network_, monitor_);
    audit_ = std::make_shared<AuditTrail>(store_, config_.audit, monitor_);
    liveness_ = std::make_shared<LivenessTracker>(store_, locks_, config_.liveness, monitor_);
}

CoordinationService::~CoordinationService() {
    stop();
}

// ========== Lifecycle ==========

void CoordinationService::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    audit_->start();
    if (config_.liveness.background_reaper) {
        liveness_->start();
    }
    running_ = true;
}

void CoordinationService::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    liveness_->stop();
    audit_->stop();
}

void CoordinationService::seed_defaults() {
    agentcoord::seed_defaults(*store_);
    invalidate_caches();
}

void CoordinationService::invalidate_caches() {
    guardrails_->invalidate_cache();
    profiles_->invalidate_cache();
    network_->invalidate_cache();
    if (auto declarative = std::dynamic_pointer_cast<DeclarativePolicyEngine>(policy_engine())) {
        declarative->invalidate_cache();
    }
}

// ========== Locks ==========

OperationResult<LockResult> CoordinationService::acquire_lock(const AgentIdentity& caller,
                                                              const ResourceKey& key,
                                                              std::optional<Duration> ttl,
                                                              const std::string& reason,
                                                              const std::string& metadata) {
    return run<LockResult>(caller, "acquire_lock", "acquire_lock", key,
        [&](OperationResult<LockResult>& out, AuditTimer& timer) {
            timer.parameter("resource_key", key);
            timer.parameter("ttl", format_ttl(ttl));
            if (!reason.empty()) {
                timer.parameter("reason", reason);
            }

            LockRequest request;
            request.key = key;
            request.holder = caller.agent_id;
            request.holder_type = caller.agent_type;
            request.session_id = caller.session_id;
            request.reason = reason;
            request.ttl = ttl;
            request.metadata = metadata;

            out.payload = locks_->acquire(request);
            out.success = out.payload.success;
            out.reason = out.payload.reason;
            out.message = out.payload.message;
            timer.result("outcome", to_string(out.payload.outcome));
        });
}

OperationResult<bool> CoordinationService::release_lock(const AgentIdentity& caller,
                                                        const ResourceKey& key) {
    return run<bool>(caller, "release_lock", "release_lock", key,
        [&](OperationResult<bool>& out, AuditTimer& timer) {
            timer.parameter("resource_key", key);
            auto released = locks_->release(key, caller.agent_id);
            out.payload = released.released;
            out.success = released.released;
            out.reason = released.reason;
        });
}

OperationResult<std::vector<Lock>> CoordinationService::check_locks(const AgentIdentity& caller,
                                                                    const LockFilter& filter) {
    return run<std::vector<Lock>>(caller, "check_locks", "check_locks", detail::join(filter.keys, ','),
        [&](OperationResult<std::vector<Lock>>& out, AuditTimer& timer) {
            if (!filter.keys.empty()) {
                timer.parameter("keys", detail::join(filter.keys, ','));
            }
            if (filter.holder) {
                timer.parameter("holder", *filter.holder);
            }
            out.payload = locks_->check(filter);
            out.success = true;
            timer.result("count", std::to_string(out.payload.size()));
        });
}

// ========== Work queue ==========

OperationResult<SubmitResult> CoordinationService::submit_task(const AgentIdentity& caller,
                                                               const TaskSpec& spec) {
    return run<SubmitResult>(caller, "submit_task", "submit_work", spec.type,
        [&](OperationResult<SubmitResult>& out, AuditTimer& timer) {
            timer.parameter("task_type", spec.type);
            if (spec.priority) {
                timer.parameter("priority", std::to_string(*spec.priority));
            }
            if (!spec.dependency_ids.empty()) {
                timer.parameter("dependencies", detail::join(spec.dependency_ids, ','));
            }

            out.payload = queue_->submit(spec);
            out.success = out.payload.success;
            out.reason = out.payload.reason;
            out.message = out.payload.message;
            if (out.success) {
                timer.result("task_id", out.payload.task_id);
            }
        });
}

OperationResult<std::optional<Task>> CoordinationService::claim_task(
    const AgentIdentity& caller, const std::vector<std::string>& accepted_types) {
    return run<std::optional<Task>>(caller, "claim_task", "get_work", detail::join(accepted_types, ','),
        [&](OperationResult<std::optional<Task>>& out, AuditTimer& timer) {
            if (!accepted_types.empty()) {
                timer.parameter("accepted_types", detail::join(accepted_types, ','));
            }
            auto claimed = queue_->claim(caller.agent_id, accepted_types);
            out.success = claimed.success;
            out.reason = claimed.reason;
            out.payload = std::move(claimed.task);
            if (out.payload) {
                timer.result("task_id", out.payload->id);
            }
            if (!claimed.deadline_expired.empty()) {
                timer.result("deadline_expired", detail::join(claimed.deadline_expired, ','));
            }
        });
}

OperationResult<CompleteResult> CoordinationService::complete_task(const AgentIdentity& caller,
                                                                   const TaskId& task_id,
                                                                   bool success,
                                                                   const std::string& result,
                                                                   const std::string& error) {
    return run<CompleteResult>(caller, "complete_task", "complete_work", task_id,
        [&](OperationResult<CompleteResult>& out, AuditTimer& timer) {
            timer.parameter("task_id", task_id);
            timer.parameter("success", success ? "true" : "false");

            CompletionReport report;
            report.task_id = task_id;
            report.claimant = caller.agent_id;
            report.success = success;
            report.result = result;
            report.error = error;
            report.trust_level = profiles_->trust_level(caller.agent_id, caller.agent_type);

            out.payload = queue_->complete(report);
            out.success = out.payload.success;
            out.reason = out.payload.reason;
            out.message = out.payload.message;
            if (out.payload.task) {
                timer.result("status", to_string(out.payload.task->status));
            }
            if (!out.payload.violations.empty()) {
                timer.result("violations", std::to_string(out.payload.violations.size()));
            }
        });
}

OperationResult<bool> CoordinationService::cancel_task(const AgentIdentity& caller,
                                                       const TaskId& task_id) {
    return run<bool>(caller, "cancel_task", "cancel_work", task_id,
        [&](OperationResult<bool>& out, AuditTimer& timer) {
            timer.parameter("task_id", task_id);
            auto cancelled = queue_->cancel(task_id);
            out.payload = cancelled.cancelled;
            out.success = cancelled.cancelled;
            out.reason = cancelled.reason;
        });
}

OperationResult<SubmitResult> CoordinationService::resubmit_task(const AgentIdentity& caller,
                                                                 const TaskId& task_id) {
    return run<SubmitResult>(caller, "resubmit_task", "submit_work", task_id,
        [&](OperationResult<SubmitResult>& out, AuditTimer& timer) {
            timer.parameter("task_id", task_id);
            out.payload = queue_->resubmit(task_id);
            out.success = out.payload.success;
            out.reason = out.payload.reason;
            out.message = out.payload.message;
            if (out.success) {
                timer.result("replacement_id", out.payload.task_id);
            }
        });
}

OperationResult<std::optional<Task>> CoordinationService::get_task(const AgentIdentity& caller,
                                                                   const TaskId& task_id) {
    return run<std::optional<Task>>(caller, "get_task", "get_work", task_id,
        [&](OperationResult<std::optional<Task>>& out, AuditTimer& timer) {
            timer.parameter("task_id", task_id);
            out.payload = queue_->get(task_id);
            if (!out.payload) {
                out.reason = ReasonCode::TaskNotFound;
                return;
            }
            out.success = true;
            timer.result("status", to_string(out.payload->status));
        });
}

// ========== Authorization ==========

OperationResult<GuardrailResult> CoordinationService::check_guardrails(
    const AgentIdentity& caller, const std::string& operation_text,
    const std::vector<std::string>& file_paths, std::optional<TrustLevel> trust_level) {
    return run<GuardrailResult>(caller, "check_guardrails", "check_guardrails", "",
        [&](OperationResult<GuardrailResult>& out, AuditTimer& timer) {
            timer.parameter("operation_text",
                            detail::truncate(operation_text, GuardrailEngine::MAX_OPERATION_TEXT));
            if (!file_paths.empty()) {
                timer.parameter("file_paths", detail::join(file_paths, ','));
            }

            TrustLevel trust = trust_level ? *trust_level
                                           : profiles_->trust_level(caller.agent_id, caller.agent_type);
            timer.parameter("trust_level", std::to_string(trust));

            out.payload = guardrails_->check(operation_text, trust, file_paths, caller.agent_id);
            out.success = true;
            timer.result("safe", out.payload.safe ? "true" : "false");
            timer.result("violations", std::to_string(out.payload.violations.size()));
        });
}

OperationResult<PolicyDecision> CoordinationService::check_policy(const AgentIdentity& caller,
                                                                  const PolicyRequest& request) {
    return run<PolicyDecision>(caller, "check_policy", "check_policy", request.action,
        [&](OperationResult<PolicyDecision>& out, AuditTimer& timer) {
            timer.parameter("principal", request.principal.agent_id);
            timer.parameter("action", request.action);
            timer.parameter("resource", request.resource);

            if (request.principal.agent_id.empty() || request.action.empty()) {
                out.reason = ReasonCode::InvalidRequest;
                out.message = "principal and action are required";
                return;
            }

            out.payload = decide(request);
            out.success = true;
            timer.result("allowed", out.payload.allowed ? "true" : "false");
            timer.result("reason", out.payload.reason);
        });
}

OperationResult<PolicyDecision> CoordinationService::check_network_access(const AgentIdentity& caller,
                                                                          const std::string& domain) {
    // The evaluation is the gate: no separate authorization step
    OperationResult<PolicyDecision> out;
    AuditTimer timer(*audit_, caller.agent_id, caller.agent_type, "check_network_access");
    timer.parameter("domain", domain);

    if (caller.agent_id.empty() || domain.empty()) {
        out.reason = ReasonCode::InvalidRequest;
        out.message = "agent_id and domain are required";
        timer.fail(out.message);
        return out;
    }

    PolicyRequest request;
    request.principal.agent_id = caller.agent_id;
    request.principal.agent_type = caller.agent_type;
    request.action = NETWORK_ACCESS_ACTION;
    request.resource = domain;

    out.payload = decide(request);
    out.success = true;
    timer.result("allowed", out.payload.allowed ? "true" : "false");
    timer.result("reason", out.payload.reason);
    return out;
}

// ========== Audit ==========

OperationResult<std::vector<AuditEntry>> CoordinationService::query_audit(const AgentIdentity& caller,
                                                                         const AuditFilter& filter) {
    return run<std::vector<AuditEntry>>(caller, "query_audit", "query_audit", "",
        [&](OperationResult<std::vector<AuditEntry>>& out, AuditTimer& timer) {
            if (filter.agent_id) {
                timer.parameter("agent_id", *filter.agent_id);
            }
            if (filter.operation) {
                timer.parameter("operation", *filter.operation);
            }
            timer.parameter("limit", std::to_string(filter.limit));

            audit_->flush();
            out.payload = audit_->query(filter);
            out.success = true;
            timer.result("count", std::to_string(out.payload.size()));
        });
}

OperationResult<std::size_t> CoordinationService::purge_audit(const AgentIdentity& caller) {
    return run<std::size_t>(caller, "purge_audit", "purge_audit", "",
        [&](OperationResult<std::size_t>& out, AuditTimer& timer) {
            timer.parameter("retention_days", std::to_string(config_.audit.retention_days));
            audit_->flush();
            out.payload = audit_->purge_expired();
            out.success = true;
            timer.result("removed", std::to_string(out.payload));
        });
}

// ========== Liveness ==========

OperationResult<AgentSession> CoordinationService::register_session(
    const AgentIdentity& caller, const std::vector<std::string>& capabilities,
    std::optional<std::string> current_task) {
    return run<AgentSession>(caller, "register_session", "register_session", caller.session_id,
        [&](OperationResult<AgentSession>& out, AuditTimer& timer) {
            timer.parameter("capabilities", detail::join(capabilities, ','));

            SessionRegistration registration;
            registration.agent_id = caller.agent_id;
            registration.agent_type = caller.agent_type;
            registration.capabilities = capabilities;
            if (!caller.session_id.empty()) {
                registration.session_id = caller.session_id;
            }
            registration.current_task = std::move(current_task);

            auto registered = liveness_->register_session(registration);
            out.success = registered.success;
            out.reason = registered.reason;
            if (registered.session) {
                out.payload = std::move(*registered.session);
                timer.result("session_id", out.payload.id);
            }
        });
}

OperationResult<AgentSession> CoordinationService::heartbeat(const AgentIdentity& caller,
                                                             std::optional<SessionStatus> status,
                                                             std::optional<std::string> current_task) {
    return run<AgentSession>(caller, "heartbeat", "heartbeat", caller.session_id,
        [&](OperationResult<AgentSession>& out, AuditTimer& timer) {
            timer.parameter("session_id", caller.session_id);
            if (status) {
                timer.parameter("status", to_string(*status));
            }

            if (caller.session_id.empty()) {
                out.reason = ReasonCode::InvalidRequest;
                out.message = "session_id is required";
                return;
            }

            auto beat = liveness_->heartbeat(caller.session_id, status, std::move(current_task));
            out.success = beat.success;
            out.reason = beat.reason;
            if (beat.session) {
                out.payload = std::move(*beat.session);
            }
        });
}

OperationResult<std::vector<AgentSession>> CoordinationService::discover_agents(
    const AgentIdentity& caller, const std::optional<std::string>& capability,
    const std::optional<SessionStatus>& status) {
    return run<std::vector<AgentSession>>(caller, "discover_agents", "discover_agents",
                                          capability.value_or(""),
        [&](OperationResult<std::vector<AgentSession>>& out, AuditTimer& timer) {
            if (capability) {
                timer.parameter("capability", *capability);
            }
            if (status) {
                timer.parameter("status", to_string(*status));
            }
            out.payload = liveness_->discover(capability, status);
            out.success = true;
            timer.result("count", std::to_string(out.payload.size()));
        });
}

OperationResult<ReapResult> CoordinationService::reap_dead_agents(const AgentIdentity& caller,
                                                                  std::optional<Duration> threshold) {
    return run<ReapResult>(caller, "reap_dead_agents", "cleanup_agents", "",
        [&](OperationResult<ReapResult>& out, AuditTimer& timer) {
            if (threshold) {
                timer.parameter("threshold", format_ttl(threshold));
            }
            out.payload = liveness_->reap(threshold);
            out.success = true;
            timer.result("agents_reaped", std::to_string(out.payload.agents_reaped));
            timer.result("locks_released", std::to_string(out.payload.locks_released));
        });
}

// ========== Monitoring ==========

void CoordinationService::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::shared_ptr<PolicyEngine> engine;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor_ = monitor;
        engine = policy_;
    }
    guardrails_->set_monitor(monitor);
    queue_->set_monitor(monitor);
    locks_->set_monitor(monitor);
    network_->set_monitor(monitor);
    audit_->set_monitor(monitor);
    liveness_->set_monitor(monitor);
    if (auto declarative = std::dynamic_pointer_cast<DeclarativePolicyEngine>(engine)) {
        declarative->set_monitor(monitor);
    }
}

void CoordinationService::set_policy_engine(std::shared_ptr<PolicyEngine> engine) {
    if (!engine) {
        throw InvalidRequestException("Policy engine cannot be null");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    policy_ = std::move(engine);
}

std::shared_ptr<PolicyEngine> CoordinationService::policy_engine() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_;
}

CoordinationSnapshot CoordinationService::snapshot() {
    CoordinationSnapshot snap;
    snap.timestamp = current_time();
    snap.live_locks = store_->list_live_locks({}, snap.timestamp).size();

    TaskFilter pending;
    pending.status = TaskStatus::Pending;
    snap.pending_tasks = store_->list_tasks(pending).size();

    TaskFilter claimed;
    claimed.status = TaskStatus::Claimed;
    snap.claimed_tasks = store_->list_tasks(claimed).size();

    SessionFilter active;
    active.status = SessionStatus::Active;
    snap.active_sessions = store_->list_sessions(active).size();

    snap.audit_queue_depth = audit_->queue_depth();

    std::shared_ptr<Monitor> mon;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mon = monitor_;
    }
    if (mon) {
        mon->on_snapshot(snap);
    }
    return snap;
}

// ========== Internals ==========

template<typename T, typename Body>
OperationResult<T> CoordinationService::run(const AgentIdentity& caller, const char* operation,
                                            const std::string& action, const std::string& resource,
                                            Body&& body) {
    OperationResult<T> out;
    AuditTimer timer(*audit_, caller.agent_id, caller.agent_type, operation);

    if (caller.agent_id.empty()) {
        out.reason = ReasonCode::InvalidRequest;
        out.message = "agent_id is required";
        timer.fail(out.message);
        return out;
    }

    if (config_.policy.gate_operations) {
        PolicyRequest request;
        request.principal.agent_id = caller.agent_id;
        request.principal.agent_type = caller.agent_type;
        request.action = action;
        request.resource = resource;

        auto decision = decide(request);
        if (!decision.allowed) {
            out.reason = ReasonCode::PolicyDenied;
            out.message = "policy_denied: " + decision.reason;
            timer.fail(out.message);
            return out;
        }
    }

    try {
        body(out, timer);
    } catch (const InvalidRequestException& e) {
        out = OperationResult<T>{};
        out.reason = ReasonCode::InvalidRequest;
        out.message = e.what();
    }

    timer.result("reason", to_string(out.reason));
    if (!out.success) {
        timer.fail(out.message.empty() ? std::string(to_string(out.reason)) : out.message);
    }
    return out;
}

PolicyDecision CoordinationService::decide(const PolicyRequest& request) {
    auto engine = policy_engine();

    auto started = std::chrono::steady_clock::now();
    auto decision = engine->evaluate(request);
    auto elapsed = std::chrono::steady_clock::now() - started;
    double duration_us = std::chrono::duration<double, std::micro>(elapsed).count();

    emit_event(decision.allowed ? EventType::PolicyAllowed : EventType::PolicyDenied,
               request.action + " on '" + request.resource + "': " + decision.reason,
               request.principal.agent_id, request.resource, decision.reason, duration_us);

    if (config_.policy.audit_decisions) {
        AuditEntry entry;
        entry.agent_id = request.principal.agent_id;
        entry.agent_type = request.principal.agent_type;
        entry.operation = "policy_decision";
        entry.parameters["action"] = request.action;
        entry.parameters["resource"] = request.resource;
        entry.result["allowed"] = decision.allowed ? "true" : "false";
        entry.result["reason"] = decision.reason;
        entry.result["engine"] = decision.engine;
        if (decision.matched_policy) {
            entry.result["matched_policy"] = *decision.matched_policy;
        }
        entry.duration = std::chrono::duration_cast<Duration>(elapsed);
        audit_->append(std::move(entry));
    }
    return decision;
}

void CoordinationService::emit_event(EventType type, const std::string& message,
                                     std::optional<AgentId> agent_id,
                                     std::optional<std::string> resource,
                                     std::optional<std::string> reason,
                                     std::optional<double> duration_us) {
    std::shared_ptr<Monitor> mon;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mon = monitor_;
    }

    if (!mon) {
        return;
    }

    MonitorEvent event;
    event.type = type;
    event.timestamp = current_time();
    event.message = message;
    event.agent_id = std::move(agent_id);
    event.resource = std::move(resource);
    event.reason = std::move(reason);
    event.success = type == EventType::PolicyAllowed;
    event.duration_us = duration_us;
    mon->on_event(event);
}

} // namespace agentcoord
