#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <agentcoord/agentcoord.hpp>

using namespace agentcoord;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_agentcoord, m) {
    m.doc() = "AgentCoord: Coordination engine for multi-AI-agent systems";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_monitors(m);
    bind_stores(m);
    bind_policies(m);
    bind_core(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<TaskStatus>(m, "TaskStatus")
        .value("Pending",   TaskStatus::Pending)
        .value("Claimed",   TaskStatus::Claimed)
        .value("Completed", TaskStatus::Completed)
        .value("Failed",    TaskStatus::Failed)
        .value("Cancelled", TaskStatus::Cancelled)
        .export_values();

    py::enum_<SessionStatus>(m, "SessionStatus")
        .value("Active",       SessionStatus::Active)
        .value("Idle",         SessionStatus::Idle)
        .value("Disconnected", SessionStatus::Disconnected)
        .export_values();

    py::enum_<Severity>(m, "Severity")
        .value("Block", Severity::Block)
        .value("Warn",  Severity::Warn)
        .value("Log",   Severity::Log)
        .export_values();

    py::enum_<NetworkAction>(m, "NetworkAction")
        .value("Allow", NetworkAction::Allow)
        .value("Deny",  NetworkAction::Deny)
        .export_values();

    py::enum_<LockOutcome>(m, "LockOutcome")
        .value("Granted",   LockOutcome::Granted)
        .value("Refreshed", LockOutcome::Refreshed)
        .value("Denied",    LockOutcome::Denied)
        .export_values();

    // Values are not exported: several names collide with EventType
    py::enum_<ReasonCode>(m, "ReasonCode")
        .value("Ok",                     ReasonCode::Ok)
        .value("InvalidRequest",         ReasonCode::InvalidRequest)
        .value("InvalidPriority",        ReasonCode::InvalidPriority)
        .value("InvalidTtl",             ReasonCode::InvalidTtl)
        .value("UnknownDependency",      ReasonCode::UnknownDependency)
        .value("LockedByOther",          ReasonCode::LockedByOther)
        .value("LockNotFoundOrNotOwner", ReasonCode::LockNotFoundOrNotOwner)
        .value("NoTasksAvailable",       ReasonCode::NoTasksAvailable)
        .value("TaskNotFound",           ReasonCode::TaskNotFound)
        .value("TaskNotClaimedByAgent",  ReasonCode::TaskNotClaimedByAgent)
        .value("TaskAlreadyTerminal",    ReasonCode::TaskAlreadyTerminal)
        .value("TaskNotFailed",          ReasonCode::TaskNotFailed)
        .value("GuardrailViolation",     ReasonCode::GuardrailViolation)
        .value("SessionNotFound",        ReasonCode::SessionNotFound)
        .value("PolicyDenied",           ReasonCode::PolicyDenied)
        .value("StoreUnavailable",       ReasonCode::StoreUnavailable)
        .def("token", [](ReasonCode r) { return std::string(to_string(r)); });

    py::enum_<StoreBackend>(m, "StoreBackend")
        .value("Memory", StoreBackend::Memory)
        .value("Sqlite", StoreBackend::Sqlite)
        .export_values();

    py::enum_<RetryPolicy>(m, "RetryPolicy")
        .value("ExplicitResubmit",      RetryPolicy::ExplicitResubmit)
        .value("RequeueUntilExhausted", RetryPolicy::RequeueUntilExhausted)
        .export_values();

    py::enum_<AuditBackpressure>(m, "AuditBackpressure")
        .value("DropNewest", AuditBackpressure::DropNewest)
        .value("Block",      AuditBackpressure::Block);

    py::enum_<PolicyEngineKind>(m, "PolicyEngineKind")
        .value("Native",      PolicyEngineKind::Native)
        .value("Declarative", PolicyEngineKind::Declarative)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("LockGranted",                EventType::LockGranted)
        .value("LockRefreshed",              EventType::LockRefreshed)
        .value("LockDenied",                 EventType::LockDenied)
        .value("LockReleased",               EventType::LockReleased)
        .value("LockReleaseDenied",          EventType::LockReleaseDenied)
        .value("LocksExpired",               EventType::LocksExpired)
        .value("LocksCleanedUp",             EventType::LocksCleanedUp)
        .value("TaskSubmitted",              EventType::TaskSubmitted)
        .value("TaskClaimed",                EventType::TaskClaimed)
        .value("TaskCompleted",              EventType::TaskCompleted)
        .value("TaskFailed",                 EventType::TaskFailed)
        .value("TaskRequeued",               EventType::TaskRequeued)
        .value("TaskCancelled",              EventType::TaskCancelled)
        .value("TaskResubmitted",            EventType::TaskResubmitted)
        .value("TaskDeadlineExceeded",       EventType::TaskDeadlineExceeded)
        .value("TaskCompletionRejected",     EventType::TaskCompletionRejected)
        .value("GuardrailViolationDetected", EventType::GuardrailViolationDetected)
        .value("GuardrailBypassed",          EventType::GuardrailBypassed)
        .value("GuardrailFallbackActivated", EventType::GuardrailFallbackActivated)
        .value("GuardrailPatternInvalid",    EventType::GuardrailPatternInvalid)
        .value("PolicyAllowed",              EventType::PolicyAllowed)
        .value("PolicyDenied",               EventType::PolicyDenied)
        .value("PolicyFallbackActivated",    EventType::PolicyFallbackActivated)
        .value("PolicyDocumentInvalid",      EventType::PolicyDocumentInvalid)
        .value("NetworkAccessChecked",       EventType::NetworkAccessChecked)
        .value("AuditEntryDropped",          EventType::AuditEntryDropped)
        .value("AuditWriteFailed",           EventType::AuditWriteFailed)
        .value("AuditPurged",                EventType::AuditPurged)
        .value("SessionRegistered",          EventType::SessionRegistered)
        .value("SessionHeartbeat",           EventType::SessionHeartbeat)
        .value("AgentDisconnected",          EventType::AgentDisconnected)
        .value("ReapCompleted",              EventType::ReapCompleted)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Configuration ----------------------------------------------------

    py::class_<StoreConfig>(m, "StoreConfig")
        .def(py::init<>())
        .def_readwrite("backend",       &StoreConfig::backend)
        .def_readwrite("database_path", &StoreConfig::database_path)
        .def_readwrite("busy_timeout",  &StoreConfig::busy_timeout);

    py::class_<LockConfig>(m, "LockConfig")
        .def(py::init<>())
        .def_readwrite("default_ttl", &LockConfig::default_ttl)
        .def_readwrite("max_ttl",     &LockConfig::max_ttl);

    py::class_<QueueConfig>(m, "QueueConfig")
        .def(py::init<>())
        .def_readwrite("default_priority",        &QueueConfig::default_priority)
        .def_readwrite("default_max_attempts",    &QueueConfig::default_max_attempts)
        .def_readwrite("retry_policy",            &QueueConfig::retry_policy)
        .def_readwrite("pending_listing_limit",   &QueueConfig::pending_listing_limit)
        .def_readwrite("guardrail_check_results", &QueueConfig::guardrail_check_results);

    py::class_<GuardrailConfig>(m, "GuardrailConfig")
        .def(py::init<>())
        .def_readwrite("cache_ttl",            &GuardrailConfig::cache_ttl)
        .def_readwrite("fallback_to_baseline", &GuardrailConfig::fallback_to_baseline)
        .def_readwrite("fallback_cache_ttl",   &GuardrailConfig::fallback_cache_ttl)
        .def_readwrite("record_violations",    &GuardrailConfig::record_violations);

    py::class_<ProfileConfig>(m, "ProfileConfig")
        .def(py::init<>())
        .def_readwrite("default_trust_level",     &ProfileConfig::default_trust_level)
        .def_readwrite("enforce_resource_limits", &ProfileConfig::enforce_resource_limits)
        .def_readwrite("cache_ttl",               &ProfileConfig::cache_ttl);

    py::class_<AuditConfig>(m, "AuditConfig")
        .def(py::init<>())
        .def_readwrite("async_writes",   &AuditConfig::async)
        .def_readwrite("queue_capacity", &AuditConfig::queue_capacity)
        .def_readwrite("backpressure",   &AuditConfig::backpressure)
        .def_readwrite("batch_size",     &AuditConfig::batch_size)
        .def_readwrite("flush_interval", &AuditConfig::flush_interval)
        .def_readwrite("retention_days", &AuditConfig::retention_days);

    py::class_<NetworkConfig>(m, "NetworkConfig")
        .def(py::init<>())
        .def_readwrite("default_action", &NetworkConfig::default_action)
        .def_readwrite("cache_ttl",      &NetworkConfig::cache_ttl);

    py::class_<PolicyConfig>(m, "PolicyConfig")
        .def(py::init<>())
        .def_readwrite("engine",               &PolicyConfig::engine)
        .def_readwrite("cache_ttl",            &PolicyConfig::cache_ttl)
        .def_readwrite("fallback_to_defaults", &PolicyConfig::fallback_to_defaults)
        .def_readwrite("gate_operations",      &PolicyConfig::gate_operations)
        .def_readwrite("audit_decisions",      &PolicyConfig::audit_decisions);

    py::class_<LivenessConfig>(m, "LivenessConfig")
        .def(py::init<>())
        .def_readwrite("stale_threshold",   &LivenessConfig::stale_threshold)
        .def_readwrite("reaper_interval",   &LivenessConfig::reaper_interval)
        .def_readwrite("background_reaper", &LivenessConfig::background_reaper);

    // Config (top-level, embeds the component configs)
    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_static("from_env", &Config::from_env)
        .def_readwrite("store",      &Config::store)
        .def_readwrite("locks",      &Config::locks)
        .def_readwrite("queue",      &Config::queue)
        .def_readwrite("guardrails", &Config::guardrails)
        .def_readwrite("profiles",   &Config::profiles)
        .def_readwrite("audit",      &Config::audit)
        .def_readwrite("network",    &Config::network)
        .def_readwrite("policy",     &Config::policy)
        .def_readwrite("liveness",   &Config::liveness);

    py::class_<AgentIdentity>(m, "AgentIdentity")
        .def(py::init<>())
        .def(py::init([](const AgentId& agent_id, const std::string& agent_type,
                         const SessionId& session_id) {
                 AgentIdentity identity;
                 identity.agent_id = agent_id;
                 identity.agent_type = agent_type;
                 identity.session_id = session_id;
                 return identity;
             }),
             py::arg("agent_id"), py::arg("agent_type") = "unknown",
             py::arg("session_id") = "")
        .def_static("from_env", &AgentIdentity::from_env)
        .def_readwrite("agent_id",   &AgentIdentity::agent_id)
        .def_readwrite("agent_type", &AgentIdentity::agent_type)
        .def_readwrite("session_id", &AgentIdentity::session_id)
        .def("__repr__", [](const AgentIdentity& a) {
            return "<AgentIdentity id='" + a.agent_id + "' type='" + a.agent_type + "'>";
        });

    // ---- Records ----------------------------------------------------------

    py::class_<Lock>(m, "Lock")
        .def(py::init<>())
        .def_readwrite("resource_key", &Lock::resource_key)
        .def_readwrite("holder_id",    &Lock::holder_id)
        .def_readwrite("holder_type",  &Lock::holder_type)
        .def_readwrite("session_id",   &Lock::session_id)
        .def_readwrite("acquired_at",  &Lock::acquired_at)
        .def_readwrite("expires_at",   &Lock::expires_at)
        .def_readwrite("reason",       &Lock::reason)
        .def_readwrite("metadata",     &Lock::metadata)
        .def("__repr__", [](const Lock& l) {
            return "<Lock key='" + l.resource_key + "' holder='" + l.holder_id + "'>";
        });

    py::class_<Task>(m, "Task")
        .def(py::init<>())
        .def_readwrite("id",             &Task::id)
        .def_readwrite("type",           &Task::type)
        .def_readwrite("description",    &Task::description)
        .def_readwrite("input",          &Task::input)
        .def_readwrite("priority",       &Task::priority)
        .def_readwrite("dependency_ids", &Task::dependency_ids)
        .def_readwrite("status",         &Task::status)
        .def_readwrite("claimant",       &Task::claimant)
        .def_readwrite("claimed_at",     &Task::claimed_at)
        .def_readwrite("attempt_count",  &Task::attempt_count)
        .def_readwrite("max_attempts",   &Task::max_attempts)
        .def_readwrite("result",         &Task::result)
        .def_readwrite("error",          &Task::error)
        .def_readwrite("deadline",       &Task::deadline)
        .def_readwrite("created_at",     &Task::created_at)
        .def_readwrite("completed_at",   &Task::completed_at)
        .def("__repr__", [](const Task& t) {
            return "<Task id='" + t.id + "' type='" + t.type +
                   "' status=" + to_string(t.status) + ">";
        });

    py::class_<AgentSession>(m, "AgentSession")
        .def(py::init<>())
        .def_readwrite("id",             &AgentSession::id)
        .def_readwrite("agent_id",       &AgentSession::agent_id)
        .def_readwrite("agent_type",     &AgentSession::agent_type)
        .def_readwrite("capabilities",   &AgentSession::capabilities)
        .def_readwrite("status",         &AgentSession::status)
        .def_readwrite("started_at",     &AgentSession::started_at)
        .def_readwrite("last_heartbeat", &AgentSession::last_heartbeat)
        .def_readwrite("current_task",   &AgentSession::current_task);

    py::class_<GuardrailPattern>(m, "GuardrailPattern")
        .def(py::init<>())
        .def_readwrite("name",                &GuardrailPattern::name)
        .def_readwrite("category",            &GuardrailPattern::category)
        .def_readwrite("regex",               &GuardrailPattern::regex)
        .def_readwrite("severity",            &GuardrailPattern::severity)
        .def_readwrite("min_trust_to_bypass", &GuardrailPattern::min_trust_to_bypass)
        .def_readwrite("description",         &GuardrailPattern::description)
        .def_readwrite("enabled",             &GuardrailPattern::enabled);

    py::class_<GuardrailViolation>(m, "GuardrailViolation")
        .def(py::init<>())
        .def_readwrite("agent_id",       &GuardrailViolation::agent_id)
        .def_readwrite("pattern_name",   &GuardrailViolation::pattern_name)
        .def_readwrite("category",       &GuardrailViolation::category)
        .def_readwrite("severity",       &GuardrailViolation::severity)
        .def_readwrite("operation_text", &GuardrailViolation::operation_text)
        .def_readwrite("matched_text",   &GuardrailViolation::matched_text)
        .def_readwrite("blocked",        &GuardrailViolation::blocked)
        .def_readwrite("bypassed",       &GuardrailViolation::bypassed)
        .def_readwrite("trust_level",    &GuardrailViolation::trust_level)
        .def_readwrite("created_at",     &GuardrailViolation::created_at);

    py::class_<ResourceLimits>(m, "ResourceLimits")
        .def(py::init<>())
        .def_readwrite("max_file_modifications",     &ResourceLimits::max_file_modifications)
        .def_readwrite("max_execution_time_seconds", &ResourceLimits::max_execution_time_seconds)
        .def_readwrite("max_api_calls_per_hour",     &ResourceLimits::max_api_calls_per_hour);

    py::class_<NetworkAccessPolicy>(m, "NetworkAccessPolicy")
        .def(py::init<>())
        .def_readwrite("domain_pattern", &NetworkAccessPolicy::domain_pattern)
        .def_readwrite("action",         &NetworkAccessPolicy::action)
        .def_readwrite("priority",       &NetworkAccessPolicy::priority)
        .def_readwrite("profile_name",   &NetworkAccessPolicy::profile_name)
        .def_readwrite("description",    &NetworkAccessPolicy::description)
        .def_readwrite("enabled",        &NetworkAccessPolicy::enabled);

    py::class_<AgentProfile>(m, "AgentProfile")
        .def(py::init<>())
        .def_readwrite("name",              &AgentProfile::name)
        .def_readwrite("agent_type",        &AgentProfile::agent_type)
        .def_readwrite("trust_level",       &AgentProfile::trust_level)
        .def_readwrite("allowed_ops",       &AgentProfile::allowed_ops)
        .def_readwrite("blocked_ops",       &AgentProfile::blocked_ops)
        .def_readwrite("resource_limits",   &AgentProfile::resource_limits)
        .def_readwrite("network_overrides", &AgentProfile::network_overrides)
        .def_readwrite("description",       &AgentProfile::description)
        .def_readwrite("enabled",           &AgentProfile::enabled);

    py::class_<PolicyDocument>(m, "PolicyDocument")
        .def(py::init<>())
        .def_readwrite("name",        &PolicyDocument::name)
        .def_readwrite("text",        &PolicyDocument::text)
        .def_readwrite("priority",    &PolicyDocument::priority)
        .def_readwrite("description", &PolicyDocument::description)
        .def_readwrite("enabled",     &PolicyDocument::enabled);

    py::class_<PolicyDecision>(m, "PolicyDecision")
        .def(py::init<>())
        .def_readwrite("allowed",        &PolicyDecision::allowed)
        .def_readwrite("reason",         &PolicyDecision::reason)
        .def_readwrite("matched_policy", &PolicyDecision::matched_policy)
        .def_readwrite("engine",         &PolicyDecision::engine)
        .def("__repr__", [](const PolicyDecision& d) {
            return std::string("<PolicyDecision ") + (d.allowed ? "allowed" : "denied") +
                   " reason='" + d.reason + "'>";
        });

    py::class_<AuditEntry>(m, "AuditEntry")
        .def(py::init<>())
        .def_readwrite("id",            &AuditEntry::id)
        .def_readwrite("agent_id",      &AuditEntry::agent_id)
        .def_readwrite("agent_type",    &AuditEntry::agent_type)
        .def_readwrite("operation",     &AuditEntry::operation)
        .def_readwrite("parameters",    &AuditEntry::parameters)
        .def_readwrite("result",        &AuditEntry::result)
        .def_readwrite("duration",      &AuditEntry::duration)
        .def_readwrite("success",       &AuditEntry::success)
        .def_readwrite("error_message", &AuditEntry::error_message)
        .def_readwrite("created_at",    &AuditEntry::created_at);

    py::class_<CoordinationSnapshot>(m, "CoordinationSnapshot")
        .def(py::init<>())
        .def_readwrite("timestamp",         &CoordinationSnapshot::timestamp)
        .def_readwrite("live_locks",        &CoordinationSnapshot::live_locks)
        .def_readwrite("pending_tasks",     &CoordinationSnapshot::pending_tasks)
        .def_readwrite("claimed_tasks",     &CoordinationSnapshot::claimed_tasks)
        .def_readwrite("active_sessions",   &CoordinationSnapshot::active_sessions)
        .def_readwrite("audit_queue_depth", &CoordinationSnapshot::audit_queue_depth);

    // ---- Requests & filters -----------------------------------------------

    py::class_<LockFilter>(m, "LockFilter")
        .def(py::init<>())
        .def_readwrite("keys",   &LockFilter::keys)
        .def_readwrite("holder", &LockFilter::holder);

    py::class_<AuditFilter>(m, "AuditFilter")
        .def(py::init<>())
        .def_readwrite("agent_id",  &AuditFilter::agent_id)
        .def_readwrite("operation", &AuditFilter::operation)
        .def_readwrite("since",     &AuditFilter::since)
        .def_readwrite("until",     &AuditFilter::until)
        .def_readwrite("limit",     &AuditFilter::limit);

    py::class_<TaskSpec>(m, "TaskSpec")
        .def(py::init<>())
        .def_readwrite("type",           &TaskSpec::type)
        .def_readwrite("description",    &TaskSpec::description)
        .def_readwrite("input",          &TaskSpec::input)
        .def_readwrite("priority",       &TaskSpec::priority)
        .def_readwrite("dependency_ids", &TaskSpec::dependency_ids)
        .def_readwrite("deadline",       &TaskSpec::deadline)
        .def_readwrite("max_attempts",   &TaskSpec::max_attempts);

    py::class_<Principal>(m, "Principal")
        .def(py::init<>())
        .def_readwrite("agent_id",   &Principal::agent_id)
        .def_readwrite("agent_type", &Principal::agent_type);

    py::class_<PolicyContext>(m, "PolicyContext")
        .def(py::init<>())
        .def_readwrite("trust_level",    &PolicyContext::trust_level)
        .def_readwrite("files_modified", &PolicyContext::files_modified)
        .def_readwrite("attributes",     &PolicyContext::attributes);

    py::class_<PolicyRequest>(m, "PolicyRequest")
        .def(py::init<>())
        .def_readwrite("principal", &PolicyRequest::principal)
        .def_readwrite("action",    &PolicyRequest::action)
        .def_readwrite("resource",  &PolicyRequest::resource)
        .def_readwrite("context",   &PolicyRequest::context);

    // ---- Component results ------------------------------------------------

    py::class_<LockResult>(m, "LockResult")
        .def(py::init<>())
        .def_readwrite("success", &LockResult::success)
        .def_readwrite("outcome", &LockResult::outcome)
        .def_readwrite("reason",  &LockResult::reason)
        .def_readwrite("message", &LockResult::message)
        .def_readwrite("lock",    &LockResult::lock);

    py::class_<SubmitResult>(m, "SubmitResult")
        .def(py::init<>())
        .def_readwrite("success", &SubmitResult::success)
        .def_readwrite("reason",  &SubmitResult::reason)
        .def_readwrite("message", &SubmitResult::message)
        .def_readwrite("task_id", &SubmitResult::task_id);

    py::class_<CompleteResult>(m, "CompleteResult")
        .def(py::init<>())
        .def_readwrite("success",    &CompleteResult::success)
        .def_readwrite("reason",     &CompleteResult::reason)
        .def_readwrite("message",    &CompleteResult::message)
        .def_readwrite("task",       &CompleteResult::task)
        .def_readwrite("requeued",   &CompleteResult::requeued)
        .def_readwrite("violations", &CompleteResult::violations);

    py::class_<GuardrailResult>(m, "GuardrailResult")
        .def(py::init<>())
        .def_readwrite("safe",          &GuardrailResult::safe)
        .def_readwrite("violations",    &GuardrailResult::violations)
        .def_readwrite("bypassed",      &GuardrailResult::bypassed)
        .def_readwrite("used_baseline", &GuardrailResult::used_baseline);

    py::class_<ReapResult>(m, "ReapResult")
        .def(py::init<>())
        .def_readwrite("agents_reaped",  &ReapResult::agents_reaped)
        .def_readwrite("locks_released", &ReapResult::locks_released)
        .def_readwrite("agent_ids",      &ReapResult::agent_ids);

    // ---- Monitoring -------------------------------------------------------

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",        &MonitorEvent::type)
        .def_readwrite("timestamp",   &MonitorEvent::timestamp)
        .def_readwrite("message",     &MonitorEvent::message)
        .def_readwrite("agent_id",    &MonitorEvent::agent_id)
        .def_readwrite("resource",    &MonitorEvent::resource)
        .def_readwrite("reason",      &MonitorEvent::reason)
        .def_readwrite("success",     &MonitorEvent::success)
        .def_readwrite("count",       &MonitorEvent::count)
        .def_readwrite("duration_us", &MonitorEvent::duration_us);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("locks_granted",               &MetricsMonitor::Metrics::locks_granted)
        .def_readwrite("locks_refreshed",             &MetricsMonitor::Metrics::locks_refreshed)
        .def_readwrite("locks_denied",                &MetricsMonitor::Metrics::locks_denied)
        .def_readwrite("locks_released",              &MetricsMonitor::Metrics::locks_released)
        .def_readwrite("tasks_submitted",             &MetricsMonitor::Metrics::tasks_submitted)
        .def_readwrite("tasks_claimed",               &MetricsMonitor::Metrics::tasks_claimed)
        .def_readwrite("tasks_completed",             &MetricsMonitor::Metrics::tasks_completed)
        .def_readwrite("tasks_failed",                &MetricsMonitor::Metrics::tasks_failed)
        .def_readwrite("tasks_requeued",              &MetricsMonitor::Metrics::tasks_requeued)
        .def_readwrite("completions_rejected",        &MetricsMonitor::Metrics::completions_rejected)
        .def_readwrite("guardrail_violations",        &MetricsMonitor::Metrics::guardrail_violations)
        .def_readwrite("guardrail_fallbacks",         &MetricsMonitor::Metrics::guardrail_fallbacks)
        .def_readwrite("policy_allowed",              &MetricsMonitor::Metrics::policy_allowed)
        .def_readwrite("policy_denied",               &MetricsMonitor::Metrics::policy_denied)
        .def_readwrite("policy_eval_avg_duration_us", &MetricsMonitor::Metrics::policy_eval_avg_duration_us)
        .def_readwrite("audit_entries_dropped",       &MetricsMonitor::Metrics::audit_entries_dropped)
        .def_readwrite("agents_reaped",               &MetricsMonitor::Metrics::agents_reaped)
        .def_readwrite("pending_tasks",               &MetricsMonitor::Metrics::pending_tasks)
        .def_readwrite("live_locks",                  &MetricsMonitor::Metrics::live_locks);

    // ---- Constants --------------------------------------------------------

    m.attr("PRIORITY_HIGHEST") = PRIORITY_HIGHEST;
    m.attr("PRIORITY_DEFAULT") = PRIORITY_DEFAULT;
    m.attr("PRIORITY_LOWEST")  = PRIORITY_LOWEST;

    m.attr("TRUST_SUSPENDED")  = TRUST_SUSPENDED;
    m.attr("TRUST_RESTRICTED") = TRUST_RESTRICTED;
    m.attr("TRUST_STANDARD")   = TRUST_STANDARD;
    m.attr("TRUST_ELEVATED")   = TRUST_ELEVATED;
    m.attr("TRUST_ADMIN")      = TRUST_ADMIN;
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_CoordinationError =
        py::register_exception<CoordinationException>(m, "CoordinationError", PyExc_RuntimeError);

    // Derived from CoordinationError
    static auto py_InvalidRequestError =
        py::register_exception<InvalidRequestException>(m, "InvalidRequestError", py_CoordinationError.ptr());
    static auto py_StoreError =
        py::register_exception<StoreException>(m, "StoreError", py_CoordinationError.ptr());
    static auto py_AuditImmutableError =
        py::register_exception<AuditImmutableException>(m, "AuditImmutableError", py_CoordinationError.ptr());
    static auto py_TaskNotFoundError =
        py::register_exception<TaskNotFoundException>(m, "TaskNotFoundError", py_CoordinationError.ptr());
    static auto py_SessionNotFoundError =
        py::register_exception<SessionNotFoundException>(m, "SessionNotFoundError", py_CoordinationError.ptr());
    static auto py_ConfigurationError =
        py::register_exception<ConfigurationException>(m, "ConfigurationError", py_CoordinationError.ptr());
    static auto py_PolicyParseError =
        py::register_exception<PolicyParseException>(m, "PolicyParseError", py_CoordinationError.ptr());
}
