#include "agentcoord/monitor.hpp"

#include <iostream>

namespace agentcoord {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::LockGranted:                return "LockGranted";
        case EventType::LockRefreshed:              return "LockRefreshed";
        case EventType::LockDenied:                 return "LockDenied";
        case EventType::LockReleased:               return "LockReleased";
        case EventType::LockReleaseDenied:          return "LockReleaseDenied";
        case EventType::LocksExpired:               return "LocksExpired";
        case EventType::LocksCleanedUp:             return "LocksCleanedUp";
        case EventType::TaskSubmitted:              return "TaskSubmitted";
        case EventType::TaskClaimed:                return "TaskClaimed";
        case EventType::TaskCompleted:              return "TaskCompleted";
        case EventType::TaskFailed:                 return "TaskFailed";
        case EventType::TaskRequeued:               return "TaskRequeued";
        case EventType::TaskCancelled:              return "TaskCancelled";
        case EventType::TaskResubmitted:            return "TaskResubmitted";
        case EventType::TaskDeadlineExceeded:       return "TaskDeadlineExceeded";
        case EventType::TaskCompletionRejected:     return "TaskCompletionRejected";
        case EventType::GuardrailViolationDetected: return "GuardrailViolationDetected";
        case EventType::GuardrailBypassed:          return "GuardrailBypassed";
        case EventType::GuardrailFallbackActivated: return "GuardrailFallbackActivated";
        case EventType::GuardrailPatternInvalid:    return "GuardrailPatternInvalid";
        case EventType::PolicyAllowed:              return "PolicyAllowed";
        case EventType::PolicyDenied:               return "PolicyDenied";
        case EventType::PolicyFallbackActivated:    return "PolicyFallbackActivated";
        case EventType::PolicyDocumentInvalid:      return "PolicyDocumentInvalid";
        case EventType::NetworkAccessChecked:       return "NetworkAccessChecked";
        case EventType::AuditEntryDropped:          return "AuditEntryDropped";
        case EventType::AuditWriteFailed:           return "AuditWriteFailed";
        case EventType::AuditPurged:                return "AuditPurged";
        case EventType::SessionRegistered:          return "SessionRegistered";
        case EventType::SessionHeartbeat:           return "SessionHeartbeat";
        case EventType::AgentDisconnected:          return "AgentDisconnected";
        case EventType::ReapCompleted:              return "ReapCompleted";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::LockDenied:
        case EventType::LocksCleanedUp:
        case EventType::TaskFailed:
        case EventType::TaskDeadlineExceeded:
        case EventType::TaskCompletionRejected:
        case EventType::GuardrailViolationDetected:
        case EventType::GuardrailFallbackActivated:
        case EventType::GuardrailPatternInvalid:
        case EventType::PolicyDenied:
        case EventType::PolicyFallbackActivated:
        case EventType::PolicyDocumentInvalid:
        case EventType::AuditEntryDropped:
        case EventType::AuditWriteFailed:
        case EventType::AgentDisconnected:
            return true;
        default:
            return false;
    }
}

// Chatty events only shown at Debug
bool is_debug_event(EventType t) {
    return t == EventType::SessionHeartbeat || t == EventType::NetworkAccessChecked;
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && is_debug_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[AgentCoord] " << to_string(event.type);

    if (event.agent_id.has_value()) {
        std::cout << " agent=" << event.agent_id.value();
    }
    if (event.resource.has_value()) {
        std::cout << " resource=" << event.resource.value();
    }
    if (event.reason.has_value()) {
        std::cout << " reason=" << event.reason.value();
    }
    if (event.success.has_value()) {
        std::cout << " success=" << (event.success.value() ? "true" : "false");
    }
    if (event.count.has_value()) {
        std::cout << " count=" << event.count.value();
    }
    if (verbosity_ == Verbosity::Debug && event.duration_us.has_value()) {
        std::cout << " duration_us=" << event.duration_us.value();
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_snapshot(const CoordinationSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "\n[AgentCoord] === Coordination Snapshot ===\n";
    std::cout << "  Live locks: " << snapshot.live_locks << "\n";
    std::cout << "  Pending tasks: " << snapshot.pending_tasks << "\n";
    std::cout << "  Claimed tasks: " << snapshot.claimed_tasks << "\n";
    std::cout << "  Active sessions: " << snapshot.active_sessions << "\n";
    std::cout << "  Audit queue depth: " << snapshot.audit_queue_depth << "\n";
    std::cout << "  ==============================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    AlertCallback fire;
    std::string alert;

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        switch (event.type) {
            case EventType::LockGranted:
                metrics_.locks_granted++;
                break;
            case EventType::LockRefreshed:
                metrics_.locks_refreshed++;
                break;
            case EventType::LockDenied:
                metrics_.locks_denied++;
                break;
            case EventType::LockReleased:
                metrics_.locks_released++;
                break;
            case EventType::LocksExpired:
            case EventType::LocksCleanedUp:
                metrics_.locks_released += event.count.value_or(0);
                break;
            case EventType::TaskSubmitted:
            case EventType::TaskResubmitted:
                metrics_.tasks_submitted++;
                break;
            case EventType::TaskClaimed:
                metrics_.tasks_claimed++;
                break;
            case EventType::TaskCompleted:
                metrics_.tasks_completed++;
                break;
            case EventType::TaskFailed:
                metrics_.tasks_failed++;
                break;
            case EventType::TaskRequeued:
                metrics_.tasks_requeued++;
                break;
            case EventType::TaskCompletionRejected:
                metrics_.completions_rejected++;
                break;
            case EventType::GuardrailViolationDetected:
                metrics_.guardrail_violations += event.count.value_or(1);
                break;
            case EventType::GuardrailFallbackActivated:
                metrics_.guardrail_fallbacks++;
                break;
            case EventType::PolicyAllowed:
            case EventType::PolicyDenied:
                if (event.type == EventType::PolicyAllowed) {
                    metrics_.policy_allowed++;
                } else {
                    metrics_.policy_denied++;
                }
                if (event.duration_us.has_value()) {
                    policy_eval_count_++;
                    policy_eval_duration_sum_us_ += event.duration_us.value();
                    metrics_.policy_eval_avg_duration_us =
                        policy_eval_duration_sum_us_ / static_cast<double>(policy_eval_count_);
                }
                break;
            case EventType::AuditEntryDropped:
                metrics_.audit_entries_dropped += event.count.value_or(1);
                if (audit_drop_cb_ && metrics_.audit_entries_dropped > audit_drop_threshold_) {
                    fire = audit_drop_cb_;
                    alert = "Audit entries dropped " +
                            std::to_string(metrics_.audit_entries_dropped) +
                            " exceeds threshold " + std::to_string(audit_drop_threshold_);
                }
                break;
            case EventType::ReapCompleted:
                metrics_.agents_reaped += event.count.value_or(0);
                break;
            default:
                break;
        }
    }

    // Outside the lock: the callback may call back into the monitor
    if (fire) {
        fire(alert);
    }
}

void MetricsMonitor::on_snapshot(const CoordinationSnapshot& snapshot) {
    AlertCallback fire;
    std::string alert;

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        metrics_.pending_tasks = snapshot.pending_tasks;
        metrics_.live_locks = snapshot.live_locks;

        if (pending_tasks_cb_ && snapshot.pending_tasks > pending_tasks_threshold_) {
            fire = pending_tasks_cb_;
            alert = "Pending tasks " + std::to_string(snapshot.pending_tasks) +
                    " exceeds threshold " + std::to_string(pending_tasks_threshold_);
        }
    }

    if (fire) {
        fire(alert);
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    policy_eval_count_ = 0;
    policy_eval_duration_sum_us_ = 0.0;
}

void MetricsMonitor::set_pending_tasks_alert_threshold(std::size_t threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    pending_tasks_threshold_ = threshold;
    pending_tasks_cb_ = std::move(cb);
}

void MetricsMonitor::set_audit_drop_alert_threshold(std::uint64_t threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    audit_drop_threshold_ = threshold;
    audit_drop_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const CoordinationSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace agentcoord
