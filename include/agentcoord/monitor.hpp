#pragma once

#include "agentcoord/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentcoord {

enum class EventType {
    // Lock manager
    LockGranted,
    LockRefreshed,
    LockDenied,
    LockReleased,
    LockReleaseDenied,
    LocksExpired,
    LocksCleanedUp,
    // Work queue
    TaskSubmitted,
    TaskClaimed,
    TaskCompleted,
    TaskFailed,
    TaskRequeued,
    TaskCancelled,
    TaskResubmitted,
    TaskDeadlineExceeded,
    TaskCompletionRejected,
    // Guardrails
    GuardrailViolationDetected,
    GuardrailBypassed,
    GuardrailFallbackActivated,
    GuardrailPatternInvalid,
    // Policy
    PolicyAllowed,
    PolicyDenied,
    PolicyFallbackActivated,
    PolicyDocumentInvalid,
    NetworkAccessChecked,
    // Audit
    AuditEntryDropped,
    AuditWriteFailed,
    AuditPurged,
    // Liveness
    SessionRegistered,
    SessionHeartbeat,
    AgentDisconnected,
    ReapCompleted
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<AgentId> agent_id;
    // Lock key, task id, pattern name or domain the event concerns
    std::optional<std::string> resource;
    std::optional<std::string> reason;
    std::optional<bool> success;
    std::optional<std::size_t> count;

    // Operation duration in microseconds (e.g., policy evaluation)
    std::optional<double> duration_us;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const CoordinationSnapshot& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const CoordinationSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t locks_granted{0};
        std::uint64_t locks_refreshed{0};
        std::uint64_t locks_denied{0};
        std::uint64_t locks_released{0};
        std::uint64_t tasks_submitted{0};
        std::uint64_t tasks_claimed{0};
        std::uint64_t tasks_completed{0};
        std::uint64_t tasks_failed{0};
        std::uint64_t tasks_requeued{0};
        std::uint64_t completions_rejected{0};
        std::uint64_t guardrail_violations{0};
        std::uint64_t guardrail_fallbacks{0};
        std::uint64_t policy_allowed{0};
        std::uint64_t policy_denied{0};
        double policy_eval_avg_duration_us{0.0};
        std::uint64_t audit_entries_dropped{0};
        std::uint64_t agents_reaped{0};
        std::size_t pending_tasks{0};
        std::size_t live_locks{0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const CoordinationSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    void set_pending_tasks_alert_threshold(std::size_t threshold, AlertCallback cb);
    void set_audit_drop_alert_threshold(std::uint64_t threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    std::size_t pending_tasks_threshold_{0};
    AlertCallback pending_tasks_cb_;
    std::uint64_t audit_drop_threshold_{0};
    AlertCallback audit_drop_cb_;

    // Policy evaluation duration tracking
    std::uint64_t policy_eval_count_{0};
    double policy_eval_duration_sum_us_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const CoordinationSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace agentcoord
