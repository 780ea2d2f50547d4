#pragma once

#include "agentcoord/types.hpp"
#include "agentcoord/config.hpp"
#include "agentcoord/guardrail_engine.hpp"
#include "agentcoord/monitor.hpp"
#include "agentcoord/store.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentcoord {

struct TaskSpec {
    std::string type;
    std::string description;
    std::string input;
    std::optional<TaskPriority> priority;      // unset = QueueConfig::default_priority
    std::vector<TaskId> dependency_ids;
    std::optional<Timestamp> deadline;
    std::optional<std::int32_t> max_attempts;  // unset = QueueConfig::default_max_attempts
};

struct SubmitResult {
    bool success{false};
    ReasonCode reason{ReasonCode::Ok};
    std::string message;
    TaskId task_id;
    std::vector<TaskId> missing_dependencies;
};

struct ClaimResult {
    bool success{false};
    ReasonCode reason{ReasonCode::Ok};
    std::optional<Task> task;

    // Pending tasks this claim failed because their deadline had passed
    std::vector<TaskId> deadline_expired;
};

struct CompletionReport {
    TaskId task_id;
    AgentId claimant;
    bool success{true};
    std::string result;
    std::string error;

    // Trust level the result is scanned at
    TrustLevel trust_level{TRUST_STANDARD};
};

struct CompleteResult {
    bool success{false};
    ReasonCode reason{ReasonCode::Ok};
    std::string message;
    std::optional<Task> task;  // state after the update
    bool requeued{false};
    std::vector<GuardrailViolation> violations;
};

struct CancelResult {
    bool cancelled{false};
    ReasonCode reason{ReasonCode::Ok};
};

// Priority and dependency aware task queue. Claims are exactly-once: the
// store hands a given pending task to a single caller.
class WorkQueue {
public:
    explicit WorkQueue(std::shared_ptr<CoordinationStore> store,
                       QueueConfig config = {},
                       std::shared_ptr<GuardrailEngine> guardrails = nullptr,
                       std::shared_ptr<Monitor> monitor = nullptr);
    ~WorkQueue() = default;

    // Non-copyable
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void set_monitor(std::shared_ptr<Monitor> monitor);

    SubmitResult submit(const TaskSpec& spec);

    // Best eligible task: lowest priority value, then oldest
    ClaimResult claim(const AgentId& requester,
                      const std::vector<std::string>& accepted_types = {});

    CompleteResult complete(const CompletionReport& report);

    // Advisory: in-flight work must observe the state itself
    CancelResult cancel(const TaskId& task_id);

    // New pending copy of a failed or cancelled task; pending dependents
    // are pointed at the copy.
    SubmitResult resubmit(const TaskId& task_id);

    // ==================== Queries ====================
    std::optional<Task> get(const TaskId& task_id) const;

    // Pending tasks in claim order; 0 = QueueConfig::pending_listing_limit
    std::vector<Task> pending(std::size_t limit = 0) const;

    std::vector<Task> claimed_by(const AgentId& agent_id) const;

    const QueueConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<CoordinationStore> store_;
    QueueConfig config_;
    std::shared_ptr<GuardrailEngine> guardrails_;
    mutable std::mutex mutex_;
    std::shared_ptr<Monitor> monitor_;

    void emit_event(EventType type, const std::string& message,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<std::string> resource = std::nullopt,
                    std::optional<std::string> reason = std::nullopt,
                    std::optional<std::size_t> count = std::nullopt);
};

} // namespace agentcoord
