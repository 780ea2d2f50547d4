#include "agentcoord/work_queue.hpp"
#include "agentcoord/exceptions.hpp"
#include "util.hpp"

namespace agentcoord {

WorkQueue::WorkQueue(std::shared_ptr<CoordinationStore> store,
                     QueueConfig config,
                     std::shared_ptr<GuardrailEngine> guardrails,
                     std::shared_ptr<Monitor> monitor)
    : store_(std::move(store))
    , config_(std::move(config))
    , guardrails_(std::move(guardrails))
    , monitor_(std::move(monitor))
{
    if (!store_) {
        throw InvalidRequestException("WorkQueue requires a store");
    }
}

void WorkQueue::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

// ========== Submission ==========

SubmitResult WorkQueue::submit(const TaskSpec& spec) {
    SubmitResult result;

    if (spec.type.empty()) {
        result.reason = ReasonCode::InvalidRequest;
        result.message = "task type is required";
        return result;
    }

    TaskPriority priority = spec.priority.value_or(config_.default_priority);
    if (priority < PRIORITY_HIGHEST || priority > PRIORITY_LOWEST) {
        result.reason = ReasonCode::InvalidPriority;
        result.message = "priority must be between " + std::to_string(PRIORITY_HIGHEST) +
                         " and " + std::to_string(PRIORITY_LOWEST);
        return result;
    }

    std::int32_t max_attempts = spec.max_attempts.value_or(config_.default_max_attempts);
    if (max_attempts < 1) {
        result.reason = ReasonCode::InvalidRequest;
        result.message = "max_attempts must be at least 1";
        return result;
    }

    if (!spec.dependency_ids.empty()) {
        result.missing_dependencies = store_->missing_tasks(spec.dependency_ids);
        if (!result.missing_dependencies.empty()) {
            result.reason = ReasonCode::UnknownDependency;
            result.message = "unknown dependencies: " + detail::join(result.missing_dependencies, ',');
            return result;
        }
    }

    Task task;
    task.id = detail::generate_uuid();
    task.type = spec.type;
    task.description = spec.description;
    task.input = spec.input;
    task.priority = priority;
    task.dependency_ids = spec.dependency_ids;
    task.max_attempts = max_attempts;
    task.deadline = spec.deadline;
    task.created_at = current_time();

    store_->insert_task(task);

    result.success = true;
    result.task_id = task.id;
    emit_event(EventType::TaskSubmitted,
               task.type + " task submitted at priority " + std::to_string(priority),
               std::nullopt, task.id);
    return result;
}

// ========== Claiming ==========

ClaimResult WorkQueue::claim(const AgentId& requester,
                             const std::vector<std::string>& accepted_types) {
    ClaimResult result;
    if (requester.empty()) {
        result.reason = ReasonCode::InvalidRequest;
        return result;
    }

    ClaimRequest request;
    request.claimant = requester;
    request.accepted_types = accepted_types;
    request.now = current_time();

    auto outcome = store_->claim_task(request);
    result.deadline_expired = outcome.deadline_expired;

    for (const auto& id : outcome.deadline_expired) {
        emit_event(EventType::TaskDeadlineExceeded, "Pending task failed: deadline_exceeded",
                   std::nullopt, id, "deadline_exceeded");
    }

    if (!outcome.task) {
        result.reason = ReasonCode::NoTasksAvailable;
        return result;
    }

    result.success = true;
    result.task = std::move(outcome.task);
    emit_event(EventType::TaskClaimed,
               result.task->type + " task claimed (attempt " +
               std::to_string(result.task->attempt_count) + ")",
               requester, result.task->id);
    return result;
}

// ========== Completion ==========

CompleteResult WorkQueue::complete(const CompletionReport& report) {
    CompleteResult result;

    if (report.task_id.empty() || report.claimant.empty()) {
        result.reason = ReasonCode::InvalidRequest;
        return result;
    }

    auto current = store_->get_task(report.task_id);
    if (!current) {
        result.reason = ReasonCode::TaskNotFound;
        return result;
    }
    if (current->status != TaskStatus::Claimed || current->claimant != report.claimant) {
        result.reason = ReasonCode::TaskNotClaimedByAgent;
        result.message = std::string("task is ") + to_string(current->status) +
                         (current->claimant ? " by " + *current->claimant : std::string());
        result.task = std::move(current);
        emit_event(EventType::TaskCompletionRejected, result.message,
                   report.claimant, report.task_id, to_string(result.reason));
        return result;
    }

    // A successful result is only recorded if it passes the guardrails
    if (report.success && guardrails_ && config_.guardrail_check_results) {
        auto verdict = guardrails_->check(report.result, report.trust_level, {}, report.claimant);
        if (!verdict.safe) {
            result.reason = ReasonCode::GuardrailViolation;
            result.message = "result matched " + std::to_string(verdict.violations.size()) +
                             " guardrail pattern(s)";
            result.violations = std::move(verdict.violations);
            result.task = std::move(current);
            emit_event(EventType::TaskCompletionRejected, result.message,
                       report.claimant, report.task_id, to_string(result.reason));
            return result;
        }
    }

    TaskCompletion completion;
    completion.task_id = report.task_id;
    completion.claimant = report.claimant;
    completion.success = report.success;
    completion.result = report.result;
    completion.error = report.error;
    completion.requeue_on_failure = config_.retry_policy == RetryPolicy::RequeueUntilExhausted;
    completion.now = current_time();

    auto record = store_->complete_task(completion);
    result.task = std::move(record.task);

    switch (record.outcome) {
        case CompletionOutcome::Completed:
            result.success = true;
            emit_event(EventType::TaskCompleted, "Task completed", report.claimant, report.task_id);
            break;
        case CompletionOutcome::Failed:
            result.success = true;
            emit_event(EventType::TaskFailed, "Task failed: " + report.error,
                       report.claimant, report.task_id);
            break;
        case CompletionOutcome::Requeued:
            result.success = true;
            result.requeued = true;
            emit_event(EventType::TaskRequeued, "Task returned to pending after failure: " + report.error,
                       report.claimant, report.task_id);
            break;
        case CompletionOutcome::NotFound:
            result.reason = ReasonCode::TaskNotFound;
            break;
        case CompletionOutcome::NotClaimant:
            // Lost a race with cancel or another completion
            result.reason = ReasonCode::TaskNotClaimedByAgent;
            emit_event(EventType::TaskCompletionRejected, "Task changed before completion",
                       report.claimant, report.task_id, to_string(result.reason));
            break;
    }
    return result;
}

CancelResult WorkQueue::cancel(const TaskId& task_id) {
    CancelResult result;
    switch (store_->cancel_task(task_id, current_time())) {
        case CancelOutcome::Cancelled:
            result.cancelled = true;
            emit_event(EventType::TaskCancelled, "Task cancelled", std::nullopt, task_id);
            break;
        case CancelOutcome::NotFound:
            result.reason = ReasonCode::TaskNotFound;
            break;
        case CancelOutcome::AlreadyTerminal:
            result.reason = ReasonCode::TaskAlreadyTerminal;
            break;
    }
    return result;
}

SubmitResult WorkQueue::resubmit(const TaskId& task_id) {
    SubmitResult result;

    auto original = store_->get_task(task_id);
    if (!original) {
        result.reason = ReasonCode::TaskNotFound;
        return result;
    }
    if (original->status != TaskStatus::Failed && original->status != TaskStatus::Cancelled) {
        result.reason = ReasonCode::TaskNotFailed;
        result.message = std::string("task is ") + to_string(original->status);
        return result;
    }

    auto now = current_time();
    Task replacement;
    replacement.id = detail::generate_uuid();
    replacement.type = original->type;
    replacement.description = original->description;
    replacement.input = original->input;
    replacement.priority = original->priority;
    replacement.dependency_ids = original->dependency_ids;
    replacement.max_attempts = original->max_attempts;
    // An elapsed deadline is not carried over
    if (original->deadline && *original->deadline > now) {
        replacement.deadline = original->deadline;
    }
    replacement.created_at = now;

    switch (store_->replace_task(task_id, replacement)) {
        case ReplaceOutcome::Replaced:
            result.success = true;
            result.task_id = replacement.id;
            emit_event(EventType::TaskResubmitted, "Replaces task " + task_id,
                       std::nullopt, replacement.id);
            break;
        case ReplaceOutcome::NotFound:
            result.reason = ReasonCode::TaskNotFound;
            break;
        case ReplaceOutcome::NotFailed:
            result.reason = ReasonCode::TaskNotFailed;
            break;
    }
    return result;
}

// ========== Queries ==========

std::optional<Task> WorkQueue::get(const TaskId& task_id) const {
    return store_->get_task(task_id);
}

std::vector<Task> WorkQueue::pending(std::size_t limit) const {
    TaskFilter filter;
    filter.status = TaskStatus::Pending;
    filter.limit = limit == 0 ? config_.pending_listing_limit : limit;
    return store_->list_tasks(filter);
}

std::vector<Task> WorkQueue::claimed_by(const AgentId& agent_id) const {
    TaskFilter filter;
    filter.status = TaskStatus::Claimed;
    filter.claimant = agent_id;
    return store_->list_tasks(filter);
}

void WorkQueue::emit_event(EventType type, const std::string& message,
                           std::optional<AgentId> agent_id,
                           std::optional<std::string> resource,
                           std::optional<std::string> reason,
                           std::optional<std::size_t> count) {
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
    event.count = count;
    mon->on_event(event);
}

} // namespace agentcoord
