#include "agentcoord/memory_store.hpp"
#include "agentcoord/exceptions.hpp"

#include <algorithm>
#include <set>

namespace agentcoord {

namespace {

bool claim_order(const Task& a, const Task& b) {
    if (a.priority != b.priority) {
        return a.priority < b.priority;
    }
    return a.created_at < b.created_at;
}

bool type_accepted(const Task& task, const std::vector<std::string>& accepted) {
    return accepted.empty() ||
           std::find(accepted.begin(), accepted.end(), task.type) != accepted.end();
}

} // anonymous namespace

MemoryStore::MemoryStore() = default;

// ========== Locks ==========

LockAcquireOutcome MemoryStore::acquire_lock(const Lock& candidate, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    LockAcquireOutcome outcome;
    outcome.expired_purged = purge_expired_locks_locked(now);

    auto [it, inserted] = locks_.try_emplace(candidate.resource_key, candidate);
    if (inserted) {
        outcome.outcome = LockOutcome::Granted;
        outcome.lock = it->second;
        return outcome;
    }

    Lock& existing = it->second;
    if (existing.holder_id == candidate.holder_id) {
        existing.expires_at = candidate.expires_at;
        existing.session_id = candidate.session_id;
        existing.holder_type = candidate.holder_type;
        if (!candidate.reason.empty()) {
            existing.reason = candidate.reason;
        }
        if (!candidate.metadata.empty()) {
            existing.metadata = candidate.metadata;
        }
        outcome.outcome = LockOutcome::Refreshed;
        outcome.lock = existing;
        return outcome;
    }

    outcome.outcome = LockOutcome::Denied;
    outcome.lock = existing;
    return outcome;
}

bool MemoryStore::release_lock(const ResourceKey& key, const AgentId& holder) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(key);
    if (it == locks_.end() || it->second.holder_id != holder) {
        return false;
    }
    locks_.erase(it);
    return true;
}

std::size_t MemoryStore::release_locks_held_by(const AgentId& holder) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (auto it = locks_.begin(); it != locks_.end();) {
        if (it->second.holder_id == holder) {
            it = locks_.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    return count;
}

std::size_t MemoryStore::purge_expired_locks(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return purge_expired_locks_locked(now);
}

std::vector<Lock> MemoryStore::list_live_locks(const LockFilter& filter, Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Lock> result;
    for (const auto& [key, held] : locks_) {
        if (!held.is_live(now)) continue;
        if (!filter.keys.empty() &&
            std::find(filter.keys.begin(), filter.keys.end(), key) == filter.keys.end()) {
            continue;
        }
        if (filter.holder && held.holder_id != *filter.holder) continue;
        result.push_back(held);
    }
    std::sort(result.begin(), result.end(), [](const Lock& a, const Lock& b) {
        if (a.acquired_at != b.acquired_at) return a.acquired_at > b.acquired_at;
        return a.resource_key < b.resource_key;
    });
    return result;
}

std::size_t MemoryStore::purge_expired_locks_locked(Timestamp now) {
    std::size_t count = 0;
    for (auto it = locks_.begin(); it != locks_.end();) {
        if (!it->second.is_live(now)) {
            it = locks_.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    return count;
}

// ========== Tasks ==========

void MemoryStore::insert_task(const Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    insert_task_locked(task);
}

void MemoryStore::insert_task_locked(const Task& task) {
    if (task_index_.count(task.id) != 0) {
        throw InvalidRequestException("Duplicate task id: " + task.id);
    }
    task_index_[task.id] = tasks_.size();
    tasks_.push_back(task);
}

std::vector<TaskId> MemoryStore::missing_tasks(const std::vector<TaskId>& ids) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskId> missing;
    for (const auto& id : ids) {
        if (task_index_.count(id) == 0) {
            missing.push_back(id);
        }
    }
    return missing;
}

ClaimOutcome MemoryStore::claim_task(const ClaimRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    ClaimOutcome outcome;

    // Lazily fail pending tasks whose deadline has passed
    for (auto& task : tasks_) {
        if (task.status == TaskStatus::Pending && task.deadline &&
            *task.deadline < request.now) {
            task.status = TaskStatus::Failed;
            task.error = "deadline_exceeded";
            task.completed_at = request.now;
            outcome.deadline_expired.push_back(task.id);
        }
    }

    Task* best = nullptr;
    for (auto& task : tasks_) {
        if (task.status != TaskStatus::Pending) continue;
        if (!type_accepted(task, request.accepted_types)) continue;
        if (!dependencies_completed_locked(task)) continue;
        // Strict comparison keeps the earlier-inserted task on full ties
        if (best == nullptr || claim_order(task, *best)) {
            best = &task;
        }
    }

    if (best == nullptr) {
        return outcome;
    }

    best->status = TaskStatus::Claimed;
    best->claimant = request.claimant;
    best->claimed_at = request.now;
    best->attempt_count++;
    outcome.task = *best;
    return outcome;
}

CompletionRecord MemoryStore::complete_task(const TaskCompletion& completion) {
    std::lock_guard<std::mutex> lock(mutex_);
    CompletionRecord record;

    Task* task = find_task_locked(completion.task_id);
    if (task == nullptr) {
        record.outcome = CompletionOutcome::NotFound;
        return record;
    }
    if (task->status != TaskStatus::Claimed || task->claimant != completion.claimant) {
        record.outcome = CompletionOutcome::NotClaimant;
        record.task = *task;
        return record;
    }

    if (completion.success) {
        task->status = TaskStatus::Completed;
        task->result = completion.result;
        task->error.reset();
        task->completed_at = completion.now;
        record.outcome = CompletionOutcome::Completed;
    } else if (completion.requeue_on_failure && task->attempt_count < task->max_attempts) {
        task->status = TaskStatus::Pending;
        task->claimant.reset();
        task->claimed_at.reset();
        task->error = completion.error;
        record.outcome = CompletionOutcome::Requeued;
    } else {
        task->status = TaskStatus::Failed;
        task->error = completion.error;
        if (!completion.result.empty()) {
            task->result = completion.result;
        }
        task->completed_at = completion.now;
        record.outcome = CompletionOutcome::Failed;
    }

    record.task = *task;
    return record;
}

CancelOutcome MemoryStore::cancel_task(const TaskId& id, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    Task* task = find_task_locked(id);
    if (task == nullptr) {
        return CancelOutcome::NotFound;
    }
    if (is_terminal(task->status)) {
        return CancelOutcome::AlreadyTerminal;
    }
    task->status = TaskStatus::Cancelled;
    task->completed_at = now;
    return CancelOutcome::Cancelled;
}

ReplaceOutcome MemoryStore::replace_task(const TaskId& old_id, const Task& replacement) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Task* old_task = find_task_locked(old_id);
    if (old_task == nullptr) {
        return ReplaceOutcome::NotFound;
    }
    if (old_task->status != TaskStatus::Failed && old_task->status != TaskStatus::Cancelled) {
        return ReplaceOutcome::NotFailed;
    }

    insert_task_locked(replacement);

    for (auto& task : tasks_) {
        if (task.status != TaskStatus::Pending) continue;
        std::replace(task.dependency_ids.begin(), task.dependency_ids.end(),
                     old_id, replacement.id);
    }
    return ReplaceOutcome::Replaced;
}

std::optional<Task> MemoryStore::get_task(const TaskId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Task* task = find_task_locked(id);
    if (task == nullptr) {
        return std::nullopt;
    }
    return *task;
}

std::vector<Task> MemoryStore::list_tasks(const TaskFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Task> result;
    for (const auto& task : tasks_) {
        if (filter.status && task.status != *filter.status) continue;
        if (filter.claimant && task.claimant != *filter.claimant) continue;
        result.push_back(task);
    }
    std::stable_sort(result.begin(), result.end(), claim_order);
    if (filter.limit > 0 && result.size() > filter.limit) {
        result.resize(filter.limit);
    }
    return result;
}

Task* MemoryStore::find_task_locked(const TaskId& id) {
    auto it = task_index_.find(id);
    return it == task_index_.end() ? nullptr : &tasks_[it->second];
}

const Task* MemoryStore::find_task_locked(const TaskId& id) const {
    auto it = task_index_.find(id);
    return it == task_index_.end() ? nullptr : &tasks_[it->second];
}

bool MemoryStore::dependencies_completed_locked(const Task& task) const {
    for (const auto& dep_id : task.dependency_ids) {
        const Task* dep = find_task_locked(dep_id);
        if (dep == nullptr || dep->status != TaskStatus::Completed) {
            return false;
        }
    }
    return true;
}

// ========== Sessions ==========

void MemoryStore::upsert_session(const AgentSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session.id);
    if (it == sessions_.end()) {
        sessions_.emplace(session.id, session);
        return;
    }
    // Re-registration keeps the original start time
    Timestamp started = it->second.started_at;
    it->second = session;
    it->second.started_at = started;
}

std::optional<AgentSession> MemoryStore::touch_session(
    const SessionId& id, Timestamp now,
    std::optional<SessionStatus> status,
    std::optional<std::string> current_task) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    it->second.last_heartbeat = now;
    it->second.status = status.value_or(SessionStatus::Active);
    if (current_task) {
        it->second.current_task = std::move(current_task);
    }
    return it->second;
}

std::optional<AgentSession> MemoryStore::get_session(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AgentSession> MemoryStore::list_sessions(const SessionFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentSession> result;
    for (const auto& [id, session] : sessions_) {
        if (filter.status) {
            if (session.status != *filter.status) continue;
        } else if (session.status == SessionStatus::Disconnected) {
            continue;
        }
        if (filter.agent_id && session.agent_id != *filter.agent_id) continue;
        if (filter.capability &&
            std::find(session.capabilities.begin(), session.capabilities.end(),
                      *filter.capability) == session.capabilities.end()) {
            continue;
        }
        result.push_back(session);
    }
    std::sort(result.begin(), result.end(), [](const AgentSession& a, const AgentSession& b) {
        if (a.last_heartbeat != b.last_heartbeat) return a.last_heartbeat > b.last_heartbeat;
        return a.id < b.id;
    });
    return result;
}

std::vector<ReapedAgent> MemoryStore::reap_stale_sessions(Timestamp cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<AgentId> agents;
    for (auto& [id, session] : sessions_) {
        if (session.status == SessionStatus::Disconnected) continue;
        if (session.last_heartbeat < cutoff) {
            session.status = SessionStatus::Disconnected;
            agents.insert(session.agent_id);
        }
    }

    std::vector<ReapedAgent> reaped;
    for (const auto& agent_id : agents) {
        ReapedAgent agent;
        agent.agent_id = agent_id;
        for (auto it = locks_.begin(); it != locks_.end();) {
            if (it->second.holder_id == agent_id) {
                it = locks_.erase(it);
                ++agent.locks_released;
            } else {
                ++it;
            }
        }
        reaped.push_back(std::move(agent));
    }
    return reaped;
}

// ========== Audit ==========

void MemoryStore::append_audit(const std::vector<AuditEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    audit_.insert(audit_.end(), entries.begin(), entries.end());
}

std::vector<AuditEntry> MemoryStore::query_audit(const AuditFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditEntry> result;
    for (auto it = audit_.rbegin(); it != audit_.rend(); ++it) {
        const auto& entry = *it;
        if (filter.agent_id && entry.agent_id != *filter.agent_id) continue;
        if (filter.operation && entry.operation != *filter.operation) continue;
        if (filter.since && entry.created_at < *filter.since) continue;
        if (filter.until && entry.created_at > *filter.until) continue;
        result.push_back(entry);
    }
    // Newest first; equal timestamps keep reverse insertion order
    std::stable_sort(result.begin(), result.end(), [](const AuditEntry& a, const AuditEntry& b) {
        return a.created_at > b.created_at;
    });
    if (filter.limit > 0 && result.size() > filter.limit) {
        result.resize(filter.limit);
    }
    return result;
}

std::size_t MemoryStore::purge_audit_before(Timestamp cutoff, Duration min_retention) {
    cutoff = std::min(cutoff, current_time() - std::max(min_retention, Duration::zero()));

    std::lock_guard<std::mutex> lock(mutex_);
    auto before = audit_.size();
    audit_.erase(std::remove_if(audit_.begin(), audit_.end(),
                                [cutoff](const AuditEntry& e) { return e.created_at < cutoff; }),
                 audit_.end());
    return before - audit_.size();
}

// ========== Registries ==========

std::vector<GuardrailPattern> MemoryStore::load_guardrail_patterns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GuardrailPattern> result;
    for (const auto& [name, pattern] : patterns_) {
        if (pattern.enabled) {
            result.push_back(pattern);
        }
    }
    return result;
}

void MemoryStore::upsert_guardrail_pattern(const GuardrailPattern& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    patterns_[pattern.name] = pattern;
}

void MemoryStore::record_violations(const std::vector<GuardrailViolation>& violations) {
    std::lock_guard<std::mutex> lock(mutex_);
    violations_.insert(violations_.end(), violations.begin(), violations.end());
}

std::vector<GuardrailViolation> MemoryStore::list_violations(
    const std::optional<AgentId>& agent_id, std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GuardrailViolation> result;
    for (auto it = violations_.rbegin(); it != violations_.rend(); ++it) {
        if (agent_id && it->agent_id != *agent_id) continue;
        result.push_back(*it);
        if (limit > 0 && result.size() >= limit) break;
    }
    return result;
}

std::optional<AgentProfile> MemoryStore::find_profile(const AgentId& agent_id,
                                                      const std::string& agent_type) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const AgentProfile* found = nullptr;
    auto assigned = assignments_.find(agent_id);
    if (assigned != assignments_.end()) {
        for (const auto& profile : profiles_) {
            if (profile.name == assigned->second && profile.enabled) {
                found = &profile;
                break;
            }
        }
    }
    if (found == nullptr) {
        for (const auto& profile : profiles_) {
            if (profile.agent_type == agent_type && profile.enabled) {
                found = &profile;
                break;
            }
        }
    }
    if (found == nullptr) {
        return std::nullopt;
    }

    AgentProfile profile = *found;
    profile.network_overrides.clear();
    for (const auto& policy : network_policies_) {
        if (policy.enabled && policy.profile_name == profile.name) {
            profile.network_overrides.push_back(policy);
        }
    }
    return profile;
}

void MemoryStore::upsert_profile(const AgentProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& existing : profiles_) {
        if (existing.name == profile.name) {
            existing = profile;
            return;
        }
    }
    profiles_.push_back(profile);
}

void MemoryStore::assign_profile(const AgentId& agent_id, const std::string& profile_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool known = std::any_of(profiles_.begin(), profiles_.end(),
                             [&](const AgentProfile& p) { return p.name == profile_name; });
    if (!known) {
        throw InvalidRequestException("Unknown profile: " + profile_name);
    }
    assignments_[agent_id] = profile_name;
}

std::vector<NetworkAccessPolicy> MemoryStore::load_network_policies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NetworkAccessPolicy> result;
    for (const auto& policy : network_policies_) {
        if (policy.enabled) {
            result.push_back(policy);
        }
    }
    return result;
}

void MemoryStore::upsert_network_policy(const NetworkAccessPolicy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& existing : network_policies_) {
        if (existing.domain_pattern == policy.domain_pattern &&
            existing.profile_name == policy.profile_name) {
            existing = policy;
            return;
        }
    }
    network_policies_.push_back(policy);
}

std::vector<PolicyDocument> MemoryStore::load_policy_documents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PolicyDocument> result;
    for (const auto& [name, document] : policy_documents_) {
        if (document.enabled) {
            result.push_back(document);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const PolicyDocument& a, const PolicyDocument& b) {
                         return a.priority < b.priority;
                     });
    return result;
}

void MemoryStore::upsert_policy_document(const PolicyDocument& document) {
    std::lock_guard<std::mutex> lock(mutex_);
    policy_documents_[document.name] = document;
}

} // namespace agentcoord
