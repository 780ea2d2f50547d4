#include "agentcoord/lock_manager.hpp"
#include "agentcoord/exceptions.hpp"

#include <chrono>

namespace agentcoord {

namespace {

std::string describe_holder(const Lock& lock) {
    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
        lock.expires_at - current_time());
    std::string text = "held by " + lock.holder_id;
    if (!lock.holder_type.empty()) {
        text += " (" + lock.holder_type + ")";
    }
    if (!lock.reason.empty()) {
        text += " for '" + lock.reason + "'";
    }
    text += ", expires in " + std::to_string(remaining.count()) + "s";
    return text;
}

} // anonymous namespace

LockManager::LockManager(std::shared_ptr<CoordinationStore> store,
                         LockConfig config,
                         std::shared_ptr<Monitor> monitor)
    : store_(std::move(store))
    , config_(std::move(config))
    , monitor_(std::move(monitor))
{
    if (!store_) {
        throw InvalidRequestException("LockManager requires a store");
    }
}

void LockManager::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

LockResult LockManager::acquire(const LockRequest& request) {
    LockResult result;

    if (request.key.empty() || request.holder.empty()) {
        result.reason = ReasonCode::InvalidRequest;
        result.message = "resource key and holder are required";
        return result;
    }

    Duration ttl = request.ttl.value_or(config_.default_ttl);
    if (ttl <= Duration::zero()) {
        result.reason = ReasonCode::InvalidTtl;
        result.message = "ttl must be positive";
        return result;
    }
    if (ttl > config_.max_ttl) {
        ttl = config_.max_ttl;
    }

    auto now = current_time();
    Lock candidate;
    candidate.resource_key = request.key;
    candidate.holder_id = request.holder;
    candidate.holder_type = request.holder_type;
    candidate.session_id = request.session_id;
    candidate.acquired_at = now;
    candidate.expires_at = std::chrono::time_point_cast<std::chrono::microseconds>(now + ttl);
    candidate.reason = request.reason;
    candidate.metadata = request.metadata;

    auto outcome = store_->acquire_lock(candidate, now);

    if (outcome.expired_purged > 0) {
        emit_event(EventType::LocksExpired,
                   "Purged " + std::to_string(outcome.expired_purged) + " expired lock(s)",
                   std::nullopt, std::nullopt, std::nullopt, outcome.expired_purged);
    }

    result.outcome = outcome.outcome;
    result.lock = outcome.lock;

    switch (outcome.outcome) {
        case LockOutcome::Granted:
            result.success = true;
            emit_event(EventType::LockGranted, "Lock granted on " + request.key,
                       request.holder, request.key);
            break;
        case LockOutcome::Refreshed:
            result.success = true;
            emit_event(EventType::LockRefreshed, "Lock lease extended on " + request.key,
                       request.holder, request.key);
            break;
        case LockOutcome::Denied:
            result.reason = ReasonCode::LockedByOther;
            result.message = describe_holder(outcome.lock);
            emit_event(EventType::LockDenied, request.key + " " + result.message,
                       request.holder, request.key, to_string(ReasonCode::LockedByOther));
            break;
    }
    return result;
}

ReleaseResult LockManager::release(const ResourceKey& key, const AgentId& holder) {
    ReleaseResult result;
    if (key.empty() || holder.empty()) {
        result.reason = ReasonCode::InvalidRequest;
        return result;
    }

    result.released = store_->release_lock(key, holder);
    if (result.released) {
        emit_event(EventType::LockReleased, "Lock released on " + key, holder, key);
    } else {
        result.reason = ReasonCode::LockNotFoundOrNotOwner;
        emit_event(EventType::LockReleaseDenied, "Release refused: lock not found or not owner",
                   holder, key, to_string(result.reason));
    }
    return result;
}

std::vector<Lock> LockManager::check(const LockFilter& filter) const {
    return store_->list_live_locks(filter, current_time());
}

std::size_t LockManager::purge_expired() {
    auto removed = store_->purge_expired_locks(current_time());
    if (removed > 0) {
        emit_event(EventType::LocksExpired,
                   "Purged " + std::to_string(removed) + " expired lock(s)",
                   std::nullopt, std::nullopt, std::nullopt, removed);
    }
    return removed;
}

std::size_t LockManager::cleanup_for_agent(const AgentId& holder) {
    auto released = store_->release_locks_held_by(holder);
    if (released > 0) {
        emit_event(EventType::LocksCleanedUp,
                   "Released " + std::to_string(released) + " lock(s) held by " + holder,
                   holder, std::nullopt, std::nullopt, released);
    }
    return released;
}

std::vector<ReapedAgent> LockManager::cleanup_for_stale_sessions(Timestamp cutoff) {
    auto reaped = store_->reap_stale_sessions(cutoff);
    for (const auto& agent : reaped) {
        if (agent.locks_released > 0) {
            emit_event(EventType::LocksCleanedUp,
                       "Released " + std::to_string(agent.locks_released) +
                       " lock(s) held by " + agent.agent_id,
                       agent.agent_id, std::nullopt, std::nullopt, agent.locks_released);
        }
    }
    return reaped;
}

void LockManager::emit_event(EventType type, const std::string& message,
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
