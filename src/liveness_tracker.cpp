#include "agentcoord/liveness_tracker.hpp"
#include "agentcoord/exceptions.hpp"
#include "util.hpp"

namespace agentcoord {

LivenessTracker::LivenessTracker(std::shared_ptr<CoordinationStore> store,
                                 std::shared_ptr<LockManager> locks,
                                 LivenessConfig config,
                                 std::shared_ptr<Monitor> monitor)
    : store_(std::move(store))
    , locks_(std::move(locks))
    , config_(std::move(config))
    , monitor_(std::move(monitor))
{
    if (!store_ || !locks_) {
        throw InvalidRequestException("LivenessTracker requires a store and lock manager");
    }
}

LivenessTracker::~LivenessTracker() {
    if (running_.load()) {
        stop();
    }
}

void LivenessTracker::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

RegisterResult LivenessTracker::register_session(const SessionRegistration& registration) {
    RegisterResult result;
    if (registration.agent_id.empty()) {
        result.reason = ReasonCode::InvalidRequest;
        return result;
    }

    auto now = current_time();
    AgentSession session;
    session.id = registration.session_id && !registration.session_id->empty()
                     ? *registration.session_id
                     : registration.agent_id + "-" + detail::generate_uuid();
    session.agent_id = registration.agent_id;
    session.agent_type = registration.agent_type;
    session.capabilities = registration.capabilities;
    session.status = SessionStatus::Active;
    session.started_at = now;
    session.last_heartbeat = now;
    session.current_task = registration.current_task;

    store_->upsert_session(session);

    emit_event(EventType::SessionRegistered,
               "Session registered with " + std::to_string(session.capabilities.size()) +
               " capabilities",
               session.agent_id, session.id);

    result.success = true;
    result.session = std::move(session);
    return result;
}

HeartbeatResult LivenessTracker::heartbeat(const SessionId& session_id,
                                           std::optional<SessionStatus> status,
                                           std::optional<std::string> current_task) {
    HeartbeatResult result;
    auto session = store_->touch_session(session_id, current_time(), status, std::move(current_task));
    if (!session) {
        result.reason = ReasonCode::SessionNotFound;
        return result;
    }

    emit_event(EventType::SessionHeartbeat, std::string("Heartbeat: ") + to_string(session->status),
               session->agent_id, session->id);

    result.success = true;
    result.session = std::move(session);
    return result;
}

std::vector<AgentSession> LivenessTracker::discover(const std::optional<std::string>& capability,
                                                    const std::optional<SessionStatus>& status) const {
    SessionFilter filter;
    filter.capability = capability;
    filter.status = status;
    return store_->list_sessions(filter);
}

std::optional<AgentSession> LivenessTracker::get_session(const SessionId& session_id) const {
    return store_->get_session(session_id);
}

ReapResult LivenessTracker::reap(std::optional<Duration> threshold) {
    ReapResult result;
    auto cutoff = current_time() - threshold.value_or(config_.stale_threshold);

    // Disconnect and lock release commit together
    for (const auto& agent : locks_->cleanup_for_stale_sessions(cutoff)) {
        result.agent_ids.push_back(agent.agent_id);
        result.locks_released += agent.locks_released;
        emit_event(EventType::AgentDisconnected,
                   "Heartbeat stale, released " + std::to_string(agent.locks_released) + " lock(s)",
                   agent.agent_id, std::nullopt, agent.locks_released);
    }
    result.agents_reaped = result.agent_ids.size();

    if (result.agents_reaped > 0) {
        emit_event(EventType::ReapCompleted,
                   "Reaped " + std::to_string(result.agents_reaped) + " agent(s), released " +
                   std::to_string(result.locks_released) + " lock(s)",
                   std::nullopt, std::nullopt, result.agents_reaped);
    }
    return result;
}

void LivenessTracker::start() {
    if (running_.exchange(true)) {
        return;
    }
    reaper_thread_ = std::thread(&LivenessTracker::reaper_loop, this);
}

void LivenessTracker::stop() {
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (reaper_thread_.joinable()) {
        reaper_thread_.join();
    }
}

void LivenessTracker::reaper_loop() {
    while (running_.load()) {
        try {
            reap();
        } catch (const StoreException& e) {
            // Transient; the next pass retries
            emit_event(EventType::ReapCompleted, std::string("Reap pass failed: ") + e.what());
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.reaper_interval, [this] {
            return !running_.load();
        });
    }
}

void LivenessTracker::emit_event(EventType type, const std::string& message,
                                 std::optional<AgentId> agent_id,
                                 std::optional<std::string> resource,
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
    event.count = count;
    mon->on_event(event);
}

} // namespace agentcoord
