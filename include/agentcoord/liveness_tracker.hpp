#pragma once

#include "agentcoord/types.hpp"
#include "agentcoord/config.hpp"
#include "agentcoord/lock_manager.hpp"
#include "agentcoord/monitor.hpp"
#include "agentcoord/store.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace agentcoord {

struct SessionRegistration {
    AgentId agent_id;
    std::string agent_type = "unknown";
    std::vector<std::string> capabilities;
    std::optional<SessionId> session_id;  // unset = "<agent_id>-<uuid>"
    std::optional<std::string> current_task;
};

struct RegisterResult {
    bool success{false};
    ReasonCode reason{ReasonCode::Ok};
    std::optional<AgentSession> session;
};

struct HeartbeatResult {
    bool success{false};
    ReasonCode reason{ReasonCode::Ok};
    std::optional<AgentSession> session;
};

struct ReapResult {
    std::size_t agents_reaped{0};
    std::size_t locks_released{0};
    std::vector<AgentId> agent_ids;
};

// Heartbeat-driven liveness. Reaping marks stale sessions disconnected and
// releases every lock their agents hold.
class LivenessTracker {
public:
    LivenessTracker(std::shared_ptr<CoordinationStore> store,
                    std::shared_ptr<LockManager> locks,
                    LivenessConfig config = {},
                    std::shared_ptr<Monitor> monitor = nullptr);
    ~LivenessTracker();

    // Non-copyable
    LivenessTracker(const LivenessTracker&) = delete;
    LivenessTracker& operator=(const LivenessTracker&) = delete;

    void set_monitor(std::shared_ptr<Monitor> monitor);

    RegisterResult register_session(const SessionRegistration& registration);

    // Refresh last_heartbeat; status defaults to active
    HeartbeatResult heartbeat(const SessionId& session_id,
                              std::optional<SessionStatus> status = std::nullopt,
                              std::optional<std::string> current_task = std::nullopt);

    // Most recent heartbeat first; disconnected sessions only when asked for
    std::vector<AgentSession> discover(const std::optional<std::string>& capability = std::nullopt,
                                       const std::optional<SessionStatus>& status = std::nullopt) const;

    std::optional<AgentSession> get_session(const SessionId& session_id) const;

    // Disconnect sessions silent for longer than `threshold`
    // (default LivenessConfig::stale_threshold) and release their locks
    ReapResult reap(std::optional<Duration> threshold = std::nullopt);

    // Background reaper
    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    const LivenessConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<CoordinationStore> store_;
    std::shared_ptr<LockManager> locks_;
    LivenessConfig config_;

    mutable std::mutex mutex_;
    std::shared_ptr<Monitor> monitor_;

    std::thread reaper_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    void reaper_loop();
    void emit_event(EventType type, const std::string& message,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<std::string> resource = std::nullopt,
                    std::optional<std::size_t> count = std::nullopt);
};

} // namespace agentcoord
