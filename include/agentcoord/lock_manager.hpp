#pragma once

#include "agentcoord/types.hpp"
#include "agentcoord/config.hpp"
#include "agentcoord/monitor.hpp"
#include "agentcoord/store.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentcoord {

struct LockRequest {
    ResourceKey key;
    AgentId holder;
    std::string holder_type;
    SessionId session_id;
    std::string reason;
    std::optional<Duration> ttl;  // unset = LockConfig::default_ttl
    std::string metadata;
};

struct LockResult {
    bool success{false};
    LockOutcome outcome{LockOutcome::Denied};
    ReasonCode reason{ReasonCode::Ok};
    std::string message;

    // The held lock on success, the current holder's lock on denial
    std::optional<Lock> lock;
};

struct ReleaseResult {
    bool released{false};
    ReasonCode reason{ReasonCode::Ok};
};

// Leased mutual exclusion over arbitrary resource keys. Expired leases are
// purged lazily by the next acquire.
class LockManager {
public:
    explicit LockManager(std::shared_ptr<CoordinationStore> store,
                         LockConfig config = {},
                         std::shared_ptr<Monitor> monitor = nullptr);
    ~LockManager() = default;

    // Non-copyable
    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;

    void set_monitor(std::shared_ptr<Monitor> monitor);

    // Grant, refresh (same holder) or deny. Never throws for conflicts or
    // invalid input; StoreException propagates.
    LockResult acquire(const LockRequest& request);

    ReleaseResult release(const ResourceKey& key, const AgentId& holder);

    // Live locks, newest first
    std::vector<Lock> check(const LockFilter& filter = {}) const;

    // Explicit expiry sweep; returns locks removed
    std::size_t purge_expired();

    // Release everything `holder` owns; returns locks released
    std::size_t cleanup_for_agent(const AgentId& holder);

    // Disconnect sessions with a heartbeat older than `cutoff` and release
    // their agents' locks in the same store transaction
    std::vector<ReapedAgent> cleanup_for_stale_sessions(Timestamp cutoff);

    const LockConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<CoordinationStore> store_;
    LockConfig config_;
    mutable std::mutex mutex_;
    std::shared_ptr<Monitor> monitor_;

    void emit_event(EventType type, const std::string& message,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<std::string> resource = std::nullopt,
                    std::optional<std::string> reason = std::nullopt,
                    std::optional<std::size_t> count = std::nullopt);
};

} // namespace agentcoord
