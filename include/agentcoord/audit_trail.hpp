#pragma once

#include "agentcoord/types.hpp"
#include "agentcoord/config.hpp"
#include "agentcoord/monitor.hpp"
#include "agentcoord/store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace agentcoord {

// Append-only operation log. Entries are queued and written in batches by a
// worker thread so callers never wait on the store.
class AuditTrail {
public:
    explicit AuditTrail(std::shared_ptr<CoordinationStore> store,
                        AuditConfig config = {},
                        std::shared_ptr<Monitor> monitor = nullptr);
    ~AuditTrail();

    // Non-copyable
    AuditTrail(const AuditTrail&) = delete;
    AuditTrail& operator=(const AuditTrail&) = delete;

    void set_monitor(std::shared_ptr<Monitor> monitor);

    // Lifecycle: stop() drains the queue before returning
    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    // Queue an entry (fills id and created_at when empty). Writes inline
    // when async is off or the worker is not running. Returns false if the
    // entry was dropped or could not be written.
    bool append(AuditEntry entry);

    // Block until every queued entry has been written
    void flush();

    // Newest first
    std::vector<AuditEntry> query(const AuditFilter& filter) const;

    // Retention sweep: the only removal path. A horizon inside the
    // retention window is pulled back to now - retention_days.
    std::size_t purge_older_than(Timestamp horizon);
    std::size_t purge_expired();

    // retention_days as a duration
    Duration retention() const;

    std::size_t queue_depth() const;
    std::uint64_t dropped_count() const noexcept { return dropped_.load(); }

    const AuditConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<CoordinationStore> store_;
    AuditConfig config_;

    mutable std::mutex mutex_;
    std::deque<AuditEntry> queue_;
    std::size_t in_flight_{0};
    std::condition_variable work_cv_;   // worker wake-up
    std::condition_variable space_cv_;  // Block backpressure
    std::condition_variable idle_cv_;   // flush()

    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> dropped_{0};

    std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    void worker_loop();
    bool write_batch(const std::vector<AuditEntry>& batch);
    void emit_event(EventType type, const std::string& message,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<std::string> resource = std::nullopt,
                    std::optional<std::size_t> count = std::nullopt);
};

// Measures an operation and appends its audit entry on scope exit
class AuditTimer {
public:
    AuditTimer(AuditTrail& trail, const AgentId& agent_id, const std::string& agent_type,
               const std::string& operation);
    ~AuditTimer();

    // Non-copyable
    AuditTimer(const AuditTimer&) = delete;
    AuditTimer& operator=(const AuditTimer&) = delete;

    void parameter(const std::string& name, std::string value);
    void result(const std::string& name, std::string value);
    void fail(std::string error_message);

    // Append now instead of at scope exit
    void commit();

    // Discard the entry
    void dismiss() noexcept { done_ = true; }

private:
    AuditTrail& trail_;
    AuditEntry entry_;
    std::chrono::steady_clock::time_point started_;
    int uncaught_on_entry_;
    bool done_{false};
};

} // namespace agentcoord
