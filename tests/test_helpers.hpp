#pragma once

#include <agentcoord/agentcoord.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <unistd.h>

namespace agentcoord::testing {

// Unique database file under the temp directory, removed (with its WAL
// side files) on destruction
class TempDatabase {
public:
    explicit TempDatabase(const std::string& name) {
        static std::atomic<int> counter{0};
        auto file = "agentcoord_" + name + "_" + std::to_string(::getpid()) + "_" +
                    std::to_string(counter.fetch_add(1)) + ".db";
        path_ = (std::filesystem::temp_directory_path() / file).string();
        remove_files();
    }

    ~TempDatabase() { remove_files(); }

    TempDatabase(const TempDatabase&) = delete;
    TempDatabase& operator=(const TempDatabase&) = delete;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;

    void remove_files() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_ + "-wal", ec);
        std::filesystem::remove(path_ + "-shm", ec);
    }
};

// Records every event for later inspection
class RecordingMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    void on_snapshot(const CoordinationSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshots_.push_back(snapshot);
    }

    std::vector<MonitorEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::size_t count(EventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& e : events_) {
            if (e.type == type) ++n;
        }
        return n;
    }

    std::vector<CoordinationSnapshot> snapshots() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<MonitorEvent> events_;
    std::vector<CoordinationSnapshot> snapshots_;
};

inline Task make_task(const std::string& id, const std::string& type,
                      TaskPriority priority = PRIORITY_DEFAULT,
                      std::vector<TaskId> deps = {}) {
    Task task;
    task.id = id;
    task.type = type;
    task.priority = priority;
    task.dependency_ids = std::move(deps);
    task.created_at = current_time();
    return task;
}

inline Lock make_lock(const std::string& key, const std::string& holder,
                      Timestamp now, Duration ttl) {
    Lock lock;
    lock.resource_key = key;
    lock.holder_id = holder;
    lock.holder_type = "test";
    lock.session_id = holder + "-session";
    lock.acquired_at = now;
    lock.expires_at = now + ttl;
    return lock;
}

inline AuditEntry make_audit_entry(const std::string& id, const std::string& agent,
                                   const std::string& operation, Timestamp created_at) {
    AuditEntry entry;
    entry.id = id;
    entry.agent_id = agent;
    entry.agent_type = "test";
    entry.operation = operation;
    entry.created_at = created_at;
    return entry;
}

} // namespace agentcoord::testing
