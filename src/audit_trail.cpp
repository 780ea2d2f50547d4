#include "agentcoord/audit_trail.hpp"
#include "agentcoord/exceptions.hpp"
#include "util.hpp"

#include <iterator>

namespace agentcoord {

AuditTrail::AuditTrail(std::shared_ptr<CoordinationStore> store,
                       AuditConfig config,
                       std::shared_ptr<Monitor> monitor)
    : store_(std::move(store))
    , config_(std::move(config))
    , monitor_(std::move(monitor))
{
    if (!store_) {
        throw InvalidRequestException("AuditTrail requires a store");
    }
    if (config_.queue_capacity == 0 || config_.batch_size == 0) {
        throw InvalidRequestException("Audit queue capacity and batch size must be positive");
    }
    if (config_.retention_days < 1) {
        throw InvalidRequestException("Audit retention must be at least one day");
    }
}

AuditTrail::~AuditTrail() {
    if (running_.load()) {
        stop();
    }
}

void AuditTrail::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

void AuditTrail::start() {
    if (!config_.async || running_.exchange(true)) {
        return;
    }
    worker_thread_ = std::thread(&AuditTrail::worker_loop, this);
}

void AuditTrail::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
        work_cv_.notify_all();
        space_cv_.notify_all();
    }
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    // Anything queued after the worker's last pass is written here
    std::vector<AuditEntry> leftover;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftover.assign(std::make_move_iterator(queue_.begin()),
                        std::make_move_iterator(queue_.end()));
        queue_.clear();
    }
    if (!leftover.empty()) {
        write_batch(leftover);
    }
    idle_cv_.notify_all();
}

bool AuditTrail::append(AuditEntry entry) {
    if (entry.id.empty()) {
        entry.id = detail::generate_uuid();
    }
    if (entry.created_at == Timestamp{}) {
        entry.created_at = current_time();
    }

    if (!config_.async || !running_.load()) {
        return write_batch({std::move(entry)});
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (running_.load() && queue_.size() >= config_.queue_capacity) {
            if (config_.backpressure == AuditBackpressure::Block) {
                space_cv_.wait(lock, [this] {
                    return queue_.size() < config_.queue_capacity || !running_.load();
                });
            }
            if (running_.load() && queue_.size() >= config_.queue_capacity) {
                lock.unlock();
                dropped_.fetch_add(1);
                emit_event(EventType::AuditEntryDropped,
                           "Audit queue full, dropped " + entry.operation,
                           entry.agent_id, entry.operation, 1);
                return false;
            }
        }

        // stop() raced ahead: the worker may already be gone
        if (running_.load()) {
            queue_.push_back(std::move(entry));
            lock.unlock();
            work_cv_.notify_one();
            return true;
        }
    }
    return write_batch({std::move(entry)});
}

void AuditTrail::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_.load() && !worker_thread_.joinable()) {
        // No worker: nothing can be queued
        return;
    }
    work_cv_.notify_one();
    idle_cv_.wait(lock, [this] {
        return (queue_.empty() && in_flight_ == 0) || !running_.load();
    });
}

std::vector<AuditEntry> AuditTrail::query(const AuditFilter& filter) const {
    return store_->query_audit(filter);
}

std::size_t AuditTrail::purge_older_than(Timestamp horizon) {
    auto removed = store_->purge_audit_before(horizon, retention());
    emit_event(EventType::AuditPurged,
               "Removed " + std::to_string(removed) + " audit entries past retention",
               std::nullopt, std::nullopt, removed);
    return removed;
}

std::size_t AuditTrail::purge_expired() {
    return purge_older_than(current_time() - retention());
}

Duration AuditTrail::retention() const {
    return std::chrono::duration_cast<Duration>(std::chrono::hours(24) * config_.retention_days);
}

std::size_t AuditTrail::queue_depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + in_flight_;
}

void AuditTrail::worker_loop() {
    for (;;) {
        std::vector<AuditEntry> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait_for(lock, config_.flush_interval, [this] {
                return !queue_.empty() || !running_.load();
            });

            if (queue_.empty()) {
                if (!running_.load()) {
                    idle_cv_.notify_all();
                    return;
                }
                continue;
            }

            while (!queue_.empty() && batch.size() < config_.batch_size) {
                batch.push_back(std::move(queue_.front()));
                queue_.pop_front();
            }
            in_flight_ = batch.size();
        }
        space_cv_.notify_all();

        write_batch(batch);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_ = 0;
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
        }
    }
}

bool AuditTrail::write_batch(const std::vector<AuditEntry>& batch) {
    try {
        store_->append_audit(batch);
        return true;
    } catch (const CoordinationException& e) {
        emit_event(EventType::AuditWriteFailed,
                   std::string("Audit batch not written: ") + e.what(),
                   std::nullopt, std::nullopt, batch.size());
        return false;
    }
}

void AuditTrail::emit_event(EventType type, const std::string& message,
                            std::optional<AgentId> agent_id,
                            std::optional<std::string> resource,
                            std::optional<std::size_t> count) {
    std::shared_ptr<Monitor> mon;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
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

// ========== AuditTimer ==========

AuditTimer::AuditTimer(AuditTrail& trail, const AgentId& agent_id, const std::string& agent_type,
                       const std::string& operation)
    : trail_(trail)
    , started_(std::chrono::steady_clock::now())
    , uncaught_on_entry_(std::uncaught_exceptions())
{
    entry_.agent_id = agent_id;
    entry_.agent_type = agent_type;
    entry_.operation = operation;
}

AuditTimer::~AuditTimer() {
    // Unwinding past the timer means the operation threw
    if (!done_ && std::uncaught_exceptions() > uncaught_on_entry_ && entry_.success) {
        fail("exception");
    }
    commit();
}

void AuditTimer::parameter(const std::string& name, std::string value) {
    entry_.parameters[name] = std::move(value);
}

void AuditTimer::result(const std::string& name, std::string value) {
    entry_.result[name] = std::move(value);
}

void AuditTimer::fail(std::string error_message) {
    entry_.success = false;
    entry_.error_message = std::move(error_message);
}

void AuditTimer::commit() {
    if (done_) {
        return;
    }
    done_ = true;
    entry_.duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - started_);
    trail_.append(std::move(entry_));
}

} // namespace agentcoord
