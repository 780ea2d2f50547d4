#include "agentcoord/sqlite_store.hpp"
#include "agentcoord/exceptions.hpp"
#include "util.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <string>
#include <vector>

namespace agentcoord {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS resource_locks (
    resource_key TEXT PRIMARY KEY,
    holder_id    TEXT NOT NULL,
    holder_type  TEXT NOT NULL DEFAULT '',
    session_id   TEXT NOT NULL DEFAULT '',
    acquired_at  INTEGER NOT NULL,
    expires_at   INTEGER NOT NULL,
    reason       TEXT NOT NULL DEFAULT '',
    metadata     TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS idx_resource_locks_expires ON resource_locks(expires_at);
CREATE INDEX IF NOT EXISTS idx_resource_locks_holder ON resource_locks(holder_id);

CREATE TABLE IF NOT EXISTS work_queue (
    seq           INTEGER PRIMARY KEY AUTOINCREMENT,
    id            TEXT NOT NULL UNIQUE,
    task_type     TEXT NOT NULL,
    description   TEXT NOT NULL DEFAULT '',
    input         BLOB,
    priority      INTEGER NOT NULL CHECK (priority BETWEEN 1 AND 10),
    status        TEXT NOT NULL DEFAULT 'pending'
                  CHECK (status IN ('pending', 'claimed', 'completed', 'failed', 'cancelled')),
    claimed_by    TEXT,
    claimed_at    INTEGER,
    attempt_count INTEGER NOT NULL DEFAULT 0,
    max_attempts  INTEGER NOT NULL DEFAULT 3,
    result        BLOB,
    error         TEXT,
    deadline      INTEGER,
    created_at    INTEGER NOT NULL,
    completed_at  INTEGER
);
CREATE INDEX IF NOT EXISTS idx_work_queue_pending
    ON work_queue(priority, created_at) WHERE status = 'pending';
CREATE INDEX IF NOT EXISTS idx_work_queue_claimed_by
    ON work_queue(claimed_by) WHERE status = 'claimed';

CREATE TABLE IF NOT EXISTS task_dependencies (
    task_id    TEXT NOT NULL,
    depends_on TEXT NOT NULL,
    position   INTEGER NOT NULL,
    PRIMARY KEY (task_id, depends_on)
);
CREATE INDEX IF NOT EXISTS idx_task_dependencies_depends_on ON task_dependencies(depends_on);

CREATE TABLE IF NOT EXISTS agent_sessions (
    id             TEXT PRIMARY KEY,
    agent_id       TEXT NOT NULL,
    agent_type     TEXT NOT NULL DEFAULT '',
    status         TEXT NOT NULL DEFAULT 'active'
                   CHECK (status IN ('active', 'idle', 'disconnected')),
    started_at     INTEGER NOT NULL,
    last_heartbeat INTEGER NOT NULL,
    current_task   TEXT
);
CREATE INDEX IF NOT EXISTS idx_agent_sessions_agent ON agent_sessions(agent_id, last_heartbeat);
CREATE INDEX IF NOT EXISTS idx_agent_sessions_status ON agent_sessions(status, last_heartbeat);

CREATE TABLE IF NOT EXISTS agent_capabilities (
    session_id TEXT NOT NULL,
    capability TEXT NOT NULL,
    PRIMARY KEY (session_id, capability)
);
CREATE INDEX IF NOT EXISTS idx_agent_capabilities_capability ON agent_capabilities(capability);

CREATE TABLE IF NOT EXISTS audit_log (
    seq           INTEGER PRIMARY KEY AUTOINCREMENT,
    id            TEXT NOT NULL UNIQUE,
    agent_id      TEXT NOT NULL,
    agent_type    TEXT NOT NULL DEFAULT '',
    operation     TEXT NOT NULL,
    duration_us   INTEGER NOT NULL DEFAULT 0,
    success       INTEGER NOT NULL,
    error_message TEXT,
    created_at    INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_audit_log_agent ON audit_log(agent_id, created_at);
CREATE INDEX IF NOT EXISTS idx_audit_log_operation ON audit_log(operation, created_at);
CREATE INDEX IF NOT EXISTS idx_audit_log_created ON audit_log(created_at);

CREATE TABLE IF NOT EXISTS audit_log_fields (
    entry_id TEXT NOT NULL,
    section  TEXT NOT NULL CHECK (section IN ('parameter', 'result')),
    name     TEXT NOT NULL,
    value    TEXT NOT NULL,
    PRIMARY KEY (entry_id, section, name)
);

CREATE TABLE IF NOT EXISTS audit_retention (
    id      INTEGER PRIMARY KEY CHECK (id = 1),
    horizon INTEGER NOT NULL
);

CREATE TRIGGER IF NOT EXISTS audit_log_no_update
BEFORE UPDATE ON audit_log
BEGIN
    SELECT RAISE(ABORT, 'audit log entries are immutable');
END;

CREATE TRIGGER IF NOT EXISTS audit_log_no_delete
BEFORE DELETE ON audit_log
WHEN OLD.created_at >= COALESCE((SELECT horizon FROM audit_retention WHERE id = 1),
                                -9223372036854775808)
BEGIN
    SELECT RAISE(ABORT, 'audit log entries are immutable');
END;

CREATE TRIGGER IF NOT EXISTS audit_log_fields_no_update
BEFORE UPDATE ON audit_log_fields
BEGIN
    SELECT RAISE(ABORT, 'audit log entries are immutable');
END;

CREATE TRIGGER IF NOT EXISTS audit_log_fields_no_delete
BEFORE DELETE ON audit_log_fields
WHEN COALESCE((SELECT created_at FROM audit_log WHERE id = OLD.entry_id), -9223372036854775808)
     >= COALESCE((SELECT horizon FROM audit_retention WHERE id = 1), -9223372036854775808)
BEGIN
    SELECT RAISE(ABORT, 'audit log entries are immutable');
END;

CREATE TABLE IF NOT EXISTS guardrail_patterns (
    name                TEXT PRIMARY KEY,
    category            TEXT NOT NULL,
    pattern             TEXT NOT NULL,
    severity            TEXT NOT NULL CHECK (severity IN ('block', 'warn', 'log')),
    min_trust_to_bypass INTEGER NOT NULL DEFAULT 3,
    description         TEXT NOT NULL DEFAULT '',
    enabled             INTEGER NOT NULL DEFAULT 1
);

CREATE TABLE IF NOT EXISTS guardrail_violations (
    seq            INTEGER PRIMARY KEY AUTOINCREMENT,
    agent_id       TEXT NOT NULL,
    pattern_name   TEXT NOT NULL,
    category       TEXT NOT NULL,
    severity       TEXT NOT NULL,
    operation_text TEXT NOT NULL,
    matched_text   TEXT NOT NULL,
    blocked        INTEGER NOT NULL,
    bypassed       INTEGER NOT NULL,
    trust_level    INTEGER NOT NULL,
    created_at     INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_guardrail_violations_agent
    ON guardrail_violations(agent_id, created_at);

CREATE TABLE IF NOT EXISTS agent_profiles (
    name                       TEXT PRIMARY KEY,
    agent_type                 TEXT NOT NULL,
    trust_level                INTEGER NOT NULL CHECK (trust_level BETWEEN 0 AND 4),
    allowed_operations         TEXT NOT NULL DEFAULT '',
    blocked_operations         TEXT NOT NULL DEFAULT '',
    max_file_modifications     INTEGER NOT NULL DEFAULT 50,
    max_execution_time_seconds INTEGER NOT NULL DEFAULT 300,
    max_api_calls_per_hour     INTEGER NOT NULL DEFAULT 1000,
    description                TEXT NOT NULL DEFAULT '',
    enabled                    INTEGER NOT NULL DEFAULT 1
);
CREATE INDEX IF NOT EXISTS idx_agent_profiles_type ON agent_profiles(agent_type);

CREATE TABLE IF NOT EXISTS agent_profile_assignments (
    agent_id     TEXT PRIMARY KEY,
    profile_name TEXT NOT NULL REFERENCES agent_profiles(name)
);

CREATE TABLE IF NOT EXISTS network_policies (
    domain_pattern TEXT NOT NULL,
    profile_name   TEXT NOT NULL DEFAULT '',
    action         TEXT NOT NULL CHECK (action IN ('allow', 'deny')),
    priority       INTEGER NOT NULL DEFAULT 100,
    description    TEXT NOT NULL DEFAULT '',
    enabled        INTEGER NOT NULL DEFAULT 1,
    PRIMARY KEY (domain_pattern, profile_name)
);

CREATE TABLE IF NOT EXISTS policy_documents (
    name        TEXT PRIMARY KEY,
    policy_text TEXT NOT NULL,
    priority    INTEGER NOT NULL DEFAULT 100,
    description TEXT NOT NULL DEFAULT '',
    enabled     INTEGER NOT NULL DEFAULT 1
);
)sql";

constexpr const char* kLockColumns =
    "resource_key, holder_id, holder_type, session_id, acquired_at, expires_at, reason, metadata";

constexpr const char* kTaskColumns =
    "id, task_type, description, input, priority, status, claimed_by, claimed_at, "
    "attempt_count, max_attempts, result, error, deadline, created_at, completed_at";

constexpr const char* kSessionColumns =
    "id, agent_id, agent_type, status, started_at, last_heartbeat, current_task";

constexpr const char* kProfileColumns =
    "name, agent_type, trust_level, allowed_operations, blocked_operations, "
    "max_file_modifications, max_execution_time_seconds, max_api_calls_per_hour, "
    "description, enabled";

constexpr const char* kNetworkColumns =
    "domain_pattern, profile_name, action, priority, description, enabled";

bool is_immutability_error(const std::string& message) {
    return message.find("immutable") != std::string::npos;
}

[[noreturn]] void throw_sqlite_error(sqlite3* db, const std::string& context) {
    std::string message = sqlite3_errmsg(db);
    if (is_immutability_error(message)) {
        throw AuditImmutableException(message);
    }
    throw StoreException("sqlite " + context + ": " + message);
}

void exec_sql(sqlite3* db, const char* sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = error != nullptr ? error : sqlite3_errstr(rc);
        sqlite3_free(error);
        if (is_immutability_error(message)) {
            throw AuditImmutableException(message);
        }
        throw StoreException("sqlite exec: " + message);
    }
}

// Prepared statement with typed bind/column helpers
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw_sqlite_error(db_, "prepare");
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.data(),
                                static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind(int index, const char* value) { bind(index, std::string(value)); }

    void bind(int index, std::int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
    }

    void bind(int index, std::int32_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
    }

    void bind(int index, bool value) {
        check(sqlite3_bind_int(stmt_, index, value ? 1 : 0));
    }

    void bind(int index, const std::optional<std::string>& value) {
        if (value) {
            bind(index, *value);
        } else {
            bind_null(index);
        }
    }

    void bind_blob(int index, const std::string& value) {
        check(sqlite3_bind_blob(stmt_, index, value.data(),
                                static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind_blob(int index, const std::optional<std::string>& value) {
        if (value) {
            bind_blob(index, *value);
        } else {
            bind_null(index);
        }
    }

    void bind_time(int index, Timestamp value) {
        bind(index, detail::to_micros(value));
    }

    void bind_time(int index, const std::optional<Timestamp>& value) {
        if (value) {
            bind_time(index, *value);
        } else {
            bind_null(index);
        }
    }

    void bind_null(int index) { check(sqlite3_bind_null(stmt_, index)); }

    // True when a row is available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw_sqlite_error(db_, "step");
    }

    void run() {
        while (step()) {
        }
    }

    // Ready for another run with fresh bindings
    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    std::string text(int col) const {
        const unsigned char* data = sqlite3_column_text(stmt_, col);
        int size = sqlite3_column_bytes(stmt_, col);
        return data != nullptr ? std::string(reinterpret_cast<const char*>(data), size)
                               : std::string();
    }

    std::optional<std::string> optional_text(int col) const {
        if (is_null(col)) return std::nullopt;
        return text(col);
    }

    std::string blob(int col) const {
        const void* data = sqlite3_column_blob(stmt_, col);
        int size = sqlite3_column_bytes(stmt_, col);
        return data != nullptr ? std::string(static_cast<const char*>(data), size)
                               : std::string();
    }

    std::optional<std::string> optional_blob(int col) const {
        if (is_null(col)) return std::nullopt;
        return blob(col);
    }

    std::int64_t integer(int col) const { return sqlite3_column_int64(stmt_, col); }

    Timestamp time(int col) const { return detail::from_micros(integer(col)); }

    std::optional<Timestamp> optional_time(int col) const {
        if (is_null(col)) return std::nullopt;
        return time(col);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw_sqlite_error(db_, "bind");
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

// Rolls back unless committed
class Transaction {
public:
    enum class Mode { Deferred, Immediate };

    explicit Transaction(sqlite3* db, Mode mode = Mode::Immediate) : db_(db) {
        exec_sql(db_, mode == Mode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN");
    }

    ~Transaction() {
        if (!finished_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec_sql(db_, "COMMIT");
        finished_ = true;
    }

private:
    sqlite3* db_;
    bool finished_{false};
};

std::string placeholders(std::size_t count, int first_index) {
    std::string out;
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0) out += ", ";
        out += "?" + std::to_string(first_index + static_cast<int>(i));
    }
    return out;
}

Lock read_lock(const Statement& st) {
    Lock lock;
    lock.resource_key = st.text(0);
    lock.holder_id = st.text(1);
    lock.holder_type = st.text(2);
    lock.session_id = st.text(3);
    lock.acquired_at = st.time(4);
    lock.expires_at = st.time(5);
    lock.reason = st.text(6);
    lock.metadata = st.text(7);
    return lock;
}

// Task row without its dependency list
Task read_task_row(const Statement& st) {
    Task task;
    task.id = st.text(0);
    task.type = st.text(1);
    task.description = st.text(2);
    task.input = st.blob(3);
    task.priority = static_cast<TaskPriority>(st.integer(4));
    task.status = parse_task_status(st.text(5)).value_or(TaskStatus::Pending);
    task.claimant = st.optional_text(6);
    task.claimed_at = st.optional_time(7);
    task.attempt_count = static_cast<std::int32_t>(st.integer(8));
    task.max_attempts = static_cast<std::int32_t>(st.integer(9));
    task.result = st.optional_blob(10);
    task.error = st.optional_text(11);
    task.deadline = st.optional_time(12);
    task.created_at = st.time(13);
    task.completed_at = st.optional_time(14);
    return task;
}

AgentSession read_session_row(const Statement& st) {
    AgentSession session;
    session.id = st.text(0);
    session.agent_id = st.text(1);
    session.agent_type = st.text(2);
    session.status = parse_session_status(st.text(3)).value_or(SessionStatus::Active);
    session.started_at = st.time(4);
    session.last_heartbeat = st.time(5);
    session.current_task = st.optional_text(6);
    return session;
}

AgentProfile read_profile_row(const Statement& st) {
    AgentProfile profile;
    profile.name = st.text(0);
    profile.agent_type = st.text(1);
    profile.trust_level = static_cast<TrustLevel>(st.integer(2));
    profile.allowed_ops = detail::split(st.text(3), ',');
    profile.blocked_ops = detail::split(st.text(4), ',');
    profile.resource_limits.max_file_modifications = st.integer(5);
    profile.resource_limits.max_execution_time_seconds = st.integer(6);
    profile.resource_limits.max_api_calls_per_hour = st.integer(7);
    profile.description = st.text(8);
    profile.enabled = st.integer(9) != 0;
    return profile;
}

NetworkAccessPolicy read_network_row(const Statement& st) {
    NetworkAccessPolicy policy;
    policy.domain_pattern = st.text(0);
    auto profile = st.text(1);
    if (!profile.empty()) {
        policy.profile_name = profile;
    }
    policy.action = parse_network_action(st.text(2)).value_or(NetworkAction::Deny);
    policy.priority = static_cast<std::int32_t>(st.integer(3));
    policy.description = st.text(4);
    policy.enabled = st.integer(5) != 0;
    return policy;
}

} // anonymous namespace

void SqliteStore::ConnectionCloser::operator()(sqlite3* db) const noexcept {
    sqlite3_close_v2(db);
}

SqliteStore::SqliteStore(const std::string& path, std::chrono::milliseconds busy_timeout)
    : path_(path)
{
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path_.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    db_.reset(raw);
    if (rc != SQLITE_OK) {
        std::string message = raw != nullptr ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        throw StoreException("Cannot open database '" + path_ + "': " + message);
    }

    sqlite3_busy_timeout(db_.get(), static_cast<int>(busy_timeout.count()));
    if (path_ != ":memory:") {
        exec_sql(db_.get(), "PRAGMA journal_mode=WAL");
        exec_sql(db_.get(), "PRAGMA synchronous=NORMAL");
    }
    create_schema();
}

SqliteStore::~SqliteStore() = default;

void SqliteStore::create_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_.get());
    exec_sql(db_.get(), kSchema);
    txn.commit();
}

void SqliteStore::execute(const std::string& sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    exec_sql(db_.get(), sql.c_str());
}

// ========== Locks ==========

LockAcquireOutcome SqliteStore::acquire_lock(const Lock& candidate, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db);

    LockAcquireOutcome outcome;
    {
        Statement purge(db, "DELETE FROM resource_locks WHERE expires_at <= ?1");
        purge.bind_time(1, now);
        purge.run();
        outcome.expired_purged = static_cast<std::size_t>(sqlite3_changes(db));
    }

    {
        Statement insert(db,
            "INSERT INTO resource_locks (" + std::string(kLockColumns) + ") "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8) "
            "ON CONFLICT(resource_key) DO NOTHING");
        insert.bind(1, candidate.resource_key);
        insert.bind(2, candidate.holder_id);
        insert.bind(3, candidate.holder_type);
        insert.bind(4, candidate.session_id);
        insert.bind_time(5, candidate.acquired_at);
        insert.bind_time(6, candidate.expires_at);
        insert.bind(7, candidate.reason);
        insert.bind(8, candidate.metadata);
        insert.run();
        if (sqlite3_changes(db) == 1) {
            txn.commit();
            outcome.outcome = LockOutcome::Granted;
            outcome.lock = candidate;
            return outcome;
        }
    }

    {
        // Refresh only when the same holder owns the row
        Statement refresh(db,
            "UPDATE resource_locks SET expires_at = ?2, session_id = ?3, holder_type = ?4, "
            "reason = CASE WHEN ?5 = '' THEN reason ELSE ?5 END, "
            "metadata = CASE WHEN ?6 = '' THEN metadata ELSE ?6 END "
            "WHERE resource_key = ?1 AND holder_id = ?7");
        refresh.bind(1, candidate.resource_key);
        refresh.bind_time(2, candidate.expires_at);
        refresh.bind(3, candidate.session_id);
        refresh.bind(4, candidate.holder_type);
        refresh.bind(5, candidate.reason);
        refresh.bind(6, candidate.metadata);
        refresh.bind(7, candidate.holder_id);
        refresh.run();
        outcome.outcome = sqlite3_changes(db) == 1 ? LockOutcome::Refreshed : LockOutcome::Denied;
    }

    Statement select(db, "SELECT " + std::string(kLockColumns) +
                         " FROM resource_locks WHERE resource_key = ?1");
    select.bind(1, candidate.resource_key);
    if (!select.step()) {
        throw StoreException("Lock row vanished inside transaction: " + candidate.resource_key);
    }
    outcome.lock = read_lock(select);
    txn.commit();
    return outcome;
}

bool SqliteStore::release_lock(const ResourceKey& key, const AgentId& holder) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement del(db_.get(), "DELETE FROM resource_locks WHERE resource_key = ?1 AND holder_id = ?2");
    del.bind(1, key);
    del.bind(2, holder);
    del.run();
    return sqlite3_changes(db_.get()) == 1;
}

std::size_t SqliteStore::release_locks_held_by(const AgentId& holder) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement del(db_.get(), "DELETE FROM resource_locks WHERE holder_id = ?1");
    del.bind(1, holder);
    del.run();
    return static_cast<std::size_t>(sqlite3_changes(db_.get()));
}

std::size_t SqliteStore::purge_expired_locks(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement del(db_.get(), "DELETE FROM resource_locks WHERE expires_at <= ?1");
    del.bind_time(1, now);
    del.run();
    return static_cast<std::size_t>(sqlite3_changes(db_.get()));
}

std::vector<Lock> SqliteStore::list_live_locks(const LockFilter& filter, Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = "SELECT " + std::string(kLockColumns) +
                      " FROM resource_locks WHERE expires_at > ?1";
    int next = 2;
    if (filter.holder) {
        sql += " AND holder_id = ?" + std::to_string(next++);
    }
    if (!filter.keys.empty()) {
        sql += " AND resource_key IN (" + placeholders(filter.keys.size(), next) + ")";
    }
    sql += " ORDER BY acquired_at DESC, resource_key ASC";

    Statement st(db_.get(), sql);
    st.bind_time(1, now);
    int index = 2;
    if (filter.holder) {
        st.bind(index++, *filter.holder);
    }
    for (const auto& key : filter.keys) {
        st.bind(index++, key);
    }

    std::vector<Lock> result;
    while (st.step()) {
        result.push_back(read_lock(st));
    }
    return result;
}

// ========== Tasks ==========

void SqliteStore::insert_task(const Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_.get());
    insert_task_locked(task);
    txn.commit();
}

void SqliteStore::insert_task_locked(const Task& task) {
    sqlite3* db = db_.get();
    {
        Statement insert(db,
            "INSERT INTO work_queue (" + std::string(kTaskColumns) + ") "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15)");
        insert.bind(1, task.id);
        insert.bind(2, task.type);
        insert.bind(3, task.description);
        insert.bind_blob(4, task.input);
        insert.bind(5, task.priority);
        insert.bind(6, to_string(task.status));
        insert.bind(7, task.claimant);
        insert.bind_time(8, task.claimed_at);
        insert.bind(9, task.attempt_count);
        insert.bind(10, task.max_attempts);
        insert.bind_blob(11, task.result);
        insert.bind(12, task.error);
        insert.bind_time(13, task.deadline);
        insert.bind_time(14, task.created_at);
        insert.bind_time(15, task.completed_at);
        insert.run();
    }

    std::int64_t position = 0;
    for (const auto& dep_id : task.dependency_ids) {
        Statement row(db, "INSERT OR IGNORE INTO task_dependencies (task_id, depends_on, position) "
                          "VALUES (?1, ?2, ?3)");
        row.bind(1, task.id);
        row.bind(2, dep_id);
        row.bind(3, position++);
        row.run();
    }
}

std::vector<TaskId> SqliteStore::missing_tasks(const std::vector<TaskId>& ids) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskId> missing;
    for (const auto& id : ids) {
        Statement exists(db_.get(), "SELECT 1 FROM work_queue WHERE id = ?1");
        exists.bind(1, id);
        if (!exists.step()) {
            missing.push_back(id);
        }
    }
    return missing;
}

ClaimOutcome SqliteStore::claim_task(const ClaimRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db);
    ClaimOutcome outcome;

    // Lazily fail pending tasks whose deadline has passed
    {
        Statement expired(db, "SELECT id FROM work_queue WHERE status = 'pending' "
                              "AND deadline IS NOT NULL AND deadline < ?1 ORDER BY seq");
        expired.bind_time(1, request.now);
        while (expired.step()) {
            outcome.deadline_expired.push_back(expired.text(0));
        }
    }
    if (!outcome.deadline_expired.empty()) {
        Statement fail(db, "UPDATE work_queue SET status = 'failed', error = 'deadline_exceeded', "
                           "completed_at = ?1 WHERE status = 'pending' "
                           "AND deadline IS NOT NULL AND deadline < ?1");
        fail.bind_time(1, request.now);
        fail.run();
    }

    std::string sql =
        "SELECT w.id FROM work_queue w WHERE w.status = 'pending'";
    if (!request.accepted_types.empty()) {
        sql += " AND w.task_type IN (" + placeholders(request.accepted_types.size(), 1) + ")";
    }
    sql += " AND NOT EXISTS ("
           "SELECT 1 FROM task_dependencies d "
           "LEFT JOIN work_queue dep ON dep.id = d.depends_on "
           "WHERE d.task_id = w.id AND (dep.id IS NULL OR dep.status <> 'completed'))"
           " ORDER BY w.priority ASC, w.created_at ASC, w.seq ASC LIMIT 1";

    std::optional<TaskId> candidate;
    {
        Statement select(db, sql);
        int index = 1;
        for (const auto& type : request.accepted_types) {
            select.bind(index++, type);
        }
        if (select.step()) {
            candidate = select.text(0);
        }
    }

    if (candidate) {
        // Conditional on status so the row changes hands exactly once
        Statement claim(db, "UPDATE work_queue SET status = 'claimed', claimed_by = ?2, "
                            "claimed_at = ?3, attempt_count = attempt_count + 1 "
                            "WHERE id = ?1 AND status = 'pending'");
        claim.bind(1, *candidate);
        claim.bind(2, request.claimant);
        claim.bind_time(3, request.now);
        claim.run();
        if (sqlite3_changes(db) == 1) {
            outcome.task = load_task_locked(*candidate);
        }
    }

    txn.commit();
    return outcome;
}

CompletionRecord SqliteStore::complete_task(const TaskCompletion& completion) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db);
    CompletionRecord record;

    auto current = load_task_locked(completion.task_id);
    if (!current) {
        record.outcome = CompletionOutcome::NotFound;
        return record;
    }
    if (current->status != TaskStatus::Claimed || current->claimant != completion.claimant) {
        record.outcome = CompletionOutcome::NotClaimant;
        record.task = std::move(current);
        return record;
    }

    if (completion.success) {
        Statement st(db, "UPDATE work_queue SET status = 'completed', result = ?3, error = NULL, "
                         "completed_at = ?4 WHERE id = ?1 AND status = 'claimed' AND claimed_by = ?2");
        st.bind(1, completion.task_id);
        st.bind(2, completion.claimant);
        st.bind_blob(3, completion.result);
        st.bind_time(4, completion.now);
        st.run();
        record.outcome = CompletionOutcome::Completed;
    } else if (completion.requeue_on_failure &&
               current->attempt_count < current->max_attempts) {
        Statement st(db, "UPDATE work_queue SET status = 'pending', claimed_by = NULL, "
                         "claimed_at = NULL, error = ?3 "
                         "WHERE id = ?1 AND status = 'claimed' AND claimed_by = ?2");
        st.bind(1, completion.task_id);
        st.bind(2, completion.claimant);
        st.bind(3, completion.error);
        st.run();
        record.outcome = CompletionOutcome::Requeued;
    } else {
        Statement st(db, "UPDATE work_queue SET status = 'failed', error = ?3, "
                         "result = CASE WHEN ?4 IS NULL THEN result ELSE ?4 END, "
                         "completed_at = ?5 "
                         "WHERE id = ?1 AND status = 'claimed' AND claimed_by = ?2");
        st.bind(1, completion.task_id);
        st.bind(2, completion.claimant);
        st.bind(3, completion.error);
        if (completion.result.empty()) {
            st.bind_null(4);
        } else {
            st.bind_blob(4, completion.result);
        }
        st.bind_time(5, completion.now);
        st.run();
        record.outcome = CompletionOutcome::Failed;
    }

    if (sqlite3_changes(db) != 1) {
        throw StoreException("Claimed task changed inside transaction: " + completion.task_id);
    }

    record.task = load_task_locked(completion.task_id);
    txn.commit();
    return record;
}

CancelOutcome SqliteStore::cancel_task(const TaskId& id, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db);

    Statement select(db, "SELECT status FROM work_queue WHERE id = ?1");
    select.bind(1, id);
    if (!select.step()) {
        return CancelOutcome::NotFound;
    }
    auto status = parse_task_status(select.text(0)).value_or(TaskStatus::Pending);
    if (is_terminal(status)) {
        return CancelOutcome::AlreadyTerminal;
    }

    Statement update(db, "UPDATE work_queue SET status = 'cancelled', completed_at = ?2 "
                         "WHERE id = ?1 AND status IN ('pending', 'claimed')");
    update.bind(1, id);
    update.bind_time(2, now);
    update.run();
    txn.commit();
    return CancelOutcome::Cancelled;
}

ReplaceOutcome SqliteStore::replace_task(const TaskId& old_id, const Task& replacement) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db);

    {
        Statement select(db, "SELECT status FROM work_queue WHERE id = ?1");
        select.bind(1, old_id);
        if (!select.step()) {
            return ReplaceOutcome::NotFound;
        }
        auto status = parse_task_status(select.text(0)).value_or(TaskStatus::Pending);
        if (status != TaskStatus::Failed && status != TaskStatus::Cancelled) {
            return ReplaceOutcome::NotFailed;
        }
    }

    insert_task_locked(replacement);

    Statement rewire(db, "UPDATE OR REPLACE task_dependencies SET depends_on = ?2 "
                         "WHERE depends_on = ?1 AND task_id IN "
                         "(SELECT id FROM work_queue WHERE status = 'pending')");
    rewire.bind(1, old_id);
    rewire.bind(2, replacement.id);
    rewire.run();

    txn.commit();
    return ReplaceOutcome::Replaced;
}

std::optional<Task> SqliteStore::get_task(const TaskId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_.get(), Transaction::Mode::Deferred);
    auto task = load_task_locked(id);
    txn.commit();
    return task;
}

std::vector<Task> SqliteStore::list_tasks(const TaskFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db, Transaction::Mode::Deferred);

    std::string sql = "SELECT " + std::string(kTaskColumns) + " FROM work_queue WHERE 1 = 1";
    int next = 1;
    if (filter.status) {
        sql += " AND status = ?" + std::to_string(next++);
    }
    if (filter.claimant) {
        sql += " AND claimed_by = ?" + std::to_string(next++);
    }
    sql += " ORDER BY priority ASC, created_at ASC, seq ASC";
    if (filter.limit > 0) {
        sql += " LIMIT " + std::to_string(filter.limit);
    }

    std::vector<Task> result;
    {
        Statement st(db, sql);
        int index = 1;
        if (filter.status) {
            st.bind(index++, to_string(*filter.status));
        }
        if (filter.claimant) {
            st.bind(index++, *filter.claimant);
        }
        while (st.step()) {
            result.push_back(read_task_row(st));
        }
    }
    for (auto& task : result) {
        task.dependency_ids = load_dependencies_locked(task.id);
    }
    txn.commit();
    return result;
}

std::optional<Task> SqliteStore::load_task_locked(const TaskId& id) const {
    Statement st(db_.get(), "SELECT " + std::string(kTaskColumns) +
                            " FROM work_queue WHERE id = ?1");
    st.bind(1, id);
    if (!st.step()) {
        return std::nullopt;
    }
    Task task = read_task_row(st);
    task.dependency_ids = load_dependencies_locked(id);
    return task;
}

std::vector<TaskId> SqliteStore::load_dependencies_locked(const TaskId& id) const {
    Statement st(db_.get(), "SELECT depends_on FROM task_dependencies "
                            "WHERE task_id = ?1 ORDER BY position");
    st.bind(1, id);
    std::vector<TaskId> deps;
    while (st.step()) {
        deps.push_back(st.text(0));
    }
    return deps;
}

// ========== Sessions ==========

void SqliteStore::upsert_session(const AgentSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db);

    {
        Statement st(db,
            "INSERT INTO agent_sessions (" + std::string(kSessionColumns) + ") "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7) "
            "ON CONFLICT(id) DO UPDATE SET agent_id = excluded.agent_id, "
            "agent_type = excluded.agent_type, status = excluded.status, "
            "last_heartbeat = excluded.last_heartbeat, current_task = excluded.current_task");
        st.bind(1, session.id);
        st.bind(2, session.agent_id);
        st.bind(3, session.agent_type);
        st.bind(4, to_string(session.status));
        st.bind_time(5, session.started_at);
        st.bind_time(6, session.last_heartbeat);
        st.bind(7, session.current_task);
        st.run();
    }
    {
        Statement clear(db, "DELETE FROM agent_capabilities WHERE session_id = ?1");
        clear.bind(1, session.id);
        clear.run();
    }
    for (const auto& capability : session.capabilities) {
        Statement add(db, "INSERT OR IGNORE INTO agent_capabilities (session_id, capability) "
                          "VALUES (?1, ?2)");
        add.bind(1, session.id);
        add.bind(2, capability);
        add.run();
    }
    txn.commit();
}

std::optional<AgentSession> SqliteStore::touch_session(
    const SessionId& id, Timestamp now,
    std::optional<SessionStatus> status,
    std::optional<std::string> current_task) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db);

    Statement st(db, "UPDATE agent_sessions SET last_heartbeat = ?2, status = ?3, "
                     "current_task = COALESCE(?4, current_task) WHERE id = ?1");
    st.bind(1, id);
    st.bind_time(2, now);
    st.bind(3, to_string(status.value_or(SessionStatus::Active)));
    st.bind(4, current_task);
    st.run();
    if (sqlite3_changes(db) == 0) {
        return std::nullopt;
    }
    auto session = load_session_locked(id);
    txn.commit();
    return session;
}

std::optional<AgentSession> SqliteStore::get_session(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction txn(db_.get(), Transaction::Mode::Deferred);
    auto session = load_session_locked(id);
    txn.commit();
    return session;
}

std::vector<AgentSession> SqliteStore::list_sessions(const SessionFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db, Transaction::Mode::Deferred);

    std::string sql = "SELECT " + std::string(kSessionColumns) + " FROM agent_sessions s WHERE ";
    int next = 1;
    if (filter.status) {
        sql += "s.status = ?" + std::to_string(next++);
    } else {
        sql += "s.status <> 'disconnected'";
    }
    if (filter.agent_id) {
        sql += " AND s.agent_id = ?" + std::to_string(next++);
    }
    if (filter.capability) {
        sql += " AND EXISTS (SELECT 1 FROM agent_capabilities c WHERE c.session_id = s.id "
               "AND c.capability = ?" + std::to_string(next++) + ")";
    }
    sql += " ORDER BY s.last_heartbeat DESC, s.id ASC";

    std::vector<AgentSession> result;
    {
        Statement st(db, sql);
        int index = 1;
        if (filter.status) {
            st.bind(index++, to_string(*filter.status));
        }
        if (filter.agent_id) {
            st.bind(index++, *filter.agent_id);
        }
        if (filter.capability) {
            st.bind(index++, *filter.capability);
        }
        while (st.step()) {
            result.push_back(read_session_row(st));
        }
    }
    for (auto& session : result) {
        session.capabilities = load_capabilities_locked(session.id);
    }
    txn.commit();
    return result;
}

std::vector<ReapedAgent> SqliteStore::reap_stale_sessions(Timestamp cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db);

    std::vector<ReapedAgent> reaped;
    {
        Statement select(db, "SELECT DISTINCT agent_id FROM agent_sessions "
                             "WHERE status IN ('active', 'idle') AND last_heartbeat < ?1 "
                             "ORDER BY agent_id");
        select.bind_time(1, cutoff);
        while (select.step()) {
            ReapedAgent agent;
            agent.agent_id = select.text(0);
            reaped.push_back(std::move(agent));
        }
    }
    if (reaped.empty()) {
        txn.commit();
        return reaped;
    }

    {
        Statement update(db, "UPDATE agent_sessions SET status = 'disconnected' "
                             "WHERE status IN ('active', 'idle') AND last_heartbeat < ?1");
        update.bind_time(1, cutoff);
        update.run();
    }

    // Same transaction: a heartbeat cannot land between disconnect and release
    Statement release(db, "DELETE FROM resource_locks WHERE holder_id = ?1");
    for (auto& agent : reaped) {
        release.bind(1, agent.agent_id);
        release.run();
        agent.locks_released = static_cast<std::size_t>(sqlite3_changes(db));
        release.reset();
    }
    txn.commit();
    return reaped;
}

std::optional<AgentSession> SqliteStore::load_session_locked(const SessionId& id) const {
    Statement st(db_.get(), "SELECT " + std::string(kSessionColumns) +
                            " FROM agent_sessions WHERE id = ?1");
    st.bind(1, id);
    if (!st.step()) {
        return std::nullopt;
    }
    AgentSession session = read_session_row(st);
    session.capabilities = load_capabilities_locked(id);
    return session;
}

std::vector<std::string> SqliteStore::load_capabilities_locked(const SessionId& id) const {
    Statement st(db_.get(), "SELECT capability FROM agent_capabilities "
                            "WHERE session_id = ?1 ORDER BY rowid");
    st.bind(1, id);
    std::vector<std::string> capabilities;
    while (st.step()) {
        capabilities.push_back(st.text(0));
    }
    return capabilities;
}

// ========== Audit ==========

void SqliteStore::append_audit(const std::vector<AuditEntry>& entries) {
    if (entries.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db);

    for (const auto& entry : entries) {
        {
            Statement st(db, "INSERT INTO audit_log (id, agent_id, agent_type, operation, "
                             "duration_us, success, error_message, created_at) "
                             "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");
            st.bind(1, entry.id);
            st.bind(2, entry.agent_id);
            st.bind(3, entry.agent_type);
            st.bind(4, entry.operation);
            st.bind(5, detail::duration_micros(entry.duration));
            st.bind(6, entry.success);
            st.bind(7, entry.error_message);
            st.bind_time(8, entry.created_at);
            st.run();
        }

        auto insert_fields = [&](const char* section, const AuditFields& fields) {
            for (const auto& [name, value] : fields) {
                Statement field(db, "INSERT INTO audit_log_fields (entry_id, section, name, value) "
                                    "VALUES (?1, ?2, ?3, ?4)");
                field.bind(1, entry.id);
                field.bind(2, section);
                field.bind(3, name);
                field.bind(4, value);
                field.run();
            }
        };
        insert_fields("parameter", entry.parameters);
        insert_fields("result", entry.result);
    }
    txn.commit();
}

std::vector<AuditEntry> SqliteStore::query_audit(const AuditFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db, Transaction::Mode::Deferred);

    std::string sql = "SELECT id, agent_id, agent_type, operation, duration_us, success, "
                      "error_message, created_at FROM audit_log WHERE 1 = 1";
    int next = 1;
    if (filter.agent_id) sql += " AND agent_id = ?" + std::to_string(next++);
    if (filter.operation) sql += " AND operation = ?" + std::to_string(next++);
    if (filter.since) sql += " AND created_at >= ?" + std::to_string(next++);
    if (filter.until) sql += " AND created_at <= ?" + std::to_string(next++);
    sql += " ORDER BY created_at DESC, seq DESC";
    if (filter.limit > 0) {
        sql += " LIMIT " + std::to_string(filter.limit);
    }

    std::vector<AuditEntry> result;
    {
        Statement st(db, sql);
        int index = 1;
        if (filter.agent_id) st.bind(index++, *filter.agent_id);
        if (filter.operation) st.bind(index++, *filter.operation);
        if (filter.since) st.bind_time(index++, *filter.since);
        if (filter.until) st.bind_time(index++, *filter.until);

        while (st.step()) {
            AuditEntry entry;
            entry.id = st.text(0);
            entry.agent_id = st.text(1);
            entry.agent_type = st.text(2);
            entry.operation = st.text(3);
            entry.duration = std::chrono::duration_cast<Duration>(
                std::chrono::microseconds(st.integer(4)));
            entry.success = st.integer(5) != 0;
            entry.error_message = st.optional_text(6);
            entry.created_at = st.time(7);
            result.push_back(std::move(entry));
        }
    }

    for (auto& entry : result) {
        Statement fields(db, "SELECT section, name, value FROM audit_log_fields WHERE entry_id = ?1");
        fields.bind(1, entry.id);
        while (fields.step()) {
            auto& target = fields.text(0) == "parameter" ? entry.parameters : entry.result;
            target[fields.text(1)] = fields.text(2);
        }
    }
    txn.commit();
    return result;
}

std::size_t SqliteStore::purge_audit_before(Timestamp cutoff, Duration min_retention) {
    cutoff = std::min(cutoff, current_time() - std::max(min_retention, Duration::zero()));

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db);

    {
        // The triggers only admit deletes of rows older than this horizon.
        // The clamped cutoff keeps it behind every row inside the retention window.
        Statement horizon(db, "INSERT INTO audit_retention (id, horizon) VALUES (1, ?1) "
                              "ON CONFLICT(id) DO UPDATE SET horizon = excluded.horizon");
        horizon.bind_time(1, cutoff);
        horizon.run();
    }
    {
        Statement fields(db, "DELETE FROM audit_log_fields WHERE entry_id IN "
                             "(SELECT id FROM audit_log WHERE created_at < ?1)");
        fields.bind_time(1, cutoff);
        fields.run();
    }

    Statement entries(db, "DELETE FROM audit_log WHERE created_at < ?1");
    entries.bind_time(1, cutoff);
    entries.run();
    auto removed = static_cast<std::size_t>(sqlite3_changes(db));
    txn.commit();
    return removed;
}

// ========== Registries ==========

std::vector<GuardrailPattern> SqliteStore::load_guardrail_patterns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_.get(), "SELECT name, category, pattern, severity, min_trust_to_bypass, "
                            "description, enabled FROM guardrail_patterns "
                            "WHERE enabled = 1 ORDER BY name");
    std::vector<GuardrailPattern> result;
    while (st.step()) {
        GuardrailPattern pattern;
        pattern.name = st.text(0);
        pattern.category = st.text(1);
        pattern.regex = st.text(2);
        pattern.severity = parse_severity(st.text(3)).value_or(Severity::Block);
        pattern.min_trust_to_bypass = static_cast<TrustLevel>(st.integer(4));
        pattern.description = st.text(5);
        pattern.enabled = st.integer(6) != 0;
        result.push_back(std::move(pattern));
    }
    return result;
}

void SqliteStore::upsert_guardrail_pattern(const GuardrailPattern& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_.get(),
        "INSERT INTO guardrail_patterns (name, category, pattern, severity, "
        "min_trust_to_bypass, description, enabled) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7) "
        "ON CONFLICT(name) DO UPDATE SET category = excluded.category, "
        "pattern = excluded.pattern, severity = excluded.severity, "
        "min_trust_to_bypass = excluded.min_trust_to_bypass, "
        "description = excluded.description, enabled = excluded.enabled");
    st.bind(1, pattern.name);
    st.bind(2, pattern.category);
    st.bind(3, pattern.regex);
    st.bind(4, to_string(pattern.severity));
    st.bind(5, pattern.min_trust_to_bypass);
    st.bind(6, pattern.description);
    st.bind(7, pattern.enabled);
    st.run();
}

void SqliteStore::record_violations(const std::vector<GuardrailViolation>& violations) {
    if (violations.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db);
    for (const auto& v : violations) {
        Statement st(db, "INSERT INTO guardrail_violations (agent_id, pattern_name, category, "
                         "severity, operation_text, matched_text, blocked, bypassed, "
                         "trust_level, created_at) "
                         "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)");
        st.bind(1, v.agent_id);
        st.bind(2, v.pattern_name);
        st.bind(3, v.category);
        st.bind(4, to_string(v.severity));
        st.bind(5, v.operation_text);
        st.bind(6, v.matched_text);
        st.bind(7, v.blocked);
        st.bind(8, v.bypassed);
        st.bind(9, v.trust_level);
        st.bind_time(10, v.created_at);
        st.run();
    }
    txn.commit();
}

std::vector<GuardrailViolation> SqliteStore::list_violations(
    const std::optional<AgentId>& agent_id, std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "SELECT agent_id, pattern_name, category, severity, operation_text, "
                      "matched_text, blocked, bypassed, trust_level, created_at "
                      "FROM guardrail_violations";
    if (agent_id) {
        sql += " WHERE agent_id = ?1";
    }
    sql += " ORDER BY seq DESC";
    if (limit > 0) {
        sql += " LIMIT " + std::to_string(limit);
    }

    Statement st(db_.get(), sql);
    if (agent_id) {
        st.bind(1, *agent_id);
    }
    std::vector<GuardrailViolation> result;
    while (st.step()) {
        GuardrailViolation v;
        v.agent_id = st.text(0);
        v.pattern_name = st.text(1);
        v.category = st.text(2);
        v.severity = parse_severity(st.text(3)).value_or(Severity::Block);
        v.operation_text = st.text(4);
        v.matched_text = st.text(5);
        v.blocked = st.integer(6) != 0;
        v.bypassed = st.integer(7) != 0;
        v.trust_level = static_cast<TrustLevel>(st.integer(8));
        v.created_at = st.time(9);
        result.push_back(std::move(v));
    }
    return result;
}

std::optional<AgentProfile> SqliteStore::find_profile(const AgentId& agent_id,
                                                      const std::string& agent_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db, Transaction::Mode::Deferred);

    std::optional<AgentProfile> profile;
    {
        Statement assigned(db, "SELECT p.name, p.agent_type, p.trust_level, p.allowed_operations, "
                               "p.blocked_operations, p.max_file_modifications, "
                               "p.max_execution_time_seconds, p.max_api_calls_per_hour, "
                               "p.description, p.enabled "
                               "FROM agent_profile_assignments a "
                               "JOIN agent_profiles p ON p.name = a.profile_name "
                               "WHERE a.agent_id = ?1 AND p.enabled = 1");
        assigned.bind(1, agent_id);
        if (assigned.step()) {
            profile = read_profile_row(assigned);
        }
    }
    if (!profile) {
        Statement by_type(db, "SELECT " + std::string(kProfileColumns) +
                              " FROM agent_profiles WHERE agent_type = ?1 AND enabled = 1 "
                              "ORDER BY rowid LIMIT 1");
        by_type.bind(1, agent_type);
        if (by_type.step()) {
            profile = read_profile_row(by_type);
        }
    }
    if (profile) {
        Statement overrides(db, "SELECT " + std::string(kNetworkColumns) +
                                " FROM network_policies WHERE profile_name = ?1 AND enabled = 1 "
                                "ORDER BY priority, rowid");
        overrides.bind(1, profile->name);
        while (overrides.step()) {
            profile->network_overrides.push_back(read_network_row(overrides));
        }
    }
    txn.commit();
    return profile;
}

void SqliteStore::upsert_profile(const AgentProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_.get(),
        "INSERT INTO agent_profiles (" + std::string(kProfileColumns) + ") "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10) "
        "ON CONFLICT(name) DO UPDATE SET agent_type = excluded.agent_type, "
        "trust_level = excluded.trust_level, allowed_operations = excluded.allowed_operations, "
        "blocked_operations = excluded.blocked_operations, "
        "max_file_modifications = excluded.max_file_modifications, "
        "max_execution_time_seconds = excluded.max_execution_time_seconds, "
        "max_api_calls_per_hour = excluded.max_api_calls_per_hour, "
        "description = excluded.description, enabled = excluded.enabled");
    st.bind(1, profile.name);
    st.bind(2, profile.agent_type);
    st.bind(3, profile.trust_level);
    st.bind(4, detail::join(profile.allowed_ops, ','));
    st.bind(5, detail::join(profile.blocked_ops, ','));
    st.bind(6, profile.resource_limits.max_file_modifications);
    st.bind(7, profile.resource_limits.max_execution_time_seconds);
    st.bind(8, profile.resource_limits.max_api_calls_per_hour);
    st.bind(9, profile.description);
    st.bind(10, profile.enabled);
    st.run();
}

void SqliteStore::assign_profile(const AgentId& agent_id, const std::string& profile_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3* db = db_.get();
    Transaction txn(db);
    {
        Statement known(db, "SELECT 1 FROM agent_profiles WHERE name = ?1");
        known.bind(1, profile_name);
        if (!known.step()) {
            throw InvalidRequestException("Unknown profile: " + profile_name);
        }
    }
    Statement st(db, "INSERT INTO agent_profile_assignments (agent_id, profile_name) "
                     "VALUES (?1, ?2) ON CONFLICT(agent_id) DO UPDATE SET "
                     "profile_name = excluded.profile_name");
    st.bind(1, agent_id);
    st.bind(2, profile_name);
    st.run();
    txn.commit();
}

std::vector<NetworkAccessPolicy> SqliteStore::load_network_policies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_.get(), "SELECT " + std::string(kNetworkColumns) +
                            " FROM network_policies WHERE enabled = 1 ORDER BY priority, rowid");
    std::vector<NetworkAccessPolicy> result;
    while (st.step()) {
        result.push_back(read_network_row(st));
    }
    return result;
}

void SqliteStore::upsert_network_policy(const NetworkAccessPolicy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_.get(),
        "INSERT INTO network_policies (" + std::string(kNetworkColumns) + ") "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6) "
        "ON CONFLICT(domain_pattern, profile_name) DO UPDATE SET action = excluded.action, "
        "priority = excluded.priority, description = excluded.description, "
        "enabled = excluded.enabled");
    st.bind(1, policy.domain_pattern);
    st.bind(2, policy.profile_name.value_or(""));
    st.bind(3, to_string(policy.action));
    st.bind(4, policy.priority);
    st.bind(5, policy.description);
    st.bind(6, policy.enabled);
    st.run();
}

std::vector<PolicyDocument> SqliteStore::load_policy_documents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_.get(), "SELECT name, policy_text, priority, description, enabled "
                            "FROM policy_documents WHERE enabled = 1 ORDER BY priority, name");
    std::vector<PolicyDocument> result;
    while (st.step()) {
        PolicyDocument document;
        document.name = st.text(0);
        document.text = st.text(1);
        document.priority = static_cast<std::int32_t>(st.integer(2));
        document.description = st.text(3);
        document.enabled = st.integer(4) != 0;
        result.push_back(std::move(document));
    }
    return result;
}

void SqliteStore::upsert_policy_document(const PolicyDocument& document) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_.get(),
        "INSERT INTO policy_documents (name, policy_text, priority, description, enabled) "
        "VALUES (?1, ?2, ?3, ?4, ?5) "
        "ON CONFLICT(name) DO UPDATE SET policy_text = excluded.policy_text, "
        "priority = excluded.priority, description = excluded.description, "
        "enabled = excluded.enabled");
    st.bind(1, document.name);
    st.bind(2, document.text);
    st.bind(3, document.priority);
    st.bind(4, document.description);
    st.bind(5, document.enabled);
    st.run();
}

} // namespace agentcoord
