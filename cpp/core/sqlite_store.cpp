#include "sqlite_store.hpp"
#include "errors.hpp"

#include <filesystem>

#include <sqlite3.h>

namespace fs = std::filesystem;

namespace agentsup {

namespace {

[[noreturn]] void throw_sqlite_error(sqlite3* db, int rc, const std::string& context) {
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    int primary = rc & 0xff;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
        throw QueueTransactionConflict(context + ": " + detail);
    }
    throw StoreError(context + ": " + detail);
}

/**
 * Statement - sqlite3_stmt 的 RAII 包装
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            throw_sqlite_error(db_, rc, "prepare failed");
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    // 禁止拷贝
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_text(int idx, const std::string& value) {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }

    void bind_blob(int idx, const std::string& value) {
        check(sqlite3_bind_blob(stmt_, idx, value.data(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }

    void bind_int(int idx, int64_t value) {
        check(sqlite3_bind_int64(stmt_, idx, value));
    }

    void bind_double(int idx, double value) {
        check(sqlite3_bind_double(stmt_, idx, value));
    }

    /**
     * 执行一步
     * @return true 如果产生了一行结果
     */
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw_sqlite_error(db_, rc, "step failed");
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    int64_t int_at(int col) const { return sqlite3_column_int64(stmt_, col); }
    double double_at(int col) const { return sqlite3_column_double(stmt_, col); }

    std::string text_at(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        if (!text) {
            return "";
        }
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }

    std::string blob_at(int col) const {
        const void* data = sqlite3_column_blob(stmt_, col);
        int size = sqlite3_column_bytes(stmt_, col);
        if (!data || size <= 0) {
            return "";
        }
        return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw_sqlite_error(db_, rc, "bind failed");
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string detail = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        int primary = rc & 0xff;
        if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
            throw QueueTransactionConflict(std::string("exec failed: ") + detail);
        }
        throw StoreError(std::string("exec failed: ") + detail);
    }
}

/**
 * Transaction - 作用域内的写事务，析构时未提交则回滚
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        // IMMEDIATE：开始时即获取写锁，避免读后升级写锁时的死锁
        exec_sql(db_, "BEGIN IMMEDIATE");
        active_ = true;
    }

    ~Transaction() {
        if (active_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec_sql(db_, "COMMIT");
        active_ = false;
    }

private:
    sqlite3* db_;
    bool active_ = false;
};

constexpr const char* kMessageColumns =
    "id, sender, recipient, type, payload, priority, status, "
    "created_at, claimed_at, completed_at, error";

Message read_message(const Statement& stmt) {
    Message msg;
    msg.id = stmt.int_at(0);
    msg.sender = stmt.text_at(1);
    msg.recipient = stmt.text_at(2);
    msg.type = stmt.text_at(3);
    msg.payload = stmt.blob_at(4);
    msg.priority = static_cast<int>(stmt.int_at(5));
    msg.status = message_status_from_string(stmt.text_at(6)).value_or(MessageStatus::Failed);
    msg.created_at = stmt.int_at(7);
    msg.claimed_at = stmt.int_at(8);
    msg.completed_at = stmt.int_at(9);
    msg.error = stmt.text_at(10);
    return msg;
}

LockRecord read_lock(const Statement& stmt) {
    LockRecord lock;
    lock.role_id = stmt.text_at(0);
    lock.holder_pid = static_cast<pid_t>(stmt.int_at(1));
    lock.acquired_at = stmt.int_at(2);
    return lock;
}

HeartbeatRecord read_heartbeat(const Statement& stmt) {
    HeartbeatRecord hb;
    hb.role_id = stmt.text_at(0);
    hb.pid = static_cast<pid_t>(stmt.int_at(1));
    hb.timestamp = stmt.int_at(2);
    hb.cpu_percent = stmt.double_at(3);
    hb.memory_bytes = stmt.int_at(4);
    return hb;
}

} // anonymous namespace

// ============================================================================
// SqliteStore Implementation
// ============================================================================

SqliteStore::SqliteStore(const std::string& db_path, Millis busy_timeout)
    : path_(db_path) {

    // 确保目录存在
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw StoreError("Failed to create " + parent.string() + ": " + ec.message());
        }
    }

    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open " + path_ + ": " + detail);
    }

    sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count()));

    try {
        init_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::init_schema() {
    exec_sql(db_, "PRAGMA journal_mode=WAL");
    exec_sql(db_, "PRAGMA synchronous=NORMAL");

    exec_sql(db_, R"sql(
        CREATE TABLE IF NOT EXISTS role_locks (
            role TEXT PRIMARY KEY,
            holder_pid INTEGER NOT NULL,
            acquired_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS heartbeats (
            role TEXT PRIMARY KEY,
            pid INTEGER NOT NULL,
            timestamp INTEGER NOT NULL,
            cpu_percent REAL NOT NULL DEFAULT 0,
            memory_bytes INTEGER NOT NULL DEFAULT 0
        );

        CREATE TABLE IF NOT EXISTS messages (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            sender TEXT NOT NULL,
            recipient TEXT NOT NULL,
            type TEXT NOT NULL,
            payload BLOB,
            priority INTEGER NOT NULL DEFAULT 5,
            status TEXT NOT NULL DEFAULT 'pending',
            created_at INTEGER NOT NULL,
            claimed_at INTEGER NOT NULL DEFAULT 0,
            completed_at INTEGER NOT NULL DEFAULT 0,
            error TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_messages_delivery
            ON messages(recipient, status, priority, created_at, id);

        CREATE INDEX IF NOT EXISTS idx_messages_completed
            ON messages(status, completed_at);

        CREATE TABLE IF NOT EXISTS metrics (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            role TEXT NOT NULL,
            operation_type TEXT NOT NULL,
            duration_ms REAL NOT NULL,
            timestamp INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_metrics_role_time
            ON metrics(role, timestamp);

        CREATE TABLE IF NOT EXISTS worker_status (
            role TEXT PRIMARY KEY,
            state TEXT NOT NULL,
            pid INTEGER NOT NULL,
            started_at INTEGER NOT NULL,
            restart_count INTEGER NOT NULL,
            max_restarts INTEGER NOT NULL,
            last_heartbeat INTEGER NOT NULL,
            cpu_percent REAL NOT NULL,
            memory_bytes INTEGER NOT NULL,
            forced_stop INTEGER NOT NULL DEFAULT 0,
            updated_at INTEGER NOT NULL
        );
    )sql");
}

// ---- role_locks ------------------------------------------------------------

bool SqliteStore::insert_lock(const LockRecord& lock) {
    std::lock_guard<std::mutex> guard(mutex_);

    // 单条语句：主键冲突即失败，claim 因此是线性一致的
    Statement stmt(db_, "INSERT OR IGNORE INTO role_locks (role, holder_pid, acquired_at) "
                        "VALUES (?, ?, ?)");
    stmt.bind_text(1, lock.role_id);
    stmt.bind_int(2, lock.holder_pid);
    stmt.bind_int(3, lock.acquired_at);
    stmt.step();
    return sqlite3_changes(db_) == 1;
}

std::optional<LockRecord> SqliteStore::get_lock(const std::string& role_id) {
    std::lock_guard<std::mutex> guard(mutex_);

    Statement stmt(db_, "SELECT role, holder_pid, acquired_at FROM role_locks WHERE role = ?");
    stmt.bind_text(1, role_id);
    if (stmt.step()) {
        return read_lock(stmt);
    }
    return std::nullopt;
}

bool SqliteStore::replace_lock(const LockRecord& expected, const LockRecord& replacement) {
    std::lock_guard<std::mutex> guard(mutex_);

    Statement stmt(db_, "UPDATE role_locks SET holder_pid = ?, acquired_at = ? "
                        "WHERE role = ? AND holder_pid = ? AND acquired_at = ?");
    stmt.bind_int(1, replacement.holder_pid);
    stmt.bind_int(2, replacement.acquired_at);
    stmt.bind_text(3, expected.role_id);
    stmt.bind_int(4, expected.holder_pid);
    stmt.bind_int(5, expected.acquired_at);
    stmt.step();
    return sqlite3_changes(db_) == 1;
}

bool SqliteStore::delete_lock(const std::string& role_id, pid_t holder_pid) {
    std::lock_guard<std::mutex> guard(mutex_);

    Statement stmt(db_, "DELETE FROM role_locks WHERE role = ? AND holder_pid = ?");
    stmt.bind_text(1, role_id);
    stmt.bind_int(2, holder_pid);
    stmt.step();
    return sqlite3_changes(db_) == 1;
}

std::vector<LockRecord> SqliteStore::list_locks() {
    std::lock_guard<std::mutex> guard(mutex_);

    std::vector<LockRecord> locks;
    Statement stmt(db_, "SELECT role, holder_pid, acquired_at FROM role_locks ORDER BY role");
    while (stmt.step()) {
        locks.push_back(read_lock(stmt));
    }
    return locks;
}

// ---- heartbeats ------------------------------------------------------------

void SqliteStore::upsert_heartbeat(const HeartbeatRecord& heartbeat) {
    std::lock_guard<std::mutex> guard(mutex_);

    Statement stmt(db_, "INSERT OR REPLACE INTO heartbeats "
                        "(role, pid, timestamp, cpu_percent, memory_bytes) VALUES (?, ?, ?, ?, ?)");
    stmt.bind_text(1, heartbeat.role_id);
    stmt.bind_int(2, heartbeat.pid);
    stmt.bind_int(3, heartbeat.timestamp);
    stmt.bind_double(4, heartbeat.cpu_percent);
    stmt.bind_int(5, heartbeat.memory_bytes);
    stmt.step();
}

std::optional<HeartbeatRecord> SqliteStore::get_heartbeat(const std::string& role_id) {
    std::lock_guard<std::mutex> guard(mutex_);

    Statement stmt(db_, "SELECT role, pid, timestamp, cpu_percent, memory_bytes "
                        "FROM heartbeats WHERE role = ?");
    stmt.bind_text(1, role_id);
    if (stmt.step()) {
        return read_heartbeat(stmt);
    }
    return std::nullopt;
}

std::vector<HeartbeatRecord> SqliteStore::list_heartbeats() {
    std::lock_guard<std::mutex> guard(mutex_);

    std::vector<HeartbeatRecord> result;
    Statement stmt(db_, "SELECT role, pid, timestamp, cpu_percent, memory_bytes "
                        "FROM heartbeats ORDER BY role");
    while (stmt.step()) {
        result.push_back(read_heartbeat(stmt));
    }
    return result;
}

// ---- messages --------------------------------------------------------------

int64_t SqliteStore::insert_message(const Message& message) {
    std::lock_guard<std::mutex> guard(mutex_);

    Statement stmt(db_, "INSERT INTO messages "
                        "(sender, recipient, type, payload, priority, status, created_at) "
                        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    stmt.bind_text(1, message.sender);
    stmt.bind_text(2, message.recipient);
    stmt.bind_text(3, message.type);
    stmt.bind_blob(4, message.payload);
    stmt.bind_int(5, message.priority);
    stmt.bind_text(6, to_string(message.status));
    stmt.bind_int(7, message.created_at);
    stmt.step();
    return sqlite3_last_insert_rowid(db_);
}

std::vector<Message> SqliteStore::claim_pending(const std::string& recipient,
                                                size_t limit,
                                                TimestampMs now) {
    std::lock_guard<std::mutex> guard(mutex_);

    std::vector<Message> claimed;
    if (limit == 0) {
        return claimed;
    }

    Transaction txn(db_);
    {
        std::string sql = std::string("SELECT ") + kMessageColumns +
                          " FROM messages WHERE recipient = ? AND status = 'pending' "
                          "ORDER BY priority ASC, created_at ASC, id ASC LIMIT ?";
        Statement select(db_, sql.c_str());
        select.bind_text(1, recipient);
        select.bind_int(2, static_cast<int64_t>(limit));
        while (select.step()) {
            claimed.push_back(read_message(select));
        }
    }

    Statement update(db_, "UPDATE messages SET status = 'in_progress', claimed_at = ? "
                          "WHERE id = ? AND status = 'pending'");
    for (auto& msg : claimed) {
        update.bind_int(1, now);
        update.bind_int(2, msg.id);
        update.step();
        update.reset();
        msg.status = MessageStatus::InProgress;
        msg.claimed_at = now;
    }

    txn.commit();
    return claimed;
}

bool SqliteStore::transition_message(int64_t id,
                                     MessageStatus from,
                                     MessageStatus to,
                                     TimestampMs now,
                                     const std::string& error) {
    std::lock_guard<std::mutex> guard(mutex_);

    bool finished = (to == MessageStatus::Completed || to == MessageStatus::Failed);
    Statement stmt(db_, "UPDATE messages SET status = ?, "
                        "claimed_at = CASE WHEN ? THEN ? ELSE claimed_at END, "
                        "completed_at = CASE WHEN ? THEN ? ELSE completed_at END, "
                        "error = ? "
                        "WHERE id = ? AND status = ?");
    stmt.bind_text(1, to_string(to));
    stmt.bind_int(2, to == MessageStatus::InProgress ? 1 : 0);
    stmt.bind_int(3, now);
    stmt.bind_int(4, finished ? 1 : 0);
    stmt.bind_int(5, now);
    stmt.bind_text(6, error);
    stmt.bind_int(7, id);
    stmt.bind_text(8, to_string(from));
    stmt.step();
    return sqlite3_changes(db_) == 1;
}

std::optional<Message> SqliteStore::get_message(int64_t id) {
    std::lock_guard<std::mutex> guard(mutex_);

    std::string sql = std::string("SELECT ") + kMessageColumns + " FROM messages WHERE id = ?";
    Statement stmt(db_, sql.c_str());
    stmt.bind_int(1, id);
    if (stmt.step()) {
        return read_message(stmt);
    }
    return std::nullopt;
}

size_t SqliteStore::expire_pending(const std::string& recipient,
                                   TimestampMs now,
                                   const std::string& reason) {
    std::lock_guard<std::mutex> guard(mutex_);

    Statement stmt(db_, "UPDATE messages SET status = 'failed', completed_at = ?, error = ? "
                        "WHERE recipient = ? AND status = 'pending'");
    stmt.bind_int(1, now);
    stmt.bind_text(2, reason);
    stmt.bind_text(3, recipient);
    stmt.step();
    return static_cast<size_t>(sqlite3_changes(db_));
}

size_t SqliteStore::purge_finished_before(TimestampMs cutoff) {
    std::lock_guard<std::mutex> guard(mutex_);

    Statement stmt(db_, "DELETE FROM messages "
                        "WHERE status IN ('completed', 'failed') AND completed_at < ?");
    stmt.bind_int(1, cutoff);
    stmt.step();
    return static_cast<size_t>(sqlite3_changes(db_));
}

std::map<MessageStatus, size_t> SqliteStore::count_by_status(
    const std::optional<std::string>& recipient) {
    std::lock_guard<std::mutex> guard(mutex_);

    std::map<MessageStatus, size_t> counts;
    const char* sql = recipient
        ? "SELECT status, COUNT(*) FROM messages WHERE recipient = ? GROUP BY status"
        : "SELECT status, COUNT(*) FROM messages GROUP BY status";
    Statement stmt(db_, sql);
    if (recipient) {
        stmt.bind_text(1, *recipient);
    }
    while (stmt.step()) {
        auto status = message_status_from_string(stmt.text_at(0));
        if (status) {
            counts[*status] = static_cast<size_t>(stmt.int_at(1));
        }
    }
    return counts;
}

std::vector<Message> SqliteStore::slowest_completed(size_t limit) {
    std::lock_guard<std::mutex> guard(mutex_);

    std::vector<Message> result;
    std::string sql = std::string("SELECT ") + kMessageColumns +
                      " FROM messages WHERE status = 'completed' "
                      "ORDER BY (completed_at - claimed_at) DESC, id ASC LIMIT ?";
    Statement stmt(db_, sql.c_str());
    stmt.bind_int(1, static_cast<int64_t>(limit));
    while (stmt.step()) {
        result.push_back(read_message(stmt));
    }
    return result;
}

// ---- metrics ---------------------------------------------------------------

int64_t SqliteStore::insert_metric(const MetricSample& sample) {
    std::lock_guard<std::mutex> guard(mutex_);

    Statement stmt(db_, "INSERT INTO metrics (role, operation_type, duration_ms, timestamp) "
                        "VALUES (?, ?, ?, ?)");
    stmt.bind_text(1, sample.role_id);
    stmt.bind_text(2, sample.operation_type);
    stmt.bind_double(3, sample.duration_ms);
    stmt.bind_int(4, sample.timestamp);
    stmt.step();
    return sqlite3_last_insert_rowid(db_);
}

std::vector<MetricSample> SqliteStore::list_metrics(const std::optional<std::string>& role_id,
                                                    TimestampMs since) {
    std::lock_guard<std::mutex> guard(mutex_);

    std::vector<MetricSample> result;
    const char* sql = role_id
        ? "SELECT id, role, operation_type, duration_ms, timestamp FROM metrics "
          "WHERE timestamp >= ? AND role = ? ORDER BY timestamp, id"
        : "SELECT id, role, operation_type, duration_ms, timestamp FROM metrics "
          "WHERE timestamp >= ? ORDER BY timestamp, id";
    Statement stmt(db_, sql);
    stmt.bind_int(1, since);
    if (role_id) {
        stmt.bind_text(2, *role_id);
    }
    while (stmt.step()) {
        MetricSample sample;
        sample.id = stmt.int_at(0);
        sample.role_id = stmt.text_at(1);
        sample.operation_type = stmt.text_at(2);
        sample.duration_ms = stmt.double_at(3);
        sample.timestamp = stmt.int_at(4);
        result.push_back(std::move(sample));
    }
    return result;
}

// ---- worker_status ---------------------------------------------------------

void SqliteStore::upsert_worker_status(const WorkerStatusRecord& record) {
    std::lock_guard<std::mutex> guard(mutex_);

    Statement stmt(db_, "INSERT OR REPLACE INTO worker_status "
                        "(role, state, pid, started_at, restart_count, max_restarts, "
                        " last_heartbeat, cpu_percent, memory_bytes, forced_stop, updated_at) "
                        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind_text(1, record.role_id);
    stmt.bind_text(2, to_string(record.state));
    stmt.bind_int(3, record.pid);
    stmt.bind_int(4, record.started_at);
    stmt.bind_int(5, record.restart_count);
    stmt.bind_int(6, record.max_restarts);
    stmt.bind_int(7, record.last_heartbeat);
    stmt.bind_double(8, record.cpu_percent);
    stmt.bind_int(9, record.memory_bytes);
    stmt.bind_int(10, record.forced_stop ? 1 : 0);
    stmt.bind_int(11, record.updated_at);
    stmt.step();
}

std::vector<WorkerStatusRecord> SqliteStore::list_worker_status() {
    std::lock_guard<std::mutex> guard(mutex_);

    std::vector<WorkerStatusRecord> result;
    Statement stmt(db_, "SELECT role, state, pid, started_at, restart_count, max_restarts, "
                        "last_heartbeat, cpu_percent, memory_bytes, forced_stop, updated_at "
                        "FROM worker_status ORDER BY role");
    while (stmt.step()) {
        WorkerStatusRecord record;
        record.role_id = stmt.text_at(0);
        record.state = worker_state_from_string(stmt.text_at(1)).value_or(WorkerState::Unstarted);
        record.pid = static_cast<pid_t>(stmt.int_at(2));
        record.started_at = stmt.int_at(3);
        record.restart_count = static_cast<int>(stmt.int_at(4));
        record.max_restarts = static_cast<int>(stmt.int_at(5));
        record.last_heartbeat = stmt.int_at(6);
        record.cpu_percent = stmt.double_at(7);
        record.memory_bytes = stmt.int_at(8);
        record.forced_stop = stmt.int_at(9) != 0;
        record.updated_at = stmt.int_at(10);
        result.push_back(std::move(record));
    }
    return result;
}

} // namespace agentsup
