#pragma once

#include <mutex>
#include <string>

#include "coordination_store.hpp"

// Forward declaration for SQLite handle
struct sqlite3;

namespace agentsup {

/**
 * SqliteStore - 基于 SQLite 的 CoordinationStore
 *
 * 1. WAL 模式，允许 worker 读的同时监督进程写
 * 2. busy_timeout 处理跨进程写锁竞争，超时后抛出 QueueTransactionConflict
 * 3. 每个实例持有一个连接；同一连接上的调用由 mutex_ 串行化
 *
 * 多个进程（或同一进程内的多个实例）可同时打开同一个数据库文件。
 */
class SqliteStore : public CoordinationStore {
public:
    /**
     * 打开（必要时创建）数据库并初始化表结构
     * @param db_path 数据库文件路径，父目录不存在时自动创建
     * @param busy_timeout 写锁等待上限
     * @throws StoreError 如果打开或建表失败
     */
    explicit SqliteStore(const std::string& db_path, Millis busy_timeout = Millis(5000));

    ~SqliteStore() override;

    // 禁止拷贝
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    const std::string& path() const { return path_; }

    bool insert_lock(const LockRecord& lock) override;
    std::optional<LockRecord> get_lock(const std::string& role_id) override;
    bool replace_lock(const LockRecord& expected, const LockRecord& replacement) override;
    bool delete_lock(const std::string& role_id, pid_t holder_pid) override;
    std::vector<LockRecord> list_locks() override;

    void upsert_heartbeat(const HeartbeatRecord& heartbeat) override;
    std::optional<HeartbeatRecord> get_heartbeat(const std::string& role_id) override;
    std::vector<HeartbeatRecord> list_heartbeats() override;

    int64_t insert_message(const Message& message) override;
    std::vector<Message> claim_pending(const std::string& recipient,
                                       size_t limit,
                                       TimestampMs now) override;
    bool transition_message(int64_t id,
                            MessageStatus from,
                            MessageStatus to,
                            TimestampMs now,
                            const std::string& error) override;
    std::optional<Message> get_message(int64_t id) override;
    size_t expire_pending(const std::string& recipient,
                          TimestampMs now,
                          const std::string& reason) override;
    size_t purge_finished_before(TimestampMs cutoff) override;
    std::map<MessageStatus, size_t> count_by_status(
        const std::optional<std::string>& recipient) override;
    std::vector<Message> slowest_completed(size_t limit) override;

    int64_t insert_metric(const MetricSample& sample) override;
    std::vector<MetricSample> list_metrics(const std::optional<std::string>& role_id,
                                           TimestampMs since) override;

    void upsert_worker_status(const WorkerStatusRecord& record) override;
    std::vector<WorkerStatusRecord> list_worker_status() override;

private:
    void init_schema();

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace agentsup
