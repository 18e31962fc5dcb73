#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace agentsup {

/**
 * CoordinationStore - 监督进程与 worker 共享的持久化协调状态
 *
 * 包含五张逻辑表：role_locks、heartbeats、messages、metrics、worker_status。
 * 每个方法都是单行原子操作（claim_pending 除外，它是单个写事务），
 * 因此调用方无需额外的应用层锁。
 *
 * 实现：
 * - SqliteStore：生产环境，多进程共享同一个数据库文件
 * - MemoryStore：测试用，进程内
 */
class CoordinationStore {
public:
    virtual ~CoordinationStore() = default;

    // ---- role_locks --------------------------------------------------------

    /**
     * 插入锁记录
     * @return false 如果该角色已有锁记录
     */
    virtual bool insert_lock(const LockRecord& lock) = 0;

    virtual std::optional<LockRecord> get_lock(const std::string& role_id) = 0;

    /**
     * 比较并替换：仅当当前记录的 holder_pid 与 acquired_at 均与 expected 相同时替换
     */
    virtual bool replace_lock(const LockRecord& expected, const LockRecord& replacement) = 0;

    /**
     * 删除锁记录（仅当 holder_pid 匹配）
     */
    virtual bool delete_lock(const std::string& role_id, pid_t holder_pid) = 0;

    virtual std::vector<LockRecord> list_locks() = 0;

    // ---- heartbeats --------------------------------------------------------

    virtual void upsert_heartbeat(const HeartbeatRecord& heartbeat) = 0;
    virtual std::optional<HeartbeatRecord> get_heartbeat(const std::string& role_id) = 0;
    virtual std::vector<HeartbeatRecord> list_heartbeats() = 0;

    // ---- messages ----------------------------------------------------------

    /**
     * @return 新消息 ID
     */
    virtual int64_t insert_message(const Message& message) = 0;

    /**
     * 取出 recipient 的待处理消息并原子标记为 in_progress
     *
     * 顺序：priority 升序，created_at 升序，id 升序。
     * @throws QueueTransactionConflict 写锁竞争超时
     */
    virtual std::vector<Message> claim_pending(const std::string& recipient,
                                               size_t limit,
                                               TimestampMs now) = 0;

    /**
     * 条件状态迁移：仅当当前状态为 from 时迁移到 to
     * @return 是否迁移成功
     */
    virtual bool transition_message(int64_t id,
                                    MessageStatus from,
                                    MessageStatus to,
                                    TimestampMs now,
                                    const std::string& error) = 0;

    virtual std::optional<Message> get_message(int64_t id) = 0;

    /**
     * 将 recipient 的所有 pending 消息直接置为 failed
     * @return 受影响的消息数
     */
    virtual size_t expire_pending(const std::string& recipient,
                                  TimestampMs now,
                                  const std::string& reason) = 0;

    /**
     * 删除 completed_at 早于 cutoff 的已完成/失败消息
     */
    virtual size_t purge_finished_before(TimestampMs cutoff) = 0;

    virtual std::map<MessageStatus, size_t> count_by_status(
        const std::optional<std::string>& recipient) = 0;

    /**
     * 按处理耗时（completed_at - claimed_at）降序返回已完成消息
     */
    virtual std::vector<Message> slowest_completed(size_t limit) = 0;

    // ---- metrics -----------------------------------------------------------

    virtual int64_t insert_metric(const MetricSample& sample) = 0;
    virtual std::vector<MetricSample> list_metrics(const std::optional<std::string>& role_id,
                                                   TimestampMs since) = 0;

    // ---- worker_status -----------------------------------------------------

    virtual void upsert_worker_status(const WorkerStatusRecord& record) = 0;
    virtual std::vector<WorkerStatusRecord> list_worker_status() = 0;
};

} // namespace agentsup
