#pragma once

#include <mutex>
#include <unordered_map>

#include "coordination_store.hpp"

namespace agentsup {

/**
 * MemoryStore - 进程内的 CoordinationStore
 *
 * 线程安全，语义与 SqliteStore 一致，用于测试和不需要持久化的场景。
 */
class MemoryStore : public CoordinationStore {
public:
    MemoryStore() = default;

    // 禁止拷贝
    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

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
    mutable std::mutex mutex_;

    std::unordered_map<std::string, LockRecord> locks_;
    std::unordered_map<std::string, HeartbeatRecord> heartbeats_;

    // 按 id 有序，便于 FIFO 比较
    std::map<int64_t, Message> messages_;
    int64_t next_message_id_ = 1;

    std::vector<MetricSample> metrics_;
    int64_t next_metric_id_ = 1;

    std::map<std::string, WorkerStatusRecord> worker_status_;
};

} // namespace agentsup
