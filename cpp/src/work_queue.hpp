#pragma once

#include <optional>
#include <string>
#include <vector>

#include "coordination_store.hpp"
#include "types.hpp"

namespace agentsup {

enum class Outcome {
    Completed,
    Failed,
};

struct QueueStats {
    size_t pending = 0;
    size_t in_progress = 0;
    size_t completed = 0;
    size_t failed = 0;

    size_t total() const { return pending + in_progress + completed + failed; }
};

/**
 * 某个 (role, operation_type) 的耗时统计
 */
struct MetricSummary {
    std::string role_id;
    std::string operation_type;
    size_t count = 0;
    double mean_ms = 0.0;
    double p50_ms = 0.0;
    double p95_ms = 0.0;
    double p99_ms = 0.0;
    double max_ms = 0.0;
};

/**
 * WorkQueue - worker 之间的持久化消息队列
 *
 * 1. 投递顺序：priority 升序，同优先级按创建顺序（FIFO）
 * 2. dequeue 在单个写事务中取出并标记 in_progress，同一消息不会被两个消费者同时持有
 * 3. 状态单向迁移：pending → in_progress → completed | failed，非法迁移抛 IllegalTransition
 * 4. 指标只追加，写入失败只记录日志，不影响消息投递
 */
class WorkQueue {
public:
    explicit WorkQueue(CoordinationStore& store, NowFn now = {});

    /**
     * 入队（忽略 message 中的 id/status/时间戳）
     * @return 新消息 ID
     */
    int64_t enqueue(Message message);

    int64_t enqueue(const std::string& sender,
                    const std::string& recipient,
                    const std::string& type,
                    const std::string& payload,
                    int priority = 5);

    /**
     * 取出最多 limit 条发给 recipient 的待处理消息
     * @throws QueueTransactionConflict 多次重试后仍有写锁竞争
     */
    std::vector<Message> dequeue(const std::string& recipient, size_t limit = 1);

    /**
     * in_progress → completed/failed，并追加一条处理耗时指标
     * @throws IllegalTransition 消息不存在或不处于 in_progress
     */
    void complete(int64_t message_id, Outcome outcome, const std::string& error = "");

    void record_metric(const MetricSample& sample);

    void record_metric(const std::string& role_id,
                       const std::string& operation_type,
                       double duration_ms);

    std::optional<Message> get(int64_t message_id);

    /**
     * 将 recipient 的全部待处理消息置为 failed（收件角色已 terminal 时使用）
     */
    size_t expire_pending(const std::string& recipient, const std::string& reason);

    /**
     * 删除完成时间早于 retention 的已完成/失败消息
     */
    size_t purge_finished(Millis retention);

    QueueStats stats(const std::optional<std::string>& recipient = std::nullopt);

    /**
     * recipient 的待处理消息数
     */
    size_t depth(const std::string& recipient);

    bool has_pending(const std::string& recipient) { return depth(recipient) > 0; }

    std::vector<Message> slowest(size_t limit);

    /**
     * 汇总 window 时间窗内的指标，按 (role, operation_type) 分组
     */
    std::vector<MetricSummary> summarize_metrics(const std::optional<std::string>& role_id,
                                                 Millis window);

private:
    static constexpr int kMaxClaimAttempts = 3;

    CoordinationStore& store_;
    NowFn now_;
};

} // namespace agentsup
