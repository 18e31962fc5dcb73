#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace agentsup {

/**
 * 时间戳统一使用 Unix epoch 毫秒（墙上时钟）
 *
 * 所有持久化记录都跨进程共享，因此不能使用 steady_clock。
 */
using TimestampMs = int64_t;
using Millis = std::chrono::milliseconds;

/**
 * 时钟函数，可在测试中替换
 */
using NowFn = std::function<TimestampMs()>;

/**
 * 进程存活探测函数，可在测试中替换
 */
using LivenessFn = std::function<bool(pid_t)>;

TimestampMs wall_clock_ms();

// ============================================================================
// WorkerRole - 静态角色配置
// ============================================================================

struct ResourceLimits {
    double max_cpu_percent = 0.0;    // 0 = 不限制
    int64_t max_memory_bytes = 0;    // 0 = 不限制
};

struct WorkerRole {
    std::string id;
    int priority = 100;                       // 越小越早启动
    std::vector<std::string> command;         // execvp 参数
    std::map<std::string, std::string> env;   // 额外环境变量

    Millis check_interval{30000};
    Millis heartbeat_interval{10000};         // 传给 worker 的建议心跳间隔
    Millis stale_after{300000};               // 超过则告警
    Millis dead_after{900000};                // 超过则判定死亡
    Millis ready_timeout{0};                  // 0 = 不等待就绪信号

    int max_restarts = 3;
    Millis backoff_base{60000};

    ResourceLimits limits;
};

// ============================================================================
// WorkerProcess - 某个角色的一次运行实例
// ============================================================================

enum class WorkerState {
    Unstarted,
    Starting,
    Running,
    Stale,
    Stopping,
    Crashed,
    Restarting,
    Stopped,
    Terminal,
};

const char* to_string(WorkerState state);
std::optional<WorkerState> worker_state_from_string(const std::string& name);

struct WorkerProcess {
    std::string role_id;
    pid_t pid = -1;
    TimestampMs started_at = 0;
    WorkerState state = WorkerState::Unstarted;
    int restart_count = 0;
    TimestampMs last_restart_at = 0;      // 0 = 从未重启
    TimestampMs next_restart_at = 0;      // 仅 Restarting 状态有效
    bool forced_stop = false;
    std::string last_exit;                // 退出原因描述
};

// ============================================================================
// 持久化记录
// ============================================================================

struct LockRecord {
    std::string role_id;
    pid_t holder_pid = -1;
    TimestampMs acquired_at = 0;
};

struct HeartbeatRecord {
    std::string role_id;
    pid_t pid = -1;
    TimestampMs timestamp = 0;
    double cpu_percent = 0.0;
    int64_t memory_bytes = 0;
};

enum class MessageStatus {
    Pending,
    InProgress,
    Completed,
    Failed,
};

const char* to_string(MessageStatus status);
std::optional<MessageStatus> message_status_from_string(const std::string& name);

/**
 * Message - worker 之间传递的消息
 *
 * payload 对队列不透明，只有消费者根据 type 解释。
 */
struct Message {
    int64_t id = 0;
    std::string sender;
    std::string recipient;
    std::string type;
    std::string payload;
    int priority = 5;                     // 越小越紧急
    MessageStatus status = MessageStatus::Pending;
    TimestampMs created_at = 0;
    TimestampMs claimed_at = 0;
    TimestampMs completed_at = 0;
    std::string error;
};

struct MetricSample {
    int64_t id = 0;
    std::string role_id;
    std::string operation_type;
    double duration_ms = 0.0;
    TimestampMs timestamp = 0;
};

/**
 * WorkerStatusRecord - 供外部状态工具读取的时间点快照
 */
struct WorkerStatusRecord {
    std::string role_id;
    WorkerState state = WorkerState::Unstarted;
    pid_t pid = -1;
    TimestampMs started_at = 0;
    int restart_count = 0;
    int max_restarts = 0;
    TimestampMs last_heartbeat = 0;       // 0 = 尚无心跳
    double cpu_percent = 0.0;
    int64_t memory_bytes = 0;
    bool forced_stop = false;
    TimestampMs updated_at = 0;
};

} // namespace agentsup
