#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "coordination_store.hpp"
#include "types.hpp"

namespace agentsup {

enum class HealthStatus {
    Healthy,
    Stale,    // 心跳年龄超过 stale_after，仅告警
    Dead,     // 进程不在运行，或心跳年龄超过 dead_after
};

const char* to_string(HealthStatus status);

struct HealthReport {
    std::string role_id;
    pid_t pid = -1;
    HealthStatus status = HealthStatus::Healthy;
    bool process_alive = false;
    bool has_heartbeat = false;
    Millis heartbeat_age{0};
    double cpu_percent = 0.0;
    int64_t memory_bytes = 0;
    std::vector<std::string> warnings;    // 资源超限等，不影响 status
};

/**
 * TrackedWorker - 监督进程当前跟踪的 worker 实例
 */
struct TrackedWorker {
    std::string role_id;
    pid_t pid = -1;
    TimestampMs started_at = 0;
};

/**
 * HealthMonitor - 心跳写入与健康分类
 *
 * 心跳年龄从「本 pid 写入的最近心跳」与「进程启动时间」中较晚者算起，
 * 因此刚启动的进程在第一次心跳前享有与阈值相同的宽限期，
 * 上一个实例留下的心跳也不会被误认为新进程的心跳。
 *
 * 只有存活性决定 Dead；CPU/内存超限只产生告警，避免瞬时负载引发重启风暴。
 */
class HealthMonitor {
public:
    HealthMonitor(CoordinationStore& store,
                  std::vector<WorkerRole> roles,
                  LivenessFn liveness = {},
                  NowFn now = {});

    /**
     * worker 侧调用：写入（覆盖）当前心跳
     */
    void heartbeat(const std::string& role_id, pid_t pid, double cpu_percent, int64_t memory_bytes);

    HealthReport check(const TrackedWorker& worker);

    std::vector<HealthReport> check_all(const std::vector<TrackedWorker>& workers);

private:
    const WorkerRole& role_for(const std::string& role_id) const;

    CoordinationStore& store_;
    std::unordered_map<std::string, WorkerRole> roles_;
    WorkerRole default_role_;
    LivenessFn liveness_;
    NowFn now_;
};

} // namespace agentsup
