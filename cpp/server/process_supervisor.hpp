#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>

#include "child_process.hpp"
#include "coordination_store.hpp"
#include "health_monitor.hpp"
#include "role_lock.hpp"
#include "supervisor_config.hpp"
#include "supervisor_control.pb.h"
#include "types.hpp"
#include "work_queue.hpp"

namespace agentsup {

struct ShutdownResult {
    int stopped = 0;
    int forced = 0;
    std::vector<std::string> forced_roles;
};

/**
 * ProcessSupervisor - 多角色 worker 进程监督
 *
 * 负责：
 * 1. 声明自身 RoleLock，按 priority 升序依次启动各角色
 * 2. 周期性健康检查（tick），崩溃后按 RestartPolicy 退避重启或放弃
 * 3. 关闭：SIGTERM → 宽限期 → SIGKILL，释放全部 RoleLock
 * 4. 将状态快照写入存储（及可选的 JSON 文件）
 *
 * tick() 由主循环驱动；status() / request_stop() 可在 gRPC 线程中调用。
 */
class ProcessSupervisor {
public:
    ProcessSupervisor(SupervisorConfig config, CoordinationStore& store, NowFn now = {});

    ~ProcessSupervisor();

    // 禁止拷贝
    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * 声明自身锁并启动角色
     * @param role_filter 只启动这些角色（空 = 全部）
     * @param interrupted 启动间隔中轮询，返回 true 时跳过剩余角色（如收到信号）
     * @throws RoleAlreadyRunning 另一个监督进程持有自身锁
     * @throws ConfigError role_filter 中包含未配置的角色
     *
     * 单个角色启动失败不会中断其他角色；因存储错误未能启动的角色由 tick() 重试。
     * 配置了 ready_timeout 的角色保持 starting，由 tick() 轮询就绪信号。
     */
    void start(const std::vector<std::string>& role_filter = {},
               std::function<bool()> interrupted = {});

    /**
     * 监督循环的一次迭代（单个 worker 的异常不会中断其他 worker）
     */
    void tick();

    /**
     * 请求停止（线程安全，由主循环执行 shutdown）
     */
    void request_stop(Millis grace);

    bool stop_requested() const { return stop_requested_.load(); }

    Millis requested_grace() const { return Millis(requested_grace_ms_.load()); }

    /**
     * 终止全部 worker 并释放锁
     */
    ShutdownResult shutdown(Millis grace);

    std::vector<WorkerStatusRecord> status();

    /**
     * 当前状态（含各角色待处理消息数），供 status 命令和 JSON 快照使用
     */
    control::SupervisorStatus status_report();

    /**
     * 0 = 正常；1 = 存在 terminal worker；3 = 关闭时强制终止了 worker
     */
    int exit_code();

    const SupervisorConfig& config() const { return config_; }
    TimestampMs started_at() const { return started_at_; }

private:
    struct Worker {
        WorkerRole role;
        WorkerProcess process;
        std::unique_ptr<ChildProcess> child;
        TimestampMs next_check_at = 0;
        TimestampMs ready_deadline = 0;
        TimestampMs last_heartbeat = 0;
        double cpu_percent = 0.0;
        int64_t memory_bytes = 0;
        bool launch_pending = false;    // 首次启动因存储错误未完成
    };

    // ========================================================================
    // 以下方法要求持有 mutex_
    // ========================================================================

    void launch(Worker& worker, TimestampMs now);
    void try_launch(Worker& worker, TimestampMs now);
    void try_restart(Worker& worker, TimestampMs now);
    void poll_starting(Worker& worker, TimestampMs now);
    void tick_worker(Worker& worker, TimestampMs now);
    void check_health(Worker& worker, TimestampMs now);
    void handle_crash(Worker& worker, const std::string& reason, TimestampMs now);
    void give_up(Worker& worker, TimestampMs now);
    void stop_worker_process(Worker& worker);
    void maybe_purge(TimestampMs now);
    void write_snapshot(TimestampMs now);

    std::map<std::string, std::string> worker_env(const WorkerRole& role) const;
    WorkerStatusRecord to_record(const Worker& worker, TimestampMs now) const;
    control::SupervisorStatus build_report(TimestampMs now);

    SupervisorConfig config_;
    CoordinationStore& store_;
    NowFn now_;

    RoleLock locks_;
    WorkQueue queue_;
    HealthMonitor monitor_;

    std::mutex mutex_;
    std::vector<Worker> workers_;    // 启动顺序

    pid_t self_pid_;
    TimestampMs started_at_ = 0;
    TimestampMs last_purge_at_ = 0;
    bool holds_own_lock_ = false;
    bool shut_down_ = false;
    bool forced_ = false;

    std::atomic<bool> stop_requested_{false};
    std::atomic<int64_t> requested_grace_ms_{0};
};

} // namespace agentsup
