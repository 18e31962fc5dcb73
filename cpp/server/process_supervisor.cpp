#include "process_supervisor.hpp"
#include "errors.hpp"
#include "process_probe.hpp"
#include "restart_policy.hpp"
#include "status_report.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <limits>
#include <set>
#include <thread>
#include <unistd.h>

namespace agentsup {

namespace {

constexpr Millis kKillWait{5000};
constexpr Millis kLaunchDelaySlice{50};

bool is_live_state(WorkerState state) {
    return state == WorkerState::Starting ||
           state == WorkerState::Running ||
           state == WorkerState::Stale ||
           state == WorkerState::Stopping;
}

TimestampMs saturating_add(TimestampMs base, Millis delay) {
    if (delay.count() > std::numeric_limits<TimestampMs>::max() - base) {
        return std::numeric_limits<TimestampMs>::max();
    }
    return base + delay.count();
}

} // anonymous namespace

ProcessSupervisor::ProcessSupervisor(SupervisorConfig config, CoordinationStore& store, NowFn now)
    : config_(std::move(config)),
      store_(store),
      now_(now ? std::move(now) : NowFn(wall_clock_ms)),
      locks_(store, config_.lock_stale_after, {}, now_),
      queue_(store, now_),
      monitor_(store, config_.roles, {}, now_),
      self_pid_(getpid()) {}

ProcessSupervisor::~ProcessSupervisor() {
    if (started_at_ == 0 || shut_down_) {
        return;
    }
    try {
        shutdown(Millis(0));
    } catch (const std::exception& e) {
        std::cerr << "[ProcessSupervisor] Shutdown during destruction failed: " << e.what() << std::endl;
    }
}

// ============================================================================
// 启动
// ============================================================================

void ProcessSupervisor::start(const std::vector<std::string>& role_filter,
                              std::function<bool()> interrupted) {
    if (started_at_ != 0) {
        throw SupervisorError("Supervisor already started");
    }

    std::set<std::string> wanted(role_filter.begin(), role_filter.end());
    for (const auto& role_id : wanted) {
        if (!config_.find_role(role_id)) {
            throw ConfigError("Unknown role '" + role_id + "'");
        }
    }

    // 上一次运行遗留的锁（持有者已死亡）先回收
    locks_.reclaim_stale(config_.lock_stale_after);

    if (!locks_.claim(config_.supervisor_lock, self_pid_)) {
        auto holder = locks_.holder(config_.supervisor_lock);
        throw RoleAlreadyRunning(config_.supervisor_lock, holder ? holder->holder_pid : -1);
    }
    holds_own_lock_ = true;
    started_at_ = now_();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& role : config_.roles) {
            if (!wanted.empty() && wanted.count(role.id) == 0) {
                continue;
            }
            Worker worker;
            worker.role = role;
            worker.process.role_id = role.id;
            workers_.push_back(std::move(worker));
        }
        std::stable_sort(workers_.begin(), workers_.end(), [](const Worker& a, const Worker& b) {
            return a.role.priority < b.role.priority;
        });
    }

    std::cout << "[ProcessSupervisor] Started (pid " << self_pid_ << "), launching "
              << workers_.size() << " roles" << std::endl;

    auto should_stop = [&]() {
        return stop_requested() || (interrupted && interrupted());
    };

    for (size_t i = 0; i < workers_.size(); ++i) {
        if (i > 0) {
            // 启动间隔，可被 request_stop 或信号打断
            auto deadline = std::chrono::steady_clock::now() + config_.launch_delay;
            while (!should_stop() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::min(kLaunchDelaySlice, config_.launch_delay));
            }
        }
        if (should_stop()) {
            std::cout << "[ProcessSupervisor] Stop requested, skipping remaining launches" << std::endl;
            break;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        workers_[i].launch_pending = true;
        try_launch(workers_[i], now_());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        write_snapshot(now_());
    } catch (const std::exception& e) {
        std::cerr << "[ProcessSupervisor] Failed to write status snapshot: " << e.what() << std::endl;
    }
}

void ProcessSupervisor::launch(Worker& worker, TimestampMs now) {
    const WorkerRole& role = worker.role;

    // 先以自身 pid 声明，spawn 成功后转交给子进程
    if (!locks_.claim(role.id, self_pid_)) {
        auto holder = locks_.holder(role.id);
        throw RoleAlreadyRunning(role.id, holder ? holder->holder_pid : -1);
    }
    worker.process.state = WorkerState::Starting;

    try {
        worker.child = ChildProcess::spawn(role, worker_env(role));
    } catch (const std::exception&) {
        try {
            locks_.release(role.id, self_pid_);
        } catch (const std::exception& e) {
            std::cerr << "[ProcessSupervisor] Failed to release lock for " << role.id
                      << ": " << e.what() << std::endl;
        }
        throw;
    }

    pid_t pid = worker.child->pid();
    try {
        if (!locks_.transfer(role.id, self_pid_, pid)) {
            std::cerr << "[ProcessSupervisor] Failed to transfer lock for " << role.id
                      << " to pid " << pid << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ProcessSupervisor] Failed to transfer lock for " << role.id
                  << " to pid " << pid << ": " << e.what() << std::endl;
    }

    worker.process.pid = pid;
    worker.process.started_at = now;
    worker.process.forced_stop = false;
    worker.process.last_exit.clear();
    worker.next_check_at = saturating_add(now, role.check_interval);
    worker.last_heartbeat = 0;
    worker.cpu_percent = 0.0;
    worker.memory_bytes = 0;

    std::cout << "[ProcessSupervisor] Launched " << role.id << " (pid " << pid
              << ", priority " << role.priority << ")" << std::endl;

    // 需要就绪信号的角色保持 starting，由 tick 轮询
    if (role.ready_timeout.count() > 0) {
        worker.ready_deadline = saturating_add(now, role.ready_timeout);
        return;
    }
    worker.process.state = WorkerState::Running;
}

void ProcessSupervisor::try_launch(Worker& worker, TimestampMs now) {
    try {
        launch(worker, now);
        worker.launch_pending = false;
    } catch (const RoleAlreadyRunning& e) {
        std::cerr << "[ProcessSupervisor] Skipping " << worker.role.id << ": " << e.what() << std::endl;
        worker.launch_pending = false;
        worker.process.state = WorkerState::Unstarted;
        worker.process.last_exit = e.what();
    } catch (const ProcessSpawnFailure& e) {
        worker.launch_pending = false;
        handle_crash(worker, e.what(), now);
    } catch (const std::exception& e) {
        // 存储暂时不可用：保持 unstarted，下一个 tick 重试
        std::cerr << "[ProcessSupervisor] Could not launch " << worker.role.id
                  << ", will retry: " << e.what() << std::endl;
        worker.process.state = WorkerState::Unstarted;
        worker.process.last_exit = e.what();
    }
}

void ProcessSupervisor::try_restart(Worker& worker, TimestampMs now) {
    int attempt = worker.process.restart_count + 1;
    std::cout << "[ProcessSupervisor] Restarting " << worker.role.id << " (attempt "
              << attempt << "/" << worker.role.max_restarts << ")" << std::endl;
    try {
        launch(worker, now);
        worker.process.restart_count = attempt;
        worker.process.last_restart_at = now;
    } catch (const ProcessSpawnFailure& e) {
        worker.process.restart_count = attempt;
        worker.process.last_restart_at = now;
        handle_crash(worker, e.what(), now);
    } catch (const RoleAlreadyRunning& e) {
        std::cerr << "[ProcessSupervisor] Not restarting " << worker.role.id
                  << ": " << e.what() << std::endl;
        worker.process.state = WorkerState::Unstarted;
        worker.process.last_exit = e.what();
    } catch (const std::exception& e) {
        // 不计入重启次数，保持 restarting，下一个 tick 重试
        std::cerr << "[ProcessSupervisor] Could not restart " << worker.role.id
                  << ", will retry: " << e.what() << std::endl;
        worker.process.state = WorkerState::Restarting;
    }
}

void ProcessSupervisor::poll_starting(Worker& worker, TimestampMs now) {
    if (worker.child->poll_ready()) {
        worker.process.state = WorkerState::Running;
        std::cout << "[ProcessSupervisor] " << worker.role.id << " signalled ready" << std::endl;
        return;
    }
    if (now >= worker.ready_deadline) {
        std::cerr << "[ProcessSupervisor] " << worker.role.id << " did not signal ready within "
                  << worker.role.ready_timeout.count() << "ms" << std::endl;
        worker.process.state = WorkerState::Running;
    }
}

std::map<std::string, std::string> ProcessSupervisor::worker_env(const WorkerRole& role) const {
    return {
        {"AGENTSUP_ROLE", role.id},
        {"AGENTSUP_STORE", config_.store_path},
        {"AGENTSUP_HEARTBEAT_INTERVAL_MS", std::to_string(role.heartbeat_interval.count())},
    };
}

// ============================================================================
// 监督循环
// ============================================================================

void ProcessSupervisor::tick() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return;
    }
    TimestampMs now = now_();

    for (auto& worker : workers_) {
        try {
            tick_worker(worker, now);
        } catch (const std::exception& e) {
            std::cerr << "[ProcessSupervisor] Error while supervising " << worker.role.id
                      << ": " << e.what() << std::endl;
        }
    }

    try {
        maybe_purge(now);
    } catch (const std::exception& e) {
        std::cerr << "[ProcessSupervisor] Purge failed: " << e.what() << std::endl;
    }

    try {
        write_snapshot(now);
    } catch (const std::exception& e) {
        std::cerr << "[ProcessSupervisor] Failed to write status snapshot: " << e.what() << std::endl;
    }
}

void ProcessSupervisor::tick_worker(Worker& worker, TimestampMs now) {
    switch (worker.process.state) {
        case WorkerState::Unstarted:
            if (worker.launch_pending) {
                try_launch(worker, now);
            }
            return;

        case WorkerState::Restarting:
            if (now >= worker.process.next_restart_at) {
                try_restart(worker, now);
            }
            return;

        case WorkerState::Terminal:
            if (config_.undeliverable_policy == UndeliverablePolicy::Expire) {
                queue_.expire_pending(worker.role.id, "recipient terminal");
            }
            return;

        case WorkerState::Starting:
        case WorkerState::Running:
        case WorkerState::Stale:
            break;

        default:
            return;
    }

    // 进程退出每个 tick 都回收；心跳按角色的 check_interval 检查
    if (worker.child && worker.child->poll_exit()) {
        handle_crash(worker, worker.child->describe_exit(), now);
        return;
    }

    if (worker.process.state == WorkerState::Starting) {
        if (worker.child) {
            poll_starting(worker, now);
        }
        return;
    }

    if (now >= worker.next_check_at) {
        worker.next_check_at = saturating_add(now, worker.role.check_interval);
        check_health(worker, now);
    }
}

void ProcessSupervisor::check_health(Worker& worker, TimestampMs now) {
    HealthReport report = monitor_.check({worker.role.id, worker.process.pid, worker.process.started_at});

    if (report.has_heartbeat) {
        worker.last_heartbeat = now - report.heartbeat_age.count();
        worker.cpu_percent = report.cpu_percent;
        worker.memory_bytes = report.memory_bytes;
    } else if (auto usage = sample_usage(worker.process.pid)) {
        worker.cpu_percent = usage->cpu_percent;
        worker.memory_bytes = usage->memory_bytes;
    }

    for (const auto& warning : report.warnings) {
        std::cerr << "[HealthMonitor] " << worker.role.id << " (pid " << worker.process.pid
                  << "): " << warning << std::endl;
    }

    switch (report.status) {
        case HealthStatus::Healthy:
            if (worker.process.state == WorkerState::Stale) {
                std::cout << "[HealthMonitor] " << worker.role.id << " heartbeat recovered" << std::endl;
            }
            worker.process.state = WorkerState::Running;
            break;
        case HealthStatus::Stale:
            worker.process.state = WorkerState::Stale;
            break;
        case HealthStatus::Dead:
            handle_crash(worker,
                         report.process_alive
                             ? "WorkerDead: no heartbeat for " + std::to_string(report.heartbeat_age.count()) + "ms"
                             : "WorkerDead: process not running",
                         now);
            break;
    }
}

void ProcessSupervisor::handle_crash(Worker& worker, const std::string& reason, TimestampMs now) {
    worker.process.state = WorkerState::Crashed;
    worker.process.last_exit = reason;
    std::cerr << "[ProcessSupervisor] " << worker.role.id << " (pid " << worker.process.pid
              << ") crashed: " << reason << std::endl;

    stop_worker_process(worker);
    if (worker.process.pid > 0) {
        try {
            locks_.release(worker.role.id, worker.process.pid);
        } catch (const std::exception& e) {
            // 锁留给 reclaim_stale 回收
            std::cerr << "[ProcessSupervisor] Failed to release lock for " << worker.role.id
                      << ": " << e.what() << std::endl;
        }
    }

    RestartDecision decision = RestartPolicy::decide(worker.process, worker.role);
    switch (decision.action) {
        case RestartAction::GiveUp:
            give_up(worker, now);
            break;
        case RestartAction::RestartNow:
        case RestartAction::Wait:
            worker.process.state = WorkerState::Restarting;
            worker.process.next_restart_at = saturating_add(now, decision.delay);
            std::cout << "[ProcessSupervisor] " << worker.role.id << " will restart in "
                      << decision.delay.count() << "ms (" << to_string(decision.action) << ")" << std::endl;
            break;
    }
}

void ProcessSupervisor::give_up(Worker& worker, TimestampMs now) {
    worker.process.state = WorkerState::Terminal;

    MaxRestartsExceeded alert(worker.role.id, worker.role.max_restarts);
    std::cerr << "[ProcessSupervisor] ALERT " << alert.what()
              << "; last exit: " << worker.process.last_exit << std::endl;

    if (!config_.alert_recipient.empty()) {
        try {
            std::string payload = status_to_json(
                build_status(self_pid_, started_at_, {to_record(worker, now)}, {}, now, true));
            queue_.enqueue(config_.supervisor_lock, config_.alert_recipient,
                           "max_restarts_exceeded", payload, 1);
        } catch (const std::exception& e) {
            std::cerr << "[ProcessSupervisor] Failed to enqueue alert for " << worker.role.id
                      << ": " << e.what() << std::endl;
        }
    }

    if (config_.undeliverable_policy == UndeliverablePolicy::Expire) {
        queue_.expire_pending(worker.role.id, "recipient terminal");
    }
}

void ProcessSupervisor::stop_worker_process(Worker& worker) {
    if (!worker.child) {
        return;
    }
    // 心跳超时判定死亡时进程可能仍在运行
    if (!worker.child->poll_exit()) {
        worker.child->kill();
        if (!worker.child->wait_for_exit(kKillWait)) {
            std::cerr << "[ProcessSupervisor] " << worker.role.id << " (pid " << worker.process.pid
                      << ") did not exit after SIGKILL" << std::endl;
        }
    }
    worker.child.reset();
}

void ProcessSupervisor::maybe_purge(TimestampMs now) {
    if (config_.purge_interval.count() <= 0) {
        return;
    }
    if (last_purge_at_ != 0 && now - last_purge_at_ < config_.purge_interval.count()) {
        return;
    }
    last_purge_at_ = now;
    queue_.purge_finished(config_.message_retention);
}

// ============================================================================
// 状态快照
// ============================================================================

WorkerStatusRecord ProcessSupervisor::to_record(const Worker& worker, TimestampMs now) const {
    WorkerStatusRecord record;
    record.role_id = worker.role.id;
    record.state = worker.process.state;
    record.pid = is_live_state(worker.process.state) ? worker.process.pid : -1;
    record.started_at = worker.process.started_at;
    record.restart_count = worker.process.restart_count;
    record.max_restarts = worker.role.max_restarts;
    record.last_heartbeat = worker.last_heartbeat;
    record.cpu_percent = worker.cpu_percent;
    record.memory_bytes = worker.memory_bytes;
    record.forced_stop = worker.process.forced_stop;
    record.updated_at = now;
    return record;
}

control::SupervisorStatus ProcessSupervisor::build_report(TimestampMs now) {
    std::vector<WorkerStatusRecord> records;
    std::map<std::string, size_t> pending;
    for (const auto& worker : workers_) {
        records.push_back(to_record(worker, now));
        pending[worker.role.id] = queue_.depth(worker.role.id);
    }
    return build_status(self_pid_, started_at_, records, pending, now, true);
}

void ProcessSupervisor::write_snapshot(TimestampMs now) {
    for (const auto& worker : workers_) {
        store_.upsert_worker_status(to_record(worker, now));
    }
    if (!config_.status_snapshot_path.empty()) {
        write_status_json(config_.status_snapshot_path, build_report(now));
    }
}

std::vector<WorkerStatusRecord> ProcessSupervisor::status() {
    std::lock_guard<std::mutex> lock(mutex_);
    TimestampMs now = now_();
    std::vector<WorkerStatusRecord> records;
    for (const auto& worker : workers_) {
        records.push_back(to_record(worker, now));
    }
    return records;
}

control::SupervisorStatus ProcessSupervisor::status_report() {
    std::lock_guard<std::mutex> lock(mutex_);
    return build_report(now_());
}

// ============================================================================
// 关闭
// ============================================================================

void ProcessSupervisor::request_stop(Millis grace) {
    requested_grace_ms_.store(grace.count());
    stop_requested_.store(true);
}

ShutdownResult ProcessSupervisor::shutdown(Millis grace) {
    std::lock_guard<std::mutex> lock(mutex_);
    ShutdownResult result;
    if (shut_down_) {
        return result;
    }

    std::cout << "[ProcessSupervisor] Shutting down " << workers_.size()
              << " workers (grace " << grace.count() << "ms)" << std::endl;

    // 1. 向全部存活 worker 的进程组发送 SIGTERM
    std::vector<Worker*> stopping;
    for (auto& worker : workers_) {
        if (worker.child && !worker.child->poll_exit()) {
            worker.process.state = WorkerState::Stopping;
            worker.child->terminate();
            stopping.push_back(&worker);
        }
    }

    // 2. 共享同一个宽限期截止时间，超时则 SIGKILL
    auto deadline = std::chrono::steady_clock::now() + grace;
    for (Worker* worker : stopping) {
        auto remaining = std::chrono::duration_cast<Millis>(deadline - std::chrono::steady_clock::now());
        if (worker->child->wait_for_exit(std::max(remaining, Millis(0)))) {
            continue;
        }
        std::cerr << "[ProcessSupervisor] " << worker->role.id << " (pid " << worker->process.pid
                  << ") did not exit within grace period, sending SIGKILL" << std::endl;
        worker->child->kill();
        if (!worker->child->wait_for_exit(kKillWait)) {
            std::cerr << "[ProcessSupervisor] " << worker->role.id
                      << " did not exit after SIGKILL" << std::endl;
        }
        worker->process.forced_stop = true;
        result.forced++;
        result.forced_roles.push_back(worker->role.id);
    }

    // 3. 释放锁并记录最终状态
    for (auto& worker : workers_) {
        if (worker.child) {
            worker.process.last_exit = worker.child->describe_exit();
            worker.child.reset();
            try {
                locks_.release(worker.role.id, worker.process.pid);
            } catch (const std::exception& e) {
                std::cerr << "[ProcessSupervisor] Failed to release lock for " << worker.role.id
                          << ": " << e.what() << std::endl;
            }
            worker.process.state = WorkerState::Stopped;
            if (!worker.process.forced_stop) {
                result.stopped++;
            }
        } else if (worker.process.state == WorkerState::Restarting ||
                   worker.process.state == WorkerState::Crashed) {
            worker.process.state = WorkerState::Stopped;
        }
    }

    if (holds_own_lock_) {
        try {
            locks_.release(config_.supervisor_lock, self_pid_);
        } catch (const std::exception& e) {
            std::cerr << "[ProcessSupervisor] Failed to release supervisor lock: " << e.what() << std::endl;
        }
        holds_own_lock_ = false;
    }

    forced_ = result.forced > 0;
    shut_down_ = true;

    try {
        write_snapshot(now_());
    } catch (const std::exception& e) {
        std::cerr << "[ProcessSupervisor] Failed to write status snapshot: " << e.what() << std::endl;
    }

    std::cout << "[ProcessSupervisor] Shutdown complete: " << result.stopped << " stopped, "
              << result.forced << " forced" << std::endl;
    return result;
}

int ProcessSupervisor::exit_code() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& worker : workers_) {
        if (worker.process.state == WorkerState::Terminal) {
            return 1;
        }
    }
    return forced_ ? 3 : 0;
}

} // namespace agentsup
