#include "health_monitor.hpp"
#include "process_probe.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace agentsup {

const char* to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Stale:   return "stale";
        case HealthStatus::Dead:    return "dead";
    }
    return "unknown";
}

HealthMonitor::HealthMonitor(CoordinationStore& store,
                             std::vector<WorkerRole> roles,
                             LivenessFn liveness,
                             NowFn now)
    : store_(store),
      liveness_(liveness ? std::move(liveness) : LivenessFn(is_process_alive)),
      now_(now ? std::move(now) : NowFn(wall_clock_ms)) {
    for (auto& role : roles) {
        std::string id = role.id;
        roles_.emplace(std::move(id), std::move(role));
    }
}

void HealthMonitor::heartbeat(const std::string& role_id,
                              pid_t pid,
                              double cpu_percent,
                              int64_t memory_bytes) {
    HeartbeatRecord record;
    record.role_id = role_id;
    record.pid = pid;
    record.timestamp = now_();
    record.cpu_percent = cpu_percent;
    record.memory_bytes = memory_bytes;
    store_.upsert_heartbeat(record);
}

HealthReport HealthMonitor::check(const TrackedWorker& worker) {
    const WorkerRole& role = role_for(worker.role_id);
    TimestampMs now = now_();

    HealthReport report;
    report.role_id = worker.role_id;
    report.pid = worker.pid;
    report.process_alive = liveness_(worker.pid);

    TimestampMs baseline = worker.started_at;
    auto hb = store_.get_heartbeat(worker.role_id);
    if (hb && hb->pid == worker.pid) {
        report.has_heartbeat = true;
        report.cpu_percent = hb->cpu_percent;
        report.memory_bytes = hb->memory_bytes;
        baseline = std::max(baseline, hb->timestamp);
    }
    report.heartbeat_age = Millis(std::max<TimestampMs>(0, now - baseline));

    if (!report.process_alive) {
        report.status = HealthStatus::Dead;
    } else if (report.heartbeat_age > role.dead_after) {
        report.status = HealthStatus::Dead;
    } else if (report.heartbeat_age > role.stale_after) {
        report.status = HealthStatus::Stale;
        report.warnings.push_back("HeartbeatStale: " +
                                  std::to_string(report.heartbeat_age.count()) + "ms old");
    }

    if (role.limits.max_cpu_percent > 0.0 && report.cpu_percent > role.limits.max_cpu_percent) {
        std::ostringstream oss;
        oss << "cpu " << report.cpu_percent << "% exceeds limit " << role.limits.max_cpu_percent << "%";
        report.warnings.push_back(oss.str());
    }
    if (role.limits.max_memory_bytes > 0 && report.memory_bytes > role.limits.max_memory_bytes) {
        report.warnings.push_back("memory " + std::to_string(report.memory_bytes) +
                                  " bytes exceeds limit " +
                                  std::to_string(role.limits.max_memory_bytes));
    }

    return report;
}

std::vector<HealthReport> HealthMonitor::check_all(const std::vector<TrackedWorker>& workers) {
    std::vector<HealthReport> reports;
    reports.reserve(workers.size());

    // 单个 worker 的检查失败不影响其他 worker
    for (const auto& worker : workers) {
        try {
            reports.push_back(check(worker));
        } catch (const std::exception& e) {
            std::cerr << "[HealthMonitor] Check failed for " << worker.role_id
                      << ": " << e.what() << std::endl;
        }
    }
    return reports;
}

const WorkerRole& HealthMonitor::role_for(const std::string& role_id) const {
    auto it = roles_.find(role_id);
    if (it != roles_.end()) {
        return it->second;
    }
    return default_role_;
}

} // namespace agentsup
