#include "status_report.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <google/protobuf/util/json_util.h>

namespace agentsup {

namespace {

std::string format_duration(int64_t ms) {
    if (ms < 0) {
        return "-";
    }
    int64_t seconds = ms / 1000;
    std::ostringstream oss;
    if (seconds >= 3600) {
        oss << seconds / 3600 << "h" << (seconds % 3600) / 60 << "m";
    } else if (seconds >= 60) {
        oss << seconds / 60 << "m" << seconds % 60 << "s";
    } else {
        oss << seconds << "s";
    }
    return oss.str();
}

std::string format_memory(int64_t bytes) {
    if (bytes <= 0) {
        return "-";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << "MB";
    return oss.str();
}

bool is_running_state(WorkerState state) {
    return state == WorkerState::Starting ||
           state == WorkerState::Running ||
           state == WorkerState::Stale ||
           state == WorkerState::Stopping;
}

} // anonymous namespace

std::string status_label(const WorkerStatusRecord& record) {
    switch (record.state) {
        case WorkerState::Crashed:
        case WorkerState::Restarting: {
            // 下一次重启是第几次
            int attempt = std::min(record.restart_count + 1, record.max_restarts);
            return "crashed-retrying(" + std::to_string(attempt) + "/" +
                   std::to_string(record.max_restarts) + ")";
        }
        default:
            return to_string(record.state);
    }
}

control::SupervisorStatus build_status(pid_t supervisor_pid,
                                       TimestampMs started_at,
                                       const std::vector<WorkerStatusRecord>& workers,
                                       const std::map<std::string, size_t>& pending,
                                       TimestampMs now,
                                       bool live) {
    control::SupervisorStatus status;
    status.set_supervisor_pid(supervisor_pid);
    status.set_started_at_ms(started_at);
    status.set_uptime_ms(started_at > 0 ? now - started_at : 0);
    status.set_generated_at_ms(now);
    status.set_live(live);

    for (const auto& record : workers) {
        auto* worker = status.add_workers();
        worker->set_role_id(record.role_id);
        worker->set_state(to_string(record.state));
        worker->set_label(status_label(record));
        worker->set_pid(record.pid);
        worker->set_started_at_ms(record.started_at);
        if (is_running_state(record.state) && record.started_at > 0) {
            worker->set_uptime_ms(now - record.started_at);
        }
        worker->set_restart_count(record.restart_count);
        worker->set_max_restarts(record.max_restarts);
        worker->set_last_heartbeat_ms(record.last_heartbeat);
        worker->set_heartbeat_age_ms(record.last_heartbeat > 0 ? now - record.last_heartbeat : -1);
        worker->set_cpu_percent(record.cpu_percent);
        worker->set_memory_bytes(record.memory_bytes);
        worker->set_forced_stop(record.forced_stop);

        auto it = pending.find(record.role_id);
        worker->set_pending_messages(it != pending.end() ? static_cast<int64_t>(it->second) : 0);
    }
    return status;
}

std::string status_to_json(const control::SupervisorStatus& status) {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.preserve_proto_field_names = true;

    std::string json;
    auto result = google::protobuf::util::MessageToJsonString(status, &json, options);
    if (!result.ok()) {
        throw SupervisorError("Failed to serialize status: " + std::string(result.ToString()));
    }
    return json;
}

void write_status_json(const std::string& path, const control::SupervisorStatus& status) {
    std::string json = status_to_json(status);
    std::string tmp_path = path + ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw SupervisorError("Failed to open " + tmp_path + ": " + strerror(errno));
        }
        out << json << '\n';
        if (!out.flush()) {
            throw SupervisorError("Failed to write " + tmp_path);
        }
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        throw SupervisorError("Failed to rename " + tmp_path + " to " + path + ": " + strerror(errno));
    }
}

std::string format_status_table(const control::SupervisorStatus& status) {
    std::ostringstream oss;
    if (status.live()) {
        oss << "Supervisor pid " << status.supervisor_pid()
            << ", up " << format_duration(status.uptime_ms()) << "\n";
    } else {
        oss << "Supervisor not reachable; showing last recorded snapshot\n";
    }
    oss << "\n";

    oss << std::left
        << std::setw(20) << "ROLE"
        << std::setw(24) << "STATE"
        << std::setw(9) << "PID"
        << std::setw(10) << "UPTIME"
        << std::setw(10) << "RESTARTS"
        << std::setw(11) << "HEARTBEAT"
        << std::setw(8) << "CPU%"
        << std::setw(10) << "MEM"
        << "PENDING" << "\n";

    for (const auto& worker : status.workers()) {
        std::string label = worker.label();
        if (worker.forced_stop()) {
            label += " (forced)";
        }

        std::ostringstream cpu;
        cpu << std::fixed << std::setprecision(1) << worker.cpu_percent();

        oss << std::left
            << std::setw(20) << worker.role_id()
            << std::setw(24) << label
            << std::setw(9) << (worker.pid() > 0 ? std::to_string(worker.pid()) : "-")
            << std::setw(10) << (worker.uptime_ms() > 0 ? format_duration(worker.uptime_ms()) : "-")
            << std::setw(10) << (std::to_string(worker.restart_count()) + "/" +
                                 std::to_string(worker.max_restarts()))
            << std::setw(11) << format_duration(worker.heartbeat_age_ms())
            << std::setw(8) << cpu.str()
            << std::setw(10) << format_memory(worker.memory_bytes())
            << worker.pending_messages() << "\n";
    }
    return oss.str();
}

int status_exit_code(const control::SupervisorStatus& status) {
    for (const auto& worker : status.workers()) {
        if (worker.state() == to_string(WorkerState::Terminal)) {
            return 1;
        }
    }
    return 0;
}

} // namespace agentsup
