#include "process_probe.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <string>
#include <signal.h>
#include <unistd.h>

namespace agentsup {

namespace {

/**
 * 读取 /proc/<pid>/stat 中 comm 之后的字段（comm 可能包含空格和括号）
 */
bool read_stat_fields(pid_t pid, std::string& fields) {
    std::ifstream ifs("/proc/" + std::to_string(pid) + "/stat");
    if (!ifs) {
        return false;
    }
    std::string line;
    std::getline(ifs, line);
    auto pos = line.rfind(')');
    if (pos == std::string::npos || pos + 2 > line.size()) {
        return false;
    }
    fields = line.substr(pos + 2);
    return true;
}

} // anonymous namespace

bool is_process_alive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (kill(pid, 0) != 0 && errno != EPERM) {
        return false;
    }

    // 已退出但未被回收的进程仍能通过 kill(pid, 0)
    std::string fields;
    if (read_stat_fields(pid, fields) && !fields.empty()) {
        char state = fields[0];
        if (state == 'Z' || state == 'X') {
            return false;
        }
    }
    return true;
}

std::optional<ProcessUsage> sample_usage(pid_t pid) {
    std::string fields;
    if (!read_stat_fields(pid, fields)) {
        return std::nullopt;
    }

    // fields[0] 对应 stat 第 3 列 (state)；utime/stime/starttime 为第 14/15/22 列
    std::istringstream iss(fields);
    std::string token;
    unsigned long long utime = 0, stime = 0, starttime = 0;
    for (int col = 3; iss >> token; ++col) {
        if (col == 14) utime = std::stoull(token);
        else if (col == 15) stime = std::stoull(token);
        else if (col == 22) { starttime = std::stoull(token); break; }
    }

    long ticks = sysconf(_SC_CLK_TCK);
    long page_size = sysconf(_SC_PAGESIZE);
    if (ticks <= 0 || page_size <= 0) {
        return std::nullopt;
    }

    double uptime_seconds = 0.0;
    {
        std::ifstream up("/proc/uptime");
        if (!(up >> uptime_seconds)) {
            return std::nullopt;
        }
    }

    ProcessUsage usage;
    double elapsed = uptime_seconds - static_cast<double>(starttime) / ticks;
    if (elapsed > 0.0) {
        usage.cpu_percent = 100.0 * (static_cast<double>(utime + stime) / ticks) / elapsed;
    }

    std::ifstream statm("/proc/" + std::to_string(pid) + "/statm");
    long long size_pages = 0, resident_pages = 0;
    if (statm >> size_pages >> resident_pages) {
        usage.memory_bytes = static_cast<int64_t>(resident_pages) * page_size;
    }
    return usage;
}

} // namespace agentsup
