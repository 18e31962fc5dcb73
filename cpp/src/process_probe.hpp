#pragma once

#include <cstdint>
#include <optional>
#include <sys/types.h>

namespace agentsup {

/**
 * 检查进程是否仍在运行
 *
 * kill(pid, 0) 成功（或 EPERM）且 /proc 中状态不是僵尸进程时返回 true。
 */
bool is_process_alive(pid_t pid);

struct ProcessUsage {
    double cpu_percent = 0.0;     // 进程生命周期内的平均 CPU 占用
    int64_t memory_bytes = 0;     // RSS
};

/**
 * 从 /proc/<pid>/stat 与 /proc/<pid>/statm 采样资源占用
 * @return std::nullopt 如果进程不存在或 /proc 不可读
 */
std::optional<ProcessUsage> sample_usage(pid_t pid);

} // namespace agentsup
