#pragma once

#include <map>
#include <string>
#include <vector>
#include <sys/types.h>

#include "types.hpp"
#include "supervisor_control.pb.h"

namespace agentsup {

/**
 * 面向运维的状态标签：
 * running | stale | crashed-retrying(N/M) | terminal | stopped | ...
 */
std::string status_label(const WorkerStatusRecord& record);

/**
 * 由 worker 快照组装 SupervisorStatus
 * @param pending 每个角色的待处理消息数
 * @param live true = 来自运行中的监督进程，false = 来自存储中的快照
 */
control::SupervisorStatus build_status(pid_t supervisor_pid,
                                       TimestampMs started_at,
                                       const std::vector<WorkerStatusRecord>& workers,
                                       const std::map<std::string, size_t>& pending,
                                       TimestampMs now,
                                       bool live);

/**
 * protobuf JSON 映射
 * @throws SupervisorError 序列化失败
 */
std::string status_to_json(const control::SupervisorStatus& status);

/**
 * 原子写入 JSON 快照（写临时文件后 rename）
 * @throws SupervisorError 写入失败
 */
void write_status_json(const std::string& path, const control::SupervisorStatus& status);

std::string format_status_table(const control::SupervisorStatus& status);

/**
 * status 命令的退出码：存在 terminal worker 时为 1，否则为 0
 */
int status_exit_code(const control::SupervisorStatus& status);

} // namespace agentsup
