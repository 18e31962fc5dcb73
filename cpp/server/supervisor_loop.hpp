#pragma once

#include <atomic>

#include "process_supervisor.hpp"
#include "supervisor_config.hpp"
#include "types.hpp"

namespace agentsup {

/**
 * 信号对应的关闭宽限期：SIGINT 用 interrupt_grace，其余用 shutdown_grace
 */
Millis grace_for_signal(const SupervisorConfig& config, int signal);

/**
 * 前台监督循环
 *
 * 每 monitor_interval 调用一次 tick()，直到 signal 非 0 或收到 Shutdown 请求，
 * 然后以请求的宽限期执行 shutdown()。
 *
 * @param signal 由信号处理函数写入的信号编号（0 = 无）
 */
ShutdownResult run_monitor_loop(ProcessSupervisor& supervisor, const std::atomic<int>& signal);

} // namespace agentsup
