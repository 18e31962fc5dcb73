/**
 * main.cpp - agentsup 命令行入口
 *
 * 用法: agentsup <start|stop|status> [--config FILE] [...]
 *
 * start  前台运行监督进程，按优先级启动各角色 worker
 * stop   请求运行中的监督进程关闭（gRPC，失败时退回 SIGTERM）
 * status 打印各角色状态（gRPC，失败时读取存储中的快照）
 *
 * 退出码：0 正常；1 存在 terminal worker；2 监督进程锁已被占用；
 *         3 关闭时强制终止了 worker；4 配置或存储错误
 */

#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <chrono>
#include <map>
#include <sstream>
#include <thread>
#include <vector>

#include "control_service.hpp"
#include "errors.hpp"
#include "process_probe.hpp"
#include "process_supervisor.hpp"
#include "role_lock.hpp"
#include "sqlite_store.hpp"
#include "status_report.hpp"
#include "supervisor_config.hpp"
#include "supervisor_loop.hpp"
#include "work_queue.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitAlreadyRunning = 2;
constexpr int kExitError = 4;

constexpr agentsup::Millis kRpcTimeout{3000};
constexpr agentsup::Millis kPollSlice{50};
constexpr agentsup::Millis kStopExtraWait{5000};

std::atomic<int> g_signal{0};

void signal_handler(int signal) {
    g_signal = signal;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <command> [OPTIONS]\n"
              << "\n"
              << "Commands:\n"
              << "  start            Run the supervisor in the foreground\n"
              << "  stop             Stop the running supervisor\n"
              << "  status           Show per-role worker status\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE    Configuration file (default: $AGENTSUP_CONFIG or agentsup.yaml)\n"
              << "  --roles A,B      start: only launch these roles\n"
              << "  --now            stop: terminate workers without a grace period\n"
              << "  --help           Show this help message\n"
              << std::endl;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// ============================================================================
// start
// ============================================================================

int run_start(const agentsup::SupervisorConfig& config, const std::vector<std::string>& roles) {
    agentsup::SqliteStore store(config.store_path);
    agentsup::ProcessSupervisor supervisor(config, store);

    try {
        // 启动间隔中收到信号则跳过剩余角色
        supervisor.start(roles, []() { return g_signal.load() != 0; });
    } catch (const agentsup::RoleAlreadyRunning& e) {
        std::cerr << "[main] Another supervisor is running: " << e.what() << std::endl;
        return kExitAlreadyRunning;
    }

    agentsup::ControlServer control(supervisor, config.control_socket);
    try {
        control.start();
    } catch (const agentsup::SupervisorError& e) {
        // 控制面不可用时 status/stop 退回存储快照与信号
        std::cerr << "[main] Control server unavailable: " << e.what() << std::endl;
    }

    // 主循环
    auto result = agentsup::run_monitor_loop(supervisor, g_signal);
    control.stop();

    for (const auto& role : result.forced_roles) {
        std::cerr << "[main] Forced termination: " << role << std::endl;
    }

    int code = supervisor.exit_code();
    std::cout << "[main] Done (exit code " << code << ")." << std::endl;
    return code;
}

// ============================================================================
// stop
// ============================================================================

bool wait_for_exit(pid_t pid, agentsup::Millis timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (agentsup::is_process_alive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kPollSlice);
    }
    return true;
}

int run_stop(const agentsup::SupervisorConfig& config, bool immediate) {
    agentsup::SqliteStore store(config.store_path);
    agentsup::RoleLock locks(store, config.lock_stale_after);
    auto holder = locks.holder(config.supervisor_lock);

    auto response = agentsup::request_shutdown(config.control_socket, immediate, kRpcTimeout);
    if (response) {
        std::cout << "[main] " << response->message() << std::endl;
    } else {
        if (!holder || !agentsup::is_process_alive(holder->holder_pid)) {
            std::cout << "[main] No running supervisor" << std::endl;
            return kExitOk;
        }
        // SIGINT 使用较短的 interrupt_grace
        int sig = immediate ? SIGINT : SIGTERM;
        std::cout << "[main] Control socket unreachable, sending signal " << sig
                  << " to pid " << holder->holder_pid << std::endl;
        if (kill(holder->holder_pid, sig) != 0) {
            std::cerr << "[main] Failed to signal pid " << holder->holder_pid << std::endl;
            return kExitError;
        }
    }

    if (holder) {
        agentsup::Millis grace = immediate ? config.interrupt_grace : config.shutdown_grace;
        if (!wait_for_exit(holder->holder_pid, grace + kStopExtraWait)) {
            std::cerr << "[main] Supervisor pid " << holder->holder_pid
                      << " is still running" << std::endl;
            return kExitError;
        }
        std::cout << "[main] Supervisor stopped." << std::endl;
    }
    return kExitOk;
}

// ============================================================================
// status
// ============================================================================

int run_status(const agentsup::SupervisorConfig& config) {
    agentsup::control::SupervisorStatus report;

    auto live = agentsup::query_status(config.control_socket, kRpcTimeout);
    if (live) {
        report = *live;
    } else {
        agentsup::SqliteStore store(config.store_path);
        agentsup::WorkQueue queue(store);
        agentsup::RoleLock locks(store, config.lock_stale_after);

        auto records = store.list_worker_status();
        std::map<std::string, size_t> pending;
        for (const auto& record : records) {
            pending[record.role_id] = queue.depth(record.role_id);
        }
        auto holder = locks.holder(config.supervisor_lock);
        report = agentsup::build_status(holder ? holder->holder_pid : 0, 0, records, pending,
                                        agentsup::wall_clock_ms(), false);
    }

    std::cout << agentsup::format_status_table(report);
    return agentsup::status_exit_code(report);
}

} // anonymous namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return kExitError;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return kExitOk;
    }

    // 解析命令行参数
    std::string config_path;
    std::vector<std::string> roles;
    bool immediate = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return kExitOk;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--roles" && i + 1 < argc) {
            roles = split_list(argv[++i]);
        } else if (arg == "--now") {
            immediate = true;
        } else {
            std::cerr << "[main] Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return kExitError;
        }
    }

    // 设置信号处理
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        auto config = agentsup::load_config(agentsup::resolve_config_path(config_path));

        if (command == "start") {
            return run_start(config, roles);
        } else if (command == "stop") {
            return run_stop(config, immediate);
        } else if (command == "status") {
            return run_status(config);
        }

        std::cerr << "[main] Unknown command: " << command << std::endl;
        print_usage(argv[0]);
        return kExitError;

    } catch (const std::exception& e) {
        std::cerr << "[main] Error: " << e.what() << std::endl;
        return kExitError;
    }
}
