#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "types.hpp"
#include "supervisor_control.pb.h"

// Forward declarations for gRPC types
namespace grpc {
class Server;
}

namespace agentsup {

class ProcessSupervisor;
class ControlServiceImpl;

/**
 * ControlServer - 运行中监督进程的 gRPC 控制面（Unix Domain Socket）
 *
 * GetStatus 读取状态快照；Shutdown 只设置停止标志，由主循环执行关闭。
 */
class ControlServer {
public:
    ControlServer(ProcessSupervisor& supervisor, std::string socket_path);

    ~ControlServer();

    // 禁止拷贝
    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    /**
     * 绑定 socket 并在后台线程中提供服务
     * @throws SupervisorError 如果 gRPC 服务器启动失败
     */
    void start();

    void stop();

    bool is_running() const { return running_.load(); }

    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    std::unique_ptr<ControlServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
};

// ============================================================================
// 客户端（status / stop 命令）
// ============================================================================

/**
 * 查询运行中监督进程的状态
 * @return std::nullopt 如果 socket 不可达
 */
std::optional<control::SupervisorStatus> query_status(const std::string& socket_path,
                                                      Millis timeout);

/**
 * 请求运行中的监督进程停止
 * @return std::nullopt 如果 socket 不可达
 */
std::optional<control::ShutdownResponse> request_shutdown(const std::string& socket_path,
                                                          bool immediate,
                                                          Millis timeout);

} // namespace agentsup
