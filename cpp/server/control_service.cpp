#include "control_service.hpp"
#include "errors.hpp"
#include "process_supervisor.hpp"

#include <chrono>
#include <cstdio>
#include <iostream>
#include <unistd.h>

#include <grpcpp/grpcpp.h>
#include "supervisor_control.grpc.pb.h"

namespace agentsup {

// ============================================================================
// SupervisorControl gRPC Service Implementation
// ============================================================================

class ControlServiceImpl final : public control::SupervisorControl::Service {
public:
    explicit ControlServiceImpl(ProcessSupervisor& supervisor) : supervisor_(supervisor) {}

    grpc::Status GetStatus(
        grpc::ServerContext* context,
        const control::GetStatusRequest* request,
        control::SupervisorStatus* response) override {

        try {
            *response = supervisor_.status_report();
        } catch (const std::exception& e) {
            std::cerr << "[ControlService] GetStatus failed: " << e.what() << std::endl;
            return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
        }
        return grpc::Status::OK;
    }

    grpc::Status Shutdown(
        grpc::ServerContext* context,
        const control::ShutdownRequest* request,
        control::ShutdownResponse* response) override {

        Millis grace = request->immediate() ? Millis(0) : supervisor_.config().shutdown_grace;
        std::cout << "[ControlService] Shutdown requested (grace " << grace.count() << "ms)" << std::endl;

        supervisor_.request_stop(grace);
        response->set_accepted(true);
        response->set_message("Shutdown scheduled with " + std::to_string(grace.count()) + "ms grace");
        return grpc::Status::OK;
    }

private:
    ProcessSupervisor& supervisor_;
};

// ============================================================================
// ControlServer Implementation
// ============================================================================

ControlServer::ControlServer(ProcessSupervisor& supervisor, std::string socket_path)
    : socket_path_(std::move(socket_path)),
      service_(std::make_unique<ControlServiceImpl>(supervisor)) {}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::start() {
    // 调用方已持有监督进程锁，残留的 socket 文件来自上一个实例
    std::remove(socket_path_.c_str());

    std::string server_address = "unix://" + socket_path_;

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service_.get());

    server_ = builder.BuildAndStart();
    if (!server_) {
        throw SupervisorError("Failed to start control server on " + server_address);
    }
    running_.store(true);

    std::cout << "[ControlService] Listening on " << server_address << std::endl;

    server_thread_ = std::thread([this]() { server_->Wait(); });
}

void ControlServer::stop() {
    if (running_.exchange(false)) {
        std::cout << "[ControlService] Stopping..." << std::endl;
        server_->Shutdown();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        std::remove(socket_path_.c_str());
    }
}

// ============================================================================
// Client helpers
// ============================================================================

namespace {

std::unique_ptr<control::SupervisorControl::Stub> connect(const std::string& socket_path) {
    if (access(socket_path.c_str(), F_OK) != 0) {
        return nullptr;
    }
    auto channel = grpc::CreateChannel("unix://" + socket_path, grpc::InsecureChannelCredentials());
    return control::SupervisorControl::NewStub(channel);
}

} // anonymous namespace

std::optional<control::SupervisorStatus> query_status(const std::string& socket_path,
                                                      Millis timeout) {
    auto stub = connect(socket_path);
    if (!stub) {
        return std::nullopt;
    }

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + timeout);

    control::GetStatusRequest request;
    control::SupervisorStatus response;
    grpc::Status status = stub->GetStatus(&context, request, &response);
    if (!status.ok()) {
        std::cerr << "[ControlService] GetStatus via " << socket_path << " failed: "
                  << status.error_message() << std::endl;
        return std::nullopt;
    }
    return response;
}

std::optional<control::ShutdownResponse> request_shutdown(const std::string& socket_path,
                                                          bool immediate,
                                                          Millis timeout) {
    auto stub = connect(socket_path);
    if (!stub) {
        return std::nullopt;
    }

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + timeout);

    control::ShutdownRequest request;
    request.set_immediate(immediate);
    control::ShutdownResponse response;
    grpc::Status status = stub->Shutdown(&context, request, &response);
    if (!status.ok()) {
        std::cerr << "[ControlService] Shutdown via " << socket_path << " failed: "
                  << status.error_message() << std::endl;
        return std::nullopt;
    }
    return response;
}

} // namespace agentsup
