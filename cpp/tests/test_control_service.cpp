/**
 * ControlService Test - GetStatus / Shutdown over a Unix domain socket
 */

#include "control_service.hpp"
#include "memory_store.hpp"
#include "process_supervisor.hpp"
#include "test_util.hpp"

#include <cassert>
#include <iostream>
#include <unistd.h>

using namespace agentsup;
using agentsup::testing::TempDir;

namespace {

SupervisorConfig make_config() {
    WorkerRole role;
    role.id = "architect";
    role.command = {"sleep", "30"};

    SupervisorConfig config;
    config.launch_delay = Millis(0);
    config.shutdown_grace = Millis(4000);
    config.roles = {role};
    return config;
}

} // anonymous namespace

void test_unreachable_socket() {
    std::cout << "=== Test: Unreachable Socket ===\n";

    TempDir dir;
    assert(!query_status(dir.file("none.sock"), Millis(500)).has_value());
    assert(!request_shutdown(dir.file("none.sock"), false, Millis(500)).has_value());

    std::cout << "✓ Missing socket reported as unreachable\n";
}

void test_status_and_shutdown() {
    std::cout << "\n=== Test: GetStatus + Shutdown ===\n";

    TempDir dir;
    std::string socket = dir.file("control.sock");

    MemoryStore store;
    ProcessSupervisor supervisor(make_config(), store);
    supervisor.start();

    ControlServer server(supervisor, socket);
    server.start();
    assert(server.is_running());
    assert(access(socket.c_str(), F_OK) == 0);

    auto status = query_status(socket, Millis(3000));
    assert(status.has_value());
    assert(status->live());
    assert(status->supervisor_pid() == getpid());
    assert(status->workers_size() == 1);
    assert(status->workers(0).role_id() == "architect");
    assert(status->workers(0).state() == "running");
    std::cout << "status via rpc: " << status->workers(0).label() << "\n";

    assert(!supervisor.stop_requested());
    auto response = request_shutdown(socket, false, Millis(3000));
    assert(response.has_value());
    assert(response->accepted());
    assert(supervisor.stop_requested());
    assert(supervisor.requested_grace() == Millis(4000));

    auto immediate = request_shutdown(socket, true, Millis(3000));
    assert(immediate.has_value());
    assert(supervisor.requested_grace() == Millis(0));

    server.stop();
    assert(!server.is_running());
    assert(access(socket.c_str(), F_OK) != 0);

    supervisor.shutdown(supervisor.requested_grace());
    std::cout << "✓ Shutdown RPC only sets the stop flag\n";
}

int main() {
    std::cout << "ControlService Tests\n";
    std::cout << "====================\n\n";

    test_unreachable_socket();
    test_status_and_shutdown();

    std::cout << "\n✅ All control service tests passed!\n";
    return 0;
}
