/**
 * SupervisorLoop Test - signal handling during launch and in the monitor loop
 */

#include "memory_store.hpp"
#include "process_supervisor.hpp"
#include "supervisor_loop.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace agentsup;

namespace {

WorkerRole sleeper(const std::string& id, int priority) {
    WorkerRole role;
    role.id = id;
    role.priority = priority;
    role.command = {"sleep", "30"};
    return role;
}

SupervisorConfig make_config(std::vector<WorkerRole> roles) {
    SupervisorConfig config;
    config.store_path = ":memory:";
    config.launch_delay = Millis(0);
    config.monitor_interval = Millis(60000);
    config.shutdown_grace = Millis(4000);
    config.interrupt_grace = Millis(2000);
    config.roles = std::move(roles);
    return config;
}

WorkerState state_of(ProcessSupervisor& supervisor, const std::string& role_id) {
    for (const auto& record : supervisor.status()) {
        if (record.role_id == role_id) {
            return record.state;
        }
    }
    assert(false && "role not found");
    return WorkerState::Unstarted;
}

int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - since).count();
}

} // anonymous namespace

void test_grace_for_signal() {
    std::cout << "=== Test: Grace Per Signal ===\n";

    SupervisorConfig config = make_config({});
    assert(grace_for_signal(config, SIGINT) == Millis(2000));
    assert(grace_for_signal(config, SIGTERM) == Millis(4000));
    assert(grace_for_signal(config, SIGHUP) == Millis(4000));

    std::cout << "✓ SIGINT uses interrupt_grace, others shutdown_grace\n";
}

void test_signal_during_launch_delay() {
    std::cout << "\n=== Test: Signal During Launch Delay ===\n";

    SupervisorConfig config = make_config({sleeper("architect", 1), sleeper("assistant", 2),
                                           sleeper("code_developer", 3)});
    config.launch_delay = Millis(2000);

    MemoryStore store;
    ProcessSupervisor supervisor(config, store);

    std::atomic<int> signal{0};
    std::thread sender([&]() {
        std::this_thread::sleep_for(Millis(100));
        signal.store(SIGINT);
    });

    auto begin = std::chrono::steady_clock::now();
    supervisor.start({}, [&]() { return signal.load() != 0; });
    int64_t took = elapsed_ms(begin);
    sender.join();
    std::cout << "start returned after " << took << "ms\n";

    assert(took < 1500);
    assert(state_of(supervisor, "architect") == WorkerState::Running);
    assert(state_of(supervisor, "assistant") == WorkerState::Unstarted);
    assert(state_of(supervisor, "code_developer") == WorkerState::Unstarted);

    begin = std::chrono::steady_clock::now();
    ShutdownResult result = run_monitor_loop(supervisor, signal);
    assert(elapsed_ms(begin) < 3000);

    assert(supervisor.stop_requested());
    assert(supervisor.requested_grace() == Millis(2000));
    assert(result.stopped == 1);
    assert(result.forced == 0);
    assert(state_of(supervisor, "architect") == WorkerState::Stopped);
    assert(supervisor.exit_code() == 0);

    std::cout << "✓ Remaining launches skipped, shutdown with interrupt grace\n";
}

void test_sigterm_in_monitor_loop() {
    std::cout << "\n=== Test: SIGTERM in Monitor Loop ===\n";

    MemoryStore store;
    ProcessSupervisor supervisor(make_config({sleeper("architect", 1)}), store);
    supervisor.start();
    assert(state_of(supervisor, "architect") == WorkerState::Running);

    std::atomic<int> signal{0};
    std::thread sender([&]() {
        std::this_thread::sleep_for(Millis(300));
        signal.store(SIGTERM);
    });

    // monitor_interval 为 60s，信号仍需及时响应
    auto begin = std::chrono::steady_clock::now();
    ShutdownResult result = run_monitor_loop(supervisor, signal);
    int64_t took = elapsed_ms(begin);
    sender.join();
    std::cout << "loop returned after " << took << "ms\n";

    assert(took < 5000);
    assert(supervisor.requested_grace() == Millis(4000));
    assert(result.stopped == 1);
    assert(state_of(supervisor, "architect") == WorkerState::Stopped);

    std::cout << "✓ SIGTERM uses shutdown_grace\n";
}

void test_shutdown_request_ends_loop() {
    std::cout << "\n=== Test: Shutdown Request Ends Loop ===\n";

    MemoryStore store;
    ProcessSupervisor supervisor(make_config({sleeper("architect", 1)}), store);
    supervisor.start();

    std::atomic<int> signal{0};
    std::thread requester([&]() {
        std::this_thread::sleep_for(Millis(200));
        supervisor.request_stop(Millis(0));
    });

    ShutdownResult result = run_monitor_loop(supervisor, signal);
    requester.join();

    assert(signal.load() == 0);
    assert(supervisor.requested_grace() == Millis(0));
    assert(state_of(supervisor, "architect") == WorkerState::Stopped);
    assert(result.stopped + result.forced == 1);

    std::cout << "✓ Loop exits on a stop request without a signal\n";
}

int main() {
    std::cout << "SupervisorLoop Tests\n";
    std::cout << "====================\n\n";

    test_grace_for_signal();
    test_signal_during_launch_delay();
    test_sigterm_in_monitor_loop();
    test_shutdown_request_ends_loop();

    std::cout << "\n✅ All supervisor loop tests passed!\n";
    return 0;
}
