#include "supervisor_loop.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace agentsup {

namespace {

constexpr Millis kPollSlice{50};

} // anonymous namespace

Millis grace_for_signal(const SupervisorConfig& config, int signal) {
    return signal == SIGINT ? config.interrupt_grace : config.shutdown_grace;
}

ShutdownResult run_monitor_loop(ProcessSupervisor& supervisor, const std::atomic<int>& signal) {
    const SupervisorConfig& config = supervisor.config();

    while (!supervisor.stop_requested()) {
        int sig = signal.load();
        if (sig != 0) {
            std::cout << "[main] Received signal " << sig << ", shutting down..." << std::endl;
            supervisor.request_stop(grace_for_signal(config, sig));
            break;
        }

        supervisor.tick();

        auto deadline = std::chrono::steady_clock::now() + config.monitor_interval;
        while (signal.load() == 0 && !supervisor.stop_requested() &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kPollSlice);
        }
    }

    return supervisor.shutdown(supervisor.requested_grace());
}

} // namespace agentsup
