/**
 * ChildProcess Test - spawn, readiness, exit reaping, group termination
 */

#include "child_process.hpp"
#include "errors.hpp"
#include "process_probe.hpp"
#include "test_util.hpp"

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

using namespace agentsup;
using agentsup::testing::TempDir;

namespace {

WorkerRole shell_role(const std::string& script) {
    WorkerRole role;
    role.id = "test_worker";
    role.command = {"/bin/sh", "-c", script};
    return role;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // anonymous namespace

void test_terminate_running_process() {
    std::cout << "=== Test: Terminate Running Process ===\n";

    WorkerRole role;
    role.id = "sleeper";
    role.command = {"/bin/sleep", "30"};

    auto child = ChildProcess::spawn(role, {});
    assert(child->pid() > 0);
    assert(!child->poll_exit());
    assert(is_process_alive(child->pid()));

    child->terminate();
    assert(child->wait_for_exit(Millis(5000)));
    assert(child->exited());
    assert(child->describe_exit().find("killed by signal 15") == 0);

    std::cout << "exit: " << child->describe_exit() << "\n";
    std::cout << "✓ SIGTERM stops the worker\n";
}

void test_exec_failure() {
    std::cout << "\n=== Test: Exec Failure ===\n";

    WorkerRole role;
    role.id = "missing";
    role.command = {"/nonexistent/agentsup-worker"};

    bool thrown = false;
    try {
        ChildProcess::spawn(role, {});
    } catch (const ProcessSpawnFailure& e) {
        thrown = true;
        std::cout << "error: " << e.what() << "\n";
    }
    assert(thrown);

    std::cout << "✓ Missing executable raises ProcessSpawnFailure\n";
}

void test_exit_code() {
    std::cout << "\n=== Test: Exit Code ===\n";

    auto child = ChildProcess::spawn(shell_role("exit 3"), {});
    assert(child->wait_for_exit(Millis(5000)));
    assert(child->describe_exit() == "exited with code 3");

    // 重复回收保持结果
    assert(child->poll_exit());
    assert(child->describe_exit() == "exited with code 3");

    std::cout << "✓ Exit status reaped without blocking\n";
}

void test_ready_signal() {
    std::cout << "\n=== Test: Ready Signal ===\n";

    auto child = ChildProcess::spawn(
        shell_role("sleep 0.2; printf ready >&$AGENTSUP_READY_FD; sleep 5"), {});
    assert(!child->ready());
    assert(child->wait_for_ready(Millis(5000)));
    assert(child->ready());
    assert(child->poll_ready());

    child->kill();
    assert(child->wait_for_exit(Millis(5000)));

    std::cout << "✓ Worker signals readiness through the inherited fd\n";
}

void test_ready_timeout_and_eof() {
    std::cout << "\n=== Test: Ready Timeout / EOF ===\n";

    auto silent = ChildProcess::spawn(shell_role("sleep 5"), {});
    assert(!silent->wait_for_ready(Millis(200)));
    silent->kill();
    assert(silent->wait_for_exit(Millis(5000)));

    // 未发信号就退出：EOF 不视为就绪
    auto quitter = ChildProcess::spawn(shell_role("exit 0"), {});
    assert(!quitter->wait_for_ready(Millis(5000)));
    assert(!quitter->ready());
    assert(quitter->wait_for_exit(Millis(5000)));

    std::cout << "✓ No signal means not ready\n";
}

void test_environment() {
    std::cout << "\n=== Test: Environment ===\n";

    TempDir dir;
    std::string out = dir.file("env.txt");

    // 继承的变量保留，role.env 覆盖继承值，监督进程变量覆盖 role.env
    setenv("AGENTSUP_TEST_INHERITED", "kept", 1);
    setenv("MODEL", "small", 1);

    WorkerRole role = shell_role(
        "echo \"$AGENTSUP_ROLE:$MODEL:$AGENTSUP_STORE:$AGENTSUP_TEST_INHERITED:$AGENTSUP_READY_FD\" > " + out);
    role.env["MODEL"] = "large";
    role.env["AGENTSUP_STORE"] = "/tmp/ignored.db";

    auto child = ChildProcess::spawn(role, {{"AGENTSUP_ROLE", "architect"},
                                            {"AGENTSUP_STORE", "/tmp/team.db"}});
    unsetenv("AGENTSUP_TEST_INHERITED");
    unsetenv("MODEL");

    assert(child->wait_for_exit(Millis(5000)));
    assert(child->describe_exit() == "exited with code 0");

    std::string line = read_file(out);
    std::cout << "worker env: " << line;
    assert(line.find("architect:large:/tmp/team.db:kept:") == 0);
    assert(line.size() > std::string("architect:large:/tmp/team.db:kept:\n").size());

    std::cout << "✓ Environment prepared before fork reaches the worker\n";
}

void test_group_kill_reaches_grandchildren() {
    std::cout << "\n=== Test: Process Group Kill ===\n";

    TempDir dir;
    std::string pidfile = dir.file("grandchild.pid");

    auto child = ChildProcess::spawn(
        shell_role("sleep 30 & echo $! > " + pidfile + "; wait"), {});

    pid_t grandchild = -1;
    bool found = agentsup::testing::eventually([&]() {
        std::string text = read_file(pidfile);
        if (text.empty() || text.back() != '\n') {
            return false;
        }
        grandchild = static_cast<pid_t>(std::stol(text));
        return true;
    });
    assert(found);
    assert(grandchild > 0);
    assert(is_process_alive(grandchild));

    child->terminate();
    assert(child->wait_for_exit(Millis(5000)));

    // 孙进程不是本进程的子进程，由 init 回收
    bool gone = agentsup::testing::eventually([&]() { return !is_process_alive(grandchild); });
    assert(gone);

    std::cout << "✓ SIGTERM reaches the whole process group\n";
}

void test_unresponsive_needs_kill() {
    std::cout << "\n=== Test: Unresponsive Worker ===\n";

    auto child = ChildProcess::spawn(
        shell_role("trap '' TERM; printf ready >&$AGENTSUP_READY_FD; while true; do sleep 0.1; done"),
        {});
    assert(child->wait_for_ready(Millis(5000)));

    child->terminate();
    assert(!child->wait_for_exit(Millis(500)));

    child->kill();
    assert(child->wait_for_exit(Millis(5000)));
    assert(child->describe_exit().find("killed by signal 9") == 0);

    std::cout << "✓ SIGKILL stops a worker that ignores SIGTERM\n";
}

int main() {
    std::cout << "ChildProcess Tests\n";
    std::cout << "==================\n\n";

    test_terminate_running_process();
    test_exec_failure();
    test_exit_code();
    test_ready_signal();
    test_ready_timeout_and_eof();
    test_environment();
    test_group_kill_reaches_grandchildren();
    test_unresponsive_needs_kill();

    std::cout << "\n✅ All child process tests passed!\n";
    return 0;
}
