/**
 * SupervisorConfig Test - YAML parsing, defaults, validation
 */

#include "errors.hpp"
#include "supervisor_config.hpp"
#include "test_util.hpp"

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <iostream>

using namespace agentsup;
using agentsup::testing::TempDir;

namespace {

const char* kTeamConfig = R"(
store_path: /var/lib/agentsup/team.db
status_snapshot: /tmp/team-status.json
monitor_interval: 0.5
launch_delay: 1.5
undeliverable_policy: expire
alert_recipient: project_manager

defaults:
  check_interval: 15
  stale_after: 120
  dead_after: 600
  max_restarts: 5
  backoff_base: 30

roles:
  - id: architect
    priority: 1
    command: [/usr/bin/agent, --role, architect]
    env:
      MODEL: large
  - id: code_developer
    priority: 2
    command: "exec agent --role dev"
    max_restarts: 1
    max_cpu_percent: 90
    max_memory_mb: 512
  - id: assistant
    python_module: agents.assistant
    args: [--verbose]
    ready_timeout: 2.25
)";

bool throws_config_error(const std::string& yaml) {
    try {
        parse_config(yaml);
    } catch (const ConfigError& e) {
        std::cout << "  rejected: " << e.what() << "\n";
        return true;
    }
    return false;
}

} // anonymous namespace

void test_parse_team_config() {
    std::cout << "=== Test: Parse Team Config ===\n";

    setenv("PYTHON_PATH", "/opt/venv/bin/python3", 1);
    SupervisorConfig config = parse_config(kTeamConfig);
    unsetenv("PYTHON_PATH");

    assert(config.store_path == "/var/lib/agentsup/team.db");
    assert(config.status_snapshot_path == "/tmp/team-status.json");
    assert(config.monitor_interval == Millis(500));
    assert(config.launch_delay == Millis(1500));
    assert(config.undeliverable_policy == UndeliverablePolicy::Expire);
    assert(config.alert_recipient == "project_manager");
    assert(config.shutdown_grace == Millis(10000));
    assert(config.control_socket == "/tmp/agentsup.sock");

    assert(config.roles.size() == 3);
    const WorkerRole& architect = config.roles[0];
    assert(architect.id == "architect");
    assert(architect.priority == 1);
    assert(architect.command.size() == 3 && architect.command[2] == "architect");
    assert(architect.env.at("MODEL") == "large");
    assert(architect.check_interval == Millis(15000));
    assert(architect.max_restarts == 5);
    assert(architect.backoff_base == Millis(30000));

    const WorkerRole* dev = config.find_role("code_developer");
    assert(dev != nullptr);
    assert(dev->command.size() == 3);
    assert(dev->command[0] == "/bin/sh" && dev->command[1] == "-c");
    assert(dev->max_restarts == 1);
    assert(dev->limits.max_cpu_percent == 90.0);
    assert(dev->limits.max_memory_bytes == 512LL * 1024 * 1024);
    assert(dev->stale_after == Millis(120000));

    const WorkerRole* assistant = config.find_role("assistant");
    assert(assistant != nullptr);
    assert(assistant->command.size() == 4);
    assert(assistant->command[0] == "/opt/venv/bin/python3");
    assert(assistant->command[1] == "-m");
    assert(assistant->command[2] == "agents.assistant");
    assert(assistant->command[3] == "--verbose");
    assert(assistant->ready_timeout == Millis(2250));

    assert(config.find_role("ux_design_expert") == nullptr);

    std::cout << "✓ Roles inherit defaults and keep file order\n";
}

void test_builtin_defaults() {
    std::cout << "\n=== Test: Built-in Defaults ===\n";

    SupervisorConfig config = parse_config("roles:\n  - id: solo\n    command: [/bin/true]\n");
    const WorkerRole& role = config.roles[0];

    assert(config.store_path == "agentsup.db");
    assert(config.undeliverable_policy == UndeliverablePolicy::Hold);
    assert(config.alert_recipient.empty());
    assert(config.status_snapshot_path.empty());
    assert(role.max_restarts == 3);
    assert(role.backoff_base == Millis(60000));
    assert(role.stale_after == Millis(300000));
    assert(role.dead_after == Millis(900000));
    assert(role.ready_timeout == Millis(0));

    std::cout << "✓ 3 restarts, 60s backoff, 5min stale, 15min dead\n";
}

void test_validation_errors() {
    std::cout << "\n=== Test: Validation Errors ===\n";

    assert(throws_config_error("- just\n- a list\n"));
    assert(throws_config_error("store_path: x.db\n"));
    assert(throws_config_error("roles:\n  - command: [/bin/true]\n"));
    assert(throws_config_error("roles:\n  - id: a\n"));
    assert(throws_config_error(
        "roles:\n  - id: a\n    command: [/bin/true]\n    python_module: m\n"));
    assert(throws_config_error(
        "roles:\n  - id: a\n    command: [/bin/true]\n  - id: a\n    command: [/bin/true]\n"));
    assert(throws_config_error(
        "roles:\n  - id: agentsup-supervisor\n    command: [/bin/true]\n"));
    assert(throws_config_error(
        "roles:\n  - id: a\n    command: [/bin/true]\n    stale_after: 60\n    dead_after: 30\n"));
    assert(throws_config_error(
        "roles:\n  - id: a\n    command: [/bin/true]\n    check_interval: 0\n"));
    assert(throws_config_error(
        "roles:\n  - id: a\n    command: [/bin/true]\n    max_restarts: -1\n"));
    assert(throws_config_error(
        "roles:\n  - id: a\n    command: [/bin/true]\n    backoff_base: -5\n"));
    assert(throws_config_error(
        "undeliverable_policy: drop\nroles:\n  - id: a\n    command: [/bin/true]\n"));
    assert(throws_config_error("roles: [ {id: a, command: [/bin/true] \n"));
    assert(throws_config_error(
        "roles:\n  - id: a\n    command: [/bin/true]\n    max_restarts: lots\n"));

    std::cout << "✓ Invalid configurations raise ConfigError\n";
}

void test_load_config_store_override() {
    std::cout << "\n=== Test: load_config + AGENTSUP_STORE ===\n";

    TempDir dir;
    std::string path = dir.file("agentsup.yaml");
    {
        std::ofstream out(path);
        out << "store_path: from-file.db\n"
            << "roles:\n"
            << "  - id: architect\n"
            << "    command: [/bin/true]\n";
    }

    unsetenv("AGENTSUP_STORE");
    assert(load_config(path).store_path == "from-file.db");

    setenv("AGENTSUP_STORE", "/tmp/override.db", 1);
    assert(load_config(path).store_path == "/tmp/override.db");
    // parse_config 不读取环境变量
    assert(parse_config("store_path: a.db\nroles:\n  - id: r\n    command: [x]\n").store_path == "a.db");
    unsetenv("AGENTSUP_STORE");

    bool missing = false;
    try {
        load_config(dir.file("missing.yaml"));
    } catch (const ConfigError&) {
        missing = true;
    }
    assert(missing);

    std::cout << "✓ Environment overrides the store path\n";
}

void test_resolve_config_path() {
    std::cout << "\n=== Test: resolve_config_path ===\n";

    unsetenv("AGENTSUP_CONFIG");
    assert(resolve_config_path("") == "agentsup.yaml");
    assert(resolve_config_path("cli.yaml") == "cli.yaml");

    setenv("AGENTSUP_CONFIG", "/etc/agentsup/team.yaml", 1);
    assert(resolve_config_path("") == "/etc/agentsup/team.yaml");
    assert(resolve_config_path("cli.yaml") == "cli.yaml");
    unsetenv("AGENTSUP_CONFIG");

    std::cout << "✓ CLI > AGENTSUP_CONFIG > ./agentsup.yaml\n";
}

int main() {
    std::cout << "SupervisorConfig Tests\n";
    std::cout << "======================\n\n";

    test_parse_team_config();
    test_builtin_defaults();
    test_validation_errors();
    test_load_config_store_override();
    test_resolve_config_path();

    std::cout << "\n✅ All supervisor config tests passed!\n";
    return 0;
}
