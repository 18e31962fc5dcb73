#include "supervisor_config.hpp"
#include "errors.hpp"

#include <cmath>
#include <cstdlib>
#include <set>

#include <yaml-cpp/yaml.h>

namespace agentsup {

namespace {

constexpr const char* kDefaultConfigPath = "agentsup.yaml";
constexpr int64_t kBytesPerMb = 1024 * 1024;

Millis read_seconds(const YAML::Node& node, const char* key, Millis fallback) {
    const YAML::Node value = node[key];
    if (!value) {
        return fallback;
    }
    double seconds = value.as<double>();
    if (seconds < 0) {
        throw ConfigError(std::string(key) + " must not be negative");
    }
    return Millis(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

template <typename T>
T read_value(const YAML::Node& node, const char* key, const T& fallback) {
    const YAML::Node value = node[key];
    if (!value) {
        return fallback;
    }
    return value.as<T>();
}

/**
 * 读取角色的可继承字段（defaults 块与 roles 条目共用）
 */
void read_role_settings(const YAML::Node& node, WorkerRole& role) {
    role.check_interval = read_seconds(node, "check_interval", role.check_interval);
    role.heartbeat_interval = read_seconds(node, "heartbeat_interval", role.heartbeat_interval);
    role.stale_after = read_seconds(node, "stale_after", role.stale_after);
    role.dead_after = read_seconds(node, "dead_after", role.dead_after);
    role.ready_timeout = read_seconds(node, "ready_timeout", role.ready_timeout);
    role.backoff_base = read_seconds(node, "backoff_base", role.backoff_base);
    role.max_restarts = read_value<int>(node, "max_restarts", role.max_restarts);
    role.limits.max_cpu_percent =
        read_value<double>(node, "max_cpu_percent", role.limits.max_cpu_percent);

    const YAML::Node memory = node["max_memory_mb"];
    if (memory) {
        role.limits.max_memory_bytes = memory.as<int64_t>() * kBytesPerMb;
    }
}

WorkerRole read_role(const YAML::Node& node, const WorkerRole& defaults) {
    if (!node.IsMap()) {
        throw ConfigError("each entry in 'roles' must be a mapping");
    }

    WorkerRole role = defaults;
    role.id = read_value<std::string>(node, "id", "");
    if (role.id.empty()) {
        throw ConfigError("role without 'id'");
    }
    role.priority = read_value<int>(node, "priority", role.priority);
    read_role_settings(node, role);

    const YAML::Node command = node["command"];
    const YAML::Node module = node["python_module"];
    if (command && module) {
        throw ConfigError("role '" + role.id + "': 'command' and 'python_module' are exclusive");
    }
    if (command) {
        if (command.IsSequence()) {
            role.command = command.as<std::vector<std::string>>();
        } else {
            role.command = {"/bin/sh", "-c", command.as<std::string>()};
        }
    } else if (module) {
        const char* python = std::getenv("PYTHON_PATH");
        role.command = {python ? python : "python", "-m", module.as<std::string>()};
    }
    if (role.command.empty()) {
        throw ConfigError("role '" + role.id + "' has no 'command' or 'python_module'");
    }

    const YAML::Node args = node["args"];
    if (args) {
        for (const auto& arg : args.as<std::vector<std::string>>()) {
            role.command.push_back(arg);
        }
    }

    const YAML::Node env = node["env"];
    if (env) {
        if (!env.IsMap()) {
            throw ConfigError("role '" + role.id + "': 'env' must be a mapping");
        }
        for (auto it = env.begin(); it != env.end(); ++it) {
            role.env[it->first.as<std::string>()] = it->second.as<std::string>();
        }
    }
    return role;
}

void validate(const SupervisorConfig& config) {
    if (config.store_path.empty()) {
        throw ConfigError("store_path must not be empty");
    }
    if (config.monitor_interval.count() <= 0) {
        throw ConfigError("monitor_interval must be positive");
    }
    if (config.roles.empty()) {
        throw ConfigError("no roles configured");
    }

    std::set<std::string> seen;
    for (const auto& role : config.roles) {
        if (!seen.insert(role.id).second) {
            throw ConfigError("duplicate role '" + role.id + "'");
        }
        if (role.id == config.supervisor_lock) {
            throw ConfigError("role '" + role.id + "' collides with supervisor_lock");
        }
        if (role.check_interval.count() <= 0) {
            throw ConfigError("role '" + role.id + "': check_interval must be positive");
        }
        if (role.dead_after < role.stale_after) {
            throw ConfigError("role '" + role.id + "': dead_after must be >= stale_after");
        }
        if (role.max_restarts < 0) {
            throw ConfigError("role '" + role.id + "': max_restarts must not be negative");
        }
    }
}

SupervisorConfig build_config(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ConfigError("configuration root must be a mapping");
    }

    SupervisorConfig config;
    config.store_path = read_value<std::string>(root, "store_path", config.store_path);
    config.control_socket = read_value<std::string>(root, "control_socket", config.control_socket);
    config.status_snapshot_path =
        read_value<std::string>(root, "status_snapshot", config.status_snapshot_path);
    config.supervisor_lock = read_value<std::string>(root, "supervisor_lock", config.supervisor_lock);

    config.monitor_interval = read_seconds(root, "monitor_interval", config.monitor_interval);
    config.launch_delay = read_seconds(root, "launch_delay", config.launch_delay);
    config.shutdown_grace = read_seconds(root, "shutdown_grace", config.shutdown_grace);
    config.interrupt_grace = read_seconds(root, "interrupt_grace", config.interrupt_grace);
    config.lock_stale_after = read_seconds(root, "lock_stale_after", config.lock_stale_after);
    config.message_retention = read_seconds(root, "message_retention", config.message_retention);
    config.purge_interval = read_seconds(root, "purge_interval", config.purge_interval);
    config.alert_recipient = read_value<std::string>(root, "alert_recipient", "");

    std::string policy = read_value<std::string>(root, "undeliverable_policy", "hold");
    if (policy == "hold") {
        config.undeliverable_policy = UndeliverablePolicy::Hold;
    } else if (policy == "expire") {
        config.undeliverable_policy = UndeliverablePolicy::Expire;
    } else {
        throw ConfigError("undeliverable_policy must be 'hold' or 'expire', got '" + policy + "'");
    }

    WorkerRole defaults;
    const YAML::Node defaults_node = root["defaults"];
    if (defaults_node) {
        read_role_settings(defaults_node, defaults);
    }

    const YAML::Node roles = root["roles"];
    if (roles) {
        if (!roles.IsSequence()) {
            throw ConfigError("'roles' must be a list");
        }
        for (const auto& node : roles) {
            config.roles.push_back(read_role(node, defaults));
        }
    }

    validate(config);
    return config;
}

} // anonymous namespace

const char* to_string(UndeliverablePolicy policy) {
    switch (policy) {
        case UndeliverablePolicy::Hold:   return "hold";
        case UndeliverablePolicy::Expire: return "expire";
    }
    return "unknown";
}

const WorkerRole* SupervisorConfig::find_role(const std::string& role_id) const {
    for (const auto& role : roles) {
        if (role.id == role_id) {
            return &role;
        }
    }
    return nullptr;
}

SupervisorConfig parse_config(const std::string& yaml_text) {
    try {
        return build_config(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
}

SupervisorConfig load_config(const std::string& path) {
    SupervisorConfig config;
    try {
        config = build_config(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load " + path + ": " + e.what());
    }

    if (const char* store = std::getenv("AGENTSUP_STORE")) {
        config.store_path = store;
    }
    return config;
}

std::string resolve_config_path(const std::string& cli_path) {
    if (!cli_path.empty()) {
        return cli_path;
    }
    if (const char* env = std::getenv("AGENTSUP_CONFIG")) {
        return env;
    }
    return kDefaultConfigPath;
}

} // namespace agentsup
