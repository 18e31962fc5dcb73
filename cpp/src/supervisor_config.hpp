#pragma once

#include <string>
#include <vector>

#include "types.hpp"

namespace agentsup {

/**
 * 收件角色进入 terminal 后，其待处理消息的处理方式
 */
enum class UndeliverablePolicy {
    Hold,      // 保持 pending，等待人工处理
    Expire,    // 置为 failed（error = "recipient terminal"）
};

const char* to_string(UndeliverablePolicy policy);

/**
 * SupervisorConfig - 监督进程配置（YAML）
 *
 * 时长字段在 YAML 中以秒表示（可为小数），角色字段缺省时取 defaults 块。
 */
struct SupervisorConfig {
    std::string store_path = "agentsup.db";
    std::string control_socket = "/tmp/agentsup.sock";
    std::string status_snapshot_path;             // 空 = 不导出 JSON 快照
    std::string supervisor_lock = "agentsup-supervisor";

    Millis monitor_interval{1000};
    Millis launch_delay{2000};
    Millis shutdown_grace{10000};                 // SIGTERM / stop
    Millis interrupt_grace{3000};                 // SIGINT
    Millis lock_stale_after{60000};
    Millis message_retention{7LL * 24 * 3600 * 1000};
    Millis purge_interval{3600000};

    UndeliverablePolicy undeliverable_policy = UndeliverablePolicy::Hold;
    std::string alert_recipient;                  // 空 = 不发送告警消息

    std::vector<WorkerRole> roles;                // 按配置文件顺序

    const WorkerRole* find_role(const std::string& role_id) const;
};

/**
 * 从 YAML 文本解析配置（不应用环境变量覆盖）
 * @throws ConfigError 格式错误或校验失败
 */
SupervisorConfig parse_config(const std::string& yaml_text);

/**
 * 加载配置文件并应用 AGENTSUP_STORE 覆盖
 * @throws ConfigError 文件无法读取、格式错误或校验失败
 */
SupervisorConfig load_config(const std::string& path);

/**
 * 配置文件路径：命令行 > AGENTSUP_CONFIG > ./agentsup.yaml
 */
std::string resolve_config_path(const std::string& cli_path);

} // namespace agentsup
