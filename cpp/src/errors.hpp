#pragma once

#include <stdexcept>
#include <string>
#include <sys/types.h>

namespace agentsup {

/**
 * SupervisorError - 所有 agentsup 异常的基类
 */
class SupervisorError : public std::runtime_error {
public:
    explicit SupervisorError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * 角色锁已被另一存活进程持有（不重试）
 */
class RoleAlreadyRunning : public SupervisorError {
public:
    RoleAlreadyRunning(const std::string& role_id, pid_t holder_pid)
        : SupervisorError("Role '" + role_id + "' already running (holder pid " +
                          std::to_string(holder_pid) + ")"),
          role_id_(role_id), holder_pid_(holder_pid) {}

    const std::string& role_id() const { return role_id_; }
    pid_t holder_pid() const { return holder_pid_; }

private:
    std::string role_id_;
    pid_t holder_pid_;
};

/**
 * 操作系统无法创建或 exec 子进程
 */
class ProcessSpawnFailure : public SupervisorError {
public:
    using SupervisorError::SupervisorError;
};

/**
 * 重启次数耗尽，需要人工介入
 */
class MaxRestartsExceeded : public SupervisorError {
public:
    MaxRestartsExceeded(const std::string& role_id, int max_restarts)
        : SupervisorError("Role '" + role_id + "' exceeded max restarts (" +
                          std::to_string(max_restarts) + ")"),
          role_id_(role_id) {}

    const std::string& role_id() const { return role_id_; }

private:
    std::string role_id_;
};

/**
 * 非法的消息状态迁移（例如重复 complete）
 */
class IllegalTransition : public SupervisorError {
public:
    using SupervisorError::SupervisorError;
};

/**
 * 存储层写锁竞争，可安全重试
 */
class QueueTransactionConflict : public SupervisorError {
public:
    using SupervisorError::SupervisorError;
};

/**
 * 存储层其他错误
 */
class StoreError : public SupervisorError {
public:
    using SupervisorError::SupervisorError;
};

class ConfigError : public SupervisorError {
public:
    using SupervisorError::SupervisorError;
};

} // namespace agentsup
