#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

#include "types.hpp"

namespace agentsup {

/**
 * ChildProcess - 单个 worker 子进程
 *
 * 负责：
 * 1. fork/exec 角色命令，子进程自成进程组（便于整组终止）
 * 2. 通过 pipe 接收就绪信号（AGENTSUP_READY_FD）
 * 3. 通过 close-on-exec pipe 检测 exec 失败
 * 4. 非阻塞回收退出状态
 */
class ChildProcess {
public:
    /**
     * 派生子进程
     * @param role 角色配置（command / env）
     * @param extra_env 监督进程追加的环境变量
     * @throws ProcessSpawnFailure pipe/fork/exec 失败
     */
    static std::unique_ptr<ChildProcess> spawn(const WorkerRole& role,
                                               const std::map<std::string, std::string>& extra_env);

    ~ChildProcess();

    // 禁止拷贝
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    /**
     * 阻塞等待就绪信号
     * @return true 如果在超时前收到就绪信号
     */
    bool wait_for_ready(Millis timeout);

    /**
     * 非阻塞检查就绪信号
     */
    bool poll_ready();

    bool ready() const { return ready_; }

    /**
     * 非阻塞回收子进程
     * @return true 如果子进程已退出
     */
    bool poll_exit();

    bool exited() const { return exited_; }

    /**
     * 向进程组发送 SIGTERM
     */
    void terminate();

    /**
     * 向进程组发送 SIGKILL
     */
    void kill();

    /**
     * 等待退出，最多 timeout
     * @return true 如果已退出
     */
    bool wait_for_exit(Millis timeout);

    /**
     * 退出原因，例如 "exited with code 1"、"killed by signal 9 (Killed)"
     */
    std::string describe_exit() const;

private:
    // 只允许 spawn() 构造
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    ChildProcess(PrivateTag, pid_t pid, int ready_fd);

private:

    void signal_group(int signal);

    pid_t pid_ = -1;
    int ready_fd_ = -1;
    bool ready_ = false;
    bool exited_ = false;
    int wait_status_ = 0;
};

} // namespace agentsup
