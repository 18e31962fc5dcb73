#include "child_process.hpp"
#include "errors.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <string>
#include <vector>

extern char** environ;

namespace agentsup {

namespace {

constexpr Millis kExitPollInterval{20};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

ssize_t read_retry(int fd, void* buf, size_t len) {
    ssize_t n;
    do {
        n = read(fd, buf, len);
    } while (n < 0 && errno == EINTR);
    return n;
}

/**
 * 子进程环境：继承当前环境，依次覆盖 role.env、extra_env 和 AGENTSUP_READY_FD
 */
std::vector<std::string> build_environment(const WorkerRole& role,
                                           const std::map<std::string, std::string>& extra_env,
                                           int ready_fd) {
    std::map<std::string, std::string> vars;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq != std::string::npos) {
            vars[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : role.env) {
        vars[key] = value;
    }
    for (const auto& [key, value] : extra_env) {
        vars[key] = value;
    }
    vars["AGENTSUP_READY_FD"] = std::to_string(ready_fd);

    std::vector<std::string> entries;
    entries.reserve(vars.size());
    for (const auto& [key, value] : vars) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

} // anonymous namespace

std::unique_ptr<ChildProcess> ChildProcess::spawn(const WorkerRole& role,
                                                  const std::map<std::string, std::string>& extra_env) {
    if (role.command.empty()) {
        throw ProcessSpawnFailure("Role '" + role.id + "' has an empty command");
    }

    // 就绪信号 pipe：只有写端由子进程继承
    int ready_fds[2];
    if (pipe2(ready_fds, O_CLOEXEC) < 0) {
        throw ProcessSpawnFailure("Failed to create ready pipe: " + std::string(strerror(errno)));
    }

    // exec 失败检测 pipe：exec 成功后写端自动关闭
    int exec_fds[2];
    if (pipe2(exec_fds, O_CLOEXEC) < 0) {
        int err = errno;
        close(ready_fds[0]);
        close(ready_fds[1]);
        throw ProcessSpawnFailure("Failed to create exec pipe: " + std::string(strerror(err)));
    }

    // fork 前准备好 argv 和 envp，子进程中只调用 async-signal-safe 函数
    std::vector<char*> args;
    for (const auto& arg : role.command) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    std::vector<std::string> env_entries = build_environment(role, extra_env, ready_fds[1]);
    std::vector<char*> envp;
    for (const auto& entry : env_entries) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(ready_fds[0]);
        close(ready_fds[1]);
        close(exec_fds[0]);
        close(exec_fds[1]);
        throw ProcessSpawnFailure("Fork failed: " + std::string(strerror(err)));
    }

    if (pid == 0) {
        // ===== 子进程 =====
        close(ready_fds[0]);
        close(exec_fds[0]);
        fcntl(ready_fds[1], F_SETFD, 0);
        setpgid(0, 0);

        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        execvpe(args[0], args.data(), envp.data());

        // 如果 execvpe 返回，说明失败了
        int err = errno;
        ssize_t ignored = write(exec_fds[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // ===== 父进程 =====
    setpgid(pid, pid);
    close(ready_fds[1]);
    close(exec_fds[1]);

    int exec_errno = 0;
    ssize_t n = read_retry(exec_fds[0], &exec_errno, sizeof(exec_errno));
    close(exec_fds[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        close(ready_fds[0]);
        waitpid(pid, nullptr, 0);
        throw ProcessSpawnFailure("Failed to exec '" + role.command[0] + "' for role '" +
                                  role.id + "': " + strerror(exec_errno));
    }

    std::cout << "[ChildProcess] Spawned " << role.id << " (pid " << pid << "): "
              << role.command[0] << std::endl;
    return std::make_unique<ChildProcess>(PrivateTag{}, pid, ready_fds[0]);
}

ChildProcess::ChildProcess(PrivateTag, pid_t pid, int ready_fd) : pid_(pid), ready_fd_(ready_fd) {}

ChildProcess::~ChildProcess() {
    if (!poll_exit()) {
        kill();
        waitpid(pid_, &wait_status_, 0);
        exited_ = true;
    }
    close_fd(ready_fd_);
}

bool ChildProcess::wait_for_ready(Millis timeout) {
    if (ready_) {
        return true;
    }
    if (ready_fd_ < 0) {
        return false;
    }

    struct pollfd pfd;
    pfd.fd = ready_fd_;
    pfd.events = POLLIN;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto remaining = std::chrono::duration_cast<Millis>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            remaining = Millis(0);
        }

        int ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0 && errno == EINTR) {
            continue;
        }
        if (ret > 0) {
            char buf[128];
            ssize_t n = read_retry(ready_fd_, buf, sizeof(buf) - 1);
            if (n > 0) {
                buf[n] = '\0';
                std::cout << "[ChildProcess] Worker " << pid_ << " signaled: " << buf << std::endl;
                ready_ = true;
                return true;
            }
            // EOF：worker 关闭了就绪 fd 或已退出
            close_fd(ready_fd_);
            return false;
        }
        if (ret == 0) {
            return false;
        }
        std::cerr << "[ChildProcess] Poll error: " << strerror(errno) << std::endl;
        return false;
    }
}

bool ChildProcess::poll_ready() {
    return wait_for_ready(Millis(0));
}

bool ChildProcess::poll_exit() {
    if (exited_) {
        return true;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        exited_ = true;
        wait_status_ = status;
    } else if (result < 0 && errno == ECHILD) {
        // 已被其他地方回收
        exited_ = true;
    }
    return exited_;
}

void ChildProcess::terminate() {
    signal_group(SIGTERM);
}

void ChildProcess::kill() {
    signal_group(SIGKILL);
}

void ChildProcess::signal_group(int signal) {
    if (exited_) {
        return;
    }
    if (::kill(-pid_, signal) < 0 && errno == ESRCH) {
        ::kill(pid_, signal);
    }
}

bool ChildProcess::wait_for_exit(Millis timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!poll_exit()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kExitPollInterval);
    }
    return true;
}

std::string ChildProcess::describe_exit() const {
    if (!exited_) {
        return "running";
    }
    if (WIFEXITED(wait_status_)) {
        return "exited with code " + std::to_string(WEXITSTATUS(wait_status_));
    }
    if (WIFSIGNALED(wait_status_)) {
        int sig = WTERMSIG(wait_status_);
        return "killed by signal " + std::to_string(sig) + " (" + strsignal(sig) + ")";
    }
    return "exited";
}

} // namespace agentsup
