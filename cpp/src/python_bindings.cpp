/**
 * python_bindings.cpp - pybind11 绑定
 *
 * 将 worker 侧的协调接口暴露为 Python 模块 agentsup._worker
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <unistd.h>

#include "errors.hpp"
#include "health_monitor.hpp"
#include "process_probe.hpp"
#include "sqlite_store.hpp"
#include "work_queue.hpp"

namespace py = pybind11;

namespace agentsup {

namespace {

std::string require_env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        throw ConfigError(std::string(name) + " is not set; not running under agentsup?");
    }
    return value;
}

py::dict to_dict(const Message& message) {
    py::dict d;
    d["id"] = message.id;
    d["sender"] = message.sender;
    d["recipient"] = message.recipient;
    d["type"] = message.type;
    d["payload"] = py::bytes(message.payload);
    d["priority"] = message.priority;
    d["status"] = to_string(message.status);
    d["created_at"] = message.created_at;
    d["claimed_at"] = message.claimed_at;
    return d;
}

} // anonymous namespace

/**
 * WorkerContext - worker 进程使用的协调句柄
 *
 * 处理：
 * 1. 心跳（显式传入资源占用，或从 /proc 自采样）
 * 2. 就绪信号（AGENTSUP_READY_FD）
 * 3. 收发消息与记录指标
 *
 * 所有存储访问都在释放 GIL 后进行。
 */
class PyWorkerContext {
public:
    PyWorkerContext(const std::string& store_path, const std::string& role)
        : store_(store_path), role_(role), queue_(store_), monitor_(store_, {}) {}

    static std::unique_ptr<PyWorkerContext> from_env() {
        return std::make_unique<PyWorkerContext>(require_env("AGENTSUP_STORE"), require_env("AGENTSUP_ROLE"));
    }

    void heartbeat(py::object cpu_percent, py::object memory_bytes) {
        double cpu = 0.0;
        int64_t memory = 0;
        if (cpu_percent.is_none() || memory_bytes.is_none()) {
            if (auto usage = sample_usage(getpid())) {
                cpu = usage->cpu_percent;
                memory = usage->memory_bytes;
            }
        }
        if (!cpu_percent.is_none()) {
            cpu = cpu_percent.cast<double>();
        }
        if (!memory_bytes.is_none()) {
            memory = memory_bytes.cast<int64_t>();
        }

        py::gil_scoped_release release;
        monitor_.heartbeat(role_, getpid(), cpu, memory);
    }

    /**
     * 通知监督进程本 worker 已就绪（只发送一次）
     * @return false 如果没有就绪 fd（未设置 ready_timeout 或已发送）
     */
    bool signal_ready(const std::string& message) {
        const char* fd_env = std::getenv("AGENTSUP_READY_FD");
        if (ready_sent_ || !fd_env) {
            return false;
        }
        int fd = std::atoi(fd_env);
        ssize_t n = write(fd, message.data(), message.size());
        close(fd);
        ready_sent_ = true;
        return n == static_cast<ssize_t>(message.size());
    }

    int64_t send(const std::string& recipient,
                 const std::string& type,
                 py::bytes payload,
                 int priority) {
        std::string data = py::cast<std::string>(payload);

        py::gil_scoped_release release;
        return queue_.enqueue(role_, recipient, type, data, priority);
    }

    py::list receive(size_t limit) {
        std::vector<Message> messages;
        {
            py::gil_scoped_release release;
            messages = queue_.dequeue(role_, limit);
        }

        py::list result;
        for (const auto& message : messages) {
            result.append(to_dict(message));
        }
        return result;
    }

    void complete(int64_t message_id, bool success, const std::string& error) {
        py::gil_scoped_release release;
        queue_.complete(message_id, success ? Outcome::Completed : Outcome::Failed, error);
    }

    void record_metric(const std::string& operation_type, double duration_ms) {
        py::gil_scoped_release release;
        queue_.record_metric(role_, operation_type, duration_ms);
    }

    size_t pending() {
        py::gil_scoped_release release;
        return queue_.depth(role_);
    }

    const std::string& role() const { return role_; }

    const std::string& store_path() const { return store_.path(); }

private:
    SqliteStore store_;
    std::string role_;
    WorkQueue queue_;
    HealthMonitor monitor_;
    bool ready_sent_ = false;
};

} // namespace agentsup

PYBIND11_MODULE(_worker, m) {
    m.doc() = "agentsup worker-side coordination (heartbeats, readiness, messages, metrics)";

    auto base = py::register_exception<agentsup::SupervisorError>(m, "SupervisorError");
    py::register_exception<agentsup::IllegalTransition>(m, "IllegalTransition", base.ptr());
    py::register_exception<agentsup::QueueTransactionConflict>(m, "QueueTransactionConflict", base.ptr());
    py::register_exception<agentsup::StoreError>(m, "StoreError", base.ptr());
    py::register_exception<agentsup::ConfigError>(m, "ConfigError", base.ptr());

    py::class_<agentsup::PyWorkerContext>(m, "WorkerContext")
        .def(py::init<const std::string&, const std::string&>(),
             py::arg("store_path"),
             py::arg("role"),
             R"doc(
             打开协调存储

             Args:
                 store_path: SQLite 数据库路径（与监督进程相同）
                 role: 本 worker 的角色 ID
             )doc")
        .def_static("from_env", &agentsup::PyWorkerContext::from_env,
             "由 AGENTSUP_STORE / AGENTSUP_ROLE 环境变量创建")
        .def("heartbeat", &agentsup::PyWorkerContext::heartbeat,
             py::arg("cpu_percent") = py::none(),
             py::arg("memory_bytes") = py::none(),
             "写入心跳；未提供的资源占用从 /proc 采样")
        .def("signal_ready", &agentsup::PyWorkerContext::signal_ready,
             py::arg("message") = "ready",
             "通过 AGENTSUP_READY_FD 发送就绪信号")
        .def("send", &agentsup::PyWorkerContext::send,
             py::arg("recipient"),
             py::arg("type"),
             py::arg("payload"),
             py::arg("priority") = 5,
             "发送消息，返回消息 ID")
        .def("receive", &agentsup::PyWorkerContext::receive,
             py::arg("limit") = 1,
             "取出发给本角色的待处理消息（标记为 in_progress）")
        .def("complete", &agentsup::PyWorkerContext::complete,
             py::arg("message_id"),
             py::arg("success") = true,
             py::arg("error") = "",
             "完成消息；非 in_progress 消息抛出 IllegalTransition")
        .def("record_metric", &agentsup::PyWorkerContext::record_metric,
             py::arg("operation_type"),
             py::arg("duration_ms"),
             "记录一次操作耗时")
        .def("pending", &agentsup::PyWorkerContext::pending,
             "本角色的待处理消息数")
        .def_property_readonly("role", &agentsup::PyWorkerContext::role,
             "角色 ID")
        .def_property_readonly("store_path", &agentsup::PyWorkerContext::store_path,
             "数据库路径");

    m.attr("__version__") = "0.1.0";
}
