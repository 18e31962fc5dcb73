#include "types.hpp"

namespace agentsup {

TimestampMs wall_clock_ms() {
    return std::chrono::duration_cast<Millis>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

const char* to_string(WorkerState state) {
    switch (state) {
        case WorkerState::Unstarted:  return "unstarted";
        case WorkerState::Starting:   return "starting";
        case WorkerState::Running:    return "running";
        case WorkerState::Stale:      return "stale";
        case WorkerState::Stopping:   return "stopping";
        case WorkerState::Crashed:    return "crashed";
        case WorkerState::Restarting: return "restarting";
        case WorkerState::Stopped:    return "stopped";
        case WorkerState::Terminal:   return "terminal";
    }
    return "unknown";
}

std::optional<WorkerState> worker_state_from_string(const std::string& name) {
    static const WorkerState all[] = {
        WorkerState::Unstarted, WorkerState::Starting, WorkerState::Running,
        WorkerState::Stale, WorkerState::Stopping, WorkerState::Crashed,
        WorkerState::Restarting, WorkerState::Stopped, WorkerState::Terminal,
    };
    for (WorkerState s : all) {
        if (name == to_string(s)) {
            return s;
        }
    }
    return std::nullopt;
}

const char* to_string(MessageStatus status) {
    switch (status) {
        case MessageStatus::Pending:    return "pending";
        case MessageStatus::InProgress: return "in_progress";
        case MessageStatus::Completed:  return "completed";
        case MessageStatus::Failed:     return "failed";
    }
    return "unknown";
}

std::optional<MessageStatus> message_status_from_string(const std::string& name) {
    if (name == "pending") return MessageStatus::Pending;
    if (name == "in_progress") return MessageStatus::InProgress;
    if (name == "completed") return MessageStatus::Completed;
    if (name == "failed") return MessageStatus::Failed;
    return std::nullopt;
}

} // namespace agentsup
