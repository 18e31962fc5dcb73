#include "memory_store.hpp"

#include <algorithm>

namespace agentsup {

// ---- role_locks ------------------------------------------------------------

bool MemoryStore::insert_lock(const LockRecord& lock) {
    std::lock_guard<std::mutex> guard(mutex_);
    return locks_.emplace(lock.role_id, lock).second;
}

std::optional<LockRecord> MemoryStore::get_lock(const std::string& role_id) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = locks_.find(role_id);
    if (it != locks_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool MemoryStore::replace_lock(const LockRecord& expected, const LockRecord& replacement) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = locks_.find(expected.role_id);
    if (it == locks_.end() ||
        it->second.holder_pid != expected.holder_pid ||
        it->second.acquired_at != expected.acquired_at) {
        return false;
    }
    it->second.holder_pid = replacement.holder_pid;
    it->second.acquired_at = replacement.acquired_at;
    return true;
}

bool MemoryStore::delete_lock(const std::string& role_id, pid_t holder_pid) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = locks_.find(role_id);
    if (it == locks_.end() || it->second.holder_pid != holder_pid) {
        return false;
    }
    locks_.erase(it);
    return true;
}

std::vector<LockRecord> MemoryStore::list_locks() {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<LockRecord> result;
    result.reserve(locks_.size());
    for (const auto& [_, lock] : locks_) {
        result.push_back(lock);
    }
    std::sort(result.begin(), result.end(),
              [](const LockRecord& a, const LockRecord& b) { return a.role_id < b.role_id; });
    return result;
}

// ---- heartbeats ------------------------------------------------------------

void MemoryStore::upsert_heartbeat(const HeartbeatRecord& heartbeat) {
    std::lock_guard<std::mutex> guard(mutex_);
    heartbeats_[heartbeat.role_id] = heartbeat;
}

std::optional<HeartbeatRecord> MemoryStore::get_heartbeat(const std::string& role_id) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = heartbeats_.find(role_id);
    if (it != heartbeats_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<HeartbeatRecord> MemoryStore::list_heartbeats() {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<HeartbeatRecord> result;
    for (const auto& [_, hb] : heartbeats_) {
        result.push_back(hb);
    }
    std::sort(result.begin(), result.end(),
              [](const HeartbeatRecord& a, const HeartbeatRecord& b) { return a.role_id < b.role_id; });
    return result;
}

// ---- messages --------------------------------------------------------------

int64_t MemoryStore::insert_message(const Message& message) {
    std::lock_guard<std::mutex> guard(mutex_);
    Message stored = message;
    stored.id = next_message_id_++;
    messages_[stored.id] = stored;
    return stored.id;
}

std::vector<Message> MemoryStore::claim_pending(const std::string& recipient,
                                                size_t limit,
                                                TimestampMs now) {
    std::lock_guard<std::mutex> guard(mutex_);

    std::vector<Message*> candidates;
    for (auto& [_, msg] : messages_) {
        if (msg.recipient == recipient && msg.status == MessageStatus::Pending) {
            candidates.push_back(&msg);
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const Message* a, const Message* b) {
        if (a->priority != b->priority) return a->priority < b->priority;
        if (a->created_at != b->created_at) return a->created_at < b->created_at;
        return a->id < b->id;
    });

    std::vector<Message> claimed;
    for (Message* msg : candidates) {
        if (claimed.size() >= limit) {
            break;
        }
        msg->status = MessageStatus::InProgress;
        msg->claimed_at = now;
        claimed.push_back(*msg);
    }
    return claimed;
}

bool MemoryStore::transition_message(int64_t id,
                                     MessageStatus from,
                                     MessageStatus to,
                                     TimestampMs now,
                                     const std::string& error) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = messages_.find(id);
    if (it == messages_.end() || it->second.status != from) {
        return false;
    }
    Message& msg = it->second;
    msg.status = to;
    if (to == MessageStatus::InProgress) {
        msg.claimed_at = now;
    }
    if (to == MessageStatus::Completed || to == MessageStatus::Failed) {
        msg.completed_at = now;
    }
    msg.error = error;
    return true;
}

std::optional<Message> MemoryStore::get_message(int64_t id) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = messages_.find(id);
    if (it != messages_.end()) {
        return it->second;
    }
    return std::nullopt;
}

size_t MemoryStore::expire_pending(const std::string& recipient,
                                   TimestampMs now,
                                   const std::string& reason) {
    std::lock_guard<std::mutex> guard(mutex_);
    size_t count = 0;
    for (auto& [_, msg] : messages_) {
        if (msg.recipient == recipient && msg.status == MessageStatus::Pending) {
            msg.status = MessageStatus::Failed;
            msg.completed_at = now;
            msg.error = reason;
            count++;
        }
    }
    return count;
}

size_t MemoryStore::purge_finished_before(TimestampMs cutoff) {
    std::lock_guard<std::mutex> guard(mutex_);
    size_t count = 0;
    for (auto it = messages_.begin(); it != messages_.end();) {
        const Message& msg = it->second;
        bool finished = msg.status == MessageStatus::Completed || msg.status == MessageStatus::Failed;
        if (finished && msg.completed_at < cutoff) {
            it = messages_.erase(it);
            count++;
        } else {
            ++it;
        }
    }
    return count;
}

std::map<MessageStatus, size_t> MemoryStore::count_by_status(
    const std::optional<std::string>& recipient) {
    std::lock_guard<std::mutex> guard(mutex_);
    std::map<MessageStatus, size_t> counts;
    for (const auto& [_, msg] : messages_) {
        if (!recipient || msg.recipient == *recipient) {
            counts[msg.status]++;
        }
    }
    return counts;
}

std::vector<Message> MemoryStore::slowest_completed(size_t limit) {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<Message> completed;
    for (const auto& [_, msg] : messages_) {
        if (msg.status == MessageStatus::Completed) {
            completed.push_back(msg);
        }
    }
    std::stable_sort(completed.begin(), completed.end(), [](const Message& a, const Message& b) {
        return (a.completed_at - a.claimed_at) > (b.completed_at - b.claimed_at);
    });
    if (completed.size() > limit) {
        completed.resize(limit);
    }
    return completed;
}

// ---- metrics ---------------------------------------------------------------

int64_t MemoryStore::insert_metric(const MetricSample& sample) {
    std::lock_guard<std::mutex> guard(mutex_);
    MetricSample stored = sample;
    stored.id = next_metric_id_++;
    metrics_.push_back(stored);
    return stored.id;
}

std::vector<MetricSample> MemoryStore::list_metrics(const std::optional<std::string>& role_id,
                                                    TimestampMs since) {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<MetricSample> result;
    for (const auto& sample : metrics_) {
        if (sample.timestamp >= since && (!role_id || sample.role_id == *role_id)) {
            result.push_back(sample);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const MetricSample& a, const MetricSample& b) { return a.timestamp < b.timestamp; });
    return result;
}

// ---- worker_status ---------------------------------------------------------

void MemoryStore::upsert_worker_status(const WorkerStatusRecord& record) {
    std::lock_guard<std::mutex> guard(mutex_);
    worker_status_[record.role_id] = record;
}

std::vector<WorkerStatusRecord> MemoryStore::list_worker_status() {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<WorkerStatusRecord> result;
    for (const auto& [_, record] : worker_status_) {
        result.push_back(record);
    }
    return result;
}

} // namespace agentsup
