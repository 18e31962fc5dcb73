#include "work_queue.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <thread>

namespace agentsup {

namespace {

double percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        return 0.0;
    }
    // nearest-rank
    size_t rank = static_cast<size_t>(std::ceil(p * static_cast<double>(sorted.size()) / 100.0));
    rank = std::clamp<size_t>(rank, 1, sorted.size());
    return sorted[rank - 1];
}

} // anonymous namespace

WorkQueue::WorkQueue(CoordinationStore& store, NowFn now)
    : store_(store), now_(now ? std::move(now) : NowFn(wall_clock_ms)) {}

int64_t WorkQueue::enqueue(Message message) {
    message.id = 0;
    message.status = MessageStatus::Pending;
    message.created_at = now_();
    message.claimed_at = 0;
    message.completed_at = 0;
    message.error.clear();

    int64_t id = store_.insert_message(message);
    std::cout << "[WorkQueue] Enqueued #" << id << " " << message.type
              << " " << message.sender << " -> " << message.recipient
              << " (priority " << message.priority << ")" << std::endl;
    return id;
}

int64_t WorkQueue::enqueue(const std::string& sender,
                           const std::string& recipient,
                           const std::string& type,
                           const std::string& payload,
                           int priority) {
    Message message;
    message.sender = sender;
    message.recipient = recipient;
    message.type = type;
    message.payload = payload;
    message.priority = priority;
    return enqueue(std::move(message));
}

std::vector<Message> WorkQueue::dequeue(const std::string& recipient, size_t limit) {
    for (int attempt = 1; ; ++attempt) {
        try {
            return store_.claim_pending(recipient, limit, now_());
        } catch (const QueueTransactionConflict& e) {
            if (attempt >= kMaxClaimAttempts) {
                throw;
            }
            std::cerr << "[WorkQueue] Dequeue conflict for " << recipient
                      << " (attempt " << attempt << "): " << e.what() << std::endl;
            std::this_thread::sleep_for(Millis(5 * attempt));
        }
    }
}

void WorkQueue::complete(int64_t message_id, Outcome outcome, const std::string& error) {
    MessageStatus target = outcome == Outcome::Completed ? MessageStatus::Completed
                                                         : MessageStatus::Failed;
    TimestampMs now = now_();

    if (!store_.transition_message(message_id, MessageStatus::InProgress, target, now, error)) {
        auto current = store_.get_message(message_id);
        if (!current) {
            throw IllegalTransition("Message #" + std::to_string(message_id) + " not found");
        }
        throw IllegalTransition("Message #" + std::to_string(message_id) + " cannot move from " +
                                to_string(current->status) + " to " + to_string(target));
    }

    // 处理耗时指标：认领 → 完成
    auto done = store_.get_message(message_id);
    if (done && done->claimed_at > 0) {
        MetricSample sample;
        sample.role_id = done->recipient;
        sample.operation_type = done->type;
        sample.duration_ms = static_cast<double>(now - done->claimed_at);
        sample.timestamp = now;
        record_metric(sample);
    }
}

void WorkQueue::record_metric(const MetricSample& sample) {
    MetricSample stored = sample;
    if (stored.timestamp == 0) {
        stored.timestamp = now_();
    }
    try {
        store_.insert_metric(stored);
    } catch (const std::exception& e) {
        std::cerr << "[WorkQueue] Failed to record metric " << stored.role_id << "/"
                  << stored.operation_type << ": " << e.what() << std::endl;
    }
}

void WorkQueue::record_metric(const std::string& role_id,
                              const std::string& operation_type,
                              double duration_ms) {
    MetricSample sample;
    sample.role_id = role_id;
    sample.operation_type = operation_type;
    sample.duration_ms = duration_ms;
    record_metric(sample);
}

std::optional<Message> WorkQueue::get(int64_t message_id) {
    return store_.get_message(message_id);
}

size_t WorkQueue::expire_pending(const std::string& recipient, const std::string& reason) {
    size_t count = store_.expire_pending(recipient, now_(), reason);
    if (count > 0) {
        std::cerr << "[WorkQueue] Expired " << count << " pending messages for "
                  << recipient << ": " << reason << std::endl;
    }
    return count;
}

size_t WorkQueue::purge_finished(Millis retention) {
    size_t count = store_.purge_finished_before(now_() - retention.count());
    if (count > 0) {
        std::cout << "[WorkQueue] Purged " << count << " finished messages" << std::endl;
    }
    return count;
}

QueueStats WorkQueue::stats(const std::optional<std::string>& recipient) {
    QueueStats stats;
    for (const auto& [status, count] : store_.count_by_status(recipient)) {
        switch (status) {
            case MessageStatus::Pending:    stats.pending = count; break;
            case MessageStatus::InProgress: stats.in_progress = count; break;
            case MessageStatus::Completed:  stats.completed = count; break;
            case MessageStatus::Failed:     stats.failed = count; break;
        }
    }
    return stats;
}

size_t WorkQueue::depth(const std::string& recipient) {
    return stats(recipient).pending;
}

std::vector<Message> WorkQueue::slowest(size_t limit) {
    return store_.slowest_completed(limit);
}

std::vector<MetricSummary> WorkQueue::summarize_metrics(const std::optional<std::string>& role_id,
                                                        Millis window) {
    std::map<std::pair<std::string, std::string>, std::vector<double>> groups;
    for (const auto& sample : store_.list_metrics(role_id, now_() - window.count())) {
        groups[{sample.role_id, sample.operation_type}].push_back(sample.duration_ms);
    }

    std::vector<MetricSummary> summaries;
    for (auto& [key, durations] : groups) {
        std::sort(durations.begin(), durations.end());

        MetricSummary summary;
        summary.role_id = key.first;
        summary.operation_type = key.second;
        summary.count = durations.size();
        double total = 0.0;
        for (double d : durations) {
            total += d;
        }
        summary.mean_ms = total / static_cast<double>(durations.size());
        summary.p50_ms = percentile(durations, 50);
        summary.p95_ms = percentile(durations, 95);
        summary.p99_ms = percentile(durations, 99);
        summary.max_ms = durations.back();
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

} // namespace agentsup
