/**
 * WorkQueue Test - ordering, exactly-once claims, transitions, metrics
 */

#include "errors.hpp"
#include "memory_store.hpp"
#include "sqlite_store.hpp"
#include "test_util.hpp"
#include "work_queue.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace agentsup;
using agentsup::testing::FakeClock;
using agentsup::testing::TempDir;

namespace {

/**
 * 前 conflicts 次 claim_pending 抛出 QueueTransactionConflict
 */
class ContendedStore : public MemoryStore {
public:
    explicit ContendedStore(int conflicts) : conflicts_(conflicts) {}

    std::vector<Message> claim_pending(const std::string& recipient,
                                       size_t limit,
                                       TimestampMs now) override {
        attempts++;
        if (conflicts_ > 0) {
            conflicts_--;
            throw QueueTransactionConflict("database is locked");
        }
        return MemoryStore::claim_pending(recipient, limit, now);
    }

    int attempts = 0;

private:
    int conflicts_;
};

class BrokenMetricsStore : public MemoryStore {
public:
    int64_t insert_metric(const MetricSample&) override {
        throw StoreError("disk I/O error");
    }
};

} // anonymous namespace

void test_priority_then_fifo() {
    std::cout << "=== Test: Priority Then FIFO ===\n";

    MemoryStore store;
    FakeClock clock;
    WorkQueue queue(store, clock.fn());

    int64_t first_five = queue.enqueue("architect", "code_developer", "implement", "design-a", 5);
    clock.advance(Millis(10));
    int64_t urgent = queue.enqueue("project_manager", "code_developer", "hotfix", "bug-1", 1);
    clock.advance(Millis(10));
    int64_t second_five = queue.enqueue("architect", "code_developer", "implement", "design-b", 5);

    auto batch = queue.dequeue("code_developer", 10);
    assert(batch.size() == 3);
    assert(batch[0].id == urgent);
    assert(batch[1].id == first_five);
    assert(batch[2].id == second_five);
    assert(batch[0].status == MessageStatus::InProgress);
    assert(batch[0].claimed_at == clock.now);

    std::cout << "order: " << batch[0].payload << ", " << batch[1].payload
              << ", " << batch[2].payload << "\n";
    std::cout << "✓ Priorities [5, 1, 5] dequeue as [1, 5, 5]\n";
}

void test_same_timestamp_orders_by_id() {
    std::cout << "\n=== Test: Same Timestamp Orders By Id ===\n";

    MemoryStore store;
    FakeClock clock;
    WorkQueue queue(store, clock.fn());

    int64_t a = queue.enqueue("a", "r", "t", "1", 3);
    int64_t b = queue.enqueue("a", "r", "t", "2", 3);
    int64_t c = queue.enqueue("a", "r", "t", "3", 3);

    auto first = queue.dequeue("r");
    auto rest = queue.dequeue("r", 5);
    assert(first.size() == 1 && first[0].id == a);
    assert(rest.size() == 2 && rest[0].id == b && rest[1].id == c);

    std::cout << "✓ Ties broken by insertion order\n";
}

void test_claimed_message_not_redelivered() {
    std::cout << "\n=== Test: Claimed Message Not Redelivered ===\n";

    MemoryStore store;
    WorkQueue queue(store);

    int64_t id = queue.enqueue("architect", "assistant", "question", "why?");
    assert(queue.has_pending("assistant"));

    auto first = queue.dequeue("assistant");
    auto second = queue.dequeue("assistant");
    assert(first.size() == 1 && first[0].id == id);
    assert(second.empty());
    assert(!queue.has_pending("assistant"));

    // 其他收件人看不到
    assert(queue.dequeue("architect").empty());

    std::cout << "✓ in_progress message is not returned again\n";
}

void test_illegal_transitions() {
    std::cout << "\n=== Test: Illegal Transitions ===\n";

    MemoryStore store;
    WorkQueue queue(store);

    int64_t pending = queue.enqueue("a", "b", "t", "p");
    bool threw = false;
    try {
        queue.complete(pending, Outcome::Completed);
    } catch (const IllegalTransition& e) {
        threw = true;
        std::cout << "pending: " << e.what() << "\n";
    }
    assert(threw);

    queue.dequeue("b");
    queue.complete(pending, Outcome::Failed, "tool crashed");
    auto failed = queue.get(pending);
    assert(failed->status == MessageStatus::Failed);
    assert(failed->error == "tool crashed");

    threw = false;
    try {
        queue.complete(pending, Outcome::Completed);
    } catch (const IllegalTransition& e) {
        threw = true;
        std::cout << "failed: " << e.what() << "\n";
    }
    assert(threw);

    threw = false;
    try {
        queue.complete(987654, Outcome::Completed);
    } catch (const IllegalTransition& e) {
        threw = true;
        std::cout << "missing: " << e.what() << "\n";
    }
    assert(threw);

    std::cout << "✓ Only in_progress messages can be completed\n";
}

void test_completion_records_metric() {
    std::cout << "\n=== Test: Completion Records Metric ===\n";

    MemoryStore store;
    FakeClock clock;
    WorkQueue queue(store, clock.fn());

    int64_t id = queue.enqueue("project_manager", "code_developer", "implement", "PRIORITY 3");
    clock.advance(Millis(100));
    queue.dequeue("code_developer");
    clock.advance(Millis(250));
    queue.complete(id, Outcome::Completed);

    auto done = queue.get(id);
    assert(done->status == MessageStatus::Completed);
    assert(done->completed_at == clock.now);

    auto summaries = queue.summarize_metrics(std::nullopt, std::chrono::hours(1));
    assert(summaries.size() == 1);
    assert(summaries[0].role_id == "code_developer");
    assert(summaries[0].operation_type == "implement");
    assert(summaries[0].count == 1);
    assert(summaries[0].max_ms == 250.0);

    auto slowest = queue.slowest(5);
    assert(slowest.size() == 1 && slowest[0].id == id);

    std::cout << "✓ Claim-to-completion duration recorded\n";
}

void test_metric_summary_percentiles() {
    std::cout << "\n=== Test: Metric Summary Percentiles ===\n";

    MemoryStore store;
    FakeClock clock;
    WorkQueue queue(store, clock.fn());

    for (int i = 100; i >= 1; --i) {
        queue.record_metric("architect", "design", static_cast<double>(i));
    }
    queue.record_metric("assistant", "answer", 7.0);

    auto summaries = queue.summarize_metrics(std::string("architect"), std::chrono::hours(1));
    assert(summaries.size() == 1);
    const auto& s = summaries[0];
    assert(s.count == 100);
    assert(s.mean_ms == 50.5);
    assert(s.p50_ms == 50.0);
    assert(s.p95_ms == 95.0);
    assert(s.p99_ms == 99.0);
    assert(s.max_ms == 100.0);

    // 时间窗之外的样本不计入
    clock.advance(std::chrono::hours(2));
    queue.record_metric("architect", "design", 1000.0);
    auto recent = queue.summarize_metrics(std::string("architect"), std::chrono::hours(1));
    assert(recent.size() == 1 && recent[0].count == 1);

    std::cout << "p50=" << s.p50_ms << " p95=" << s.p95_ms << " p99=" << s.p99_ms << "\n";
    std::cout << "✓ Nearest-rank percentiles per role and operation\n";
}

void test_record_metric_never_throws() {
    std::cout << "\n=== Test: Metric Failure Is Logged Only ===\n";

    BrokenMetricsStore store;
    WorkQueue queue(store);

    queue.record_metric("architect", "design", 12.0);

    // 指标写入失败不影响完成
    int64_t id = queue.enqueue("a", "architect", "design", "x");
    queue.dequeue("architect");
    queue.complete(id, Outcome::Completed);
    assert(queue.get(id)->status == MessageStatus::Completed);

    std::cout << "✓ Metric errors do not block delivery\n";
}

void test_conflicts_are_retried() {
    std::cout << "\n=== Test: Conflict Retry ===\n";

    ContendedStore flaky(2);
    WorkQueue queue(flaky);
    queue.enqueue("a", "b", "t", "p");
    auto batch = queue.dequeue("b");
    assert(batch.size() == 1);
    assert(flaky.attempts == 3);

    ContendedStore stuck(100);
    WorkQueue stuck_queue(stuck);
    bool threw = false;
    try {
        stuck_queue.dequeue("b");
    } catch (const QueueTransactionConflict&) {
        threw = true;
    }
    assert(threw);
    assert(stuck.attempts == 3);

    std::cout << "✓ Transient conflicts retried a bounded number of times\n";
}

void test_stats_expire_and_purge() {
    std::cout << "\n=== Test: Stats, Expire, Purge ===\n";

    MemoryStore store;
    FakeClock clock;
    WorkQueue queue(store, clock.fn());

    int64_t done = queue.enqueue("a", "architect", "t", "1");
    queue.enqueue("a", "architect", "t", "2");
    queue.enqueue("a", "assistant", "t", "3");
    queue.enqueue("a", "assistant", "t", "4");
    queue.dequeue("architect");
    queue.complete(done, Outcome::Completed);

    QueueStats all = queue.stats();
    assert(all.total() == 4);
    assert(all.pending == 3 && all.completed == 1);
    assert(queue.depth("assistant") == 2);
    assert(queue.depth("architect") == 1);

    size_t expired = queue.expire_pending("assistant", "recipient terminal");
    assert(expired == 2);
    assert(queue.depth("assistant") == 0);
    QueueStats assistant = queue.stats(std::string("assistant"));
    assert(assistant.failed == 2);

    // 保留期内不删除
    clock.advance(std::chrono::hours(1));
    assert(queue.purge_finished(std::chrono::hours(24)) == 0);

    clock.advance(std::chrono::hours(24));
    size_t purged = queue.purge_finished(std::chrono::hours(24));
    assert(purged == 3);
    assert(!queue.get(done).has_value());
    assert(queue.stats().total() == 1);
    assert(queue.depth("architect") == 1);

    std::cout << "✓ Counters, expiry and retention purge\n";
}

void test_concurrent_dequeue_sqlite() {
    std::cout << "\n=== Test: Concurrent Dequeue (SQLite) ===\n";

    TempDir dir;
    std::string db = dir.file("queue.db");

    constexpr int kMessages = 200;
    constexpr int kConsumers = 4;
    {
        SqliteStore store(db);
        WorkQueue queue(store);
        for (int i = 0; i < kMessages; ++i) {
            queue.enqueue("project_manager", "code_developer", "task", std::to_string(i), i % 3);
        }
    }

    std::vector<std::unique_ptr<SqliteStore>> stores;
    for (int i = 0; i < kConsumers; ++i) {
        stores.push_back(std::make_unique<SqliteStore>(db));
    }

    std::mutex mu;
    std::vector<int64_t> seen;
    std::vector<std::thread> threads;
    for (int i = 0; i < kConsumers; ++i) {
        threads.emplace_back([&, i]() {
            WorkQueue queue(*stores[i]);
            while (true) {
                auto batch = queue.dequeue("code_developer", 3);
                if (batch.empty()) {
                    break;
                }
                std::lock_guard<std::mutex> lock(mu);
                for (const auto& m : batch) {
                    seen.push_back(m.id);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::set<int64_t> unique(seen.begin(), seen.end());
    assert(seen.size() == kMessages);
    assert(unique.size() == kMessages);

    SqliteStore reader(db);
    WorkQueue queue(reader);
    assert(queue.stats().in_progress == kMessages);

    std::cout << "✓ " << kConsumers << " consumers, " << kMessages << " messages, no duplicates\n";
}

int main() {
    std::cout << "WorkQueue Tests\n";
    std::cout << "===============\n\n";

    test_priority_then_fifo();
    test_same_timestamp_orders_by_id();
    test_claimed_message_not_redelivered();
    test_illegal_transitions();
    test_completion_records_metric();
    test_metric_summary_percentiles();
    test_record_metric_never_throws();
    test_conflicts_are_retried();
    test_stats_expire_and_purge();
    test_concurrent_dequeue_sqlite();

    std::cout << "\n✅ All work queue tests passed!\n";
    return 0;
}
