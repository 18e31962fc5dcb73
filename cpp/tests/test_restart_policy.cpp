/**
 * RestartPolicy Test - backoff schedule and give-up boundary
 */

#include "restart_policy.hpp"
#include <cassert>
#include <iostream>
#include <limits>

using namespace agentsup;

namespace {

WorkerRole make_role(int max_restarts, Millis backoff_base) {
    WorkerRole role;
    role.id = "code_developer";
    role.max_restarts = max_restarts;
    role.backoff_base = backoff_base;
    return role;
}

WorkerProcess after_restarts(int restart_count) {
    WorkerProcess process;
    process.role_id = "code_developer";
    process.state = WorkerState::Crashed;
    process.restart_count = restart_count;
    return process;
}

} // anonymous namespace

void test_exponential_schedule() {
    std::cout << "=== Test: Exponential Schedule ===\n";

    WorkerRole role = make_role(3, std::chrono::seconds(60));

    RestartDecision first = RestartPolicy::decide(after_restarts(0), role);
    RestartDecision second = RestartPolicy::decide(after_restarts(1), role);
    RestartDecision third = RestartPolicy::decide(after_restarts(2), role);
    RestartDecision fourth = RestartPolicy::decide(after_restarts(3), role);

    assert(first.action == RestartAction::Wait);
    assert(first.delay == std::chrono::seconds(60));
    assert(second.action == RestartAction::Wait);
    assert(second.delay == std::chrono::seconds(120));
    assert(third.action == RestartAction::Wait);
    assert(third.delay == std::chrono::seconds(240));
    assert(fourth.action == RestartAction::GiveUp);

    std::cout << "60s, 120s, 240s, " << to_string(fourth.action) << "\n";
    std::cout << "✓ Backoff doubles until restarts are exhausted\n";
}

void test_zero_backoff_restarts_now() {
    std::cout << "\n=== Test: Zero Backoff ===\n";

    WorkerRole role = make_role(2, Millis(0));

    assert(RestartPolicy::decide(after_restarts(0), role).action == RestartAction::RestartNow);
    assert(RestartPolicy::decide(after_restarts(1), role).action == RestartAction::RestartNow);
    assert(RestartPolicy::decide(after_restarts(2), role).action == RestartAction::GiveUp);

    std::cout << "✓ Zero delay restarts immediately\n";
}

void test_no_restarts_allowed() {
    std::cout << "\n=== Test: max_restarts = 0 ===\n";

    WorkerRole role = make_role(0, std::chrono::seconds(60));
    assert(RestartPolicy::decide(after_restarts(0), role).action == RestartAction::GiveUp);

    std::cout << "✓ First crash is terminal\n";
}

void test_delay_never_overflows() {
    std::cout << "\n=== Test: Overflow Clamp ===\n";

    WorkerRole role = make_role(1000000, std::chrono::seconds(60));
    Millis at_clamp = RestartPolicy::backoff_for(role, 30);
    Millis far_beyond = RestartPolicy::backoff_for(role, 5000);
    assert(at_clamp.count() > 0);
    assert(far_beyond == at_clamp);

    WorkerRole huge = make_role(1000000, Millis(std::numeric_limits<int64_t>::max() / 4));
    Millis saturated = RestartPolicy::backoff_for(huge, 10);
    assert(saturated.count() == std::numeric_limits<int64_t>::max());

    RestartDecision decision = RestartPolicy::decide(after_restarts(10), huge);
    assert(decision.action == RestartAction::Wait);
    assert(decision.delay.count() > 0);

    std::cout << "clamped delay: " << at_clamp.count() << "ms\n";
    std::cout << "✓ Delay stays positive and saturates\n";
}

int main() {
    std::cout << "RestartPolicy Tests\n";
    std::cout << "===================\n\n";

    test_exponential_schedule();
    test_zero_backoff_restarts_now();
    test_no_restarts_allowed();
    test_delay_never_overflows();

    std::cout << "\n✅ All restart policy tests passed!\n";
    return 0;
}
