#include "restart_policy.hpp"

#include <algorithm>
#include <limits>

namespace agentsup {

namespace {

constexpr int kMaxBackoffExponent = 30;

} // anonymous namespace

const char* to_string(RestartAction action) {
    switch (action) {
        case RestartAction::RestartNow: return "restart_now";
        case RestartAction::Wait:       return "wait";
        case RestartAction::GiveUp:     return "give_up";
    }
    return "unknown";
}

RestartDecision RestartPolicy::decide(const WorkerProcess& process, const WorkerRole& role) {
    if (process.restart_count >= role.max_restarts) {
        return RestartDecision::give_up();
    }

    Millis delay = backoff_for(role, process.restart_count);
    if (delay.count() <= 0) {
        return RestartDecision::restart_now();
    }
    return RestartDecision::wait(delay);
}

Millis RestartPolicy::backoff_for(const WorkerRole& role, int restart_count) {
    if (role.backoff_base.count() <= 0) {
        return Millis(0);
    }

    int exponent = std::clamp(restart_count, 0, kMaxBackoffExponent);
    int64_t base = role.backoff_base.count();
    int64_t factor = int64_t(1) << exponent;
    if (base > std::numeric_limits<int64_t>::max() / factor) {
        return Millis(std::numeric_limits<int64_t>::max());
    }
    return Millis(base * factor);
}

} // namespace agentsup
