#pragma once

#include "types.hpp"

namespace agentsup {

enum class RestartAction {
    RestartNow,
    Wait,
    GiveUp,
};

const char* to_string(RestartAction action);

struct RestartDecision {
    RestartAction action = RestartAction::GiveUp;
    Millis delay{0};

    static RestartDecision restart_now() { return {RestartAction::RestartNow, Millis(0)}; }
    static RestartDecision wait(Millis delay) { return {RestartAction::Wait, delay}; }
    static RestartDecision give_up() { return {RestartAction::GiveUp, Millis(0)}; }
};

/**
 * RestartPolicy - 崩溃后的重启决策（无副作用）
 *
 * 退避：delay = backoff_base * 2^restart_count
 * restart_count >= max_restarts 时放弃，进程进入 terminal 状态。
 *
 * 例：max_restarts=3, backoff_base=60s → 60s, 120s, 240s, give_up
 */
class RestartPolicy {
public:
    static RestartDecision decide(const WorkerProcess& process, const WorkerRole& role);

    /**
     * 第 restart_count 次重启前的退避时长（指数被钳制，不会溢出）
     */
    static Millis backoff_for(const WorkerRole& role, int restart_count);
};

} // namespace agentsup
