#pragma once

#include <optional>
#include <string>
#include <vector>

#include "coordination_store.hpp"
#include "types.hpp"

namespace agentsup {

/**
 * RoleLock - 每个角色最多一个存活进程的互斥声明
 *
 * 锁记录保存在 CoordinationStore 中，因此跨监督进程实例同样有效。
 * 声明失败立即返回（fail-fast，不排队）。
 *
 * 过期定义：持有者进程已确认不在运行，且锁的年龄超过 stale_after。
 * 存活进程持有的锁无论多旧都不会被回收。
 */
class RoleLock {
public:
    /**
     * @param store 协调存储
     * @param stale_after 过期锁的最小年龄
     * @param liveness 进程存活探测（默认 is_process_alive）
     * @param now 时钟（默认 wall_clock_ms）
     */
    RoleLock(CoordinationStore& store,
             Millis stale_after,
             LivenessFn liveness = {},
             NowFn now = {});

    /**
     * 声明角色
     * @return true 如果声明成功
     */
    bool claim(const std::string& role_id, pid_t holder_pid);

    /**
     * 释放角色（仅当 holder_pid 当前持有该锁）
     */
    bool release(const std::string& role_id, pid_t holder_pid);

    /**
     * 将锁转交给另一个进程（例如刚派生的 worker）
     */
    bool transfer(const std::string& role_id, pid_t from_pid, pid_t to_pid);

    /**
     * 回收持有者已死亡且年龄超过 max_age 的锁
     * @return 回收数量
     */
    int reclaim_stale(Millis max_age);

    std::optional<LockRecord> holder(const std::string& role_id);

    std::vector<LockRecord> list();

private:
    bool is_expired(const LockRecord& lock, Millis max_age, TimestampMs now) const;

    CoordinationStore& store_;
    Millis stale_after_;
    LivenessFn liveness_;
    NowFn now_;
};

} // namespace agentsup
