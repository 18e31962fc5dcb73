#include "role_lock.hpp"
#include "process_probe.hpp"

#include <iostream>

namespace agentsup {

RoleLock::RoleLock(CoordinationStore& store, Millis stale_after, LivenessFn liveness, NowFn now)
    : store_(store),
      stale_after_(stale_after),
      liveness_(liveness ? std::move(liveness) : LivenessFn(is_process_alive)),
      now_(now ? std::move(now) : NowFn(wall_clock_ms)) {}

bool RoleLock::claim(const std::string& role_id, pid_t holder_pid) {
    TimestampMs now = now_();
    LockRecord record{role_id, holder_pid, now};

    if (store_.insert_lock(record)) {
        std::cout << "[RoleLock] Claimed " << role_id << " (pid " << holder_pid << ")" << std::endl;
        return true;
    }

    auto existing = store_.get_lock(role_id);
    if (!existing) {
        // 持有者恰好在两次调用之间释放
        if (store_.insert_lock(record)) {
            std::cout << "[RoleLock] Claimed " << role_id << " (pid " << holder_pid << ")" << std::endl;
            return true;
        }
        return false;
    }

    if (is_expired(*existing, stale_after_, now) && store_.replace_lock(*existing, record)) {
        std::cerr << "[RoleLock] StaleLockOrphaned: " << role_id
                  << " taken over from dead pid " << existing->holder_pid
                  << " by pid " << holder_pid << std::endl;
        return true;
    }

    std::cerr << "[RoleLock] Claim denied for " << role_id
              << ": held by pid " << existing->holder_pid << std::endl;
    return false;
}

bool RoleLock::release(const std::string& role_id, pid_t holder_pid) {
    bool released = store_.delete_lock(role_id, holder_pid);
    if (released) {
        std::cout << "[RoleLock] Released " << role_id << " (pid " << holder_pid << ")" << std::endl;
    }
    return released;
}

bool RoleLock::transfer(const std::string& role_id, pid_t from_pid, pid_t to_pid) {
    auto existing = store_.get_lock(role_id);
    if (!existing || existing->holder_pid != from_pid) {
        return false;
    }
    LockRecord replacement{role_id, to_pid, now_()};
    return store_.replace_lock(*existing, replacement);
}

int RoleLock::reclaim_stale(Millis max_age) {
    TimestampMs now = now_();
    int reclaimed = 0;

    for (const auto& lock : store_.list_locks()) {
        if (!is_expired(lock, max_age, now)) {
            continue;
        }
        if (store_.delete_lock(lock.role_id, lock.holder_pid)) {
            reclaimed++;
            std::cerr << "[RoleLock] StaleLockOrphaned: reclaimed " << lock.role_id
                      << " (dead pid " << lock.holder_pid << ", age "
                      << (now - lock.acquired_at) << "ms)" << std::endl;
        }
    }
    return reclaimed;
}

std::optional<LockRecord> RoleLock::holder(const std::string& role_id) {
    return store_.get_lock(role_id);
}

std::vector<LockRecord> RoleLock::list() {
    return store_.list_locks();
}

bool RoleLock::is_expired(const LockRecord& lock, Millis max_age, TimestampMs now) const {
    if (now - lock.acquired_at <= max_age.count()) {
        return false;
    }
    return !liveness_(lock.holder_pid);
}

} // namespace agentsup
