#ifndef TXKV_LOCK_MANAGER_HPP
#define TXKV_LOCK_MANAGER_HPP

#include "../txkv_core.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace txkv {

enum class LockStatus {
    GRANTED = 0,
    TIMED_OUT = 1,
    DEADLOCK = 2,
    CANCELLED = 3
};

// 死锁受害者选择策略
enum class DeadlockVictimPolicy {
    YOUNGEST = 0,   // 环中事务ID最大的事务
    REQUESTER = 1   // 形成环的那次加锁请求所属事务
};

struct LockResult {
    LockStatus status = LockStatus::GRANTED;
    // 仅在 DEADLOCK 时有效，从发起请求的事务开始
    std::vector<WaitForEntry> cycle;

    bool granted() const { return status == LockStatus::GRANTED; }
};

// 可设置的最长锁等待时间（一年）
constexpr std::chrono::milliseconds MAX_LOCK_TIMEOUT = std::chrono::hours(24 * 365);

// 悲观事务的行级排他锁表，带超时与等待图死锁检测
class LockManager {
public:
    explicit LockManager(DeadlockVictimPolicy victim_policy = DeadlockVictimPolicy::YOUNGEST);
    ~LockManager() = default;

    // 禁止拷贝和移动
    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;
    LockManager(LockManager&&) = delete;
    LockManager& operator=(LockManager&&) = delete;

    // 阻塞直到获得锁、超时、被选为死锁受害者或被取消。
    // timeout <= 0 或超过 MAX_LOCK_TIMEOUT 表示不设超时。同一事务重复加锁直接返回 GRANTED。
    LockResult acquire(TransactionID tx_id, Key key, std::chrono::milliseconds timeout);

    // 不等待的加锁：键空闲或已由本事务持有时返回 true，不产生等待边
    bool tryAcquire(TransactionID tx_id, Key key);

    bool release(TransactionID tx_id, Key key);

    // 释放事务持有的全部锁并清除其等待边，返回释放的锁数量
    size_t releaseAll(TransactionID tx_id);

    // 唤醒事务正在进行的 acquire，使其返回 CANCELLED
    bool cancel(TransactionID tx_id);

    TransactionID getHolder(Key key) const;
    std::set<Key> getHeldKeys(TransactionID tx_id) const;
    bool isWaiting(TransactionID tx_id) const;
    std::vector<WaitForEntry> getWaitForEdges() const;
    size_t getLockCount() const;
    uint64_t getDeadlockCount() const;

    DeadlockVictimPolicy getVictimPolicy() const {
        return victim_policy_;
    }

private:
    struct LockEntry {
        TransactionID holder = NO_TX;
        size_t waiters = 0;
        std::condition_variable cv;
    };

    // 以下方法要求调用方已持有 latch_
    std::vector<WaitForEntry> findCycle(TransactionID start) const;
    TransactionID chooseVictim(TransactionID requester, const std::vector<WaitForEntry>& cycle) const;
    void grant(LockEntry& entry, TransactionID tx_id, Key key);
    bool releaseLocked(TransactionID tx_id, Key key);
    void eraseIfUnused(Key key);

    const DeadlockVictimPolicy victim_policy_;

    mutable std::mutex latch_;
    std::unordered_map<Key, LockEntry> lock_table_;
    std::unordered_map<TransactionID, std::set<Key>> held_locks_;
    // 等待图：每个事务同一时刻最多等待一个键，边的终点是该键当前的持有者
    std::unordered_map<TransactionID, Key> wait_for_;
    // 已被选为受害者但尚未醒来的事务
    std::unordered_map<TransactionID, std::vector<WaitForEntry>> victims_;
    std::unordered_set<TransactionID> cancelled_;
    uint64_t deadlock_count_ = 0;
};

} // namespace txkv

#endif // TXKV_LOCK_MANAGER_HPP
