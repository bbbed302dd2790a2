#include "transaction/txkv_lock_manager.hpp"
#include "txkv_logger.hpp"
#include <algorithm>
using namespace std;

namespace txkv {

LockManager::LockManager(DeadlockVictimPolicy victim_policy)
    : victim_policy_(victim_policy) {
}

LockResult LockManager::acquire(TransactionID tx_id, Key key, chrono::milliseconds timeout) {
    unique_lock<mutex> lock(latch_);
    LockResult result;

    if (cancelled_.count(tx_id) > 0) {
        result.status = LockStatus::CANCELLED;
        return result;
    }

    LockEntry& entry = lock_table_[key];
    if (entry.holder == tx_id) {
        // 同一事务重入，不产生等待边
        return result;
    }
    if (entry.holder == NO_TX) {
        grant(entry, tx_id, key);
        return result;
    }

    // 记录等待边，并从新边的起点检测环
    wait_for_[tx_id] = key;
    entry.waiters++;
    TXKV_LOG_DEBUGF("tx {} waits for key {} held by tx {}", tx_id, key, entry.holder);

    vector<WaitForEntry> cycle = findCycle(tx_id);
    if (!cycle.empty()) {
        deadlock_count_++;
        TransactionID victim = chooseVictim(tx_id, cycle);
        TXKV_LOG_WARNINGF("deadlock detected on request of tx {} for key {}, victim is tx {}", tx_id, key, victim);
        if (victim == tx_id) {
            wait_for_.erase(tx_id);
            entry.waiters--;
            result.status = LockStatus::DEADLOCK;
            result.cycle = move(cycle);
            return result;
        }
        // 受害者正阻塞在另一个键上：摘掉它的等待边后唤醒它
        auto victim_wait = wait_for_.find(victim);
        if (victim_wait != wait_for_.end()) {
            Key victim_key = victim_wait->second;
            wait_for_.erase(victim_wait);
            victims_[victim] = move(cycle);
            lock_table_.at(victim_key).cv.notify_all();
        }
    }

    // 超过 MAX_LOCK_TIMEOUT 的超时按不限时处理，避免截止时间溢出
    const bool has_deadline = timeout.count() > 0 && timeout <= MAX_LOCK_TIMEOUT;
    const auto deadline = has_deadline ? chrono::steady_clock::now() + timeout : chrono::steady_clock::time_point();
    bool timed_out = false;
    while (true) {
        auto victim_it = victims_.find(tx_id);
        if (victim_it != victims_.end()) {
            result.status = LockStatus::DEADLOCK;
            result.cycle = move(victim_it->second);
            victims_.erase(victim_it);
            break;
        }
        if (cancelled_.count(tx_id) > 0) {
            result.status = LockStatus::CANCELLED;
            break;
        }
        if (entry.holder == NO_TX) {
            grant(entry, tx_id, key);
            break;
        }
        if (timed_out) {
            result.status = LockStatus::TIMED_OUT;
            TXKV_LOG_DEBUGF("tx {} timed out waiting for key {}", tx_id, key);
            break;
        }
        if (has_deadline) {
            timed_out = (entry.cv.wait_until(lock, deadline) == cv_status::timeout);
        } else {
            entry.cv.wait(lock);
        }
    }

    wait_for_.erase(tx_id);
    entry.waiters--;
    eraseIfUnused(key);
    return result;
}

bool LockManager::tryAcquire(TransactionID tx_id, Key key) {
    lock_guard<mutex> lock(latch_);
    if (cancelled_.count(tx_id) > 0) {
        return false;
    }
    auto it = lock_table_.find(key);
    if (it == lock_table_.end()) {
        grant(lock_table_[key], tx_id, key);
        return true;
    }
    if (it->second.holder == tx_id) {
        return true;
    }
    if (it->second.holder == NO_TX) {
        grant(it->second, tx_id, key);
        return true;
    }
    return false;
}

bool LockManager::release(TransactionID tx_id, Key key) {
    lock_guard<mutex> lock(latch_);
    return releaseLocked(tx_id, key);
}

size_t LockManager::releaseAll(TransactionID tx_id) {
    lock_guard<mutex> lock(latch_);
    size_t released = 0;
    auto held_it = held_locks_.find(tx_id);
    if (held_it != held_locks_.end()) {
        // releaseLocked 会修改集合，先拷贝
        set<Key> keys = held_it->second;
        for (Key key : keys) {
            if (releaseLocked(tx_id, key)) {
                released++;
            }
        }
    }
    held_locks_.erase(tx_id);
    wait_for_.erase(tx_id);
    victims_.erase(tx_id);
    cancelled_.erase(tx_id);
    TXKV_LOG_DEBUGF("tx {} released {} locks", tx_id, released);
    return released;
}

bool LockManager::cancel(TransactionID tx_id) {
    lock_guard<mutex> lock(latch_);
    auto wait_it = wait_for_.find(tx_id);
    bool known = wait_it != wait_for_.end() || held_locks_.find(tx_id) != held_locks_.end();
    if (!known) {
        return false;
    }
    cancelled_.insert(tx_id);
    if (wait_it != wait_for_.end()) {
        lock_table_.at(wait_it->second).cv.notify_all();
    }
    return true;
}

TransactionID LockManager::getHolder(Key key) const {
    lock_guard<mutex> lock(latch_);
    auto it = lock_table_.find(key);
    return it != lock_table_.end() ? it->second.holder : NO_TX;
}

set<Key> LockManager::getHeldKeys(TransactionID tx_id) const {
    lock_guard<mutex> lock(latch_);
    auto it = held_locks_.find(tx_id);
    return it != held_locks_.end() ? it->second : set<Key>();
}

bool LockManager::isWaiting(TransactionID tx_id) const {
    lock_guard<mutex> lock(latch_);
    return wait_for_.find(tx_id) != wait_for_.end();
}

vector<WaitForEntry> LockManager::getWaitForEdges() const {
    lock_guard<mutex> lock(latch_);
    vector<WaitForEntry> edges;
    edges.reserve(wait_for_.size());
    for (const auto& pair : wait_for_) {
        edges.push_back({pair.first, pair.second, lock_table_.at(pair.second).holder});
    }
    sort(edges.begin(), edges.end(), [](const WaitForEntry& a, const WaitForEntry& b) {
        return a.tx_id < b.tx_id;
    });
    return edges;
}

size_t LockManager::getLockCount() const {
    lock_guard<mutex> lock(latch_);
    size_t count = 0;
    for (const auto& pair : held_locks_) {
        count += pair.second.size();
    }
    return count;
}

uint64_t LockManager::getDeadlockCount() const {
    lock_guard<mutex> lock(latch_);
    return deadlock_count_;
}

// 每个事务至多一条出边，深度优先搜索退化为沿链行走
vector<WaitForEntry> LockManager::findCycle(TransactionID start) const {
    vector<WaitForEntry> path;
    unordered_set<TransactionID> visited{start};
    TransactionID current = start;
    while (true) {
        auto wait_it = wait_for_.find(current);
        if (wait_it == wait_for_.end()) {
            return {};
        }
        TransactionID holder = lock_table_.at(wait_it->second).holder;
        if (holder == NO_TX) {
            return {};
        }
        path.push_back({current, wait_it->second, holder});
        if (holder == start) {
            return path;
        }
        if (!visited.insert(holder).second) {
            // 环不经过 start，建环时已经处理过
            return {};
        }
        current = holder;
    }
}

TransactionID LockManager::chooseVictim(TransactionID requester, const vector<WaitForEntry>& cycle) const {
    if (victim_policy_ == DeadlockVictimPolicy::REQUESTER) {
        return requester;
    }
    TransactionID youngest = requester;
    for (const auto& edge : cycle) {
        youngest = max(youngest, edge.tx_id);
    }
    return youngest;
}

void LockManager::grant(LockEntry& entry, TransactionID tx_id, Key key) {
    entry.holder = tx_id;
    held_locks_[tx_id].insert(key);
    TXKV_LOG_DEBUGF("tx {} acquired lock on key {}", tx_id, key);
}

bool LockManager::releaseLocked(TransactionID tx_id, Key key) {
    auto it = lock_table_.find(key);
    if (it == lock_table_.end() || it->second.holder != tx_id) {
        return false;
    }
    it->second.holder = NO_TX;
    auto held_it = held_locks_.find(tx_id);
    if (held_it != held_locks_.end()) {
        held_it->second.erase(key);
        if (held_it->second.empty()) {
            held_locks_.erase(held_it);
        }
    }
    it->second.cv.notify_all();
    eraseIfUnused(key);
    return true;
}

void LockManager::eraseIfUnused(Key key) {
    auto it = lock_table_.find(key);
    if (it != lock_table_.end() && it->second.holder == NO_TX && it->second.waiters == 0) {
        lock_table_.erase(it);
    }
}

} // namespace txkv
