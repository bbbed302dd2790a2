#include "transaction/txkv_transaction_coordinator.hpp"
#include "txkv_exception.hpp"
#include "txkv_logger.hpp"
#include <algorithm>
using namespace std;

namespace txkv {

TransactionCoordinator::TransactionCoordinator(IKeyValueStore& store, LockManager& lock_manager,
                                               OptimisticValidator& validator)
    : store_(store), lock_manager_(lock_manager), validator_(validator) {
}

TransactionCoordinator::~TransactionCoordinator() {
}

TransactionID TransactionCoordinator::begin(TransactionConcurrency concurrency, TransactionIsolationLevel isolation,
                                            chrono::milliseconds timeout) {
    TransactionID txid = nextTransactionId();
    auto tx = make_unique<Transaction>(txid, concurrency, isolation, timeout);
    if (concurrency == TransactionConcurrency::OPTIMISTIC) {
        validator_.begin(txid, tx->getIsolation());
    }
    lock_guard<mutex> lock(transactions_mutex_);
    active_transactions_.emplace(txid, move(tx));
    TXKV_LOG_DEBUGF("tx {} started ({}, {}, timeout {} ms)", txid, concurrency, isolation, timeout.count());
    return txid;
}

Record TransactionCoordinator::get(TransactionID txid, Key key) {
    Transaction& tx = getActiveTransaction(txid);
    optional<Record> local = tx.findLocal(key);
    if (local) {
        return *local;
    }

    if (tx.getConcurrency() == TransactionConcurrency::PESSIMISTIC) {
        acquireLock(tx, key);
    } else {
        // 先取版本再读值：期间若有并发提交，校验时必然失败
        validator_.recordRead(txid, key);
    }

    optional<Record> record = store_.get(key);
    if (!record) {
        throw KeyNotFoundException(txid, key);
    }
    tx.cacheRead(*record);
    return *record;
}

void TransactionCoordinator::put(TransactionID txid, const Record& record) {
    Transaction& tx = getActiveTransaction(txid);
    if (tx.getConcurrency() == TransactionConcurrency::PESSIMISTIC) {
        acquireLock(tx, record.getId());
    } else {
        validator_.recordWrite(txid, record.getId(), record);
    }
    tx.bufferWrite(record);
}

void TransactionCoordinator::commit(TransactionID txid) {
    Transaction& tx = getActiveTransaction(txid);

    if (tx.getConcurrency() == TransactionConcurrency::PESSIMISTIC) {
        // 所有锁仍被持有，写集合整体落盘；经由校验器提升版本，使读过这些键的乐观事务失败
        Version version = validator_.applyWrites(tx.getWriteSet());
        finish(txid, TransactionState::COMMITTED);
        TXKV_LOG_DEBUGF("tx {} committed at version {}", txid, version);
        return;
    }

    // 校验期间锁住写集合，被其他事务持有的键视为冲突
    vector<Key> locked_keys = lockWriteSet(tx);
    if (!locked_keys.empty()) {
        finish(txid, TransactionState::FAILED_CONFLICT);
        TXKV_LOG_DEBUGF("tx {} conflicts on key {} locked by tx {}", txid, locked_keys.front(),
                        lock_manager_.getHolder(locked_keys.front()));
        throw TransactionOptimisticException(txid, move(locked_keys));
    }

    ValidationResult result = validator_.validate(txid);
    if (!result.committed()) {
        finish(txid, TransactionState::FAILED_CONFLICT);
        throw TransactionOptimisticException(txid, move(result.conflicting_keys));
    }
    finish(txid, TransactionState::COMMITTED);
    TXKV_LOG_DEBUGF("tx {} committed at version {}", txid, result.commit_version);
}

bool TransactionCoordinator::rollback(TransactionID txid) {
    {
        lock_guard<mutex> lock(transactions_mutex_);
        if (active_transactions_.find(txid) == active_transactions_.end()) {
            if (finished_transactions_.find(txid) != finished_transactions_.end()) {
                return false;
            }
            throw TransactionException(txid, "Transaction " + to_string(txid) + " not found");
        }
    }
    finish(txid, TransactionState::ROLLED_BACK);
    TXKV_LOG_DEBUGF("tx {} rolled back", txid);
    return true;
}

TransactionState TransactionCoordinator::getState(TransactionID txid) const {
    lock_guard<mutex> lock(transactions_mutex_);
    if (active_transactions_.find(txid) != active_transactions_.end()) {
        return TransactionState::ACTIVE;
    }
    auto it = finished_transactions_.find(txid);
    if (it == finished_transactions_.end()) {
        throw TransactionException(txid, "Transaction " + to_string(txid) + " not found");
    }
    return it->second;
}

bool TransactionCoordinator::isActive(TransactionID txid) const {
    lock_guard<mutex> lock(transactions_mutex_);
    return active_transactions_.find(txid) != active_transactions_.end();
}

vector<TransactionID> TransactionCoordinator::getActiveTransactions() const {
    lock_guard<mutex> lock(transactions_mutex_);
    vector<TransactionID> active_txids;
    active_txids.reserve(active_transactions_.size());
    for (const auto& pair : active_transactions_) {
        active_txids.push_back(pair.first);
    }
    sort(active_txids.begin(), active_txids.end());
    return active_txids;
}

bool TransactionCoordinator::cancel(TransactionID txid) {
    {
        lock_guard<mutex> lock(transactions_mutex_);
        auto it = active_transactions_.find(txid);
        if (it == active_transactions_.end() ||
            it->second->getConcurrency() != TransactionConcurrency::PESSIMISTIC) {
            return false;
        }
    }
    return lock_manager_.cancel(txid);
}

Transaction& TransactionCoordinator::getActiveTransaction(TransactionID txid) {
    lock_guard<mutex> lock(transactions_mutex_);
    auto it = active_transactions_.find(txid);
    if (it != active_transactions_.end()) {
        return *it->second;
    }
    if (finished_transactions_.find(txid) != finished_transactions_.end()) {
        throw TransactionException(txid, "Transaction " + to_string(txid) + " is already finished");
    }
    throw TransactionException(txid, "Transaction " + to_string(txid) + " not found");
}

void TransactionCoordinator::acquireLock(Transaction& tx, Key key) {
    if (tx.holdsLock(key)) {
        return;
    }
    const TransactionID txid = tx.getId();
    const chrono::milliseconds timeout = tx.getTimeout();

    LockResult result = lock_manager_.acquire(txid, key, timeout);
    switch (result.status) {
        case LockStatus::GRANTED:
            tx.addHeldLock(key);
            return;
        case LockStatus::DEADLOCK:
            finish(txid, TransactionState::FAILED_DEADLOCK);
            TXKV_LOG_WARNINGF("tx {} rolled back as deadlock victim while locking key {}", txid, key);
            throw TransactionDeadlockException(txid, move(result.cycle));
        case LockStatus::TIMED_OUT:
            finish(txid, TransactionState::FAILED_TIMEOUT);
            TXKV_LOG_WARNINGF("tx {} timed out after {} ms waiting for key {}", txid, timeout.count(), key);
            throw TransactionTimeoutException(txid, key, timeout);
        case LockStatus::CANCELLED:
            finish(txid, TransactionState::ROLLED_BACK);
            throw TransactionException(txid, "Transaction " + to_string(txid) + " was cancelled");
    }
    throw TransactionException(txid, "Unknown lock status for transaction " + to_string(txid));
}

// 按键升序不等待地锁住写集合，遇到被其他事务持有的键即停止并返回该键。
// 两个乐观事务同时提交时至少一方能锁住全部键
vector<Key> TransactionCoordinator::lockWriteSet(Transaction& tx) {
    for (const auto& pair : tx.getWriteSet()) {
        if (!lock_manager_.tryAcquire(tx.getId(), pair.first)) {
            return {pair.first};
        }
        tx.addHeldLock(pair.first);
    }
    return {};
}

void TransactionCoordinator::finish(TransactionID txid, TransactionState state) {
    unique_ptr<Transaction> tx;
    {
        lock_guard<mutex> lock(transactions_mutex_);
        auto it = active_transactions_.find(txid);
        if (it == active_transactions_.end()) {
            return;
        }
        tx = move(it->second);
        active_transactions_.erase(it);
        tx->setState(state);
        finished_transactions_[txid] = tx->getState();
    }

    // 乐观事务只在提交校验期间持锁
    if (tx->getConcurrency() == TransactionConcurrency::PESSIMISTIC || !tx->getHeldLocks().empty()) {
        lock_manager_.releaseAll(txid);
        tx->clearHeldLocks();
    }
    if (tx->getConcurrency() == TransactionConcurrency::OPTIMISTIC) {
        // validate 已经结束跟踪，这里只处理回滚
        validator_.discard(txid);
    }
}

} // namespace txkv
