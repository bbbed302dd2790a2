#ifndef TXKV_TRANSACTION_COORDINATOR_HPP
#define TXKV_TRANSACTION_COORDINATOR_HPP

#include "../txkv_core.hpp"
#include "../txkv_record.hpp"
#include "../storage/txkv_kv_store.h"
#include "txkv_transaction.hpp"
#include "txkv_lock_manager.hpp"
#include "txkv_optimistic_validator.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace txkv {

// 事务协调器：按并发模式把读写路由到锁管理器或乐观校验器，并把冲突转换为异常。
// 每个事务只能由一个线程驱动，cancel 除外。
class TransactionCoordinator {
public:
    TransactionCoordinator(IKeyValueStore& store, LockManager& lock_manager, OptimisticValidator& validator);
    ~TransactionCoordinator();

    TransactionCoordinator(const TransactionCoordinator&) = delete;
    TransactionCoordinator& operator=(const TransactionCoordinator&) = delete;

    // 开始事务，timeout <= 0 表示加锁时不限时
    TransactionID begin(TransactionConcurrency concurrency, TransactionIsolationLevel isolation,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    // 读取记录副本。悲观模式先加锁，乐观模式先记录版本
    Record get(TransactionID tx_id, Key key);

    // 缓冲写入，提交时生效
    void put(TransactionID tx_id, const Record& record);

    void commit(TransactionID tx_id);

    // 回滚活跃事务；已结束的事务返回 false
    bool rollback(TransactionID tx_id);

    TransactionState getState(TransactionID tx_id) const;
    bool isActive(TransactionID tx_id) const;
    std::vector<TransactionID> getActiveTransactions() const;

    // 唤醒阻塞在加锁上的悲观事务，使其以 ROLLED_BACK 结束
    bool cancel(TransactionID tx_id);

    IKeyValueStore& getStore() { return store_; }

private:
    Transaction& getActiveTransaction(TransactionID tx_id);
    void acquireLock(Transaction& tx, Key key);
    std::vector<Key> lockWriteSet(Transaction& tx);
    // 释放资源并把事务移入已结束表，调用后 tx 不再可用
    void finish(TransactionID tx_id, TransactionState state);

    TransactionID nextTransactionId() {
        return transaction_id_generator_.fetch_add(1);
    }

    IKeyValueStore& store_;
    LockManager& lock_manager_;
    OptimisticValidator& validator_;

    std::atomic<TransactionID> transaction_id_generator_{1};

    mutable std::mutex transactions_mutex_;
    std::unordered_map<TransactionID, std::unique_ptr<Transaction>> active_transactions_;
    std::unordered_map<TransactionID, TransactionState> finished_transactions_;
};

} // namespace txkv

#endif // TXKV_TRANSACTION_COORDINATOR_HPP
