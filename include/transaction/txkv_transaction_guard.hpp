#ifndef TXKV_TRANSACTION_GUARD_HPP
#define TXKV_TRANSACTION_GUARD_HPP

#include "txkv_transaction_coordinator.hpp"

namespace txkv {

// 事务作用域：离开作用域时若事务仍活跃则回滚
class TransactionGuard {
public:
    TransactionGuard(TransactionCoordinator& coordinator, TransactionConcurrency concurrency,
                     TransactionIsolationLevel isolation,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    TransactionID id() const { return tx_id_; }

    Record get(Key key) { return coordinator_.get(tx_id_, key); }
    void put(const Record& record) { coordinator_.put(tx_id_, record); }
    void commit() { coordinator_.commit(tx_id_); }
    bool rollback() { return coordinator_.rollback(tx_id_); }

    TransactionState state() const { return coordinator_.getState(tx_id_); }

private:
    TransactionCoordinator& coordinator_;
    TransactionID tx_id_;
};

} // namespace txkv

#endif // TXKV_TRANSACTION_GUARD_HPP
