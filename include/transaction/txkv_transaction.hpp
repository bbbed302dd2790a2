#ifndef TXKV_TRANSACTION_HPP
#define TXKV_TRANSACTION_HPP
#include "../txkv_core.hpp"
#include "../txkv_record.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <set>

namespace txkv {

class Transaction {
public:
    Transaction(TransactionID transaction_id, TransactionConcurrency concurrency,
                TransactionIsolationLevel isolation, std::chrono::milliseconds timeout);
    ~Transaction();

    TransactionID getId() const { return transaction_id_; }
    TransactionConcurrency getConcurrency() const { return concurrency_; }
    TransactionIsolationLevel getIsolation() const { return isolation_; }
    std::chrono::milliseconds getTimeout() const { return timeout_; }

    TransactionState getState() const { return state_; }
    void setState(TransactionState state) { state_ = state; }

    // 本地副本：写集合优先，其次是读缓存
    std::optional<Record> findLocal(Key key) const;
    void cacheRead(const Record& record);
    void bufferWrite(const Record& record);

    void addHeldLock(Key key);
    bool holdsLock(Key key) const;
    void clearHeldLocks();

    const std::map<Key, Record>& getWriteSet() const { return write_set_; }
    const std::set<Key>& getHeldLocks() const { return held_locks_; }

private:
    TransactionID transaction_id_;
    TransactionConcurrency concurrency_;
    TransactionIsolationLevel isolation_;
    std::chrono::milliseconds timeout_;          // <= 0 表示不限时
    TransactionState state_ = TransactionState::ACTIVE;
    std::map<Key, Record> write_set_;            // 提交前缓冲的写入
    std::map<Key, Record> read_cache_;
    std::set<Key> held_locks_;                   // 悲观模式下已获得的锁
};

} // namespace txkv

#endif // TXKV_TRANSACTION_HPP
