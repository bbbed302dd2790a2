#ifndef TXKV_EXCEPTION_HPP
#define TXKV_EXCEPTION_HPP

#include "txkv_core.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace txkv {

// 事务异常基类
class TransactionException : public std::runtime_error {
public:
    TransactionException(TransactionID tx_id, const std::string& message)
        : std::runtime_error(message), tx_id_(tx_id) {}

    TransactionID getTransactionId() const { return tx_id_; }

private:
    TransactionID tx_id_;
};

// 事务被选为死锁受害者，所有锁已释放
class TransactionDeadlockException : public TransactionException {
public:
    TransactionDeadlockException(TransactionID tx_id, std::vector<WaitForEntry> cycle);

    const std::vector<WaitForEntry>& getCycle() const { return cycle_; }

private:
    std::vector<WaitForEntry> cycle_;
};

class TransactionTimeoutException : public TransactionException {
public:
    TransactionTimeoutException(TransactionID tx_id, Key key, std::chrono::milliseconds timeout);

    Key getKey() const { return key_; }
    std::chrono::milliseconds getTimeout() const { return timeout_; }

private:
    Key key_;
    std::chrono::milliseconds timeout_;
};

// 乐观事务提交时校验失败
class TransactionOptimisticException : public TransactionException {
public:
    TransactionOptimisticException(TransactionID tx_id, std::vector<Key> conflicting_keys);

    const std::vector<Key>& getConflictingKeys() const { return conflicting_keys_; }

private:
    std::vector<Key> conflicting_keys_;
};

class KeyNotFoundException : public TransactionException {
public:
    KeyNotFoundException(TransactionID tx_id, Key key);

    Key getKey() const { return key_; }

private:
    Key key_;
};

} // namespace txkv

#endif // TXKV_EXCEPTION_HPP
