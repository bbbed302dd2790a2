#ifndef TXKV_WORKER_HPP
#define TXKV_WORKER_HPP

#include "txkv_core.hpp"
#include "transaction/txkv_transaction_coordinator.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace txkv {

enum class KeyOrder {
    ASCENDING = 0,
    DESCENDING = 1
};

struct WorkerOptions {
    std::string name = "worker";
    double amount = 100;
    KeyOrder order = KeyOrder::ASCENDING;
    Key first_key = 1;
    Key last_key = 10;
    std::chrono::milliseconds step_pause{10};       // 每个键之间的停顿
    std::chrono::milliseconds commit_pause{2000};   // 提交前的停顿
    TransactionConcurrency concurrency = TransactionConcurrency::PESSIMISTIC;
    TransactionIsolationLevel isolation = TransactionIsolationLevel::REPEATABLE_READ;
    std::chrono::milliseconds timeout{3000};
    bool retry = false;
    size_t max_attempts = 0;                        // 0 表示不限次数
};

struct WorkerResult {
    std::string name;
    bool committed = false;
    size_t attempts = 0;
    TransactionID last_tx_id = NO_TX;
    TransactionState final_state = TransactionState::ACTIVE;
    std::string failure_message;
    std::vector<WaitForEntry> deadlock_cycle;       // 最近一次死锁的等待环
};

// 在一个事务内依次给一组账户存款，冲突时按选项重试
class Worker {
public:
    Worker(TransactionCoordinator& coordinator, WorkerOptions options);

    WorkerResult run();

    // 按访问顺序排列的键
    std::vector<Key> getKeys() const;

    const WorkerOptions& getOptions() const { return options_; }

private:
    void runAttempt(WorkerResult& result);
    bool shouldRetry(const WorkerResult& result) const;

    TransactionCoordinator& coordinator_;
    WorkerOptions options_;
};

} // namespace txkv

#endif // TXKV_WORKER_HPP
