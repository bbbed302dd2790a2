#ifndef TXKV_SCENARIO_HPP
#define TXKV_SCENARIO_HPP

#include "txkv_config.hpp"
#include "txkv_worker.hpp"
#include "storage/txkv_memory_store.h"
#include "transaction/txkv_lock_manager.hpp"
#include "transaction/txkv_optimistic_validator.hpp"
#include "transaction/txkv_transaction_coordinator.hpp"
#include <iostream>
#include <map>
#include <vector>

namespace txkv {

struct ScenarioReport {
    ScenarioMode mode = ScenarioMode::DEADLOCK_DETECTION;
    std::map<Key, Record> before;
    std::map<Key, Record> after;
    std::vector<WorkerResult> workers;
    uint64_t deadlocks = 0;
};

// 存款示例：初始化账户，运行工作者，打印前后账户快照
class DepositScenario {
public:
    explicit DepositScenario(const ScenarioConfig& config, std::ostream& out = std::cout);

    DepositScenario(const DepositScenario&) = delete;
    DepositScenario& operator=(const DepositScenario&) = delete;

    // 按配置中的模式运行
    ScenarioReport run();

    ScenarioReport runDeadlockDetection();
    ScenarioReport runDeadlockFree();
    ScenarioReport runPessimistic();

    // 账户 k 的初始余额为 k * 100
    static void initAccounts(IKeyValueStore& store, size_t entries);
    void printAccounts();

    IKeyValueStore& getStore() { return store_; }
    LockManager& getLockManager() { return lock_manager_; }
    TransactionCoordinator& getCoordinator() { return coordinator_; }

private:
    WorkerOptions makeOptions(const std::string& name, double amount, KeyOrder order) const;
    // 两个工作者并发地以相反顺序访问全部账户
    ScenarioReport runConcurrentDeposits(ScenarioMode mode, TransactionConcurrency concurrency,
                                         TransactionIsolationLevel isolation, bool retry);

    ScenarioConfig config_;
    std::ostream& out_;

    MemoryKeyValueStore store_;
    LockManager lock_manager_;
    OptimisticValidator validator_;
    TransactionCoordinator coordinator_;
};

} // namespace txkv

#endif // TXKV_SCENARIO_HPP
