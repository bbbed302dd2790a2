#include <gtest/gtest.h>
#include "transaction/txkv_transaction_coordinator.hpp"
#include "transaction/txkv_transaction_guard.hpp"
#include "storage/txkv_memory_store.h"
#include "txkv_exception.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <thread>

using namespace txkv;
using namespace std::chrono_literals;

namespace {

bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds limit = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

} // namespace

class TransactionCoordinatorTest : public ::testing::Test {
protected:
    MemoryKeyValueStore store_;
    LockManager lock_manager_;
    OptimisticValidator validator_{store_};
    TransactionCoordinator coordinator_{store_, lock_manager_, validator_};

    void SetUp() override {
        for (Key key = 1; key <= 3; key++) {
            store_.put(key, Record(key, key * 100));
        }
    }

    TransactionID beginPessimistic(std::chrono::milliseconds timeout = 0ms) {
        return coordinator_.begin(TransactionConcurrency::PESSIMISTIC,
                                  TransactionIsolationLevel::REPEATABLE_READ, timeout);
    }

    TransactionID beginOptimistic() {
        return coordinator_.begin(TransactionConcurrency::OPTIMISTIC, TransactionIsolationLevel::SERIALIZABLE);
    }

    void deposit(TransactionID tx, Key key, double amount) {
        Record record = coordinator_.get(tx, key);
        record.update(amount);
        coordinator_.put(tx, record);
    }
};

// 悲观事务提交前存储不变，提交后整体生效且不留锁
TEST_F(TransactionCoordinatorTest, PessimisticCommitIsAtomic) {
    TransactionID tx = beginPessimistic();
    deposit(tx, 1, 50);
    deposit(tx, 2, 50);

    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 100);
    EXPECT_EQ(lock_manager_.getHeldKeys(tx), (std::set<Key>{1, 2}));

    coordinator_.commit(tx);
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 150);
    EXPECT_DOUBLE_EQ(store_.get(2)->getBalance(), 250);
    EXPECT_EQ(lock_manager_.getLockCount(), 0u);
    EXPECT_EQ(coordinator_.getState(tx), TransactionState::COMMITTED);
    EXPECT_FALSE(coordinator_.isActive(tx));
}

// 事务内读取返回本地副本
TEST_F(TransactionCoordinatorTest, ReadYourOwnWrites) {
    TransactionID tx = beginOptimistic();
    deposit(tx, 1, 10);
    deposit(tx, 1, 10);
    EXPECT_DOUBLE_EQ(coordinator_.get(tx, 1).getBalance(), 120);
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 100);

    coordinator_.commit(tx);
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 120);
}

TEST_F(TransactionCoordinatorTest, RollbackDiscardsWrites) {
    TransactionID pessimistic = beginPessimistic();
    TransactionID optimistic = beginOptimistic();
    deposit(pessimistic, 1, 500);
    deposit(optimistic, 2, 500);

    EXPECT_TRUE(coordinator_.rollback(pessimistic));
    EXPECT_TRUE(coordinator_.rollback(optimistic));
    EXPECT_FALSE(coordinator_.rollback(pessimistic));

    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 100);
    EXPECT_DOUBLE_EQ(store_.get(2)->getBalance(), 200);
    EXPECT_EQ(lock_manager_.getLockCount(), 0u);
    EXPECT_EQ(validator_.getTrackedCount(), 0u);
    EXPECT_EQ(coordinator_.getState(pessimistic), TransactionState::ROLLED_BACK);
}

TEST_F(TransactionCoordinatorTest, MissingKeyThrows) {
    TransactionID tx = beginPessimistic();
    try {
        coordinator_.get(tx, 99);
        FAIL() << "expected KeyNotFoundException";
    } catch (const KeyNotFoundException& e) {
        EXPECT_EQ(e.getKey(), 99);
        EXPECT_EQ(e.getTransactionId(), tx);
    }
    EXPECT_TRUE(coordinator_.isActive(tx));
    coordinator_.rollback(tx);
}

TEST_F(TransactionCoordinatorTest, UnknownAndFinishedTransactionsThrow) {
    EXPECT_THROW(coordinator_.get(12345, 1), TransactionException);
    EXPECT_THROW(coordinator_.getState(12345), TransactionException);
    EXPECT_THROW(coordinator_.rollback(12345), TransactionException);

    TransactionID tx = beginOptimistic();
    coordinator_.commit(tx);
    EXPECT_THROW(coordinator_.get(tx, 1), TransactionException);
    EXPECT_THROW(coordinator_.put(tx, Record(1, 0)), TransactionException);
    EXPECT_THROW(coordinator_.commit(tx), TransactionException);
}

TEST_F(TransactionCoordinatorTest, PessimisticTimeout) {
    TransactionID holder = beginPessimistic();
    coordinator_.get(holder, 1);

    TransactionID waiter = beginPessimistic(50ms);
    deposit(waiter, 2, 10);
    try {
        coordinator_.get(waiter, 1);
        FAIL() << "expected TransactionTimeoutException";
    } catch (const TransactionTimeoutException& e) {
        EXPECT_EQ(e.getKey(), 1);
        EXPECT_EQ(e.getTimeout(), 50ms);
    }

    EXPECT_EQ(coordinator_.getState(waiter), TransactionState::FAILED_TIMEOUT);
    EXPECT_TRUE(lock_manager_.getHeldKeys(waiter).empty());
    EXPECT_EQ(lock_manager_.getHolder(2), NO_TX);

    coordinator_.commit(holder);
    EXPECT_DOUBLE_EQ(store_.get(2)->getBalance(), 200);
}

// 反向加锁：一个事务提交，另一个以死锁失败，不会挂起
TEST_F(TransactionCoordinatorTest, OppositeOrderDeadlockResolves) {
    TransactionID older = beginPessimistic(5000ms);
    TransactionID younger = beginPessimistic(5000ms);
    deposit(older, 1, 100);
    deposit(younger, 2, 200);

    auto older_result = std::async(std::launch::async, [this, older]() {
        deposit(older, 2, 100);
        coordinator_.commit(older);
    });
    ASSERT_TRUE(waitUntil([this, older]() { return lock_manager_.isWaiting(older); }));

    try {
        deposit(younger, 1, 200);
        FAIL() << "expected TransactionDeadlockException";
    } catch (const TransactionDeadlockException& e) {
        EXPECT_EQ(e.getTransactionId(), younger);
        ASSERT_EQ(e.getCycle().size(), 2u);
        EXPECT_EQ(e.getCycle()[0], (WaitForEntry{younger, 1, older}));
        EXPECT_EQ(e.getCycle()[1], (WaitForEntry{older, 2, younger}));
    }

    older_result.get();
    EXPECT_EQ(coordinator_.getState(younger), TransactionState::FAILED_DEADLOCK);
    EXPECT_EQ(coordinator_.getState(older), TransactionState::COMMITTED);
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 200);
    EXPECT_DOUBLE_EQ(store_.get(2)->getBalance(), 300);
    EXPECT_EQ(lock_manager_.getLockCount(), 0u);
}

// 乐观冲突后存储等于冲突前快照
TEST_F(TransactionCoordinatorTest, OptimisticConflictLeavesStoreUntouched) {
    TransactionID first = beginOptimistic();
    TransactionID second = beginOptimistic();
    deposit(first, 1, 100);
    deposit(second, 1, 200);
    deposit(second, 3, 200);

    coordinator_.commit(first);
    auto before = store_.snapshot();

    try {
        coordinator_.commit(second);
        FAIL() << "expected TransactionOptimisticException";
    } catch (const TransactionOptimisticException& e) {
        EXPECT_EQ(e.getConflictingKeys(), std::vector<Key>{1});
    }
    EXPECT_EQ(coordinator_.getState(second), TransactionState::FAILED_CONFLICT);
    EXPECT_EQ(store_.snapshot(), before);
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 200);
}

TEST_F(TransactionCoordinatorTest, DisjointOptimisticTransactionsCommit) {
    TransactionID first = beginOptimistic();
    TransactionID second = beginOptimistic();
    deposit(first, 1, 1);
    deposit(second, 2, 2);
    EXPECT_NO_THROW(coordinator_.commit(second));
    EXPECT_NO_THROW(coordinator_.commit(first));
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 101);
    EXPECT_DOUBLE_EQ(store_.get(2)->getBalance(), 202);
}

// 悲观提交提升版本：提交前读过该键的乐观事务校验失败，重试后两笔存款都生效
TEST_F(TransactionCoordinatorTest, PessimisticCommitInvalidatesOptimisticRead) {
    TransactionID optimistic = beginOptimistic();
    EXPECT_DOUBLE_EQ(coordinator_.get(optimistic, 1).getBalance(), 100);

    TransactionID pessimistic = beginPessimistic();
    deposit(pessimistic, 1, 200);
    coordinator_.commit(pessimistic);
    EXPECT_EQ(validator_.getVersion(1), 1u);

    deposit(optimistic, 1, 100);
    EXPECT_THROW(coordinator_.commit(optimistic), TransactionOptimisticException);
    EXPECT_EQ(coordinator_.getState(optimistic), TransactionState::FAILED_CONFLICT);
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 300);

    TransactionID retry = beginOptimistic();
    deposit(retry, 1, 100);
    coordinator_.commit(retry);
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 400);
}

// 乐观事务不能写回被悲观事务锁住的键
TEST_F(TransactionCoordinatorTest, OptimisticCommitRejectsLockedKey) {
    TransactionID pessimistic = beginPessimistic();
    deposit(pessimistic, 1, 5);

    TransactionID optimistic = beginOptimistic();
    deposit(optimistic, 1, 1);
    deposit(optimistic, 2, 1);
    try {
        coordinator_.commit(optimistic);
        FAIL() << "expected TransactionOptimisticException";
    } catch (const TransactionOptimisticException& e) {
        EXPECT_EQ(e.getConflictingKeys(), std::vector<Key>{1});
    }
    EXPECT_EQ(coordinator_.getState(optimistic), TransactionState::FAILED_CONFLICT);
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 100);
    EXPECT_DOUBLE_EQ(store_.get(2)->getBalance(), 200);
    // 失败的乐观事务不留锁，悲观事务的锁不受影响
    EXPECT_EQ(lock_manager_.getHeldKeys(optimistic), std::set<Key>());
    EXPECT_EQ(lock_manager_.getHolder(1), pessimistic);
    EXPECT_EQ(validator_.getTrackedCount(), 0u);

    coordinator_.commit(pessimistic);
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 105);

    TransactionID retry = beginOptimistic();
    deposit(retry, 1, 1);
    coordinator_.commit(retry);
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 106);
    EXPECT_EQ(lock_manager_.getLockCount(), 0u);
}

// 两种模式并发存款，总额不丢失
TEST_F(TransactionCoordinatorTest, MixedModesKeepEveryDeposit) {
    const int rounds = 50;
    auto pessimistic_worker = std::async(std::launch::async, [this, rounds]() {
        for (int i = 0; i < rounds; i++) {
            TransactionID tx = beginPessimistic();
            deposit(tx, 1, 1);
            coordinator_.commit(tx);
        }
    });
    auto optimistic_worker = std::async(std::launch::async, [this, rounds]() {
        int committed = 0;
        while (committed < rounds) {
            TransactionID tx = beginOptimistic();
            try {
                deposit(tx, 1, 10);
                coordinator_.commit(tx);
                committed++;
            } catch (const TransactionOptimisticException&) {
                // 冲突后重试
            }
        }
    });
    pessimistic_worker.get();
    optimistic_worker.get();

    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 100 + rounds * 1 + rounds * 10);
    EXPECT_EQ(lock_manager_.getLockCount(), 0u);
    EXPECT_TRUE(coordinator_.getActiveTransactions().empty());
}

TEST_F(TransactionCoordinatorTest, CancelBlockedTransaction) {
    TransactionID holder = beginPessimistic();
    coordinator_.get(holder, 1);

    TransactionID waiter = beginPessimistic();
    auto blocked = std::async(std::launch::async, [this, waiter]() {
        coordinator_.get(waiter, 1);
    });
    ASSERT_TRUE(waitUntil([this, waiter]() { return lock_manager_.isWaiting(waiter); }));

    EXPECT_TRUE(coordinator_.cancel(waiter));
    EXPECT_THROW(blocked.get(), TransactionException);
    EXPECT_EQ(coordinator_.getState(waiter), TransactionState::ROLLED_BACK);

    // 乐观事务从不阻塞，没有可取消的等待
    TransactionID optimistic = beginOptimistic();
    EXPECT_FALSE(coordinator_.cancel(optimistic));
    coordinator_.rollback(optimistic);
    coordinator_.rollback(holder);
}

TEST_F(TransactionCoordinatorTest, ActiveTransactions) {
    TransactionID first = beginPessimistic();
    TransactionID second = beginOptimistic();
    EXPECT_EQ(coordinator_.getActiveTransactions(), (std::vector<TransactionID>{first, second}));
    EXPECT_EQ(coordinator_.getState(first), TransactionState::ACTIVE);

    coordinator_.rollback(first);
    EXPECT_EQ(coordinator_.getActiveTransactions(), std::vector<TransactionID>{second});
    coordinator_.commit(second);
    EXPECT_TRUE(coordinator_.getActiveTransactions().empty());
}

// 作用域结束时自动回滚
TEST_F(TransactionCoordinatorTest, GuardRollsBackOnScopeExit) {
    TransactionID id = NO_TX;
    {
        TransactionGuard tx(coordinator_, TransactionConcurrency::PESSIMISTIC,
                            TransactionIsolationLevel::REPEATABLE_READ);
        id = tx.id();
        Record record = tx.get(1);
        record.update(1000);
        tx.put(record);
        EXPECT_EQ(tx.state(), TransactionState::ACTIVE);
    }
    EXPECT_EQ(coordinator_.getState(id), TransactionState::ROLLED_BACK);
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 100);
    EXPECT_EQ(lock_manager_.getLockCount(), 0u);
}

TEST_F(TransactionCoordinatorTest, GuardKeepsCommittedState) {
    TransactionID id = NO_TX;
    {
        TransactionGuard tx(coordinator_, TransactionConcurrency::OPTIMISTIC,
                            TransactionIsolationLevel::SERIALIZABLE);
        id = tx.id();
        Record record = tx.get(3);
        record.update(-300);
        tx.put(record);
        tx.commit();
    }
    EXPECT_EQ(coordinator_.getState(id), TransactionState::COMMITTED);
    EXPECT_DOUBLE_EQ(store_.get(3)->getBalance(), 0);
}
