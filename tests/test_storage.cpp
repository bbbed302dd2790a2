#include <gtest/gtest.h>
#include "storage/txkv_memory_store.h"
#include "txkv_record.hpp"
#include "txkv_utils.hpp"
#include <thread>
#include <vector>

using namespace txkv;

// 测试账户记录
TEST(RecordTest, UpdateAndToString) {
    Record record(1, 100);
    EXPECT_EQ(record.getId(), 1);
    EXPECT_DOUBLE_EQ(record.getBalance(), 100);
    EXPECT_EQ(record.toString(), "Record [id=1, balance=$100]");

    record.update(200);
    EXPECT_DOUBLE_EQ(record.getBalance(), 300);

    // 负数表示取款
    record.update(-50.5);
    EXPECT_DOUBLE_EQ(record.getBalance(), 249.5);
    EXPECT_EQ(record.toString(), "Record [id=1, balance=$249.50]");
}

TEST(RecordTest, Equality) {
    EXPECT_EQ(Record(1, 100), Record(1, 100));
    EXPECT_NE(Record(1, 100), Record(2, 100));
    EXPECT_NE(Record(1, 100), Record(1, 200));
}

class MemoryStoreTest : public ::testing::Test {
protected:
    MemoryKeyValueStore store_;
};

TEST_F(MemoryStoreTest, PutAndGet) {
    EXPECT_FALSE(store_.get(1).has_value());

    store_.put(1, Record(1, 100));
    auto record = store_.get(1);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(*record, Record(1, 100));

    // 覆盖写
    store_.put(1, Record(1, 150));
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 150);
    EXPECT_EQ(store_.size(), 1u);
}

// 读出的是副本，修改副本不影响存储
TEST_F(MemoryStoreTest, GetReturnsCopy) {
    store_.put(1, Record(1, 100));
    Record copy = *store_.get(1);
    copy.update(1000);
    EXPECT_DOUBLE_EQ(store_.get(1)->getBalance(), 100);
}

TEST_F(MemoryStoreTest, DeleteAndExists) {
    store_.put(7, Record(7, 700));
    EXPECT_TRUE(store_.exists(7));
    EXPECT_TRUE(store_.del(7));
    EXPECT_FALSE(store_.exists(7));
    EXPECT_FALSE(store_.del(7));
}

TEST_F(MemoryStoreTest, PutAllAndSortedKeys) {
    std::map<Key, Record> records = {
        {3, Record(3, 300)},
        {1, Record(1, 100)},
        {2, Record(2, 200)},
    };
    store_.putAll(records);

    EXPECT_EQ(store_.getAllKeys(), (std::vector<Key>{1, 2, 3}));
    EXPECT_EQ(store_.snapshot(), records);

    store_.clear();
    EXPECT_EQ(store_.size(), 0u);
    EXPECT_TRUE(store_.getAllKeys().empty());
}

TEST_F(MemoryStoreTest, ConcurrentPuts) {
    const int num_threads = 4;
    const int per_thread = 250;
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < per_thread; i++) {
                Key key = t * per_thread + i;
                store_.put(key, Record(key, key));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(store_.size(), static_cast<size_t>(num_threads * per_thread));
}

// 工具函数
TEST(UtilsTest, EnumNames) {
    EXPECT_EQ(Utils::stateToString(TransactionState::FAILED_DEADLOCK), "FAILED_DEADLOCK");
    EXPECT_EQ(Utils::concurrencyToString(TransactionConcurrency::OPTIMISTIC), "OPTIMISTIC");
    EXPECT_EQ(Utils::isolationToString(TransactionIsolationLevel::REPEATABLE_READ), "REPEATABLE_READ");

    TransactionIsolationLevel isolation;
    EXPECT_TRUE(Utils::stringToIsolation("Serializable", isolation));
    EXPECT_EQ(isolation, TransactionIsolationLevel::SERIALIZABLE);
    EXPECT_FALSE(Utils::stringToIsolation("snapshot", isolation));

    TransactionConcurrency concurrency;
    EXPECT_TRUE(Utils::stringToConcurrency("pessimistic", concurrency));
    EXPECT_EQ(concurrency, TransactionConcurrency::PESSIMISTIC);
}

TEST(UtilsTest, FormatCycle) {
    std::vector<WaitForEntry> cycle = {{2, 5, 1}, {1, 6, 2}};
    EXPECT_EQ(Utils::formatCycle(cycle),
              "Deadlock detected:\n"
              "    tx 2 waits for key 5 held by tx 1\n"
              "    tx 1 waits for key 6 held by tx 2");
}

TEST(UtilsTest, Numbers) {
    EXPECT_TRUE(Utils::isNumeric("3000"));
    EXPECT_TRUE(Utils::isNumeric("-1"));
    EXPECT_FALSE(Utils::isNumeric("-"));
    EXPECT_FALSE(Utils::isNumeric("12a"));
    EXPECT_EQ(Utils::stringToInt("42"), 42);
    EXPECT_THROW(Utils::stringToInt("abc"), std::invalid_argument);
    EXPECT_EQ(Utils::formatAmount(100), "100");
    EXPECT_EQ(Utils::formatAmount(0.5), "0.50");
}
