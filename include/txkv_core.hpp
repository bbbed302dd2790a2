#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <ostream>

namespace txkv {

// 基础类型定义
using Key = int64_t;
using Version = uint64_t;
using TransactionID = uint64_t;

const TransactionID NO_TX = 0;

// 事务并发模式
enum class TransactionConcurrency {
    PESSIMISTIC = 0,          // 悲观：写前加锁，冲突时阻塞
    OPTIMISTIC = 1            // 乐观：提交时校验版本，冲突时重试
};

// 事务隔离等级枚举
enum class TransactionIsolationLevel {
    READ_COMMITTED = 0,       // 读已提交：乐观模式下只校验写集合
    REPEATABLE_READ = 1,      // 可重复读：确保事务多次读取同一数据时得到相同结果
    SERIALIZABLE = 2          // 串行化：乐观模式下校验读写集合
};

// 事务状态
enum class TransactionState {
    ACTIVE = 0,
    COMMITTED = 1,
    ROLLED_BACK = 2,
    FAILED_DEADLOCK = 3,
    FAILED_TIMEOUT = 4,
    FAILED_CONFLICT = 5
};

// 等待图中的一条边：tx_id 等待 key，key 当前由 holder 持有
struct WaitForEntry {
    TransactionID tx_id;
    Key key;
    TransactionID holder;

    bool operator==(const WaitForEntry& other) const {
        return tx_id == other.tx_id && key == other.key && holder == other.holder;
    }
};

std::ostream& operator<<(std::ostream& os, TransactionState state);
std::ostream& operator<<(std::ostream& os, TransactionConcurrency concurrency);
std::ostream& operator<<(std::ostream& os, TransactionIsolationLevel isolation);
std::ostream& operator<<(std::ostream& os, const WaitForEntry& entry);

} // namespace txkv
