#ifndef TXKV_OPTIMISTIC_VALIDATOR_HPP
#define TXKV_OPTIMISTIC_VALIDATOR_HPP

#include "../txkv_core.hpp"
#include "../txkv_record.hpp"
#include "../storage/txkv_kv_store.h"
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace txkv {

enum class ValidationStatus {
    COMMITTED = 0,
    CONFLICT = 1
};

struct ValidationResult {
    ValidationStatus status = ValidationStatus::COMMITTED;
    std::vector<Key> conflicting_keys;
    Version commit_version = 0;

    bool committed() const { return status == ValidationStatus::COMMITTED; }
};

// 乐观并发控制：记录每个事务首次接触各键时的版本，提交时校验并原子地写回存储
class OptimisticValidator {
public:
    explicit OptimisticValidator(IKeyValueStore& store);
    ~OptimisticValidator() = default;

    // 禁止拷贝和移动
    OptimisticValidator(const OptimisticValidator&) = delete;
    OptimisticValidator& operator=(const OptimisticValidator&) = delete;
    OptimisticValidator(OptimisticValidator&&) = delete;
    OptimisticValidator& operator=(OptimisticValidator&&) = delete;

    void begin(TransactionID tx_id, TransactionIsolationLevel isolation);

    // 返回该键在本事务中的快照版本。未 begin 的事务抛出 std::out_of_range
    Version recordRead(TransactionID tx_id, Key key);
    void recordWrite(TransactionID tx_id, Key key, const Record& value);

    // 校验通过则写回写集合并提升版本，失败时不做任何修改。两种情况下都结束对该事务的跟踪
    ValidationResult validate(TransactionID tx_id);

    // 不经校验直接写回并提升版本，供已持有排他锁的悲观事务提交。
    // 正在跟踪这些键的乐观事务随后校验失败。返回提交版本，写集合为空时不提升
    Version applyWrites(const std::map<Key, Record>& writes);

    bool discard(TransactionID tx_id);

    Version getVersion(Key key) const;
    Version getGlobalVersion() const;
    bool isTracking(TransactionID tx_id) const;
    size_t getTrackedCount() const;

private:
    struct TransactionTracking {
        TransactionIsolationLevel isolation = TransactionIsolationLevel::SERIALIZABLE;
        std::map<Key, Version> snapshot_versions;
        std::set<Key> read_set;
        std::map<Key, Record> write_set;
    };

    // 要求调用方持有 commit_latch_
    Version applyLocked(const std::map<Key, Record>& writes);
    Version currentVersion(Key key) const;
    void snapshotIfAbsent(TransactionTracking& tracking, Key key) const;

    IKeyValueStore& store_;

    // 锁顺序：commit_latch_ -> tracking_mutex_
    mutable std::shared_mutex commit_latch_;
    std::unordered_map<Key, Version> key_versions_;
    Version global_version_ = 0;

    mutable std::mutex tracking_mutex_;
    std::unordered_map<TransactionID, TransactionTracking> tracking_;
};

} // namespace txkv

#endif // TXKV_OPTIMISTIC_VALIDATOR_HPP
