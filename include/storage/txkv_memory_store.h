#pragma once

#include "txkv_kv_store.h"
#include <unordered_map>
#include <mutex>
#include <shared_mutex>

namespace txkv {

// 基于哈希表的内存存储
class MemoryKeyValueStore : public IKeyValueStore {
private:
    // 使用读写锁保护数据访问
    mutable std::shared_mutex mutex_;
    std::unordered_map<Key, Record> data_;

public:
    MemoryKeyValueStore() = default;
    ~MemoryKeyValueStore() override = default;

    std::optional<Record> get(Key key) const override;
    void put(Key key, const Record& record) override;
    void putAll(const std::map<Key, Record>& records) override;
    bool del(Key key) override;
    bool exists(Key key) const override;

    void clear() override;
    size_t size() const override;
    std::vector<Key> getAllKeys() const override;
    std::map<Key, Record> snapshot() const override;

private:
    std::unique_lock<std::shared_mutex> wlock() const;
    std::shared_lock<std::shared_mutex> rlock() const;
};

} // namespace txkv
