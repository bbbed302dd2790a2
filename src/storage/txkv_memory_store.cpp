#include "storage/txkv_memory_store.h"
#include <algorithm>
#include <mutex>

namespace txkv {

std::optional<Record> MemoryKeyValueStore::get(Key key) const {
    auto lock = rlock();
    auto it = data_.find(key);
    if (it != data_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void MemoryKeyValueStore::put(Key key, const Record& record) {
    auto lock = wlock();
    data_.insert_or_assign(key, record);
}

void MemoryKeyValueStore::putAll(const std::map<Key, Record>& records) {
    auto lock = wlock();
    for (const auto& pair : records) {
        data_.insert_or_assign(pair.first, pair.second);
    }
}

bool MemoryKeyValueStore::del(Key key) {
    auto lock = wlock();
    return data_.erase(key) > 0;
}

bool MemoryKeyValueStore::exists(Key key) const {
    auto lock = rlock();
    return data_.find(key) != data_.end();
}

// 容器操作
void MemoryKeyValueStore::clear() {
    auto lock = wlock();
    data_.clear();
}

size_t MemoryKeyValueStore::size() const {
    auto lock = rlock();
    return data_.size();
}

std::vector<Key> MemoryKeyValueStore::getAllKeys() const {
    std::vector<Key> keys;
    {
        auto lock = rlock();
        keys.reserve(data_.size());
        for (const auto& pair : data_) {
            keys.push_back(pair.first);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::map<Key, Record> MemoryKeyValueStore::snapshot() const {
    auto lock = rlock();
    return std::map<Key, Record>(data_.begin(), data_.end());
}

// 锁操作方法
std::unique_lock<std::shared_mutex> MemoryKeyValueStore::wlock() const {
    return std::unique_lock<std::shared_mutex>(mutex_);
}

std::shared_lock<std::shared_mutex> MemoryKeyValueStore::rlock() const {
    return std::shared_lock<std::shared_mutex>(mutex_);
}

} // namespace txkv
