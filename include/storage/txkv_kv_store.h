#pragma once

#include "../txkv_core.hpp"
#include "../txkv_record.hpp"
#include <map>
#include <optional>
#include <vector>

namespace txkv {

// 存储接口基类，不提供任何事务语义，隔离性全部由事务层保证
class IKeyValueStore {
public:
    IKeyValueStore() = default;
    virtual ~IKeyValueStore() = default;

    // 禁止拷贝和移动
    IKeyValueStore(const IKeyValueStore&) = delete;
    IKeyValueStore& operator=(const IKeyValueStore&) = delete;
    IKeyValueStore(IKeyValueStore&&) = delete;
    IKeyValueStore& operator=(IKeyValueStore&&) = delete;

    // 返回记录副本，不存在时返回 std::nullopt
    virtual std::optional<Record> get(Key key) const = 0;
    virtual void put(Key key, const Record& record) = 0;
    // 作为一个整体写入，其他读者看不到中间状态
    virtual void putAll(const std::map<Key, Record>& records) = 0;
    virtual bool del(Key key) = 0;
    virtual bool exists(Key key) const = 0;

    // 容器操作
    virtual void clear() = 0;
    virtual size_t size() const = 0;
    // 按键升序返回
    virtual std::vector<Key> getAllKeys() const = 0;
    virtual std::map<Key, Record> snapshot() const = 0;
};

} // namespace txkv
