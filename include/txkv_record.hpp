#pragma once

#include "txkv_core.hpp"
#include <string>
#include <ostream>

namespace txkv {

// 账户记录，事务冲突的最小单位
class Record {
public:
    Record() = default;
    Record(Key id, double balance) : id_(id), balance_(balance) {}

    Key getId() const { return id_; }
    double getBalance() const { return balance_; }

    // 按金额调整余额（可以为负数）
    void update(double amount) { balance_ += amount; }

    std::string toString() const;

    bool operator==(const Record& other) const {
        return id_ == other.id_ && balance_ == other.balance_;
    }
    bool operator!=(const Record& other) const { return !(*this == other); }

private:
    Key id_ = 0;
    double balance_ = 0.0;
};

inline std::ostream& operator<<(std::ostream& os, const Record& record) {
    return os << record.toString();
}

} // namespace txkv
