#pragma once

#include <string>
#include <chrono>
#include <vector>
#include "txkv_core.hpp"

namespace txkv {

// 工具函数
class Utils {
public:
    // 枚举与字符串互转
    static std::string concurrencyToString(TransactionConcurrency concurrency);
    static std::string isolationToString(TransactionIsolationLevel isolation);
    static std::string stateToString(TransactionState state);
    static bool stringToConcurrency(const std::string& str, TransactionConcurrency& out);
    static bool stringToIsolation(const std::string& str, TransactionIsolationLevel& out);

    // 将死锁环格式化为多行报告
    static std::string formatCycle(const std::vector<WaitForEntry>& cycle);

    // 格式化金额，整数金额不带小数部分
    static std::string formatAmount(double amount);

    // 检查字符串是否为数字
    static bool isNumeric(const std::string& str);

    // 字符串转整数，非法输入抛出 std::invalid_argument
    static int64_t stringToInt(const std::string& str);

    static std::string toLower(std::string str);
};

} // namespace txkv
