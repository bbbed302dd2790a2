#include "txkv_utils.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <stdexcept>
#include <unordered_map>

namespace txkv {

std::string Utils::concurrencyToString(TransactionConcurrency concurrency) {
    switch (concurrency) {
        case TransactionConcurrency::PESSIMISTIC:
            return "PESSIMISTIC";
        case TransactionConcurrency::OPTIMISTIC:
            return "OPTIMISTIC";
    }
    return "UNKNOWN";
}

std::string Utils::isolationToString(TransactionIsolationLevel isolation) {
    switch (isolation) {
        case TransactionIsolationLevel::READ_COMMITTED:
            return "READ_COMMITTED";
        case TransactionIsolationLevel::REPEATABLE_READ:
            return "REPEATABLE_READ";
        case TransactionIsolationLevel::SERIALIZABLE:
            return "SERIALIZABLE";
    }
    return "UNKNOWN";
}

std::string Utils::stateToString(TransactionState state) {
    static const std::unordered_map<int, std::string> state_map = {
        {static_cast<int>(TransactionState::ACTIVE), "ACTIVE"},
        {static_cast<int>(TransactionState::COMMITTED), "COMMITTED"},
        {static_cast<int>(TransactionState::ROLLED_BACK), "ROLLED_BACK"},
        {static_cast<int>(TransactionState::FAILED_DEADLOCK), "FAILED_DEADLOCK"},
        {static_cast<int>(TransactionState::FAILED_TIMEOUT), "FAILED_TIMEOUT"},
        {static_cast<int>(TransactionState::FAILED_CONFLICT), "FAILED_CONFLICT"},
    };

    auto it = state_map.find(static_cast<int>(state));
    return (it != state_map.end()) ? it->second : "UNKNOWN";
}

bool Utils::stringToConcurrency(const std::string& str, TransactionConcurrency& out) {
    std::string lower = toLower(str);
    if (lower == "pessimistic") {
        out = TransactionConcurrency::PESSIMISTIC;
    } else if (lower == "optimistic") {
        out = TransactionConcurrency::OPTIMISTIC;
    } else {
        return false;
    }
    return true;
}

bool Utils::stringToIsolation(const std::string& str, TransactionIsolationLevel& out) {
    std::string lower = toLower(str);
    if (lower == "read_committed") {
        out = TransactionIsolationLevel::READ_COMMITTED;
    } else if (lower == "repeatable_read") {
        out = TransactionIsolationLevel::REPEATABLE_READ;
    } else if (lower == "serializable") {
        out = TransactionIsolationLevel::SERIALIZABLE;
    } else {
        return false;
    }
    return true;
}

std::string Utils::formatCycle(const std::vector<WaitForEntry>& cycle) {
    std::stringstream ss;
    ss << "Deadlock detected:";
    for (const auto& entry : cycle) {
        ss << "\n    " << entry;
    }
    return ss.str();
}

std::string Utils::formatAmount(double amount) {
    std::stringstream ss;
    if (std::floor(amount) == amount) {
        ss << static_cast<int64_t>(amount);
    } else {
        ss << std::fixed << std::setprecision(2) << amount;
    }
    return ss.str();
}

bool Utils::isNumeric(const std::string& str) {
    if (str.empty()) {
        return false;
    }

    // 允许一个前导负号
    size_t start = (str[0] == '-') ? 1 : 0;
    if (start == str.length()) {
        return false;
    }

    return std::all_of(str.begin() + start, str.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

int64_t Utils::stringToInt(const std::string& str) {
    if (!isNumeric(str)) {
        throw std::invalid_argument("not an integer: " + str);
    }
    return std::stoll(str);
}

std::string Utils::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::ostream& operator<<(std::ostream& os, TransactionState state) {
    return os << Utils::stateToString(state);
}

std::ostream& operator<<(std::ostream& os, TransactionConcurrency concurrency) {
    return os << Utils::concurrencyToString(concurrency);
}

std::ostream& operator<<(std::ostream& os, TransactionIsolationLevel isolation) {
    return os << Utils::isolationToString(isolation);
}

std::ostream& operator<<(std::ostream& os, const WaitForEntry& entry) {
    return os << "tx " << entry.tx_id << " waits for key " << entry.key
              << " held by tx " << entry.holder;
}

} // namespace txkv
