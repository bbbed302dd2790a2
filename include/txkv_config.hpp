#pragma once

#include "txkv_core.hpp"
#include "transaction/txkv_lock_manager.hpp"
#include <chrono>
#include <string>

namespace txkv {

// 示例场景
enum class ScenarioMode {
    DEADLOCK_DETECTION = 0,   // 悲观事务反向加锁，检测并报告死锁
    DEADLOCK_FREE = 1,        // 乐观事务，冲突后重试直到提交
    PESSIMISTIC = 2           // 两个账户依次存款
};

struct ScenarioConfig {
    ScenarioMode mode = ScenarioMode::DEADLOCK_DETECTION;
    size_t entries = 10;
    std::chrono::milliseconds timeout{3000};
    std::chrono::milliseconds step_pause{10};
    std::chrono::milliseconds commit_pause{2000};
    DeadlockVictimPolicy victim_policy = DeadlockVictimPolicy::YOUNGEST;
    size_t max_attempts = 0;          // 乐观重试次数上限，0 表示不限
    std::string config_file;
    std::string log_level = "info";
    std::string log_file;             // 为空则不输出到文件
    bool show_help = false;
    bool show_version = false;
};

// 配置文件与命令行解析。非法取值抛出 std::invalid_argument
class ConfigParser {
public:
    // 读取 "key value" 格式的配置文件，# 开头为注释。文件无法打开时返回 false
    static bool loadConfigFile(const std::string& config_file, ScenarioConfig& config);

    // 先加载 -c 指定的配置文件，再用其余命令行参数覆盖
    static ScenarioConfig parseArguments(int argc, char* argv[]);

    // 设置单个配置项，未知的键返回 false
    static bool applyOption(const std::string& key, const std::string& value, ScenarioConfig& config);

    static bool parseMode(const std::string& str, ScenarioMode& mode);
    static bool parseVictimPolicy(const std::string& str, DeadlockVictimPolicy& policy);
    static std::string modeToString(ScenarioMode mode);
    static std::string victimPolicyToString(DeadlockVictimPolicy policy);
};

} // namespace txkv
