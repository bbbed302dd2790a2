#include "txkv_config.hpp"
#include "txkv_scenario.hpp"
#include "txkv_logger.hpp"
#include <iostream>
#include <string>

namespace txkv {

// 打印帮助信息
void printHelp() {
    std::cout << "txkv - 键值存储事务冲突处理示例 v0.1\n" << std::endl;
    std::cout << "用法: txkv [选项]\n" << std::endl;
    std::cout << "选项:" << std::endl;
    std::cout << "  -m, --mode <mode>        运行的场景（deadlock-detection, deadlock-free, pessimistic，默认：deadlock-detection）" << std::endl;
    std::cout << "  -n, --entries <num>      账户数量（默认：10）" << std::endl;
    std::cout << "  -t, --timeout <ms>       悲观事务加锁超时，0 表示不限时（默认：3000）" << std::endl;
    std::cout << "      --step-pause <ms>    每个账户之间的停顿（默认：10）" << std::endl;
    std::cout << "      --commit-pause <ms>  提交前的停顿（默认：2000）" << std::endl;
    std::cout << "      --victim <policy>    死锁受害者策略（youngest, requester，默认：youngest）" << std::endl;
    std::cout << "      --max-attempts <num> 乐观事务最大尝试次数，0 表示不限（默认：0）" << std::endl;
    std::cout << "  -c, --config <file>      使用指定的配置文件" << std::endl;
    std::cout << "  -l, --log-level <level>  设置日志等级（debug, info, warning, error, critical, 默认：info）" << std::endl;
    std::cout << "  -f, --log-file <file>    设置日志文件路径" << std::endl;
    std::cout << "  -v, --version            显示版本信息" << std::endl;
    std::cout << "  -h, --help               显示帮助信息" << std::endl;
    std::cout << "\n示例:" << std::endl;
    std::cout << "  txkv                             # 悲观事务死锁检测" << std::endl;
    std::cout << "  txkv -m deadlock-free            # 乐观事务冲突重试" << std::endl;
    std::cout << "  txkv -m pessimistic              # 两个账户依次存款" << std::endl;
    std::cout << "  txkv -c txkv.conf                # 使用配置文件启动" << std::endl;
    std::cout << "  txkv -l debug -f txkv.log        # 启用调试日志并输出到文件" << std::endl;
}

// 打印版本信息
void printVersion() {
    std::cout << "txkv v0.1.0" << std::endl;
    std::cout << "基于C++17的事务冲突处理核心：悲观锁死锁检测与乐观校验重试" << std::endl;
}

} // namespace txkv

int main(int argc, char* argv[]) {
    using namespace txkv;

    auto& logger = Logger::getInstance();

    ScenarioConfig config;
    try {
        config = ConfigParser::parseArguments(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "错误: " << e.what() << std::endl;
        std::cerr << "使用 -h 或 --help 查看帮助信息" << std::endl;
        return 1;
    }

    if (config.show_help) {
        printHelp();
        return 0;
    }

    if (config.show_version) {
        printVersion();
        return 0;
    }

    LogLevel level = LogLevel::INFO;
    if (Logger::parseLogLevel(config.log_level, level)) {
        logger.setLogLevel(level);
    }

    if (!config.log_file.empty()) {
        if (logger.setLogFile(config.log_file)) {
            TXKV_LOG_INFO("日志文件已设置为: ", config.log_file);
        } else {
            TXKV_LOG_ERROR("无法打开日志文件: ", config.log_file);
        }
    }

    TXKV_LOG_INFO("场景: ", ConfigParser::modeToString(config.mode), ", 账户数量: ", config.entries,
                  ", 超时: ", config.timeout.count(), " ms, 死锁受害者策略: ",
                  ConfigParser::victimPolicyToString(config.victim_policy));

    int exit_code = 0;
    try {
        DepositScenario scenario(config);
        ScenarioReport report = scenario.run();
        for (const auto& result : report.workers) {
            TXKV_LOG_INFOF("[{}] committed: {}, attempts: {}, final state: {}", result.name,
                           result.committed ? "yes" : "no", result.attempts, result.final_state);
        }
        if (report.deadlocks > 0) {
            TXKV_LOG_INFO("检测到死锁次数: ", report.deadlocks);
        }
    } catch (const std::exception& e) {
        TXKV_LOG_CRITICAL("场景运行失败: ", e.what());
        exit_code = 1;
    }

    logger.closeLogFile();
    return exit_code;
}
