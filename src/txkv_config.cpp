#include "txkv_config.hpp"
#include "txkv_logger.hpp"
#include "txkv_utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace txkv {

namespace {

int64_t parseNonNegative(const std::string& key, const std::string& value) {
    if (!Utils::isNumeric(value) || value[0] == '-') {
        throw std::invalid_argument("invalid value for " + key + ": " + value);
    }
    try {
        return Utils::stringToInt(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("value out of range for " + key + ": " + value);
    }
}

// 时长上限与锁等待上限一致
std::chrono::milliseconds parseMillis(const std::string& key, const std::string& value) {
    std::chrono::milliseconds millis(parseNonNegative(key, value));
    if (millis > MAX_LOCK_TIMEOUT) {
        throw std::invalid_argument("value out of range for " + key + ": " + value);
    }
    return millis;
}

} // namespace

bool ConfigParser::loadConfigFile(const std::string& config_file, ScenarioConfig& config) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        TXKV_LOG_ERROR("cannot open config file: ", config_file);
        return false;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        // 跳过注释和空行
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::istringstream iss(line);
        std::string key, value;
        if (!(iss >> key)) {
            continue;
        }
        if (!(iss >> value)) {
            throw std::invalid_argument(config_file + ":" + std::to_string(line_no) + ": missing value for " + key);
        }
        if (!applyOption(key, value, config)) {
            TXKV_LOG_WARNING("unknown config key ignored: ", key, " (", config_file, ":", line_no, ")");
        }
    }
    return true;
}

bool ConfigParser::applyOption(const std::string& key, const std::string& value, ScenarioConfig& config) {
    if (key == "mode") {
        if (!parseMode(value, config.mode)) {
            throw std::invalid_argument("invalid mode: " + value);
        }
    } else if (key == "entries") {
        int64_t entries = parseNonNegative(key, value);
        if (entries == 0) {
            throw std::invalid_argument("entries must be positive");
        }
        config.entries = static_cast<size_t>(entries);
    } else if (key == "timeout") {
        config.timeout = parseMillis(key, value);
    } else if (key == "step_pause") {
        config.step_pause = parseMillis(key, value);
    } else if (key == "commit_pause") {
        config.commit_pause = parseMillis(key, value);
    } else if (key == "victim") {
        if (!parseVictimPolicy(value, config.victim_policy)) {
            throw std::invalid_argument("invalid victim policy: " + value);
        }
    } else if (key == "max_attempts") {
        config.max_attempts = static_cast<size_t>(parseNonNegative(key, value));
    } else if (key == "log_level") {
        LogLevel level;
        if (!Logger::parseLogLevel(value, level)) {
            throw std::invalid_argument("invalid log level: " + value);
        }
        config.log_level = value;
    } else if (key == "log_file") {
        config.log_file = value;
    } else {
        return false;
    }
    return true;
}

ScenarioConfig ConfigParser::parseArguments(int argc, char* argv[]) {
    ScenarioConfig config;

    // 选项名 -> 配置键
    auto optionKey = [](const std::string& arg) -> std::string {
        if (arg == "-m" || arg == "--mode") return "mode";
        if (arg == "-n" || arg == "--entries") return "entries";
        if (arg == "-t" || arg == "--timeout") return "timeout";
        if (arg == "--step-pause") return "step_pause";
        if (arg == "--commit-pause") return "commit_pause";
        if (arg == "--victim") return "victim";
        if (arg == "--max-attempts") return "max_attempts";
        if (arg == "-l" || arg == "--log-level") return "log_level";
        if (arg == "-f" || arg == "--log-file") return "log_file";
        if (arg == "-c" || arg == "--config") return "config";
        return "";
    };

    // 第一遍：定位配置文件
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config.config_file = argv[i + 1];
        }
    }
    if (!config.config_file.empty() && !loadConfigFile(config.config_file, config)) {
        throw std::invalid_argument("cannot open config file: " + config.config_file);
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            continue;
        }
        if (arg == "-v" || arg == "--version") {
            config.show_version = true;
            continue;
        }

        std::string key = optionKey(arg);
        if (key.empty()) {
            throw std::invalid_argument("unknown argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument(arg + " requires a value");
        }
        std::string value = argv[++i];
        if (key != "config") {
            applyOption(key, value, config);
        }
    }

    return config;
}

bool ConfigParser::parseMode(const std::string& str, ScenarioMode& mode) {
    std::string name = Utils::toLower(str);
    if (name == "deadlock-detection") {
        mode = ScenarioMode::DEADLOCK_DETECTION;
    } else if (name == "deadlock-free") {
        mode = ScenarioMode::DEADLOCK_FREE;
    } else if (name == "pessimistic") {
        mode = ScenarioMode::PESSIMISTIC;
    } else {
        return false;
    }
    return true;
}

bool ConfigParser::parseVictimPolicy(const std::string& str, DeadlockVictimPolicy& policy) {
    std::string name = Utils::toLower(str);
    if (name == "youngest") {
        policy = DeadlockVictimPolicy::YOUNGEST;
    } else if (name == "requester") {
        policy = DeadlockVictimPolicy::REQUESTER;
    } else {
        return false;
    }
    return true;
}

std::string ConfigParser::modeToString(ScenarioMode mode) {
    switch (mode) {
        case ScenarioMode::DEADLOCK_DETECTION:
            return "deadlock-detection";
        case ScenarioMode::DEADLOCK_FREE:
            return "deadlock-free";
        case ScenarioMode::PESSIMISTIC:
            return "pessimistic";
    }
    return "unknown";
}

std::string ConfigParser::victimPolicyToString(DeadlockVictimPolicy policy) {
    switch (policy) {
        case DeadlockVictimPolicy::YOUNGEST:
            return "youngest";
        case DeadlockVictimPolicy::REQUESTER:
            return "requester";
    }
    return "unknown";
}

} // namespace txkv
