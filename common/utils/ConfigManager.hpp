#pragma once

#include "LoggerManager.hpp"
#include "common/guard/GuardRegistry.hpp"

namespace fs = std::filesystem;

/**
 * @brief 配置管理器 - 负责加载、验证和保存库配置
 *
 * 配置文件示例（所有字段可选）：
 * @code
 * {
 *     "log": { "level": "INFO", "dir": "./logs", "console": true },
 *     "guards": { "duplicate_policy": "error", "freeze_after_init": true }
 * }
 * @endcode
 */
class ConfigManager {
public:
    /**
     * @brief 加载并验证配置文件
     * @param path 配置文件路径，为空时按默认顺序查找
     * @return 是否成功加载，失败时已输出详细错误信息到 stderr 和日志
     */
    static bool load(const std::string& path = "") {
        reset();

        std::optional<std::string> configPath = path.empty() ? findConfigFile() : std::optional(path);
        if (!configPath) {
            std::vector<std::string> hints = {"请在以下位置之一创建配置文件:"};
            for (const auto& p : searchPaths()) {
                hints.push_back("  - " + p);
            }
            hints.emplace_back("可参考 config/olympus.example.json");
            printErrors("未找到配置文件", hints);
            return false;
        }

        Json::Value root;
        if (!parseConfigFile(*configPath, root)) {
            return false;
        }
        if (!validateConfig(root, *configPath)) {
            return false;
        }

        applyConfig(root);
        LOG_INFO << "Config loaded from: " << *configPath;
        return true;
    }

    /**
     * @brief 从内存中的 JSON 文本加载
     */
    static bool loadFromString(const std::string& text, const std::string& origin = "<memory>") {
        reset();

        Json::Value root;
        std::istringstream iss(text);
        if (!parseStream(iss, origin, root)) {
            return false;
        }
        if (!validateConfig(root, origin)) {
            return false;
        }

        applyConfig(root);
        return true;
    }

    /**
     * @brief 加载失败时抛出 ConfigException
     */
    static void loadOrThrow(const std::string& path = "") {
        if (!load(path)) {
            throw ConfigException("Failed to load configuration" + (path.empty() ? std::string() : ": " + path));
        }
    }

    /**
     * @brief 恢复默认值
     */
    static void reset() {
        logLevel_ = "INFO";
        logDir_.clear();
        consoleLog_ = true;
        duplicatePolicy_ = DuplicatePolicy::Error;
        freezeAfterInit_ = true;
    }

    /**
     * @brief 按顺序查找第一个存在的配置文件：$OLYMPUS_CONFIG、./config/olympus.local.json、
     *        ./config/olympus.json、./olympus.json
     */
    static std::optional<std::string> findConfigFile() {
        for (const auto& path : searchPaths()) {
            if (fs::exists(path)) {
                return path;
            }
        }
        return std::nullopt;
    }

    static const std::string& getLogLevel() { return logLevel_; }
    static const std::string& getLogDir() { return logDir_; }
    static bool isConsoleLogEnabled() { return consoleLog_; }
    static DuplicatePolicy getDuplicatePolicy() { return duplicatePolicy_; }
    static bool shouldFreezeRegistry() { return freezeAfterInit_; }

private:
    inline static std::string logLevel_ = "INFO";
    inline static std::string logDir_;
    inline static bool consoleLog_ = true;
    inline static DuplicatePolicy duplicatePolicy_ = DuplicatePolicy::Error;
    inline static bool freezeAfterInit_ = true;

    static std::vector<std::string> searchPaths() {
        std::vector<std::string> paths;
        if (const char* env = std::getenv("OLYMPUS_CONFIG"); env && *env) {
            paths.emplace_back(env);
        }
        paths.emplace_back("./config/olympus.local.json");
        paths.emplace_back("./config/olympus.json");
        paths.emplace_back("./olympus.json");
        return paths;
    }

    // ─── JSON 解析 ──────────────────────────────────────────────

    static bool parseConfigFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            printErrors("无法打开配置文件: " + path, {"请检查文件是否存在及读取权限"});
            return false;
        }
        return parseStream(ifs, path, root);
    }

    static bool parseStream(std::istream& in, const std::string& origin, Json::Value& root) {
        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, in, &root, &errs)) {
            printErrors("JSON 解析失败: " + origin, {
                errs,
                "请检查 JSON 语法（缺少逗号、引号不匹配、尾部逗号等）"
            });
            return false;
        }

        if (!root.isObject()) {
            printErrors("JSON 格式错误: " + origin, {"配置文件根节点必须是 JSON 对象"});
            return false;
        }
        return true;
    }

    // ─── 配置验证 ──────────────────────────────────────────────

    static bool validateConfig(const Json::Value& root, const std::string& origin) {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        for (const auto& key : root.getMemberNames()) {
            if (key != "log" && key != "guards") {
                warnings.push_back("未知的配置项: " + key);
            }
        }
        validateLog(root, errors);
        validateGuards(root, errors);

        if (!warnings.empty()) {
            printWarnings("配置警告 (" + origin + ")", warnings);
        }
        if (!errors.empty()) {
            printErrors("配置验证失败: " + origin, errors);
            return false;
        }
        return true;
    }

    static void validateLog(const Json::Value& root, std::vector<std::string>& errors) {
        if (!root.isMember("log")) return;
        const auto& log = root["log"];
        if (!log.isObject()) {
            errors.emplace_back("[log] 必须是 JSON 对象");
            return;
        }

        if (log.isMember("level")) {
            if (!log["level"].isString()) {
                errors.emplace_back("[log] level 必须是字符串");
            } else if (LoggerManager::parseLevel(log["level"].asString()).isNone()) {
                errors.push_back("[log] level 值无效: " + log["level"].asString()
                                 + "（有效值: TRACE、DEBUG、INFO、WARN、ERROR、FATAL）");
            }
        }
        if (log.isMember("dir") && !log["dir"].isString()) {
            errors.emplace_back("[log] dir 必须是字符串");
        }
        if (log.isMember("console") && !log["console"].isBool()) {
            errors.emplace_back("[log] console 必须是布尔值");
        }
    }

    static void validateGuards(const Json::Value& root, std::vector<std::string>& errors) {
        if (!root.isMember("guards")) return;
        const auto& guards = root["guards"];
        if (!guards.isObject()) {
            errors.emplace_back("[guards] 必须是 JSON 对象");
            return;
        }

        if (guards.isMember("duplicate_policy")) {
            if (!guards["duplicate_policy"].isString()) {
                errors.emplace_back("[guards] duplicate_policy 必须是字符串");
            } else if (GuardRegistry::parsePolicy(guards["duplicate_policy"].asString()).isNone()) {
                errors.push_back("[guards] duplicate_policy 值无效: " + guards["duplicate_policy"].asString()
                                 + "（有效值: error、replace）");
            }
        }
        if (guards.isMember("freeze_after_init") && !guards["freeze_after_init"].isBool()) {
            errors.emplace_back("[guards] freeze_after_init 必须是布尔值");
        }
    }

    // ─── 配置应用 ──────────────────────────────────────────────

    static void applyConfig(const Json::Value& root) {
        const auto& log = root["log"];
        if (log.isObject()) {
            logLevel_ = StringUtils::toUpper(log.get("level", logLevel_).asString());
            logDir_ = log.get("dir", logDir_).asString();
            consoleLog_ = log.get("console", consoleLog_).asBool();
        }

        const auto& guards = root["guards"];
        if (guards.isObject()) {
            if (guards.isMember("duplicate_policy")) {
                duplicatePolicy_ = GuardRegistry::parsePolicy(guards["duplicate_policy"].asString()).get();
            }
            freezeAfterInit_ = guards.get("freeze_after_init", freezeAfterInit_).asBool();
        }
    }

    // ─── 输出 ──────────────────────────────────────────────

    static void printErrors(const std::string& title, const std::vector<std::string>& messages) {
        std::string border(60, '=');
        std::cerr << "\n" << border << "\n";
        std::cerr << " [ERROR] " << title << "\n";
        std::cerr << std::string(60, '-') << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_ERROR << "[Config] " << msg;
        }
        std::cerr << border << "\n" << std::endl;
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n" << std::string(60, '-') << "\n";
        std::cerr << " [WARN] " << title << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_WARN << "[Config] " << msg;
        }
        std::cerr << std::string(60, '-') << "\n" << std::endl;
    }
};
