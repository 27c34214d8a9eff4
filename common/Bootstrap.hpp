#pragma once

#include "common/domain/EventBus.hpp"
#include "common/guard/BuiltinGuards.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/utils/LoggerManager.hpp"

/**
 * @brief 自定义守卫注册回调，在注册表冻结之前执行
 */
using GuardSetup = std::function<void(GuardRegistry&)>;

/**
 * @brief 初始化阶段：加载配置、初始化日志、注册守卫、冻结注册表
 *
 * 使用示例：
 * @code
 * int main() {
 *     if (!Bootstrap::initialize("", [](GuardRegistry& registry) {
 *             registry.registerPredicate("adult", "{name} must{not}be an adult",
 *                 [](const Json::Value& v, const auto&) { return v.isNumeric() && v.asInt() >= 18; });
 *         })) {
 *         return 1;
 *     }
 *     ...
 *     Bootstrap::shutdown();
 * }
 * @endcode
 */
class Bootstrap {
public:
    /**
     * @param configPath 配置文件路径；为空时按默认顺序查找，找不到则使用默认配置
     * @param setup 自定义守卫注册
     * @param registry 被配置的注册表，默认进程级注册表
     * @return 配置无效或自定义注册失败时返回 false
     */
    static bool initialize(const std::string& configPath = "",
                           const GuardSetup& setup = {},
                           GuardRegistry& registry = GuardRegistry::instance()) {
        if (!loadConfig(configPath)) {
            return false;
        }

        LoggerManager::initialize(ConfigManager::getLogDir(), ConfigManager::isConsoleLogEnabled());
        LoggerManager::setLogLevel(ConfigManager::getLogLevel());

        if (!registry.isFrozen()) {
            registry.setDuplicatePolicy(ConfigManager::getDuplicatePolicy());
            if (setup) {
                try {
                    setup(registry);
                } catch (const AppException& e) {
                    LOG_ERROR << "Bootstrap: Guard registration failed: " << e.what();
                    return false;
                }
            }
            if (ConfigManager::shouldFreezeRegistry()) {
                registry.freeze();
            }
        } else if (setup) {
            LOG_ERROR << "Bootstrap: Cannot run guard setup, registry is already frozen";
            return false;
        }

        LOG_INFO << "Bootstrap: Initialized with " << registry.size() << " guard(s)";
        return true;
    }

    /**
     * @brief 注销事件处理器并关闭文件日志
     */
    static void shutdown(EventBus& bus = EventBus::instance()) {
        bus.unbindAll();
        LoggerManager::close();
    }

private:
    static bool loadConfig(const std::string& configPath) {
        if (!configPath.empty()) {
            return ConfigManager::load(configPath);
        }
        if (ConfigManager::findConfigFile()) {
            return ConfigManager::load();
        }
        ConfigManager::reset();
        LOG_WARN << "Bootstrap: No config file found, using defaults";
        return true;
    }
};
