#pragma once

#include "StringUtils.hpp"
#include "common/monads/Maybe.hpp"

namespace fs = std::filesystem;

/**
 * @brief 日志管理器 - 使用 trantor::AsyncFileLogger 异步写盘 + 按日期轮转
 *
 * 文件命名: <logDir>/olympus_YYYY-MM-DD*.log
 * 轮转策略: 每天自动创建新文件 + 单文件超 100MB 时轮转
 * 未调用 initialize 时沿用 trantor 默认的标准输出。
 */
class LoggerManager {
private:
    inline static std::unique_ptr<trantor::AsyncFileLogger> fileLogger_;
    inline static std::shared_mutex loggerMutex_;
    inline static std::string logDir_;
    inline static std::atomic<int> currentDay_{0};
    inline static std::atomic<bool> console_{true};
    static constexpr uint64_t FILE_SIZE_LIMIT = 100 * 1024 * 1024;  // 100MB

    /** 当天日期 YYYYMMDD */
    static int todayInt() {
        auto now = std::chrono::system_clock::now();
        auto dp = std::chrono::floor<std::chrono::days>(now);
        std::chrono::year_month_day ymd{dp};
        return static_cast<int>(ymd.year()) * 10000
             + static_cast<unsigned>(ymd.month()) * 100
             + static_cast<unsigned>(ymd.day());
    }

    static std::string dayToStr(int day) {
        char buf[11];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                      day / 10000, day % 10000 / 100, day % 100);
        return buf;
    }

    static std::unique_ptr<trantor::AsyncFileLogger> createLogger(int day) {
        auto logger = std::make_unique<trantor::AsyncFileLogger>();
        logger->setFileName(logDir_ + "/olympus_" + dayToStr(day));
        logger->setFileSizeLimit(FILE_SIZE_LIMIT);
        logger->startLogging();
        return logger;
    }

    static void rotateDailyLog(int today) {
        std::unique_ptr<trantor::AsyncFileLogger> oldLogger;
        {
            std::unique_lock lock(loggerMutex_);
            if (!fileLogger_ || today == currentDay_.load(std::memory_order_relaxed)) return;

            oldLogger = std::move(fileLogger_);
            fileLogger_ = createLogger(today);
            currentDay_.store(today, std::memory_order_relaxed);
        }
        // oldLogger 在锁外析构，自动 flush 剩余数据
    }

    static void outputFunction(const char* msg, const uint64_t len) {
        std::string formatted = formatLogMessage(msg, len);

        int today = todayInt();
        if (today != currentDay_.load(std::memory_order_relaxed)) {
            rotateDailyLog(today);
        }

        std::shared_lock lock(loggerMutex_);
        if (fileLogger_) {
            fileLogger_->output(formatted.c_str(), formatted.size());
        }
        if (!fileLogger_ || console_.load(std::memory_order_relaxed)) {
            std::fwrite(formatted.data(), 1, formatted.size(), stdout);
        }
    }

    static void flushFunction() {
        std::shared_lock lock(loggerMutex_);
        if (fileLogger_) {
            fileLogger_->flush();
        }
        std::fflush(stdout);
    }

public:
    /**
     * @brief 格式化日志消息
     * @details 原始: "YYYYMMDD HH:MM:SS.microseconds ThreadID Level [func] message - file:line"
     *          目标: "YYYY-MM-DD HH:MM:SS ThreadID Level message"
     */
    static std::string formatLogMessage(const char* msg, uint64_t len) {
        std::string logMsg(msg, len);

        if (len < 17 || logMsg[8] != ' ') return logMsg;
        size_t timeEnd = logMsg.find(' ', 9);
        if (timeEnd == std::string::npos || timeEnd <= 15) return logMsg;

        std::string rest = logMsg.substr(timeEnd);

        // lambda 的函数名 [operator ()] 没有意义
        size_t opStart = rest.find("[operator ()");
        if (opStart != std::string::npos) {
            size_t opEnd = rest.find("] ", opStart);
            if (opEnd != std::string::npos) {
                rest = rest.substr(0, opStart) + rest.substr(opEnd + 2);
            }
        }

        size_t filePos = rest.rfind(" - ");
        if (filePos != std::string::npos) {
            std::string suffix = rest.substr(filePos + 3);
            if (suffix.find(".cpp:") != std::string::npos || suffix.find(".hpp:") != std::string::npos) {
                rest = rest.substr(0, filePos) + "\n";
            }
        }

        return logMsg.substr(0, 4) + "-" + logMsg.substr(4, 2) + "-" + logMsg.substr(6, 2)
             + " " + logMsg.substr(9, 8) + rest;
    }

    static Maybe<trantor::Logger::LogLevel> parseLevel(const std::string& level) {
        static const std::map<std::string, trantor::Logger::LogLevel> levels = {
            {"TRACE", trantor::Logger::kTrace},
            {"DEBUG", trantor::Logger::kDebug},
            {"INFO", trantor::Logger::kInfo},
            {"WARN", trantor::Logger::kWarn},
            {"ERROR", trantor::Logger::kError},
            {"FATAL", trantor::Logger::kFatal},
        };
        auto it = levels.find(StringUtils::toUpper(StringUtils::trim(level)));
        if (it == levels.end()) return none();
        return some(it->second);
    }

    /**
     * @brief 初始化日志系统
     * @param logDir 日志目录，为空时只输出到控制台
     * @param console 写文件的同时是否输出到控制台
     */
    static void initialize(const std::string& logDir, bool console = true) {
        console_.store(console, std::memory_order_relaxed);

        std::unique_ptr<trantor::AsyncFileLogger> oldLogger;
        {
            std::unique_lock lock(loggerMutex_);
            oldLogger = std::move(fileLogger_);
            logDir_ = logDir;
            if (!logDir_.empty()) {
                fs::create_directories(logDir_);
                int today = todayInt();
                currentDay_.store(today, std::memory_order_relaxed);
                fileLogger_ = createLogger(today);
            }
        }

        trantor::Logger::setDisplayLocalTime(true);
        trantor::Logger::setOutputFunction(outputFunction, flushFunction);
    }

    /**
     * @brief 设置日志级别（不区分大小写）
     * @return 级别名称无效时返回 false，级别保持不变
     */
    static bool setLogLevel(const std::string& level) {
        auto parsed = parseLevel(level);
        if (parsed.isNone()) {
            LOG_WARN << "LoggerManager: Unknown log level '" << level << "'";
            return false;
        }
        trantor::Logger::setLogLevel(parsed.get());
        return true;
    }

    static bool hasFileLogger() {
        std::shared_lock lock(loggerMutex_);
        return fileLogger_ != nullptr;
    }

    /**
     * @brief 关闭文件日志，之后的日志输出到控制台
     */
    static void close() {
        std::unique_ptr<trantor::AsyncFileLogger> oldLogger;
        {
            std::unique_lock lock(loggerMutex_);
            oldLogger = std::move(fileLogger_);
        }
        if (oldLogger) {
            oldLogger->flush();
        }
    }
};
