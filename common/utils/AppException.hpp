#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 应用异常基类
 */
class AppException : public std::exception {
private:
    int code_;
    std::string message_;

public:
    AppException(int code, std::string message)
        : code_(code), message_(std::move(message)) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
};

/**
 * 错误码定义见 ErrorCodes.hpp：
 * 1xxx - 调用方错误
 * 2xxx - 守卫规则错误
 * 5xxx - 内部错误
 */

/**
 * @brief 验证失败
 */
class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "验证失败")
        : AppException(ErrorCodes::VALIDATION_FAILED, message) {}
};

/**
 * @brief 对失败的 Result / Either 取值
 */
class UnwrapException : public AppException {
public:
    explicit UnwrapException(const std::string& message = "Cannot get value of a failed result")
        : AppException(ErrorCodes::UNWRAP_ON_ERR, message) {}
};

/**
 * @brief 对空的 Maybe 取值
 */
class MissingValueException : public AppException {
public:
    MissingValueException()
        : AppException(ErrorCodes::MISSING_VALUE, "Cannot get value from a Maybe with no value") {}
};

/**
 * @brief 规则名称未注册
 */
class UnknownGuardException : public AppException {
    std::string name_;

public:
    explicit UnknownGuardException(std::string name)
        : AppException(ErrorCodes::UNKNOWN_GUARD, "Guard " + name + " is not defined in registry")
        , name_(std::move(name)) {}

    const std::string& name() const { return name_; }
};

/**
 * @brief 规则字符串语法错误
 *
 * 消息中附带原始语句和指向出错列的脱字符：
 * @code
 * Expected ] at position 7:
 * lt[18|gt[1]
 *        ^
 * @endcode
 */
class MalformedRuleException : public AppException {
    std::string statement_;
    size_t position_;

public:
    MalformedRuleException(const std::string& reason, std::string statement, size_t position)
        : AppException(ErrorCodes::MALFORMED_RULE,
                       reason + " at position " + std::to_string(position) + ":\n"
                           + statement + "\n" + std::string(position, ' ') + "^")
        , statement_(std::move(statement))
        , position_(position) {}

    /**
     * @brief 规则参数错误（参数个数或类型不符），无位置信息
     */
    explicit MalformedRuleException(const std::string& reason)
        : AppException(ErrorCodes::MALFORMED_RULE, reason)
        , position_(0) {}

    const std::string& statement() const { return statement_; }
    size_t position() const { return position_; }
};

/**
 * @brief 规则名称重复注册
 */
class DuplicateNameException : public AppException {
public:
    explicit DuplicateNameException(const std::string& name)
        : AppException(ErrorCodes::DUPLICATE_NAME, "Guard " + name + " is already defined in registry") {}
};

/**
 * @brief 注册表冻结后仍尝试注册
 */
class RegistryFrozenException : public AppException {
public:
    explicit RegistryFrozenException(const std::string& name)
        : AppException(ErrorCodes::REGISTRY_FROZEN,
                       "Cannot register guard " + name + ": registry is frozen") {}
};

/**
 * @brief 配置文件错误
 */
class ConfigException : public AppException {
public:
    explicit ConfigException(const std::string& message = "配置文件无效")
        : AppException(ErrorCodes::CONFIG_INVALID, message) {}
};
