#pragma once

#include "GuardRule.hpp"
#include "common/monads/Result.hpp"

/**
 * @brief 单条守卫的检查结果
 */
struct GuardResult {
    bool satisfied = true;
    std::string message;

    operator bool() const { return satisfied; }

    static GuardResult ok() {
        return {true, ""};
    }

    static GuardResult fail(const std::string& message) {
        return {false, message};
    }

    /**
     * @brief 如果检查失败则抛出 ValidationException
     */
    void throwIfInvalid() const {
        if (!satisfied) {
            throw ValidationException(message);
        }
    }

    Result<Unit, std::string> toResult() const {
        if (satisfied) return ::ok();
        return ::err(message);
    }
};

/**
 * @brief 守卫接口
 *
 * isSatisfiedBy 只判断未取反的语义，取反和消息格式化由 check 统一处理。
 * accepts 返回 false 的值（类型无法判断）无论是否取反都不满足。
 */
class IGuard {
public:
    virtual ~IGuard() = default;

    virtual bool isSatisfiedBy(const Json::Value& value) const = 0;
    virtual std::string messageTemplate() const = 0;
    virtual const std::string& name() const = 0;
    virtual bool negated() const = 0;
    virtual std::string format(const std::string& field) const = 0;

    virtual bool accepts(const Json::Value&) const { return true; }

    GuardResult check(const std::string& field, const Json::Value& value) const {
        if (accepts(value) && isSatisfiedBy(value) != negated()) {
            return GuardResult::ok();
        }
        return GuardResult::fail(format(field));
    }
};

/**
 * @brief 守卫基类：持有解析后的规则，负责消息模板替换
 *
 * 模板占位符：{name} 为字段名，{not} 按是否取反替换为 " not " 或 " "，
 * 其余占位符由子类通过 injections() 提供。
 */
class AbstractGuard : public IGuard {
public:
    explicit AbstractGuard(GuardRule rule)
        : rule_(std::move(rule)) {}

    const std::string& name() const override { return rule_.name; }
    bool negated() const override { return rule_.negate; }
    const GuardRule& rule() const { return rule_; }

    std::string format(const std::string& field) const override {
        auto values = injections();
        values["name"] = field;
        values["not"] = rule_.negate ? " not " : " ";
        return StringUtils::substitute(messageTemplate(), values);
    }

protected:
    GuardRule rule_;

    virtual std::map<std::string, std::string> injections() const {
        return {};
    }

    // ========== 参数校验 ==========

    void expectArgs(size_t count) const {
        if (rule_.args.size() != count) {
            throw MalformedRuleException("Guard " + rule_.name + " expects " + std::to_string(count)
                                         + " argument(s), got " + std::to_string(rule_.args.size()));
        }
    }

    const Json::Value& numberArg(size_t index) const {
        const auto& arg = rule_.args.at(index);
        if (!arg.isNumeric()) {
            throw MalformedRuleException("Guard " + rule_.name + " expects a numeric argument, got "
                                         + GuardRule::literal(arg));
        }
        return arg;
    }

    size_t sizeArg(size_t index) const {
        const auto& arg = rule_.args.at(index);
        if (!arg.isIntegral() || arg.asInt64() < 0) {
            throw MalformedRuleException("Guard " + rule_.name + " expects a non-negative integer, got "
                                         + GuardRule::literal(arg));
        }
        return static_cast<size_t>(arg.asUInt64());
    }

    std::string stringArg(size_t index) const {
        const auto& arg = rule_.args.at(index);
        if (!arg.isString()) {
            throw MalformedRuleException("Guard " + rule_.name + " expects a string argument, got "
                                         + GuardRule::literal(arg));
        }
        return arg.asString();
    }
};

using GuardPredicate = std::function<bool(const Json::Value& value, const std::vector<Json::Value>& args)>;

/**
 * @brief 由 lambda 定义的守卫
 *
 * 模板中可以用 {0}、{1} ... 引用规则参数。
 */
class PredicateGuard : public AbstractGuard {
public:
    PredicateGuard(GuardRule rule, std::string messageTemplate, GuardPredicate predicate)
        : AbstractGuard(std::move(rule))
        , template_(std::move(messageTemplate))
        , predicate_(std::move(predicate)) {}

    bool isSatisfiedBy(const Json::Value& value) const override {
        return predicate_(value, rule_.args);
    }

    std::string messageTemplate() const override {
        return template_;
    }

protected:
    std::map<std::string, std::string> injections() const override {
        std::map<std::string, std::string> values;
        for (size_t i = 0; i < rule_.args.size(); ++i) {
            values[std::to_string(i)] = GuardRule::literal(rule_.args[i]);
        }
        return values;
    }

private:
    std::string template_;
    GuardPredicate predicate_;
};
