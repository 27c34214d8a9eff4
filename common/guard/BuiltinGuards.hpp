#pragma once

#include "GuardRegistry.hpp"

namespace detail {

/**
 * @brief 字符串按 UTF-8 字符计数，数组和对象按元素计数，其余类型无长度
 */
inline Maybe<size_t> valueLength(const Json::Value& value) {
    if (value.isString()) {
        return some(StringUtils::utf8Length(value.asString()));
    }
    if (value.isArray() || value.isObject()) {
        return some(static_cast<size_t>(value.size()));
    }
    return none();
}

/**
 * @brief 比较两个值：数字按数值比较，字符串按字典序比较，其余组合不可比较
 * @return 负数 / 0 / 正数
 */
inline Maybe<int> compareValues(const Json::Value& lhs, const Json::Value& rhs) {
    if (lhs.isNumeric() && rhs.isNumeric()) {
        if (lhs.isInt64() && rhs.isInt64()) {
            auto a = lhs.asInt64();
            auto b = rhs.asInt64();
            return some(a < b ? -1 : (a > b ? 1 : 0));
        }
        double a = lhs.asDouble();
        double b = rhs.asDouble();
        return some(a < b ? -1 : (a > b ? 1 : 0));
    }
    if (lhs.isString() && rhs.isString()) {
        int result = lhs.asString().compare(rhs.asString());
        return some(result < 0 ? -1 : (result > 0 ? 1 : 0));
    }
    return none();
}

inline bool valuesEqual(const Json::Value& lhs, const Json::Value& rhs) {
    if (lhs.isNumeric() && rhs.isNumeric()) {
        return compareValues(lhs, rhs).getOr(1) == 0;
    }
    return lhs == rhs;
}

}  // namespace detail

// ========== 存在性 ==========

class RequiredGuard : public AbstractGuard {
public:
    explicit RequiredGuard(GuardRule rule) : AbstractGuard(std::move(rule)) {
        expectArgs(0);
    }

    bool isSatisfiedBy(const Json::Value& value) const override {
        if (value.isNull()) return false;
        return detail::valueLength(value).getOr(1) > 0;
    }

    std::string messageTemplate() const override { return "{name}{not}is required"; }
};

class EmptyGuard : public AbstractGuard {
public:
    explicit EmptyGuard(GuardRule rule) : AbstractGuard(std::move(rule)) {
        expectArgs(0);
    }

    bool isSatisfiedBy(const Json::Value& value) const override {
        if (value.isNull()) return true;
        return detail::valueLength(value).getOr(1) == 0;
    }

    std::string messageTemplate() const override { return "{name} must{not}be empty"; }
};

// ========== 长度 ==========

class LengthGuard : public AbstractGuard {
public:
    explicit LengthGuard(GuardRule rule) : AbstractGuard(std::move(rule)) {
        expectArgs(1);
        length_ = sizeArg(0);
    }

    bool isSatisfiedBy(const Json::Value& value) const override {
        return detail::valueLength(value).map([this](size_t n) { return n == length_; }).getOr(false);
    }

    bool accepts(const Json::Value& value) const override {
        return detail::valueLength(value).isSome();
    }

    std::string messageTemplate() const override { return "{name} must{not}have of length {length}"; }

protected:
    std::map<std::string, std::string> injections() const override {
        return {{"length", std::to_string(length_)}};
    }

private:
    size_t length_ = 0;
};

class BetweenGuard : public AbstractGuard {
public:
    explicit BetweenGuard(GuardRule rule) : AbstractGuard(std::move(rule)) {
        expectArgs(2);
        min_ = sizeArg(0);
        max_ = sizeArg(1);
        if (min_ > max_) {
            throw MalformedRuleException("Guard " + name() + " expects min <= max, got "
                                         + std::to_string(min_) + " and " + std::to_string(max_));
        }
    }

    bool isSatisfiedBy(const Json::Value& value) const override {
        return detail::valueLength(value)
            .map([this](size_t n) { return n >= min_ && n <= max_; })
            .getOr(false);
    }

    bool accepts(const Json::Value& value) const override {
        return detail::valueLength(value).isSome();
    }

    std::string messageTemplate() const override { return "{name} must{not}be between {min} and {max}"; }

protected:
    std::map<std::string, std::string> injections() const override {
        return {{"min", std::to_string(min_)}, {"max", std::to_string(max_)}};
    }

private:
    size_t min_ = 0;
    size_t max_ = 0;
};

// ========== 内容 ==========

/**
 * @brief 正则匹配，从字符串开头开始匹配（不要求匹配到结尾）
 */
class RegexGuard : public AbstractGuard {
public:
    explicit RegexGuard(GuardRule rule) : AbstractGuard(std::move(rule)) {
        expectArgs(1);
        pattern_ = stringArg(0);
        try {
            regex_ = std::regex(pattern_);
        } catch (const std::regex_error& e) {
            throw MalformedRuleException("Guard " + name() + " has an invalid pattern " + pattern_ + ": " + e.what());
        }
    }

    bool isSatisfiedBy(const Json::Value& value) const override {
        if (!value.isString()) return false;
        const std::string text = value.asString();
        return std::regex_search(text, regex_, std::regex_constants::match_continuous);
    }

    bool accepts(const Json::Value& value) const override { return value.isString(); }

    std::string messageTemplate() const override {
        return "{name} must{not}match the regular expression {regex}";
    }

protected:
    std::map<std::string, std::string> injections() const override {
        return {{"regex", pattern_}};
    }

private:
    std::string pattern_;
    std::regex regex_;
};

/**
 * @brief 成员检查，参数可以是一个列表 in[[a, b]]，也可以直接列出 in[a, b]
 */
class InGuard : public AbstractGuard {
public:
    explicit InGuard(GuardRule rule) : AbstractGuard(std::move(rule)), items_(Json::arrayValue) {
        if (rule_.args.empty()) {
            throw MalformedRuleException("Guard " + name() + " expects a list of values");
        }
        if (rule_.args.size() == 1 && rule_.args[0].isArray()) {
            items_ = rule_.args[0];
        } else {
            for (const auto& arg : rule_.args) {
                items_.append(arg);
            }
        }
    }

    bool isSatisfiedBy(const Json::Value& value) const override {
        for (const auto& item : items_) {
            if (detail::valuesEqual(value, item)) return true;
        }
        return false;
    }

    std::string messageTemplate() const override { return "{name} must{not}be in the list {list}"; }

protected:
    std::map<std::string, std::string> injections() const override {
        return {{"list", GuardRule::literal(items_)}};
    }

private:
    Json::Value items_;
};

class EqualGuard : public AbstractGuard {
public:
    explicit EqualGuard(GuardRule rule) : AbstractGuard(std::move(rule)) {
        expectArgs(1);
    }

    bool isSatisfiedBy(const Json::Value& value) const override {
        return detail::valuesEqual(value, rule_.args[0]);
    }

    std::string messageTemplate() const override { return "{name} must{not}be equal to {value}"; }

protected:
    std::map<std::string, std::string> injections() const override {
        return {{"value", GuardRule::literal(rule_.args[0])}};
    }
};

// ========== 比较 ==========

/**
 * @brief 与单个边界值比较的守卫（le / lt / ge / gt）
 *
 * 数字与数字按数值比较，字符串与字符串按字典序比较，类型不兼容时不满足（取反也不满足）。
 */
class BoundGuard : public AbstractGuard {
public:
    using Comparison = bool (*)(int);

    BoundGuard(GuardRule rule, std::string messageTemplate, std::string placeholder, Comparison comparison)
        : AbstractGuard(std::move(rule))
        , template_(std::move(messageTemplate))
        , placeholder_(std::move(placeholder))
        , comparison_(comparison) {
        expectArgs(1);
        const auto& bound = rule_.args[0];
        if (!bound.isNumeric() && !bound.isString()) {
            throw MalformedRuleException("Guard " + name() + " expects a number or string bound, got "
                                         + GuardRule::literal(bound));
        }
    }

    bool isSatisfiedBy(const Json::Value& value) const override {
        return detail::compareValues(value, rule_.args[0]).map(comparison_).getOr(false);
    }

    bool accepts(const Json::Value& value) const override {
        return detail::compareValues(value, rule_.args[0]).isSome();
    }

    std::string messageTemplate() const override { return template_; }

protected:
    std::map<std::string, std::string> injections() const override {
        return {{placeholder_, GuardRule::literal(rule_.args[0])}};
    }

private:
    std::string template_;
    std::string placeholder_;
    Comparison comparison_;
};

class LessThanOrEqualGuard : public BoundGuard {
public:
    explicit LessThanOrEqualGuard(GuardRule rule)
        : BoundGuard(std::move(rule), "{name} must{not}be less than or equal to {max}", "max",
                     [](int c) { return c <= 0; }) {}
};

class LessThanGuard : public BoundGuard {
public:
    explicit LessThanGuard(GuardRule rule)
        : BoundGuard(std::move(rule), "{name} must{not}be less than {max}", "max",
                     [](int c) { return c < 0; }) {}
};

class GreaterThanOrEqualGuard : public BoundGuard {
public:
    explicit GreaterThanOrEqualGuard(GuardRule rule)
        : BoundGuard(std::move(rule), "{name} must{not}be greater than or equal to {min}", "min",
                     [](int c) { return c >= 0; }) {}
};

class GreaterThanGuard : public BoundGuard {
public:
    explicit GreaterThanGuard(GuardRule rule)
        : BoundGuard(std::move(rule), "{name} must{not}be greater than {min}", "min",
                     [](int c) { return c > 0; }) {}
};

// ========== 数值性质 ==========

class ParityGuard : public AbstractGuard {
public:
    ParityGuard(GuardRule rule, bool odd) : AbstractGuard(std::move(rule)), odd_(odd) {
        expectArgs(0);
    }

    bool isSatisfiedBy(const Json::Value& value) const override {
        if (!value.isNumeric() || !value.isIntegral()) return false;
        bool isOdd = value.isInt64() ? (value.asInt64() % 2 != 0) : (value.asUInt64() % 2 != 0);
        return isOdd == odd_;
    }

    bool accepts(const Json::Value& value) const override {
        return value.isNumeric() && value.isIntegral();
    }

    std::string messageTemplate() const override {
        return odd_ ? "{name} must{not}be odd" : "{name} must{not}be even";
    }

private:
    bool odd_;
};

class SignGuard : public AbstractGuard {
public:
    SignGuard(GuardRule rule, bool positive) : AbstractGuard(std::move(rule)), positive_(positive) {
        expectArgs(0);
    }

    bool isSatisfiedBy(const Json::Value& value) const override {
        if (!value.isNumeric()) return false;
        double number = value.asDouble();
        return positive_ ? number > 0 : number < 0;
    }

    bool accepts(const Json::Value& value) const override { return value.isNumeric(); }

    std::string messageTemplate() const override {
        return positive_ ? "{name} must{not}be positive" : "{name} must{not}be negative";
    }

private:
    bool positive_;
};

/**
 * @brief 内置守卫
 */
class BuiltinGuards {
public:
    static void registerAll(GuardRegistry& registry) {
        registry.registerGuard<RequiredGuard>("required");
        registry.registerGuard<EmptyGuard>("empty");
        registry.registerGuard<LengthGuard>("length");
        registry.registerGuard<BetweenGuard>("between");
        registry.registerGuard<RegexGuard>("regex");
        registry.registerGuard<InGuard>("in");
        registry.registerGuard<EqualGuard>("eq");
        registry.registerGuard<LessThanOrEqualGuard>("le");
        registry.registerGuard<LessThanGuard>("lt");
        registry.registerGuard<GreaterThanOrEqualGuard>("ge");
        registry.registerGuard<GreaterThanGuard>("gt");
        registry.registerGuard("odd", [](const GuardRule& rule) -> std::unique_ptr<IGuard> {
            return std::make_unique<ParityGuard>(rule, true);
        });
        registry.registerGuard("even", [](const GuardRule& rule) -> std::unique_ptr<IGuard> {
            return std::make_unique<ParityGuard>(rule, false);
        });
        registry.registerGuard("positive", [](const GuardRule& rule) -> std::unique_ptr<IGuard> {
            return std::make_unique<SignGuard>(rule, true);
        });
        registry.registerGuard("negative", [](const GuardRule& rule) -> std::unique_ptr<IGuard> {
            return std::make_unique<SignGuard>(rule, false);
        });
    }
};

inline GuardRegistry& GuardRegistry::instance() {
    static GuardRegistry registry;
    static std::once_flag builtinsRegistered;
    std::call_once(builtinsRegistered, [] { BuiltinGuards::registerAll(registry); });
    return registry;
}
