#pragma once

#include "BuiltinGuards.hpp"
#include "FailureReport.hpp"
#include "RuleParser.hpp"

/**
 * @brief 字段 -> 规则字符串，可选自定义失败消息
 */
struct FieldRules {
    std::string field;
    std::string rules;
    std::string message;
};

/**
 * @brief 有序的验证声明
 *
 * @code
 * ValidationSpec spec{{"name", "required"}, {"age", "lt[18]"}};
 * spec.add("email", R"(required|regex[r"^[^@]+@[^@]+$"])", "email is invalid");
 * @endcode
 */
class ValidationSpec {
public:
    using const_iterator = std::vector<FieldRules>::const_iterator;

    ValidationSpec() = default;

    ValidationSpec(std::initializer_list<std::pair<std::string, std::string>> entries) {
        for (const auto& [field, rules] : entries) {
            add(field, rules);
        }
    }

    /**
     * @brief 追加字段；字段已存在时原位替换其规则和消息
     */
    ValidationSpec& add(const std::string& field, const std::string& rules, const std::string& message = "") {
        auto it = std::find_if(fields_.begin(), fields_.end(), [&field](const FieldRules& entry) {
            return entry.field == field;
        });
        if (it != fields_.end()) {
            it->rules = rules;
            it->message = message;
        } else {
            fields_.push_back({field, rules, message});
        }
        return *this;
    }

    bool empty() const { return fields_.empty(); }
    size_t size() const { return fields_.size(); }
    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

private:
    std::vector<FieldRules> fields_;
};

struct CompiledField {
    std::string field;
    std::string message;
    std::vector<std::shared_ptr<const IGuard>> guards;
};

/**
 * @brief 已解析并实例化全部守卫的验证声明，可重复使用
 */
class CompiledSpec {
public:
    using const_iterator = std::vector<CompiledField>::const_iterator;

    void add(CompiledField field) {
        fields_.push_back(std::move(field));
    }

    bool empty() const { return fields_.empty(); }
    size_t size() const { return fields_.size(); }
    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

private:
    std::vector<CompiledField> fields_;
};

/**
 * @brief 守卫求值器
 *
 * 同一字段内遇到第一个失败即停止；不同字段全部求值，失败按声明顺序汇总。
 * 缺失的字段按 null 处理。规则语法错误和未注册的规则名以异常报告，
 * 且在任何字段求值之前发现。
 */
class GuardEvaluator {
public:
    GuardEvaluator()
        : registry_(GuardRegistry::instance()) {}

    explicit GuardEvaluator(const GuardRegistry& registry)
        : registry_(registry) {}

    CompiledSpec compile(const ValidationSpec& spec) const {
        CompiledSpec compiled;
        for (const auto& entry : spec) {
            compiled.add({entry.field, entry.message, compileRules(entry.field, entry.rules)});
        }
        return compiled;
    }

    Result<Unit, FailureReport> evaluate(const Json::Value& values, const ValidationSpec& spec) const {
        return evaluate(values, compile(spec));
    }

    /**
     * @throws ValidationException values 既不是对象也不是 null
     */
    Result<Unit, FailureReport> evaluate(const Json::Value& values, const CompiledSpec& compiled) const {
        if (!values.isNull() && !values.isObject()) {
            throw ValidationException("Validation values must be a JSON object");
        }

        FailureReport report;
        for (const auto& field : compiled) {
            auto result = runGuards(field.field, lookup(values, field.field), field.guards, field.message);
            if (!result) {
                report.add(field.field, result.message);
            }
        }

        if (report.empty()) return ok();
        LOG_DEBUG << "GuardEvaluator: " << report.size() << " field(s) failed validation: " << report.toString();
        return err(std::move(report));
    }

    /**
     * @brief 检查单个字段
     */
    GuardResult check(const std::string& field,
                      const Json::Value& value,
                      const std::string& rules,
                      const std::string& message = "") const {
        return runGuards(field, value, compileRules(field, rules), message);
    }

    /**
     * @brief 返回第一个失败的结果，全部通过时返回 ok
     */
    static GuardResult combine(const std::vector<GuardResult>& results) {
        for (const auto& result : results) {
            if (!result) return result;
        }
        return GuardResult::ok();
    }

private:
    const GuardRegistry& registry_;

    std::vector<std::shared_ptr<const IGuard>> compileRules(const std::string& field, const std::string& rules) const {
        try {
            std::vector<std::shared_ptr<const IGuard>> guards;
            for (const auto& rule : RuleParser(rules).parse()) {
                guards.push_back(registry_.resolve(rule));
            }
            return guards;
        } catch (const AppException& e) {
            LOG_ERROR << "GuardEvaluator: Failed to compile rules for field '" << field << "': " << e.what();
            throw;
        }
    }

    static GuardResult runGuards(const std::string& field,
                                 const Json::Value& value,
                                 const std::vector<std::shared_ptr<const IGuard>>& guards,
                                 const std::string& message) {
        for (const auto& guard : guards) {
            auto result = guard->check(field, value);
            if (!result) {
                return message.empty() ? result : GuardResult::fail(message);
            }
        }
        return GuardResult::ok();
    }

    static const Json::Value& lookup(const Json::Value& values, const std::string& field) {
        static const Json::Value absent;
        if (values.isObject() && values.isMember(field)) {
            return values[field];
        }
        return absent;
    }
};

/**
 * @brief 使用进程级注册表验证
 */
inline Result<Unit, FailureReport> validate(const Json::Value& values, const ValidationSpec& spec) {
    return GuardEvaluator().evaluate(values, spec);
}
