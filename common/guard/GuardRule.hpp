#pragma once

#include "common/utils/StringUtils.hpp"

/**
 * @brief 解析后的单条规则：名称、是否取反、带类型的参数
 *
 * 例如 "!between[1, 10]" 解析为 { "between", true, [1, 10] }。
 */
struct GuardRule {
    std::string name;
    bool negate = false;
    std::vector<Json::Value> args;

    /**
     * @brief 规则名称必须匹配 [A-Za-z_][A-Za-z0-9_]*
     */
    static bool isValidName(const std::string& name) {
        if (name.empty()) return false;
        unsigned char head = static_cast<unsigned char>(name.front());
        if (!std::isalpha(head) && head != '_') return false;
        return std::all_of(name.begin() + 1, name.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '_';
        });
    }

    /**
     * @brief 参数的可读形式，用于消息模板注入
     *
     * 字符串原样输出，列表输出为 [a, b]，空值输出为 none。
     */
    static std::string literal(const Json::Value& value) {
        switch (value.type()) {
            case Json::nullValue:
                return "none";
            case Json::booleanValue:
                return value.asBool() ? "true" : "false";
            case Json::intValue:
                return std::to_string(value.asInt64());
            case Json::uintValue:
                return std::to_string(value.asUInt64());
            case Json::stringValue:
                return value.asString();
            case Json::arrayValue: {
                std::vector<std::string> items;
                for (const auto& item : value) {
                    items.push_back(literal(item));
                }
                return "[" + StringUtils::join(items, ", ") + "]";
            }
            default: {
                Json::StreamWriterBuilder builder;
                builder["indentation"] = "";
                return Json::writeString(builder, value);
            }
        }
    }

    std::string toString() const {
        std::string text = negate ? "!" + name : name;
        if (args.empty()) return text;
        std::vector<std::string> items;
        for (const auto& arg : args) {
            items.push_back(literal(arg));
        }
        return text + "[" + StringUtils::join(items, ", ") + "]";
    }
};
