#pragma once

#include "common/monads/Maybe.hpp"
#include "common/utils/StringUtils.hpp"

struct FieldFailure {
    std::string field;
    std::string message;

    friend bool operator==(const FieldFailure&, const FieldFailure&) = default;
};

/**
 * @brief 验证失败报告，按字段声明顺序保存每个失败字段的第一条失败消息
 */
class FailureReport {
public:
    using const_iterator = std::vector<FieldFailure>::const_iterator;

    void add(std::string field, std::string message) {
        failures_.push_back({std::move(field), std::move(message)});
    }

    bool empty() const { return failures_.empty(); }
    size_t size() const { return failures_.size(); }

    const_iterator begin() const { return failures_.begin(); }
    const_iterator end() const { return failures_.end(); }

    const std::vector<FieldFailure>& failures() const { return failures_; }

    bool contains(const std::string& field) const {
        return std::any_of(failures_.begin(), failures_.end(), [&field](const FieldFailure& failure) {
            return failure.field == field;
        });
    }

    Maybe<std::string> messageFor(const std::string& field) const {
        for (const auto& failure : failures_) {
            if (failure.field == field) return some(failure.message);
        }
        return none();
    }

    Maybe<FieldFailure> first() const {
        if (failures_.empty()) return none();
        return some(failures_.front());
    }

    std::vector<std::string> messages() const {
        std::vector<std::string> result;
        result.reserve(failures_.size());
        for (const auto& failure : failures_) {
            result.push_back(failure.message);
        }
        return result;
    }

    /**
     * @brief "field: message; field: message"
     */
    std::string toString() const {
        std::vector<std::string> parts;
        parts.reserve(failures_.size());
        for (const auto& failure : failures_) {
            parts.push_back(failure.field + ": " + failure.message);
        }
        return StringUtils::join(parts, "; ");
    }

    /**
     * @brief [{"field": ..., "message": ...}, ...]
     */
    Json::Value toJson() const {
        Json::Value result(Json::arrayValue);
        for (const auto& failure : failures_) {
            Json::Value item;
            item["field"] = failure.field;
            item["message"] = failure.message;
            result.append(item);
        }
        return result;
    }

    void throwIfInvalid() const {
        if (!failures_.empty()) {
            throw ValidationException(toString());
        }
    }

    friend bool operator==(const FailureReport&, const FailureReport&) = default;

private:
    std::vector<FieldFailure> failures_;
};
