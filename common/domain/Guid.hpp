#pragma once

#include "common/utils/AppException.hpp"

/**
 * @brief 聚合根标识，不透明的字符串值
 *
 * 本库不负责生成标识，由调用方提供（通常是 UUID 文本）。
 */
class Guid {
public:
    explicit Guid(std::string value)
        : value_(std::move(value)) {
        if (value_.empty()) {
            throw ValidationException("Guid must not be empty");
        }
    }

    const std::string& toString() const { return value_; }

    friend bool operator==(const Guid&, const Guid&) = default;
    friend auto operator<=>(const Guid&, const Guid&) = default;

private:
    std::string value_;
};
