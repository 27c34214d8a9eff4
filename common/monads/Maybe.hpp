#pragma once

#include "Result.hpp"

/**
 * @brief none() 返回的空值标记，可隐式转换为任意 Maybe<T>
 */
struct NoneTag {
    friend bool operator==(const NoneTag&, const NoneTag&) = default;
};

inline constexpr NoneTag none() {
    return {};
}

namespace detail {

template<typename X>
struct IsMaybe : std::false_type {};

template<typename U>
struct IsMaybe<Maybe<U>> : std::true_type {};

}  // namespace detail

/**
 * @brief 可选值单子：Some(T) 或 None，不使用空指针或哨兵值表达"缺失"
 *
 * 主要用于表达"标识尚未分配"等场景：
 * @code
 * Maybe<Guid> id = none();
 * std::string label = id.map([](const Guid& g) { return g.toString(); })
 *                       .getOr("<unassigned>");
 * @endcode
 */
template<typename T>
class Maybe {
public:
    using value_type = T;

    Maybe() = default;
    Maybe(NoneTag) {}

    static Maybe just(T value) {
        Maybe result;
        result.value_.emplace(std::move(value));
        return result;
    }

    static Maybe nothing() {
        return Maybe();
    }

    /**
     * @brief present 为真时包装 value，否则为 None
     */
    static Maybe withBool(bool present, T value) {
        return present ? just(std::move(value)) : nothing();
    }

    bool isSome() const noexcept { return value_.has_value(); }
    bool isNone() const noexcept { return !value_.has_value(); }
    explicit operator bool() const noexcept { return isSome(); }

    /**
     * @brief 取值，None 时抛出 MissingValueException
     */
    const T& get() const {
        if (!value_) throw MissingValueException();
        return *value_;
    }

    T getOr(T fallback) const {
        return value_ ? *value_ : std::move(fallback);
    }

    template<typename F>
    T getOrElse(F&& fallback) const {
        if (value_) return *value_;
        return std::invoke(std::forward<F>(fallback));
    }

    template<typename F>
    auto map(F&& f) const -> Maybe<std::remove_cvref_t<std::invoke_result_t<F, const T&>>> {
        using U = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
        if (!value_) return Maybe<U>();
        return Maybe<U>::just(std::invoke(std::forward<F>(f), *value_));
    }

    /**
     * @brief f 返回 Maybe；None 时短路，不调用 f
     */
    template<typename F>
    auto bind(F&& f) const -> std::remove_cvref_t<std::invoke_result_t<F, const T&>> {
        using M = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
        if (!value_) return M();
        return std::invoke(std::forward<F>(f), *value_);
    }

    template<typename F>
    auto flatMap(F&& f) const {
        return bind(std::forward<F>(f));
    }

    /**
     * @brief 应用：T 为可调用对象时，用它处理 other 的值；任一方为 None 则结果为 None
     */
    template<typename U>
        requires std::invocable<const T&, const U&>
    auto amap(const Maybe<U>& other) const -> Maybe<std::remove_cvref_t<std::invoke_result_t<const T&, const U&>>> {
        using R = std::remove_cvref_t<std::invoke_result_t<const T&, const U&>>;
        if (!value_ || other.isNone()) return Maybe<R>();
        return Maybe<R>::just(std::invoke(*value_, other.get()));
    }

    /**
     * @brief 展平 Maybe<Maybe<U>>
     */
    auto join() const requires detail::IsMaybe<T>::value {
        if (!value_) return T();
        return *value_;
    }

    /**
     * @brief Some(v) -> Ok(v)，None -> Err(error)
     */
    template<typename E>
    Result<T, std::decay_t<E>> okOr(E&& error) const {
        if (value_) return Result<T, std::decay_t<E>>(OkTag<T>{*value_});
        return Result<T, std::decay_t<E>>(ErrTag<std::decay_t<E>>{std::forward<E>(error)});
    }

    friend bool operator==(const Maybe& lhs, const Maybe& rhs)
        requires std::equality_comparable<T>
    {
        return lhs.value_ == rhs.value_;
    }

private:
    std::optional<T> value_;
};

template<typename T>
Maybe<std::decay_t<T>> some(T&& value) {
    return Maybe<std::decay_t<T>>::just(std::forward<T>(value));
}
