#pragma once

#include "common/utils/AppException.hpp"

/**
 * @brief 无值成功的占位类型（Result<Unit, E> 表示"已通过"）
 */
struct Unit {
    friend bool operator==(const Unit&, const Unit&) = default;
};

/**
 * @brief ok(v) / err(e) 构造出的中间标记，可隐式转换为任意兼容的 Result
 */
template<typename T>
struct OkTag {
    T value;
};

template<typename E>
struct ErrTag {
    E error;
};

template<typename T>
OkTag<std::decay_t<T>> ok(T&& value) {
    return {std::forward<T>(value)};
}

inline OkTag<Unit> ok() {
    return {Unit{}};
}

template<typename E>
ErrTag<std::decay_t<E>> err(E&& error) {
    return {std::forward<E>(error)};
}

template<typename T>
class Maybe;

template<typename T, typename E>
class Result;

namespace detail {

template<typename X>
struct IsResult : std::false_type {};

template<typename T, typename E>
struct IsResult<Result<T, E>> : std::true_type {};

template<typename X>
inline constexpr bool isResult = IsResult<std::remove_cvref_t<X>>::value;

/**
 * @brief 调用 f(value)；f 不接受参数时调用 f()
 */
template<typename F, typename V>
decltype(auto) invokeWithValue(F&& f, V&& value) {
    if constexpr (std::is_invocable_v<F, V>) {
        return std::invoke(std::forward<F>(f), std::forward<V>(value));
    } else {
        return std::invoke(std::forward<F>(f));
    }
}

template<typename F, typename V>
using InvokeValueT = std::remove_cvref_t<decltype(invokeWithValue(std::declval<F>(), std::declval<V>()))>;

/**
 * @brief 同 invokeWithValue，但 void 返回值映射为 Unit
 */
template<typename F, typename V>
auto invokeMapped(F&& f, V&& value) {
    if constexpr (std::is_void_v<decltype(invokeWithValue(std::forward<F>(f), std::forward<V>(value)))>) {
        invokeWithValue(std::forward<F>(f), std::forward<V>(value));
        return Unit{};
    } else {
        return invokeWithValue(std::forward<F>(f), std::forward<V>(value));
    }
}

template<typename F, typename V>
using MappedT = decltype(invokeMapped(std::declval<F>(), std::declval<V>()));

/**
 * @brief 把错误值转成可读文本（用于 unwrap 失败时的日志和异常消息）
 */
template<typename E>
std::string describeError(const E& error) {
    if constexpr (std::is_convertible_v<const E&, std::string>) {
        return std::string(error);
    } else if constexpr (requires { { error.toString() } -> std::convertible_to<std::string>; }) {
        return error.toString();
    } else if constexpr (std::is_base_of_v<std::exception, E>) {
        return error.what();
    } else if constexpr (requires(std::ostream& os) { os << error; }) {
        std::ostringstream oss;
        oss << error;
        return oss.str();
    } else {
        return "<unprintable error>";
    }
}

}  // namespace detail

/**
 * @brief 结果单子：Ok(T) 或 Err(E)，二者互斥且构造后不可变
 *
 * 链式调用在第一个 Err 处短路，后续阶段不会执行：
 * @code
 * Result<int, std::string> parsed = parseAge(input);
 * auto adult = parsed
 *     .bind([](int age) -> Result<int, std::string> {
 *         if (age < 18) return err("age must be at least 18");
 *         return ok(age);
 *     })
 *     .map([](int age) { return age * 12; });
 *
 * int months = adult.unwrapOrElse([](const std::string&) { return 0; });
 * @endcode
 */
template<typename T, typename E = std::string>
class Result {
public:
    using value_type = T;
    using error_type = E;

    template<typename U>
        requires std::constructible_from<T, U&&>
    Result(OkTag<U> tag)
        : storage_(std::in_place_index<0>, std::move(tag.value)) {}

    template<typename G>
        requires std::constructible_from<E, G&&>
    Result(ErrTag<G> tag)
        : storage_(std::in_place_index<1>, std::move(tag.error)) {}

    // ========== 工厂方法 ==========

    template<typename U = T>
    static Result ok(U&& value) {
        return Result(OkTag<std::decay_t<U>>{std::forward<U>(value)});
    }

    static Result ok() requires std::same_as<T, Unit> {
        return Result(OkTag<Unit>{Unit{}});
    }

    template<typename G = E>
    static Result err(G&& error) {
        return Result(ErrTag<std::decay_t<G>>{std::forward<G>(error)});
    }

    /**
     * @brief condition 为真时 Ok(value)，否则以同一个值作为错误 Err(value)
     */
    template<typename U>
        requires std::constructible_from<T, U&&> && std::constructible_from<E, U&&>
    static Result withBool(bool condition, U&& value) {
        if (condition) return Result(OkTag<std::decay_t<U>>{std::forward<U>(value)});
        return Result(ErrTag<std::decay_t<U>>{std::forward<U>(value)});
    }

    /**
     * @brief 合并多个结果，全部成功时返回值列表，否则返回第一个失败
     */
    static Result<std::vector<T>, E> combine(const std::vector<Result>& results) {
        std::vector<T> values;
        values.reserve(results.size());
        for (const auto& result : results) {
            if (result.isErr()) {
                return Result<std::vector<T>, E>(ErrTag<E>{result.error()});
            }
            values.push_back(result.value());
        }
        return Result<std::vector<T>, E>(OkTag<std::vector<T>>{std::move(values)});
    }

    // ========== 状态查询 ==========

    bool isOk() const noexcept { return storage_.index() == 0; }
    bool isErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return isOk(); }

    const T& value() const& {
        if (isErr()) failUnwrap();
        return std::get<0>(storage_);
    }

    T&& value() && {
        if (isErr()) failUnwrap();
        return std::get<0>(std::move(storage_));
    }

    const E& error() const& {
        if (isOk()) throw UnwrapException("Cannot get error of a successful result");
        return std::get<1>(storage_);
    }

    E&& error() && {
        if (isOk()) throw UnwrapException("Cannot get error of a successful result");
        return std::get<1>(std::move(storage_));
    }

    // ========== 组合子 ==========

    /**
     * @brief Ok 时调用 f（f 必须返回 Result），Err 时原样短路，不调用 f
     */
    template<typename F>
    auto bind(F&& f) const& -> detail::InvokeValueT<F, const T&> {
        using R = detail::InvokeValueT<F, const T&>;
        static_assert(detail::isResult<R>, "bind() expects a function returning Result");
        if (isOk()) {
            return detail::invokeWithValue(std::forward<F>(f), std::get<0>(storage_));
        }
        return R(ErrTag<E>{std::get<1>(storage_)});
    }

    template<typename F>
    auto bind(F&& f) && -> detail::InvokeValueT<F, T&&> {
        using R = detail::InvokeValueT<F, T&&>;
        static_assert(detail::isResult<R>, "bind() expects a function returning Result");
        if (isOk()) {
            return detail::invokeWithValue(std::forward<F>(f), std::get<0>(std::move(storage_)));
        }
        return R(ErrTag<E>{std::get<1>(std::move(storage_))});
    }

    /**
     * @brief 把普通函数提升到 Ok 分支；返回 void 的函数映射为 Unit
     */
    template<typename F>
    auto map(F&& f) const& -> Result<detail::MappedT<F, const T&>, E> {
        using U = detail::MappedT<F, const T&>;
        if (isOk()) {
            return Result<U, E>(OkTag<U>{detail::invokeMapped(std::forward<F>(f), std::get<0>(storage_))});
        }
        return Result<U, E>(ErrTag<E>{std::get<1>(storage_)});
    }

    template<typename F>
    auto map(F&& f) && -> Result<detail::MappedT<F, T&&>, E> {
        using U = detail::MappedT<F, T&&>;
        if (isOk()) {
            return Result<U, E>(OkTag<U>{
                detail::invokeMapped(std::forward<F>(f), std::get<0>(std::move(storage_)))});
        }
        return Result<U, E>(ErrTag<E>{std::get<1>(std::move(storage_))});
    }

    template<typename F>
    auto mapErr(F&& f) const& -> Result<T, std::remove_cvref_t<std::invoke_result_t<F, const E&>>> {
        using G = std::remove_cvref_t<std::invoke_result_t<F, const E&>>;
        if (isOk()) {
            return Result<T, G>(OkTag<T>{std::get<0>(storage_)});
        }
        return Result<T, G>(ErrTag<G>{std::invoke(std::forward<F>(f), std::get<1>(storage_))});
    }

    /**
     * @brief Err 时用 f 恢复；f 可以返回 Result，也可以返回普通值（视为 Ok）
     */
    template<typename F>
    Result ifErr(F&& f) const& {
        if (isOk()) return *this;
        auto recovered = detail::invokeWithValue(std::forward<F>(f), std::get<1>(storage_));
        if constexpr (detail::isResult<decltype(recovered)>) {
            return recovered;
        } else {
            return Result(OkTag<T>{T(std::move(recovered))});
        }
    }

    /**
     * @brief 条件成立时才 bind；条件可以是 bool，也可以是作用于值的谓词
     */
    template<typename C, typename F>
    Result bindIf(C&& condition, F&& f) const& {
        if (isErr()) return *this;
        bool matched = false;
        if constexpr (std::is_invocable_r_v<bool, C, const T&>) {
            matched = std::invoke(std::forward<C>(condition), std::get<0>(storage_));
        } else {
            matched = static_cast<bool>(condition);
        }
        if (!matched) return *this;
        return bind(std::forward<F>(f));
    }

    // ========== 取值 ==========

    /**
     * @brief 取出成功值；Err 时记录错误并抛出 UnwrapException
     */
    const T& unwrap() const& {
        return value();
    }

    T unwrap() && {
        return std::move(*this).value();
    }

    E unwrapErr() const {
        if (isOk()) throw UnwrapException("Cannot get error of a successful result");
        return std::get<1>(storage_);
    }

    T unwrapOr(T fallback) const& {
        if (isOk()) return std::get<0>(storage_);
        return fallback;
    }

    /**
     * @brief Ok 时返回值，Err 时返回 handler(error) 的结果，不抛异常
     */
    template<typename F>
    T unwrapOrElse(F&& handler) const& {
        if (isOk()) return std::get<0>(storage_);
        return detail::invokeWithValue(std::forward<F>(handler), std::get<1>(storage_));
    }

    template<typename F>
    T unwrapOrElse(F&& handler) && {
        if (isOk()) return std::get<0>(std::move(storage_));
        return detail::invokeWithValue(std::forward<F>(handler), std::get<1>(std::move(storage_)));
    }

    /**
     * @brief 转换为 Maybe（需要包含 Maybe.hpp）
     */
    template<typename M = Maybe<T>>
    M toMaybe() const& {
        if (isOk()) return M::just(std::get<0>(storage_));
        return M::nothing();
    }

    friend bool operator==(const Result& lhs, const Result& rhs)
        requires std::equality_comparable<T> && std::equality_comparable<E>
    {
        return lhs.storage_ == rhs.storage_;
    }

private:
    std::variant<T, E> storage_;

    [[noreturn]] void failUnwrap() const {
        auto description = detail::describeError(std::get<1>(storage_));
        LOG_ERROR << "Result: unwrap on Err: " << description;
        throw UnwrapException("Cannot get value of a failed result: " + description);
    }
};
