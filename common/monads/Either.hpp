#pragma once

#include "Result.hpp"

template<typename L>
struct LeftTag {
    L value;
};

template<typename R>
struct RightTag {
    R value;
};

template<typename L>
LeftTag<std::decay_t<L>> left(L&& value) {
    return {std::forward<L>(value)};
}

template<typename R>
RightTag<std::decay_t<R>> right(R&& value) {
    return {std::forward<R>(value)};
}

/**
 * @brief 不相交并集：Left(L) 或 Right(R)
 *
 * 约定 Right 为"正确"分支，map / bind 只作用于 Right，Left 原样短路。
 * 与 Result 的区别在于 Left 不要求是错误类型，可以携带任意信息。
 */
template<typename L, typename R>
class Either {
public:
    using left_type = L;
    using right_type = R;

    template<typename U>
        requires std::constructible_from<L, U&&>
    Either(LeftTag<U> tag)
        : storage_(std::in_place_index<0>, std::move(tag.value)) {}

    template<typename U>
        requires std::constructible_from<R, U&&>
    Either(RightTag<U> tag)
        : storage_(std::in_place_index<1>, std::move(tag.value)) {}

    bool isLeft() const noexcept { return storage_.index() == 0; }
    bool isRight() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return isRight(); }

    const L& leftValue() const {
        if (isRight()) throw UnwrapException("Cannot get left value of a Right");
        return std::get<0>(storage_);
    }

    const R& rightValue() const {
        if (isLeft()) throw UnwrapException("Cannot get right value of a Left");
        return std::get<1>(storage_);
    }

    template<typename F>
    auto map(F&& f) const -> Either<L, std::remove_cvref_t<std::invoke_result_t<F, const R&>>> {
        using S = std::remove_cvref_t<std::invoke_result_t<F, const R&>>;
        if (isLeft()) return Either<L, S>(LeftTag<L>{std::get<0>(storage_)});
        return Either<L, S>(RightTag<S>{std::invoke(std::forward<F>(f), std::get<1>(storage_))});
    }

    template<typename F>
    auto mapLeft(F&& f) const -> Either<std::remove_cvref_t<std::invoke_result_t<F, const L&>>, R> {
        using K = std::remove_cvref_t<std::invoke_result_t<F, const L&>>;
        if (isRight()) return Either<K, R>(RightTag<R>{std::get<1>(storage_)});
        return Either<K, R>(LeftTag<K>{std::invoke(std::forward<F>(f), std::get<0>(storage_))});
    }

    template<typename F>
    auto bind(F&& f) const -> std::remove_cvref_t<std::invoke_result_t<F, const R&>> {
        using E = std::remove_cvref_t<std::invoke_result_t<F, const R&>>;
        if (isLeft()) return E(LeftTag<L>{std::get<0>(storage_)});
        return std::invoke(std::forward<F>(f), std::get<1>(storage_));
    }

    template<typename FL, typename FR>
    auto fold(FL&& onLeft, FR&& onRight) const {
        if (isLeft()) return std::invoke(std::forward<FL>(onLeft), std::get<0>(storage_));
        return std::invoke(std::forward<FR>(onRight), std::get<1>(storage_));
    }

    /**
     * @brief Right -> Ok，Left -> Err
     */
    Result<R, L> toResult() const {
        if (isRight()) return Result<R, L>(OkTag<R>{std::get<1>(storage_)});
        return Result<R, L>(ErrTag<L>{std::get<0>(storage_)});
    }

    friend bool operator==(const Either& lhs, const Either& rhs)
        requires std::equality_comparable<L> && std::equality_comparable<R>
    {
        return lhs.storage_ == rhs.storage_;
    }

private:
    std::variant<L, R> storage_;
};
