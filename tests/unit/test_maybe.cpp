#include "common/monads/Maybe.hpp"

#include <gtest/gtest.h>
#include <functional>
#include <string>

TEST(Maybe, SomeHoldsValue) {
    auto m = some(42);
    EXPECT_TRUE(m.isSome());
    EXPECT_FALSE(m.isNone());
    EXPECT_TRUE(static_cast<bool>(m));
    EXPECT_EQ(m.get(), 42);
}

TEST(Maybe, NoneConvertsToAnyMaybe) {
    Maybe<int> n = none();
    Maybe<std::string> s = none();
    EXPECT_TRUE(n.isNone());
    EXPECT_TRUE(s.isNone());
    EXPECT_FALSE(static_cast<bool>(n));
}

TEST(Maybe, MapTransformsSome) {
    auto doubled = some(21).map([](int x) { return x * 2; });
    EXPECT_EQ(doubled.getOr(0), 42);
}

TEST(Maybe, MapSkipsNone) {
    int calls = 0;
    Maybe<int> n = none();
    auto mapped = n.map([&calls](int x) {
        ++calls;
        return std::to_string(x);
    });
    EXPECT_TRUE(mapped.isNone());
    EXPECT_EQ(mapped.getOr("fallback"), "fallback");
    EXPECT_EQ(calls, 0);
}

TEST(Maybe, GetOrReturnsDefaultOnNone) {
    Maybe<int> n = none();
    EXPECT_EQ(n.getOr(7), 7);
    EXPECT_EQ(some(3).getOr(7), 3);
}

TEST(Maybe, GetOrElseIsLazy) {
    int calls = 0;
    auto fallback = [&calls] {
        ++calls;
        return 9;
    };
    EXPECT_EQ(some(1).getOrElse(fallback), 1);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(Maybe<int>().getOrElse(fallback), 9);
    EXPECT_EQ(calls, 1);
}

TEST(Maybe, GetOnNoneThrows) {
    Maybe<int> n = none();
    EXPECT_THROW(n.get(), MissingValueException);
}

TEST(Maybe, BindChainsAndShortCircuits) {
    auto positive = [](int x) -> Maybe<int> {
        if (x > 0) return some(x);
        return none();
    };
    EXPECT_EQ(some(5).bind(positive).getOr(0), 5);
    EXPECT_TRUE(some(-5).bind(positive).isNone());
    EXPECT_TRUE(Maybe<int>().flatMap(positive).isNone());
}

TEST(Maybe, JoinFlattens) {
    Maybe<Maybe<int>> nested = some(some(3));
    EXPECT_EQ(nested.join(), some(3));

    Maybe<Maybe<int>> outerNone = none();
    EXPECT_TRUE(outerNone.join().isNone());
}

TEST(Maybe, WithBool) {
    EXPECT_EQ(Maybe<int>::withBool(true, 4), some(4));
    EXPECT_TRUE(Maybe<int>::withBool(false, 4).isNone());
}

TEST(Maybe, Equality) {
    EXPECT_TRUE(Maybe<int>() == Maybe<int>(none()));
    EXPECT_TRUE(some(1) == some(1));
    EXPECT_FALSE(some(1) == some(2));
    EXPECT_FALSE(some(1) == Maybe<int>());
}

TEST(Maybe, OkOrConvertsToResult) {
    auto present = some(8).okOr(std::string("missing"));
    EXPECT_TRUE(present.isOk());
    EXPECT_EQ(present.value(), 8);

    auto missing = Maybe<int>().okOr(std::string("missing"));
    EXPECT_TRUE(missing.isErr());
    EXPECT_EQ(missing.error(), "missing");
}

TEST(Maybe, AmapAppliesWrappedFunction) {
    auto increment = some(std::function<int(int)>([](int x) { return x + 1; }));
    EXPECT_EQ(increment.amap(some(1)), some(2));
    EXPECT_TRUE(increment.amap(Maybe<int>()).isNone());

    Maybe<std::function<int(int)>> missing;
    EXPECT_TRUE(missing.amap(some(1)).isNone());
    EXPECT_TRUE(missing.amap(Maybe<int>()).isNone());
}

TEST(Maybe, AmapChangesValueType) {
    auto describe = some([](int n) { return std::string(static_cast<size_t>(n), '*'); });
    auto stars = describe.amap(some(3));
    ASSERT_TRUE(stars.isSome());
    EXPECT_EQ(stars.get(), "***");
}
