#include "common/monads/Either.hpp"

#include <gtest/gtest.h>
#include <string>

using Parsed = Either<std::string, int>;

TEST(Either, LeftAndRight) {
    Parsed l = left(std::string("bad input"));
    Parsed r = right(5);

    EXPECT_TRUE(l.isLeft());
    EXPECT_FALSE(l.isRight());
    EXPECT_FALSE(static_cast<bool>(l));
    EXPECT_EQ(l.leftValue(), "bad input");

    EXPECT_TRUE(r.isRight());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.rightValue(), 5);
}

TEST(Either, WrongArmThrows) {
    Parsed l = left(std::string("x"));
    Parsed r = right(1);
    EXPECT_THROW(l.rightValue(), UnwrapException);
    EXPECT_THROW(r.leftValue(), UnwrapException);
}

TEST(Either, MapActsOnRight) {
    Parsed r = right(5);
    EXPECT_EQ(r.map([](int x) { return x * 3; }).rightValue(), 15);

    int calls = 0;
    Parsed l = left(std::string("x"));
    auto mapped = l.map([&calls](int x) {
        ++calls;
        return x;
    });
    EXPECT_TRUE(mapped.isLeft());
    EXPECT_EQ(calls, 0);
}

TEST(Either, MapLeftActsOnLeft) {
    Parsed l = left(std::string("abc"));
    auto mapped = l.mapLeft([](const std::string& s) { return s.size(); });
    EXPECT_EQ(mapped.leftValue(), 3u);

    Parsed r = right(2);
    EXPECT_EQ(r.mapLeft([](const std::string& s) { return s.size(); }).rightValue(), 2);
}

TEST(Either, BindShortCircuitsOnLeft) {
    auto half = [](int x) -> Parsed {
        if (x % 2 != 0) return left(std::string("odd"));
        return right(x / 2);
    };

    Parsed r = right(8);
    EXPECT_EQ(r.bind(half).bind(half).rightValue(), 2);

    Parsed odd = right(3);
    EXPECT_EQ(odd.bind(half).bind(half).leftValue(), "odd");
}

TEST(Either, Fold) {
    auto describe = [](const Parsed& p) {
        return p.fold([](const std::string& e) { return "error: " + e; },
                      [](int x) { return "value: " + std::to_string(x); });
    };
    EXPECT_EQ(describe(right(4)), "value: 4");
    EXPECT_EQ(describe(left(std::string("oops"))), "error: oops");
}

TEST(Either, ToResult) {
    Parsed r = right(9);
    Parsed l = left(std::string("no"));
    EXPECT_EQ(r.toResult().unwrap(), 9);
    EXPECT_EQ(l.toResult().error(), "no");
}

TEST(Either, Equality) {
    Parsed a = right(1);
    Parsed b = right(1);
    Parsed c = left(std::string("1"));
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == c);
}
