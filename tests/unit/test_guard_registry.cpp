#include "common/guard/GuardEvaluator.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

GuardRule rule(const std::string& name, std::vector<Json::Value> args = {}, bool negate = false) {
    return GuardRule{name, negate, std::move(args)};
}

bool isAdult(const Json::Value& value, const std::vector<Json::Value>&) {
    return value.isNumeric() && value.asInt() >= 18;
}

class DivisibleGuard : public AbstractGuard {
public:
    explicit DivisibleGuard(GuardRule rule) : AbstractGuard(std::move(rule)) {
        expectArgs(1);
        divisor_ = numberArg(0).asInt64();
        if (divisor_ == 0) throw MalformedRuleException("divisor must not be zero");
    }

    bool isSatisfiedBy(const Json::Value& value) const override {
        return value.isIntegral() && value.asInt64() % divisor_ == 0;
    }

    std::string messageTemplate() const override { return "{name} must{not}be divisible by {divisor}"; }

protected:
    std::map<std::string, std::string> injections() const override {
        return {{"divisor", std::to_string(divisor_)}};
    }

private:
    int64_t divisor_ = 1;
};

}  // namespace

TEST(GuardRegistry, RegisterPredicateAndResolve) {
    GuardRegistry registry;
    registry.registerPredicate("adult", "{name} must{not}be an adult", isAdult);

    EXPECT_TRUE(registry.has("adult"));
    auto guard = registry.resolve(rule("adult"));
    EXPECT_TRUE(guard->check("age", 20));
    auto failed = guard->check("age", 12);
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.message, "age must be an adult");
}

TEST(GuardRegistry, PredicateSeesArgumentsAndPlaceholders) {
    GuardRegistry registry;
    registry.registerPredicate("startswith", "{name} must{not}start with {0}",
                               [](const Json::Value& value, const std::vector<Json::Value>& args) {
                                   return value.isString() && value.asString().rfind(args.at(0).asString(), 0) == 0;
                               });

    auto guard = registry.resolve(rule("startswith", {Json::Value("ab")}));
    EXPECT_TRUE(guard->check("code", "abc"));
    EXPECT_EQ(guard->check("code", "xyz").message, "code must start with ab");
}

TEST(GuardRegistry, RegisterGuardClass) {
    GuardRegistry registry;
    registry.registerGuard<DivisibleGuard>("divisible");

    auto guard = registry.resolve(rule("divisible", {Json::Value(3)}));
    EXPECT_TRUE(guard->check("n", 9));
    EXPECT_EQ(guard->check("n", 10).message, "n must be divisible by 3");

    auto negated = registry.resolve(rule("divisible", {Json::Value(3)}, true));
    EXPECT_TRUE(negated->check("n", 10));
    EXPECT_EQ(negated->check("n", 9).message, "n must not be divisible by 3");

    EXPECT_THROW(registry.resolve(rule("divisible", {Json::Value(0)})), MalformedRuleException);
    EXPECT_THROW(registry.resolve(rule("divisible")), MalformedRuleException);
}

TEST(GuardRegistry, UnknownNameThrows) {
    GuardRegistry registry;
    try {
        registry.resolve(rule("bogus_rule"));
        FAIL() << "expected UnknownGuardException";
    } catch (const UnknownGuardException& e) {
        EXPECT_EQ(e.name(), "bogus_rule");
        EXPECT_EQ(e.getCode(), ErrorCodes::UNKNOWN_GUARD);
    }
}

TEST(GuardRegistry, DuplicateRejectedByDefault) {
    GuardRegistry registry;
    registry.registerPredicate("adult", "{name} must{not}be an adult", isAdult);

    EXPECT_EQ(registry.duplicatePolicy(), DuplicatePolicy::Error);
    EXPECT_THROW(registry.registerPredicate("adult", "other", isAdult), DuplicateNameException);

    auto result = registry.tryRegister("adult", [](const GuardRule& r) -> std::unique_ptr<IGuard> {
        return std::make_unique<PredicateGuard>(r, "x", isAdult);
    });
    ASSERT_TRUE(result.isErr());
    EXPECT_NE(result.error().find("already defined"), std::string::npos);

    EXPECT_EQ(registry.resolve(rule("adult"))->messageTemplate(), "{name} must{not}be an adult");
}

TEST(GuardRegistry, ReplacePolicyOverwrites) {
    GuardRegistry registry;
    registry.setDuplicatePolicy(DuplicatePolicy::Replace);
    registry.registerPredicate("adult", "first", isAdult);
    registry.registerPredicate("adult", "second", isAdult);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.resolve(rule("adult"))->messageTemplate(), "second");
}

TEST(GuardRegistry, TryRegisterSucceeds) {
    GuardRegistry registry;
    auto result = registry.tryRegister("divisible", [](const GuardRule& r) -> std::unique_ptr<IGuard> {
        return std::make_unique<DivisibleGuard>(r);
    });
    EXPECT_TRUE(result.isOk());
    EXPECT_TRUE(registry.has("divisible"));
}

TEST(GuardRegistry, InvalidRegistrations) {
    GuardRegistry registry;
    EXPECT_THROW(registry.registerPredicate("bad-name", "x", isAdult), MalformedRuleException);
    EXPECT_THROW(registry.registerPredicate("", "x", isAdult), MalformedRuleException);
    EXPECT_THROW(registry.registerGuard("empty_factory", GuardFactory{}), MalformedRuleException);
    EXPECT_THROW(registry.registerPredicate("no_predicate", "x", GuardPredicate{}), MalformedRuleException);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(GuardRegistry, FreezeRejectsChanges) {
    GuardRegistry registry;
    registry.registerPredicate("adult", "x", isAdult);
    registry.freeze();

    EXPECT_TRUE(registry.isFrozen());
    EXPECT_THROW(registry.registerPredicate("child", "x", isAdult), RegistryFrozenException);
    EXPECT_THROW(registry.unregister("adult"), RegistryFrozenException);
    EXPECT_TRUE(registry.tryRegister("child", [](const GuardRule& r) -> std::unique_ptr<IGuard> {
        return std::make_unique<PredicateGuard>(r, "x", isAdult);
    }).isErr());

    EXPECT_NO_THROW(registry.resolve(rule("adult")));
}

TEST(GuardRegistry, UnregisterAndNames) {
    GuardRegistry registry;
    registry.registerPredicate("zeta", "x", isAdult);
    registry.registerPredicate("alpha", "x", isAdult);

    EXPECT_EQ(registry.names(), (std::vector<std::string>{"alpha", "zeta"}));
    EXPECT_TRUE(registry.unregister("zeta"));
    EXPECT_FALSE(registry.unregister("zeta"));
    EXPECT_FALSE(registry.has("zeta"));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(GuardRegistry, ParsePolicy) {
    EXPECT_EQ(GuardRegistry::parsePolicy("error").get(), DuplicatePolicy::Error);
    EXPECT_EQ(GuardRegistry::parsePolicy(" Replace ").get(), DuplicatePolicy::Replace);
    EXPECT_TRUE(GuardRegistry::parsePolicy("ignore").isNone());
}

TEST(GuardRegistry, InstanceHasBuiltins) {
    auto& registry = GuardRegistry::instance();
    for (const char* name : {"required", "empty", "length", "between", "regex", "in", "eq",
                             "le", "lt", "ge", "gt", "odd", "even", "positive", "negative"}) {
        EXPECT_TRUE(registry.has(name)) << name;
    }
    EXPECT_EQ(&registry, &GuardRegistry::instance());
}

TEST(GuardRegistry, ConcurrentResolve) {
    GuardRegistry registry;
    BuiltinGuards::registerAll(registry);
    registry.freeze();

    std::atomic<int> satisfied{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&registry, &satisfied] {
            for (int i = 0; i < 500; ++i) {
                auto guard = registry.resolve(GuardRule{"lt", false, {Json::Value(18)}});
                if (guard->check("age", 10)) ++satisfied;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(satisfied.load(), 8 * 500);
}
