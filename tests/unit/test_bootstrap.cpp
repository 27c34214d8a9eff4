#include "common/Bootstrap.hpp"
#include "common/guard/GuardEvaluator.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace {

class BootstrapTest : public ::testing::Test {
protected:
    void TearDown() override {
        ConfigManager::reset();
        if (!path_.empty()) {
            std::filesystem::remove(path_);
        }
    }

    std::string writeConfig(const std::string& content) {
        path_ = (std::filesystem::temp_directory_path() / "olympus_bootstrap_test.json").string();
        std::ofstream out(path_);
        out << content;
        return path_;
    }

    static void registerAdult(GuardRegistry& registry) {
        BuiltinGuards::registerAll(registry);
        registry.registerPredicate("adult", "{name} must{not}be an adult",
                                   [](const Json::Value& value, const std::vector<Json::Value>&) {
                                       return value.isNumeric() && value.asInt() >= 18;
                                   });
    }

private:
    std::string path_;
};

}  // namespace

TEST_F(BootstrapTest, InitializeRegistersAndFreezes) {
    auto path = writeConfig(R"({ "log": { "level": "INFO" }, "guards": { "freeze_after_init": true } })");
    GuardRegistry registry;

    ASSERT_TRUE(Bootstrap::initialize(path, registerAdult, registry));
    EXPECT_TRUE(registry.isFrozen());
    EXPECT_TRUE(registry.has("adult"));
    EXPECT_TRUE(registry.has("required"));
    EXPECT_THROW(registry.registerPredicate("late", "x", [](const Json::Value&, const std::vector<Json::Value>&) {
        return true;
    }), RegistryFrozenException);

    Json::Value values;
    values["age"] = 12;
    auto result = GuardEvaluator(registry).evaluate(values, ValidationSpec{{"age", "required|adult"}});
    ASSERT_TRUE(result.isErr());
    EXPECT_EQ(result.error().messageFor("age").get(), "age must be an adult");
}

TEST_F(BootstrapTest, SetupRejectedOnceFrozen) {
    auto path = writeConfig("{}");
    GuardRegistry registry;
    ASSERT_TRUE(Bootstrap::initialize(path, registerAdult, registry));
    EXPECT_FALSE(Bootstrap::initialize(path, registerAdult, registry));
    EXPECT_TRUE(Bootstrap::initialize(path, {}, registry));
}

TEST_F(BootstrapTest, AppliesConfigToRegistry) {
    auto path = writeConfig(R"({ "guards": { "duplicate_policy": "replace", "freeze_after_init": false } })");
    GuardRegistry registry;

    ASSERT_TRUE(Bootstrap::initialize(path, {}, registry));
    EXPECT_FALSE(registry.isFrozen());
    EXPECT_EQ(registry.duplicatePolicy(), DuplicatePolicy::Replace);
}

TEST_F(BootstrapTest, InvalidConfigFails) {
    auto path = writeConfig(R"({ "guards": { "duplicate_policy": "ignore" } })");
    GuardRegistry registry;

    EXPECT_FALSE(Bootstrap::initialize(path, registerAdult, registry));
    EXPECT_FALSE(registry.isFrozen());
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(BootstrapTest, FailingSetupReportsFalse) {
    auto path = writeConfig(R"({ "guards": { "freeze_after_init": false } })");
    GuardRegistry registry;
    auto duplicate = [](GuardRegistry& r) {
        registerAdult(r);
        registerAdult(r);
    };

    EXPECT_FALSE(Bootstrap::initialize(path, duplicate, registry));
}

TEST_F(BootstrapTest, ShutdownUnbindsHandlers) {
    EventBus bus;
    bus.bind<DomainEvent>([](const DomainEvent&) {});
    EXPECT_EQ(bus.handlerCount<DomainEvent>(), 1u);

    Bootstrap::shutdown(bus);
    EXPECT_EQ(bus.handlerCount<DomainEvent>(), 0u);
}
