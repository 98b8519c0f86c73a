#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "test_support.hpp"

namespace {

using cuebridge::core::config::BridgeConfig;
using cuebridge::core::config::CheckExitPolicy;
using cuebridge::core::config::load_config;
using cuebridge::core::config::parse_check_exit_policy;
using cuebridge::core::config::parse_config;
using cuebridge::core::errors::ErrorCategory;
using cuebridge::core::errors::get_error;
using cuebridge::core::errors::get_value;
using cuebridge::core::errors::is_error;
using cuebridge::core::logging::LogLevel;
using cuebridge::testing::TempWorkspace;
using cuebridge::testing::write_file;

TEST(BridgeConfigTest, EmptyObjectKeepsDefaults) {
    auto result = parse_config("{}");
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_TRUE(config.executable_path.empty());
    EXPECT_EQ(config.tool_name, "cue");
    EXPECT_EQ(config.timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.check_exit_policy, CheckExitPolicy::Parse);
    EXPECT_FALSE(config.message_bundle.has_value());
    EXPECT_EQ(config.log_level, LogLevel::WARN);
}

TEST(BridgeConfigTest, ReadsAllFields) {
    auto result = parse_config(R"({
        "executable_path": "/opt/cue/bin/cue",
        "tool_name": "cue-nightly",
        "timeout_ms": 1500,
        "check_exit_policy": "discard",
        "message_bundle": "/etc/cue_bridge/messages.json",
        "log_level": "debug",
        "unrelated": true
    })");
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.executable_path, "/opt/cue/bin/cue");
    EXPECT_EQ(config.tool_name, "cue-nightly");
    EXPECT_EQ(config.timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(config.check_exit_policy, CheckExitPolicy::Discard);
    ASSERT_TRUE(config.message_bundle.has_value());
    EXPECT_EQ(config.message_bundle->string(), "/etc/cue_bridge/messages.json");
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST(BridgeConfigTest, RejectsInvalidJson) {
    auto result = parse_config("{ not json");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "invalid_config_json");

    auto array = parse_config("[1, 2]");
    ASSERT_TRUE(is_error(array));
    EXPECT_EQ(get_error(array).code, "invalid_config_json");
}

TEST(BridgeConfigTest, RejectsWrongFieldTypes) {
    EXPECT_EQ(get_error(parse_config(R"({"timeout_ms": "fast"})")).code, "invalid_config_field");
    EXPECT_EQ(get_error(parse_config(R"({"timeout_ms": 0})")).code, "invalid_config_field");
    EXPECT_EQ(get_error(parse_config(R"({"timeout_ms": -5})")).code, "invalid_config_field");
    EXPECT_EQ(get_error(parse_config(R"({"executable_path": 3})")).code, "invalid_config_field");
    EXPECT_EQ(get_error(parse_config(R"({"tool_name": ""})")).code, "invalid_config_field");
}

TEST(BridgeConfigTest, RejectsUnknownEnumValues) {
    auto policy = parse_config(R"({"check_exit_policy": "maybe"})");
    ASSERT_TRUE(is_error(policy));
    EXPECT_EQ(get_error(policy).code, "invalid_check_exit_policy");
    EXPECT_FALSE(get_error(policy).hint.empty());

    auto level = parse_config(R"({"log_level": "loud"})");
    ASSERT_TRUE(is_error(level));
    EXPECT_EQ(get_error(level).code, "invalid_log_level");
}

TEST(BridgeConfigTest, CheckExitPolicyNamesRoundTrip) {
    for (const auto policy : {CheckExitPolicy::Parse, CheckExitPolicy::Discard}) {
        const auto name = cuebridge::core::config::to_string(policy);
        auto parsed = parse_check_exit_policy(name);
        ASSERT_FALSE(is_error(parsed)) << name;
        EXPECT_EQ(get_value(parsed), policy);
    }
    EXPECT_EQ(cuebridge::core::config::to_string(CheckExitPolicy::Discard), "discard");
}

TEST(BridgeConfigTest, LoadResolvesBundleRelativeToConfigFile) {
    TempWorkspace workspace;
    const auto config_path = workspace.root() / "settings" / "cue_bridge.json";
    write_file(config_path, R"({"message_bundle": "messages.de.json", "timeout_ms": 250})");

    auto result = load_config(config_path);
    ASSERT_FALSE(is_error(result));
    const auto& config = get_value(result);
    ASSERT_TRUE(config.message_bundle.has_value());
    EXPECT_EQ(config.message_bundle.value(),
              workspace.root() / "settings" / "messages.de.json");
    EXPECT_EQ(config.timeout, std::chrono::milliseconds(250));
}

TEST(BridgeConfigTest, LoadReportsMissingFileAndPrefixesParseErrors) {
    TempWorkspace workspace;
    auto missing = load_config(workspace.root() / "absent.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "config_open_failed");

    const auto broken = workspace.root() / "broken.json";
    write_file(broken, "{");
    auto parsed = load_config(broken);
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_config_json");
    EXPECT_NE(get_error(parsed).message.find("broken.json"), std::string::npos);
}

}  // namespace
