#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/core_config.hpp"
#include "test_support.hpp"

namespace {

using statekeep::core::config::CoreConfig;
using statekeep::core::config::load_config_file;
using statekeep::core::config::parse_config;
using statekeep::core::config::to_json_string;
using statekeep::core::config::validate;
using statekeep::core::errors::get_error;
using statekeep::core::errors::get_value;
using statekeep::core::errors::is_error;
using statekeep::testing::TempWorkspace;

TEST(CoreConfigTest, DefaultsAreValid) {
    const CoreConfig config;
    EXPECT_FALSE(is_error(validate(config)));
    EXPECT_EQ(config.base_path.string(), ".statekeep");
    EXPECT_EQ(config.lock_timeout_ms, 5000u);
    EXPECT_EQ(config.heartbeat_interval_ms, 1000u);
    EXPECT_EQ(config.heartbeat_timeout_ms, 3000u);
    EXPECT_EQ(config.lock_retry_attempts, 10u);
    EXPECT_EQ(config.max_history_entries, 50u);
    EXPECT_TRUE(config.cooperative_release);
}

TEST(CoreConfigTest, ParseOverridesOnlyGivenKeys) {
    auto parsed = parse_config(R"({"base_path": "/tmp/state", "lock_timeout_ms": 250,
                                  "max_history_entries": 3, "cooperative_release": false})");
    ASSERT_FALSE(is_error(parsed));
    const auto& config = get_value(parsed);
    EXPECT_EQ(config.base_path.string(), "/tmp/state");
    EXPECT_EQ(config.lock_timeout_ms, 250u);
    EXPECT_EQ(config.max_history_entries, 3u);
    EXPECT_FALSE(config.cooperative_release);
    EXPECT_EQ(config.heartbeat_timeout_ms, 3000u);
}

TEST(CoreConfigTest, RejectsWrongTypes) {
    auto parsed = parse_config(R"({"lock_timeout_ms": "soon"})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "config.invalid");
    EXPECT_EQ(get_error(parsed).context.at("key"), "lock_timeout_ms");

    parsed = parse_config(R"({"enable_heartbeat": 1})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).context.at("key"), "enable_heartbeat");
}

TEST(CoreConfigTest, RejectsNegativeNumbers) {
    auto parsed = parse_config(R"({"max_history_entries": -1})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "config.invalid");
}

TEST(CoreConfigTest, RejectsValuesWiderThanTheField) {
    auto parsed = parse_config(R"({"lock_timeout_ms": 4294967297})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "config.invalid");
    EXPECT_EQ(get_error(parsed).context.at("key"), "lock_timeout_ms");

    parsed = parse_config(R"({"lock_timeout_ms": 4294967295})");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).lock_timeout_ms, 4294967295u);
}

TEST(CoreConfigTest, CooperativeWaitMustFitInsideLockTimeout) {
    CoreConfig config;
    config.lock_timeout_ms = 500;
    config.cooperative_release_timeout_ms = 500;
    auto status = validate(config);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).context.at("key"), "cooperative_release_timeout_ms");

    config.cooperative_release = false;
    EXPECT_FALSE(is_error(validate(config)));
}

TEST(CoreConfigTest, HeartbeatIntervalMustBeBelowTimeout) {
    CoreConfig config;
    config.heartbeat_interval_ms = 3000;
    config.heartbeat_timeout_ms = 3000;
    auto status = validate(config);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).context.at("key"), "heartbeat_interval_ms");
}

TEST(CoreConfigTest, ZeroHistoryIsRejected) {
    CoreConfig config;
    config.max_history_entries = 0;
    EXPECT_TRUE(is_error(validate(config)));
}

TEST(CoreConfigTest, CircuitBreakerSettingsParseAndValidate) {
    auto parsed = parse_config(
        R"({"enable_circuit_breaker": true, "circuit_failure_threshold": 2,
            "circuit_reset_timeout_ms": 5000})");
    ASSERT_FALSE(is_error(parsed));
    const auto& config = get_value(parsed);
    EXPECT_TRUE(config.enable_circuit_breaker);
    EXPECT_EQ(config.circuit_failure_threshold, 2u);
    EXPECT_EQ(config.circuit_reset_timeout_ms, 5000u);
    EXPECT_EQ(config.circuit_half_open_max_attempts, 3u);

    CoreConfig zero;
    zero.circuit_failure_threshold = 0;
    EXPECT_FALSE(is_error(validate(zero)));
    zero.enable_circuit_breaker = true;
    auto status = validate(zero);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).context.at("key"), "circuit_failure_threshold");
}

TEST(CoreConfigTest, RejectsMalformedJson) {
    auto parsed = parse_config("{not json");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "config.invalid");

    parsed = parse_config("[1, 2]");
    ASSERT_TRUE(is_error(parsed));
}

TEST(CoreConfigTest, LoadsFromFileAndRoundTripsThroughJson) {
    TempWorkspace workspace("config");
    CoreConfig original;
    original.base_path = workspace.root() / "state";
    original.lock_expiry_ms = 9000;
    original.max_checkpoints = 4;

    const auto path = workspace.root() / "statekeep.json";
    {
        std::ofstream out(path);
        out << to_json_string(original);
    }

    auto loaded = load_config_file(path);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).base_path, original.base_path);
    EXPECT_EQ(get_value(loaded).lock_expiry_ms, 9000u);
    EXPECT_EQ(get_value(loaded).max_checkpoints, 4u);
}

TEST(CoreConfigTest, MissingFileIsAConfigError) {
    TempWorkspace workspace("config");
    auto loaded = load_config_file(workspace.root() / "absent.json");
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "config.invalid");
}

}  // namespace
