/**
 * @file test_game_config.cpp
 * @brief Unit tests for layered server settings
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include "../TestHarness.hpp"
#include <Ascent/Game/GameConfig.hpp>
#include <gtest/gtest.h>
#include <map>
#include <string>

using namespace Ascent;
using namespace Ascent::Game;
using namespace Ascent::Testing;

namespace {

EnvironmentLookup fakeEnvironment(std::map<std::string, std::string> variables) {
    return [variables = std::move(variables)](const std::string& name) -> std::optional<std::string> {
        auto it = variables.find(name);
        if (it == variables.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

const EnvironmentLookup EMPTY_ENVIRONMENT = fakeEnvironment({});

} // namespace

TEST(GameConfig, DefaultsMatchReferenceGame) {
    auto config = GameConfig::fromMap({}, EMPTY_ENVIRONMENT);
    ASSERT_RESULT_SUCCESS(config);

    const GameConfig& c = config.value();
    EXPECT_EQ(c.clientSeed, "demo-client");
    EXPECT_DOUBLE_EQ(c.edgeFactor, 0.96);
    EXPECT_EQ(c.waitingSeconds, 5);
    EXPECT_EQ(c.countdownInterval.count(), 1000);
    EXPECT_EQ(c.tickInterval.count(), 100);
    EXPECT_EQ(c.multiplierStep, 1);
    EXPECT_EQ(c.crashPause.count(), 3000);
    EXPECT_EQ(c.startingBalance, 100000);
    EXPECT_EQ(c.port, 3000);
    EXPECT_EQ(c.logLevel, Core::LogLevel::Info);
}

TEST(GameConfig, FileValuesApplied) {
    TempDirectory dir;
    const std::string path = dir.writeFile("server.conf",
        "client_seed = table-7\n"
        "edge_factor = 1\n"
        "waiting_seconds = 10\n"
        "multiplier_step = 0.05\n"
        "starting_balance = 250.50\n"
        "max_bet = 100\n"
        "port = 8080\n"
        "admin_port = 0\n"
        "log_level = debug\n"
        "persistence_path = \"\"\n");

    auto config = GameConfig::load(path, EMPTY_ENVIRONMENT);
    ASSERT_RESULT_SUCCESS(config);

    const GameConfig& c = config.value();
    EXPECT_EQ(c.clientSeed, "table-7");
    EXPECT_DOUBLE_EQ(c.edgeFactor, 1.0);
    EXPECT_EQ(c.waitingSeconds, 10);
    EXPECT_EQ(c.multiplierStep, 5);
    EXPECT_EQ(c.startingBalance, 25050);
    EXPECT_EQ(c.maxBet, 10000);
    EXPECT_EQ(c.port, 8080);
    EXPECT_EQ(c.adminPort, 0);
    EXPECT_EQ(c.logLevel, Core::LogLevel::Debug);
    EXPECT_TRUE(c.persistencePath.empty());
}

TEST(GameConfig, EnvironmentOverridesFile) {
    Config::ConfigMap values = {
        {"port", Config::ConfigValue{int64_t{8080}}},
        {"edge_factor", Config::ConfigValue{0.9}},
    };

    auto config = GameConfig::fromMap(values, fakeEnvironment({
        {"PORT", "9000"},
        {"ASCENT_EDGE_FACTOR", "0.99"},
        {"ASCENT_CLIENT_SEED", "from-env"},
    }));
    ASSERT_RESULT_SUCCESS(config);

    EXPECT_EQ(config.value().port, 9000);
    EXPECT_DOUBLE_EQ(config.value().edgeFactor, 0.99);
    EXPECT_EQ(config.value().clientSeed, "from-env");
}

TEST(GameConfig, PrefixedPortWinsOverPlainPort) {
    auto config = GameConfig::fromMap({}, fakeEnvironment({
        {"PORT", "9000"},
        {"ASCENT_PORT", "9100"},
    }));
    ASSERT_RESULT_SUCCESS(config);
    EXPECT_EQ(config.value().port, 9100);
}

TEST(GameConfig, UnknownKeysIgnored) {
    Config::ConfigMap values = {{"colour", Config::ConfigValue{std::string("blue")}}};
    EXPECT_TRUE(GameConfig::fromMap(values, EMPTY_ENVIRONMENT).isSuccess());
}

TEST(GameConfig, WronglyTypedValuesRejected) {
    EXPECT_RESULT_ERROR(GameConfig::fromMap({{"port", Config::ConfigValue{std::string("http")}}},
                                            EMPTY_ENVIRONMENT),
                        ErrorCode::ConfigInvalid);
    EXPECT_RESULT_ERROR(GameConfig::fromMap({{"port", Config::ConfigValue{int64_t{70000}}}},
                                            EMPTY_ENVIRONMENT),
                        ErrorCode::ConfigInvalid);
    EXPECT_RESULT_ERROR(GameConfig::fromMap({{"edge_factor", Config::ConfigValue{true}}},
                                            EMPTY_ENVIRONMENT),
                        ErrorCode::ConfigInvalid);
    EXPECT_RESULT_ERROR(GameConfig::fromMap({{"max_bet", Config::ConfigValue{1.005}}},
                                            EMPTY_ENVIRONMENT),
                        ErrorCode::ConfigInvalid);
    EXPECT_RESULT_ERROR(GameConfig::fromMap({{"log_level", Config::ConfigValue{std::string("loud")}}},
                                            EMPTY_ENVIRONMENT),
                        ErrorCode::ConfigInvalid);
    EXPECT_RESULT_ERROR(GameConfig::fromMap({}, fakeEnvironment({{"PORT", "abc"}})),
                        ErrorCode::ConfigInvalid);
}

TEST(GameConfig, ClientSeedMustBeUtf8) {
    EXPECT_RESULT_ERROR(GameConfig::fromMap({{"client_seed", Config::ConfigValue{std::string("seed\xff")}}},
                                            EMPTY_ENVIRONMENT),
                        ErrorCode::ConfigInvalid);
    EXPECT_RESULT_ERROR(GameConfig::fromMap({}, fakeEnvironment({{"ASCENT_CLIENT_SEED", "seed\xff"}})),
                        ErrorCode::ConfigInvalid);

    auto accented = GameConfig::fromMap({}, fakeEnvironment({{"ASCENT_CLIENT_SEED", "caf\xc3\xa9"}}));
    ASSERT_RESULT_SUCCESS(accented);
    EXPECT_EQ(accented.value().clientSeed, "caf\xc3\xa9");
}

TEST(GameConfig, ValidationRejectsOutOfRange) {
    const std::map<std::string, Config::ConfigValue> invalid = {
        {"edge_factor", Config::ConfigValue{1.5}},
        {"waiting_seconds", Config::ConfigValue{int64_t{0}}},
        {"tick_interval_ms", Config::ConfigValue{int64_t{0}}},
        {"multiplier_step", Config::ConfigValue{int64_t{0}}},
        {"crash_pause_ms", Config::ConfigValue{int64_t{-1}}},
        {"starting_balance", Config::ConfigValue{int64_t{-10}}},
        {"port", Config::ConfigValue{int64_t{0}}},
        {"admin_port", Config::ConfigValue{int64_t{3000}}},
        {"session_queue_depth", Config::ConfigValue{int64_t{0}}},
    };

    for (const auto& [key, value] : invalid) {
        Config::ConfigMap values = {{key, value}};
        EXPECT_RESULT_ERROR(GameConfig::fromMap(values, EMPTY_ENVIRONMENT),
                            ErrorCode::ConfigInvalid);
    }
}

TEST(GameConfig, MissingFileReported) {
    TempDirectory dir;
    EXPECT_RESULT_ERROR(GameConfig::load(dir.path() + "/absent.conf", EMPTY_ENVIRONMENT),
                        ErrorCode::ConfigFileNotFound);
}

TEST(GameConfig, EmptyPathUsesDefaults) {
    auto config = GameConfig::load("", fakeEnvironment({{"ASCENT_WAITING_SECONDS", "3"}}));
    ASSERT_RESULT_SUCCESS(config);
    EXPECT_EQ(config.value().waitingSeconds, 3);
}
