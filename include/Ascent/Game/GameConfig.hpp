/**
 * @file GameConfig.hpp
 * @brief Validated server settings
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * Settings come from three layers, later ones winning:
 *   1. built-in defaults
 *   2. a `key = value` file read by Config::ConfigLoader
 *   3. environment variables ASCENT_<KEY> (e.g. ASCENT_EDGE_FACTOR), plus
 *      the plain PORT variable for the player port
 */

#pragma once

#ifndef ASCENT_GAME_GAME_CONFIG_HPP
#define ASCENT_GAME_GAME_CONFIG_HPP

#include <Ascent/Core/Config.hpp>
#include <Ascent/Core/ErrorCodes.hpp>
#include <Ascent/Core/Logger.hpp>
#include <Ascent/Core/Types.hpp>
#include <Ascent/Game/GameTypes.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace Ascent::Game {

/// Environment lookup, replaceable in tests
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// Reads the process environment
std::optional<std::string> processEnvironment(const std::string& name);

struct GameConfig {
    // Round lifecycle
    std::string clientSeed = "demo-client";
    double edgeFactor = 0.96;
    int64_t waitingSeconds = 5;
    Milliseconds countdownInterval{1000};
    Milliseconds tickInterval{100};
    Multiplier multiplierStep = 1;
    Milliseconds crashPause{3000};

    // Ledger
    Cents startingBalance = 1000 * CENTS_PER_UNIT;
    Cents maxBet = 0;

    // Network
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 3000;
    uint16_t adminPort = 3001;         ///< 0 disables the admin interface
    size_t sessionQueueDepth = 256;

    // Persistence
    size_t persistenceQueueDepth = 4096;
    std::string persistencePath = "ascent_rounds.jsonl";

    // Logging
    Core::LogLevel logLevel = Core::LogLevel::Info;
    std::string logFile;

    /**
     * @brief Check ranges and relations between settings
     * @return ConfigInvalid on the first violation
     */
    Result<void> validate() const;

    /**
     * @brief Build settings from a parsed map and the environment
     * @return Settings, or ConfigInvalid for a wrongly typed or out-of-range value
     */
    static Result<GameConfig> fromMap(const Config::ConfigMap& values,
                                      const EnvironmentLookup& environment = processEnvironment);

    /**
     * @brief Read a file (empty path = defaults only) and build settings
     */
    static Result<GameConfig> load(const std::string& path,
                                   const EnvironmentLookup& environment = processEnvironment);
};

} // namespace Ascent::Game

#endif // ASCENT_GAME_GAME_CONFIG_HPP
