/**
 * @file AdminReports.hpp
 * @brief JSON documents served by the administrative interface
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#pragma once

#ifndef ASCENT_GAME_ADMIN_REPORTS_HPP
#define ASCENT_GAME_ADMIN_REPORTS_HPP

#include <Ascent/Core/ErrorCodes.hpp>
#include <Ascent/Game/BroadcastHub.hpp>
#include <Ascent/Game/GameTypes.hpp>
#include <Ascent/Game/RoundEngine.hpp>
#include <Ascent/Game/RoundStore.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Ascent::Game {

/**
 * @brief Claimed outcome of a finished round, as submitted by an auditor
 */
struct VerifyRequest {
    std::string serverSeed;
    std::string serverSeedHash;
    std::string clientSeed;
    std::string crashPoint;     ///< Decimal text, e.g. "2.88"
};

/**
 * @brief `{active_users, users: {id: {balance, activeBet, cashedOut}}}`
 *
 * activeBet is null when the session has no wager this round.
 */
nlohmann::json usersReport(const std::vector<SessionView>& sessions);

/**
 * @brief Engine phase, round, multiplier, connected sessions and
 *        delivery counters
 * @param persistence Omitted from the report when not set
 */
nlohmann::json statusReport(const EngineSnapshot& engine,
                            size_t sessions,
                            const BroadcastStatistics& broadcast,
                            const std::optional<PersistenceStatistics>& persistence);

/**
 * @brief Recompute a round from its revealed inputs
 * @return `{verified, expectedCrashPoint, ...}`, or MissingField /
 *         InvalidAmount when the request is incomplete or the crash point
 *         is not a decimal with at most two places
 */
Result<nlohmann::json> verifyReport(const VerifyRequest& request, double edgeFactor);

} // namespace Ascent::Game

#endif // ASCENT_GAME_ADMIN_REPORTS_HPP
