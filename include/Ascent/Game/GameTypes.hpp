/**
 * @file GameTypes.hpp
 * @brief Shared value types of the round lifecycle
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * Money is held as integer cents and multipliers as integer hundredths
 * (1.00x == 100) so that every balance transition is exact. Conversion to
 * decimal happens only at the wire boundary.
 */

#pragma once

#ifndef ASCENT_GAME_GAME_TYPES_HPP
#define ASCENT_GAME_GAME_TYPES_HPP

#include <Ascent/Core/Types.hpp>
#include <Ascent/Core/ErrorCodes.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace Ascent::Game {

/// Monetary amount in cents
using Cents = int64_t;

/// Multiplier in hundredths (100 == 1.00x)
using Multiplier = int64_t;

/// Connected session identifier ("Guest_1A2B3C")
using SessionId = std::string;

/// Round number assigned by the engine, starting at 1
using RoundId = uint64_t;

/// Multiplier every round starts from
constexpr Multiplier BASE_MULTIPLIER = 100;

/// Cents per currency unit
constexpr Cents CENTS_PER_UNIT = 100;

/**
 * @brief Round state machine phases
 */
enum class RoundPhase : uint8_t {
    Waiting,    ///< Countdown, bets accepted
    Running,    ///< Multiplier rising, cashouts accepted
    Crashed     ///< Round over, seed revealed
};

/**
 * @brief Wire name of a phase ("WAITING", "RUNNING", "CRASHED")
 */
constexpr std::string_view toString(RoundPhase phase) noexcept {
    switch (phase) {
        case RoundPhase::Waiting: return "WAITING";
        case RoundPhase::Running: return "RUNNING";
        case RoundPhase::Crashed: return "CRASHED";
    }
    return "UNKNOWN";
}

/**
 * @brief Wager held by a session for the current round
 */
struct ActiveBet {
    Cents amount = 0;
    bool cashedOut = false;
};

/**
 * @brief Point-in-time copy of one session
 */
struct SessionView {
    SessionId id;
    Cents balance = 0;
    std::optional<ActiveBet> activeBet;
};

/**
 * @brief Payout of a wager at a multiplier, rounded half-up to the cent
 *
 * @return Win in cents, InvalidArgument for negative input, OutOfRange on
 *         overflow
 */
inline Result<Cents> computeWin(Cents amount, Multiplier multiplier) {
    if (amount < 0 || multiplier < 0) {
        return ErrorCode::InvalidArgument;
    }

    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    const int64_t whole = multiplier / 100;
    const int64_t fraction = multiplier % 100;

    if (whole != 0 && amount > kMax / whole) {
        return ErrorCode::OutOfRange;
    }
    if (fraction != 0 && amount > (kMax - 50) / fraction) {
        return ErrorCode::OutOfRange;
    }

    const int64_t wholePart = amount * whole;
    const int64_t fractionPart = (amount * fraction + 50) / 100;
    if (wholePart > kMax - fractionPart) {
        return ErrorCode::OutOfRange;
    }

    return wholePart + fractionPart;
}

} // namespace Ascent::Game

#endif // ASCENT_GAME_GAME_TYPES_HPP
