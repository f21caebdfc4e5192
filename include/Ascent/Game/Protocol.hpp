/**
 * @file Protocol.hpp
 * @brief Client/server JSON message codec
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * Every frame is a JSON object with a `type` field.
 *
 * Client to server:
 *   {"type":"PLACE_BET","amount":200}
 *   {"type":"CASHOUT"}
 *
 * Server to client:
 *   WELCOME, STATE, WAITING_TICK, ROUND_START, MULTIPLIER, BET_CONFIRMED,
 *   CASHOUT_CONFIRMED, CRASH, ERROR
 *
 * Money and multipliers are decimal on the wire. Whole values are written
 * as JSON integers (500), the rest as numbers with up to two decimals (2.5).
 */

#pragma once

#ifndef ASCENT_GAME_PROTOCOL_HPP
#define ASCENT_GAME_PROTOCOL_HPP

#include <Ascent/Core/ErrorCodes.hpp>
#include <Ascent/Game/GameTypes.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace Ascent::Game {

// ============================================================================
// Client messages
// ============================================================================

enum class ClientMessageType : uint8_t {
    PlaceBet,
    Cashout
};

struct ClientMessage {
    ClientMessageType type = ClientMessageType::Cashout;
    Cents amount = 0;   ///< PLACE_BET only
};

/**
 * @brief Decode a client frame
 * @return Message, or JsonParseFailed, MissingField, InvalidFieldType,
 *         UnknownMessageType, InvalidAmount
 */
Result<ClientMessage> parseClientMessage(std::string_view payload);

// ============================================================================
// Server events
// ============================================================================

struct WelcomeEvent {
    SessionId sessionId;
    Cents balance = 0;
    RoundPhase phase = RoundPhase::Waiting;
    Multiplier multiplier = BASE_MULTIPLIER;
};

struct StateEvent {
    RoundPhase phase = RoundPhase::Waiting;
};

struct WaitingTickEvent {
    int64_t seconds = 0;
};

struct RoundStartEvent {
    RoundId roundId = 0;
    std::string serverSeedHash;
    std::string clientSeed;
};

struct MultiplierEvent {
    Multiplier value = BASE_MULTIPLIER;
};

struct BetConfirmedEvent {
    Cents amount = 0;
    Cents balance = 0;
};

struct CashoutConfirmedEvent {
    Multiplier multiplier = BASE_MULTIPLIER;
    Cents win = 0;
    Cents balance = 0;
};

struct CrashEvent {
    RoundId roundId = 0;
    Multiplier crashPoint = BASE_MULTIPLIER;
    std::string serverSeed;
};

struct ErrorEvent {
    std::string message;
};

using ServerEvent = std::variant<
    WelcomeEvent,
    StateEvent,
    WaitingTickEvent,
    RoundStartEvent,
    MultiplierEvent,
    BetConfirmedEvent,
    CashoutConfirmedEvent,
    CrashEvent,
    ErrorEvent
>;

/**
 * @brief Wire type name of an event ("WELCOME", "STATE", ...)
 */
std::string_view eventType(const ServerEvent& event) noexcept;

/**
 * @brief Build the JSON object of an event
 */
nlohmann::json toJson(const ServerEvent& event);

/**
 * @brief Serialize an event to its frame text
 *
 * Never throws; invalid UTF-8 in string fields is replaced with U+FFFD.
 */
std::string encode(const ServerEvent& event);

/**
 * @brief True when text is valid UTF-8 and so travels in a frame unchanged
 */
bool isValidUtf8(std::string_view text);

/**
 * @brief Error reply carrying the message text of a code
 */
ErrorEvent makeError(ErrorCode code);

// ============================================================================
// Decimal helpers
// ============================================================================

/**
 * @brief JSON number for a value held in hundredths
 */
nlohmann::json hundredthsToJson(int64_t hundredths);

/**
 * @brief Parse a decimal JSON number with at most two decimals into hundredths
 * @return Hundredths or InvalidAmount (not a number, non-finite, too precise
 *         or out of range). Zero and negatives are accepted here.
 */
Result<int64_t> hundredthsFromJson(const nlohmann::json& value);

} // namespace Ascent::Game

#endif // ASCENT_GAME_PROTOCOL_HPP
