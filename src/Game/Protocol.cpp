/**
 * @file Protocol.cpp
 * @brief Client/server JSON message codec
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <Ascent/Game/Protocol.hpp>

#include <cmath>
#include <limits>

namespace Ascent::Game {

using json = nlohmann::json;

namespace {

constexpr int64_t MAX_WHOLE_UNITS = std::numeric_limits<int64_t>::max() / 100;

// Largest magnitude (in hundredths) a double still represents exactly
constexpr double MAX_EXACT_HUNDREDTHS = 9007199254740992.0;

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

// ============================================================================
// Decimal helpers
// ============================================================================

json hundredthsToJson(int64_t hundredths) {
    if (hundredths % 100 == 0) {
        return json(hundredths / 100);
    }
    return json(static_cast<double>(hundredths) / 100.0);
}

Result<int64_t> hundredthsFromJson(const json& value) {
    if (value.is_number_unsigned()) {
        const auto whole = value.get<uint64_t>();
        if (whole > static_cast<uint64_t>(MAX_WHOLE_UNITS)) {
            return ErrorCode::InvalidAmount;
        }
        return static_cast<int64_t>(whole) * 100;
    }

    if (value.is_number_integer()) {
        const auto whole = value.get<int64_t>();
        if (whole > MAX_WHOLE_UNITS || whole < -MAX_WHOLE_UNITS) {
            return ErrorCode::InvalidAmount;
        }
        return whole * 100;
    }

    if (value.is_number_float()) {
        const double real = value.get<double>();
        if (!std::isfinite(real)) {
            return ErrorCode::InvalidAmount;
        }

        const double scaled = real * 100.0;
        const double rounded = std::round(scaled);
        if (std::fabs(rounded) > MAX_EXACT_HUNDREDTHS) {
            return ErrorCode::InvalidAmount;
        }
        // More than two decimals
        if (std::fabs(scaled - rounded) > 1e-6) {
            return ErrorCode::InvalidAmount;
        }
        return static_cast<int64_t>(rounded);
    }

    return ErrorCode::InvalidAmount;
}

// ============================================================================
// Client messages
// ============================================================================

Result<ClientMessage> parseClientMessage(std::string_view payload) {
    json document = json::parse(payload.data(), payload.data() + payload.size(),
                                nullptr, false);
    if (document.is_discarded()) {
        return ErrorCode::JsonParseFailed;
    }
    if (!document.is_object()) {
        return ErrorCode::JsonInvalid;
    }

    auto typeIt = document.find("type");
    if (typeIt == document.end()) {
        return ErrorCode::MissingField;
    }
    if (!typeIt->is_string()) {
        return ErrorCode::InvalidFieldType;
    }

    const auto& type = typeIt->get_ref<const std::string&>();

    if (type == "CASHOUT") {
        return ClientMessage{ClientMessageType::Cashout, 0};
    }

    if (type == "PLACE_BET") {
        auto amountIt = document.find("amount");
        if (amountIt == document.end()) {
            return ErrorCode::MissingField;
        }

        auto amount = hundredthsFromJson(*amountIt);
        if (amount.isFailure()) {
            return amount.error();
        }
        if (amount.value() <= 0) {
            return ErrorCode::InvalidAmount;
        }
        return ClientMessage{ClientMessageType::PlaceBet, amount.value()};
    }

    return ErrorCode::UnknownMessageType;
}

// ============================================================================
// Server events
// ============================================================================

std::string_view eventType(const ServerEvent& event) noexcept {
    return std::visit(Overloaded{
        [](const WelcomeEvent&) { return std::string_view("WELCOME"); },
        [](const StateEvent&) { return std::string_view("STATE"); },
        [](const WaitingTickEvent&) { return std::string_view("WAITING_TICK"); },
        [](const RoundStartEvent&) { return std::string_view("ROUND_START"); },
        [](const MultiplierEvent&) { return std::string_view("MULTIPLIER"); },
        [](const BetConfirmedEvent&) { return std::string_view("BET_CONFIRMED"); },
        [](const CashoutConfirmedEvent&) { return std::string_view("CASHOUT_CONFIRMED"); },
        [](const CrashEvent&) { return std::string_view("CRASH"); },
        [](const ErrorEvent&) { return std::string_view("ERROR"); },
    }, event);
}

json toJson(const ServerEvent& event) {
    json frame = json::object();
    frame["type"] = std::string(eventType(event));

    std::visit(Overloaded{
        [&frame](const WelcomeEvent& e) {
            frame["sessionId"] = e.sessionId;
            frame["balance"] = hundredthsToJson(e.balance);
            frame["gameState"] = std::string(toString(e.phase));
            frame["currentMultiplier"] = hundredthsToJson(e.multiplier);
        },
        [&frame](const StateEvent& e) {
            frame["state"] = std::string(toString(e.phase));
        },
        [&frame](const WaitingTickEvent& e) {
            frame["seconds"] = e.seconds;
        },
        [&frame](const RoundStartEvent& e) {
            frame["roundId"] = e.roundId;
            frame["serverSeedHash"] = e.serverSeedHash;
            frame["clientSeed"] = e.clientSeed;
        },
        [&frame](const MultiplierEvent& e) {
            frame["value"] = hundredthsToJson(e.value);
        },
        [&frame](const BetConfirmedEvent& e) {
            frame["amount"] = hundredthsToJson(e.amount);
            frame["balance"] = hundredthsToJson(e.balance);
        },
        [&frame](const CashoutConfirmedEvent& e) {
            frame["multiplier"] = hundredthsToJson(e.multiplier);
            frame["win"] = hundredthsToJson(e.win);
            frame["balance"] = hundredthsToJson(e.balance);
        },
        [&frame](const CrashEvent& e) {
            frame["roundId"] = e.roundId;
            frame["crashPoint"] = hundredthsToJson(e.crashPoint);
            frame["serverSeed"] = e.serverSeed;
        },
        [&frame](const ErrorEvent& e) {
            frame["message"] = e.message;
        },
    }, event);

    return frame;
}

std::string encode(const ServerEvent& event) {
    return toJson(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool isValidUtf8(std::string_view text) {
    try {
        const std::string frame = nlohmann::json(std::string(text)).dump();
        return !frame.empty();
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
}

ErrorEvent makeError(ErrorCode code) {
    return ErrorEvent{std::string(getErrorMessage(code))};
}

} // namespace Ascent::Game
