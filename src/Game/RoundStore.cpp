/**
 * @file RoundStore.cpp
 * @brief JSON-lines round and bet log
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <Ascent/Game/RoundStore.hpp>
#include <Ascent/Game/Protocol.hpp>

#include <fstream>

namespace Ascent::Game {

using json = nlohmann::json;

JsonLinesRoundStore::JsonLinesRoundStore(std::string path)
    : m_path(std::move(path)) {
}

Result<void> JsonLinesRoundStore::recordRoundOpened(const RoundRecord& round) {
    json line = {
        {"event", "round_opened"},
        {"round_id", round.roundId},
        {"server_seed", round.serverSeed},
        {"server_seed_hash", round.serverSeedHash},
        {"client_seed", round.clientSeed},
        {"crash_point", hundredthsToJson(round.crashPoint)},
        {"started_at", toUnixMillis(round.startedAt)}
    };
    return append(line);
}

Result<void> JsonLinesRoundStore::recordRoundClosed(RoundId roundId, WallTime endedAt) {
    json line = {
        {"event", "round_closed"},
        {"round_id", roundId},
        {"ended_at", toUnixMillis(endedAt)}
    };
    return append(line);
}

Result<void> JsonLinesRoundStore::recordBet(const BetRecord& bet) {
    json line = {
        {"event", "bet"},
        {"round_id", bet.roundId},
        {"session_id", bet.sessionId},
        {"action", bet.action == BetAction::Bet ? "BET" : "CASHOUT"},
        {"amount", hundredthsToJson(bet.amount)},
        {"multiplier", hundredthsToJson(bet.multiplier)},
        {"balance_delta", hundredthsToJson(bet.balanceDelta)},
        {"balance", hundredthsToJson(bet.balance)},
        {"at", toUnixMillis(bet.at)}
    };
    return append(line);
}

Result<void> JsonLinesRoundStore::append(const json& line) {
    if (m_path.empty()) {
        return ErrorCode::PersistenceUnavailable;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    std::ofstream file(m_path, std::ios::app);
    if (!file.is_open()) {
        return ErrorCode::PersistenceUnavailable;
    }

    file << line.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    file.flush();
    if (!file.good()) {
        return ErrorCode::FileWriteError;
    }

    return Result<void>::Success();
}

} // namespace Ascent::Game
