/**
 * @file RoundStore.hpp
 * @brief Persistence collaborator for rounds and bets
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * Persistence is advisory. The engine hands records to a PersistenceQueue
 * and never waits for them; a store failure is logged and counted and has
 * no effect on the round in progress.
 */

#pragma once

#ifndef ASCENT_GAME_ROUND_STORE_HPP
#define ASCENT_GAME_ROUND_STORE_HPP

#include <Ascent/Core/Types.hpp>
#include <Ascent/Core/ErrorCodes.hpp>
#include <Ascent/Game/GameTypes.hpp>
#include <Ascent/Game/FairnessCommitment.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace Ascent::Game {

enum class BetAction : uint8_t {
    Bet,
    Cashout
};

/**
 * @brief One balance movement
 */
struct BetRecord {
    RoundId roundId = 0;
    SessionId sessionId;
    BetAction action = BetAction::Bet;
    Cents amount = 0;
    Multiplier multiplier = BASE_MULTIPLIER;   ///< Cashout only
    Cents balanceDelta = 0;                    ///< -amount on bet, +win on cashout
    Cents balance = 0;                         ///< Balance after the movement
    WallTime at{};
};

/**
 * @brief External store interface
 */
class RoundStore {
public:
    virtual ~RoundStore() = default;

    virtual Result<void> recordRoundOpened(const RoundRecord& round) = 0;
    virtual Result<void> recordRoundClosed(RoundId roundId, WallTime endedAt) = 0;
    virtual Result<void> recordBet(const BetRecord& bet) = 0;
};

/**
 * @brief Store that appends one JSON object per line to a file
 *
 * Line shapes:
 *   {"event":"round_opened","round_id":1,"server_seed":"..","server_seed_hash":"..",
 *    "client_seed":"..","crash_point":2.88,"started_at":1735689600000}
 *   {"event":"round_closed","round_id":1,"ended_at":1735689609000}
 *   {"event":"bet","round_id":1,"session_id":"Guest_1A2B3C","action":"BET",
 *    "amount":200,"multiplier":1,"balance_delta":-200,"balance":800,"at":..}
 */
class JsonLinesRoundStore final : public RoundStore {
public:
    explicit JsonLinesRoundStore(std::string path);

    Result<void> recordRoundOpened(const RoundRecord& round) override;
    Result<void> recordRoundClosed(RoundId roundId, WallTime endedAt) override;
    Result<void> recordBet(const BetRecord& bet) override;

    const std::string& path() const noexcept { return m_path; }

private:
    Result<void> append(const nlohmann::json& line);

    std::string m_path;
    std::mutex m_mutex;
};

/**
 * @brief Queue counters
 */
struct PersistenceStatistics {
    uint64_t enqueued = 0;
    uint64_t written = 0;
    uint64_t failed = 0;
    uint64_t dropped = 0;     ///< Refused because the queue was full or stopped
};

/**
 * @brief Asynchronous, bounded queue in front of a RoundStore
 *
 * Jobs run in order on one worker thread. enqueue() never blocks.
 */
class PersistenceQueue {
public:
    /**
     * @param store Destination; a null store discards every job
     * @param capacity Maximum queued jobs
     */
    PersistenceQueue(std::shared_ptr<RoundStore> store, size_t capacity);
    ~PersistenceQueue();

    PersistenceQueue(const PersistenceQueue&) = delete;
    PersistenceQueue& operator=(const PersistenceQueue&) = delete;

    /**
     * @return InvalidState if already running, ThreadCreationFailed
     */
    Result<void> start();

    /**
     * @brief Drain the remaining jobs and stop the worker
     */
    void stop() noexcept;

    Result<void> enqueueRoundOpened(RoundRecord round);
    Result<void> enqueueRoundClosed(RoundId roundId, WallTime endedAt);
    Result<void> enqueueBet(BetRecord bet);

    /**
     * @brief Wait until the queue is empty and no job is running
     * @return true if idle before the timeout
     */
    bool waitIdle(Milliseconds timeout);

    PersistenceStatistics statistics() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Ascent::Game

#endif // ASCENT_GAME_ROUND_STORE_HPP
