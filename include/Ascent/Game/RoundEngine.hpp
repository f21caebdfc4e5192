/**
 * @file RoundEngine.hpp
 * @brief Round lifecycle state machine
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * The engine cycles WAITING -> RUNNING -> CRASHED -> WAITING for as long as
 * it runs:
 *
 *   WAITING   new commitment, hash published, countdown of waitingSeconds;
 *             bets accepted
 *   RUNNING   multiplier += step every tickInterval until it reaches the
 *             crash point; cashouts accepted
 *   CRASHED   seed revealed, un-cashed stakes lost; next round after
 *             crashPause
 *
 * One engine mutex guards the phase, the multiplier, the commitment and
 * every ledger mutation, so a cashout either completes before the crash is
 * visible or is rejected with WrongPhase. Timers are scheduled through a
 * Scheduler; each timer slot carries a token so a stale or duplicated
 * firing is a no-op.
 */

#pragma once

#ifndef ASCENT_GAME_ROUND_ENGINE_HPP
#define ASCENT_GAME_ROUND_ENGINE_HPP

#include <Ascent/Core/ErrorCodes.hpp>
#include <Ascent/Game/BroadcastHub.hpp>
#include <Ascent/Game/FairnessCommitment.hpp>
#include <Ascent/Game/GameConfig.hpp>
#include <Ascent/Game/GameTypes.hpp>
#include <Ascent/Game/RoundStore.hpp>
#include <Ascent/Game/Scheduler.hpp>
#include <Ascent/Game/SessionLedger.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace Ascent::Game {

/**
 * @brief Public view of the engine
 */
struct EngineSnapshot {
    bool running = false;
    RoundPhase phase = RoundPhase::Waiting;
    RoundId roundId = 0;
    Multiplier multiplier = BASE_MULTIPLIER;
    int64_t secondsRemaining = 0;
    std::string serverSeedHash;
    std::string clientSeed;
    std::optional<RoundReveal> lastReveal;   ///< Most recent crashed round
};

class RoundEngine {
public:
    /**
     * @param config Timing, client seed and ledger settings
     * @param scheduler Timer service; must outlive the engine
     * @param fairness Commitment generator
     * @param persistence Optional outbound store queue
     */
    RoundEngine(const GameConfig& config,
                Scheduler& scheduler,
                FairnessCommitment fairness,
                std::shared_ptr<PersistenceQueue> persistence = nullptr);
    ~RoundEngine();

    RoundEngine(const RoundEngine&) = delete;
    RoundEngine& operator=(const RoundEngine&) = delete;

    /**
     * @brief Open round 1 and start the cycle
     * @return InvalidState if already running
     */
    Result<void> start();

    /**
     * @brief Cancel all timers; the current round is abandoned
     */
    void stop() noexcept;

    bool isRunning() const;

    // ========================================================================
    // Sessions
    // ========================================================================

    /**
     * @brief Open a guest session and subscribe its sink
     *
     * The sink first receives WELCOME, the current ROUND_START, then the
     * remaining countdown, the current multiplier or the last crash,
     * depending on the phase.
     */
    Result<SessionId> connect(std::shared_ptr<EventSink> sink);

    void disconnect(const SessionId& sessionId);

    // ========================================================================
    // Player actions
    // ========================================================================

    /**
     * @brief Place a wager; replies BET_CONFIRMED or ERROR to the session
     */
    Result<BetReceipt> placeBet(const SessionId& sessionId, Cents amount);

    /**
     * @brief Cash out at the current multiplier; replies CASHOUT_CONFIRMED
     *        or ERROR to the session
     */
    Result<CashoutReceipt> cashOut(const SessionId& sessionId);

    /**
     * @brief Decode and dispatch a client frame; every failure is answered
     *        with ERROR to the session
     */
    void handleMessage(const SessionId& sessionId, std::string_view payload);

    // ========================================================================
    // Observation
    // ========================================================================

    RoundPhase phase() const;
    Multiplier multiplier() const;
    RoundId roundId() const;
    EngineSnapshot snapshot() const;

    const SessionLedger& ledger() const;
    const BroadcastHub& hub() const;
    const GameConfig& config() const;

private:
    static CrashWitness crashWitness();
    static StorageWitness storageWitness();

    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Ascent::Game

#endif // ASCENT_GAME_ROUND_ENGINE_HPP
