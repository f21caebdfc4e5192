/**
 * @file SessionLedger.hpp
 * @brief Per-session balances and wagers
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * The ledger is the only place a balance changes. Each operation validates
 * and mutates under one lock, so a debit or credit is never applied twice
 * and never leaves a balance negative. The round phase is supplied by the
 * caller (the RoundEngine, under its own lock), which keeps the phase check
 * and the mutation inside the engine's exclusion domain.
 */

#pragma once

#ifndef ASCENT_GAME_SESSION_LEDGER_HPP
#define ASCENT_GAME_SESSION_LEDGER_HPP

#include <Ascent/Core/ErrorCodes.hpp>
#include <Ascent/Game/GameTypes.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace Ascent::Crypto {
class SecureRandom;
}

namespace Ascent::Game {

/// Prefix of generated guest identifiers
constexpr const char* GUEST_PREFIX = "Guest_";

struct BetReceipt {
    Cents amount = 0;
    Cents balance = 0;      ///< Balance after the debit
};

struct CashoutReceipt {
    Cents amount = 0;       ///< Original stake
    Multiplier multiplier = BASE_MULTIPLIER;
    Cents win = 0;
    Cents balance = 0;      ///< Balance after the credit
};

/**
 * @brief Outcome of one round across all sessions
 */
struct SettlementSummary {
    size_t bets = 0;
    size_t cashedOut = 0;
    size_t forfeited = 0;
    Cents wagered = 0;
    Cents forfeitedAmount = 0;
};

class SessionLedger {
public:
    /**
     * @param startingBalance Balance of a newly opened session
     * @param maxBet Largest accepted wager, 0 for no limit
     */
    explicit SessionLedger(Cents startingBalance, Cents maxBet = 0);
    ~SessionLedger();

    SessionLedger(const SessionLedger&) = delete;
    SessionLedger& operator=(const SessionLedger&) = delete;

    /**
     * @brief Open a guest session with a random "Guest_XXXXXX" id
     * @return New session, or RandomGenerationFailed
     */
    Result<SessionView> open();

    /**
     * @brief Open a session with a chosen id
     * @return New session, or InvalidState if the id is in use
     */
    Result<SessionView> open(const SessionId& sessionId);

    /**
     * @brief Remove a session; an open wager is forfeited with it
     */
    bool close(const SessionId& sessionId);

    /**
     * @brief Debit a wager
     *
     * Checked in order: InvalidAmount, SessionNotFound, WrongPhase,
     * DuplicateBet, InsufficientFunds. Nothing changes on failure.
     */
    Result<BetReceipt> placeBet(const SessionId& sessionId, Cents amount, RoundPhase phase);

    /**
     * @brief Credit the wager at the given multiplier, exactly once per round
     *
     * Checked in order: WrongPhase, SessionNotFound, NoActiveBet.
     */
    Result<CashoutReceipt> cashOut(const SessionId& sessionId, RoundPhase phase,
                                   Multiplier multiplier);

    /**
     * @brief Clear every session's wager for a new round
     */
    void resetRound();

    /**
     * @brief Tally the round at crash time; un-cashed stakes stay lost
     */
    SettlementSummary settleRound() const;

    std::optional<SessionView> find(const SessionId& sessionId) const;

    std::vector<SessionView> snapshot() const;

    size_t size() const;

    Cents startingBalance() const noexcept { return m_startingBalance; }
    Cents maxBet() const noexcept { return m_maxBet; }

private:
    struct Session {
        Cents balance = 0;
        std::optional<ActiveBet> activeBet;
    };

    static SessionView view(const SessionId& id, const Session& session);

    const Cents m_startingBalance;
    const Cents m_maxBet;

    mutable std::mutex m_mutex;
    std::map<SessionId, Session> m_sessions;
    std::unique_ptr<Crypto::SecureRandom> m_random;
};

} // namespace Ascent::Game

#endif // ASCENT_GAME_SESSION_LEDGER_HPP
