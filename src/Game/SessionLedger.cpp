/**
 * @file SessionLedger.cpp
 * @brief Per-session balances and wagers
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <Ascent/Game/SessionLedger.hpp>
#include <Ascent/Core/Crypto.hpp>
#include <Ascent/Core/Logger.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace Ascent::Game {

namespace {

/// Random bytes in a guest id suffix
constexpr size_t GUEST_ID_BYTES = 3;

/// Attempts before giving up on an unused guest id
constexpr int GUEST_ID_ATTEMPTS = 16;

} // namespace

SessionLedger::SessionLedger(Cents startingBalance, Cents maxBet)
    : m_startingBalance(std::max<Cents>(0, startingBalance))
    , m_maxBet(std::max<Cents>(0, maxBet))
    , m_random(std::make_unique<Crypto::SecureRandom>()) {
}

SessionLedger::~SessionLedger() = default;

SessionView SessionLedger::view(const SessionId& id, const Session& session) {
    return SessionView{id, session.balance, session.activeBet};
}

Result<SessionView> SessionLedger::open() {
    for (int attempt = 0; attempt < GUEST_ID_ATTEMPTS; ++attempt) {
        auto suffix = m_random->generateHex(GUEST_ID_BYTES);
        if (suffix.isFailure()) {
            return suffix.error();
        }

        std::string hex = std::move(suffix).value();
        std::transform(hex.begin(), hex.end(), hex.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        auto opened = open(GUEST_PREFIX + hex);
        if (opened.isSuccess()) {
            return opened;
        }
    }

    ASCENT_LOG_ERROR("Could not allocate an unused guest id");
    return ErrorCode::InternalError;
}

Result<SessionView> SessionLedger::open(const SessionId& sessionId) {
    if (sessionId.empty()) {
        return ErrorCode::InvalidArgument;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto [it, inserted] = m_sessions.emplace(sessionId, Session{m_startingBalance, std::nullopt});
    if (!inserted) {
        return ErrorCode::InvalidState;
    }
    return view(it->first, it->second);
}

bool SessionLedger::close(const SessionId& sessionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.erase(sessionId) > 0;
}

Result<BetReceipt> SessionLedger::placeBet(const SessionId& sessionId, Cents amount,
                                           RoundPhase phase) {
    if (amount <= 0 || (m_maxBet > 0 && amount > m_maxBet)) {
        return ErrorCode::InvalidAmount;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) {
        return ErrorCode::SessionNotFound;
    }
    if (phase != RoundPhase::Waiting) {
        return ErrorCode::WrongPhase;
    }

    Session& session = it->second;
    if (session.activeBet.has_value()) {
        return ErrorCode::DuplicateBet;
    }
    if (session.balance < amount) {
        return ErrorCode::InsufficientFunds;
    }

    session.balance -= amount;
    session.activeBet = ActiveBet{amount, false};
    return BetReceipt{amount, session.balance};
}

Result<CashoutReceipt> SessionLedger::cashOut(const SessionId& sessionId, RoundPhase phase,
                                              Multiplier multiplier) {
    if (phase != RoundPhase::Running) {
        return ErrorCode::WrongPhase;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) {
        return ErrorCode::SessionNotFound;
    }

    Session& session = it->second;
    if (!session.activeBet.has_value() || session.activeBet->cashedOut) {
        return ErrorCode::NoActiveBet;
    }

    auto win = computeWin(session.activeBet->amount, multiplier);
    if (win.isFailure()) {
        return win.error();
    }
    if (session.balance > std::numeric_limits<Cents>::max() - win.value()) {
        return ErrorCode::OutOfRange;
    }

    session.activeBet->cashedOut = true;
    session.balance += win.value();
    return CashoutReceipt{session.activeBet->amount, multiplier, win.value(), session.balance};
}

void SessionLedger::resetRound() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [id, session] : m_sessions) {
        session.activeBet.reset();
    }
}

SettlementSummary SessionLedger::settleRound() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    SettlementSummary summary;
    for (const auto& [id, session] : m_sessions) {
        if (!session.activeBet.has_value()) {
            continue;
        }
        summary.bets++;
        summary.wagered += session.activeBet->amount;
        if (session.activeBet->cashedOut) {
            summary.cashedOut++;
        } else {
            summary.forfeited++;
            summary.forfeitedAmount += session.activeBet->amount;
        }
    }
    return summary;
}

std::optional<SessionView> SessionLedger::find(const SessionId& sessionId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) {
        return std::nullopt;
    }
    return view(it->first, it->second);
}

std::vector<SessionView> SessionLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<SessionView> sessions;
    sessions.reserve(m_sessions.size());
    for (const auto& [id, session] : m_sessions) {
        sessions.push_back(view(id, session));
    }
    return sessions;
}

size_t SessionLedger::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

} // namespace Ascent::Game
