/**
 * @file RoundEngine.cpp
 * @brief Round lifecycle state machine
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <Ascent/Game/RoundEngine.hpp>
#include <Ascent/Game/Protocol.hpp>
#include <Ascent/Core/Logger.hpp>

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <mutex>
#include <vector>

namespace Ascent::Game {

namespace {

std::string formatHundredths(int64_t value) {
    char buffer[32];
    const int64_t magnitude = value < 0 ? -value : value;
    std::snprintf(buffer, sizeof(buffer), "%s%" PRId64 ".%02" PRId64,
                  value < 0 ? "-" : "", magnitude / 100, magnitude % 100);
    return buffer;
}

} // namespace

// ============================================================================
// RoundEngine::Impl
// ============================================================================

class RoundEngine::Impl {
public:
    using Handler = void (Impl::*)();

    /// One cancellable timer; a firing whose token is stale is ignored
    struct TimerSlot {
        const char* name;
        TimerId id = 0;
        uint64_t token = 0;
        bool armed = false;
        TimePoint due{};
    };

    Impl(const GameConfig& config, Scheduler& scheduler, FairnessCommitment fairness,
         std::shared_ptr<PersistenceQueue> persistence)
        : m_config(config)
        , m_scheduler(scheduler)
        , m_fairness(std::move(fairness))
        , m_persistence(std::move(persistence))
        , m_ledger(config.startingBalance, config.maxBet)
    {
    }

    ~Impl() {
        stop();
    }

    Result<void> start() {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_running) {
            return ErrorCode::InvalidState;
        }

        m_running = true;
        ASCENT_LOG_INFO_F("Round engine starting (edge %.4f, client seed '%s')",
                          m_fairness.edgeFactor(), m_config.clientSeed.c_str());
        beginRound();
        return Result<void>::Success();
    }

    void stop() noexcept {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
        disarm(m_countdown);
        disarm(m_tick);
        disarm(m_pause);
        ASCENT_LOG_INFO_F("Round engine stopped in round %llu",
                          static_cast<unsigned long long>(m_roundId));
    }

    bool isRunning() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running;
    }

    // ------------------------------------------------------------------------
    // Sessions
    // ------------------------------------------------------------------------

    Result<SessionId> connect(std::shared_ptr<EventSink> sink) {
        if (!sink) {
            return ErrorCode::NullPointer;
        }

        auto opened = m_ledger.open();
        if (opened.isFailure()) {
            return opened.error();
        }
        const SessionView& session = opened.value();

        std::lock_guard<std::mutex> lock(m_mutex);

        std::vector<ServerEvent> greeting;
        greeting.push_back(WelcomeEvent{session.id, session.balance, m_phase, m_multiplier});

        if (m_commitment) {
            greeting.push_back(RoundStartEvent{m_roundId, m_commitment->serverSeedHash(),
                                               m_commitment->clientSeed()});
            switch (m_phase) {
                case RoundPhase::Waiting:
                    greeting.push_back(WaitingTickEvent{m_secondsRemaining});
                    break;
                case RoundPhase::Running:
                    greeting.push_back(MultiplierEvent{m_multiplier});
                    break;
                case RoundPhase::Crashed:
                    if (m_lastReveal) {
                        greeting.push_back(CrashEvent{m_roundId, m_lastReveal->crashPoint,
                                                      m_lastReveal->serverSeed});
                    }
                    break;
            }
        }

        auto subscribed = m_hub.subscribe(session.id, std::move(sink), greeting);
        if (subscribed.isFailure()) {
            m_ledger.close(session.id);
            return subscribed.error();
        }

        ASCENT_LOG_INFO_F("Session %s connected (%zu online)",
                          session.id.c_str(), m_hub.subscriberCount());
        return session.id;
    }

    void disconnect(const SessionId& sessionId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        const bool subscribed = m_hub.unsubscribe(sessionId);
        const bool known = m_ledger.close(sessionId);
        if (subscribed || known) {
            ASCENT_LOG_INFO_F("Session %s disconnected", sessionId.c_str());
        }
    }

    // ------------------------------------------------------------------------
    // Player actions
    // ------------------------------------------------------------------------

    Result<BetReceipt> placeBet(const SessionId& sessionId, Cents amount) {
        std::lock_guard<std::mutex> lock(m_mutex);

        // No open round before start() or while a commitment is being retried
        const RoundPhase phase = m_commitment ? m_phase : RoundPhase::Crashed;

        auto receipt = m_ledger.placeBet(sessionId, amount, phase);
        if (receipt.isFailure()) {
            reply(sessionId, makeError(receipt.error()));
            return receipt.error();
        }

        const BetReceipt& bet = receipt.value();
        reply(sessionId, BetConfirmedEvent{bet.amount, bet.balance});
        ASCENT_LOG_DEBUG_F("Session %s bet %s in round %llu", sessionId.c_str(),
                           formatHundredths(bet.amount).c_str(),
                           static_cast<unsigned long long>(m_roundId));

        persistBet(BetRecord{m_roundId, sessionId, BetAction::Bet, bet.amount,
                             BASE_MULTIPLIER, -bet.amount, bet.balance, SystemClock::now()});
        return receipt;
    }

    Result<CashoutReceipt> cashOut(const SessionId& sessionId) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto receipt = m_ledger.cashOut(sessionId, m_phase, m_multiplier);
        if (receipt.isFailure()) {
            reply(sessionId, makeError(receipt.error()));
            return receipt.error();
        }

        const CashoutReceipt& cashout = receipt.value();
        reply(sessionId, CashoutConfirmedEvent{cashout.multiplier, cashout.win, cashout.balance});
        ASCENT_LOG_DEBUG_F("Session %s cashed out %s at %sx", sessionId.c_str(),
                           formatHundredths(cashout.win).c_str(),
                           formatHundredths(cashout.multiplier).c_str());

        persistBet(BetRecord{m_roundId, sessionId, BetAction::Cashout, cashout.amount,
                             cashout.multiplier, cashout.win, cashout.balance,
                             SystemClock::now()});
        return receipt;
    }

    void handleMessage(const SessionId& sessionId, std::string_view payload) {
        auto message = parseClientMessage(payload);
        if (message.isFailure()) {
            ASCENT_LOG_DEBUG_F("Rejected frame from %s: %s", sessionId.c_str(),
                               std::string(getErrorMessage(message.error())).c_str());
            std::lock_guard<std::mutex> lock(m_mutex);
            reply(sessionId, makeError(message.error()));
            return;
        }

        ErrorCode outcome = ErrorCode::Success;
        switch (message.value().type) {
            case ClientMessageType::PlaceBet:
                outcome = placeBet(sessionId, message.value().amount).errorOr();
                break;
            case ClientMessageType::Cashout:
                outcome = cashOut(sessionId).errorOr();
                break;
        }

        if (isFailure(outcome)) {
            ASCENT_LOG_DEBUG_F("Action from %s refused: %s", sessionId.c_str(),
                               std::string(getErrorMessage(outcome)).c_str());
        }
    }

    // ------------------------------------------------------------------------
    // Observation
    // ------------------------------------------------------------------------

    RoundPhase phase() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_phase;
    }

    Multiplier multiplier() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_multiplier;
    }

    RoundId roundId() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_roundId;
    }

    EngineSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        EngineSnapshot snap;
        snap.running = m_running;
        snap.phase = m_phase;
        snap.roundId = m_roundId;
        snap.multiplier = m_multiplier;
        snap.secondsRemaining = m_phase == RoundPhase::Waiting ? m_secondsRemaining : 0;
        if (m_commitment) {
            snap.serverSeedHash = m_commitment->serverSeedHash();
            snap.clientSeed = m_commitment->clientSeed();
        }
        snap.lastReveal = m_lastReveal;
        return snap;
    }

    const SessionLedger& ledger() const { return m_ledger; }
    const BroadcastHub& hub() const { return m_hub; }
    const GameConfig& config() const { return m_config; }

private:
    // ------------------------------------------------------------------------
    // Timers (all called with m_mutex held)
    // ------------------------------------------------------------------------

    void arm(TimerSlot& slot, TimePoint due, Handler handler) {
        disarm(slot);

        slot.token = ++m_nextToken;
        slot.armed = true;
        slot.due = due;

        const uint64_t token = slot.token;
        TimerSlot* target = &slot;
        slot.id = m_scheduler.scheduleAt(slot.name, due, [this, target, token, handler] {
            fire(*target, token, handler);
        });
    }

    void disarm(TimerSlot& slot) noexcept {
        if (slot.armed) {
            m_scheduler.cancel(slot.id);
            slot.armed = false;
        }
    }

    void fire(TimerSlot& slot, uint64_t token, Handler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);

        // Stopped, superseded or already delivered
        if (!m_running || !slot.armed || slot.token != token) {
            return;
        }
        slot.armed = false;

        (this->*handler)();
    }

    // ------------------------------------------------------------------------
    // Transitions (all called with m_mutex held)
    // ------------------------------------------------------------------------

    void beginRound() {
        auto commitment = m_fairness.newRound(m_config.clientSeed);
        if (commitment.isFailure()) {
            const Milliseconds retry = std::max(m_config.crashPause, m_config.countdownInterval);
            ASCENT_LOG_ERROR_F("Cannot commit round %llu: %s; retrying in %lld ms",
                               static_cast<unsigned long long>(m_roundId + 1),
                               std::string(getErrorMessage(commitment.error())).c_str(),
                               static_cast<long long>(retry.count()));
            arm(m_pause, m_scheduler.now() + retry, &Impl::beginRound);
            return;
        }

        m_roundId++;
        m_phase = RoundPhase::Waiting;
        m_multiplier = BASE_MULTIPLIER;
        m_secondsRemaining = m_config.waitingSeconds;
        m_commitment.emplace(std::move(commitment).value());
        m_startedAt = SystemClock::now();
        m_ledger.resetRound();

        ASCENT_LOG_INFO_F("Round %llu WAITING, hash %s",
                          static_cast<unsigned long long>(m_roundId),
                          m_commitment->serverSeedHash().c_str());

        m_hub.publish(StateEvent{RoundPhase::Waiting});
        m_hub.publish(RoundStartEvent{m_roundId, m_commitment->serverSeedHash(),
                                      m_commitment->clientSeed()});
        m_hub.publish(WaitingTickEvent{m_secondsRemaining});

        if (m_persistence) {
            auto queued = m_persistence->enqueueRoundOpened(
                m_commitment->seal(storageWitness(), m_roundId, m_startedAt));
            if (queued.isFailure()) {
                ASCENT_LOG_WARNING_F("Round %llu open not persisted",
                                     static_cast<unsigned long long>(m_roundId));
            }
        }

        arm(m_countdown, m_scheduler.now() + m_config.countdownInterval, &Impl::onCountdown);
    }

    void onCountdown() {
        m_secondsRemaining--;

        if (m_secondsRemaining > 0) {
            m_hub.publish(WaitingTickEvent{m_secondsRemaining});
            arm(m_countdown, m_countdown.due + m_config.countdownInterval, &Impl::onCountdown);
            return;
        }

        enterRunning();
    }

    void enterRunning() {
        m_phase = RoundPhase::Running;
        m_multiplier = BASE_MULTIPLIER;

        ASCENT_LOG_INFO_F("Round %llu RUNNING", static_cast<unsigned long long>(m_roundId));
        m_hub.publish(StateEvent{RoundPhase::Running});

        if (m_commitment->isCrashedAt(m_multiplier)) {
            crash();
            return;
        }

        arm(m_tick, m_scheduler.now() + m_config.tickInterval, &Impl::onTick);
    }

    void onTick() {
        const Multiplier next = m_multiplier + m_config.multiplierStep;

        // The last step lands on the crash point, never past it
        if (m_commitment->isCrashedAt(next)) {
            m_multiplier = m_commitment->reveal(crashWitness()).crashPoint;
            m_hub.publish(MultiplierEvent{m_multiplier});
            crash();
            return;
        }

        m_multiplier = next;
        m_hub.publish(MultiplierEvent{m_multiplier});

        // Absolute due times keep the tick rate from drifting
        arm(m_tick, m_tick.due + m_config.tickInterval, &Impl::onTick);
    }

    void crash() {
        disarm(m_tick);
        disarm(m_countdown);

        m_phase = RoundPhase::Crashed;

        RoundReveal reveal = m_commitment->reveal(crashWitness());
        const SettlementSummary summary = m_ledger.settleRound();

        ASCENT_LOG_INFO_F("Round %llu CRASHED at %sx (%zu bets, %zu cashed out, %zu lost)",
                          static_cast<unsigned long long>(m_roundId),
                          formatHundredths(reveal.crashPoint).c_str(),
                          summary.bets, summary.cashedOut, summary.forfeited);
        ASCENT_LOG_DEBUG_F("Round %llu seed %s", static_cast<unsigned long long>(m_roundId),
                           reveal.serverSeed.c_str());

        m_hub.publish(StateEvent{RoundPhase::Crashed});
        m_hub.publish(CrashEvent{m_roundId, reveal.crashPoint, reveal.serverSeed});

        m_lastReveal = std::move(reveal);

        if (m_persistence) {
            auto queued = m_persistence->enqueueRoundClosed(m_roundId, SystemClock::now());
            if (queued.isFailure()) {
                ASCENT_LOG_WARNING_F("Round %llu close not persisted",
                                     static_cast<unsigned long long>(m_roundId));
            }
        }

        arm(m_pause, m_scheduler.now() + m_config.crashPause, &Impl::beginRound);
    }

    // ------------------------------------------------------------------------
    // Helpers (called with m_mutex held)
    // ------------------------------------------------------------------------

    void reply(const SessionId& sessionId, const ServerEvent& event) {
        auto sent = m_hub.sendTo(sessionId, event);
        if (sent.isFailure()) {
            ASCENT_LOG_DEBUG_F("Reply %s to %s not delivered",
                               std::string(eventType(event)).c_str(), sessionId.c_str());
        }
    }

    void persistBet(BetRecord record) {
        if (!m_persistence) {
            return;
        }
        auto queued = m_persistence->enqueueBet(std::move(record));
        if (queued.isFailure()) {
            ASCENT_LOG_WARNING_F("Bet record for round %llu not persisted",
                                 static_cast<unsigned long long>(m_roundId));
        }
    }

private:
    const GameConfig m_config;
    Scheduler& m_scheduler;
    const FairnessCommitment m_fairness;
    std::shared_ptr<PersistenceQueue> m_persistence;

    SessionLedger m_ledger;
    BroadcastHub m_hub;

    mutable std::mutex m_mutex;
    bool m_running = false;
    RoundPhase m_phase = RoundPhase::Waiting;
    RoundId m_roundId = 0;
    Multiplier m_multiplier = BASE_MULTIPLIER;
    int64_t m_secondsRemaining = 0;
    std::optional<RoundCommitment> m_commitment;
    std::optional<RoundReveal> m_lastReveal;
    WallTime m_startedAt{};

    uint64_t m_nextToken = 0;
    TimerSlot m_countdown{"countdown"};
    TimerSlot m_tick{"tick"};
    TimerSlot m_pause{"pause"};
};

// ============================================================================
// RoundEngine - Public API
// ============================================================================

CrashWitness RoundEngine::crashWitness() {
    return CrashWitness();
}

StorageWitness RoundEngine::storageWitness() {
    return StorageWitness();
}

RoundEngine::RoundEngine(const GameConfig& config,
                         Scheduler& scheduler,
                         FairnessCommitment fairness,
                         std::shared_ptr<PersistenceQueue> persistence)
    : m_impl(std::make_unique<Impl>(config, scheduler, std::move(fairness), std::move(persistence))) {
}

RoundEngine::~RoundEngine() = default;

Result<void> RoundEngine::start() {
    return m_impl->start();
}

void RoundEngine::stop() noexcept {
    m_impl->stop();
}

bool RoundEngine::isRunning() const {
    return m_impl->isRunning();
}

Result<SessionId> RoundEngine::connect(std::shared_ptr<EventSink> sink) {
    return m_impl->connect(std::move(sink));
}

void RoundEngine::disconnect(const SessionId& sessionId) {
    m_impl->disconnect(sessionId);
}

Result<BetReceipt> RoundEngine::placeBet(const SessionId& sessionId, Cents amount) {
    return m_impl->placeBet(sessionId, amount);
}

Result<CashoutReceipt> RoundEngine::cashOut(const SessionId& sessionId) {
    return m_impl->cashOut(sessionId);
}

void RoundEngine::handleMessage(const SessionId& sessionId, std::string_view payload) {
    m_impl->handleMessage(sessionId, payload);
}

RoundPhase RoundEngine::phase() const {
    return m_impl->phase();
}

Multiplier RoundEngine::multiplier() const {
    return m_impl->multiplier();
}

RoundId RoundEngine::roundId() const {
    return m_impl->roundId();
}

EngineSnapshot RoundEngine::snapshot() const {
    return m_impl->snapshot();
}

const SessionLedger& RoundEngine::ledger() const {
    return m_impl->ledger();
}

const BroadcastHub& RoundEngine::hub() const {
    return m_impl->hub();
}

const GameConfig& RoundEngine::config() const {
    return m_impl->config();
}

} // namespace Ascent::Game
