/**
 * @file test_session_ledger.cpp
 * @brief Unit tests for session balances and wagers
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include "../TestHarness.hpp"
#include <Ascent/Game/SessionLedger.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <limits>
#include <set>
#include <thread>
#include <vector>

using namespace Ascent;
using namespace Ascent::Game;

namespace {

constexpr Cents STARTING_BALANCE = 100000;

bool isGuestId(const std::string& id) {
    if (id.size() != 12 || id.rfind(GUEST_PREFIX, 0) != 0) {
        return false;
    }
    for (size_t i = 6; i < id.size(); ++i) {
        const char c = id[i];
        if (!((c >= '0' && c <= '9') || (c >= 'A' && c <= 'F'))) {
            return false;
        }
    }
    return true;
}

} // namespace

class SessionLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = ledger.open("Guest_AAAAAA");
        ASSERT_RESULT_SUCCESS(opened);
    }

    SessionLedger ledger{STARTING_BALANCE};
    const SessionId player = "Guest_AAAAAA";
};

// ============================================================================
// Sessions
// ============================================================================

TEST_F(SessionLedgerTest, Open_AssignsGuestIdAndStartingBalance) {
    auto session = ledger.open();
    ASSERT_RESULT_SUCCESS(session);

    EXPECT_TRUE(isGuestId(session.value().id)) << session.value().id;
    EXPECT_EQ(session.value().balance, STARTING_BALANCE);
    EXPECT_FALSE(session.value().activeBet.has_value());
    EXPECT_EQ(ledger.size(), 2u);
}

TEST_F(SessionLedgerTest, Open_IdsAreUnique) {
    std::set<SessionId> ids;
    for (int i = 0; i < 50; ++i) {
        auto session = ledger.open();
        ASSERT_RESULT_SUCCESS(session);
        ids.insert(session.value().id);
    }
    EXPECT_EQ(ids.size(), 50u);
}

TEST_F(SessionLedgerTest, Open_RejectsDuplicateAndEmptyIds) {
    EXPECT_RESULT_ERROR(ledger.open(player), ErrorCode::InvalidState);
    EXPECT_RESULT_ERROR(ledger.open(SessionId{}), ErrorCode::InvalidArgument);
}

TEST_F(SessionLedgerTest, Close_RemovesSession) {
    EXPECT_TRUE(ledger.close(player));
    EXPECT_FALSE(ledger.close(player));
    EXPECT_FALSE(ledger.find(player).has_value());
    EXPECT_EQ(ledger.size(), 0u);
}

// ============================================================================
// Betting
// ============================================================================

TEST_F(SessionLedgerTest, PlaceBet_DebitsBalance) {
    auto receipt = ledger.placeBet(player, 20000, RoundPhase::Waiting);
    ASSERT_RESULT_SUCCESS(receipt);
    EXPECT_EQ(receipt.value().amount, 20000);
    EXPECT_EQ(receipt.value().balance, 80000);

    auto session = ledger.find(player);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->balance, 80000);
    ASSERT_TRUE(session->activeBet.has_value());
    EXPECT_EQ(session->activeBet->amount, 20000);
    EXPECT_FALSE(session->activeBet->cashedOut);
}

TEST_F(SessionLedgerTest, PlaceBet_WholeBalanceAllowed) {
    auto receipt = ledger.placeBet(player, STARTING_BALANCE, RoundPhase::Waiting);
    ASSERT_RESULT_SUCCESS(receipt);
    EXPECT_EQ(receipt.value().balance, 0);
}

TEST_F(SessionLedgerTest, PlaceBet_RejectionsLeaveStateUntouched) {
    EXPECT_RESULT_ERROR(ledger.placeBet(player, 0, RoundPhase::Waiting), ErrorCode::InvalidAmount);
    EXPECT_RESULT_ERROR(ledger.placeBet(player, -100, RoundPhase::Waiting), ErrorCode::InvalidAmount);
    EXPECT_RESULT_ERROR(ledger.placeBet("Guest_000000", 100, RoundPhase::Waiting),
                        ErrorCode::SessionNotFound);
    EXPECT_RESULT_ERROR(ledger.placeBet(player, 100, RoundPhase::Running), ErrorCode::WrongPhase);
    EXPECT_RESULT_ERROR(ledger.placeBet(player, 100, RoundPhase::Crashed), ErrorCode::WrongPhase);
    EXPECT_RESULT_ERROR(ledger.placeBet(player, STARTING_BALANCE + 1, RoundPhase::Waiting),
                        ErrorCode::InsufficientFunds);

    auto session = ledger.find(player);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->balance, STARTING_BALANCE);
    EXPECT_FALSE(session->activeBet.has_value());
}

TEST_F(SessionLedgerTest, PlaceBet_CheckOrder) {
    // Amount is validated before the session lookup
    EXPECT_RESULT_ERROR(ledger.placeBet("Guest_000000", 0, RoundPhase::Running),
                        ErrorCode::InvalidAmount);
    // Unknown session before phase
    EXPECT_RESULT_ERROR(ledger.placeBet("Guest_000000", 100, RoundPhase::Running),
                        ErrorCode::SessionNotFound);

    ASSERT_RESULT_SUCCESS(ledger.placeBet(player, 100, RoundPhase::Waiting));
    // Duplicate before funds
    EXPECT_RESULT_ERROR(ledger.placeBet(player, STARTING_BALANCE * 2, RoundPhase::Waiting),
                        ErrorCode::DuplicateBet);
    // Phase before duplicate
    EXPECT_RESULT_ERROR(ledger.placeBet(player, 100, RoundPhase::Running), ErrorCode::WrongPhase);
}

TEST_F(SessionLedgerTest, PlaceBet_OnePerRound) {
    ASSERT_RESULT_SUCCESS(ledger.placeBet(player, 1000, RoundPhase::Waiting));
    EXPECT_RESULT_ERROR(ledger.placeBet(player, 1000, RoundPhase::Waiting), ErrorCode::DuplicateBet);
    EXPECT_EQ(ledger.find(player)->balance, STARTING_BALANCE - 1000);

    ledger.resetRound();
    ASSERT_RESULT_SUCCESS(ledger.placeBet(player, 1000, RoundPhase::Waiting));
    EXPECT_EQ(ledger.find(player)->balance, STARTING_BALANCE - 2000);
}

TEST(SessionLedger, PlaceBet_MaxBetEnforced) {
    SessionLedger ledger(STARTING_BALANCE, 5000);
    ASSERT_RESULT_SUCCESS(ledger.open("Guest_BBBBBB"));

    EXPECT_EQ(ledger.maxBet(), 5000);
    EXPECT_RESULT_ERROR(ledger.placeBet("Guest_BBBBBB", 5001, RoundPhase::Waiting),
                        ErrorCode::InvalidAmount);
    EXPECT_TRUE(ledger.placeBet("Guest_BBBBBB", 5000, RoundPhase::Waiting).isSuccess());
}

// ============================================================================
// Cashing out
// ============================================================================

TEST_F(SessionLedgerTest, CashOut_CreditsStakeTimesMultiplier) {
    ASSERT_RESULT_SUCCESS(ledger.placeBet(player, 20000, RoundPhase::Waiting));

    auto receipt = ledger.cashOut(player, RoundPhase::Running, 250);
    ASSERT_RESULT_SUCCESS(receipt);
    EXPECT_EQ(receipt.value().amount, 20000);
    EXPECT_EQ(receipt.value().multiplier, 250);
    EXPECT_EQ(receipt.value().win, 50000);
    EXPECT_EQ(receipt.value().balance, 130000);

    auto session = ledger.find(player);
    ASSERT_TRUE(session.has_value());
    EXPECT_TRUE(session->activeBet->cashedOut);
}

TEST_F(SessionLedgerTest, CashOut_RoundsHalfUpToTheCent) {
    ASSERT_RESULT_SUCCESS(ledger.placeBet(player, 333, RoundPhase::Waiting));

    // 3.33 * 1.05 = 3.4965
    auto receipt = ledger.cashOut(player, RoundPhase::Running, 105);
    ASSERT_RESULT_SUCCESS(receipt);
    EXPECT_EQ(receipt.value().win, 350);
}

TEST_F(SessionLedgerTest, CashOut_ExactlyOnce) {
    ASSERT_RESULT_SUCCESS(ledger.placeBet(player, 1000, RoundPhase::Waiting));
    ASSERT_RESULT_SUCCESS(ledger.cashOut(player, RoundPhase::Running, 150));

    EXPECT_RESULT_ERROR(ledger.cashOut(player, RoundPhase::Running, 200), ErrorCode::NoActiveBet);
    EXPECT_EQ(ledger.find(player)->balance, STARTING_BALANCE - 1000 + 1500);
}

TEST_F(SessionLedgerTest, CashOut_Rejections) {
    EXPECT_RESULT_ERROR(ledger.cashOut(player, RoundPhase::Running, 150), ErrorCode::NoActiveBet);

    ASSERT_RESULT_SUCCESS(ledger.placeBet(player, 1000, RoundPhase::Waiting));
    EXPECT_RESULT_ERROR(ledger.cashOut(player, RoundPhase::Waiting, 100), ErrorCode::WrongPhase);
    EXPECT_RESULT_ERROR(ledger.cashOut(player, RoundPhase::Crashed, 150), ErrorCode::WrongPhase);
    EXPECT_RESULT_ERROR(ledger.cashOut("Guest_000000", RoundPhase::Running, 150),
                        ErrorCode::SessionNotFound);
    // Phase is checked before the session lookup
    EXPECT_RESULT_ERROR(ledger.cashOut("Guest_000000", RoundPhase::Crashed, 150),
                        ErrorCode::WrongPhase);

    EXPECT_EQ(ledger.find(player)->balance, STARTING_BALANCE - 1000);
}

TEST_F(SessionLedgerTest, CashOut_ConcurrentRequestsCreditOnce) {
    ASSERT_RESULT_SUCCESS(ledger.placeBet(player, 10000, RoundPhase::Waiting));

    std::atomic<int> successes{0};
    std::atomic<int> rejections{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            auto result = ledger.cashOut(player, RoundPhase::Running, 200);
            if (result.isSuccess()) {
                successes++;
            } else if (result.error() == ErrorCode::NoActiveBet) {
                rejections++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(rejections.load(), 7);
    EXPECT_EQ(ledger.find(player)->balance, STARTING_BALANCE + 10000);
}

TEST_F(SessionLedgerTest, CashOut_OverflowRejected) {
    SessionLedger rich(std::numeric_limits<Cents>::max());
    ASSERT_RESULT_SUCCESS(rich.open("Guest_CCCCCC"));
    ASSERT_RESULT_SUCCESS(rich.placeBet("Guest_CCCCCC", 100, RoundPhase::Waiting));

    EXPECT_RESULT_ERROR(rich.cashOut("Guest_CCCCCC", RoundPhase::Running, 300),
                        ErrorCode::OutOfRange);
    EXPECT_FALSE(rich.find("Guest_CCCCCC")->activeBet->cashedOut);
}

// ============================================================================
// Rounds
// ============================================================================

TEST_F(SessionLedgerTest, SettleRound_TalliesOutcomes) {
    ASSERT_RESULT_SUCCESS(ledger.open("Guest_BBBBBB"));
    ASSERT_RESULT_SUCCESS(ledger.open("Guest_CCCCCC"));

    ASSERT_RESULT_SUCCESS(ledger.placeBet(player, 1000, RoundPhase::Waiting));
    ASSERT_RESULT_SUCCESS(ledger.placeBet("Guest_BBBBBB", 2500, RoundPhase::Waiting));
    ASSERT_RESULT_SUCCESS(ledger.cashOut(player, RoundPhase::Running, 120));

    const SettlementSummary summary = ledger.settleRound();
    EXPECT_EQ(summary.bets, 2u);
    EXPECT_EQ(summary.cashedOut, 1u);
    EXPECT_EQ(summary.forfeited, 1u);
    EXPECT_EQ(summary.wagered, 3500);
    EXPECT_EQ(summary.forfeitedAmount, 2500);

    // Forfeited stakes stay debited
    EXPECT_EQ(ledger.find("Guest_BBBBBB")->balance, STARTING_BALANCE - 2500);
}

TEST_F(SessionLedgerTest, ResetRound_ClearsWagersKeepsBalances) {
    ASSERT_RESULT_SUCCESS(ledger.placeBet(player, 1000, RoundPhase::Waiting));
    ledger.resetRound();

    auto session = ledger.find(player);
    ASSERT_TRUE(session.has_value());
    EXPECT_FALSE(session->activeBet.has_value());
    EXPECT_EQ(session->balance, STARTING_BALANCE - 1000);
    EXPECT_EQ(ledger.settleRound().bets, 0u);
}

TEST_F(SessionLedgerTest, Snapshot_ListsEverySession) {
    ASSERT_RESULT_SUCCESS(ledger.open("Guest_BBBBBB"));
    ASSERT_RESULT_SUCCESS(ledger.placeBet("Guest_BBBBBB", 700, RoundPhase::Waiting));

    auto sessions = ledger.snapshot();
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].id, player);
    EXPECT_FALSE(sessions[0].activeBet.has_value());
    EXPECT_EQ(sessions[1].id, "Guest_BBBBBB");
    EXPECT_EQ(sessions[1].balance, STARTING_BALANCE - 700);
}
