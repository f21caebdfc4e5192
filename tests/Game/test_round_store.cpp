/**
 * @file test_round_store.cpp
 * @brief Unit tests for the JSON-lines store and the persistence queue
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include "../TestHarness.hpp"
#include <Ascent/Game/RoundStore.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace Ascent;
using namespace Ascent::Game;
using namespace Ascent::Testing;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

std::vector<json> readLines(const std::string& path) {
    std::vector<json> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(json::parse(line));
    }
    return lines;
}

RoundRecord sampleRound(RoundId id) {
    RoundRecord round;
    round.roundId = id;
    round.serverSeed = FIXTURE_SEED;
    round.serverSeedHash = FIXTURE_HASH;
    round.clientSeed = FIXTURE_CLIENT;
    round.crashPoint = 288;
    round.startedAt = WallTime{} + std::chrono::milliseconds(1735689600000LL);
    return round;
}

BetRecord sampleBet(RoundId id, BetAction action) {
    BetRecord bet;
    bet.roundId = id;
    bet.sessionId = "Guest_A1B2C3";
    bet.action = action;
    bet.amount = 20000;
    bet.multiplier = action == BetAction::Bet ? BASE_MULTIPLIER : 250;
    bet.balanceDelta = action == BetAction::Bet ? -20000 : 50000;
    bet.balance = action == BetAction::Bet ? 80000 : 130000;
    return bet;
}

} // namespace

// ============================================================================
// JsonLinesRoundStore
// ============================================================================

TEST(JsonLinesRoundStore, AppendsOneObjectPerLine) {
    TempDirectory dir;
    JsonLinesRoundStore store(dir.path() + "/rounds.jsonl");

    ASSERT_RESULT_SUCCESS(store.recordRoundOpened(sampleRound(1)));
    ASSERT_RESULT_SUCCESS(store.recordBet(sampleBet(1, BetAction::Bet)));
    ASSERT_RESULT_SUCCESS(store.recordBet(sampleBet(1, BetAction::Cashout)));
    ASSERT_RESULT_SUCCESS(store.recordRoundClosed(1, WallTime{} + 1735689609000ms));

    const auto lines = readLines(store.path());
    ASSERT_EQ(lines.size(), 4u);

    EXPECT_EQ(lines[0]["event"], "round_opened");
    EXPECT_EQ(lines[0]["round_id"], 1);
    EXPECT_EQ(lines[0]["server_seed"], FIXTURE_SEED);
    EXPECT_EQ(lines[0]["server_seed_hash"], FIXTURE_HASH);
    EXPECT_DOUBLE_EQ(lines[0]["crash_point"].get<double>(), 2.88);
    EXPECT_EQ(lines[0]["started_at"], 1735689600000LL);

    EXPECT_EQ(lines[1]["action"], "BET");
    EXPECT_EQ(lines[1]["amount"], 200);
    EXPECT_EQ(lines[1]["balance_delta"], -200);

    EXPECT_EQ(lines[2]["action"], "CASHOUT");
    EXPECT_DOUBLE_EQ(lines[2]["multiplier"].get<double>(), 2.5);
    EXPECT_EQ(lines[2]["balance"], 1300);

    EXPECT_EQ(lines[3]["event"], "round_closed");
    EXPECT_EQ(lines[3]["ended_at"], 1735689609000LL);
}

TEST(JsonLinesRoundStore, UnwritablePathReported) {
    TempDirectory dir;
    JsonLinesRoundStore missingDir(dir.path() + "/absent/rounds.jsonl");
    EXPECT_RESULT_ERROR(missingDir.recordRoundClosed(1, WallTime{}), ErrorCode::PersistenceUnavailable);

    JsonLinesRoundStore noPath("");
    EXPECT_RESULT_ERROR(noPath.recordRoundClosed(1, WallTime{}), ErrorCode::PersistenceUnavailable);
}

// ============================================================================
// PersistenceQueue
// ============================================================================

TEST(PersistenceQueue, WritesJobsInOrder) {
    auto store = std::make_shared<FakeRoundStore>();
    PersistenceQueue queue(store, 16);
    ASSERT_RESULT_SUCCESS(queue.start());

    ASSERT_RESULT_SUCCESS(queue.enqueueRoundOpened(sampleRound(1)));
    ASSERT_RESULT_SUCCESS(queue.enqueueBet(sampleBet(1, BetAction::Bet)));
    ASSERT_RESULT_SUCCESS(queue.enqueueRoundClosed(1, WallTime{}));
    ASSERT_RESULT_SUCCESS(queue.enqueueRoundOpened(sampleRound(2)));

    ASSERT_TRUE(queue.waitIdle(5000ms));

    const auto opened = store->openedRounds();
    ASSERT_EQ(opened.size(), 2u);
    EXPECT_EQ(opened[0].roundId, 1u);
    EXPECT_EQ(opened[1].roundId, 2u);
    EXPECT_EQ(store->closedRounds(), std::vector<RoundId>{1});
    EXPECT_EQ(store->bets().size(), 1u);

    const PersistenceStatistics stats = queue.statistics();
    EXPECT_EQ(stats.enqueued, 4u);
    EXPECT_EQ(stats.written, 4u);
    EXPECT_EQ(stats.failed, 0u);
    queue.stop();
}

TEST(PersistenceQueue, StoreFailuresAreCountedNotFatal) {
    auto store = std::make_shared<FakeRoundStore>();
    PersistenceQueue queue(store, 16);
    ASSERT_RESULT_SUCCESS(queue.start());

    store->setFailing(true);
    ASSERT_RESULT_SUCCESS(queue.enqueueRoundOpened(sampleRound(1)));
    ASSERT_TRUE(queue.waitIdle(5000ms));

    store->setFailing(false);
    store->setThrowing(true);
    ASSERT_RESULT_SUCCESS(queue.enqueueRoundClosed(1, WallTime{}));
    ASSERT_TRUE(queue.waitIdle(5000ms));

    store->setThrowing(false);
    ASSERT_RESULT_SUCCESS(queue.enqueueRoundOpened(sampleRound(2)));
    ASSERT_TRUE(queue.waitIdle(5000ms));

    const PersistenceStatistics stats = queue.statistics();
    EXPECT_EQ(stats.failed, 2u);
    EXPECT_EQ(stats.written, 1u);
    ASSERT_EQ(store->openedRounds().size(), 1u);
    EXPECT_EQ(store->openedRounds()[0].roundId, 2u);
    queue.stop();
}

TEST(PersistenceQueue, FullQueueDropsWithoutBlocking) {
    auto store = std::make_shared<FakeRoundStore>();
    PersistenceQueue queue(store, 2);

    // Not started, so nothing drains
    ASSERT_RESULT_SUCCESS(queue.enqueueRoundClosed(1, WallTime{}));
    ASSERT_RESULT_SUCCESS(queue.enqueueRoundClosed(2, WallTime{}));
    EXPECT_RESULT_ERROR(queue.enqueueRoundClosed(3, WallTime{}), ErrorCode::PersistenceQueueFull);
    EXPECT_EQ(queue.statistics().dropped, 1u);

    ASSERT_RESULT_SUCCESS(queue.start());
    ASSERT_TRUE(queue.waitIdle(5000ms));
    EXPECT_EQ(store->closedRounds(), (std::vector<RoundId>{1, 2}));
    queue.stop();
}

TEST(PersistenceQueue, StopDrainsThenRefuses) {
    auto store = std::make_shared<FakeRoundStore>();
    PersistenceQueue queue(store, 64);
    ASSERT_RESULT_SUCCESS(queue.start());

    for (RoundId id = 1; id <= 20; ++id) {
        ASSERT_RESULT_SUCCESS(queue.enqueueRoundClosed(id, WallTime{}));
    }
    queue.stop();

    EXPECT_EQ(store->closedRounds().size(), 20u);
    EXPECT_RESULT_ERROR(queue.enqueueRoundClosed(21, WallTime{}), ErrorCode::PersistenceUnavailable);
    EXPECT_EQ(queue.statistics().dropped, 1u);
}

TEST(PersistenceQueue, NullStoreDiscards) {
    PersistenceQueue queue(nullptr, 4);
    ASSERT_RESULT_SUCCESS(queue.start());
    EXPECT_RESULT_ERROR(queue.start(), ErrorCode::InvalidState);

    ASSERT_RESULT_SUCCESS(queue.enqueueBet(sampleBet(1, BetAction::Bet)));
    ASSERT_TRUE(queue.waitIdle(5000ms));
    EXPECT_EQ(queue.statistics().written, 1u);
    queue.stop();
}
