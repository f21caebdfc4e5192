/**
 * @file test_admin_reports.cpp
 * @brief Unit tests for the administrative JSON documents
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include "../TestHarness.hpp"
#include <Ascent/Game/AdminReports.hpp>
#include <gtest/gtest.h>

using namespace Ascent;
using namespace Ascent::Game;
using namespace Ascent::Testing;
using json = nlohmann::json;

// ============================================================================
// Users
// ============================================================================

TEST(AdminReports, UsersReport_ListsBalancesAndWagers) {
    const std::vector<SessionView> sessions = {
        {"Guest_AAAAAA", 100000, std::nullopt},
        {"Guest_BBBBBB", 80000, ActiveBet{20000, false}},
        {"Guest_CCCCCC", 130050, ActiveBet{1250, true}},
    };

    const json report = usersReport(sessions);

    EXPECT_EQ(report["active_users"], 3);
    ASSERT_TRUE(report["users"].is_object());

    const json& idle = report["users"]["Guest_AAAAAA"];
    EXPECT_EQ(idle["balance"], 1000);
    EXPECT_TRUE(idle["activeBet"].is_null());
    EXPECT_EQ(idle["cashedOut"], false);

    const json& betting = report["users"]["Guest_BBBBBB"];
    EXPECT_EQ(betting["balance"], 800);
    EXPECT_EQ(betting["activeBet"], 200);
    EXPECT_EQ(betting["cashedOut"], false);

    const json& cashed = report["users"]["Guest_CCCCCC"];
    EXPECT_DOUBLE_EQ(cashed["balance"].get<double>(), 1300.5);
    EXPECT_DOUBLE_EQ(cashed["activeBet"].get<double>(), 12.5);
    EXPECT_EQ(cashed["cashedOut"], true);
}

TEST(AdminReports, UsersReport_Empty) {
    const json report = usersReport({});
    EXPECT_EQ(report["active_users"], 0);
    EXPECT_TRUE(report["users"].is_object());
    EXPECT_TRUE(report["users"].empty());
}

// ============================================================================
// Status
// ============================================================================

TEST(AdminReports, StatusReport_Waiting) {
    EngineSnapshot engine;
    engine.running = true;
    engine.phase = RoundPhase::Waiting;
    engine.roundId = 4;
    engine.secondsRemaining = 3;
    engine.serverSeedHash = FIXTURE_HASH;
    engine.clientSeed = FIXTURE_CLIENT;

    const json status = statusReport(engine, 2, BroadcastStatistics{10, 18, 2, 1}, std::nullopt);

    EXPECT_EQ(status["running"], true);
    EXPECT_EQ(status["phase"], "WAITING");
    EXPECT_EQ(status["roundId"], 4);
    EXPECT_EQ(status["multiplier"], 1);
    EXPECT_EQ(status["secondsRemaining"], 3);
    EXPECT_EQ(status["serverSeedHash"], FIXTURE_HASH);
    EXPECT_EQ(status["sessions"], 2);
    EXPECT_EQ(status["broadcast"], json({{"published", 10}, {"delivered", 18}, {"dropped", 2}, {"stalls", 1}}));
    EXPECT_FALSE(status.contains("lastCrash"));
    EXPECT_FALSE(status.contains("persistence"));
}

TEST(AdminReports, StatusReport_RunningWithLastCrashAndPersistence) {
    EngineSnapshot engine;
    engine.running = true;
    engine.phase = RoundPhase::Running;
    engine.roundId = 5;
    engine.multiplier = 137;
    engine.lastReveal = RoundReveal{FIXTURE_SEED, FIXTURE_HASH, FIXTURE_CLIENT, 288};

    PersistenceStatistics persistence;
    persistence.enqueued = 7;
    persistence.written = 6;
    persistence.failed = 1;

    const json status = statusReport(engine, 0, BroadcastStatistics{}, persistence);

    EXPECT_EQ(status["phase"], "RUNNING");
    EXPECT_DOUBLE_EQ(status["multiplier"].get<double>(), 1.37);
    EXPECT_FALSE(status.contains("secondsRemaining"));

    ASSERT_TRUE(status.contains("lastCrash"));
    EXPECT_DOUBLE_EQ(status["lastCrash"]["crashPoint"].get<double>(), 2.88);
    EXPECT_EQ(status["lastCrash"]["serverSeed"], FIXTURE_SEED);

    ASSERT_TRUE(status.contains("persistence"));
    EXPECT_EQ(status["persistence"]["written"], 6);
    EXPECT_EQ(status["persistence"]["failed"], 1);
    EXPECT_EQ(status["persistence"]["dropped"], 0);
}

// ============================================================================
// Verification
// ============================================================================

TEST(AdminReports, VerifyReport_MatchingRound) {
    auto report = verifyReport({FIXTURE_SEED, FIXTURE_HASH, FIXTURE_CLIENT, "2.88"}, 0.96);
    ASSERT_RESULT_SUCCESS(report);

    EXPECT_EQ(report.value()["verified"], true);
    EXPECT_DOUBLE_EQ(report.value()["expectedCrashPoint"].get<double>(), 2.88);
    EXPECT_DOUBLE_EQ(report.value()["claimedCrashPoint"].get<double>(), 2.88);
    EXPECT_DOUBLE_EQ(report.value()["edgeFactor"].get<double>(), 0.96);
}

TEST(AdminReports, VerifyReport_WholeNumberCrashPoint) {
    auto report = verifyReport({FIXTURE_SEED, FIXTURE_HASH, FIXTURE_CLIENT, "3"}, 1.0);
    ASSERT_RESULT_SUCCESS(report);
    EXPECT_EQ(report.value()["verified"], true);
    EXPECT_EQ(report.value()["expectedCrashPoint"], 3);
}

TEST(AdminReports, VerifyReport_MismatchStillReportsExpected) {
    auto report = verifyReport({FIXTURE_SEED, FIXTURE_HASH, FIXTURE_CLIENT, "5.00"}, 0.96);
    ASSERT_RESULT_SUCCESS(report);

    EXPECT_EQ(report.value()["verified"], false);
    EXPECT_EQ(report.value()["claimedCrashPoint"], 5);
    EXPECT_DOUBLE_EQ(report.value()["expectedCrashPoint"].get<double>(), 2.88);

    auto wrongHash = verifyReport({LONG_ROUND_SEED, FIXTURE_HASH, FIXTURE_CLIENT, "11.67"}, 0.96);
    ASSERT_RESULT_SUCCESS(wrongHash);
    EXPECT_EQ(wrongHash.value()["verified"], false);
}

TEST(AdminReports, VerifyReport_RejectsIncompleteRequests) {
    EXPECT_RESULT_ERROR(verifyReport({"", FIXTURE_HASH, FIXTURE_CLIENT, "2.88"}, 0.96),
                        ErrorCode::MissingField);
    EXPECT_RESULT_ERROR(verifyReport({FIXTURE_SEED, FIXTURE_HASH, FIXTURE_CLIENT, ""}, 0.96),
                        ErrorCode::MissingField);

    EXPECT_RESULT_ERROR(verifyReport({FIXTURE_SEED, FIXTURE_HASH, FIXTURE_CLIENT, "abc"}, 0.96),
                        ErrorCode::InvalidAmount);
    EXPECT_RESULT_ERROR(verifyReport({FIXTURE_SEED, FIXTURE_HASH, FIXTURE_CLIENT, "2.885"}, 0.96),
                        ErrorCode::InvalidAmount);
    EXPECT_RESULT_ERROR(verifyReport({FIXTURE_SEED, FIXTURE_HASH, FIXTURE_CLIENT, "0.5"}, 0.96),
                        ErrorCode::InvalidAmount);

    EXPECT_RESULT_ERROR(verifyReport({FIXTURE_SEED, FIXTURE_HASH, FIXTURE_CLIENT, "2.88"}, 1.5),
                        ErrorCode::InvalidArgument);
}
