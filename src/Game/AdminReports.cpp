/**
 * @file AdminReports.cpp
 * @brief JSON documents served by the administrative interface
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <Ascent/Game/AdminReports.hpp>
#include <Ascent/Game/FairnessCommitment.hpp>
#include <Ascent/Game/Protocol.hpp>

namespace Ascent::Game {

using json = nlohmann::json;

namespace {

Result<Multiplier> parseCrashPoint(const std::string& text) {
    const json value = json::parse(text, nullptr, false);
    if (value.is_discarded() || !value.is_number()) {
        return ErrorCode::InvalidAmount;
    }

    auto hundredths = hundredthsFromJson(value);
    if (hundredths.isFailure()) {
        return hundredths.error();
    }
    if (hundredths.value() < BASE_MULTIPLIER) {
        return ErrorCode::InvalidAmount;
    }
    return hundredths.value();
}

json statisticsJson(const BroadcastStatistics& stats) {
    return {
        {"published", stats.published},
        {"delivered", stats.delivered},
        {"dropped", stats.dropped},
        {"stalls", stats.stalls},
    };
}

json statisticsJson(const PersistenceStatistics& stats) {
    return {
        {"enqueued", stats.enqueued},
        {"written", stats.written},
        {"failed", stats.failed},
        {"dropped", stats.dropped},
    };
}

} // namespace

json usersReport(const std::vector<SessionView>& sessions) {
    json users = json::object();

    for (const auto& session : sessions) {
        json entry;
        entry["balance"] = hundredthsToJson(session.balance);
        if (session.activeBet) {
            entry["activeBet"] = hundredthsToJson(session.activeBet->amount);
            entry["cashedOut"] = session.activeBet->cashedOut;
        } else {
            entry["activeBet"] = nullptr;
            entry["cashedOut"] = false;
        }
        users[session.id] = std::move(entry);
    }

    json report;
    report["active_users"] = sessions.size();
    report["users"] = std::move(users);
    return report;
}

json statusReport(const EngineSnapshot& engine,
                  size_t sessions,
                  const BroadcastStatistics& broadcast,
                  const std::optional<PersistenceStatistics>& persistence) {
    json status;
    status["running"] = engine.running;
    status["phase"] = std::string(toString(engine.phase));
    status["roundId"] = engine.roundId;
    status["multiplier"] = hundredthsToJson(engine.multiplier);
    status["serverSeedHash"] = engine.serverSeedHash;
    status["clientSeed"] = engine.clientSeed;
    status["sessions"] = sessions;
    status["broadcast"] = statisticsJson(broadcast);

    if (engine.phase == RoundPhase::Waiting) {
        status["secondsRemaining"] = engine.secondsRemaining;
    }

    if (engine.lastReveal) {
        status["lastCrash"] = {
            {"crashPoint", hundredthsToJson(engine.lastReveal->crashPoint)},
            {"serverSeed", engine.lastReveal->serverSeed},
            {"serverSeedHash", engine.lastReveal->serverSeedHash},
        };
    }

    if (persistence) {
        status["persistence"] = statisticsJson(*persistence);
    }

    return status;
}

Result<json> verifyReport(const VerifyRequest& request, double edgeFactor) {
    if (request.serverSeed.empty() || request.serverSeedHash.empty()
        || request.clientSeed.empty() || request.crashPoint.empty()) {
        return ErrorCode::MissingField;
    }

    Multiplier claimed = 0;
    ASCENT_TRY_ASSIGN(claimed, parseCrashPoint(request.crashPoint));

    Multiplier expected = 0;
    ASCENT_TRY_ASSIGN(expected, FairnessCommitment::crashPointFor(
        request.serverSeed, request.clientSeed, edgeFactor));

    const bool verified = FairnessCommitment::verify(
        request.serverSeed, request.serverSeedHash, request.clientSeed, claimed, edgeFactor);

    json report;
    report["verified"] = verified;
    report["claimedCrashPoint"] = hundredthsToJson(claimed);
    report["expectedCrashPoint"] = hundredthsToJson(expected);
    report["edgeFactor"] = edgeFactor;
    return report;
}

} // namespace Ascent::Game
