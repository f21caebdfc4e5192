/**
 * @file VerifyRound.cpp
 * @brief Offline auditor for revealed rounds
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * Usage:
 *   ascent_verify <serverSeed> <serverSeedHash> <clientSeed> <crashPoint> [edgeFactor]
 *
 * Exit status: 0 verified, 1 mismatch, 2 bad arguments.
 */

#include <Ascent/Core/Crypto.hpp>
#include <Ascent/Game/AdminReports.hpp>
#include <Ascent/Game/FairnessCommitment.hpp>

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace Ascent;

namespace {

constexpr double DEFAULT_EDGE_FACTOR = 0.96;

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " <serverSeed> <serverSeedHash> <clientSeed> <crashPoint> [edgeFactor]" << std::endl;
    std::cerr << "  crashPoint   decimal multiplier, e.g. 2.88" << std::endl;
    std::cerr << "  edgeFactor   house edge factor in (0, 1], default 0.96" << std::endl;
}

bool ParseEdgeFactor(const char* text, double& edgeFactor) {
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(text, &end);
    if (errno != 0 || end == text || *end != '\0') {
        return false;
    }
    if (!Game::FairnessCommitment::isValidEdgeFactor(value)) {
        return false;
    }
    edgeFactor = value;
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 5 && argc != 6) {
        PrintUsage(argv[0]);
        return 2;
    }

    double edgeFactor = DEFAULT_EDGE_FACTOR;
    if (argc == 6 && !ParseEdgeFactor(argv[5], edgeFactor)) {
        std::cerr << "Invalid edge factor: " << argv[5] << std::endl;
        return 2;
    }

    Game::VerifyRequest request;
    request.serverSeed = argv[1];
    request.serverSeedHash = argv[2];
    request.clientSeed = argv[3];
    request.crashPoint = argv[4];

    auto report = Game::verifyReport(request, edgeFactor);
    if (report.isFailure()) {
        std::cerr << "Cannot verify: " << getErrorMessage(report.error()) << std::endl;
        return 2;
    }

    const auto& result = report.value();
    const bool verified = result["verified"].get<bool>();

    auto hash = Crypto::HashEngine::sha256Hex(request.serverSeed);
    if (hash.isFailure()) {
        std::cerr << "Cannot hash seed: " << getErrorMessage(hash.error()) << std::endl;
        return 2;
    }

    std::cout << "Seed hash        " << hash.value() << std::endl;
    std::cout << "Claimed hash     " << request.serverSeedHash << std::endl;
    std::cout << "Expected crash   " << result["expectedCrashPoint"].dump() << "x" << std::endl;
    std::cout << "Claimed crash    " << result["claimedCrashPoint"].dump() << "x" << std::endl;
    std::cout << "Edge factor      " << edgeFactor << std::endl;
    std::cout << (verified ? "VERIFIED" : "MISMATCH") << std::endl;

    return verified ? 0 : 1;
}
