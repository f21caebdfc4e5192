/**
 * @file FairnessCommitment.cpp
 * @brief Commit-reveal crash point derivation
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <Ascent/Game/FairnessCommitment.hpp>
#include <Ascent/Core/Crypto.hpp>

#include <cmath>
#include <memory>

namespace Ascent::Game {

namespace {

constexpr uint64_t PREFIX_MASK = (uint64_t{1} << CRASH_PREFIX_BITS) - 1;

/// First 52 bits of a digest, big-endian
uint64_t macPrefix(const ByteBuffer& mac) {
    uint64_t value = 0;
    for (size_t i = 0; i < 7; ++i) {
        value = (value << 8) | mac[i];
    }
    return value >> 4;
}

Result<std::string> defaultSeed() {
    // SecureRandom keeps its descriptor open, share one per process
    static Crypto::SecureRandom rng;
    return rng.generateHex(SERVER_SEED_BYTES);
}

} // namespace

FairnessCommitment::FairnessCommitment(double edgeFactor, SeedSource seedSource)
    : m_edgeFactor(edgeFactor)
    , m_seedSource(seedSource ? std::move(seedSource) : SeedSource(&defaultSeed)) {
}

bool FairnessCommitment::isValidEdgeFactor(double edgeFactor) noexcept {
    return std::isfinite(edgeFactor) && edgeFactor > 0.0 && edgeFactor <= 1.0;
}

Multiplier FairnessCommitment::crashPointFromPrefix(uint64_t x, double edgeFactor) noexcept {
    constexpr double TWO_POW_52 = 4503599627370496.0;

    x &= PREFIX_MASK;
    const double scaled = std::floor(100.0 * edgeFactor * TWO_POW_52
                                     / (TWO_POW_52 - static_cast<double>(x)));

    // Also catches NaN from a nonsensical edge factor
    if (!(scaled >= static_cast<double>(BASE_MULTIPLIER))) {
        return BASE_MULTIPLIER;
    }
    return static_cast<Multiplier>(scaled);
}

Result<Multiplier> FairnessCommitment::crashPointFor(const std::string& serverSeed,
                                                     const std::string& clientSeed,
                                                     double edgeFactor) {
    if (!isValidEdgeFactor(edgeFactor)) {
        return ErrorCode::InvalidArgument;
    }

    auto mac = Crypto::HMAC::sha256(asBytes(serverSeed), asBytes(clientSeed));
    if (mac.isFailure()) {
        return mac.error();
    }
    if (mac.value().size() < 7) {
        return ErrorCode::CryptoError;
    }

    return crashPointFromPrefix(macPrefix(mac.value()), edgeFactor);
}

Result<RoundCommitment> FairnessCommitment::commit(const std::string& serverSeed,
                                                   const std::string& clientSeed) const {
    if (serverSeed.empty()) {
        return ErrorCode::InvalidArgument;
    }

    auto hash = Crypto::HashEngine::sha256Hex(serverSeed);
    if (hash.isFailure()) {
        return hash.error();
    }

    auto crashPoint = crashPointFor(serverSeed, clientSeed, m_edgeFactor);
    if (crashPoint.isFailure()) {
        return crashPoint.error();
    }

    return RoundCommitment(serverSeed, std::move(hash).value(), clientSeed, crashPoint.value());
}

Result<RoundCommitment> FairnessCommitment::newRound(const std::string& clientSeed) const {
    auto seed = m_seedSource();
    if (seed.isFailure()) {
        return seed.error();
    }
    return commit(seed.value(), clientSeed);
}

bool FairnessCommitment::verify(const std::string& serverSeed,
                                const std::string& serverSeedHash,
                                const std::string& clientSeed,
                                Multiplier crashPoint,
                                double edgeFactor) {
    auto claimed = Crypto::fromHex(serverSeedHash);
    if (claimed.isFailure()) {
        return false;
    }

    auto digest = Crypto::HashEngine::sha256(asBytes(serverSeed));
    if (digest.isFailure()) {
        return false;
    }

    if (!Crypto::constantTimeCompare(digest.value(), claimed.value())) {
        return false;
    }

    auto expected = crashPointFor(serverSeed, clientSeed, edgeFactor);
    return expected.isSuccess() && expected.value() == crashPoint;
}

} // namespace Ascent::Game
