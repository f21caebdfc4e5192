/**
 * @file FairnessCommitment.hpp
 * @brief Provably fair crash point generation (commit-reveal)
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * A round is committed before it starts:
 *
 *   serverSeed     = hex(32 random bytes)
 *   serverSeedHash = hex(SHA-256(serverSeed))
 *   X              = first 52 bits of HMAC-SHA256(key = serverSeed, clientSeed)
 *   crashPoint     = max(1.00, floor(100 * edge * 2^52 / (2^52 - X)) / 100)
 *
 * The hash is published at round start. The seed and the crash point stay
 * inside RoundCommitment and can only be read with a witness object that
 * only the RoundEngine can construct, once the round has crashed.
 */

#pragma once

#ifndef ASCENT_GAME_FAIRNESS_COMMITMENT_HPP
#define ASCENT_GAME_FAIRNESS_COMMITMENT_HPP

#include <Ascent/Core/Types.hpp>
#include <Ascent/Core/ErrorCodes.hpp>
#include <Ascent/Game/GameTypes.hpp>
#include <cstdint>
#include <functional>
#include <string>

namespace Ascent::Game {

class RoundEngine;

/// Number of MAC bits used for the crash point
constexpr unsigned CRASH_PREFIX_BITS = 52;

/// Random bytes in a server seed
constexpr size_t SERVER_SEED_BYTES = 32;

/**
 * @brief Everything needed to verify a finished round
 */
struct RoundReveal {
    std::string serverSeed;
    std::string serverSeedHash;
    std::string clientSeed;
    Multiplier crashPoint = BASE_MULTIPLIER;
};

/**
 * @brief Round row handed to the persistence collaborator
 */
struct RoundRecord {
    RoundId roundId = 0;
    std::string serverSeed;
    std::string serverSeedHash;
    std::string clientSeed;
    Multiplier crashPoint = BASE_MULTIPLIER;
    WallTime startedAt{};
};

/**
 * @brief Proof that the round has crashed
 */
class CrashWitness {
    friend class RoundEngine;
    CrashWitness() = default;
};

/**
 * @brief Permission to archive the secret with the persistence collaborator
 */
class StorageWitness {
    friend class RoundEngine;
    StorageWitness() = default;
};

/**
 * @brief Committed, still secret, round outcome
 */
class RoundCommitment {
public:
    const std::string& serverSeedHash() const noexcept { return m_serverSeedHash; }
    const std::string& clientSeed() const noexcept { return m_clientSeed; }

    /// True once the multiplier has reached the crash point
    bool isCrashedAt(Multiplier multiplier) const noexcept {
        return multiplier >= m_crashPoint;
    }

    /// Seed and crash point, after the crash transition
    RoundReveal reveal(const CrashWitness&) const {
        return RoundReveal{m_serverSeed, m_serverSeedHash, m_clientSeed, m_crashPoint};
    }

    /// Full record for persistence
    RoundRecord seal(const StorageWitness&, RoundId roundId, WallTime startedAt) const {
        return RoundRecord{roundId, m_serverSeed, m_serverSeedHash, m_clientSeed,
                           m_crashPoint, startedAt};
    }

private:
    friend class FairnessCommitment;

    RoundCommitment(std::string serverSeed, std::string serverSeedHash,
                    std::string clientSeed, Multiplier crashPoint)
        : m_serverSeed(std::move(serverSeed))
        , m_serverSeedHash(std::move(serverSeedHash))
        , m_clientSeed(std::move(clientSeed))
        , m_crashPoint(crashPoint) {}

    std::string m_serverSeed;
    std::string m_serverSeedHash;
    std::string m_clientSeed;
    Multiplier m_crashPoint;
};

/**
 * @brief Crash point generator and verifier
 */
class FairnessCommitment {
public:
    /// Source of fresh server seeds
    using SeedSource = std::function<Result<std::string>()>;

    /**
     * @param edgeFactor House edge factor in (0, 1]; 1 is a fair game
     * @param seedSource Seed generator, defaults to 32 CSPRNG bytes as hex
     */
    explicit FairnessCommitment(double edgeFactor, SeedSource seedSource = {});

    double edgeFactor() const noexcept { return m_edgeFactor; }

    /**
     * @brief Draw a seed and commit to a new round
     * @return Commitment, or RandomGenerationFailed / HashFailed / CryptoError
     */
    Result<RoundCommitment> newRound(const std::string& clientSeed) const;

    /**
     * @brief Commit to a known seed
     */
    Result<RoundCommitment> commit(const std::string& serverSeed,
                                   const std::string& clientSeed) const;

    /**
     * @brief Map a 52-bit MAC prefix to a crash point
     *
     * Values of x at or above 2^52 are masked to 52 bits.
     */
    static Multiplier crashPointFromPrefix(uint64_t x, double edgeFactor) noexcept;

    /**
     * @brief Crash point of (serverSeed, clientSeed)
     * @return Crash point or InvalidArgument for an edge factor outside (0, 1]
     */
    static Result<Multiplier> crashPointFor(const std::string& serverSeed,
                                            const std::string& clientSeed,
                                            double edgeFactor);

    /**
     * @brief Verify a revealed round
     *
     * Recomputes the hash and crash point from the seed. Comparison of the
     * hash is constant-time and case-insensitive.
     */
    static bool verify(const std::string& serverSeed, const std::string& serverSeedHash,
                       const std::string& clientSeed, Multiplier crashPoint,
                       double edgeFactor);

    /// verify() with this instance's edge factor
    bool verify(const std::string& serverSeed, const std::string& serverSeedHash,
                const std::string& clientSeed, Multiplier crashPoint) const {
        return verify(serverSeed, serverSeedHash, clientSeed, crashPoint, m_edgeFactor);
    }

    static bool isValidEdgeFactor(double edgeFactor) noexcept;

private:
    double m_edgeFactor;
    SeedSource m_seedSource;
};

} // namespace Ascent::Game

#endif // ASCENT_GAME_FAIRNESS_COMMITMENT_HPP
