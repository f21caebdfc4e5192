/**
 * @file Crypto.hpp
 * @brief Cryptographic primitives for the Ascent round server
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * This module provides the primitives the commit-reveal scheme is built on:
 * - Secure random number generation (server seeds, guest identifiers)
 * - SHA-256/SHA-512 hashing (seed commitments)
 * - HMAC computation (crash point derivation)
 * - Hex encoding and constant-time comparison
 */

#pragma once

#ifndef ASCENT_CORE_CRYPTO_HPP
#define ASCENT_CORE_CRYPTO_HPP

#include <Ascent/Core/Types.hpp>
#include <Ascent/Core/ErrorCodes.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace Ascent::Crypto {

// ============================================================================
// Secure Random Number Generator
// ============================================================================

/**
 * @brief Cryptographically secure random number generator
 *
 * Reads from /dev/urandom; a single instance is safe to share between
 * threads.
 */
class SecureRandom {
public:
    SecureRandom();
    ~SecureRandom();

    SecureRandom(const SecureRandom&) = delete;
    SecureRandom& operator=(const SecureRandom&) = delete;

    /**
     * @brief Generate random bytes
     * @param buffer Buffer to fill with random bytes
     * @param size Number of bytes to generate
     * @return Result indicating success or failure
     */
    Result<void> generate(Byte* buffer, size_t size);

    /**
     * @brief Generate random byte buffer
     * @param size Number of bytes to generate
     * @return Random bytes or error
     */
    Result<ByteBuffer> generate(size_t size);

    /**
     * @brief Generate random bytes rendered as lowercase hex
     * @param byteCount Number of random bytes (output has 2 * byteCount chars)
     * @return Hex string or error
     */
    Result<std::string> generateHex(size_t byteCount);

    /**
     * @brief Generate random value of type T
     */
    template<typename T>
    Result<T> generateValue() {
        T value;
        auto result = generate(reinterpret_cast<Byte*>(&value), sizeof(T));
        if (result.isFailure()) return result.error();
        return value;
    }

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Hash Engine
// ============================================================================

/**
 * @brief Hash algorithm types
 */
enum class HashAlgorithm {
    SHA256,
    SHA384,
    SHA512
};

/**
 * @brief One-shot cryptographic hash engine over the OpenSSL EVP API
 *
 * @example
 * ```cpp
 * auto digest = HashEngine::sha256Hex("seed");
 * ```
 */
class HashEngine {
public:
    explicit HashEngine(HashAlgorithm algorithm = HashAlgorithm::SHA256);
    ~HashEngine();

    /**
     * @brief Compute hash of data
     * @param data Data to hash
     * @return Hash bytes or error
     */
    Result<ByteBuffer> hash(ByteSpan data);

    /**
     * @brief Compute SHA-256 hash
     */
    static Result<SHA256Hash> sha256(ByteSpan data);

    /**
     * @brief Compute SHA-512 hash
     */
    static Result<SHA512Hash> sha512(ByteSpan data);

    /**
     * @brief Compute SHA-256 of a string and render it as lowercase hex
     */
    static Result<std::string> sha256Hex(std::string_view text);

    /**
     * @brief Get hash size for algorithm
     */
    static size_t getHashSize(HashAlgorithm algorithm) noexcept;

    HashAlgorithm getAlgorithm() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// HMAC
// ============================================================================

/**
 * @brief HMAC (Hash-based Message Authentication Code)
 */
class HMAC {
public:
    /**
     * @brief Construct HMAC with key
     * @param key HMAC key
     * @param algorithm Hash algorithm (default: SHA256)
     */
    explicit HMAC(ByteSpan key, HashAlgorithm algorithm = HashAlgorithm::SHA256);

    ~HMAC();

    /**
     * @brief Compute HMAC of data
     * @param data Data to authenticate
     * @return HMAC bytes or error
     */
    Result<ByteBuffer> compute(ByteSpan data);

    /**
     * @brief Compute HMAC-SHA256 (static helper)
     */
    static Result<ByteBuffer> sha256(ByteSpan key, ByteSpan data);

    /**
     * @brief Verify HMAC in constant time
     * @return true if valid, false if invalid
     */
    Result<bool> verify(ByteSpan data, ByteSpan mac);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Convert bytes to lowercase hex string
 */
std::string toHex(ByteSpan data);

/**
 * @brief Convert hex string to bytes
 * @return Bytes or InvalidHexString
 */
Result<ByteBuffer> fromHex(std::string_view hex);

/**
 * @brief Constant-time comparison of byte arrays
 *
 * Used when checking a claimed seed hash or MAC so that comparison time
 * does not depend on where the first mismatch is.
 *
 * @return true if equal
 */
bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept;

} // namespace Ascent::Crypto

#endif // ASCENT_CORE_CRYPTO_HPP
