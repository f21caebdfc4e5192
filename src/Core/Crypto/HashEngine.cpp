/**
 * @file HashEngine.cpp
 * @brief Cryptographic hash engine implementation using OpenSSL EVP API
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * SHA-256 is the commitment hash published at round start; SHA-384/512
 * are available for auditors that want a wider digest.
 */

#include <Ascent/Core/Crypto.hpp>
#include <Ascent/Core/Crypto/OpenSSLRAII.hpp>
#include <openssl/evp.h>
#include <algorithm>

namespace Ascent::Crypto {

// ============================================================================
// HashEngine::Impl - OpenSSL EVP implementation
// ============================================================================

class HashEngine::Impl {
public:
    explicit Impl(HashAlgorithm algorithm)
        : m_algorithm(algorithm)
        , m_md(nullptr)
    {
        switch (algorithm) {
            case HashAlgorithm::SHA256:
                m_md = EVP_sha256();
                break;
            case HashAlgorithm::SHA384:
                m_md = EVP_sha384();
                break;
            case HashAlgorithm::SHA512:
                m_md = EVP_sha512();
                break;
        }
    }

    Result<ByteBuffer> hash(ByteSpan data) {
        if (m_md == nullptr) {
            return ErrorCode::CryptoError;
        }

        // Fresh context per call so one engine can be shared by sequential callers
        EVPMDCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx) {
            return ErrorCode::CryptoError;
        }

        if (EVP_DigestInit_ex(ctx, m_md, nullptr) != 1) {
            return ErrorCode::HashFailed;
        }

        if (!data.empty() && EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
            return ErrorCode::HashFailed;
        }

        int hashSize = EVP_MD_get_size(m_md);
        if (hashSize <= 0) {
            return ErrorCode::CryptoError;
        }

        ByteBuffer digest(static_cast<size_t>(hashSize));
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx, digest.data(), &len) != 1) {
            return ErrorCode::HashFailed;
        }

        if (len != static_cast<unsigned int>(hashSize)) {
            return ErrorCode::HashFailed;
        }

        return digest;
    }

    HashAlgorithm getAlgorithm() const noexcept {
        return m_algorithm;
    }

private:
    HashAlgorithm m_algorithm;
    const EVP_MD* m_md;
};

// ============================================================================
// HashEngine - Public API
// ============================================================================

HashEngine::HashEngine(HashAlgorithm algorithm)
    : m_impl(std::make_unique<Impl>(algorithm)) {
}

HashEngine::~HashEngine() = default;

Result<ByteBuffer> HashEngine::hash(ByteSpan data) {
    return m_impl->hash(data);
}

Result<SHA256Hash> HashEngine::sha256(ByteSpan data) {
    HashEngine engine(HashAlgorithm::SHA256);
    auto result = engine.hash(data);

    if (result.isFailure()) {
        return result.error();
    }

    const auto& hashBytes = result.value();
    if (hashBytes.size() != 32) {
        return ErrorCode::HashFailed;
    }

    SHA256Hash digest;
    std::copy(hashBytes.begin(), hashBytes.end(), digest.begin());
    return digest;
}

Result<SHA512Hash> HashEngine::sha512(ByteSpan data) {
    HashEngine engine(HashAlgorithm::SHA512);
    auto result = engine.hash(data);

    if (result.isFailure()) {
        return result.error();
    }

    const auto& hashBytes = result.value();
    if (hashBytes.size() != 64) {
        return ErrorCode::HashFailed;
    }

    SHA512Hash digest;
    std::copy(hashBytes.begin(), hashBytes.end(), digest.begin());
    return digest;
}

Result<std::string> HashEngine::sha256Hex(std::string_view text) {
    auto digest = sha256(asBytes(text));
    if (digest.isFailure()) {
        return digest.error();
    }
    return toHex(digest.value());
}

size_t HashEngine::getHashSize(HashAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case HashAlgorithm::SHA256:
            return 32;
        case HashAlgorithm::SHA384:
            return 48;
        case HashAlgorithm::SHA512:
            return 64;
    }
    return 0;
}

HashAlgorithm HashEngine::getAlgorithm() const noexcept {
    return m_impl->getAlgorithm();
}

} // namespace Ascent::Crypto
