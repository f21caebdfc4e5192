/**
 * @file HMAC.cpp
 * @brief HMAC (Hash-based Message Authentication Code) implementation
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * HMAC-SHA256 keyed by the server seed over the client seed is the source
 * of every crash point.
 */

#include <Ascent/Core/Crypto.hpp>
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <climits>

namespace Ascent::Crypto {

// ============================================================================
// HMAC::Impl - Implementation details
// ============================================================================

class HMAC::Impl {
public:
    explicit Impl(ByteSpan key, HashAlgorithm algorithm)
        : m_key(key.begin(), key.end())
        , m_evpMd(EVP_sha256())
    {
        switch (algorithm) {
            case HashAlgorithm::SHA256:
                m_evpMd = EVP_sha256();
                break;
            case HashAlgorithm::SHA384:
                m_evpMd = EVP_sha384();
                break;
            case HashAlgorithm::SHA512:
                m_evpMd = EVP_sha512();
                break;
        }
    }

    Result<ByteBuffer> compute(ByteSpan data) {
        // Seeds are 64 hex characters; anything past this is a caller bug
        constexpr size_t MAX_KEY_SIZE = 2048;
        if (m_key.size() > MAX_KEY_SIZE || m_key.size() > INT_MAX) {
            return ErrorCode::InvalidKey;
        }

        unsigned int len = 0;
        ByteBuffer mac(EVP_MAX_MD_SIZE);

        // An empty key still needs a non-null pointer for OpenSSL
        static const Byte emptyKey = 0;
        const Byte* keyPtr = m_key.empty() ? &emptyKey : m_key.data();
        static const Byte emptyData = 0;
        const Byte* dataPtr = data.empty() ? &emptyData : data.data();

        unsigned char* out = ::HMAC(
            m_evpMd,
            keyPtr,
            static_cast<int>(m_key.size()),
            dataPtr,
            data.size(),
            mac.data(),
            &len
        );

        if (out == nullptr) {
            return ErrorCode::CryptoError;
        }

        mac.resize(len);
        return mac;
    }

    Result<bool> verify(ByteSpan data, ByteSpan mac) {
        auto computed = compute(data);
        if (computed.isFailure()) {
            return computed.error();
        }

        return constantTimeCompare(computed.value(), mac);
    }

private:
    ByteBuffer m_key;
    const EVP_MD* m_evpMd;
};

// ============================================================================
// HMAC - Public API
// ============================================================================

HMAC::HMAC(ByteSpan key, HashAlgorithm algorithm)
    : m_impl(std::make_unique<Impl>(key, algorithm)) {
}

HMAC::~HMAC() = default;

Result<ByteBuffer> HMAC::compute(ByteSpan data) {
    return m_impl->compute(data);
}

Result<bool> HMAC::verify(ByteSpan data, ByteSpan mac) {
    return m_impl->verify(data, mac);
}

Result<ByteBuffer> HMAC::sha256(ByteSpan key, ByteSpan data) {
    HMAC hmac(key, HashAlgorithm::SHA256);
    return hmac.compute(data);
}

} // namespace Ascent::Crypto
