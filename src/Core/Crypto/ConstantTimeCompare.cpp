/**
 * @file ConstantTimeCompare.cpp
 * @brief Constant-time comparison for digest verification
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 */

#include <Ascent/Core/Crypto.hpp>
#include <openssl/crypto.h>

namespace Ascent::Crypto {

/**
 * @brief Constant-time comparison of byte arrays
 *
 * Delegates to CRYPTO_memcmp. Length is compared first and is not secret
 * (both sides are fixed-size digests).
 *
 * @param a First buffer
 * @param b Second buffer
 * @return true if contents are identical
 */
bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    if (a.empty()) {
        return true;
    }

    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace Ascent::Crypto
