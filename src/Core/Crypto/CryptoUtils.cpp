/**
 * @file CryptoUtils.cpp
 * @brief Hex encoding and decoding
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * Seeds, seed hashes and HMAC digests all travel as lowercase hex.
 */

#include <Ascent/Core/Crypto.hpp>
#include <sstream>
#include <iomanip>

namespace Ascent::Crypto {

namespace {

int hexValue(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

std::string toHex(ByteSpan data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (Byte b : data) {
        oss << std::setw(2) << static_cast<int>(b);
    }

    return oss.str();
}

Result<ByteBuffer> fromHex(std::string_view hex) {
    if (hex.length() % 2 != 0) {
        return ErrorCode::InvalidHexString;
    }

    ByteBuffer result;
    result.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int highVal = hexValue(hex[i]);
        int lowVal = hexValue(hex[i + 1]);

        if (highVal == -1 || lowVal == -1) {
            return ErrorCode::InvalidHexString;
        }

        result.push_back(static_cast<Byte>((highVal << 4) | lowVal));
    }

    return result;
}

} // namespace Ascent::Crypto
