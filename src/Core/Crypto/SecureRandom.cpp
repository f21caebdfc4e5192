/**
 * @file SecureRandom.cpp
 * @brief Cryptographically secure random number generator implementation
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * Server seeds and guest identifiers are drawn from /dev/urandom. The
 * descriptor is opened on first use so that a missing device surfaces as
 * RandomGenerationFailed instead of a constructor exception.
 */

#include <Ascent/Core/Crypto.hpp>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <mutex>

namespace Ascent::Crypto {

// ============================================================================
// SecureRandom::Impl - /dev/urandom reader
// ============================================================================

class SecureRandom::Impl {
public:
    Impl() = default;

    ~Impl() {
        if (m_fd >= 0) {
            close(m_fd);
        }
    }

    Result<void> generate(Byte* buffer, size_t size) {
        if (buffer == nullptr && size > 0) {
            return ErrorCode::InvalidArgument;
        }

        if (size == 0) {
            return Result<void>::Success();
        }

        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_fd < 0) {
            m_fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
            if (m_fd < 0) {
                return ErrorCode::RandomGenerationFailed;
            }
        }

        size_t total = 0;
        while (total < size) {
            ssize_t n = read(m_fd, buffer + total, size - total);

            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return ErrorCode::RandomGenerationFailed;
            }

            if (n == 0) {
                // Unexpected EOF
                return ErrorCode::RandomGenerationFailed;
            }

            total += static_cast<size_t>(n);
        }

        return Result<void>::Success();
    }

private:
    int m_fd = -1;
    std::mutex m_mutex;
};

// ============================================================================
// SecureRandom - Public API
// ============================================================================

SecureRandom::SecureRandom()
    : m_impl(std::make_unique<Impl>()) {
}

SecureRandom::~SecureRandom() = default;

Result<void> SecureRandom::generate(Byte* buffer, size_t size) {
    return m_impl->generate(buffer, size);
}

Result<ByteBuffer> SecureRandom::generate(size_t size) {
    ByteBuffer buffer(size);
    auto result = m_impl->generate(buffer.data(), size);

    if (result.isFailure()) {
        return result.error();
    }

    return buffer;
}

Result<std::string> SecureRandom::generateHex(size_t byteCount) {
    auto bytes = generate(byteCount);
    if (bytes.isFailure()) {
        return bytes.error();
    }
    return toHex(bytes.value());
}

} // namespace Ascent::Crypto
