/**
 * @file OpenSSLRAII.hpp
 * @brief RAII wrappers for OpenSSL contexts
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * The round server hashes a seed every round for as long as the process
 * lives, so every EVP context is owned by a wrapper that frees it on all
 * exit paths.
 *
 * @code
 * EVPMDCtxPtr ctx(EVP_MD_CTX_new());
 * if (!ctx) {
 *     return ErrorCode::CryptoError;
 * }
 * EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
 * @endcode
 */

#pragma once

#ifndef ASCENT_CRYPTO_OPENSSL_RAII_HPP
#define ASCENT_CRYPTO_OPENSSL_RAII_HPP

#include <openssl/evp.h>
#include <utility>

namespace Ascent::Crypto {

/**
 * @brief Generic owning wrapper for OpenSSL resources
 *
 * @tparam T OpenSSL object type (e.g. EVP_MD_CTX)
 * @tparam Deleter OpenSSL free function for T
 */
template<typename T, void (*Deleter)(T*)>
class OpenSSLRAII {
public:
    explicit OpenSSLRAII(T* ptr = nullptr) noexcept
        : m_ptr(ptr) {
    }

    ~OpenSSLRAII() noexcept {
        reset();
    }

    OpenSSLRAII(const OpenSSLRAII&) = delete;
    OpenSSLRAII& operator=(const OpenSSLRAII&) = delete;

    OpenSSLRAII(OpenSSLRAII&& other) noexcept
        : m_ptr(other.m_ptr) {
        other.m_ptr = nullptr;
    }

    OpenSSLRAII& operator=(OpenSSLRAII&& other) noexcept {
        if (this != &other) {
            reset();
            m_ptr = other.m_ptr;
            other.m_ptr = nullptr;
        }
        return *this;
    }

    void reset(T* ptr = nullptr) noexcept {
        if (m_ptr != nullptr) {
            Deleter(m_ptr);
        }
        m_ptr = ptr;
    }

    [[nodiscard]] T* get() const noexcept {
        return m_ptr;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return m_ptr != nullptr;
    }

    /// Implicit conversion for OpenSSL API calls
    operator T*() const noexcept {
        return m_ptr;
    }

private:
    T* m_ptr;
};

/// Message digest context
using EVPMDCtxPtr = OpenSSLRAII<EVP_MD_CTX, EVP_MD_CTX_free>;

} // namespace Ascent::Crypto

#endif // ASCENT_CRYPTO_OPENSSL_RAII_HPP
