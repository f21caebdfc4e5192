/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for the Ascent round server
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * This file defines all error codes used throughout Ascent, along with
 * a Result type for error handling without exceptions.
 */

#pragma once

#ifndef ASCENT_CORE_ERROR_CODES_HPP
#define ASCENT_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <stdexcept>
#include <utility>

namespace Ascent {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory : uint8_t {
    None        = 0x00,  ///< No error
    System      = 0x01,  ///< Operating system errors
    Crypto      = 0x03,  ///< Cryptographic errors
    Network     = 0x04,  ///< Network transport errors
    Config      = 0x08,  ///< Configuration errors
    IO          = 0x09,  ///< File I/O errors
    Parse       = 0x0A,  ///< Parsing errors
    Game        = 0x0D,  ///< Wager and round rule violations
    Persistence = 0x0E,  ///< External store errors
    Internal    = 0xFF   ///< Internal/unknown errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Error codes for all Ascent operations
 *
 * Error codes are structured as:
 * - 0x0000: Success
 * - 0x0100-0x01FF: System errors
 * - 0x0300-0x03FF: Crypto errors
 * - 0x0400-0x04FF: Network errors
 * - 0x0800-0x08FF: Config errors
 * - 0x0900-0x09FF: I/O errors
 * - 0x0A00-0x0AFF: Parse errors
 * - 0x0D00-0x0DFF: Game errors
 * - 0x0E00-0x0EFF: Persistence errors
 * - 0xFF00-0xFFFF: Internal errors
 */
enum class ErrorCode : uint16_t {
    /// Operation completed successfully
    Success = 0x0000,

    // ========================================================================
    // System Errors (0x0100-0x01FF)
    // ========================================================================

    /// Generic system error
    SystemError = 0x0100,

    /// Thread creation failed
    ThreadCreationFailed = 0x0103,

    // ========================================================================
    // Cryptographic Errors (0x0300-0x03FF)
    // ========================================================================

    /// Generic cryptographic error
    CryptoError = 0x0300,

    /// Hash computation failed
    HashFailed = 0x0303,

    /// Invalid key format or size
    InvalidKey = 0x0306,

    /// Random number generation failed
    RandomGenerationFailed = 0x0307,

    // ========================================================================
    // Network Errors (0x0400-0x04FF)
    // ========================================================================

    /// Generic network error
    NetworkError = 0x0400,

    // ========================================================================
    // Configuration Errors (0x0800-0x08FF)
    // ========================================================================

    /// Generic configuration error
    ConfigError = 0x0800,

    /// Invalid configuration value
    ConfigInvalid = 0x0802,

    /// Configuration file not found
    ConfigFileNotFound = 0x0803,

    /// Configuration parse error
    ConfigParseFailed = 0x0804,

    // ========================================================================
    // I/O Errors (0x0900-0x09FF)
    // ========================================================================

    /// Generic I/O error
    IOError = 0x0900,

    /// File write error
    FileWriteError = 0x0907,

    /// File too large
    FileTooLarge = 0x0909,

    /// Invalid file path
    InvalidPath = 0x090A,

    /// Access denied
    AccessDenied = 0x090B,

    // ========================================================================
    // Parse Errors (0x0A00-0x0AFF)
    // ========================================================================

    /// Generic parse error
    ParseError = 0x0A00,

    /// JSON parse error
    JsonParseFailed = 0x0A01,

    /// Invalid JSON structure
    JsonInvalid = 0x0A02,

    /// Missing required field
    MissingField = 0x0A03,

    /// Invalid field type
    InvalidFieldType = 0x0A04,

    /// Invalid hex string
    InvalidHexString = 0x0A05,

    /// Message type not understood
    UnknownMessageType = 0x0A07,

    // ========================================================================
    // Game Errors (0x0D00-0x0DFF)
    // ========================================================================

    /// Generic game rule error
    GameError = 0x0D00,

    /// Action attempted outside the round phase that allows it
    WrongPhase = 0x0D01,

    /// Session already holds a wager in this round
    DuplicateBet = 0x0D02,

    /// No open wager to cash out
    NoActiveBet = 0x0D03,

    /// Balance lower than the requested wager
    InsufficientFunds = 0x0D04,

    /// Wager amount non-positive, malformed or above the limit
    InvalidAmount = 0x0D05,

    /// Unknown session identifier
    SessionNotFound = 0x0D06,

    // ========================================================================
    // Persistence Errors (0x0E00-0x0EFF)
    // ========================================================================

    /// Generic persistence error
    PersistenceError = 0x0E00,

    /// External store could not be reached or refused the write
    PersistenceUnavailable = 0x0E01,

    /// Outbound persistence queue is saturated
    PersistenceQueueFull = 0x0E02,

    // ========================================================================
    // Internal Errors (0xFF00-0xFFFF)
    // ========================================================================

    /// Unknown internal error
    InternalError = 0xFF00,

    /// Invalid state
    InvalidState = 0xFF03,

    /// Null pointer
    NullPointer = 0xFF04,

    /// Invalid argument
    InvalidArgument = 0xFF05,

    /// Out of range
    OutOfRange = 0xFF06
};

// ============================================================================
// Error Code Utilities
// ============================================================================

/**
 * @brief Get the category of an error code
 * @param code The error code
 * @return The error category
 */
[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint16_t value = static_cast<uint16_t>(code);
    if (value == 0) return ErrorCategory::None;
    uint8_t category = static_cast<uint8_t>((value >> 8) & 0xFF);
    return static_cast<ErrorCategory>(category);
}

/**
 * @brief Check if an error code represents success
 */
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::Success;
}

/**
 * @brief Check if an error code represents failure
 */
[[nodiscard]] constexpr bool isFailure(ErrorCode code) noexcept {
    return code != ErrorCode::Success;
}

/**
 * @brief Get human-readable error message
 * @param code The error code
 * @return Error message string
 */
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Get error category name
 * @param category The error category
 * @return Category name string
 */
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for operations that can fail
 *
 * This is a discriminated union that holds either a value of type T
 * or an ErrorCode. Use this for error handling without exceptions.
 *
 * @tparam T The success value type
 *
 * @example
 * ```cpp
 * Result<Cents> parseAmount(double value) {
 *     if (value <= 0.0) return ErrorCode::InvalidAmount;
 *     return static_cast<Cents>(value * 100);
 * }
 * ```
 */
template<typename T>
class Result {
public:
    /// Default constructor creates a failed result
    Result() : m_data(ErrorCode::InternalError) {}

    /// Construct from success value
    Result(const T& value) : m_data(value) {}

    /// Construct from success value (move)
    Result(T&& value) : m_data(std::move(value)) {}

    /// Construct from error code
    Result(ErrorCode error) : m_data(error) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    /// Static method to create success result
    [[nodiscard]] static Result Success(T value) {
        return Result(std::move(value));
    }

    /// Static method to create error result
    [[nodiscard]] static Result Error(ErrorCode code) {
        return Result(code);
    }

    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return std::holds_alternative<ErrorCode>(m_data);
    }

    /// True if success
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the success value (throws if failure)
    [[nodiscard]] T& value() & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (const, throws if failure)
    [[nodiscard]] const T& value() const & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (rvalue, throws if failure)
    [[nodiscard]] T&& value() && {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(std::move(m_data));
    }

    /// Get the error code (throws if success)
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::runtime_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorCode>(m_data);
    }

    /// Get value or default if failure
    [[nodiscard]] T valueOr(const T& defaultValue) const & {
        return isSuccess() ? std::get<T>(m_data) : defaultValue;
    }

    /// Get error or Success if no error
    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? std::get<ErrorCode>(m_data) : defaultError;
    }

private:
    std::variant<T, ErrorCode> m_data;
};

/**
 * @brief Specialization of Result for void (no return value)
 */
template<>
class Result<void> {
public:
    /// Construct success result
    Result() : m_error(ErrorCode::Success) {}

    /// Construct from error code
    Result(ErrorCode error) : m_error(error) {}

    [[nodiscard]] static Result Success() {
        return Result();
    }

    [[nodiscard]] static Result Error(ErrorCode code) {
        return Result(code);
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return m_error == ErrorCode::Success;
    }

    [[nodiscard]] bool isFailure() const noexcept {
        return m_error != ErrorCode::Success;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error;
    }

    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? m_error : defaultError;
    }

private:
    ErrorCode m_error;
};

/// Alias for Result<void>
using VoidResult = Result<void>;

// ============================================================================
// Convenience Macros
// ============================================================================

/**
 * @brief Return early if result is failure
 *
 * Usage:
 * ```cpp
 * ASCENT_TRY(someOperation());
 * ```
 */
#define ASCENT_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

/**
 * @brief Assign value or return early on failure
 *
 * Usage:
 * ```cpp
 * ASCENT_TRY_ASSIGN(value, someOperation());
 * ```
 */
#define ASCENT_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (_result_##var.isFailure()) return _result_##var.error(); \
    var = std::move(_result_##var.value())

} // namespace Ascent

#endif // ASCENT_CORE_ERROR_CODES_HPP
