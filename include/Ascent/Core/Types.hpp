/**
 * @file Types.hpp
 * @brief Core type definitions for the Ascent round server
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * This file contains fundamental type definitions, constants, and aliases
 * used throughout the Ascent codebase. All components should include
 * this header for consistent type usage.
 */

#pragma once

#ifndef ASCENT_CORE_TYPES_HPP
#define ASCENT_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <chrono>

namespace Ascent {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Byte type for raw buffers
using Byte = uint8_t;

/// Span of bytes (non-owning view)
using ByteSpan = std::span<const Byte>;

/// Mutable span of bytes
using MutableByteSpan = std::span<Byte>;

/// Owning byte buffer
using ByteBuffer = std::vector<Byte>;

// ============================================================================
// Time Types
// ============================================================================

/// Monotonic clock used for all timer scheduling
using Clock = std::chrono::steady_clock;

/// Monotonic time point
using TimePoint = Clock::time_point;

/// Wall clock for records that leave the process
using SystemClock = std::chrono::system_clock;

/// Wall-clock time point
using WallTime = SystemClock::time_point;

/// Duration in milliseconds
using Milliseconds = std::chrono::milliseconds;

/// Duration in seconds
using Seconds = std::chrono::seconds;

// ============================================================================
// Cryptographic Types
// ============================================================================

/// SHA-256 hash (32 bytes)
using SHA256Hash = std::array<Byte, 32>;

/// SHA-512 hash (64 bytes)
using SHA512Hash = std::array<Byte, 64>;

// ============================================================================
// Helpers
// ============================================================================

/**
 * @brief View the characters of a string as bytes
 */
inline ByteSpan asBytes(std::string_view text) noexcept {
    return ByteSpan(reinterpret_cast<const Byte*>(text.data()), text.size());
}

/**
 * @brief Milliseconds since the Unix epoch for a wall-clock time point
 */
inline int64_t toUnixMillis(WallTime time) noexcept {
    return std::chrono::duration_cast<Milliseconds>(time.time_since_epoch()).count();
}

} // namespace Ascent

#endif // ASCENT_CORE_TYPES_HPP
