/**
 * @file ErrorCodes.cpp
 * @brief Human-readable text for error codes and categories
 * @author Ascent Engineering Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Ascent Games. All rights reserved.
 *
 * The strings returned for Game and Parse codes are sent verbatim to
 * players in ERROR replies.
 */

#include <Ascent/Core/ErrorCodes.hpp>

namespace Ascent {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:                return "Success";

        case ErrorCode::SystemError:            return "System error";
        case ErrorCode::ThreadCreationFailed:   return "Thread creation failed";

        case ErrorCode::CryptoError:            return "Cryptographic error";
        case ErrorCode::HashFailed:             return "Hash computation failed";
        case ErrorCode::InvalidKey:             return "Invalid key";
        case ErrorCode::RandomGenerationFailed: return "Random generation failed";

        case ErrorCode::NetworkError:           return "Network error";

        case ErrorCode::ConfigError:            return "Configuration error";
        case ErrorCode::ConfigInvalid:          return "Invalid configuration value";
        case ErrorCode::ConfigFileNotFound:     return "Configuration file not found";
        case ErrorCode::ConfigParseFailed:      return "Configuration parse failed";

        case ErrorCode::IOError:                return "I/O error";
        case ErrorCode::FileWriteError:         return "File write error";
        case ErrorCode::FileTooLarge:           return "File too large";
        case ErrorCode::InvalidPath:            return "Invalid path";
        case ErrorCode::AccessDenied:           return "Access denied";

        case ErrorCode::ParseError:             return "Malformed message";
        case ErrorCode::JsonParseFailed:        return "Malformed message";
        case ErrorCode::JsonInvalid:            return "Malformed message";
        case ErrorCode::MissingField:           return "Missing field";
        case ErrorCode::InvalidFieldType:       return "Invalid field type";
        case ErrorCode::InvalidHexString:       return "Invalid hex string";
        case ErrorCode::UnknownMessageType:     return "Unknown message type";

        case ErrorCode::GameError:              return "Action rejected";
        case ErrorCode::WrongPhase:             return "Action not allowed in the current round phase";
        case ErrorCode::DuplicateBet:           return "Already bet this round";
        case ErrorCode::NoActiveBet:            return "No active bet to cash out";
        case ErrorCode::InsufficientFunds:      return "Insufficient balance";
        case ErrorCode::InvalidAmount:          return "Invalid bet amount";
        case ErrorCode::SessionNotFound:        return "Unknown session";

        case ErrorCode::PersistenceError:       return "Persistence error";
        case ErrorCode::PersistenceUnavailable: return "Persistence unavailable";
        case ErrorCode::PersistenceQueueFull:   return "Persistence queue full";

        case ErrorCode::InternalError:          return "Internal error";
        case ErrorCode::InvalidState:           return "Invalid state";
        case ErrorCode::NullPointer:            return "Null pointer";
        case ErrorCode::InvalidArgument:        return "Invalid argument";
        case ErrorCode::OutOfRange:             return "Out of range";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:        return "None";
        case ErrorCategory::System:      return "System";
        case ErrorCategory::Crypto:      return "Crypto";
        case ErrorCategory::Network:     return "Network";
        case ErrorCategory::Config:      return "Config";
        case ErrorCategory::IO:          return "IO";
        case ErrorCategory::Parse:       return "Parse";
        case ErrorCategory::Game:        return "Game";
        case ErrorCategory::Persistence: return "Persistence";
        case ErrorCategory::Internal:    return "Internal";
    }
    return "Unknown";
}

} // namespace Ascent
