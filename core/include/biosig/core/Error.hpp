/**
 * @file Error.hpp
 * @brief Structured error handling via std::expected for the biosignal pipeline.
 *
 * Every fallible operation returns an Expected<T> instead of throwing
 * exceptions or returning boolean success flags. Exceptions raised by
 * third-party code are converted to an Error at the call boundary.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 *
 * @see https://en.cppreference.com/w/cpp/utility/expected
 */
#pragma once

#ifndef BIOSIG_CORE_ERROR_HPP
    #define BIOSIG_CORE_ERROR_HPP

    #include <cstdint>
    #include <source_location>
    #include <string>
    #include <string_view>
    #include <utility>

namespace biosig::core {

/**
 * @brief Exhaustive catalog of error conditions.
 */
enum class ErrorCode : std::uint8_t {
    kInvalidArgument,
    kInvalidConfiguration,
    kInsufficientData,
    kEmptyInput,
    kChannelCountMismatch,
    kPredictorInput,
    kPredictorFailure,
    kSourceExhausted,
    kNotInitialized,
    kAlreadyRunning,
    kInvalidState,
    kFileNotFound,
    kFileParseError,
    kUnknown
};

/**
 * @brief Returns a short human-readable label for the given error code.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kInvalidArgument:       return "InvalidArgument";
        case ErrorCode::kInvalidConfiguration:  return "InvalidConfiguration";
        case ErrorCode::kInsufficientData:      return "InsufficientData";
        case ErrorCode::kEmptyInput:            return "EmptyInput";
        case ErrorCode::kChannelCountMismatch:  return "ChannelCountMismatch";
        case ErrorCode::kPredictorInput:        return "PredictorInput";
        case ErrorCode::kPredictorFailure:      return "PredictorFailure";
        case ErrorCode::kSourceExhausted:       return "SourceExhausted";
        case ErrorCode::kNotInitialized:        return "NotInitialized";
        case ErrorCode::kAlreadyRunning:        return "AlreadyRunning";
        case ErrorCode::kInvalidState:          return "InvalidState";
        case ErrorCode::kFileNotFound:          return "FileNotFound";
        case ErrorCode::kFileParseError:        return "FileParseError";
        case ErrorCode::kUnknown:               return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Structured error with code, message, and source location.
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::source_location location;

    /**
     * @brief Factory method for constructing an Error at the call site.
     *
     * @param code    The error code identifying the failure category
     * @param message A descriptive message (may include runtime context)
     * @param loc     Automatically captured source location
     * @return A fully constructed Error value
     *
     * @code
     *   return std::unexpected(Error::make(ErrorCode::kInvalidConfiguration, "order must be >= 1"));
     * @endcode
     */
    [[nodiscard]] static Error make(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current())
    {
        return Error{code, std::move(message), loc};
    }

    /**
     * @brief Formats the error as "[Code] message (file:line)".
     */
    [[nodiscard]] std::string format() const;
};

} // namespace biosig::core

#endif // BIOSIG_CORE_ERROR_HPP
