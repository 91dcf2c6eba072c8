#pragma once

#include <cstdint>
#include <string>
#include <expected>
#include <optional>

namespace sightline::core {

// ============================================================================
// Result and Optional Types
// ============================================================================

template<typename T, typename E>
using Result = std::expected<T, E>;

template<typename T>
using Option = std::optional<T>;

// ============================================================================
// Error Types
// ============================================================================

/**
 * Error codes used throughout sightline
 */
enum class ErrorCode : uint32_t {
    Success = 0,

    // Generic errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    Timeout = 6,
    Cancelled = 7,

    // File I/O errors (100-199)
    FileNotFound = 100,
    FileReadError = 103,

    // Layout errors (200-299)
    LayoutParseError = 200,
    InvalidLayout = 201,
    UnknownShapeType = 202,
    InvalidShape = 203,
    DuplicatePieceId = 204,

    // Config errors (300-399)
    ConfigParseError = 300,
    InvalidConfig = 301,

    // Analysis errors (400-499)
    AnalysisFailed = 400,
    AnalysisBusy = 401,
};

/**
 * Error information structure
 */
struct Error {
    ErrorCode code = ErrorCode::Success;
    std::string message;

    Error() = default;

    explicit Error(ErrorCode code_, std::string message_ = "")
        : code(code_), message(std::move(message_)) {}

    bool is_success() const { return code == ErrorCode::Success; }
    bool is_error() const { return code != ErrorCode::Success; }

    std::string to_string() const {
        if (is_success()) return "Success";
        std::string result = "Error " + std::to_string(static_cast<uint32_t>(code));
        if (!message.empty()) result += ": " + message;
        return result;
    }
};

} // namespace sightline::core

// Bring common types into global sightline namespace for convenience
namespace sightline {
    using sightline::core::Result;
    using sightline::core::Option;
    using sightline::core::Error;
    using sightline::core::ErrorCode;
} // namespace sightline
