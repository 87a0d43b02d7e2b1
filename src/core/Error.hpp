// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace zesbe
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    TransportError,
    EndpointError,
    ProtocolError,
    ToolCallError,
    TimeoutError,
    GatewayError,
    LoopCeilingExceeded,
    Cancelled,
};

/// @brief Returns a short human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::ConfigError: return "config error";
        case ErrorCode::TransportError: return "transport error";
        case ErrorCode::EndpointError: return "endpoint error";
        case ErrorCode::ProtocolError: return "protocol error";
        case ErrorCode::ToolCallError: return "tool error";
        case ErrorCode::TimeoutError: return "timeout";
        case ErrorCode::GatewayError: return "gateway error";
        case ErrorCode::LoopCeilingExceeded: return "iteration limit";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    /// HTTP status for ErrorCode::EndpointError, 0 otherwise.
    int httpStatus = 0;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message), .httpStatus = 0 });
}

/// @brief Creates an unexpected Error for a non-success HTTP status.
/// @param status The HTTP status code returned by the endpoint.
/// @param body The response body, kept verbatim as the message.
/// @return An unexpected Error with ErrorCode::EndpointError.
[[nodiscard]] inline auto makeEndpointError(int status, std::string body) -> std::unexpected<Error>
{
    return std::unexpected<Error>(
        Error { .code = ErrorCode::EndpointError, .message = std::move(body), .httpStatus = status });
}

} // namespace zesbe

template <>
struct std::formatter<zesbe::Error>: std::formatter<std::string>
{
    auto format(const zesbe::Error& error, auto& ctx) const
    {
        if (error.code == zesbe::ErrorCode::EndpointError)
            return std::formatter<std::string>::format(
                std::format("[{} {}] {}", zesbe::errorCodeName(error.code), error.httpStatus, error.message),
                ctx);
        return std::formatter<std::string>::format(
            std::format("[{}] {}", zesbe::errorCodeName(error.code), error.message), ctx);
    }
};
