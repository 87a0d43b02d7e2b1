// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace zesbe
{

/// @brief A tool name split into the MCP server it belongs to and its server-local name.
struct QualifiedName
{
    std::string server;
    std::string tool;

    /// Prefix shared by every gateway-exposed tool name.
    static constexpr auto Prefix = std::string_view { "mcp_" };

    /// @brief Builds "mcp_<server>_<tool>".
    [[nodiscard]] auto str() const -> std::string;

    /// @brief Splits "mcp_<server>_<tool>".
    ///
    /// The server segment ends at the first underscore after the prefix, so
    /// tool names may contain underscores but server names may not.
    /// @return The parts, or std::nullopt if either segment would be empty.
    [[nodiscard]] static auto parse(std::string_view qualified) -> std::optional<QualifiedName>;

    /// @brief Returns true if @p server can appear in a qualified name.
    ///
    /// Server names are limited to ASCII letters, digits and '-' so that the
    /// qualified name survives the chat endpoint's tool name rules unchanged.
    [[nodiscard]] static auto isValidServerName(std::string_view server) -> bool;

    /// @brief Maps @p tool onto the characters a chat endpoint accepts in tool names.
    ///
    /// Every character outside [A-Za-z0-9_-] becomes '_'.
    [[nodiscard]] static auto sanitizeToolName(std::string_view tool) -> std::string;

    auto operator==(const QualifiedName&) const -> bool = default;
};

} // namespace zesbe
