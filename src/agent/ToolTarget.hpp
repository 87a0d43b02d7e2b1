// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace zesbe
{

/// @brief A tool implemented in-process.
struct BuiltInTarget
{
    std::string name;
};

/// @brief A tool served by an MCP server through the gateway.
struct McpTarget
{
    std::string server; // empty if the name is not a well-formed qualified name
    std::string tool;
    std::string qualifiedName;
};

/// @brief Where a tool call is executed.
using ToolTarget = std::variant<BuiltInTarget, McpTarget>;

/// @brief Decides where a tool call goes, from its name alone.
///
/// Every name in the "mcp_" namespace is routed to the gateway, which
/// reports malformed ones; everything else is a built-in.
[[nodiscard]] auto resolveToolTarget(std::string_view name) -> ToolTarget;

} // namespace zesbe
