// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace zesbe
{

/// @brief A tool implemented in-process and offered to the model next to MCP tools.
class BuiltinTool
{
  public:
    virtual ~BuiltinTool() = default;

    /// @brief Returns the name, description and parameter schema shown to the model.
    [[nodiscard]] virtual auto definition() const -> ToolDefinition = 0;

    /// @brief Runs the tool.
    /// @param arguments The arguments object produced by the model.
    /// @return The tool's textual output, or an error whose message is shown to the model.
    [[nodiscard]] virtual auto execute(const nlohmann::json& arguments) -> Result<std::string> = 0;
};

} // namespace zesbe
