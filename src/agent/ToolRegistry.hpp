// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <tools/BuiltinTool.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace zesbe
{

/// @brief Owns the built-in tools and dispatches calls to them by name.
class ToolRegistry
{
  public:
    /// @brief Adds a tool, replacing any tool with the same name.
    void add(std::unique_ptr<BuiltinTool> tool);

    /// @brief Adds every tool in @p tools.
    void addAll(std::vector<std::unique_ptr<BuiltinTool>> tools);

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /// @brief Returns the definitions of all tools, ordered by name.
    [[nodiscard]] auto definitions() const -> std::vector<ToolDefinition>;

    /// @brief Runs a tool.
    ///
    /// Exceptions escaping the tool are converted to ErrorCode::ToolCallError.
    /// @return The tool output, or ToolCallError for unknown tools and failures.
    [[nodiscard]] auto execute(std::string_view name, const nlohmann::json& arguments) -> Result<std::string>;

    [[nodiscard]] auto size() const noexcept -> size_t { return _tools.size(); }

  private:
    struct Entry
    {
        ToolDefinition definition;
        std::unique_ptr<BuiltinTool> tool;
    };

    std::map<std::string, Entry, std::less<>> _tools;
};

} // namespace zesbe
