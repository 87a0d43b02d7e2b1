// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tools/BuiltinTool.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace zesbe
{

/// @brief Settings shared by the built-in tools.
struct BuiltinToolOptions
{
    /// Relative paths and commands are resolved here. Empty means the process's current directory.
    std::filesystem::path workingDirectory;

    std::chrono::seconds commandTimeout { 60 };
    size_t maxCommandOutput = 1024 * 1024;
};

/// @brief Creates read_file, write_file, edit_file and list_directory.
[[nodiscard]] auto createFileTools(const BuiltinToolOptions& options) -> std::vector<std::unique_ptr<BuiltinTool>>;

/// @brief Creates run_command.
[[nodiscard]] auto createCommandTool(const BuiltinToolOptions& options) -> std::unique_ptr<BuiltinTool>;

/// @brief Creates the complete built-in tool set.
[[nodiscard]] auto createBuiltinTools(const BuiltinToolOptions& options)
    -> std::vector<std::unique_ptr<BuiltinTool>>;

namespace toolargs
{
    /// @brief Returns a required, non-empty string argument.
    [[nodiscard]] auto requireString(const nlohmann::json& args, std::string_view key) -> Result<std::string>;

    /// @brief Returns an integer given either as a JSON number or as numeric text.
    [[nodiscard]] auto optionalInt(const nlohmann::json& args, std::string_view key) -> std::optional<int>;

    /// @brief Returns true for a JSON true or the text "true".
    [[nodiscard]] auto flag(const nlohmann::json& args, std::string_view key) -> bool;
} // namespace toolargs

} // namespace zesbe
