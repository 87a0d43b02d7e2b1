// SPDX-License-Identifier: Apache-2.0
#include "BuiltinTools.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace zesbe
{

namespace toolargs
{
    auto requireString(const nlohmann::json& args, std::string_view key) -> Result<std::string>
    {
        auto value = json::getStringOr(args, key, "");
        if (value.empty())
            return makeError(ErrorCode::InvalidArgument, std::format("Missing required argument '{}'", key));
        return value;
    }

    auto optionalInt(const nlohmann::json& args, std::string_view key) -> std::optional<int>
    {
        auto const it = args.find(std::string(key));
        if (it == args.end())
            return std::nullopt;
        if (it->is_number_integer())
            return it->get<int>();
        if (it->is_string())
        {
            auto const& text = it->get_ref<const std::string&>();
            auto value = 0;
            auto const [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec == std::errc {} && end == text.data() + text.size())
                return value;
        }
        return std::nullopt;
    }

    auto flag(const nlohmann::json& args, std::string_view key) -> bool
    {
        auto const it = args.find(std::string(key));
        if (it == args.end())
            return false;
        if (it->is_boolean())
            return it->get<bool>();
        return it->is_string() && it->get_ref<const std::string&>() == "true";
    }
} // namespace toolargs

namespace
{
    /// Directories not worth descending into when listing recursively.
    constexpr auto SkippedDirectories =
        std::array<std::string_view, 6> { "node_modules", ".git", "dist", "build", ".cache", "__pycache__" };

    constexpr auto MaxRecursiveDepth = 4;
    constexpr auto MaxRecursiveEntries = size_t { 80 };

    auto stringProperty(std::string_view description) -> nlohmann::json
    {
        return nlohmann::json { { "type", "string" }, { "description", description } };
    }

    auto integerProperty(std::string_view description) -> nlohmann::json
    {
        return nlohmann::json { { "type", "integer" }, { "description", description } };
    }

    auto readWholeFile(const fs::path& path) -> Result<std::string>
    {
        auto file = std::ifstream(path, std::ios::binary);
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", path.string()));

        auto buffer = std::stringstream {};
        buffer << file.rdbuf();
        return buffer.str();
    }

    auto writeWholeFile(const fs::path& path, std::string_view content) -> VoidResult
    {
        auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Cannot write file: {}", path.string()));

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Failed writing file: {}", path.string()));
        return {};
    }

    /// @brief Base for tools operating on paths relative to the working directory.
    class FileTool: public BuiltinTool
    {
      public:
        explicit FileTool(fs::path workingDirectory): _workingDirectory(std::move(workingDirectory)) {}

      protected:
        [[nodiscard]] auto resolve(std::string_view path) const -> fs::path
        {
            auto const p = fs::path(path);
            if (p.is_absolute() || _workingDirectory.empty())
                return p.lexically_normal();
            return (_workingDirectory / p).lexically_normal();
        }

      private:
        fs::path _workingDirectory;
    };

    class ReadFileTool final: public FileTool
    {
      public:
        using FileTool::FileTool;

        [[nodiscard]] auto definition() const -> ToolDefinition override
        {
            return ToolDefinition {
                .name = "read_file",
                .description = "Read the contents of a file, with line numbers. Use this to understand "
                               "existing code before making changes.",
                .parameters = {
                    { "type", "object" },
                    { "properties",
                      {
                          { "path", stringProperty("The path to the file to read") },
                          { "line_start", integerProperty("Optional: first line to read (1-based)") },
                          { "line_end", integerProperty("Optional: last line to read (inclusive)") },
                      } },
                    { "required", { "path" } },
                },
            };
        }

        [[nodiscard]] auto execute(const nlohmann::json& arguments) -> Result<std::string> override
        {
            auto const path = toolargs::requireString(arguments, "path");
            if (!path)
                return std::unexpected(path.error());

            auto content = readWholeFile(resolve(*path));
            if (!content)
                return std::unexpected(content.error());

            auto lines = std::vector<std::string_view> {};
            auto view = std::string_view(*content);
            while (!view.empty())
            {
                auto const newline = view.find('\n');
                lines.push_back(view.substr(0, newline));
                if (newline == std::string_view::npos)
                    break;
                view.remove_prefix(newline + 1);
            }

            auto const total = static_cast<int>(lines.size());
            auto const first = std::max(1, toolargs::optionalInt(arguments, "line_start").value_or(1));
            auto const last = std::min(total, toolargs::optionalInt(arguments, "line_end").value_or(total));

            auto output = std::string {};
            for (auto lineNo = first; lineNo <= last; ++lineNo)
            {
                if (!output.empty())
                    output += '\n';
                output += std::format("{:>4} │ {}", lineNo, lines[static_cast<size_t>(lineNo - 1)]);
            }
            return output;
        }
    };

    class WriteFileTool final: public FileTool
    {
      public:
        using FileTool::FileTool;

        [[nodiscard]] auto definition() const -> ToolDefinition override
        {
            return ToolDefinition {
                .name = "write_file",
                .description = "Write or overwrite a file with new content. Creates directories if needed.",
                .parameters = {
                    { "type", "object" },
                    { "properties",
                      {
                          { "path", stringProperty("The path to the file to write") },
                          { "content", stringProperty("The complete content to write to the file") },
                      } },
                    { "required", { "path", "content" } },
                },
            };
        }

        [[nodiscard]] auto execute(const nlohmann::json& arguments) -> Result<std::string> override
        {
            auto const path = toolargs::requireString(arguments, "path");
            if (!path)
                return std::unexpected(path.error());

            auto const content = json::getStringOr(arguments, "content", "");
            auto const target = resolve(*path);

            if (target.has_parent_path())
            {
                auto ec = std::error_code {};
                fs::create_directories(target.parent_path(), ec);
                if (ec)
                    return makeError(ErrorCode::IoError,
                                     std::format("Cannot create directory {}: {}", target.parent_path().string(), ec.message()));
            }

            return writeWholeFile(target, content).transform([&]() {
                return std::format("Successfully wrote {} bytes to {}", content.size(), target.string());
            });
        }
    };

    class EditFileTool final: public FileTool
    {
      public:
        using FileTool::FileTool;

        [[nodiscard]] auto definition() const -> ToolDefinition override
        {
            return ToolDefinition {
                .name = "edit_file",
                .description = "Edit a file by replacing the first exact occurrence of a text. Use this for "
                               "surgical code changes instead of rewriting entire files.",
                .parameters = {
                    { "type", "object" },
                    { "properties",
                      {
                          { "path", stringProperty("The path to the file to edit") },
                          { "old_text", stringProperty("The exact text to find and replace (must match exactly)") },
                          { "new_text", stringProperty("The new text to replace with") },
                      } },
                    { "required", { "path", "old_text", "new_text" } },
                },
            };
        }

        [[nodiscard]] auto execute(const nlohmann::json& arguments) -> Result<std::string> override
        {
            auto const path = toolargs::requireString(arguments, "path");
            if (!path)
                return std::unexpected(path.error());
            auto const oldText = toolargs::requireString(arguments, "old_text");
            if (!oldText)
                return std::unexpected(oldText.error());
            auto const newText = json::getStringOr(arguments, "new_text", "");

            auto const target = resolve(*path);
            auto content = readWholeFile(target);
            if (!content)
                return std::unexpected(content.error());

            auto const pos = content->find(*oldText);
            if (pos == std::string::npos)
                return makeError(ErrorCode::ToolCallError,
                                 "Text not found in file. Make sure old_text matches exactly.");

            content->replace(pos, oldText->size(), newText);
            return writeWholeFile(target, *content).transform([&]() {
                return std::format("Successfully edited {}\nReplaced {} chars with {} chars",
                                   target.string(),
                                   oldText->size(),
                                   newText.size());
            });
        }
    };

    class ListDirectoryTool final: public FileTool
    {
      public:
        using FileTool::FileTool;

        [[nodiscard]] auto definition() const -> ToolDefinition override
        {
            return ToolDefinition {
                .name = "list_directory",
                .description = "List files and directories. Use to explore project structure.",
                .parameters = {
                    { "type", "object" },
                    { "properties",
                      {
                          { "path", stringProperty("The directory path to list (default: current directory)") },
                          { "recursive", { { "type", "boolean" }, { "description", "List subdirectories too" } } },
                      } },
                    { "required", nlohmann::json::array() },
                },
            };
        }

        [[nodiscard]] auto execute(const nlohmann::json& arguments) -> Result<std::string> override
        {
            auto const path = json::getStringOr(arguments, "path", ".");
            auto const dir = resolve(path.empty() ? "." : path);

            auto ec = std::error_code {};
            if (!fs::is_directory(dir, ec))
                return makeError(ErrorCode::IoError, std::format("Not a directory: {}", dir.string()));

            return toolargs::flag(arguments, "recursive") ? listRecursive(dir) : listFlat(dir);
        }

      private:
        static auto listFlat(const fs::path& dir) -> Result<std::string>
        {
            auto ec = std::error_code {};
            auto entries = std::vector<std::string> {};
            for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec))
            {
                auto typeError = std::error_code {};
                auto const isDir = it->is_directory(typeError);
                entries.push_back(std::format("{} {}", isDir ? "[DIR]" : "[FILE]", it->path().filename().string()));
            }
            if (ec)
                return makeError(ErrorCode::IoError, std::format("Cannot list {}: {}", dir.string(), ec.message()));

            std::ranges::sort(entries);
            return joinLines(entries, "Directory is empty");
        }

        static auto listRecursive(const fs::path& dir) -> Result<std::string>
        {
            auto ec = std::error_code {};
            auto entries = std::vector<std::string> {};
            auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
            for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
            {
                auto const name = it->path().filename().string();
                auto typeError = std::error_code {};
                auto const isDir = it->is_directory(typeError);
                if (isDir && std::ranges::find(SkippedDirectories, name) != SkippedDirectories.end())
                {
                    it.disable_recursion_pending();
                    continue;
                }
                if (isDir && it.depth() + 1 >= MaxRecursiveDepth)
                    it.disable_recursion_pending();

                auto const relative = it->path().lexically_relative(dir).generic_string();
                entries.push_back(isDir ? relative + "/" : relative);
            }
            if (ec)
                return makeError(ErrorCode::IoError, std::format("Cannot list {}: {}", dir.string(), ec.message()));

            std::ranges::sort(entries);
            auto const truncated = entries.size() > MaxRecursiveEntries;
            if (truncated)
                entries.resize(MaxRecursiveEntries);

            auto output = joinLines(entries, "No files found");
            if (truncated)
                output += "\n... (truncated)";
            return output;
        }

        static auto joinLines(const std::vector<std::string>& lines, std::string_view whenEmpty) -> std::string
        {
            if (lines.empty())
                return std::string(whenEmpty);

            auto output = std::string {};
            for (const auto& line: lines)
            {
                if (!output.empty())
                    output += '\n';
                output += line;
            }
            return output;
        }
    };

} // namespace

auto createFileTools(const BuiltinToolOptions& options) -> std::vector<std::unique_ptr<BuiltinTool>>
{
    auto tools = std::vector<std::unique_ptr<BuiltinTool>> {};
    tools.push_back(std::make_unique<ReadFileTool>(options.workingDirectory));
    tools.push_back(std::make_unique<WriteFileTool>(options.workingDirectory));
    tools.push_back(std::make_unique<EditFileTool>(options.workingDirectory));
    tools.push_back(std::make_unique<ListDirectoryTool>(options.workingDirectory));
    return tools;
}

auto createBuiltinTools(const BuiltinToolOptions& options) -> std::vector<std::unique_ptr<BuiltinTool>>
{
    auto tools = createFileTools(options);
    tools.push_back(createCommandTool(options));
    return tools;
}

} // namespace zesbe
