// SPDX-License-Identifier: Apache-2.0
#include "ToolRegistry.hpp"

#include <core/Log.hpp>

#include <exception>
#include <format>

namespace zesbe
{

void ToolRegistry::add(std::unique_ptr<BuiltinTool> tool)
{
    auto definition = tool->definition();
    auto name = definition.name;
    _tools.insert_or_assign(std::move(name), Entry { .definition = std::move(definition), .tool = std::move(tool) });
}

void ToolRegistry::addAll(std::vector<std::unique_ptr<BuiltinTool>> tools)
{
    for (auto& tool: tools)
        add(std::move(tool));
}

auto ToolRegistry::contains(std::string_view name) const -> bool
{
    return _tools.find(name) != _tools.end();
}

auto ToolRegistry::definitions() const -> std::vector<ToolDefinition>
{
    auto result = std::vector<ToolDefinition> {};
    result.reserve(_tools.size());
    for (const auto& [name, entry]: _tools)
        result.push_back(entry.definition);
    return result;
}

auto ToolRegistry::execute(std::string_view name, const nlohmann::json& arguments) -> Result<std::string>
{
    auto const it = _tools.find(name);
    if (it == _tools.end())
        return makeError(ErrorCode::ToolCallError, std::format("Unknown tool: {}", name));

    try
    {
        auto result = it->second.tool->execute(arguments);
        if (!result && result.error().code != ErrorCode::ToolCallError)
            return makeError(ErrorCode::ToolCallError, result.error().message);
        return result;
    }
    catch (const std::exception& e)
    {
        log::warning("Tool '{}' threw: {}", name, e.what());
        return makeError(ErrorCode::ToolCallError, e.what());
    }
}

} // namespace zesbe
