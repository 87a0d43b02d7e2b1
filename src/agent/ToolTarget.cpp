// SPDX-License-Identifier: Apache-2.0
#include "ToolTarget.hpp"

#include <mcp/QualifiedName.hpp>

namespace zesbe
{

auto resolveToolTarget(std::string_view name) -> ToolTarget
{
    if (!name.starts_with(QualifiedName::Prefix))
        return BuiltInTarget { .name = std::string(name) };

    auto target = McpTarget { .server = {}, .tool = {}, .qualifiedName = std::string(name) };
    if (auto const parsed = QualifiedName::parse(name))
    {
        target.server = parsed->server;
        target.tool = parsed->tool;
    }
    return target;
}

} // namespace zesbe
