// SPDX-License-Identifier: Apache-2.0
#include "QualifiedName.hpp"

#include <algorithm>
#include <format>

namespace zesbe
{

namespace
{
    auto isNameChar(char c) -> bool
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
    }
} // namespace

auto QualifiedName::str() const -> std::string
{
    return std::format("{}{}_{}", Prefix, server, tool);
}

auto QualifiedName::parse(std::string_view qualified) -> std::optional<QualifiedName>
{
    if (!qualified.starts_with(Prefix))
        return std::nullopt;

    auto const rest = qualified.substr(Prefix.size());
    auto const separator = rest.find('_');
    if (separator == std::string_view::npos || separator == 0 || separator + 1 >= rest.size())
        return std::nullopt;

    return QualifiedName {
        .server = std::string(rest.substr(0, separator)),
        .tool = std::string(rest.substr(separator + 1)),
    };
}

auto QualifiedName::isValidServerName(std::string_view server) -> bool
{
    return !server.empty() && std::ranges::all_of(server, isNameChar);
}

auto QualifiedName::sanitizeToolName(std::string_view tool) -> std::string
{
    auto result = std::string(tool);
    std::ranges::replace_if(result, [](char c) { return c != '_' && !isNameChar(c); }, '_');
    return result;
}

} // namespace zesbe
