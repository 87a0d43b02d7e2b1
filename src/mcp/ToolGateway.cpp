// SPDX-License-Identifier: Apache-2.0
#include "ToolGateway.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/QualifiedName.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>

namespace zesbe
{

auto spawnStdioTransport(const std::string& name, const McpServerConfig& config)
    -> Result<std::unique_ptr<Transport>>
{
    auto transport = std::make_unique<StdioTransport>();

    auto transportConfig = StdioTransportConfig {
        .command = config.command,
        .args = config.args,
        .env = config.env,
        .inheritStderr = log::getLevel() >= log::Level::Debug,
    };

    auto startResult = transport->start(transportConfig);
    if (!startResult)
        return makeError(startResult.error().code,
                         std::format("MCP server '{}': {}", name, startResult.error().message));

    return std::unique_ptr<Transport>(std::move(transport));
}

auto flattenToolContent(const nlohmann::json& result) -> std::string
{
    auto const content = result.is_object() ? result.find("content") : result.end();
    if (content == result.end() || !content->is_array())
        return json::dump(result);

    auto text = std::string {};
    auto first = true;
    for (const auto& part: *content)
    {
        if (!first)
            text += '\n';
        first = false;

        auto const partText = part.is_object() ? part.find("text") : part.end();
        if (partText != part.end() && partText->is_string())
            text += partText->get<std::string>();
        else
            text += json::dump(part);
    }
    return text;
}

ToolGateway::ToolGateway(std::map<std::string, McpServerConfig> servers,
                         GatewayTimeouts timeouts,
                         TransportFactory factory):
    _configs(std::move(servers)),
    _timeouts(timeouts),
    _factory(factory ? std::move(factory) : TransportFactory(spawnStdioTransport))
{
}

ToolGateway::~ToolGateway()
{
    disconnectAll();
}

void ToolGateway::initialize()
{
    for (const auto& [name, config]: serverConfigs())
    {
        if (!config.enabled || isConnected(name))
            continue;

        if (auto result = connect(name, config); !result)
            log::warning("Failed to connect to MCP server '{}': {}", name, result.error().message);
    }
}

auto ToolGateway::connect(const std::string& name, const McpServerConfig& config) -> VoidResult
{
    if (!QualifiedName::isValidServerName(name))
        return makeError(ErrorCode::GatewayError,
                         std::format("Invalid MCP server name '{}' (use letters, digits and '-')", name));

    {
        auto lock = std::unique_lock(_mutex);
        if (_handles.contains(name))
            return {};
        _configs[name] = config;
    }

    // Spawning and the handshake happen without holding the map lock.
    auto transport = _factory(name, config);
    if (!transport)
        return std::unexpected(transport.error());

    auto client = std::make_unique<McpClient>(std::move(*transport));
    client->setRequestTimeout(_timeouts.connect);

    auto info = client->initialize();
    if (!info)
    {
        client->close();
        return makeError(info.error().code,
                         std::format("MCP server '{}' initialization failed: {}", name, info.error().message));
    }

    auto tools = client->listTools();
    if (!tools)
    {
        client->close();
        return makeError(tools.error().code,
                         std::format("MCP server '{}' tool discovery failed: {}", name, tools.error().message));
    }

    client->setRequestTimeout(_timeouts.call);

    auto handle = std::make_shared<ServerHandle>();
    handle->name = name;
    handle->info = *info;
    for (auto& tool: *tools)
    {
        auto published = QualifiedName::sanitizeToolName(tool.name);
        if (auto const [it, inserted] = handle->toolNames.emplace(published, tool.name); !inserted)
        {
            log::warning("MCP server '{}': skipping tool '{}', its name collides with '{}'", name, tool.name, it->second);
            continue;
        }

        auto const description = tool.description.empty() ? tool.name : tool.description;
        handle->tools.push_back(ToolDefinition {
            .name = QualifiedName { .server = name, .tool = std::move(published) }.str(),
            .description = std::format("[MCP:{}] {}", name, description),
            .parameters = std::move(tool.parameters),
        });
    }
    handle->client = std::move(client);

    auto lock = std::unique_lock(_mutex);
    if (_handles.contains(name))
    {
        // Lost a race against a concurrent connect of the same server.
        handle->client->close();
        return {};
    }
    log::info("Connected to MCP server '{}' ({} tools)", name, handle->tools.size());
    _handles.emplace(name, std::move(handle));
    return {};
}

auto ToolGateway::reconnect(const std::string& name) -> VoidResult
{
    auto config = std::optional<McpServerConfig> {};
    {
        auto lock = std::shared_lock(_mutex);
        if (auto const it = _configs.find(name); it != _configs.end())
            config = it->second;
    }
    if (!config)
        return makeError(ErrorCode::GatewayError, std::format("Unknown MCP server: {}", name));

    disconnect(name);
    return connect(name, *config);
}

auto ToolGateway::callTool(std::string_view qualifiedName, const nlohmann::json& arguments) -> ToolResult
{
    auto const errorResult = [](std::string text) {
        return ToolResult { .callId = {}, .content = std::move(text), .isError = true };
    };

    auto const parsed = QualifiedName::parse(qualifiedName);
    if (!parsed)
        return errorResult(std::format("Invalid MCP tool name: {}", qualifiedName));

    auto handle = findHandle(parsed->server);
    if (!handle)
        return errorResult(std::format("MCP server not connected: {}", parsed->server));

    auto lock = std::lock_guard(handle->mutex);
    if (!handle->client->isConnected())
        return errorResult(std::format("MCP server '{}' is no longer running", parsed->server));

    auto const toolName = handle->toolNames.find(parsed->tool);
    if (toolName == handle->toolNames.end())
        return errorResult(std::format("Unknown tool '{}' on MCP server '{}'", parsed->tool, parsed->server));

    log::debug("Calling MCP tool '{}' on server '{}'", toolName->second, parsed->server);
    auto result = handle->client->callTool(toolName->second, arguments);
    if (!result)
        return errorResult(std::format("MCP tool error: {}", result.error().message));

    return ToolResult {
        .callId = {},
        .content = flattenToolContent(*result),
        .isError = json::getBoolOr(*result, "isError", false),
    };
}

auto ToolGateway::disconnect(const std::string& name) -> bool
{
    auto handle = std::shared_ptr<ServerHandle> {};
    {
        auto lock = std::unique_lock(_mutex);
        auto const it = _handles.find(name);
        if (it == _handles.end())
            return false;
        handle = std::move(it->second);
        _handles.erase(it);
    }

    // Waits for a call in flight on this server to finish.
    auto lock = std::lock_guard(handle->mutex);
    handle->client->close();
    log::info("Disconnected MCP server '{}'", name);
    return true;
}

void ToolGateway::disconnectAll()
{
    for (const auto& name: getConnectedServers())
        disconnect(name);
}

auto ToolGateway::getTools() const -> std::vector<ToolDefinition>
{
    auto lock = std::shared_lock(_mutex);
    auto tools = std::vector<ToolDefinition> {};
    for (const auto& [name, handle]: _handles)
        tools.insert(tools.end(), handle->tools.begin(), handle->tools.end());
    return tools;
}

auto ToolGateway::getConnectedServers() const -> std::vector<std::string>
{
    auto lock = std::shared_lock(_mutex);
    auto names = std::vector<std::string> {};
    names.reserve(_handles.size());
    for (const auto& [name, handle]: _handles)
        names.push_back(name);
    return names;
}

auto ToolGateway::isConnected(const std::string& name) const -> bool
{
    return findHandle(name) != nullptr;
}

auto ToolGateway::serverInfo(const std::string& name) const -> std::optional<McpServerInfo>
{
    if (auto handle = findHandle(name))
        return handle->info;
    return std::nullopt;
}

auto ToolGateway::toolCount(const std::string& name) const -> size_t
{
    if (auto handle = findHandle(name))
        return handle->tools.size();
    return 0;
}

auto ToolGateway::serverConfigs() const -> std::map<std::string, McpServerConfig>
{
    auto lock = std::shared_lock(_mutex);
    return _configs;
}

auto ToolGateway::findHandle(const std::string& name) const -> std::shared_ptr<ServerHandle>
{
    auto lock = std::shared_lock(_mutex);
    auto const it = _handles.find(name);
    return it != _handles.end() ? it->second : nullptr;
}

} // namespace zesbe
