// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>

namespace zesbe
{

McpClient::McpClient(std::unique_ptr<Transport> transport): _transport(std::move(transport))
{
}

McpClient::~McpClient() = default;

auto McpClient::initialize() -> Result<McpServerInfo>
{
    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "zesbe" },
              { "version", "0.1.0" },
          } },
    };

    return sendRequest("initialize", std::move(params))
        .and_then([this](const nlohmann::json& result) -> Result<McpServerInfo> {
            if (!result.is_object())
                return makeError(ErrorCode::ProtocolError, "initialize returned no result object");

            auto const serverInfo = result.value("serverInfo", nlohmann::json::object());
            _serverInfo.name = json::getStringOr(serverInfo, "name", "unknown");
            _serverInfo.version = json::getStringOr(serverInfo, "version", "unknown");
            _serverInfo.protocolVersion = json::getStringOr(result, "protocolVersion", ProtocolVersion);

            if (auto const caps = result.find("capabilities"); caps != result.end() && caps->is_object())
            {
                _serverInfo.hasTools = caps->contains("tools");
                _serverInfo.hasResources = caps->contains("resources");
                _serverInfo.hasPrompts = caps->contains("prompts");
            }

            return _transport->send(jsonrpc::makeNotification("notifications/initialized"))
                .transform([this]() {
                    _initialized = true;
                    log::debug("MCP server initialized: {} v{}", _serverInfo.name, _serverInfo.version);
                    return _serverInfo;
                });
        });
}

auto McpClient::listTools() -> Result<std::vector<ToolDefinition>>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    return sendRequest("tools/list")
        .and_then([](const nlohmann::json& result) -> Result<std::vector<ToolDefinition>> {
            auto tools = std::vector<ToolDefinition> {};

            auto const list = result.find("tools");
            if (list == result.end() || !list->is_array())
                return tools;

            for (const auto& toolJson: *list)
            {
                if (!toolJson.is_object())
                    continue;
                auto tool = ToolDefinition {
                    .name = json::getStringOr(toolJson, "name", ""),
                    .description = json::getStringOr(toolJson, "description", ""),
                    .parameters = toolJson.value("inputSchema", nlohmann::json::object()),
                };
                if (!tool.name.empty())
                    tools.push_back(std::move(tool));
            }

            return tools;
        });
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_object() ? arguments : nlohmann::json::object() },
    };

    return sendRequest("tools/call", std::move(params));
}

void McpClient::setRequestTimeout(std::chrono::milliseconds timeout)
{
    _transport->setReceiveTimeout(timeout);
}

void McpClient::close()
{
    _transport->close();
    _initialized = false;
}

auto McpClient::serverInfo() const -> const McpServerInfo&
{
    return _serverInfo;
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::isConnected() const -> bool
{
    return _transport->isConnected();
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    auto const id = _nextId++;
    auto request = jsonrpc::makeRequest(id, method, std::move(params));

    return _transport->send(request).and_then([this, id]() { return awaitResponse(id); });
}

auto McpClient::awaitResponse(int64_t id) -> Result<nlohmann::json>
{
    while (true)
    {
        auto message = _transport->receive();
        if (!message)
            return std::unexpected(message.error());

        switch (jsonrpc::classify(*message))
        {
            case jsonrpc::MessageKind::Notification:
                log::trace("MCP notification: {}", json::getStringOr(*message, "method", ""));
                continue;
            case jsonrpc::MessageKind::Request: answerServerRequest(*message); continue;
            case jsonrpc::MessageKind::Invalid: log::debug("Skipping invalid MCP message"); continue;
            case jsonrpc::MessageKind::Response: break;
        }

        auto const& responseId = (*message)["id"];
        if (!responseId.is_number_integer() || responseId.get<int64_t>() != id)
        {
            log::debug("Skipping stale MCP response {}", responseId.dump());
            continue;
        }

        return jsonrpc::parseResponse(*message).and_then(
            [](const jsonrpc::Response& resp) -> Result<nlohmann::json> {
                if (resp.error)
                {
                    return makeError(ErrorCode::ProtocolError,
                                     std::format("RPC error {}: {}", resp.error->code, resp.error->message));
                }
                return resp.result.value_or(nlohmann::json::object());
            });
    }
}

void McpClient::answerServerRequest(const nlohmann::json& request)
{
    auto const& id = request["id"];
    auto const method = json::getStringOr(request, "method", "");

    auto const reply = method == "ping"
                           ? jsonrpc::makeResult(id, nlohmann::json::object())
                           : jsonrpc::makeErrorReply(
                                 id, jsonrpc::MethodNotFound, std::format("Method not found: {}", method));

    if (auto sent = _transport->send(reply); !sent)
        log::debug("Failed to answer server request '{}': {}", method, sent.error().message);
}

} // namespace zesbe
