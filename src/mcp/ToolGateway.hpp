// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace zesbe
{

/// @brief Configuration for a single MCP server.
struct McpServerConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled = true;
};

/// @brief Bounds on how long the gateway waits for MCP servers.
struct GatewayTimeouts
{
    std::chrono::milliseconds connect { 5000 };
    std::chrono::milliseconds call { 60000 };
};

/// @brief Creates the transport for a server. Used to substitute in-process fakes.
using TransportFactory =
    std::function<Result<std::unique_ptr<Transport>>(const std::string& name, const McpServerConfig& config)>;

/// @brief Spawns the server as a child process speaking MCP over stdio.
[[nodiscard]] auto spawnStdioTransport(const std::string& name, const McpServerConfig& config)
    -> Result<std::unique_ptr<Transport>>;

/// @brief Pool of MCP server connections exposing their tools under qualified names.
///
/// Tools are published as `mcp_<server>_<tool>` and calls are routed back by
/// splitting that name. Failures of one server never affect the others, and
/// callTool() reports every failure as text rather than as an error value.
///
/// All methods are safe to call from multiple threads. Requests to the same
/// server are serialized; a call in flight keeps its server alive even if the
/// server is disconnected concurrently.
class ToolGateway
{
  public:
    /// @brief Constructs a gateway over the given server table. Nothing is started yet.
    /// @param servers Server configurations keyed by server name.
    /// @param timeouts Connect and call timeouts.
    /// @param factory Transport factory; defaults to spawnStdioTransport.
    explicit ToolGateway(std::map<std::string, McpServerConfig> servers,
                         GatewayTimeouts timeouts = {},
                         TransportFactory factory = {});
    ~ToolGateway();

    ToolGateway(const ToolGateway&) = delete;
    ToolGateway& operator=(const ToolGateway&) = delete;

    /// @brief Connects every enabled server that is not connected yet.
    ///
    /// Failures are logged and skipped. Calling it again only retries the
    /// servers that are still disconnected.
    void initialize();

    /// @brief Connects one server and discovers its tools.
    ///
    /// The configuration is remembered for reconnect(). Connecting a server
    /// that is already connected succeeds without touching it.
    /// @return Success, or the spawn/handshake/discovery error.
    [[nodiscard]] auto connect(const std::string& name, const McpServerConfig& config) -> VoidResult;

    /// @brief Disconnects and connects a server again with its stored configuration.
    [[nodiscard]] auto reconnect(const std::string& name) -> VoidResult;

    /// @brief Calls a tool by its qualified name.
    /// @return The flattened tool output; any failure is reported with isError set.
    [[nodiscard]] auto callTool(std::string_view qualifiedName, const nlohmann::json& arguments) -> ToolResult;

    /// @brief Closes a server connection.
    /// @return false if the server was not connected.
    auto disconnect(const std::string& name) -> bool;

    /// @brief Closes all server connections.
    void disconnectAll();

    /// @brief Returns the qualified tool definitions of all connected servers.
    [[nodiscard]] auto getTools() const -> std::vector<ToolDefinition>;

    /// @brief Returns the names of all connected servers.
    [[nodiscard]] auto getConnectedServers() const -> std::vector<std::string>;

    [[nodiscard]] auto isConnected(const std::string& name) const -> bool;

    /// @brief Returns what the server reported at initialization, if connected.
    [[nodiscard]] auto serverInfo(const std::string& name) const -> std::optional<McpServerInfo>;

    /// @brief Returns the number of tools a connected server exposes.
    [[nodiscard]] auto toolCount(const std::string& name) const -> size_t;

    /// @brief Returns the configured servers, connected or not.
    [[nodiscard]] auto serverConfigs() const -> std::map<std::string, McpServerConfig>;

  private:
    struct ServerHandle
    {
        std::string name;
        std::mutex mutex; // serializes requests to this server
        std::unique_ptr<McpClient> client;
        std::vector<ToolDefinition> tools;
        std::map<std::string, std::string> toolNames; // published tool segment -> server-local name
        McpServerInfo info;
    };

    [[nodiscard]] auto findHandle(const std::string& name) const -> std::shared_ptr<ServerHandle>;

    mutable std::shared_mutex _mutex;
    std::map<std::string, McpServerConfig> _configs;
    std::map<std::string, std::shared_ptr<ServerHandle>> _handles;
    GatewayTimeouts _timeouts;
    TransportFactory _factory;
};

/// @brief Flattens an MCP tools/call result into a single text.
///
/// Text parts are taken verbatim and other parts as compact JSON, joined by
/// newlines. A result without a content array is serialized whole.
[[nodiscard]] auto flattenToolContent(const nlohmann::json& result) -> std::string;

} // namespace zesbe
