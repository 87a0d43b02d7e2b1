// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace zesbe
{

/// @brief What an MCP server reported about itself during initialization.
struct McpServerInfo
{
    std::string name;
    std::string version;
    std::string protocolVersion;
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
};

/// @brief Client for the Model Context Protocol (MCP).
///
/// Handles the MCP lifecycle: initialize, list tools, call tools.
/// Responses are matched to requests by id; anything else the server sends
/// in between (notifications, stale responses, its own requests) is handled
/// and skipped.
class McpClient
{
  public:
    /// Protocol revision announced in the initialize request.
    static constexpr auto ProtocolVersion = std::string_view { "2024-11-05" };

    /// @brief Constructs an McpClient with the given transport.
    /// @param transport The transport to use for communication.
    explicit McpClient(std::unique_ptr<Transport> transport);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the MCP initialize handshake and sends notifications/initialized.
    /// @return The server's self-description or an error.
    [[nodiscard]] auto initialize() -> Result<McpServerInfo>;

    /// @brief Lists available tools from the server.
    /// @return A vector of tool definitions (original names) or an error.
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDefinition>>;

    /// @brief Calls a tool on the server.
    /// @param name The tool name as the server knows it.
    /// @param arguments The tool arguments.
    /// @return The raw `result` object of the reply, or an error.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments)
        -> Result<nlohmann::json>;

    /// @brief Bounds how long a single request waits for its reply.
    void setRequestTimeout(std::chrono::milliseconds timeout);

    /// @brief Closes the underlying transport.
    void close();

    /// @brief Returns the server info (valid after initialize).
    [[nodiscard]] auto serverInfo() const -> const McpServerInfo&;

    /// @brief Returns true if the client has been initialized.
    [[nodiscard]] auto isInitialized() const -> bool;

    /// @brief Returns true if the transport is still usable.
    [[nodiscard]] auto isConnected() const -> bool;

  private:
    std::unique_ptr<Transport> _transport;
    McpServerInfo _serverInfo;
    int64_t _nextId = 1;
    bool _initialized = false;

    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params = nullptr)
        -> Result<nlohmann::json>;
    [[nodiscard]] auto awaitResponse(int64_t id) -> Result<nlohmann::json>;
    void answerServerRequest(const nlohmann::json& request);
};

} // namespace zesbe
