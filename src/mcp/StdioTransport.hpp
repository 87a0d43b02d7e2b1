// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace zesbe
{

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;

    /// Added to (and overriding) the parent's environment.
    std::map<std::string, std::string> env;

    /// Whether the child's stderr goes to ours; otherwise it is discarded.
    bool inheritStderr = false;
};

/// @brief Transport that talks newline-delimited JSON over a child process's stdio.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the server process.
    /// @param config The process configuration.
    /// @return Success, or ErrorCode::TransportError if the process could not be spawned.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    void setReceiveTimeout(std::chrono::milliseconds timeout) override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace zesbe
