// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <llm/ChatProvider.hpp>
#include <llm/ChatSession.hpp>
#include <mcp/ToolGateway.hpp>
#include <zesbe/Config.hpp>

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

namespace zesbe
{

/// @brief Creates the chat backend for the given provider settings.
using ProviderFactory = std::function<Result<std::unique_ptr<ChatProvider>>(const ProviderSettings& settings)>;

/// @brief Creates an OpenAiProvider for @p settings.
[[nodiscard]] auto makeOpenAiProvider(const ProviderSettings& settings) -> Result<std::unique_ptr<ChatProvider>>;

/// @brief How the console is wired to the outside world.
struct ConsoleOptions
{
    std::istream* input = nullptr;  ///< Defaults to std::cin.
    std::ostream* output = nullptr; ///< Defaults to std::cout.

    /// Where /provider persists the selection; empty disables saving.
    std::string configPath;

    ProviderFactory providerFactory;   ///< Defaults to makeOpenAiProvider.
    TransportFactory transportFactory; ///< Defaults to spawning MCP servers.
    ConfigSources sources;             ///< Where /provider looks up API keys.

    /// Whether SIGINT cancels the running turn. Off in tests.
    bool handleInterrupts = true;
};

/// @brief Line-oriented interactive session: reads user input, runs the agent, prints the results.
///
/// Lines starting with '/' are console commands; everything else is sent to
/// the model. While a response is being produced, Ctrl-C cancels it.
class Console
{
  public:
    explicit Console(AppConfig config, ConsoleOptions options = {});
    ~Console();

    Console(const Console&) = delete;
    Console& operator=(const Console&) = delete;

    /// @brief Creates the provider, registers the built-in tools and connects the MCP servers.
    /// @return Success, or the error creating the provider.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the read-eval-print loop until /exit or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

    /// @brief Handles a single input line.
    /// @return false if the console should exit.
    auto handleLine(std::string_view line) -> bool;

    /// @brief Sends one message to the agent and prints the reply.
    /// @return The reply, or why the turn was aborted.
    auto sendMessage(std::string_view text) -> Result<std::string>;

    [[nodiscard]] auto config() const -> const AppConfig&;
    [[nodiscard]] auto session() const -> const ChatSession&;
    [[nodiscard]] auto gateway() -> ToolGateway&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace zesbe
