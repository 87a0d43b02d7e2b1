// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/ToolRegistry.hpp>
#include <agent/ToolTarget.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/ChatProvider.hpp>
#include <llm/ChatSession.hpp>
#include <mcp/ToolGateway.hpp>

#include <functional>
#include <stop_token>
#include <string>
#include <string_view>

namespace zesbe
{

/// @brief Configuration for the agent loop.
struct AgentConfig
{
    int maxIterations = 10; // model turns per user message
    std::string model;      // empty means the provider's default
    int maxTokens = 4096;
    float temperature = 0.7f;
    bool toolsEnabled = true;
};

/// @brief The collaborators an agent loop works with. None of them is owned.
struct AgentContext
{
    ChatProvider& provider;
    ToolRegistry& registry;
    ToolGateway& gateway;
};

/// @brief Progress notifications raised while a message is processed. Any may be empty.
struct AgentEvents
{
    std::function<void(std::string_view text)> onText;
    std::function<void(const ToolCallRequest& call)> onToolCall;
    std::function<void(const ToolCallRequest& call, const ToolResult& result)> onToolResult;
};

/// @brief Where the loop is in processing a message.
enum class AgentState
{
    Idle,
    ModelTurn,
    ToolExecution,
    Final,
    Aborted,
};

/// @brief Implements a multi-step agent reasoning loop.
///
/// The loop sends the conversation to the model, executes any tool calls,
/// feeds results back, and repeats until the model produces a final text
/// response. Every assistant message that requests tools is followed by
/// exactly one tool message per request, in request order, before the next
/// model turn.
///
/// A turn that fails, is cancelled, or exceeds the iteration limit leaves the
/// session exactly as it was before the user message.
class AgentLoop
{
  public:
    /// @brief Constructs an AgentLoop.
    /// @param context Provider, built-in tools and MCP gateway to work with.
    /// @param session Reference to the chat session.
    /// @param config Agent configuration.
    AgentLoop(AgentContext context, ChatSession& session, AgentConfig config);

    /// @brief Processes a user message through the agent loop.
    /// @param userMessage The user's input text.
    /// @param events Optional progress callbacks.
    /// @param stopToken Cancels the turn when stop is requested.
    /// @return The final assistant response text, or the reason the turn was aborted
    ///         (LoopCeilingExceeded, Cancelled, or the stream's error).
    [[nodiscard]] auto processMessage(std::string_view userMessage,
                                      const AgentEvents& events = {},
                                      std::stop_token stopToken = {}) -> Result<std::string>;

    /// @brief Returns the agent configuration.
    [[nodiscard]] auto config() const -> const AgentConfig&;

    /// @brief Replaces the agent configuration for subsequent messages.
    void setConfig(AgentConfig config);

    /// @brief Returns the state the last processMessage() call ended in.
    [[nodiscard]] auto state() const noexcept -> AgentState { return _state; }

    /// @brief Returns the number of model turns the last processMessage() call made.
    [[nodiscard]] auto iterations() const noexcept -> int { return _iterations; }

  private:
    struct TurnOutput
    {
        std::string text;
        std::vector<ToolCallRequest> toolCalls;
    };

    [[nodiscard]] auto runModelTurn(const AgentEvents& events, std::stop_token stopToken) -> Result<TurnOutput>;
    [[nodiscard]] auto executeToolCall(const ToolCallRequest& call) -> ToolResult;
    [[nodiscard]] auto offeredTools() const -> std::vector<ToolDefinition>;

    AgentContext _context;
    ChatSession& _session;
    AgentConfig _config;
    AgentState _state = AgentState::Idle;
    int _iterations = 0;
};

} // namespace zesbe
