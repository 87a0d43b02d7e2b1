// SPDX-License-Identifier: Apache-2.0
#include "AgentLoop.hpp"

#include <core/Log.hpp>

#include <format>

namespace zesbe
{

AgentLoop::AgentLoop(AgentContext context, ChatSession& session, AgentConfig config):
    _context(context), _session(session), _config(std::move(config))
{
}

auto AgentLoop::processMessage(std::string_view userMessage, const AgentEvents& events, std::stop_token stopToken)
    -> Result<std::string>
{
    auto const checkpoint = _session.checkpoint();
    _session.addUserMessage(std::string(userMessage));
    _iterations = 0;

    auto const abortTurn = [&](Error error) -> Result<std::string> {
        _session.truncate(checkpoint);
        _state = AgentState::Aborted;
        log::debug("Turn aborted after {} model turn(s): {}", _iterations, error.message);
        return std::unexpected(std::move(error));
    };

    while (true)
    {
        _state = AgentState::ModelTurn;
        if (++_iterations > _config.maxIterations)
        {
            return abortTurn(Error {
                .code = ErrorCode::LoopCeilingExceeded,
                .message = std::format("No final answer after {} model turns", _config.maxIterations),
                .httpStatus = 0,
            });
        }

        log::debug("Agent step {}/{}", _iterations, _config.maxIterations);
        auto turn = runModelTurn(events, stopToken);
        if (!turn)
            return abortTurn(std::move(turn.error()));

        if (turn->toolCalls.empty())
        {
            _session.addAssistantMessage(turn->text);
            _state = AgentState::Final;
            return std::move(turn->text);
        }

        _state = AgentState::ToolExecution;
        log::info("Model requested {} tool call(s)", turn->toolCalls.size());
        _session.addAssistantMessage(turn->text, turn->toolCalls);

        for (const auto& call: turn->toolCalls)
        {
            if (stopToken.stop_requested())
                return abortTurn(Error { .code = ErrorCode::Cancelled, .message = "Cancelled", .httpStatus = 0 });

            if (events.onToolCall)
                events.onToolCall(call);

            auto result = executeToolCall(call);

            if (events.onToolResult)
                events.onToolResult(call, result);

            _session.addToolResult(call.id, std::move(result.content));
        }
    }
}

auto AgentLoop::config() const -> const AgentConfig&
{
    return _config;
}

void AgentLoop::setConfig(AgentConfig config)
{
    _config = std::move(config);
}

auto AgentLoop::runModelTurn(const AgentEvents& events, std::stop_token stopToken) -> Result<TurnOutput>
{
    auto request = ChatRequest {
        .messages = _session.messages(),
        .tools = offeredTools(),
        .model = _config.model,
        .maxTokens = _config.maxTokens,
        .temperature = _config.temperature,
    };

    auto stream = _context.provider.chatStream(request);
    auto output = TurnOutput {};

    while (true)
    {
        auto event = stream->next(stopToken);
        if (!event)
        {
            // Destroying the stream stops the request.
            if (stopToken.stop_requested())
                return makeError(ErrorCode::Cancelled, "Cancelled");
            return makeError(ErrorCode::ProtocolError, "Stream ended without completion");
        }

        if (auto* fragment = std::get_if<TextFragment>(&*event))
        {
            if (events.onText)
                events.onText(fragment->text);
            output.text += fragment->text;
        }
        else if (auto* toolCall = std::get_if<ToolCallEvent>(&*event))
        {
            output.toolCalls.push_back(std::move(toolCall->call));
        }
        else if (auto* failure = std::get_if<StreamError>(&*event))
        {
            return std::unexpected(std::move(failure->error));
        }
        else
        {
            return output; // StreamDone
        }
    }
}

auto AgentLoop::executeToolCall(const ToolCallRequest& call) -> ToolResult
{
    log::info("Executing tool: {} (id: {})", call.name, call.id);

    auto result = ToolResult { .callId = call.id, .content = {}, .isError = false };
    auto const target = resolveToolTarget(call.name);

    if (auto const* mcp = std::get_if<McpTarget>(&target))
    {
        auto gatewayResult = _context.gateway.callTool(mcp->qualifiedName, call.arguments);
        result.content = std::move(gatewayResult.content);
        result.isError = gatewayResult.isError;
        if (result.isError)
            result.content = std::format("Error: {}", result.content);
    }
    else
    {
        auto const& builtIn = std::get<BuiltInTarget>(target);
        auto output = _context.registry.execute(builtIn.name, call.arguments);
        if (output)
        {
            result.content = std::move(*output);
        }
        else
        {
            log::warning("Tool '{}' failed: {}", call.name, output.error().message);
            result.content = std::format("Error: {}", output.error().message);
            result.isError = true;
        }
    }

    if (result.content.empty())
        result.content = "(no output)";
    return result;
}

auto AgentLoop::offeredTools() const -> std::vector<ToolDefinition>
{
    if (!_config.toolsEnabled)
        return {};

    auto tools = _context.registry.definitions();
    auto mcpTools = _context.gateway.getTools();
    tools.insert(tools.end(), std::make_move_iterator(mcpTools.begin()), std::make_move_iterator(mcpTools.end()));
    return tools;
}

} // namespace zesbe
