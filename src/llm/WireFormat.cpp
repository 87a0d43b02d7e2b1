// SPDX-License-Identifier: Apache-2.0
#include "WireFormat.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>

namespace zesbe::wire
{

namespace
{
    auto isAllowedNameChar(char c) -> bool
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_'
               || c == '-';
    }

    auto isUtf8Continuation(char c) -> bool
    {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    auto toWireToolCall(const ToolCallRequest& call) -> nlohmann::json
    {
        return nlohmann::json {
            { "id", call.id },
            { "type", "function" },
            { "function",
              {
                  { "name", call.name },
                  { "arguments", call.arguments.is_object() ? json::dump(call.arguments) : std::string("{}") },
              } },
        };
    }
} // namespace

auto toWireMessage(const Message& message) -> nlohmann::json
{
    auto wire = nlohmann::json {
        { "role", roleToString(message.role) },
        { "content", message.content },
    };

    if (message.role == Role::Assistant && !message.toolCalls.empty())
    {
        if (message.content.empty())
            wire["content"] = nullptr;

        auto calls = nlohmann::json::array();
        for (const auto& call: message.toolCalls)
            calls.push_back(toWireToolCall(call));
        wire["tool_calls"] = std::move(calls);
    }

    if (message.role == Role::Tool)
        wire["tool_call_id"] = message.toolCallId;

    return wire;
}

auto toWireMessages(const std::vector<Message>& messages) -> nlohmann::json
{
    auto wire = nlohmann::json::array();
    for (const auto& message: messages)
        wire.push_back(toWireMessage(message));
    return wire;
}

auto sanitizeToolName(std::string_view name) -> std::string
{
    auto result = std::string(name);
    std::ranges::replace_if(result, [](char c) { return !isAllowedNameChar(c); }, '_');
    return result;
}

auto truncateUtf8(std::string_view text, size_t maxBytes) -> std::string
{
    if (text.size() <= maxBytes)
        return std::string(text);

    auto cut = maxBytes;
    while (cut > 0 && isUtf8Continuation(text[cut]))
        --cut;
    return std::string(text.substr(0, cut));
}

auto sanitizeParameters(const nlohmann::json& parameters) -> nlohmann::json
{
    auto schema = nlohmann::json {
        { "type", "object" },
        { "properties", nlohmann::json::object() },
        { "required", nlohmann::json::array() },
    };

    if (!parameters.is_object())
        return schema;

    if (auto const it = parameters.find("type"); it != parameters.end() && it->is_string())
        schema["type"] = *it;
    if (auto const it = parameters.find("properties"); it != parameters.end() && it->is_object())
        schema["properties"] = *it;
    if (auto const it = parameters.find("required"); it != parameters.end() && it->is_array())
        schema["required"] = *it;
    if (auto const it = parameters.find("additionalProperties"); it != parameters.end())
        schema["additionalProperties"] = *it;

    return schema;
}

auto toWireTools(const std::vector<ToolDefinition>& tools) -> nlohmann::json
{
    auto wire = nlohmann::json::array();
    for (const auto& tool: tools)
    {
        if (tool.name.empty())
            continue;

        auto const description = tool.description.empty() ? tool.name : tool.description;
        wire.push_back(nlohmann::json {
            { "type", "function" },
            { "function",
              {
                  { "name", sanitizeToolName(tool.name) },
                  { "description", truncateUtf8(description, MaxToolDescriptionBytes) },
                  { "parameters", sanitizeParameters(tool.parameters) },
              } },
        });
    }
    return wire;
}

auto buildRequestBody(const ChatRequest& request, std::string_view defaultModel, bool stream) -> nlohmann::json
{
    auto body = nlohmann::json {
        { "model", request.model.empty() ? std::string(defaultModel) : request.model },
        { "messages", toWireMessages(request.messages) },
        { "max_tokens", request.maxTokens },
        { "temperature", request.temperature },
        { "stream", stream },
    };

    auto tools = toWireTools(request.tools);
    if (!tools.empty())
    {
        body["tools"] = std::move(tools);
        body["tool_choice"] = "auto";
    }

    return body;
}

auto parseFinishReason(std::string_view reason) -> FinishReason
{
    if (reason == "tool_calls" || reason == "function_call")
        return FinishReason::ToolCalls;
    if (reason == "length")
        return FinishReason::Length;
    if (reason == "error")
        return FinishReason::Error;
    return FinishReason::Stop;
}

auto parseArguments(std::string_view toolName, std::string_view argumentsText) -> nlohmann::json
{
    if (argumentsText.find_first_not_of(" \t\r\n") == std::string_view::npos)
        return nlohmann::json::object();

    auto parsed = json::parse(argumentsText);
    if (!parsed || !parsed->is_object())
    {
        log::warning("Tool call '{}' has malformed arguments, using {{}}: {}",
                     toolName,
                     argumentsText.substr(0, 200));
        return nlohmann::json::object();
    }
    return std::move(*parsed);
}

auto parseChatResponse(const nlohmann::json& body) -> Result<ChatResponse>
{
    if (!body.is_object())
        return makeError(ErrorCode::ProtocolError, "Chat response is not a JSON object");

    auto const choices = body.find("choices");
    if (choices == body.end() || !choices->is_array() || choices->empty() || !(*choices)[0].is_object())
        return makeError(ErrorCode::ProtocolError, "Chat response has no choices");

    auto const& choice = (*choices)[0];
    auto const message = choice.find("message");
    if (message == choice.end() || !message->is_object())
        return makeError(ErrorCode::ProtocolError, "Chat response choice has no message");

    auto response = ChatResponse {};
    response.id = json::getStringOr(body, "id", "");
    response.model = json::getStringOr(body, "model", "");
    response.content = json::getStringOr(*message, "content", "");
    response.finishReason = parseFinishReason(json::getStringOr(choice, "finish_reason", "stop"));

    if (auto const calls = message->find("tool_calls"); calls != message->end() && calls->is_array())
    {
        for (const auto& call: *calls)
        {
            if (!call.is_object() || !call.contains("function") || !call["function"].is_object())
                continue;
            auto const& function = call["function"];
            auto const name = json::getStringOr(function, "name", "");
            auto const arguments = function.value("arguments", nlohmann::json {});
            response.toolCalls.push_back(ToolCallRequest {
                .id = json::getStringOr(call, "id", ""),
                .name = name,
                .arguments = arguments.is_string() ? parseArguments(name, arguments.get<std::string>())
                             : arguments.is_object() ? arguments
                                                     : nlohmann::json::object(),
            });
        }
    }

    if (auto const usage = body.find("usage"); usage != body.end() && usage->is_object())
    {
        response.usage = TokenUsage {
            .promptTokens = json::getIntOr(*usage, "prompt_tokens", 0),
            .completionTokens = json::getIntOr(*usage, "completion_tokens", 0),
            .totalTokens = json::getIntOr(*usage, "total_tokens", 0),
        };
    }

    return response;
}

} // namespace zesbe::wire
