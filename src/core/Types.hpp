// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace zesbe
{

/// @brief The role of a message participant in a chat conversation.
enum class Role
{
    System,
    User,
    Assistant,
    Tool,
};

/// @brief Converts a Role enum to its string representation.
/// @param role The role to convert.
/// @return The string representation.
[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

/// @brief Parses a string to a Role enum value.
/// @param str The string to parse.
/// @return The corresponding Role, or Role::User if unknown.
[[nodiscard]] constexpr auto roleFromString(std::string_view str) -> Role
{
    if (str == "system")
        return Role::System;
    if (str == "assistant")
        return Role::Assistant;
    if (str == "tool")
        return Role::Tool;
    return Role::User;
}

/// @brief A tool invocation requested by the model.
///
/// The id is opaque and unique within one turn; arguments is always a JSON object.
struct ToolCallRequest
{
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

/// @brief Represents the textual result of executing a tool call.
struct ToolResult
{
    std::string callId;
    std::string content;
    bool isError = false;
};

/// @brief Defines a tool that the LLM can invoke.
struct ToolDefinition
{
    std::string name;
    std::string description;

    /// JSON-Schema shaped descriptor: type, properties, required.
    nlohmann::json parameters = nlohmann::json::object();
};

/// @brief A single message in a chat conversation.
struct Message
{
    Role role = Role::User;
    std::string content;
    std::vector<ToolCallRequest> toolCalls; // Role::Assistant only
    std::string toolCallId;                 // Role::Tool only
};

/// @brief A fragment of assistant text, delivered as soon as it arrives.
struct TextFragment
{
    std::string text;
};

/// @brief A completely assembled tool call.
struct ToolCallEvent
{
    ToolCallRequest call;
};

/// @brief The stream ended normally.
struct StreamDone
{
};

/// @brief The stream ended with a failure.
struct StreamError
{
    Error error;
};

/// @brief One decoded event of a streaming chat response.
using StreamEvent = std::variant<TextFragment, ToolCallEvent, StreamDone, StreamError>;

/// @brief Returns true if the event terminates a stream.
[[nodiscard]] inline auto isTerminal(const StreamEvent& event) -> bool
{
    return std::holds_alternative<StreamDone>(event) || std::holds_alternative<StreamError>(event);
}

/// @brief A provider-agnostic chat completion request.
struct ChatRequest
{
    std::vector<Message> messages;
    std::vector<ToolDefinition> tools;
    std::string model; // empty means the provider's default model
    int maxTokens = 4096;
    float temperature = 0.7f;
};

/// @brief Why the model stopped generating.
enum class FinishReason
{
    Stop,
    ToolCalls,
    Length,
    Error,
};

/// @brief Token accounting reported by the endpoint.
struct TokenUsage
{
    int promptTokens = 0;
    int completionTokens = 0;
    int totalTokens = 0;
};

/// @brief A complete, non-streamed chat response.
struct ChatResponse
{
    std::string id;
    std::string model;
    std::string content;
    std::vector<ToolCallRequest> toolCalls;
    std::optional<TokenUsage> usage;
    FinishReason finishReason = FinishReason::Stop;

    /// @brief Returns true if this response contains tool calls.
    [[nodiscard]] auto hasToolCalls() const -> bool { return !toolCalls.empty(); }
};

} // namespace zesbe
