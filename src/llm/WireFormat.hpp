// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

/// Translation between the provider-agnostic data model and the
/// OpenAI-compatible chat completions wire format.
namespace zesbe::wire
{

/// Longest tool description sent to the endpoint, in bytes.
constexpr auto MaxToolDescriptionBytes = size_t { 1000 };

/// @brief Converts one message to its wire object.
///
/// Assistant messages that carry tool calls get `content: null` when they have
/// no text, and tool messages carry `tool_call_id`.
[[nodiscard]] auto toWireMessage(const Message& message) -> nlohmann::json;

/// @brief Converts a conversation to the wire `messages` array.
[[nodiscard]] auto toWireMessages(const std::vector<Message>& messages) -> nlohmann::json;

/// @brief Replaces every character outside [A-Za-z0-9_-] with '_'.
[[nodiscard]] auto sanitizeToolName(std::string_view name) -> std::string;

/// @brief Cuts @p text to at most @p maxBytes without splitting a UTF-8 sequence.
[[nodiscard]] auto truncateUtf8(std::string_view text, size_t maxBytes) -> std::string;

/// @brief Reduces a tool's parameter schema to type, properties, required and additionalProperties.
[[nodiscard]] auto sanitizeParameters(const nlohmann::json& parameters) -> nlohmann::json;

/// @brief Converts tool definitions to the wire `tools` array, dropping unnamed ones.
[[nodiscard]] auto toWireTools(const std::vector<ToolDefinition>& tools) -> nlohmann::json;

/// @brief Builds the complete request body.
/// @param request The chat request.
/// @param defaultModel Used when the request names no model.
/// @param stream Whether to ask for a server-sent event stream.
[[nodiscard]] auto buildRequestBody(const ChatRequest& request, std::string_view defaultModel, bool stream)
    -> nlohmann::json;

/// @brief Maps a wire `finish_reason` to FinishReason. Unknown values map to Stop.
[[nodiscard]] auto parseFinishReason(std::string_view reason) -> FinishReason;

/// @brief Parses tool call arguments text into a JSON object.
///
/// Empty text yields an empty object. Malformed or non-object text also
/// yields an empty object and is logged.
[[nodiscard]] auto parseArguments(std::string_view toolName, std::string_view argumentsText) -> nlohmann::json;

/// @brief Parses a non-streamed chat completion response.
/// @return The response, or ErrorCode::ProtocolError if it has no usable choice.
[[nodiscard]] auto parseChatResponse(const nlohmann::json& body) -> Result<ChatResponse>;

} // namespace zesbe::wire
