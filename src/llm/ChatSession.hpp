// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <string>
#include <vector>

namespace zesbe
{

/// @brief Manages conversation history for a chat session.
///
/// The system prompt, if any, is always the first message. The session
/// layer owns the session; the agent loop appends to it during a turn and
/// truncates it back to a checkpoint when a turn is aborted.
class ChatSession
{
  public:
    /// @brief Constructs a ChatSession with an optional system prompt.
    /// @param systemPrompt The system prompt to prepend to conversations.
    explicit ChatSession(std::string systemPrompt = "");

    /// @brief Adds a user message to the conversation.
    /// @param content The user's message text.
    void addUserMessage(std::string content);

    /// @brief Adds an assistant message to the conversation.
    /// @param content The assistant's response text, may be empty if tool calls are present.
    /// @param toolCalls Any tool calls made by the assistant.
    void addAssistantMessage(std::string content, std::vector<ToolCallRequest> toolCalls = {});

    /// @brief Adds a tool result message to the conversation.
    /// @param callId The ID of the tool call this result corresponds to.
    /// @param content The tool's output.
    void addToolResult(std::string callId, std::string content);

    /// @brief Returns all messages in the conversation, including the system prompt.
    [[nodiscard]] auto messages() const -> const std::vector<Message>&;

    /// @brief Returns a position that truncate() can roll back to.
    [[nodiscard]] auto checkpoint() const -> size_t { return _messages.size(); }

    /// @brief Drops every message added after @p checkpoint.
    void truncate(size_t checkpoint);

    /// @brief Clears all messages except the system prompt.
    void clear();

    /// @brief Returns the number of messages (excluding system prompt).
    [[nodiscard]] auto messageCount() const -> size_t;

    /// @brief Returns the system prompt.
    [[nodiscard]] auto systemPrompt() const -> const std::string&;

    /// @brief Sets a new system prompt, replacing the existing one and keeping the history.
    /// @param prompt The new system prompt.
    void setSystemPrompt(std::string prompt);

  private:
    std::string _systemPrompt;
    std::vector<Message> _messages;

    void ensureSystemPrompt();
};

} // namespace zesbe
