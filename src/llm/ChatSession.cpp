// SPDX-License-Identifier: Apache-2.0
#include "ChatSession.hpp"

#include <utility>

namespace zesbe
{

ChatSession::ChatSession(std::string systemPrompt): _systemPrompt(std::move(systemPrompt))
{
    ensureSystemPrompt();
}

void ChatSession::addUserMessage(std::string content)
{
    _messages.push_back(Message {
        .role = Role::User,
        .content = std::move(content),
        .toolCalls = {},
        .toolCallId = {},
    });
}

void ChatSession::addAssistantMessage(std::string content, std::vector<ToolCallRequest> toolCalls)
{
    _messages.push_back(Message {
        .role = Role::Assistant,
        .content = std::move(content),
        .toolCalls = std::move(toolCalls),
        .toolCallId = {},
    });
}

void ChatSession::addToolResult(std::string callId, std::string content)
{
    _messages.push_back(Message {
        .role = Role::Tool,
        .content = std::move(content),
        .toolCalls = {},
        .toolCallId = std::move(callId),
    });
}

auto ChatSession::messages() const -> const std::vector<Message>&
{
    return _messages;
}

void ChatSession::truncate(size_t checkpoint)
{
    if (checkpoint < _messages.size())
        _messages.resize(checkpoint);
}

void ChatSession::clear()
{
    _messages.clear();
    ensureSystemPrompt();
}

auto ChatSession::messageCount() const -> size_t
{
    if (_systemPrompt.empty())
        return _messages.size();
    return _messages.empty() ? 0 : _messages.size() - 1;
}

auto ChatSession::systemPrompt() const -> const std::string&
{
    return _systemPrompt;
}

void ChatSession::setSystemPrompt(std::string prompt)
{
    if (!_systemPrompt.empty() && !_messages.empty() && _messages.front().role == Role::System)
        _messages.erase(_messages.begin());
    _systemPrompt = std::move(prompt);
    ensureSystemPrompt();
}

void ChatSession::ensureSystemPrompt()
{
    if (!_systemPrompt.empty())
    {
        _messages.insert(_messages.begin(),
                         Message {
                             .role = Role::System,
                             .content = _systemPrompt,
                             .toolCalls = {},
                             .toolCallId = {},
                         });
    }
}

} // namespace zesbe
