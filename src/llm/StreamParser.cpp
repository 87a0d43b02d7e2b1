// SPDX-License-Identifier: Apache-2.0
#include "StreamParser.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <llm/WireFormat.hpp>

namespace zesbe
{

namespace
{
    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r");
        return text.substr(first, last - first + 1);
    }

    /// Arguments usually arrive as JSON text; a few endpoints send an object instead.
    auto argumentsTextOf(const nlohmann::json& function) -> std::string
    {
        auto const it = function.find("arguments");
        if (it == function.end() || it->is_null())
            return {};
        if (it->is_string())
            return it->get<std::string>();
        return it->dump();
    }
} // namespace

auto StreamParser::feed(std::string_view bytes) -> std::vector<StreamEvent>
{
    auto events = std::vector<StreamEvent> {};
    if (_done)
        return events;

    _buffer.append(bytes);

    auto start = size_t { 0 };
    while (!_done)
    {
        auto const newline = _buffer.find('\n', start);
        if (newline == std::string::npos)
            break;
        processLine(std::string_view(_buffer).substr(start, newline - start), events);
        start = newline + 1;
    }

    if (_done)
        _buffer.clear();
    else
        _buffer.erase(0, start);

    return events;
}

auto StreamParser::finish() -> std::vector<StreamEvent>
{
    auto events = std::vector<StreamEvent> {};
    if (_done)
        return events;

    if (!_buffer.empty())
    {
        auto const line = std::move(_buffer);
        _buffer.clear();
        processLine(line, events);
    }

    if (!_done)
        emitDone(events);
    return events;
}

void StreamParser::processLine(std::string_view line, std::vector<StreamEvent>& out)
{
    line = trim(line);
    if (!line.starts_with("data:"))
        return; // event:, id:, retry:, comments and blank separators

    auto payload = line.substr(5);
    if (payload.starts_with(' '))
        payload.remove_prefix(1);

    if (payload == "[DONE]")
    {
        emitDone(out);
        return;
    }

    auto frame = json::parse(payload);
    if (!frame)
    {
        log::trace("Skipping malformed stream frame: {}", payload.substr(0, 200));
        return;
    }

    processFrame(*frame, out);
}

void StreamParser::processFrame(const nlohmann::json& frame, std::vector<StreamEvent>& out)
{
    if (!frame.is_object())
        return;

    if (auto const error = frame.find("error"); error != frame.end() && !error->is_null())
    {
        auto const message = error->is_object() ? json::getStringOr(*error, "message", error->dump())
                                                : error->dump();
        out.emplace_back(StreamError { .error = Error { .code = ErrorCode::EndpointError,
                                                        .message = message,
                                                        .httpStatus = 0 } });
        _slots.clear();
        _done = true;
        return;
    }

    auto const choices = frame.find("choices");
    if (choices == frame.end() || !choices->is_array() || choices->empty())
        return;

    auto const& choice = (*choices)[0];
    if (!choice.is_object())
        return;

    if (auto const delta = choice.find("delta"); delta != choice.end() && delta->is_object())
    {
        if (auto const content = delta->find("content"); content != delta->end() && content->is_string())
        {
            auto text = content->get<std::string>();
            if (!text.empty())
                out.emplace_back(TextFragment { .text = std::move(text) });
        }

        if (auto const calls = delta->find("tool_calls"); calls != delta->end() && calls->is_array())
        {
            auto position = 0;
            for (const auto& fragment: *calls)
                mergeToolCallFragment(fragment, position++);
        }
    }

    if (json::getStringOr(choice, "finish_reason", "") == "tool_calls")
        flushSlots(out);
}

void StreamParser::mergeToolCallFragment(const nlohmann::json& fragment, int position)
{
    if (!fragment.is_object())
        return;

    auto const index = json::getIntOr(fragment, "index", position);
    auto const id = json::getStringOr(fragment, "id", "");
    auto const function = fragment.value("function", nlohmann::json::object());
    auto const name = function.is_object() ? json::getStringOr(function, "name", "") : std::string {};
    auto const arguments = function.is_object() ? argumentsTextOf(function) : std::string {};

    auto const it = _slots.find(index);
    if (!id.empty() && (it == _slots.end() || it->second.id != id))
    {
        _slots[index] = Slot { .id = id, .name = name, .argumentsText = arguments };
        return;
    }

    if (it == _slots.end())
        return; // continuation of a call we never saw start

    auto& slot = it->second;
    slot.argumentsText += arguments;
    if (slot.name.empty())
        slot.name = name;
}

void StreamParser::flushSlots(std::vector<StreamEvent>& out)
{
    for (auto& [index, slot]: _slots)
    {
        out.emplace_back(ToolCallEvent { .call = ToolCallRequest {
                                             .id = std::move(slot.id),
                                             .name = slot.name,
                                             .arguments = wire::parseArguments(slot.name, slot.argumentsText),
                                         } });
    }
    _slots.clear();
}

void StreamParser::emitDone(std::vector<StreamEvent>& out)
{
    flushSlots(out);
    out.emplace_back(StreamDone {});
    _done = true;
}

} // namespace zesbe
