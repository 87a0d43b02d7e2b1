// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace zesbe
{

/// @brief Incremental decoder for an OpenAI-compatible server-sent event stream.
///
/// Bytes may be fed in arbitrarily sized pieces; the resulting event sequence
/// does not depend on where the input was split. Text is emitted as soon as a
/// frame carrying it is complete. Tool calls arrive as fragments keyed by
/// slot index and are emitted only once fully assembled, in ascending slot
/// order. The stream ends with exactly one StreamDone (or StreamError for an
/// in-band error object), after which all input is ignored.
///
/// One instance decodes one response.
class StreamParser
{
  public:
    /// @brief Consumes a piece of the response body.
    /// @return The events completed by this piece, in arrival order.
    [[nodiscard]] auto feed(std::string_view bytes) -> std::vector<StreamEvent>;

    /// @brief Signals the end of input. Any buffered partial line is processed as the last line.
    /// @return The remaining events, ending with the terminal event unless one was already emitted.
    [[nodiscard]] auto finish() -> std::vector<StreamEvent>;

    /// @brief Returns true once the terminal event has been emitted.
    [[nodiscard]] auto isDone() const noexcept -> bool { return _done; }

  private:
    struct Slot
    {
        std::string id;
        std::string name;
        std::string argumentsText;
    };

    void processLine(std::string_view line, std::vector<StreamEvent>& out);
    void processFrame(const nlohmann::json& frame, std::vector<StreamEvent>& out);
    void mergeToolCallFragment(const nlohmann::json& fragment, int position);
    void flushSlots(std::vector<StreamEvent>& out);
    void emitDone(std::vector<StreamEvent>& out);

    std::string _buffer;
    std::map<int, Slot> _slots;
    bool _done = false;
};

} // namespace zesbe
