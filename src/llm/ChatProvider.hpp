// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/EventStream.hpp>

#include <memory>
#include <string>

namespace zesbe
{

/// @brief Abstract chat completion backend.
class ChatProvider
{
  public:
    virtual ~ChatProvider() = default;

    /// @brief Sends a request and waits for the complete response.
    /// @return The response, or TransportError / EndpointError / ProtocolError.
    [[nodiscard]] virtual auto chat(const ChatRequest& request) -> Result<ChatResponse> = 0;

    /// @brief Starts a streaming request and returns immediately.
    ///
    /// Failures are delivered in-band as a StreamError event.
    [[nodiscard]] virtual auto chatStream(const ChatRequest& request) -> std::unique_ptr<EventStream> = 0;

    /// @brief Returns the model used when a request names none.
    [[nodiscard]] virtual auto defaultModel() const -> const std::string& = 0;
};

} // namespace zesbe
