// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/ChatProvider.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace zesbe
{

/// @brief Connection settings for an OpenAI-compatible endpoint.
struct OpenAiProviderConfig
{
    std::string baseUrl; // e.g. "https://api.openai.com/v1"
    std::string apiKey;  // omitted from requests when empty
    std::string defaultModel;
    std::chrono::seconds connectTimeout { 10 };
    std::chrono::seconds readTimeout { 300 };
};

/// @brief A base URL split into what the HTTP client connects to and the path below it.
struct BaseUrl
{
    std::string origin;     // "scheme://host[:port]"
    std::string pathPrefix; // "" or "/v1", never with a trailing slash

    auto operator==(const BaseUrl&) const -> bool = default;
};

/// @brief Splits "scheme://host[:port]/prefix" into origin and path prefix.
/// @return The parts, or ErrorCode::InvalidArgument if the URL has no http(s) scheme or host.
[[nodiscard]] auto splitBaseUrl(std::string_view url) -> Result<BaseUrl>;

/// @brief ChatProvider speaking the OpenAI chat completions protocol over HTTP(S).
class OpenAiProvider final: public ChatProvider
{
  public:
    /// @brief Validates the configuration and creates the provider.
    /// @return The provider, or ErrorCode::InvalidArgument for an unusable base URL.
    [[nodiscard]] static auto create(OpenAiProviderConfig config) -> Result<std::unique_ptr<OpenAiProvider>>;

    [[nodiscard]] auto chat(const ChatRequest& request) -> Result<ChatResponse> override;
    [[nodiscard]] auto chatStream(const ChatRequest& request) -> std::unique_ptr<EventStream> override;
    [[nodiscard]] auto defaultModel() const -> const std::string& override { return _config.defaultModel; }

    [[nodiscard]] auto endpoint() const -> const BaseUrl& { return _endpoint; }

  private:
    OpenAiProvider(OpenAiProviderConfig config, BaseUrl endpoint);

    OpenAiProviderConfig _config;
    BaseUrl _endpoint;
};

} // namespace zesbe
