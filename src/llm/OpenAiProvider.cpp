// SPDX-License-Identifier: Apache-2.0
#include "OpenAiProvider.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <llm/StreamParser.hpp>
#include <llm/WireFormat.hpp>

#include <httplib.h>

#include <format>
#include <stop_token>

namespace zesbe
{

namespace
{
    auto isSuccessStatus(int status) -> bool
    {
        return status >= 200 && status < 300;
    }

    auto makeHeaders(const OpenAiProviderConfig& config, bool stream) -> httplib::Headers
    {
        auto headers = httplib::Headers {};
        if (!config.apiKey.empty())
            headers.emplace("Authorization", "Bearer " + config.apiKey);
        if (stream)
            headers.emplace("Accept", "text/event-stream");
        return headers;
    }

    /// @brief Creates a client for @p endpoint with the configured timeouts.
    auto makeClient(const OpenAiProviderConfig& config, const BaseUrl& endpoint)
        -> Result<std::unique_ptr<httplib::Client>>
    {
        auto client = std::make_unique<httplib::Client>(endpoint.origin);
        if (!client->is_valid())
            return makeError(ErrorCode::TransportError,
                             std::format("Cannot connect to '{}' (HTTPS support missing?)", endpoint.origin));

        client->set_connection_timeout(config.connectTimeout);
        client->set_read_timeout(config.readTimeout);
        client->set_write_timeout(std::chrono::seconds(30));
        return client;
    }
} // namespace

auto splitBaseUrl(std::string_view url) -> Result<BaseUrl>
{
    auto const schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos)
        return makeError(ErrorCode::InvalidArgument, std::format("Base URL has no scheme: '{}'", url));

    auto const scheme = url.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https")
        return makeError(ErrorCode::InvalidArgument, std::format("Unsupported URL scheme '{}'", scheme));

    auto const authorityStart = schemeEnd + 3;
    auto const pathStart = url.find('/', authorityStart);
    auto const authority = url.substr(authorityStart, pathStart == std::string_view::npos ? url.npos
                                                                                           : pathStart - authorityStart);
    if (authority.empty())
        return makeError(ErrorCode::InvalidArgument, std::format("Base URL has no host: '{}'", url));

    auto path = pathStart == std::string_view::npos ? std::string_view {} : url.substr(pathStart);
    while (path.ends_with('/'))
        path.remove_suffix(1);

    return BaseUrl {
        .origin = std::string(url.substr(0, authorityStart + authority.size())),
        .pathPrefix = std::string(path),
    };
}

OpenAiProvider::OpenAiProvider(OpenAiProviderConfig config, BaseUrl endpoint):
    _config(std::move(config)), _endpoint(std::move(endpoint))
{
}

auto OpenAiProvider::create(OpenAiProviderConfig config) -> Result<std::unique_ptr<OpenAiProvider>>
{
    return splitBaseUrl(config.baseUrl).transform([&config](BaseUrl endpoint) {
        return std::unique_ptr<OpenAiProvider>(new OpenAiProvider(std::move(config), std::move(endpoint)));
    });
}

auto OpenAiProvider::chat(const ChatRequest& request) -> Result<ChatResponse>
{
    auto client = makeClient(_config, _endpoint);
    if (!client)
        return std::unexpected(client.error());

    auto const path = _endpoint.pathPrefix + "/chat/completions";
    auto const body = json::dump(wire::buildRequestBody(request, _config.defaultModel, false));
    log::debug("POST {}{} ({} messages)", _endpoint.origin, path, request.messages.size());

    auto response = (*client)->Post(path, makeHeaders(_config, false), body, "application/json");
    if (!response)
        return makeError(ErrorCode::TransportError,
                         std::format("Request to {} failed: {}", _endpoint.origin, httplib::to_string(response.error())));

    if (!isSuccessStatus(response->status))
        return makeEndpointError(response->status, response->body);

    return json::parse(response->body).and_then(
        [](const nlohmann::json& parsed) { return wire::parseChatResponse(parsed); });
}

auto OpenAiProvider::chatStream(const ChatRequest& request) -> std::unique_ptr<EventStream>
{
    auto body = json::dump(wire::buildRequestBody(request, _config.defaultModel, true));

    return std::make_unique<EventStream>(
        [config = _config, endpoint = _endpoint, body = std::move(body)](EventSink& sink,
                                                                        std::stop_token stopToken) {
            auto client = makeClient(config, endpoint);
            if (!client)
            {
                sink.push(StreamError { .error = client.error() });
                return;
            }

            // Unblocks a read that is waiting on the network.
            auto const onStop = std::stop_callback(stopToken, [&client] { (*client)->stop(); });

            auto parser = StreamParser {};
            auto status = 0;
            auto errorBody = std::string {};

            auto req = httplib::Request {};
            req.method = "POST";
            req.path = endpoint.pathPrefix + "/chat/completions";
            req.headers = makeHeaders(config, true);
            req.set_header("Content-Type", "application/json");
            req.body = body;
            req.response_handler = [&status](const httplib::Response& response) {
                status = response.status;
                return true;
            };
            req.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
                if (stopToken.stop_requested())
                    return false;
                if (!isSuccessStatus(status))
                {
                    errorBody.append(data, length);
                    return true;
                }
                for (auto& event: parser.feed(std::string_view(data, length)))
                {
                    if (!sink.push(std::move(event)))
                        return false;
                }
                return !parser.isDone();
            };

            log::debug("POST {}{} (streaming)", endpoint.origin, req.path);
            auto result = (*client)->send(req);

            if (stopToken.stop_requested() || sink.terminated())
                return;

            if (!result && status == 0)
            {
                sink.push(StreamError {
                    .error = Error { .code = ErrorCode::TransportError,
                                     .message = std::format("Request to {} failed: {}",
                                                            endpoint.origin,
                                                            httplib::to_string(result.error())),
                                     .httpStatus = 0 } });
                return;
            }

            if (!isSuccessStatus(status))
            {
                if (errorBody.empty() && result)
                    errorBody = result->body;
                sink.push(StreamError { .error = Error { .code = ErrorCode::EndpointError,
                                                         .message = std::format("HTTP {}: {}", status, errorBody),
                                                         .httpStatus = status } });
                return;
            }

            if (!result)
            {
                // The connection broke after the headers; keep what was decoded and report the failure.
                sink.push(StreamError {
                    .error = Error { .code = ErrorCode::TransportError,
                                     .message = std::format("Stream from {} interrupted: {}",
                                                            endpoint.origin,
                                                            httplib::to_string(result.error())),
                                     .httpStatus = 0 } });
                return;
            }

            for (auto& event: parser.finish())
            {
                if (!sink.push(std::move(event)))
                    return;
            }
        });
}

} // namespace zesbe
