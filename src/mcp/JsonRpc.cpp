// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace zesbe::jsonrpc
{

namespace
{
    auto isVersion2(const nlohmann::json& message) -> bool
    {
        auto const it = message.find("jsonrpc");
        return it != message.end() && it->is_string() && *it == "2.0";
    }
} // namespace

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorReply(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto classify(const nlohmann::json& message) -> MessageKind
{
    if (!message.is_object() || !isVersion2(message))
        return MessageKind::Invalid;

    auto const hasId = message.contains("id") && !message["id"].is_null();
    auto const hasMethod = message.contains("method") && message["method"].is_string();

    if (hasMethod)
        return hasId ? MessageKind::Request : MessageKind::Notification;
    if (hasId && (message.contains("result") || message.contains("error")))
        return MessageKind::Response;
    return MessageKind::Invalid;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !isVersion2(message))
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result nor error");
    }

    return response;
}

} // namespace zesbe::jsonrpc
