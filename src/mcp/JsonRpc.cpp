// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcpgate::jsonrpc
{

auto idKey(const nlohmann::json& id) -> Result<std::string>
{
    if (id.is_string() || id.is_number_integer() || id.is_number_unsigned())
        return id.dump();

    if (id.is_number_float())
        return makeError(ErrorCode::InvalidArgument, "JSON-RPC id must not be fractional");

    return makeError(ErrorCode::InvalidArgument,
                     std::format("JSON-RPC id must be a number or a string, got {}", id.type_name()));
}

auto makeRequest(nlohmann::json id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", std::move(id) },
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

auto makeErrorResponse(nlohmann::json id, int code, std::string_view message, nlohmann::json data)
    -> nlohmann::json
{
    auto error = nlohmann::json {
        { "code", code },
        { "message", message },
    };

    if (!data.is_null())
        error["data"] = std::move(data);

    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", std::move(id) },
        { "error", std::move(error) },
    };
}

auto errorCodeFor(ErrorCode code) -> int
{
    switch (code)
    {
        case ErrorCode::InvalidArgument: return codes::InvalidRequest;
        case ErrorCode::TimeoutError: return codes::Timeout;
        case ErrorCode::ProcessFailure:
        case ErrorCode::TransportError: return codes::ProcessFailure;
        case ErrorCode::RestartLimitExceeded: return codes::RestartLimitExceeded;
        case ErrorCode::DuplicateIdentifier: return codes::DuplicateIdentifier;
        case ErrorCode::SpawnError: return codes::SpawnFailure;
        case ErrorCode::ShutdownError: return codes::Shutdown;
        case ErrorCode::UnknownServer: return codes::UnknownServer;
        default: return codes::InternalError;
    }
}

auto parseRequest(std::string_view payload) -> Result<Request>
{
    auto parsed = json::parse(payload, ErrorCode::InvalidArgument);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto& message = *parsed;
    if (!message.is_object())
        return makeError(ErrorCode::InvalidArgument, "JSON-RPC payload must be a JSON object");

    if (message.contains("jsonrpc") && message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::InvalidArgument, "Unsupported JSON-RPC version");

    auto method = json::getString(message, "method");
    if (!method)
        return makeError(ErrorCode::InvalidArgument, "JSON-RPC request is missing a method");

    auto request = Request {
        .message = {},
        .id = nullptr,
        .method = std::move(*method),
    };

    if (message.contains("id") && !message["id"].is_null())
    {
        auto key = idKey(message["id"]);
        if (!key)
            return std::unexpected(key.error());
        request.id = message["id"];
    }
    else
    {
        // An explicit null id is forwarded as a notification.
        message.erase("id");
    }

    request.message = std::move(message);
    return request;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object())
        return makeError(ErrorCode::MalformedMessage, "JSON-RPC message is not an object");

    if (message.contains("jsonrpc") && message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::MalformedMessage, "Not a valid JSON-RPC 2.0 message");

    if (!message.contains("id") || message["id"].is_null())
        return makeError(ErrorCode::MalformedMessage, "JSON-RPC response has no id");

    if (auto key = idKey(message["id"]); !key)
        return makeError(ErrorCode::MalformedMessage, key.error().message);

    auto response = Response {};
    response.id = message["id"];
    response.raw = message;

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = static_cast<int>(json::getIntOr(err, "code", 0)),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.contains("data") ? err["data"] : nlohmann::json {},
        };
    }
    else
    {
        return makeError(ErrorCode::MalformedMessage, "JSON-RPC response has neither result nor error");
    }

    return response;
}

} // namespace mcpgate::jsonrpc
