// SPDX-License-Identifier: Apache-2.0
#include "HttpServer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <httplib.h>

#include <exception>
#include <format>

namespace mcpgate
{

namespace
{

    constexpr auto JsonContentType = "application/json";

    auto unauthorized(std::string_view message) -> ApiResponse
    {
        return ApiResponse {
            .status = 401,
            .body = { { "error", "Unauthorized" }, { "message", message } },
        };
    }

    auto failure(const nlohmann::json& id, const Error& error) -> ApiResponse
    {
        return ApiResponse { .status = httpStatusFor(error.code), .body = errorEnvelope(id, error) };
    }

    auto badBody(int rpcCode, std::string_view message) -> ApiResponse
    {
        return ApiResponse {
            .status = 400,
            .body = jsonrpc::makeErrorResponse(
                nullptr, rpcCode, message, { { "kind", errorCodeName(ErrorCode::InvalidArgument) } }),
        };
    }

    void writeResponse(httplib::Response& res, const ApiResponse& response)
    {
        res.status = response.status;
        res.set_content(response.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                        JsonContentType);
    }

} // namespace

auto httpStatusFor(ErrorCode code) -> int
{
    switch (code)
    {
        case ErrorCode::InvalidArgument:
        case ErrorCode::MalformedMessage: return 400;
        case ErrorCode::Unauthorized: return 401;
        case ErrorCode::UnknownServer: return 404;
        case ErrorCode::DuplicateIdentifier: return 409;
        case ErrorCode::SpawnError:
        case ErrorCode::ProcessFailure:
        case ErrorCode::TransportError: return 502;
        case ErrorCode::RestartLimitExceeded:
        case ErrorCode::ShutdownError: return 503;
        case ErrorCode::TimeoutError: return 504;
        default: return 500;
    }
}

auto errorEnvelope(const nlohmann::json& id, const Error& error) -> nlohmann::json
{
    return jsonrpc::makeErrorResponse(
        id, jsonrpc::errorCodeFor(error.code), error.message, { { "kind", errorCodeName(error.code) } });
}

ApiHandler::ApiHandler(Bridge& bridge,
                       AuthConfig auth,
                       std::string serverName,
                       std::chrono::milliseconds requestTimeout):
    _bridge(bridge), _auth(std::move(auth)), _serverName(std::move(serverName)), _requestTimeout(requestTimeout)
{
}

auto ApiHandler::handleCommand(std::optional<std::string_view> authorization, std::string_view body) -> ApiResponse
{
    if (auto allowed = authorize(_auth, authorization); !allowed)
        return unauthorized(allowed.error().message);

    auto envelope = json::parse(body);
    if (!envelope)
        return badBody(jsonrpc::codes::ParseError, envelope.error().message);

    auto command = json::getString(*envelope, "command");
    if (!command)
        return badBody(jsonrpc::codes::InvalidRequest, "Request body must be an object with a string \"command\"");

    auto request = jsonrpc::parseRequest(*command);
    if (!request)
        return failure(nullptr, request.error());

    if (request->isNotification())
    {
        if (auto sent = _bridge.notify(_serverName, *command); !sent)
            return failure(nullptr, sent.error());
        return ApiResponse { .status = 202, .body = { { "status", "accepted" } } };
    }

    auto response = _bridge.submit(_serverName, *command, _requestTimeout);
    if (!response)
    {
        log::warning("Request {} to '{}' failed: {}", request->id.dump(), _serverName, response.error());
        return failure(request->id, response.error());
    }

    return ApiResponse { .status = 200, .body = std::move(response->raw) };
}

auto ApiHandler::health() -> ApiResponse
{
    auto const now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return ApiResponse {
        .status = 200,
        .body = { { "status", "healthy" }, { "service", "mcpgate" }, { "timestamp", std::format("{:%FT%TZ}", now) } },
    };
}

HttpServer::HttpServer(ApiHandler& handler): _handler(handler), _server(std::make_unique<httplib::Server>())
{
    _server->Post("/api/v1", [this](const httplib::Request& req, httplib::Response& res) {
        auto const header = req.get_header_value("Authorization");
        auto authorization = std::optional<std::string_view> {};
        if (req.has_header("Authorization"))
            authorization = header;
        writeResponse(res, _handler.handleCommand(authorization, req.body));
    });

    _server->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        writeResponse(res, ApiHandler::health());
    });

    _server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        auto message = std::string("unknown exception");
        try
        {
            std::rethrow_exception(ep);
        }
        catch (const std::exception& e)
        {
            message = e.what();
        }
        log::error("Unhandled exception serving {} {}: {}", req.method, req.path, message);
        writeResponse(res, failure(nullptr, Error { ErrorCode::Unknown, message }));
    });

    _server->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty())
            return;
        res.set_content(nlohmann::json { { "error", res.status == 404 ? "Not Found" : "Bad Request" } }.dump(),
                        JsonContentType);
    });

    _server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        log::debug("{} {} -> {}", req.method, req.path, res.status);
    });
}

HttpServer::~HttpServer() = default;

auto HttpServer::listen(const std::string& host, std::uint16_t port) -> VoidResult
{
    log::info("HTTP server listening on http://{}:{}", host, port);
    if (!_server->listen(host, port))
        return makeError(ErrorCode::TransportError, std::format("Failed to listen on {}:{}", host, port));
    return {};
}

void HttpServer::stop()
{
    _server->stop();
}

} // namespace mcpgate
