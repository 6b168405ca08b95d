// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/Bridge.hpp>
#include <mcpgate/Auth.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace httplib
{
class Server;
}

namespace mcpgate
{

/// @brief An HTTP status with its JSON body.
struct ApiResponse
{
    int status = 200;
    nlohmann::json body;
};

/// @brief Returns the HTTP status reported for a failed request.
[[nodiscard]] auto httpStatusFor(ErrorCode code) -> int;

/// @brief Builds the JSON-RPC error envelope returned to HTTP clients for a gateway error.
/// @param id The id of the failed request, or null if it could not be determined.
/// @param error The failure.
[[nodiscard]] auto errorEnvelope(const nlohmann::json& id, const Error& error) -> nlohmann::json;

/// @brief Translates API requests into bridge calls, independent of the HTTP library.
class ApiHandler
{
  public:
    /// @param bridge Where commands are forwarded.
    /// @param auth Authentication applied to command requests.
    /// @param serverName The MCP server commands go to.
    /// @param requestTimeout How long a command may wait for its response.
    ApiHandler(Bridge& bridge, AuthConfig auth, std::string serverName, std::chrono::milliseconds requestTimeout);

    /// @brief Handles POST /api/v1.
    /// @param authorization The Authorization header, if present.
    /// @param body The request body, expected to be {"command": "<JSON-RPC text>"}.
    [[nodiscard]] auto handleCommand(std::optional<std::string_view> authorization, std::string_view body)
        -> ApiResponse;

    /// @brief Handles GET /health.
    [[nodiscard]] static auto health() -> ApiResponse;

  private:
    Bridge& _bridge;
    AuthConfig _auth;
    std::string _serverName;
    std::chrono::milliseconds _requestTimeout;
};

/// @brief Serves an ApiHandler over HTTP using a thread-pooled cpp-httplib server.
class HttpServer
{
  public:
    explicit HttpServer(ApiHandler& handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// @brief Binds and serves until stop() is called.
    /// @return Success after stop(), or a TransportError if the address could not be bound.
    [[nodiscard]] auto listen(const std::string& host, std::uint16_t port) -> VoidResult;

    /// @brief Stops a running listen() call. Safe to call from any thread.
    void stop();

  private:
    ApiHandler& _handler;
    std::unique_ptr<httplib::Server> _server;
};

} // namespace mcpgate
