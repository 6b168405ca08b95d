// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcpgate
{

/// @brief Bearer token authentication settings for the HTTP API.
struct AuthConfig
{
    std::optional<std::string> apiKey;

    /// Only true when an API key is configured and authentication is not disabled.
    bool enabled = false;
};

/// @brief Builds the auth settings from HTTP_API_KEY and DISABLE_AUTH.
[[nodiscard]] auto authConfigFromEnv() -> AuthConfig;

/// @brief Checks an Authorization header against the configured API key.
/// @param config The auth settings.
/// @param authorizationHeader The header value, or std::nullopt if the request had none.
/// @return Success, or an Unauthorized error whose message is safe to show to clients.
[[nodiscard]] auto authorize(const AuthConfig& config, std::optional<std::string_view> authorizationHeader)
    -> VoidResult;

} // namespace mcpgate
