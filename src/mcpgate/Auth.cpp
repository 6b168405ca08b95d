// SPDX-License-Identifier: Apache-2.0
#include "Auth.hpp"

#include <core/Log.hpp>

#include <cstdlib>

namespace mcpgate
{

namespace
{

    constexpr auto BearerPrefix = std::string_view { "Bearer " };

    /// Compares without returning early on the first mismatching byte.
    auto constantTimeEquals(std::string_view a, std::string_view b) -> bool
    {
        if (a.size() != b.size())
            return false;

        auto diff = 0u;
        for (auto i = std::size_t { 0 }; i < a.size(); ++i)
            diff |= static_cast<unsigned char>(a[i]) ^ static_cast<unsigned char>(b[i]);
        return diff == 0;
    }

} // namespace

auto authConfigFromEnv() -> AuthConfig
{
    auto config = AuthConfig {};

    if (auto const* const apiKey = std::getenv("HTTP_API_KEY"); apiKey && *apiKey)
        config.apiKey = std::string(apiKey);

    auto const* const disableAuth = std::getenv("DISABLE_AUTH");
    auto const disabled = disableAuth && std::string_view(disableAuth) == "true";

    config.enabled = !disabled && config.apiKey.has_value();

    if (config.enabled)
        log::info("HTTP API authentication enabled");
    else
        log::warning("HTTP API authentication disabled");
    return config;
}

auto authorize(const AuthConfig& config, std::optional<std::string_view> authorizationHeader) -> VoidResult
{
    if (!config.enabled || !config.apiKey)
        return {};

    if (!authorizationHeader)
        return makeError(ErrorCode::Unauthorized, "Missing Authorization header");

    if (!authorizationHeader->starts_with(BearerPrefix))
        return makeError(ErrorCode::Unauthorized, "Authorization header must use Bearer token");

    auto const token = authorizationHeader->substr(BearerPrefix.size());
    if (!constantTimeEquals(token, *config.apiKey))
    {
        log::debug("Invalid API key provided (length: {})", token.size());
        return makeError(ErrorCode::Unauthorized, "Invalid API key");
    }

    return {};
}

} // namespace mcpgate
