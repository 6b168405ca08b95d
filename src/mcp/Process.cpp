// SPDX-License-Identifier: Apache-2.0
#include "Process.hpp"

#include <format>

#include <sys/wait.h>

extern char** environ;

namespace mcpgate
{

auto ExitStatus::describe() const -> std::string
{
    if (signal != 0)
        return std::format("signal {}", signal);
    return std::format("exit code {}", code);
}

auto ExitStatus::fromWaitStatus(int status) -> ExitStatus
{
    if (WIFEXITED(status))
        return ExitStatus { .code = WEXITSTATUS(status), .signal = 0 };
    if (WIFSIGNALED(status))
        return ExitStatus { .code = -1, .signal = WTERMSIG(status) };
    return ExitStatus {};
}

auto mergedEnvironment(const std::map<std::string, std::string>& overlay) -> std::vector<std::string>
{
    auto merged = std::map<std::string, std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const eq = entry.find('=');
            if (eq == std::string_view::npos)
                continue;
            merged.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
        }
    }

    for (const auto& [key, value]: overlay)
        merged[key] = value;

    auto result = std::vector<std::string> {};
    result.reserve(merged.size());
    for (const auto& [key, value]: merged)
        result.push_back(std::format("{}={}", key, value));
    return result;
}

} // namespace mcpgate
