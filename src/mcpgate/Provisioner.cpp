// SPDX-License-Identifier: Apache-2.0
#include "Provisioner.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>

#include <sys/wait.h>

#include <fcntl.h>
#include <spawn.h>
#include <unistd.h>

namespace mcpgate
{

namespace
{

    constexpr auto MaxCapturedOutput = std::size_t { 64 * 1024 };

    auto trimmed(std::string_view text) -> std::string_view
    {
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
            text.remove_suffix(1);
        return text;
    }

    auto joinCommand(const std::vector<std::string>& argv) -> std::string
    {
        auto text = std::string {};
        for (const auto& arg: argv)
        {
            if (!text.empty())
                text += ' ';
            text += arg;
        }
        return text;
    }

} // namespace

auto runCommand(const std::vector<std::string>& argv,
                const std::map<std::string, std::string>& env,
                const std::string& workingDirectory) -> Result<CommandOutput>
{
    if (argv.empty())
        return makeError(ErrorCode::InvalidArgument, "Empty command");

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0)
        return makeError(ErrorCode::IoError, std::format("Failed to create pipe: {}", strerror(errno)));
    auto outputRead = fds[0];
    auto outputWrite = fds[1];

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, outputWrite, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, outputWrite, STDERR_FILENO);
    if (!workingDirectory.empty())
        posix_spawn_file_actions_addchdir_np(&actions, workingDirectory.c_str());

    auto argStrings = argv;
    auto args = std::vector<char*> {};
    for (auto& arg: argStrings)
        args.push_back(arg.data());
    args.push_back(nullptr);

    auto envStrings = mergedEnvironment(env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const spawnStatus = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    ::close(outputWrite);

    if (spawnStatus != 0)
    {
        ::close(outputRead);
        return makeError(ErrorCode::IoError,
                         std::format("Failed to run '{}': {}", joinCommand(argv), strerror(spawnStatus)));
    }

    auto result = CommandOutput {};
    auto buf = std::array<char, 4096> {};
    while (true)
    {
        auto const bytesRead = ::read(outputRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
            break;

        result.output.append(buf.data(), static_cast<size_t>(bytesRead));
        if (result.output.size() > MaxCapturedOutput)
            result.output.erase(0, result.output.size() - MaxCapturedOutput);
    }
    ::close(outputRead);

    int rawStatus = 0;
    while (::waitpid(pid, &rawStatus, 0) < 0)
    {
        if (errno != EINTR)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to wait for '{}': {}", joinCommand(argv), strerror(errno)));
    }
    result.status = ExitStatus::fromWaitStatus(rawStatus);
    return result;
}

auto repositoryName(std::string_view url) -> Result<std::string>
{
    while (url.ends_with('/'))
        url.remove_suffix(1);

    auto const slash = url.find_last_of("/:");
    auto name = slash == std::string_view::npos ? url : url.substr(slash + 1);
    if (name.ends_with(".git"))
        name.remove_suffix(4);

    if (name.empty() || name == "." || name == "..")
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid repository URL: {}", url));
    return std::string(name);
}

auto runtimeVersionCommand(Runtime runtime) -> std::vector<std::string>
{
    switch (runtime)
    {
        case Runtime::Node: return { "node", "--version" };
        case Runtime::Python: return { "python3", "--version" };
        case Runtime::Go: return { "go", "version" };
    }
    return {};
}

auto checkRuntime(Runtime runtime) -> Result<std::string>
{
    auto const notAvailable = std::format("{} is not available", runtimeName(runtime));

    auto result = runCommand(runtimeVersionCommand(runtime));
    if (!result)
        return makeError(ErrorCode::ProvisionError, std::format("{}: {}", notAvailable, result.error().message));
    if (!result->status.success())
        return makeError(ErrorCode::ProvisionError, std::format("{} ({})", notAvailable, result->status.describe()));

    return std::string(trimmed(result->output));
}

auto provisionServer(const ServerConfig& server, std::string_view workDir) -> Result<ServerDefinition>
{
    auto definition = server.definition;

    if (server.runtime)
    {
        auto version = checkRuntime(*server.runtime);
        if (!version)
            return std::unexpected(version.error());
        log::info("[{}] using {} {}", definition.name, runtimeName(*server.runtime), *version);
    }

    auto ec = std::error_code {};
    std::filesystem::create_directories(workDir, ec);
    if (ec)
        return makeError(ErrorCode::ProvisionError,
                         std::format("Failed to create work directory '{}': {}", workDir, ec.message()));

    if (!server.repository)
    {
        if (definition.workingDirectory.empty())
            definition.workingDirectory = std::string(workDir);
        return definition;
    }

    auto name = repositoryName(*server.repository);
    if (!name)
        return makeError(ErrorCode::ProvisionError, name.error().message);

    auto const clonePath = (std::filesystem::path(workDir) / *name).string();
    if (std::filesystem::exists(clonePath, ec))
    {
        log::debug("Removing existing checkout: {}", clonePath);
        std::filesystem::remove_all(clonePath, ec);
        if (ec)
            return makeError(ErrorCode::ProvisionError,
                             std::format("Failed to remove existing directory '{}': {}", clonePath, ec.message()));
    }

    log::info("[{}] cloning {} into {}", definition.name, *server.repository, clonePath);
    auto clone = runCommand({ "git", "clone", *server.repository, clonePath });
    if (!clone)
        return makeError(ErrorCode::ProvisionError, clone.error().message);
    if (!clone->status.success())
        return makeError(ErrorCode::ProvisionError,
                         std::format("Git clone failed ({}): {}", clone->status.describe(), trimmed(clone->output)));

    if (server.buildCommand && !server.buildCommand->empty())
    {
        log::info("[{}] building: {}", definition.name, *server.buildCommand);
        auto build = runCommand({ "sh", "-c", *server.buildCommand }, definition.env, clonePath);
        if (!build)
            return makeError(ErrorCode::ProvisionError, build.error().message);
        if (!build->status.success())
            return makeError(ErrorCode::ProvisionError,
                             std::format("Build failed ({}): {}", build->status.describe(), trimmed(build->output)));
        log::info("[{}] build completed", definition.name);
    }

    // A configured working directory is taken relative to the checkout.
    definition.workingDirectory = definition.workingDirectory.empty()
                                      ? clonePath
                                      : (std::filesystem::path(clonePath) / definition.workingDirectory).string();
    return definition;
}

} // namespace mcpgate
