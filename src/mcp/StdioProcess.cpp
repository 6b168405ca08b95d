// SPDX-License-Identifier: Apache-2.0
#include "StdioProcess.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>

namespace mcpgate
{

namespace
{

    constexpr auto DefaultTerminateGrace = std::chrono::milliseconds(2000);
    constexpr auto ReapPollInterval = std::chrono::milliseconds(10);

    /// @brief Both ends of a pipe, closed on destruction unless released.
    struct Pipe
    {
        int readEnd = -1;
        int writeEnd = -1;

        Pipe() = default;
        Pipe(const Pipe&) = delete;
        Pipe& operator=(const Pipe&) = delete;

        ~Pipe()
        {
            if (readEnd >= 0)
                ::close(readEnd);
            if (writeEnd >= 0)
                ::close(writeEnd);
        }

        [[nodiscard]] auto open(int flags) -> bool
        {
            int fds[2];
            if (::pipe2(fds, flags) != 0)
                return false;
            readEnd = fds[0];
            writeEnd = fds[1];
            return true;
        }

        [[nodiscard]] auto releaseRead() -> int { return std::exchange(readEnd, -1); }
        [[nodiscard]] auto releaseWrite() -> int { return std::exchange(writeEnd, -1); }
    };

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto describeCommand(const ServerDefinition& definition) -> std::string
    {
        auto text = definition.command;
        for (const auto& arg: definition.args)
            text += " " + arg;
        return text;
    }

    std::once_flag ignoreSigpipeOnce;

} // namespace

struct StdioProcess::Impl
{
    std::string name;
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    int wakeRead = -1;
    int wakeWrite = -1;

    std::timed_mutex writeMutex;
    std::mutex lifecycleMutex;
    std::optional<ExitStatus> status;
    std::jthread stderrDrain;

    /// @brief Waits until fd is readable or terminate() was called.
    /// @return true if fd is readable (or hung up), false if woken for termination or on error.
    auto waitReadable(int fd) const -> bool
    {
        auto fds = std::array<pollfd, 2> { {
            { .fd = fd, .events = POLLIN, .revents = 0 },
            { .fd = wakeRead, .events = POLLIN, .revents = 0 },
        } };

        while (true)
        {
            auto const rc = ::poll(fds.data(), fds.size(), -1);
            if (rc < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            if (fds[1].revents != 0)
                return false;
            if (fds[0].revents != 0)
                return true;
        }
    }

    void drainStderr()
    {
        auto pending = std::string {};
        auto buf = std::array<char, 4096> {};

        auto const logLines = [&] {
            for (auto pos = pending.find('\n'); pos != std::string::npos; pos = pending.find('\n'))
            {
                auto line = std::string_view(pending).substr(0, pos);
                if (!line.empty() && line.back() == '\r')
                    line.remove_suffix(1);
                if (!line.empty())
                    log::debug("[{}] stderr: {}", name, line);
                pending.erase(0, pos + 1);
            }
        };

        auto closed = false;
        while (!closed && waitReadable(stderrRead))
        {
            auto const bytesRead = ::read(stderrRead, buf.data(), buf.size());
            if (bytesRead < 0 && (errno == EINTR || errno == EAGAIN))
                continue;
            if (bytesRead <= 0)
            {
                closed = true;
                break;
            }
            pending.append(buf.data(), static_cast<size_t>(bytesRead));
            logLines();
        }

        // Woken by terminate(): a crashing child's last words are usually still in the pipe.
        while (!closed)
        {
            auto const bytesRead = ::read(stderrRead, buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                break;
            pending.append(buf.data(), static_cast<size_t>(bytesRead));
            logLines();
        }

        if (!pending.empty())
            log::debug("[{}] stderr: {}", name, pending);
        log::trace("[{}] stderr closed", name);
    }

    /// @brief Sends a signal to every process in the child's process group.
    void signalGroup(int signal) const
    {
        if (::kill(-childPid, signal) != 0 && errno != ESRCH)
            log::debug("[{}] cannot signal process group {}: {}", name, childPid, strerror(errno));
    }

    /// @brief Reaps the child if it has exited. Caller holds lifecycleMutex.
    auto tryReap() -> bool
    {
        if (status)
            return true;

        int rawStatus = 0;
        auto const result = ::waitpid(childPid, &rawStatus, WNOHANG);
        if (result == childPid)
        {
            status = ExitStatus::fromWaitStatus(rawStatus);
            return true;
        }
        if (result < 0 && errno == ECHILD)
        {
            status = ExitStatus {};
            return true;
        }
        return false;
    }
};

StdioProcess::StdioProcess(PrivateTag): _impl(std::make_unique<Impl>())
{
}

StdioProcess::~StdioProcess()
{
    terminate(DefaultTerminateGrace);

    // Joins the drain thread before its descriptors go away.
    _impl->stderrDrain = std::jthread {};

    closeFd(_impl->stdinWrite);
    closeFd(_impl->stdoutRead);
    closeFd(_impl->stderrRead);
    closeFd(_impl->wakeRead);
    closeFd(_impl->wakeWrite);
}

auto StdioProcess::launch(const ServerDefinition& definition) -> Result<std::unique_ptr<Process>>
{
    // A child exiting while we write to it must surface as EPIPE, not kill the gateway.
    std::call_once(ignoreSigpipeOnce, [] { std::signal(SIGPIPE, SIG_IGN); });

    auto stdinPipe = Pipe {};
    auto stdoutPipe = Pipe {};
    auto stderrPipe = Pipe {};
    auto wakePipe = Pipe {};

    if (!stdinPipe.open(O_CLOEXEC) || !stdoutPipe.open(O_CLOEXEC) || !stderrPipe.open(O_CLOEXEC)
        || !wakePipe.open(O_CLOEXEC | O_NONBLOCK))
    {
        return makeError(ErrorCode::SpawnError, std::format("Failed to create pipes: {}", strerror(errno)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe.readEnd, STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe.writeEnd, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe.writeEnd, STDERR_FILENO);
    if (!definition.workingDirectory.empty())
        posix_spawn_file_actions_addchdir_np(&actions, definition.workingDirectory.c_str());

    // Own process group, default signal handling and an empty signal mask, regardless
    // of what the gateway itself ignores or blocks.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    sigset_t emptyMask;
    sigemptyset(&emptyMask);
    sigset_t defaultSignals;
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    sigaddset(&defaultSignals, SIGINT);
    sigaddset(&defaultSignals, SIGTERM);
    posix_spawnattr_setsigmask(&attributes, &emptyMask);
    posix_spawnattr_setsigdefault(&attributes, &defaultSignals);
    posix_spawnattr_setpgroup(&attributes, 0);
    posix_spawnattr_setflags(&attributes,
                             POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETPGROUP);

    auto argStrings = std::vector<std::string> { definition.command };
    argStrings.insert(argStrings.end(), definition.args.begin(), definition.args.end());
    auto argv = std::vector<char*> {};
    for (auto& arg: argStrings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = mergedEnvironment(definition.env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const spawnStatus =
        posix_spawnp(&pid, definition.command.c_str(), &actions, &attributes, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);

    if (spawnStatus != 0)
    {
        return makeError(ErrorCode::SpawnError,
                         std::format("Failed to spawn '{}': {}", describeCommand(definition), strerror(spawnStatus)));
    }

    auto process = std::make_unique<StdioProcess>(PrivateTag {});
    auto& impl = *process->_impl;
    impl.name = definition.name;
    impl.childPid = pid;
    impl.stdinWrite = stdinPipe.releaseWrite();
    impl.stdoutRead = stdoutPipe.releaseRead();
    impl.stderrRead = stderrPipe.releaseRead();
    impl.wakeRead = wakePipe.releaseRead();
    impl.wakeWrite = wakePipe.releaseWrite();

    // Writes honour deadlines by polling instead of blocking on a full pipe; stderr is
    // read without blocking once the drain thread is told to stop.
    ::fcntl(impl.stdinWrite, F_SETFL, ::fcntl(impl.stdinWrite, F_GETFL) | O_NONBLOCK);
    ::fcntl(impl.stderrRead, F_SETFL, ::fcntl(impl.stderrRead, F_GETFL) | O_NONBLOCK);

    impl.stderrDrain = std::jthread([&impl] { impl.drainStderr(); });

    log::info("[{}] started process {}: {}", definition.name, pid, describeCommand(definition));
    return std::unique_ptr<Process>(std::move(process));
}

auto StdioProcess::writeLine(std::string_view line, Clock::time_point deadline) -> VoidResult
{
    auto const lock = std::unique_lock(_impl->writeMutex, deadline);
    if (!lock.owns_lock())
        return makeError(ErrorCode::TimeoutError, "Timed out waiting for another write to the process");

    if (_impl->stdinWrite < 0)
        return makeError(ErrorCode::ProcessFailure, "Process stdin is closed");

    auto written = size_t { 0 };
    while (written < line.size())
    {
        auto const result = ::write(_impl->stdinWrite, line.data() + written, line.size() - written);
        if (result > 0)
        {
            written += static_cast<size_t>(result);
            continue;
        }

        if (result < 0 && errno == EINTR)
            continue;

        if (result < 0 && errno == EPIPE)
            return makeError(ErrorCode::ProcessFailure, "Process closed its stdin");

        if (result < 0 && errno != EAGAIN)
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", strerror(errno)));

        // Pipe full. A partially written line cannot be taken back: every later
        // line would be misframed, so that case fails the process, not just the write.
        auto const now = Clock::now();
        if (now >= deadline)
        {
            if (written == 0)
                return makeError(ErrorCode::TimeoutError, "Timed out waiting for process to accept input");
            return makeError(ErrorCode::ProcessFailure,
                             std::format("Process stopped reading its input after {} of {} bytes of a message",
                                         written,
                                         line.size()));
        }

        auto const waitFor =
            std::min(std::chrono::milliseconds(100), std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
        auto fds = std::array<pollfd, 2> { {
            { .fd = _impl->stdinWrite, .events = POLLOUT, .revents = 0 },
            { .fd = _impl->wakeRead, .events = POLLIN, .revents = 0 },
        } };
        if (::poll(fds.data(), fds.size(), static_cast<int>(waitFor.count())) > 0 && fds[1].revents != 0)
            return makeError(ErrorCode::ProcessFailure, "Process is terminating");
    }

    return {};
}

auto StdioProcess::read(std::span<char> buffer) -> Result<std::size_t>
{
    while (_impl->waitReadable(_impl->stdoutRead))
    {
        auto const bytesRead = ::read(_impl->stdoutRead, buffer.data(), buffer.size());
        if (bytesRead >= 0)
            return static_cast<std::size_t>(bytesRead);
        if (errno == EINTR || errno == EAGAIN)
            continue;
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to read from process stdout: {}", strerror(errno)));
    }

    return std::size_t { 0 };
}

auto StdioProcess::exitStatus() -> std::optional<ExitStatus>
{
    auto const lock = std::lock_guard(_impl->lifecycleMutex);
    if (_impl->childPid > 0)
        _impl->tryReap();
    return _impl->status;
}

auto StdioProcess::terminate(std::chrono::milliseconds grace) -> ExitStatus
{
    auto const lock = std::lock_guard(_impl->lifecycleMutex);

    if (_impl->wakeWrite >= 0)
    {
        auto const byte = char { 1 };
        [[maybe_unused]] auto const ignored = ::write(_impl->wakeWrite, &byte, 1);
    }

    {
        auto const writeLock = std::lock_guard(_impl->writeMutex);
        closeFd(_impl->stdinWrite);
    }

    if (_impl->childPid <= 0 || _impl->status)
        return _impl->status.value_or(ExitStatus {});

    // The group outlives its leader while helpers the server started are still running.
    _impl->signalGroup(SIGTERM);
    if (_impl->tryReap())
        return *_impl->status;

    auto const deadline = Clock::now() + grace;
    while (Clock::now() < deadline)
    {
        if (_impl->tryReap())
        {
            log::debug("[{}] process {} exited: {}", _impl->name, _impl->childPid, _impl->status->describe());
            return *_impl->status;
        }
        std::this_thread::sleep_for(ReapPollInterval);
    }

    if (grace.count() > 0)
        log::warning("[{}] process {} ignored SIGTERM for {}, killing", _impl->name, _impl->childPid, grace);
    _impl->signalGroup(SIGKILL);

    int rawStatus = 0;
    while (::waitpid(_impl->childPid, &rawStatus, 0) < 0 && errno == EINTR)
        ;
    _impl->status = ExitStatus::fromWaitStatus(rawStatus);
    return *_impl->status;
}

auto StdioProcess::pid() const -> int
{
    return _impl->childPid;
}

} // namespace mcpgate
