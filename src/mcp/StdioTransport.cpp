// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace zesbe
{

namespace
{
    using Clock = std::chrono::steady_clock;

    /// Writing to a pipe whose reader died must not kill the host process.
    void ignoreSigpipeOnce()
    {
        static auto flag = std::once_flag {};
        std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    /// @brief Waits up to @p timeout for the child to exit.
    /// @return true if the child was reaped.
    auto waitForExit(pid_t pid, std::chrono::milliseconds timeout) -> bool
    {
        auto const deadline = Clock::now() + timeout;
        while (true)
        {
            int status = 0;
            auto const rc = ::waitpid(pid, &status, WNOHANG);
            if (rc == pid || (rc < 0 && errno == ECHILD))
                return true;
            if (Clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
} // namespace

struct StdioTransport::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    bool connected = false;
    std::string readBuffer;
    std::string command;
    std::chrono::milliseconds receiveTimeout { 0 };

    /// @brief Pops one complete line from the read buffer, if any.
    auto takeLine() -> std::optional<std::string>
    {
        auto const newlinePos = readBuffer.find('\n');
        if (newlinePos == std::string::npos)
            return std::nullopt;

        auto line = readBuffer.substr(0, newlinePos);
        readBuffer.erase(0, newlinePos + 1);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        return line;
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");
    if (config.command.empty())
        return makeError(ErrorCode::TransportError, "No command configured");

    ignoreSigpipeOnce();

    // O_CLOEXEC keeps our pipe ends out of other spawned servers; dup2 clears it on 0/1.
    int stdinPipe[2];
    int stdoutPipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    if (!config.inheritStderr)
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Inherited environment, with configured entries replacing same-named ones.
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const key = entry.substr(0, entry.find('='));
            if (!config.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status =
        ::posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(
            ErrorCode::TransportError,
            std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->command = config.command;
    _impl->readBuffer.clear();
    _impl->connected = true;
    log::debug("Spawned '{}' (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = json::dump(message) + "\n";
    log::trace("-> {}", data.substr(0, data.size() - 1));

    auto remaining = std::string_view(data);
    while (!remaining.empty())
    {
        auto const written = ::write(_impl->stdinWrite, remaining.data(), remaining.size());
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to '{}': {}", _impl->command, std::strerror(errno)));
        }
        remaining.remove_prefix(static_cast<size_t>(written));
    }

    return {};
}

auto StdioTransport::receive() -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const limited = _impl->receiveTimeout.count() > 0;
    auto const deadline = Clock::now() + _impl->receiveTimeout;

    while (true)
    {
        while (auto line = _impl->takeLine())
        {
            if (line->empty())
                continue;
            log::trace("<- {}", *line);
            auto parsed = json::parse(*line);
            if (!parsed)
            {
                log::debug("Skipping non-JSON output from '{}'", _impl->command);
                continue;
            }
            return parsed;
        }

        auto waitMs = -1;
        if (limited)
        {
            auto const left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (left.count() <= 0)
                return makeError(ErrorCode::TimeoutError,
                                 std::format("Timed out waiting for '{}'", _impl->command));
            waitMs = static_cast<int>(left.count());
        }

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, waitMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", std::strerror(errno)));
        }
        if (ready == 0)
            continue; // deadline is re-checked at the top

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError,
                             std::format("Process '{}' closed its output", _impl->command));
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::setReceiveTimeout(std::chrono::milliseconds timeout)
{
    _impl->receiveTimeout = timeout;
}

void StdioTransport::close()
{
    if (_impl->stdinWrite >= 0)
    {
        ::close(_impl->stdinWrite);
        _impl->stdinWrite = -1;
    }
    if (_impl->stdoutRead >= 0)
    {
        ::close(_impl->stdoutRead);
        _impl->stdoutRead = -1;
    }

    // EOF on stdin is the polite shutdown request; escalate if it is ignored.
    if (_impl->childPid > 0)
    {
        auto const pid = _impl->childPid;
        _impl->childPid = -1;
        if (!waitForExit(pid, std::chrono::milliseconds(500)))
        {
            ::kill(pid, SIGTERM);
            if (!waitForExit(pid, std::chrono::milliseconds(1000)))
            {
                ::kill(pid, SIGKILL);
                int status = 0;
                ::waitpid(pid, &status, 0);
            }
        }
        log::debug("MCP transport for '{}' closed", _impl->command);
    }

    _impl->connected = false;
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace zesbe
