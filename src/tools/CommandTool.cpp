// SPDX-License-Identifier: Apache-2.0
#include "BuiltinTools.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>
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

    struct CommandOutcome
    {
        std::string output;
        int exitCode = 0;
        bool timedOut = false;
        bool truncated = false;
    };

    /// @brief Runs @p command through /bin/sh with stdout and stderr combined.
    auto runShellCommand(const std::string& command,
                         const std::string& workingDirectory,
                         std::chrono::seconds timeout,
                         size_t maxOutput) -> Result<CommandOutcome>
    {
        int outputPipe[2];
        if (::pipe2(outputPipe, O_CLOEXEC) != 0)
            return makeError(ErrorCode::IoError, "Failed to create output pipe");

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_adddup2(&actions, outputPipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&actions, outputPipe[1], STDERR_FILENO);

        // Own process group, so a timeout takes down everything the shell started.
        posix_spawnattr_t attributes;
        posix_spawnattr_init(&attributes);
        posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
        posix_spawnattr_setpgroup(&attributes, 0);

        // sh -c SCRIPT $0 $1: the directory and the command travel as positional
        // parameters, so neither needs quoting.
        auto args = std::vector<std::string> { "/bin/sh", "-c" };
        if (workingDirectory.empty())
        {
            args.push_back(command);
        }
        else
        {
            args.emplace_back("cd -- \"$0\" || exit 1; eval \"$1\"");
            args.push_back(workingDirectory);
            args.push_back(command);
        }

        auto argv = std::vector<char*> {};
        for (auto& arg: args)
            argv.push_back(arg.data());
        argv.push_back(nullptr);

        pid_t pid = -1;
        auto const status = ::posix_spawn(&pid, "/bin/sh", &actions, &attributes, argv.data(), environ);
        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attributes);
        ::close(outputPipe[1]);

        if (status != 0)
        {
            ::close(outputPipe[0]);
            return makeError(ErrorCode::IoError, std::format("Failed to start shell: {}", std::strerror(status)));
        }

        auto outcome = CommandOutcome {};
        auto const deadline = Clock::now() + timeout;
        auto buf = std::array<char, 4096> {};

        while (true)
        {
            auto const left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (left.count() <= 0)
            {
                outcome.timedOut = true;
                break;
            }

            auto pfd = pollfd { .fd = outputPipe[0], .events = POLLIN, .revents = 0 };
            auto const ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
            if (ready < 0 && errno != EINTR)
                break;
            if (ready <= 0)
                continue;

            auto const bytesRead = ::read(outputPipe[0], buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                break; // EOF: every writer is gone

            // Keep draining past the cap so the child never blocks on a full pipe.
            auto const room = maxOutput > outcome.output.size() ? maxOutput - outcome.output.size() : 0;
            auto const take = std::min(room, static_cast<size_t>(bytesRead));
            outcome.output.append(buf.data(), take);
            if (take < static_cast<size_t>(bytesRead))
                outcome.truncated = true;
        }
        ::close(outputPipe[0]);

        // The shell may have closed its output and still be running.
        int waitStatus = 0;
        auto reaped = false;
        while (!outcome.timedOut)
        {
            auto const result = ::waitpid(pid, &waitStatus, WNOHANG);
            if (result == pid || (result < 0 && errno != EINTR))
            {
                reaped = result == pid;
                break;
            }
            if (Clock::now() >= deadline)
                outcome.timedOut = true;
            else
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (outcome.timedOut)
            ::kill(-pid, SIGKILL);

        if (!reaped)
        {
            while (::waitpid(pid, &waitStatus, 0) < 0 && errno == EINTR)
                ;
        }

        if (WIFEXITED(waitStatus))
            outcome.exitCode = WEXITSTATUS(waitStatus);
        else if (WIFSIGNALED(waitStatus))
            outcome.exitCode = 128 + WTERMSIG(waitStatus);

        return outcome;
    }

    class RunCommandTool final: public BuiltinTool
    {
      public:
        explicit RunCommandTool(BuiltinToolOptions options): _options(std::move(options)) {}

        [[nodiscard]] auto definition() const -> ToolDefinition override
        {
            return ToolDefinition {
                .name = "run_command",
                .description = "Execute a shell command. Use for running tests, building projects, "
                               "inspecting the system, etc.",
                .parameters = {
                    { "type", "object" },
                    { "properties",
                      {
                          { "command", { { "type", "string" }, { "description", "The shell command to execute" } } },
                          { "cwd", { { "type", "string" }, { "description", "Working directory for the command" } } },
                      } },
                    { "required", { "command" } },
                },
            };
        }

        [[nodiscard]] auto execute(const nlohmann::json& arguments) -> Result<std::string> override
        {
            auto const command = toolargs::requireString(arguments, "command");
            if (!command)
                return std::unexpected(command.error());

            auto cwd = json::getStringOr(arguments, "cwd", "");
            if (!cwd.empty() && std::filesystem::path(cwd).is_relative() && !_options.workingDirectory.empty())
                cwd = (_options.workingDirectory / cwd).string();
            else if (cwd.empty())
                cwd = _options.workingDirectory.string();

            log::debug("run_command: {}", *command);
            auto outcome = runShellCommand(*command, cwd, _options.commandTimeout, _options.maxCommandOutput);
            if (!outcome)
                return std::unexpected(outcome.error());

            if (outcome->truncated)
                outcome->output += "\n...[truncated]";

            if (outcome->timedOut)
                return makeError(ErrorCode::TimeoutError,
                                 std::format("Command timed out after {}s\n{}",
                                             _options.commandTimeout.count(),
                                             outcome->output));

            if (outcome->exitCode != 0)
                return makeError(ErrorCode::ToolCallError,
                                 std::format("Command failed with exit code {}\n{}", outcome->exitCode, outcome->output));

            return std::move(outcome->output);
        }

      private:
        BuiltinToolOptions _options;
    };

} // namespace

auto createCommandTool(const BuiltinToolOptions& options) -> std::unique_ptr<BuiltinTool>
{
    return std::make_unique<RunCommandTool>(options);
}

} // namespace zesbe
