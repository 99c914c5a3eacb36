#include "command_runner.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#if defined(_WIN32)
#    include <process.h>
#    include <stdlib.h>
#else
#    include <spawn.h>
#    include <sys/wait.h>
#    include <unistd.h>

extern char** environ;
#endif

namespace rawbuild
{
namespace process
{
    namespace
    {
        std::vector<std::string> buildArgumentStorage(const CommandInvocation& invocation)
        {
            std::vector<std::string> storage;
            storage.reserve(invocation.arguments.size() + 1);
            storage.push_back(invocation.executable.string());
            for (const auto& argument : invocation.arguments)
            {
                storage.push_back(argument);
            }
            return storage;
        }

        bool isOverridden(std::string_view entry, const CommandInvocation& invocation)
        {
            for (const auto& variable : invocation.environment)
            {
                const auto& name = variable.first;
                if (entry.size() > name.size() && entry.compare(0, name.size(), name) == 0
                    && entry[name.size()] == '=')
                {
                    return true;
                }
            }
            return false;
        }

        std::vector<std::string> buildEnvironmentStorage(const CommandInvocation& invocation)
        {
            std::vector<std::string> storage;
#if defined(_WIN32)
            char** entries = _environ;
#else
            char** entries = environ;
#endif
            for (; entries != nullptr && *entries != nullptr; ++entries)
            {
                std::string_view entry{*entries};
                if (!isOverridden(entry, invocation))
                {
                    storage.emplace_back(entry);
                }
            }

            for (const auto& [name, value] : invocation.environment)
            {
                storage.push_back(name + "=" + value);
            }
            return storage;
        }

        std::vector<char*> toPointerVector(std::vector<std::string>& storage)
        {
            std::vector<char*> pointers;
            pointers.reserve(storage.size() + 1);
            for (auto& entry : storage)
            {
                pointers.push_back(entry.data());
            }
            pointers.push_back(nullptr);
            return pointers;
        }

#if !defined(_WIN32)
        int waitForChild(pid_t pid, const CommandInvocation& invocation, std::ostream* errors)
        {
            int status = 0;
            while (::waitpid(pid, &status, 0) == -1)
            {
                if (errno == EINTR)
                {
                    continue;
                }

                if (errors != nullptr)
                {
                    *errors << "rawbuild: failed to wait for '" << invocation.executable.string()
                            << "': " << std::strerror(errno) << "\n";
                }
                return 1;
            }

            if (WIFEXITED(status))
            {
                return WEXITSTATUS(status);
            }

            if (WIFSIGNALED(status))
            {
                int signal = WTERMSIG(status);
                if (errors != nullptr)
                {
                    *errors << "rawbuild: '" << invocation.executable.string() << "' terminated by signal "
                            << signal << ".\n";
                }
                return 128 + signal;
            }

            return status;
        }
#endif
    } // namespace

    ProcessCommandRunner::ProcessCommandRunner(std::ostream& errors)
        : errors(errors)
    {
    }

    int ProcessCommandRunner::run(const CommandInvocation& invocation)
    {
        auto argumentStorage = buildArgumentStorage(invocation);
        auto environmentStorage = buildEnvironmentStorage(invocation);
        auto argv = toPointerVector(argumentStorage);
        auto envp = toPointerVector(environmentStorage);

#if defined(_WIN32)
        std::fflush(nullptr);
        auto exitCode = _spawnvpe(_P_WAIT, argv[0], argv.data(), envp.data());
        if (exitCode == -1)
        {
            errors << "rawbuild: failed to launch '" << invocation.executable.string() << "': " << std::strerror(errno)
                   << "\n";
            return kLaunchFailureExitCode;
        }
        return static_cast<int>(exitCode);
#else
        std::cout.flush();
        std::cerr.flush();

        pid_t pid = 0;
        int spawnResult = ::posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), envp.data());
        if (spawnResult != 0)
        {
            errors << "rawbuild: failed to launch '" << invocation.executable.string() << "': "
                   << std::strerror(spawnResult) << "\n";
            return kLaunchFailureExitCode;
        }

        return waitForChild(pid, invocation, &errors);
#endif
    }

    CaptureResult ProcessCommandRunner::capture(const CommandInvocation& invocation)
    {
        CaptureResult result;

#if defined(_WIN32)
        std::string command;
        for (const auto& [name, value] : invocation.environment)
        {
            command += "set \"" + name + "=" + value + "\" && ";
        }
        command += quoteIfNeeded(invocation.executable.string());
        for (const auto& argument : invocation.arguments)
        {
            command += " " + quoteIfNeeded(argument);
        }

        FILE* pipe = _popen(command.c_str(), "r");
        if (pipe == nullptr)
        {
            result.exitCode = kLaunchFailureExitCode;
            return result;
        }

        result.launched = true;
        char buffer[4096];
        std::size_t count = 0;
        while ((count = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0)
        {
            result.output.append(buffer, count);
        }
        result.exitCode = _pclose(pipe);
        return result;
#else
        auto argumentStorage = buildArgumentStorage(invocation);
        auto environmentStorage = buildEnvironmentStorage(invocation);
        auto argv = toPointerVector(argumentStorage);
        auto envp = toPointerVector(environmentStorage);

        int fds[2] = {-1, -1};
        if (::pipe(fds) != 0)
        {
            result.exitCode = kLaunchFailureExitCode;
            return result;
        }

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
        posix_spawn_file_actions_addclose(&actions, fds[0]);
        posix_spawn_file_actions_addclose(&actions, fds[1]);

        pid_t pid = 0;
        int spawnResult = ::posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), envp.data());
        posix_spawn_file_actions_destroy(&actions);
        ::close(fds[1]);

        if (spawnResult != 0)
        {
            ::close(fds[0]);
            result.exitCode = kLaunchFailureExitCode;
            return result;
        }

        result.launched = true;
        char buffer[4096];
        while (true)
        {
            auto count = ::read(fds[0], buffer, sizeof(buffer));
            if (count > 0)
            {
                result.output.append(buffer, static_cast<std::size_t>(count));
                continue;
            }

            if (count == -1 && errno == EINTR)
            {
                continue;
            }
            break;
        }
        ::close(fds[0]);

        // Capture is used for best-effort probes; wait failures are reported through the exit code only.
        result.exitCode = waitForChild(pid, invocation, nullptr);
        return result;
#endif
    }
} // namespace process
} // namespace rawbuild
