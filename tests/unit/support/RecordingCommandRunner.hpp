#pragma once

#include "process/command_runner.hpp"

#include <functional>
#include <string>
#include <vector>

namespace rawbuild::test_support
{
    // Records every invocation instead of spawning it. `exitCodeFor` decides the outcome.
    class RecordingCommandRunner final : public process::CommandRunner
    {
    public:
        int run(const process::CommandInvocation& invocation) override
        {
            invocations.push_back(invocation);
            return exitCodeFor ? exitCodeFor(invocation) : 0;
        }

        process::CaptureResult capture(const process::CommandInvocation& invocation) override
        {
            captures.push_back(invocation);
            return captureResult;
        }

        std::size_t countRunsOf(const std::string& executableName) const
        {
            std::size_t count = 0;
            for (const auto& invocation : invocations)
            {
                if (invocation.executable.filename().string() == executableName)
                {
                    ++count;
                }
            }
            return count;
        }

        std::vector<process::CommandInvocation> invocations;
        std::vector<process::CommandInvocation> captures;
        std::function<int(const process::CommandInvocation&)> exitCodeFor;
        process::CaptureResult captureResult;
    };
} // namespace rawbuild::test_support
