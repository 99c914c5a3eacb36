#pragma once

#include "command_invocation.hpp"

#include <iosfwd>
#include <string>

namespace rawbuild
{
namespace process
{
    // Exit status used when a child could not be launched, matching the shell convention.
    constexpr int kLaunchFailureExitCode = 127;

    struct CaptureResult
    {
        int exitCode{0};
        bool launched{false};
        std::string output;
    };

    class CommandRunner
    {
    public:
        virtual ~CommandRunner() = default;

        // Runs the invocation with inherited standard streams and waits for it to exit.
        virtual int run(const CommandInvocation& invocation) = 0;

        // Runs the invocation and collects its standard output.
        virtual CaptureResult capture(const CommandInvocation& invocation) = 0;
    };

    class ProcessCommandRunner final : public CommandRunner
    {
    public:
        explicit ProcessCommandRunner(std::ostream& errors);

        int run(const CommandInvocation& invocation) override;
        CaptureResult capture(const CommandInvocation& invocation) override;

    private:
        std::ostream& errors;
    };
} // namespace process
} // namespace rawbuild
