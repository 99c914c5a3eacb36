#pragma once

#include "operation_plan.hpp"

#include "../process/command_runner.hpp"

#include <filesystem>
#include <iosfwd>
#include <vector>

namespace rawbuild
{
namespace operations
{
    // Regular, executable files matching the pattern, sorted by name. A missing directory
    // yields no artifacts.
    std::vector<std::filesystem::path> findArtifacts(const ArtifactPattern& pattern);

    class PlanExecutor
    {
    public:
        PlanExecutor(process::CommandRunner& runner, std::ostream& out, std::ostream& err, bool trace);

        // Runs the steps in order and stops at the first failure. Returns the status of the last
        // command run, or 0 when nothing ran.
        int execute(const OperationPlan& plan);

    private:
        int executeStep(const PlanStep& step);
        int runCommand(const process::CommandInvocation& invocation);
        int grantCapability(const PlanStep& step);
        int runTestRunner(const PlanStep& step);
        int removeDirectory(const PlanStep& step);

        process::CommandRunner& runner;
        std::ostream& out;
        std::ostream& err;
        bool trace;
    };
} // namespace operations
} // namespace rawbuild
