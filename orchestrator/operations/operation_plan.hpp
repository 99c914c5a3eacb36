#pragma once

#include "../process/command_invocation.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace rawbuild
{
namespace operations
{
    enum class Operation
    {
        Build,
        BuildDocs,
        BuildTestArtifacts,
        RunTests,
        Clean,
        BuildBenchmarks,
    };

    enum class StepKind
    {
        RunCommand,
        RunTestRunner,
        GrantCapability,
        RemoveDirectory,
        Notice,
        Warning,
        Fail,
    };

    // Files in `directory` whose name starts with `prefix`, resolved when the step runs.
    struct ArtifactPattern
    {
        std::filesystem::path directory;
        std::string prefix;
    };

    struct PlanStep
    {
        StepKind kind{StepKind::Notice};
        process::CommandInvocation invocation;
        std::optional<ArtifactPattern> artifacts;
        std::optional<std::filesystem::path> elevationUtility;
        std::string capability;
        std::filesystem::path target;
        std::string message;
        int exitCode{1};
    };

    struct OperationPlan
    {
        Operation operation{Operation::Build};
        std::vector<PlanStep> steps;
    };

    PlanStep makeCommandStep(process::CommandInvocation invocation);

    // Runs `invocation`, or every artifact matching `artifacts` with the invocation's arguments
    // and environment. A set `elevationUtility` runs it through that utility.
    PlanStep makeTestRunnerStep(process::CommandInvocation invocation,
        std::optional<ArtifactPattern> artifacts,
        std::optional<std::filesystem::path> elevationUtility);

    PlanStep makeCapabilityGrantStep(std::filesystem::path elevationUtility,
        std::string capability,
        ArtifactPattern artifacts);

    PlanStep makeRemoveDirectoryStep(std::filesystem::path target);
    PlanStep makeNoticeStep(std::string message);
    PlanStep makeWarningStep(std::string message);
    PlanStep makeFailureStep(std::string message, int exitCode);

    std::string describePattern(const ArtifactPattern& pattern);
    std::string describeStep(const PlanStep& step);
    void printPlan(const OperationPlan& plan, std::ostream& out);

    const char* toString(Operation operation);
} // namespace operations
} // namespace rawbuild
