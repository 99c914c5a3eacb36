#include "operation_plan.hpp"

#include <ostream>
#include <utility>

namespace rawbuild
{
namespace operations
{
    PlanStep makeCommandStep(process::CommandInvocation invocation)
    {
        PlanStep step;
        step.kind = StepKind::RunCommand;
        step.invocation = std::move(invocation);
        return step;
    }

    PlanStep makeTestRunnerStep(process::CommandInvocation invocation,
        std::optional<ArtifactPattern> artifacts,
        std::optional<std::filesystem::path> elevationUtility)
    {
        PlanStep step;
        step.kind = StepKind::RunTestRunner;
        step.invocation = std::move(invocation);
        step.artifacts = std::move(artifacts);
        step.elevationUtility = std::move(elevationUtility);
        return step;
    }

    PlanStep makeCapabilityGrantStep(std::filesystem::path elevationUtility,
        std::string capability,
        ArtifactPattern artifacts)
    {
        PlanStep step;
        step.kind = StepKind::GrantCapability;
        step.elevationUtility = std::move(elevationUtility);
        step.capability = std::move(capability);
        step.artifacts = std::move(artifacts);
        return step;
    }

    PlanStep makeRemoveDirectoryStep(std::filesystem::path target)
    {
        PlanStep step;
        step.kind = StepKind::RemoveDirectory;
        step.target = std::move(target);
        return step;
    }

    PlanStep makeNoticeStep(std::string message)
    {
        PlanStep step;
        step.kind = StepKind::Notice;
        step.message = std::move(message);
        return step;
    }

    PlanStep makeWarningStep(std::string message)
    {
        PlanStep step;
        step.kind = StepKind::Warning;
        step.message = std::move(message);
        return step;
    }

    PlanStep makeFailureStep(std::string message, int exitCode)
    {
        PlanStep step;
        step.kind = StepKind::Fail;
        step.message = std::move(message);
        step.exitCode = exitCode;
        return step;
    }

    std::string describePattern(const ArtifactPattern& pattern)
    {
        return (pattern.directory / (pattern.prefix + "*")).string();
    }

    std::string describeStep(const PlanStep& step)
    {
        switch (step.kind)
        {
        case StepKind::RunCommand:
            return process::formatInvocation(step.invocation);

        case StepKind::RunTestRunner:
        {
            auto invocation = step.invocation;
            if (step.artifacts.has_value())
            {
                invocation.executable = describePattern(*step.artifacts);
            }
            if (step.elevationUtility.has_value())
            {
                invocation = process::elevateInvocation(invocation, *step.elevationUtility);
            }
            return process::formatInvocation(invocation);
        }

        case StepKind::GrantCapability:
        {
            process::CommandInvocation invocation;
            invocation.executable = step.elevationUtility.value_or(std::filesystem::path{"sudo"});
            invocation.arguments = {"setcap", step.capability};
            if (step.artifacts.has_value())
            {
                invocation.arguments.push_back(describePattern(*step.artifacts));
            }
            return process::formatInvocation(invocation);
        }

        case StepKind::RemoveDirectory:
            return "remove directory tree '" + step.target.string() + "'";

        case StepKind::Notice:
            return "notice: " + step.message;

        case StepKind::Warning:
            return "warning: " + step.message;

        case StepKind::Fail:
            return "fail (" + std::to_string(step.exitCode) + "): " + step.message;
        }

        return "unknown step";
    }

    void printPlan(const OperationPlan& plan, std::ostream& out)
    {
        out << "[rawbuild] plan for '" << toString(plan.operation) << "':\n";
        for (const auto& step : plan.steps)
        {
            out << "[rawbuild]   " << describeStep(step) << "\n";
        }
    }

    const char* toString(Operation operation)
    {
        switch (operation)
        {
        case Operation::Build:
            return "build";
        case Operation::BuildDocs:
            return "doc";
        case Operation::BuildTestArtifacts:
            return "test-artifacts";
        case Operation::RunTests:
            return "test";
        case Operation::Clean:
            return "clean";
        case Operation::BuildBenchmarks:
            return "benchmarks";
        }
        return "unknown";
    }
} // namespace operations
} // namespace rawbuild
