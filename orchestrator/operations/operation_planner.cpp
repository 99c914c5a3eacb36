#include "operation_planner.hpp"

#include "privilege_strategy.hpp"

#include "../process/command_runner.hpp"

#include <utility>

namespace rawbuild
{
namespace operations
{
    namespace
    {
        OperationPlan makePlan(Operation operation, std::vector<PlanStep> steps)
        {
            OperationPlan plan;
            plan.operation = operation;
            plan.steps = std::move(steps);
            return plan;
        }

        void append(std::vector<PlanStep>& steps, std::vector<PlanStep> more)
        {
            for (auto& step : more)
            {
                steps.push_back(std::move(step));
            }
        }
    } // namespace

    OperationPlanner::OperationPlanner(const host::HostContext& context, ProjectLayout layout)
        : context(context)
        , layout(std::move(layout))
        , toolchainStrategy(selectToolchainStrategy(context.toolchain, this->layout, context.verbose))
    {
    }

    OperationPlan OperationPlanner::plan(Operation operation) const
    {
        switch (operation)
        {
        case Operation::Build:
            return planBuild();
        case Operation::BuildDocs:
            return planDocs();
        case Operation::BuildTestArtifacts:
            return planTestArtifacts();
        case Operation::RunTests:
            return planRunTests();
        case Operation::Clean:
            return planClean();
        case Operation::BuildBenchmarks:
            return planBenchmarks();
        }
        return planBuild();
    }

    OperationPlan OperationPlanner::planBuild() const
    {
        return makePlan(Operation::Build, toolchainStrategy->build());
    }

    OperationPlan OperationPlanner::planDocs() const
    {
        return makePlan(Operation::BuildDocs, toolchainStrategy->buildDocs());
    }

    OperationPlan OperationPlanner::planTestArtifacts() const
    {
        return makePlan(Operation::BuildTestArtifacts, toolchainStrategy->buildTestArtifacts());
    }

    OperationPlan OperationPlanner::planRunTests() const
    {
        // The executor stops at the first failing step, so nothing privileged runs unless every
        // artifact step succeeded.
        auto steps = toolchainStrategy->buildTestArtifacts();
        steps.push_back(makeNoticeStep(kPrivilegeAdvisory));
        append(steps, planPrivilegedTestRun(context, *toolchainStrategy, layout));
        return makePlan(Operation::RunTests, std::move(steps));
    }

    OperationPlan OperationPlanner::planClean() const
    {
        return makePlan(Operation::Clean, toolchainStrategy->clean());
    }

    OperationPlan OperationPlanner::planBenchmarks() const
    {
        std::vector<PlanStep> steps;
        if (context.operatingSystemName != layout.nativeBenchmarkPlatform)
        {
            steps.push_back(makeWarningStep("C benchmarks only work on OS X"));
        }

        if (!context.toolchain.cCompiler.has_value())
        {
            steps.push_back(makeFailureStep("no C compiler ('clang' or 'gcc') was found on PATH.",
                process::kLaunchFailureExitCode));
            return makePlan(Operation::BuildBenchmarks, std::move(steps));
        }

        if (!context.toolchain.directCompiler.has_value())
        {
            steps.push_back(makeMissingToolStep("direct compiler", "rustc"));
            return makePlan(Operation::BuildBenchmarks, std::move(steps));
        }

        const auto sourceDirectory = layout.benchmarkSourceDirectory;
        const auto outputDirectory = layout.benchmarkDirectory();

        for (const auto& benchmark : layout.nativeBenchmarks)
        {
            process::CommandInvocation invocation;
            invocation.executable = *context.toolchain.cCompiler;
            invocation.arguments = {
                "-W",
                "-Wall",
                "-O2",
                (sourceDirectory / (benchmark + ".c")).string(),
                "-o",
                (outputDirectory / benchmark).string(),
            };
            steps.push_back(makeCommandStep(std::move(invocation)));
        }

        for (const auto& benchmark : layout.libraryBenchmarks)
        {
            process::CommandInvocation invocation;
            invocation.executable = *context.toolchain.directCompiler;
            invocation.arguments = {
                "-O",
                (sourceDirectory / (benchmark + ".rs")).string(),
                "--out-dir",
                outputDirectory.string(),
                "-L",
                layout.releaseDirectory().string(),
            };
            steps.push_back(makeCommandStep(std::move(invocation)));
        }

        return makePlan(Operation::BuildBenchmarks, std::move(steps));
    }
} // namespace operations
} // namespace rawbuild
