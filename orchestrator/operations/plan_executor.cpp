#include "plan_executor.hpp"

#include <algorithm>
#include <ostream>
#include <system_error>
#include <utility>

namespace rawbuild
{
namespace operations
{
    namespace
    {
        bool isExecutableArtifact(const std::filesystem::directory_entry& entry)
        {
            std::error_code ec;
            if (!entry.is_regular_file(ec) || ec)
            {
                return false;
            }

#if defined(_WIN32)
            return entry.path().extension() == ".exe";
#else
            auto permissions = entry.status(ec).permissions();
            if (ec)
            {
                return false;
            }
            return (permissions & std::filesystem::perms::owner_exec) != std::filesystem::perms::none;
#endif
        }
    } // namespace

    std::vector<std::filesystem::path> findArtifacts(const ArtifactPattern& pattern)
    {
        std::vector<std::filesystem::path> artifacts;

        std::error_code ec;
        for (std::filesystem::directory_iterator iterator{pattern.directory, ec};
             !ec && iterator != std::filesystem::directory_iterator{};
             iterator.increment(ec))
        {
            const auto& entry = *iterator;
            auto fileName = entry.path().filename().string();
            if (fileName.compare(0, pattern.prefix.size(), pattern.prefix) != 0)
            {
                continue;
            }

            if (isExecutableArtifact(entry))
            {
                artifacts.push_back(entry.path());
            }
        }

        std::sort(artifacts.begin(), artifacts.end());
        return artifacts;
    }

    PlanExecutor::PlanExecutor(process::CommandRunner& runner, std::ostream& out, std::ostream& err, bool trace)
        : runner(runner)
        , out(out)
        , err(err)
        , trace(trace)
    {
    }

    int PlanExecutor::execute(const OperationPlan& plan)
    {
        int status = 0;
        for (const auto& step : plan.steps)
        {
            status = executeStep(step);
            if (status != 0)
            {
                return status;
            }
        }
        return status;
    }

    int PlanExecutor::executeStep(const PlanStep& step)
    {
        switch (step.kind)
        {
        case StepKind::RunCommand:
            return runCommand(step.invocation);

        case StepKind::RunTestRunner:
            return runTestRunner(step);

        case StepKind::GrantCapability:
            return grantCapability(step);

        case StepKind::RemoveDirectory:
            return removeDirectory(step);

        case StepKind::Notice:
            out << "[rawbuild] " << step.message << "\n";
            return 0;

        case StepKind::Warning:
            err << "warning: " << step.message << "\n";
            return 0;

        case StepKind::Fail:
            err << "rawbuild: " << step.message << "\n";
            return step.exitCode;
        }

        err << "rawbuild: unknown plan step.\n";
        return 1;
    }

    int PlanExecutor::runCommand(const process::CommandInvocation& invocation)
    {
        if (trace)
        {
            err << "+ " << process::formatInvocation(invocation) << "\n";
        }

        auto exitCode = runner.run(invocation);
        if (exitCode != 0)
        {
            err << "rawbuild: '" << invocation.executable.string() << "' exited with code " << exitCode << ".\n";
        }
        return exitCode;
    }

    int PlanExecutor::grantCapability(const PlanStep& step)
    {
        if (!step.elevationUtility.has_value() || !step.artifacts.has_value())
        {
            err << "rawbuild: capability grant is missing its elevation utility or artifacts.\n";
            return 1;
        }

        auto artifacts = findArtifacts(*step.artifacts);
        if (artifacts.empty())
        {
            err << "rawbuild: no test artifacts matching '" << describePattern(*step.artifacts) << "' were found.\n";
            return 1;
        }

        process::CommandInvocation invocation;
        invocation.executable = *step.elevationUtility;
        invocation.arguments = {"setcap", step.capability};
        for (const auto& artifact : artifacts)
        {
            out << "[rawbuild] privileged: granting " << step.capability << " to " << artifact.string() << " via "
                << step.elevationUtility->string() << "\n";
            invocation.arguments.push_back(artifact.string());
        }

        return runCommand(invocation);
    }

    int PlanExecutor::runTestRunner(const PlanStep& step)
    {
        std::vector<process::CommandInvocation> invocations;
        if (step.artifacts.has_value())
        {
            auto artifacts = findArtifacts(*step.artifacts);
            if (artifacts.empty())
            {
                err << "rawbuild: no test artifacts matching '" << describePattern(*step.artifacts)
                    << "' were found.\n";
                return 1;
            }

            for (const auto& artifact : artifacts)
            {
                auto invocation = step.invocation;
                invocation.executable = artifact;
                invocations.push_back(std::move(invocation));
            }
        }
        else
        {
            invocations.push_back(step.invocation);
        }

        int status = 0;
        for (const auto& invocation : invocations)
        {
            if (step.elevationUtility.has_value())
            {
                out << "[rawbuild] privileged: running test runner via " << step.elevationUtility->string() << "\n";
                status = runCommand(process::elevateInvocation(invocation, *step.elevationUtility));
            }
            else
            {
                status = runCommand(invocation);
            }

            if (status != 0)
            {
                return status;
            }
        }
        return status;
    }

    int PlanExecutor::removeDirectory(const PlanStep& step)
    {
        if (trace)
        {
            err << "+ rm -fr " << process::quoteIfNeeded(step.target.string()) << "\n";
        }

        std::error_code ec;
        std::filesystem::remove_all(step.target, ec);
        if (ec)
        {
            err << "rawbuild: failed to remove '" << step.target.string() << "': " << ec.message() << "\n";
            return 1;
        }
        return 0;
    }
} // namespace operations
} // namespace rawbuild
