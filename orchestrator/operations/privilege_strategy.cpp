#include "privilege_strategy.hpp"

namespace rawbuild
{
namespace operations
{
    PrivilegeModel selectPrivilegeModel(host::PlatformClass platform)
    {
        switch (platform)
        {
        case host::PlatformClass::Linux:
            return PrivilegeModel::CapabilityGrant;
        case host::PlatformClass::BSDOrDarwin:
            return PrivilegeModel::ElevatedRun;
        case host::PlatformClass::WindowsCompat:
            return PrivilegeModel::Unelevated;
        case host::PlatformClass::Unsupported:
            return PrivilegeModel::Unsupported;
        }
        return PrivilegeModel::Unsupported;
    }

    std::vector<std::pair<std::string, std::string>> testEnvironment(const ProjectLayout& layout,
        const std::string& testInterface,
        bool exportInterface)
    {
        std::vector<std::pair<std::string, std::string>> environment;
        if (exportInterface && !testInterface.empty())
        {
            environment.emplace_back(layout.interfaceVariable, testInterface);
        }

        for (const auto& variable : layout.parallelismVariables)
        {
            environment.emplace_back(variable, "1");
        }
        return environment;
    }

    std::vector<PlanStep> planPrivilegedTestRun(const host::HostContext& context,
        const ToolchainStrategy& strategy,
        const ProjectLayout& layout)
    {
        auto runner = strategy.testRunner();
        const auto& elevationUtility = context.toolchain.elevationUtility;

        std::vector<PlanStep> steps;
        switch (selectPrivilegeModel(context.platform))
        {
        case PrivilegeModel::CapabilityGrant:
            if (!context.privilegedUser)
            {
                if (!elevationUtility.has_value())
                {
                    steps.push_back(makeMissingToolStep("elevation utility", "sudo"));
                    return steps;
                }

                steps.push_back(
                    makeCapabilityGrantStep(*elevationUtility, layout.rawSocketCapability, strategy.testArtifacts()));
            }

            runner.invocation.environment = testEnvironment(layout, context.testInterface, false);
            steps.push_back(makeTestRunnerStep(runner.invocation, runner.artifacts, std::nullopt));
            return steps;

        case PrivilegeModel::ElevatedRun:
            if (!elevationUtility.has_value())
            {
                steps.push_back(makeMissingToolStep("elevation utility", "sudo"));
                return steps;
            }

            runner.invocation.environment = testEnvironment(layout, context.testInterface, true);
            steps.push_back(makeTestRunnerStep(runner.invocation, runner.artifacts, elevationUtility));
            return steps;

        case PrivilegeModel::Unelevated:
            runner.invocation.environment = testEnvironment(layout, context.testInterface, true);
            steps.push_back(makeTestRunnerStep(runner.invocation, runner.artifacts, std::nullopt));
            return steps;

        case PrivilegeModel::Unsupported:
            break;
        }

        std::string platformName = context.operatingSystemName.empty() ? "unknown" : context.operatingSystemName;
        steps.push_back(makeFailureStep("unsupported testing platform '" + platformName + "'.", 1));
        return steps;
    }

    const char* toString(PrivilegeModel model)
    {
        switch (model)
        {
        case PrivilegeModel::CapabilityGrant:
            return "capability-grant";
        case PrivilegeModel::ElevatedRun:
            return "elevated-run";
        case PrivilegeModel::Unelevated:
            return "unelevated";
        case PrivilegeModel::Unsupported:
            return "unsupported";
        }
        return "unknown";
    }
} // namespace operations
} // namespace rawbuild
