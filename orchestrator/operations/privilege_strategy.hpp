#pragma once

#include "operation_plan.hpp"
#include "project_layout.hpp"
#include "toolchain_strategy.hpp"

#include "../host/host_context.hpp"

#include <string>
#include <utility>
#include <vector>

namespace rawbuild
{
namespace operations
{
    enum class PrivilegeModel
    {
        // Linux: grant the raw-socket capability to the test binaries, run tests unprivileged.
        CapabilityGrant,
        // BSD/Darwin: run the whole test runner through the elevation utility.
        ElevatedRun,
        // Windows compatibility layers: no elevation available or needed.
        Unelevated,
        Unsupported,
    };

    PrivilegeModel selectPrivilegeModel(host::PlatformClass platform);

    std::vector<std::pair<std::string, std::string>> testEnvironment(const ProjectLayout& layout,
        const std::string& testInterface,
        bool exportInterface);

    // Steps that run the tests under the platform's privilege model. Assumes the test
    // artifacts are already built.
    std::vector<PlanStep> planPrivilegedTestRun(const host::HostContext& context,
        const ToolchainStrategy& strategy,
        const ProjectLayout& layout);

    const char* toString(PrivilegeModel model);
} // namespace operations
} // namespace rawbuild
