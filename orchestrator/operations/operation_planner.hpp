#pragma once

#include "operation_plan.hpp"
#include "project_layout.hpp"
#include "toolchain_strategy.hpp"

#include "../host/host_context.hpp"

#include <memory>

namespace rawbuild
{
namespace operations
{
    inline constexpr const char* kPrivilegeAdvisory
        = "Setting permissions for test suite - enter sudo password if prompted";

    // Turns an operation into the ordered steps that carry it out. The toolchain strategy is
    // chosen once, from the resolved toolchain, when the planner is built.
    class OperationPlanner
    {
    public:
        OperationPlanner(const host::HostContext& context, ProjectLayout layout);

        OperationPlan plan(Operation operation) const;

        OperationPlan planBuild() const;
        OperationPlan planDocs() const;
        OperationPlan planTestArtifacts() const;
        OperationPlan planRunTests() const;
        OperationPlan planClean() const;
        OperationPlan planBenchmarks() const;

        const ToolchainStrategy& strategy() const
        {
            return *toolchainStrategy;
        }

    private:
        const host::HostContext& context;
        ProjectLayout layout;
        std::unique_ptr<ToolchainStrategy> toolchainStrategy;
    };
} // namespace operations
} // namespace rawbuild
