#include "host_context.hpp"

#include "interface_discovery.hpp"

#include "../toolchain/toolchain_resolver.hpp"

namespace rawbuild
{
namespace host
{
    bool isVerboseRequested(const Environment& environment, const std::string& verbosityVariable)
    {
        return environment.equals(verbosityVariable, "1");
    }

    HostContext discoverHostContext(const Environment& environment,
        process::CommandRunner& runner,
        const HostProbeSettings& settings)
    {
        HostContext context;
        context.toolchain = toolchain::resolveToolchain(environment);
        if (settings.queryInterface)
        {
            context.testInterface = discoverTestInterface(environment, runner, settings.interfaceVariable);
        }
        else
        {
            context.testInterface = environment.lookup(settings.interfaceVariable).value_or("");
        }
        context.operatingSystemName = hostOperatingSystemName(environment);
        context.platform = classifyPlatform(context.operatingSystemName);
        context.verbose = isVerboseRequested(environment, settings.verbosityVariable);
        context.privilegedUser = isPrivilegedUser();
        return context;
    }
} // namespace host
} // namespace rawbuild
