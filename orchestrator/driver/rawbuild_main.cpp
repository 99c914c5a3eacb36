#include "command_line.hpp"
#include "dispatcher.hpp"

#include "../host/host_context.hpp"
#include "../operations/project_layout.hpp"
#include "../process/command_runner.hpp"
#include "../support/environment.hpp"

#include <iostream>

#ifndef RAWBUILD_VERSION
#define RAWBUILD_VERSION "0.1.0-local"
#endif

namespace rawbuild
{
namespace driver
{
    static void printVersion()
    {
        std::cout << "rawbuild " << RAWBUILD_VERSION << "\n";
    }
} // namespace driver
} // namespace rawbuild

int main(int argc, char** argv)
{
    using namespace rawbuild;

    auto result = driver::parseCommandLine(argc, argv);
    if (result.showHelp)
    {
        driver::printHelp(std::cout);
        return 0;
    }

    if (result.showVersion)
    {
        driver::printVersion();
        return 0;
    }

    operations::ProjectLayout layout;
    auto environment = Environment::capture();
    process::ProcessCommandRunner runner{std::cerr};

    host::HostProbeSettings probeSettings;
    probeSettings.interfaceVariable = layout.interfaceVariable;
    probeSettings.queryInterface = !result.options.dryRun;
    auto context = host::discoverHostContext(environment, runner, probeSettings);

    return driver::dispatch(result.options, context, layout, runner, std::cout, std::cerr);
}
