#pragma once

#include "platform_classifier.hpp"

#include "../process/command_runner.hpp"
#include "../support/environment.hpp"
#include "../toolchain/toolchain_config.hpp"

#include <string>

namespace rawbuild
{
namespace host
{
    // Everything probed from the host before dispatch. Read-only afterwards.
    struct HostContext
    {
        toolchain::ToolchainConfig toolchain;
        PlatformClass platform{PlatformClass::Unsupported};
        std::string operatingSystemName;
        std::string testInterface;
        bool verbose{false};
        bool privilegedUser{false};
    };

    struct HostProbeSettings
    {
        std::string verbosityVariable{"VERBOSE"};
        std::string interfaceVariable{"PNET_TEST_IFACE"};
        // When false only the override variable names the interface; ifconfig is not run.
        bool queryInterface{true};
    };

    bool isVerboseRequested(const Environment& environment, const std::string& verbosityVariable);

    HostContext discoverHostContext(const Environment& environment,
        process::CommandRunner& runner,
        const HostProbeSettings& settings);
} // namespace host
} // namespace rawbuild
