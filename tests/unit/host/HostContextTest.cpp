#include "host/host_context.hpp"

#include "support/RecordingCommandRunner.hpp"

#include <gtest/gtest.h>

using namespace rawbuild;
using namespace rawbuild::host;
using rawbuild::test_support::RecordingCommandRunner;

TEST(HostContextTest, VerboseOnlyWhenExactlyOne)
{
    Environment environment;
    EXPECT_FALSE(isVerboseRequested(environment, "VERBOSE"));

    environment.set("VERBOSE", "1");
    EXPECT_TRUE(isVerboseRequested(environment, "VERBOSE"));

    for (const char* value : {"0", "true", "yes", "01", ""})
    {
        environment.set("VERBOSE", value);
        EXPECT_FALSE(isVerboseRequested(environment, "VERBOSE")) << "VERBOSE=" << value;
    }
}

TEST(HostContextTest, DiscoversEverythingOnce)
{
    Environment environment;
    environment.set("PATH", "");
    environment.set("VERBOSE", "1");
    RecordingCommandRunner runner;
    runner.captureResult.launched = true;
    runner.captureResult.output = "eth1: flags=4163<UP,BROADCAST,RUNNING,MULTICAST>  mtu 1500\n"
                                  "        status: active\n";

    auto context = discoverHostContext(environment, runner, HostProbeSettings{});

    EXPECT_FALSE(context.toolchain.hasPackageTool());
    EXPECT_FALSE(context.toolchain.elevationUtility.has_value());
    EXPECT_EQ(context.testInterface, "eth1");
    EXPECT_TRUE(context.verbose);
    EXPECT_EQ(context.platform, classifyPlatform(context.operatingSystemName));
    EXPECT_EQ(runner.captures.size(), 1u);
    EXPECT_TRUE(runner.invocations.empty());
}

TEST(HostContextTest, InterfaceVariableIsConfigurable)
{
    Environment environment;
    environment.set("RAWSOCK_IFACE", "wlan0");
    RecordingCommandRunner runner;
    HostProbeSettings settings;
    settings.interfaceVariable = "RAWSOCK_IFACE";

    auto context = discoverHostContext(environment, runner, settings);

    EXPECT_EQ(context.testInterface, "wlan0");
    EXPECT_FALSE(context.verbose);
    EXPECT_TRUE(runner.captures.empty());
}

TEST(HostContextTest, InterfaceQueryCanBeSkipped)
{
    Environment environment;
    RecordingCommandRunner runner;
    runner.captureResult.launched = true;
    runner.captureResult.output = "en0: flags=8863<UP,BROADCAST,RUNNING> mtu 1500\n"
                                  "\tstatus: active\n";
    HostProbeSettings settings;
    settings.queryInterface = false;

    auto context = discoverHostContext(environment, runner, settings);

    EXPECT_TRUE(context.testInterface.empty());
    EXPECT_TRUE(runner.captures.empty());

    environment.set("PNET_TEST_IFACE", "bridge0");
    EXPECT_EQ(discoverHostContext(environment, runner, settings).testInterface, "bridge0");
    EXPECT_TRUE(runner.captures.empty());
}
