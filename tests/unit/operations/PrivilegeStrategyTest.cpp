#include "operations/privilege_strategy.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace rawbuild;
using namespace rawbuild::operations;

namespace
{
    using EnvironmentList = std::vector<std::pair<std::string, std::string>>;

    host::HostContext createContext(host::PlatformClass platform, const std::string& operatingSystemName)
    {
        host::HostContext context;
        context.toolchain.packageTool = std::filesystem::path{"/opt/cargo/bin/cargo"};
        context.toolchain.elevationUtility = std::filesystem::path{"/usr/bin/sudo"};
        context.platform = platform;
        context.operatingSystemName = operatingSystemName;
        context.testInterface = "en0";
        return context;
    }

    bool containsVariable(const EnvironmentList& environment, const std::string& name)
    {
        return std::any_of(environment.begin(), environment.end(), [&](const auto& entry) {
            return entry.first == name;
        });
    }

    std::size_t countKind(const std::vector<PlanStep>& steps, StepKind kind)
    {
        return static_cast<std::size_t>(std::count_if(steps.begin(), steps.end(), [kind](const PlanStep& step) {
            return step.kind == kind;
        }));
    }
}

TEST(PrivilegeStrategyTest, SelectsModelPerPlatform)
{
    EXPECT_EQ(selectPrivilegeModel(host::PlatformClass::Linux), PrivilegeModel::CapabilityGrant);
    EXPECT_EQ(selectPrivilegeModel(host::PlatformClass::BSDOrDarwin), PrivilegeModel::ElevatedRun);
    EXPECT_EQ(selectPrivilegeModel(host::PlatformClass::WindowsCompat), PrivilegeModel::Unelevated);
    EXPECT_EQ(selectPrivilegeModel(host::PlatformClass::Unsupported), PrivilegeModel::Unsupported);
    EXPECT_STREQ(toString(PrivilegeModel::CapabilityGrant), "capability-grant");
}

TEST(PrivilegeStrategyTest, TestEnvironmentPinsParallelism)
{
    ProjectLayout layout;

    auto environment = testEnvironment(layout, "en0", true);

    ASSERT_EQ(environment.size(), 3u);
    EXPECT_EQ(environment[0], (std::pair<std::string, std::string>{"PNET_TEST_IFACE", "en0"}));
    EXPECT_EQ(environment[1], (std::pair<std::string, std::string>{"RUST_TEST_TASKS", "1"}));
    EXPECT_EQ(environment[2], (std::pair<std::string, std::string>{"RUST_TEST_THREADS", "1"}));
}

TEST(PrivilegeStrategyTest, EmptyInterfaceIsNotExported)
{
    ProjectLayout layout;

    auto environment = testEnvironment(layout, "", true);

    EXPECT_FALSE(containsVariable(environment, "PNET_TEST_IFACE"));
    EXPECT_TRUE(containsVariable(environment, "RUST_TEST_TASKS"));
}

TEST(PrivilegeStrategyTest, LinuxGrantsCapabilityThenRunsUnelevated)
{
    ProjectLayout layout;
    auto context = createContext(host::PlatformClass::Linux, "Linux");
    PackageToolStrategy strategy{*context.toolchain.packageTool, layout, false};

    auto steps = planPrivilegedTestRun(context, strategy, layout);

    ASSERT_EQ(steps.size(), 2u);
    ASSERT_EQ(steps[0].kind, StepKind::GrantCapability);
    EXPECT_EQ(steps[0].capability, "cap_net_raw+ep");
    ASSERT_TRUE(steps[0].elevationUtility.has_value());
    EXPECT_EQ(*steps[0].elevationUtility, std::filesystem::path{"/usr/bin/sudo"});
    ASSERT_TRUE(steps[0].artifacts.has_value());
    EXPECT_EQ(steps[0].artifacts->directory, std::filesystem::path{"target"} / "debug" / "deps");
    EXPECT_EQ(steps[0].artifacts->prefix, "pnet-");

    ASSERT_EQ(steps[1].kind, StepKind::RunTestRunner);
    EXPECT_FALSE(steps[1].elevationUtility.has_value());
    EXPECT_FALSE(containsVariable(steps[1].invocation.environment, "PNET_TEST_IFACE"));
    EXPECT_TRUE(containsVariable(steps[1].invocation.environment, "RUST_TEST_TASKS"));
    EXPECT_TRUE(containsVariable(steps[1].invocation.environment, "RUST_TEST_THREADS"));
}

TEST(PrivilegeStrategyTest, LinuxAsPrivilegedUserSkipsGrant)
{
    ProjectLayout layout;
    auto context = createContext(host::PlatformClass::Linux, "Linux");
    context.privilegedUser = true;
    context.toolchain.elevationUtility.reset();
    PackageToolStrategy strategy{*context.toolchain.packageTool, layout, false};

    auto steps = planPrivilegedTestRun(context, strategy, layout);

    ASSERT_EQ(steps.size(), 1u);
    EXPECT_EQ(steps[0].kind, StepKind::RunTestRunner);
}

TEST(PrivilegeStrategyTest, LinuxWithoutElevationUtilityFails)
{
    ProjectLayout layout;
    auto context = createContext(host::PlatformClass::Linux, "Linux");
    context.toolchain.elevationUtility.reset();
    PackageToolStrategy strategy{*context.toolchain.packageTool, layout, false};

    auto steps = planPrivilegedTestRun(context, strategy, layout);

    ASSERT_EQ(steps.size(), 1u);
    EXPECT_EQ(steps[0].kind, StepKind::Fail);
    EXPECT_EQ(steps[0].exitCode, 127);
    EXPECT_NE(steps[0].message.find("sudo"), std::string::npos);
}

TEST(PrivilegeStrategyTest, LinuxDirectModeTargetsOutputDirectoryArtifacts)
{
    ProjectLayout layout;
    auto context = createContext(host::PlatformClass::Linux, "Linux");
    context.toolchain.packageTool.reset();
    DirectToolStrategy strategy{context.toolchain, layout};

    auto steps = planPrivilegedTestRun(context, strategy, layout);

    ASSERT_EQ(steps.size(), 2u);
    ASSERT_TRUE(steps[0].artifacts.has_value());
    EXPECT_EQ(steps[0].artifacts->directory, std::filesystem::path{"target"});
    ASSERT_TRUE(steps[1].artifacts.has_value());
    EXPECT_EQ(steps[1].artifacts->directory, std::filesystem::path{"target"});
    EXPECT_EQ(steps[1].artifacts->prefix, "pnet-");
}

TEST(PrivilegeStrategyTest, BsdOrDarwinRunsWholeRunnerElevated)
{
    ProjectLayout layout;
    auto context = createContext(host::PlatformClass::BSDOrDarwin, "Darwin");
    PackageToolStrategy strategy{*context.toolchain.packageTool, layout, false};

    auto steps = planPrivilegedTestRun(context, strategy, layout);

    ASSERT_EQ(steps.size(), 1u);
    ASSERT_EQ(steps[0].kind, StepKind::RunTestRunner);
    ASSERT_TRUE(steps[0].elevationUtility.has_value());
    EXPECT_EQ(*steps[0].elevationUtility, std::filesystem::path{"/usr/bin/sudo"});
    EXPECT_TRUE(containsVariable(steps[0].invocation.environment, "PNET_TEST_IFACE"));
    EXPECT_EQ(describeStep(steps[0]),
        "/usr/bin/sudo PNET_TEST_IFACE=en0 RUST_TEST_TASKS=1 RUST_TEST_THREADS=1 /opt/cargo/bin/cargo test");
}

TEST(PrivilegeStrategyTest, BsdOrDarwinWithoutElevationUtilityFails)
{
    ProjectLayout layout;
    auto context = createContext(host::PlatformClass::BSDOrDarwin, "FreeBSD");
    context.toolchain.elevationUtility.reset();
    PackageToolStrategy strategy{*context.toolchain.packageTool, layout, false};

    auto steps = planPrivilegedTestRun(context, strategy, layout);

    ASSERT_EQ(steps.size(), 1u);
    EXPECT_EQ(steps[0].kind, StepKind::Fail);
    EXPECT_EQ(steps[0].exitCode, 127);
}

TEST(PrivilegeStrategyTest, WindowsCompatRunsDirectlyWithInterface)
{
    ProjectLayout layout;
    auto context = createContext(host::PlatformClass::WindowsCompat, "MINGW64_NT-10.0");
    context.toolchain.elevationUtility.reset();
    PackageToolStrategy strategy{*context.toolchain.packageTool, layout, false};

    auto steps = planPrivilegedTestRun(context, strategy, layout);

    ASSERT_EQ(steps.size(), 1u);
    ASSERT_EQ(steps[0].kind, StepKind::RunTestRunner);
    EXPECT_FALSE(steps[0].elevationUtility.has_value());
    EXPECT_TRUE(containsVariable(steps[0].invocation.environment, "PNET_TEST_IFACE"));
}

TEST(PrivilegeStrategyTest, UnsupportedPlatformNeverRunsTests)
{
    ProjectLayout layout;
    auto context = createContext(host::PlatformClass::Unsupported, "SunOS");
    PackageToolStrategy strategy{*context.toolchain.packageTool, layout, false};

    auto steps = planPrivilegedTestRun(context, strategy, layout);

    EXPECT_EQ(countKind(steps, StepKind::RunTestRunner), 0u);
    EXPECT_EQ(countKind(steps, StepKind::GrantCapability), 0u);
    ASSERT_EQ(steps.size(), 1u);
    EXPECT_EQ(steps[0].kind, StepKind::Fail);
    EXPECT_EQ(steps[0].exitCode, 1);
    EXPECT_NE(steps[0].message.find("unsupported testing platform 'SunOS'"), std::string::npos);
}
