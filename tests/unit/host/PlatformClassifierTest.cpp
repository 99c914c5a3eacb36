#include "host/platform_classifier.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace rawbuild::host;

TEST(PlatformClassifierTest, ClassifiesLinux)
{
    EXPECT_EQ(classifyPlatform("Linux"), PlatformClass::Linux);
}

TEST(PlatformClassifierTest, ClassifiesFreeBsdAndDarwinTogether)
{
    EXPECT_EQ(classifyPlatform("FreeBSD"), PlatformClass::BSDOrDarwin);
    EXPECT_EQ(classifyPlatform("Darwin"), PlatformClass::BSDOrDarwin);
}

TEST(PlatformClassifierTest, ClassifiesWindowsCompatibilityLayersByPrefix)
{
    EXPECT_EQ(classifyPlatform("MINGW64_NT-10.0-19045"), PlatformClass::WindowsCompat);
    EXPECT_EQ(classifyPlatform("MINGW32_NT-6.1"), PlatformClass::WindowsCompat);
    EXPECT_EQ(classifyPlatform("MSYS_NT-10.0"), PlatformClass::WindowsCompat);
    EXPECT_EQ(classifyPlatform("MINGW"), PlatformClass::WindowsCompat);
}

TEST(PlatformClassifierTest, EverythingElseIsUnsupported)
{
    EXPECT_EQ(classifyPlatform(""), PlatformClass::Unsupported);
    EXPECT_EQ(classifyPlatform("OpenBSD"), PlatformClass::Unsupported);
    EXPECT_EQ(classifyPlatform("CYGWIN_NT-10.0"), PlatformClass::Unsupported);
    EXPECT_EQ(classifyPlatform("Windows_NT"), PlatformClass::Unsupported);
}

TEST(PlatformClassifierTest, MatchingIsCaseSensitiveAndExact)
{
    EXPECT_EQ(classifyPlatform("linux"), PlatformClass::Unsupported);
    EXPECT_EQ(classifyPlatform("Linux2"), PlatformClass::Unsupported);
    EXPECT_EQ(classifyPlatform("DarwinX"), PlatformClass::Unsupported);
    EXPECT_EQ(classifyPlatform("mingw64"), PlatformClass::Unsupported);
}

TEST(PlatformClassifierTest, NamesEveryClass)
{
    EXPECT_STREQ(toString(PlatformClass::Linux), "linux");
    EXPECT_STREQ(toString(PlatformClass::BSDOrDarwin), "bsd-or-darwin");
    EXPECT_STREQ(toString(PlatformClass::WindowsCompat), "windows-compat");
    EXPECT_STREQ(toString(PlatformClass::Unsupported), "unsupported");
}

#if defined(__linux__)
TEST(PlatformClassifierTest, HostNameOnLinuxClassifiesAsLinux)
{
    rawbuild::Environment environment;
    EXPECT_EQ(classifyPlatform(hostOperatingSystemName(environment)), PlatformClass::Linux);
}
#endif
