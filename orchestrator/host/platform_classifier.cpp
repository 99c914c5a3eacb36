#include "platform_classifier.hpp"

#if !defined(_WIN32)
#    include <sys/utsname.h>
#    include <unistd.h>
#endif

namespace rawbuild
{
namespace host
{
    namespace
    {
        bool startsWith(std::string_view value, std::string_view prefix)
        {
            return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
        }
    } // namespace

    PlatformClass classifyPlatform(std::string_view operatingSystemName)
    {
        if (operatingSystemName == "Linux")
        {
            return PlatformClass::Linux;
        }

        if (operatingSystemName == "FreeBSD" || operatingSystemName == "Darwin")
        {
            return PlatformClass::BSDOrDarwin;
        }

        if (startsWith(operatingSystemName, "MINGW") || startsWith(operatingSystemName, "MSYS"))
        {
            return PlatformClass::WindowsCompat;
        }

        return PlatformClass::Unsupported;
    }

    std::string hostOperatingSystemName(const Environment& environment)
    {
#if defined(_WIN32)
        auto subsystem = environment.lookup("MSYSTEM");
        if (subsystem.has_value() && !subsystem->empty())
        {
            return *subsystem;
        }
        return "Windows_NT";
#else
        (void)environment;
        struct utsname systemInfo;
        if (::uname(&systemInfo) != 0)
        {
            return {};
        }
        return systemInfo.sysname;
#endif
    }

    bool isPrivilegedUser()
    {
#if defined(_WIN32)
        return false;
#else
        return ::geteuid() == 0;
#endif
    }

    const char* toString(PlatformClass platform)
    {
        switch (platform)
        {
        case PlatformClass::Linux:
            return "linux";
        case PlatformClass::BSDOrDarwin:
            return "bsd-or-darwin";
        case PlatformClass::WindowsCompat:
            return "windows-compat";
        case PlatformClass::Unsupported:
            return "unsupported";
        }
        return "unknown";
    }
} // namespace host
} // namespace rawbuild
