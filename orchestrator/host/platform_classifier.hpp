#pragma once

#include "../support/environment.hpp"

#include <string>
#include <string_view>

namespace rawbuild
{
namespace host
{
    enum class PlatformClass
    {
        Linux,
        BSDOrDarwin,
        WindowsCompat,
        Unsupported,
    };

    PlatformClass classifyPlatform(std::string_view operatingSystemName);

    // Equivalent of `uname -s`.
    std::string hostOperatingSystemName(const Environment& environment);

    bool isPrivilegedUser();

    const char* toString(PlatformClass platform);
} // namespace host
} // namespace rawbuild
