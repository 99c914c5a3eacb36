#pragma once

#include "../process/command_runner.hpp"
#include "../support/environment.hpp"

#include <string>
#include <string_view>

namespace rawbuild
{
namespace host
{
    // Returns the interface owning the first `status: active` block of an ifconfig listing,
    // skipping loopback interfaces. Returns an empty string when nothing qualifies.
    std::string parseActiveInterface(std::string_view listing);

    bool isLoopbackInterface(std::string_view name);

    // Best effort: an interface already named by `overrideVariable` wins, otherwise ifconfig is
    // queried. Any failure produces an empty name.
    std::string discoverTestInterface(const Environment& environment,
        process::CommandRunner& runner,
        const std::string& overrideVariable);
} // namespace host
} // namespace rawbuild
