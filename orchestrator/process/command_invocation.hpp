#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace rawbuild
{
namespace process
{
    struct CommandInvocation
    {
        std::filesystem::path executable;
        std::vector<std::string> arguments;
        // Applied on top of the inherited environment of the child.
        std::vector<std::pair<std::string, std::string>> environment;
    };

    std::string quoteIfNeeded(const std::string& value);

    // Shell-like rendering: `VAR=value executable arguments...`.
    std::string formatInvocation(const CommandInvocation& invocation);

    // Wraps the invocation so it runs through the elevation utility. The environment overrides
    // become `VAR=value` arguments because the utility resets the child environment.
    CommandInvocation elevateInvocation(const CommandInvocation& invocation,
        const std::filesystem::path& elevationUtility);
} // namespace process
} // namespace rawbuild
