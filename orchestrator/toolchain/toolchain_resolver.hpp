#pragma once

#include "toolchain_config.hpp"

#include "../support/environment.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rawbuild
{
namespace toolchain
{
    struct ToolSearch
    {
        std::string overrideVariable;
        std::vector<std::string> candidateNames;
    };

    // Defaults: cargo, rustc, rustdoc, clang then gcc, sudo.
    struct ToolchainSearch
    {
        ToolSearch packageTool{"CARGO", {"cargo"}};
        ToolSearch directCompiler{"RUSTC", {"rustc"}};
        ToolSearch docGenerator{"RUSTDOC", {"rustdoc"}};
        ToolSearch cCompiler{"CC", {"clang", "gcc"}};
        ToolSearch elevationUtility{"SUDO", {"sudo"}};
    };

    std::vector<std::filesystem::path> splitSearchPath(const std::string& value);

    std::optional<std::filesystem::path> findExecutable(const std::string& name, const Environment& environment);

    std::optional<std::filesystem::path> resolveTool(const ToolSearch& search, const Environment& environment);

    ToolchainConfig resolveToolchain(const Environment& environment, const ToolchainSearch& search = {});
} // namespace toolchain
} // namespace rawbuild
