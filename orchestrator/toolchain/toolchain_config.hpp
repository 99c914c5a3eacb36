#pragma once

#include <filesystem>
#include <optional>

namespace rawbuild
{
namespace toolchain
{
    struct ToolchainConfig
    {
        std::optional<std::filesystem::path> packageTool;
        std::optional<std::filesystem::path> directCompiler;
        std::optional<std::filesystem::path> docGenerator;
        std::optional<std::filesystem::path> cCompiler;
        std::optional<std::filesystem::path> elevationUtility;

        bool hasPackageTool() const
        {
            return packageTool.has_value();
        }
    };
} // namespace toolchain
} // namespace rawbuild
