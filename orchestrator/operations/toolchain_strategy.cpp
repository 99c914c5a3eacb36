#include "toolchain_strategy.hpp"

#include "../process/command_runner.hpp"

#include <utility>

namespace rawbuild
{
namespace operations
{
    PlanStep makeMissingToolStep(const std::string& description, const std::string& toolName)
    {
        return makeFailureStep(description + " '" + toolName + "' was not found on PATH.",
            process::kLaunchFailureExitCode);
    }

    PackageToolStrategy::PackageToolStrategy(std::filesystem::path packageTool, ProjectLayout layout, bool verbose)
        : packageTool(std::move(packageTool))
        , layout(std::move(layout))
    {
        if (verbose)
        {
            diagnosticFlags.emplace_back("--verbose");
        }
    }

    const char* PackageToolStrategy::name() const
    {
        return "package-tool";
    }

    process::CommandInvocation PackageToolStrategy::subcommand(std::initializer_list<const char*> leading,
        std::initializer_list<const char*> trailing) const
    {
        process::CommandInvocation invocation;
        invocation.executable = packageTool;
        for (const auto* argument : leading)
        {
            invocation.arguments.emplace_back(argument);
        }
        for (const auto& flag : diagnosticFlags)
        {
            invocation.arguments.push_back(flag);
        }
        for (const auto* argument : trailing)
        {
            invocation.arguments.emplace_back(argument);
        }
        return invocation;
    }

    std::vector<PlanStep> PackageToolStrategy::build() const
    {
        return {makeCommandStep(subcommand({"build"}, {"--release"}))};
    }

    std::vector<PlanStep> PackageToolStrategy::buildDocs() const
    {
        return {makeCommandStep(subcommand({"doc"}))};
    }

    std::vector<PlanStep> PackageToolStrategy::buildTestArtifacts() const
    {
        return {
            makeCommandStep(subcommand({"test", "--no-run"})),
            makeCommandStep(subcommand({"bench", "--no-run"})),
        };
    }

    std::vector<PlanStep> PackageToolStrategy::clean() const
    {
        return {makeCommandStep(subcommand({"clean"}))};
    }

    TestRunnerCommand PackageToolStrategy::testRunner() const
    {
        TestRunnerCommand runner;
        runner.invocation = subcommand({"test"});
        return runner;
    }

    ArtifactPattern PackageToolStrategy::testArtifacts() const
    {
        return ArtifactPattern{layout.outputDirectory / "debug" / "deps", layout.artifactPrefix()};
    }

    DirectToolStrategy::DirectToolStrategy(const toolchain::ToolchainConfig& toolchain, ProjectLayout layout)
        : directCompiler(toolchain.directCompiler)
        , docGenerator(toolchain.docGenerator)
        , layout(std::move(layout))
    {
    }

    const char* DirectToolStrategy::name() const
    {
        return "direct-tool";
    }

    std::vector<PlanStep> DirectToolStrategy::build() const
    {
        if (!directCompiler.has_value())
        {
            return {makeMissingToolStep("direct compiler", "rustc")};
        }

        process::CommandInvocation invocation;
        invocation.executable = *directCompiler;
        invocation.arguments = {
            "-O",
            layout.entrySource.string(),
            "--crate-name",
            layout.libraryName,
            "--out-dir",
            layout.releaseDirectory().string(),
        };
        return {makeCommandStep(std::move(invocation))};
    }

    std::vector<PlanStep> DirectToolStrategy::buildDocs() const
    {
        if (!docGenerator.has_value())
        {
            return {makeMissingToolStep("documentation generator", "rustdoc")};
        }

        process::CommandInvocation invocation;
        invocation.executable = *docGenerator;
        invocation.arguments = {
            layout.entrySource.string(),
            "-o",
            layout.docDirectory().string(),
            "--crate-name",
            layout.libraryName,
        };
        return {makeCommandStep(std::move(invocation))};
    }

    std::vector<PlanStep> DirectToolStrategy::buildTestArtifacts() const
    {
        if (!directCompiler.has_value())
        {
            return {makeMissingToolStep("direct compiler", "rustc")};
        }

        process::CommandInvocation invocation;
        invocation.executable = *directCompiler;
        invocation.arguments = {
            layout.entrySource.string(),
            "--crate-name",
            layout.libraryName,
            "--test",
            "--out-dir",
            layout.outputDirectory.string(),
            "-C",
            "extra-filename=" + layout.directArtifactSuffix,
        };
        return {makeCommandStep(std::move(invocation))};
    }

    std::vector<PlanStep> DirectToolStrategy::clean() const
    {
        return {makeRemoveDirectoryStep(layout.outputDirectory)};
    }

    TestRunnerCommand DirectToolStrategy::testRunner() const
    {
        TestRunnerCommand runner;
        runner.artifacts = testArtifacts();
        return runner;
    }

    ArtifactPattern DirectToolStrategy::testArtifacts() const
    {
        return ArtifactPattern{layout.outputDirectory, layout.artifactPrefix()};
    }

    std::unique_ptr<ToolchainStrategy> selectToolchainStrategy(const toolchain::ToolchainConfig& toolchain,
        const ProjectLayout& layout,
        bool verbose)
    {
        if (toolchain.hasPackageTool())
        {
            return std::make_unique<PackageToolStrategy>(*toolchain.packageTool, layout, verbose);
        }

        return std::make_unique<DirectToolStrategy>(toolchain, layout);
    }
} // namespace operations
} // namespace rawbuild
