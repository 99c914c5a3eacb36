#pragma once

#include "operation_plan.hpp"
#include "project_layout.hpp"

#include "../toolchain/toolchain_config.hpp"

#include <filesystem>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rawbuild
{
namespace operations
{
    struct TestRunnerCommand
    {
        process::CommandInvocation invocation;
        // Set when the runner is the set of built test binaries rather than a command.
        std::optional<ArtifactPattern> artifacts;
    };

    class ToolchainStrategy
    {
    public:
        virtual ~ToolchainStrategy() = default;

        virtual const char* name() const = 0;

        virtual std::vector<PlanStep> build() const = 0;
        virtual std::vector<PlanStep> buildDocs() const = 0;
        virtual std::vector<PlanStep> buildTestArtifacts() const = 0;
        virtual std::vector<PlanStep> clean() const = 0;

        virtual TestRunnerCommand testRunner() const = 0;

        // Where the test binaries land; the target of capability grants.
        virtual ArtifactPattern testArtifacts() const = 0;
    };

    class PackageToolStrategy final : public ToolchainStrategy
    {
    public:
        PackageToolStrategy(std::filesystem::path packageTool, ProjectLayout layout, bool verbose);

        const char* name() const override;

        std::vector<PlanStep> build() const override;
        std::vector<PlanStep> buildDocs() const override;
        std::vector<PlanStep> buildTestArtifacts() const override;
        std::vector<PlanStep> clean() const override;

        TestRunnerCommand testRunner() const override;
        ArtifactPattern testArtifacts() const override;

    private:
        process::CommandInvocation subcommand(std::initializer_list<const char*> leading,
            std::initializer_list<const char*> trailing = {}) const;

        std::filesystem::path packageTool;
        ProjectLayout layout;
        std::vector<std::string> diagnosticFlags;
    };

    class DirectToolStrategy final : public ToolchainStrategy
    {
    public:
        DirectToolStrategy(const toolchain::ToolchainConfig& toolchain, ProjectLayout layout);

        const char* name() const override;

        std::vector<PlanStep> build() const override;
        std::vector<PlanStep> buildDocs() const override;
        std::vector<PlanStep> buildTestArtifacts() const override;
        std::vector<PlanStep> clean() const override;

        TestRunnerCommand testRunner() const override;
        ArtifactPattern testArtifacts() const override;

    private:
        std::optional<std::filesystem::path> directCompiler;
        std::optional<std::filesystem::path> docGenerator;
        ProjectLayout layout;
    };

    std::unique_ptr<ToolchainStrategy> selectToolchainStrategy(const toolchain::ToolchainConfig& toolchain,
        const ProjectLayout& layout,
        bool verbose);

    PlanStep makeMissingToolStep(const std::string& description, const std::string& toolName);
} // namespace operations
} // namespace rawbuild
