#include "dispatcher.hpp"

#include "../operations/operation_planner.hpp"
#include "../operations/plan_executor.hpp"

#include <ostream>
#include <system_error>

namespace rawbuild
{
namespace driver
{
    namespace
    {
        void printTool(std::ostream& out, const char* label, const std::optional<std::filesystem::path>& tool)
        {
            out << "[rawbuild] " << label << ": " << (tool.has_value() ? tool->string() : std::string{"absent"})
                << "\n";
        }
    } // namespace

    bool prepareOutputDirectories(const operations::ProjectLayout& layout, std::ostream& err)
    {
        for (const auto& directory : {layout.docDirectory(), layout.benchmarkDirectory()})
        {
            std::error_code ec;
            std::filesystem::create_directories(directory, ec);
            if (ec)
            {
                err << "rawbuild: failed to create directory '" << directory.string() << "': " << ec.message()
                    << "\n";
                return false;
            }
        }
        return true;
    }

    void printHostSummary(const host::HostContext& context, const char* strategyName, std::ostream& out)
    {
        out << "[rawbuild] platform: " << (context.operatingSystemName.empty() ? "unknown" : context.operatingSystemName)
            << " (" << host::toString(context.platform) << ")\n";
        out << "[rawbuild] toolchain strategy: " << strategyName << "\n";
        printTool(out, "package tool", context.toolchain.packageTool);
        printTool(out, "direct compiler", context.toolchain.directCompiler);
        printTool(out, "doc generator", context.toolchain.docGenerator);
        printTool(out, "C compiler", context.toolchain.cCompiler);
        printTool(out, "elevation utility", context.toolchain.elevationUtility);
        out << "[rawbuild] test interface: "
            << (context.testInterface.empty() ? std::string{"(none)"} : context.testInterface) << "\n";
    }

    int dispatch(const CommandLineOptions& options,
        const host::HostContext& context,
        const operations::ProjectLayout& layout,
        process::CommandRunner& runner,
        std::ostream& out,
        std::ostream& err)
    {
        operations::OperationPlanner planner{context, layout};
        auto plan = planner.plan(options.operation);

        if (context.verbose)
        {
            printHostSummary(context, planner.strategy().name(), out);
            if (!options.verb.empty() && !options.verbRecognized)
            {
                out << "[rawbuild] unrecognised verb '" << options.verb << "'; running build.\n";
            }
        }

        if (options.dryRun)
        {
            operations::printPlan(plan, out);
            out << "[rawbuild] dry run: no commands were run.\n";
            return 0;
        }

        if (!prepareOutputDirectories(layout, err))
        {
            return 1;
        }

        operations::PlanExecutor executor{runner, out, err, context.verbose};
        return executor.execute(plan);
    }
} // namespace driver
} // namespace rawbuild
