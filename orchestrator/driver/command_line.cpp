#include "command_line.hpp"

#include <ostream>

namespace rawbuild
{
namespace driver
{
    std::optional<operations::Operation> parseVerb(std::string_view verb)
    {
        if (verb == "test")
        {
            return operations::Operation::RunTests;
        }
        if (verb == "doc")
        {
            return operations::Operation::BuildDocs;
        }
        if (verb == "clean")
        {
            return operations::Operation::Clean;
        }
        if (verb == "benchmarks")
        {
            return operations::Operation::BuildBenchmarks;
        }
        return std::nullopt;
    }

    CommandLineParseResult parseCommandLine(int argc, char** argv)
    {
        CommandLineParseResult result;
        bool verbSeen = false;

        for (int index = 1; index < argc; ++index)
        {
            std::string_view argument{argv[index]};

            if (argument == "--help" || argument == "-h")
            {
                result.showHelp = true;
                return result;
            }

            if (argument == "--version")
            {
                result.showVersion = true;
                return result;
            }

            if (argument == "--dry-run")
            {
                result.options.dryRun = true;
                continue;
            }

            if (verbSeen)
            {
                continue;
            }

            verbSeen = true;
            result.options.verb = std::string{argument};
            if (auto operation = parseVerb(argument))
            {
                result.options.operation = *operation;
                result.options.verbRecognized = true;
            }
        }

        return result;
    }

    void printHelp(std::ostream& out)
    {
        out << "rawbuild - build and test orchestrator for raw-socket libraries\n"
               "Usage: rawbuild [options] [verb]\n\n"
               "Verbs:\n"
               "  (none)        Build the library in release mode.\n"
               "  test          Build the test artifacts, set up privileges and run the tests.\n"
               "  doc           Generate the API documentation.\n"
               "  clean         Remove build output.\n"
               "  benchmarks    Build the native and library benchmarks.\n"
               "  Any other verb builds the library.\n\n"
               "Options:\n"
               "  -h, --help    Show this help text and exit.\n"
               "  --version     Show version information and exit.\n"
               "  --dry-run     Print the planned commands without running them or probing\n"
               "                the network interfaces.\n\n"
               "Environment:\n"
               "  VERBOSE=1           Pass --verbose to the package tool and trace commands.\n"
               "  PNET_TEST_IFACE     Interface handed to the raw-socket tests (detected when unset).\n"
               "  CARGO, RUSTC, RUSTDOC, CC, SUDO\n"
               "                      Override the tool looked up on PATH.\n";
    }
} // namespace driver
} // namespace rawbuild
