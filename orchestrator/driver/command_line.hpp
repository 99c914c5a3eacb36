#pragma once

#include "../operations/operation_plan.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace rawbuild
{
namespace driver
{
    struct CommandLineOptions
    {
        operations::Operation operation{operations::Operation::Build};
        std::string verb;
        bool verbRecognized{false};
        bool dryRun{false};
    };

    struct CommandLineParseResult
    {
        CommandLineOptions options;
        bool showHelp{false};
        bool showVersion{false};
    };

    std::optional<operations::Operation> parseVerb(std::string_view verb);

    // Never fails: the first argument that is not an option is the verb, and an unrecognized
    // or absent verb selects the build operation.
    CommandLineParseResult parseCommandLine(int argc, char** argv);

    void printHelp(std::ostream& out);
} // namespace driver
} // namespace rawbuild
