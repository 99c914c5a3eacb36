#pragma once

#include "command_line.hpp"

#include "../host/host_context.hpp"
#include "../operations/project_layout.hpp"
#include "../process/command_runner.hpp"

#include <iosfwd>

namespace rawbuild
{
namespace driver
{
    // Creates `<out>/doc` and `<out>/benches`. Idempotent.
    bool prepareOutputDirectories(const operations::ProjectLayout& layout, std::ostream& err);

    void printHostSummary(const host::HostContext& context, const char* strategyName, std::ostream& out);

    int dispatch(const CommandLineOptions& options,
        const host::HostContext& context,
        const operations::ProjectLayout& layout,
        process::CommandRunner& runner,
        std::ostream& out,
        std::ostream& err);
} // namespace driver
} // namespace rawbuild
