#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace rawbuild
{
namespace operations
{
    struct ProjectLayout
    {
        std::filesystem::path entrySource{"src/lib.rs"};
        std::filesystem::path outputDirectory{"target"};
        std::string libraryName{"pnet"};
        std::string directArtifactSuffix{"-no-cargo"};
        std::filesystem::path benchmarkSourceDirectory{"benches"};
        std::vector<std::string> nativeBenchmarks{"c_receiver", "c_sender"};
        std::vector<std::string> libraryBenchmarks{"rs_receiver", "rs_sender"};
        std::string interfaceVariable{"PNET_TEST_IFACE"};
        std::vector<std::string> parallelismVariables{"RUST_TEST_TASKS", "RUST_TEST_THREADS"};
        std::string rawSocketCapability{"cap_net_raw+ep"};
        // The native benchmark sources only build on this OS.
        std::string nativeBenchmarkPlatform{"Darwin"};

        std::filesystem::path docDirectory() const
        {
            return outputDirectory / "doc";
        }

        std::filesystem::path benchmarkDirectory() const
        {
            return outputDirectory / "benches";
        }

        std::filesystem::path releaseDirectory() const
        {
            return outputDirectory / "release";
        }

        std::string artifactPrefix() const
        {
            return libraryName + "-";
        }
    };
} // namespace operations
} // namespace rawbuild
