#include "toolchain_resolver.hpp"

#include <system_error>

#if !defined(_WIN32)
#    include <unistd.h>
#endif

namespace rawbuild
{
namespace toolchain
{
    namespace
    {
#if defined(_WIN32)
        constexpr char kSearchPathSeparator = ';';
#else
        constexpr char kSearchPathSeparator = ':';
#endif

        bool hasPathSeparator(const std::string& value)
        {
            return value.find('/') != std::string::npos || value.find('\\') != std::string::npos;
        }

        bool isExecutableFile(const std::filesystem::path& candidate)
        {
            std::error_code ec;
            auto status = std::filesystem::status(candidate, ec);
            if (ec || status.type() != std::filesystem::file_type::regular)
            {
                return false;
            }

#if defined(_WIN32)
            return true;
#else
            return ::access(candidate.c_str(), X_OK) == 0;
#endif
        }

        std::vector<std::string> executableExtensions(const Environment& environment)
        {
            std::vector<std::string> extensions{""};
#if defined(_WIN32)
            auto pathExt = environment.lookup("PATHEXT").value_or(".COM;.EXE;.BAT;.CMD");
            std::size_t start = 0;
            while (start <= pathExt.size())
            {
                auto end = pathExt.find(';', start);
                if (end == std::string::npos)
                {
                    end = pathExt.size();
                }
                if (end > start)
                {
                    extensions.push_back(pathExt.substr(start, end - start));
                }
                start = end + 1;
            }
#else
            (void)environment;
#endif
            return extensions;
        }
    } // namespace

    std::vector<std::filesystem::path> splitSearchPath(const std::string& value)
    {
        std::vector<std::filesystem::path> directories;
        std::size_t start = 0;
        while (start <= value.size())
        {
            auto end = value.find(kSearchPathSeparator, start);
            if (end == std::string::npos)
            {
                end = value.size();
            }

            // An empty entry means the current directory.
            if (end == start)
            {
                directories.emplace_back(".");
            }
            else
            {
                directories.emplace_back(value.substr(start, end - start));
            }
            start = end + 1;
        }
        return directories;
    }

    std::optional<std::filesystem::path> findExecutable(const std::string& name, const Environment& environment)
    {
        if (name.empty())
        {
            return std::nullopt;
        }

        const auto extensions = executableExtensions(environment);

        if (hasPathSeparator(name))
        {
            for (const auto& extension : extensions)
            {
                std::filesystem::path candidate{name + extension};
                if (isExecutableFile(candidate))
                {
                    return candidate;
                }
            }
            return std::nullopt;
        }

        auto searchPath = environment.lookup("PATH");
        if (!searchPath.has_value() || searchPath->empty())
        {
            return std::nullopt;
        }

        for (const auto& directory : splitSearchPath(*searchPath))
        {
            for (const auto& extension : extensions)
            {
                auto candidate = directory / (name + extension);
                if (isExecutableFile(candidate))
                {
                    return candidate;
                }
            }
        }

        return std::nullopt;
    }

    std::optional<std::filesystem::path> resolveTool(const ToolSearch& search, const Environment& environment)
    {
        if (!search.overrideVariable.empty())
        {
            auto overrideValue = environment.lookup(search.overrideVariable);
            if (overrideValue.has_value() && !overrideValue->empty())
            {
                return findExecutable(*overrideValue, environment);
            }
        }

        for (const auto& name : search.candidateNames)
        {
            if (auto path = findExecutable(name, environment))
            {
                return path;
            }
        }

        return std::nullopt;
    }

    ToolchainConfig resolveToolchain(const Environment& environment, const ToolchainSearch& search)
    {
        ToolchainConfig config;
        config.packageTool = resolveTool(search.packageTool, environment);
        config.directCompiler = resolveTool(search.directCompiler, environment);
        config.docGenerator = resolveTool(search.docGenerator, environment);
        config.cCompiler = resolveTool(search.cCompiler, environment);
        config.elevationUtility = resolveTool(search.elevationUtility, environment);
        return config;
    }
} // namespace toolchain
} // namespace rawbuild
