#include "interface_discovery.hpp"

#include <cctype>
#include <vector>

namespace rawbuild
{
namespace host
{
    namespace
    {
        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        std::vector<std::string_view> splitLines(std::string_view text)
        {
            std::vector<std::string_view> lines;
            std::size_t start = 0;
            while (start < text.size())
            {
                auto end = text.find('\n', start);
                if (end == std::string_view::npos)
                {
                    end = text.size();
                }

                auto line = text.substr(start, end - start);
                if (!line.empty() && line.back() == '\r')
                {
                    line.remove_suffix(1);
                }
                lines.push_back(line);
                start = end + 1;
            }
            return lines;
        }

        // Header lines start in column zero: `en0: flags=8863<UP,BROADCAST,...> mtu 1500`.
        bool isHeaderLine(std::string_view line)
        {
            return !line.empty() && !std::isspace(static_cast<unsigned char>(line.front()))
                && line.find(':') != std::string_view::npos;
        }

        std::string_view headerInterfaceName(std::string_view line)
        {
            return trim(line.substr(0, line.find(':')));
        }

        bool isActiveStatusLine(std::string_view line)
        {
            auto content = trim(line);
            constexpr std::string_view statusKey = "status:";
            if (content.compare(0, statusKey.size(), statusKey) != 0)
            {
                return false;
            }
            return trim(content.substr(statusKey.size())) == "active";
        }
    } // namespace

    bool isLoopbackInterface(std::string_view name)
    {
        if (name.compare(0, 2, "lo") != 0)
        {
            return false;
        }

        auto suffix = name.substr(2);
        for (char ch : suffix)
        {
            if (!std::isdigit(static_cast<unsigned char>(ch)))
            {
                return suffix == "opback";
            }
        }
        return true;
    }

    std::string parseActiveInterface(std::string_view listing)
    {
        std::string_view currentInterface;
        for (auto line : splitLines(listing))
        {
            if (isHeaderLine(line))
            {
                currentInterface = headerInterfaceName(line);
                continue;
            }

            if (!isActiveStatusLine(line))
            {
                continue;
            }

            if (!currentInterface.empty() && !isLoopbackInterface(currentInterface))
            {
                return std::string{currentInterface};
            }
        }

        return {};
    }

    std::string discoverTestInterface(const Environment& environment,
        process::CommandRunner& runner,
        const std::string& overrideVariable)
    {
        if (!overrideVariable.empty())
        {
            auto overrideValue = environment.lookup(overrideVariable);
            if (overrideValue.has_value())
            {
                return *overrideValue;
            }
        }

        process::CommandInvocation query;
        query.executable = "ifconfig";

        auto captured = runner.capture(query);
        if (!captured.launched || captured.exitCode != 0)
        {
            return {};
        }

        return parseActiveInterface(captured.output);
    }
} // namespace host
} // namespace rawbuild
