#include "command_invocation.hpp"

namespace rawbuild
{
namespace process
{
    std::string quoteIfNeeded(const std::string& value)
    {
        if (!value.empty() && value.find_first_of(" \"\t'$*?") == std::string::npos)
        {
            return value;
        }

        std::string quoted{"\""};
        for (char ch : value)
        {
            if (ch == '\\' || ch == '"' || ch == '$')
            {
                quoted.push_back('\\');
            }
            quoted.push_back(ch);
        }
        quoted.push_back('"');
        return quoted;
    }

    std::string formatInvocation(const CommandInvocation& invocation)
    {
        std::string result;
        for (const auto& [name, value] : invocation.environment)
        {
            result += name;
            result += "=";
            result += quoteIfNeeded(value);
            result += " ";
        }

        result += quoteIfNeeded(invocation.executable.string());
        for (const auto& argument : invocation.arguments)
        {
            result += " ";
            result += quoteIfNeeded(argument);
        }
        return result;
    }

    CommandInvocation elevateInvocation(const CommandInvocation& invocation,
        const std::filesystem::path& elevationUtility)
    {
        CommandInvocation elevated;
        elevated.executable = elevationUtility;

        for (const auto& [name, value] : invocation.environment)
        {
            elevated.arguments.emplace_back(name + "=" + value);
        }

        elevated.arguments.emplace_back(invocation.executable.string());
        for (const auto& argument : invocation.arguments)
        {
            elevated.arguments.emplace_back(argument);
        }

        return elevated;
    }
} // namespace process
} // namespace rawbuild
