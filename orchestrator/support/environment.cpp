#include "environment.hpp"

#include <utility>

#if defined(_WIN32)
#    include <stdlib.h>
#else
extern char** environ;
#endif

namespace rawbuild
{
    Environment Environment::capture()
    {
        Environment environment;
#if defined(_WIN32)
        char** entries = _environ;
#else
        char** entries = environ;
#endif
        if (entries == nullptr)
        {
            return environment;
        }

        for (; *entries != nullptr; ++entries)
        {
            std::string_view entry{*entries};
            auto separator = entry.find('=');
            if (separator == std::string_view::npos || separator == 0)
            {
                continue;
            }

            environment.set(std::string{entry.substr(0, separator)}, std::string{entry.substr(separator + 1)});
        }

        return environment;
    }

    std::optional<std::string> Environment::lookup(std::string_view name) const
    {
        auto found = variables.find(name);
        if (found == variables.end())
        {
            return std::nullopt;
        }
        return found->second;
    }

    bool Environment::equals(std::string_view name, std::string_view value) const
    {
        auto found = variables.find(name);
        return found != variables.end() && found->second == value;
    }

    void Environment::set(std::string name, std::string value)
    {
        variables[std::move(name)] = std::move(value);
    }
} // namespace rawbuild
