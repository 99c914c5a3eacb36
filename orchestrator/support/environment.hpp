#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rawbuild
{
    class Environment
    {
    public:
        Environment() = default;

        static Environment capture();

        std::optional<std::string> lookup(std::string_view name) const;
        bool equals(std::string_view name, std::string_view value) const;

        void set(std::string name, std::string value);

    private:
        std::map<std::string, std::string, std::less<>> variables;
    };
} // namespace rawbuild
