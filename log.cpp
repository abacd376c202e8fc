// This file is part of wsl-clip.
//
// wsl-clip is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// wsl-clip is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with wsl-clip.  If not, see <https://www.gnu.org/licenses/>.

#include "log.hpp"

#include <ctime>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <unistd.h>

#include "util.hpp"

namespace
{
    std::vector<std::string> &enabled_patterns()
    {
        static std::vector<std::string> patterns;
        return patterns;
    }

    std::string_view level_name(const logging::level lvl)
    {
        switch (lvl)
        {
        case logging::level::debug:
            return "DEBUG";
        case logging::level::info:
            return "INFO";
        case logging::level::warn:
            return "WARN";
        case logging::level::error:
            return "ERROR";
        default:
            throw std::logic_error("unknown log level");
        }
    }

    std::string_view level_color(const logging::level lvl)
    {
        switch (lvl)
        {
        case logging::level::debug:
            return "\033[1;35m";
        case logging::level::info:
            return "\033[1;34m";
        case logging::level::warn:
            return "\033[1;33m";
        case logging::level::error:
            return "\033[1;31m";
        default:
            throw std::logic_error("unknown log level");
        }
    }
}

void logging::enable(std::string_view pattern)
{
    util::trim_space(pattern);
    if (!pattern.empty())
    {
        enabled_patterns().emplace_back(pattern);
    }
}

void logging::enable_list(const std::string_view comma_separated)
{
    size_t start = 0;
    while (start <= comma_separated.size())
    {
        auto end = comma_separated.find(',', start);
        if (end == std::string_view::npos)
        {
            end = comma_separated.size();
        }
        enable(comma_separated.substr(start, end - start));
        start = end + 1;
    }
}

void logging::disable_all() { enabled_patterns().clear(); }

bool logging::is_enabled(const std::string_view ns)
{
    for (const auto &pattern : enabled_patterns())
    {
        if (pattern == "*" || pattern == ns)
        {
            return true;
        }
        if (pattern.ends_with('*') && ns.starts_with(std::string_view(pattern).substr(0, pattern.size() - 1)))
        {
            return true;
        }
    }
    return false;
}

void logging::write(const level lvl, const std::string_view ns, const std::string_view message)
{
    char stamp[16] = {};
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    if (localtime_r(&now, &local))
    {
        std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &local);
    }

    if (isatty(STDERR_FILENO))
    {
        std::cerr << std::format("\033[2m[{}]\033[0m {}{}\033[0m \033[1m{}\033[0m {}\n", stamp, level_color(lvl),
                                 level_name(lvl), ns, message);
    }
    else
    {
        std::cerr << std::format("[{}] {} {} {}\n", stamp, level_name(lvl), ns, message);
    }
}
