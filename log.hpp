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

#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace logging
{
    enum class level : int
    {
        debug,
        info,
        warn,
        error,
    };

    // Patterns are namespace names, "*" for everything, or a prefix ending in '*'.
    void enable(std::string_view pattern);
    void enable_list(std::string_view comma_separated);
    void disable_all();
    [[nodiscard]] bool is_enabled(std::string_view ns);

    void write(level lvl, std::string_view ns, std::string_view message);

    // Debug and info lines are printed only for enabled namespaces. Warnings and errors always are.
    class logger
    {
        std::string_view _ns;

        template <typename... Args>
        void emit(const level lvl, std::format_string<Args...> fmt, Args &&...args) const
        {
            if (lvl < level::warn && !is_enabled(_ns))
            {
                return;
            }
            write(lvl, _ns, std::format(fmt, std::forward<Args>(args)...));
        }

    public:
        explicit constexpr logger(const std::string_view ns) : _ns(ns) {}

        template <typename... Args>
        void debug(std::format_string<Args...> fmt, Args &&...args) const
        {
            emit(level::debug, fmt, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void info(std::format_string<Args...> fmt, Args &&...args) const
        {
            emit(level::info, fmt, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(std::format_string<Args...> fmt, Args &&...args) const
        {
            emit(level::warn, fmt, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(std::format_string<Args...> fmt, Args &&...args) const
        {
            emit(level::error, fmt, std::forward<Args>(args)...);
        }

        [[nodiscard]] bool enabled() const { return is_enabled(_ns); }
    };
}
