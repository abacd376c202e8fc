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

#include <stdexcept>
#include <string>

namespace errors
{
    namespace exit_code
    {
        constexpr int AMBIGUOUS_INPUT = 2;
        constexpr int UNREADABLE_INPUT = 3;
        constexpr int IO = 4;
        constexpr int TRANSLATION = 5;
        constexpr int EXTERNAL_SETTER = 6;
        constexpr int CONFIG = 7;
    }

    // Every failure aborts the invocation. Nothing is retried because setting the clipboard is not safe to repeat.
    class error : public std::runtime_error
    {
        int _exit_code;

    public:
        error(const std::string &what, const int exit_code) : std::runtime_error(what), _exit_code(exit_code) {}

        [[nodiscard]] int exit_code() const { return _exit_code; }
    };

    class ambiguous_input_error : public error
    {
    public:
        explicit ambiguous_input_error(const std::string &what) : error(what, exit_code::AMBIGUOUS_INPUT) {}
    };

    class unreadable_input_error : public error
    {
    public:
        explicit unreadable_input_error(const std::string &what) : error(what, exit_code::UNREADABLE_INPUT) {}
    };

    class io_error : public error
    {
    public:
        explicit io_error(const std::string &what) : error(what, exit_code::IO) {}
    };

    class translation_error : public error
    {
    public:
        explicit translation_error(const std::string &what) : error(what, exit_code::TRANSLATION) {}
    };

    class external_setter_error : public error
    {
    public:
        explicit external_setter_error(const std::string &what) : error(what, exit_code::EXTERNAL_SETTER) {}
    };

    class config_error : public error
    {
    public:
        explicit config_error(const std::string &what) : error(what, exit_code::CONFIG) {}
    };
}
