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

#include <filesystem>
#include <string>
#include <vector>

namespace paths
{
    // Maps a POSIX path to the string the host uses to address the same file.
    class translator
    {
    public:
        virtual ~translator() = default;

        // Throws errors::translation_error when the path cannot be resolved.
        [[nodiscard]] virtual std::string to_host(const std::filesystem::path &path) = 0;
    };

    // Runs an external utility, "wslpath -w" by default, with the absolute path appended as the last argument.
    class command_translator final : public translator
    {
        std::vector<std::string> _command;

    public:
        explicit command_translator(std::vector<std::string> command);

        [[nodiscard]] std::string to_host(const std::filesystem::path &path) override;
    };
}
