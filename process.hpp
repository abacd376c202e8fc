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
#include <optional>
#include <string>
#include <vector>

namespace process
{
    struct result
    {
        int exit_code = -1;
        std::string output;
    };

    // Runs argv[0] (searched on PATH) with exactly these arguments. No shell is involved, so nothing in argv is
    // ever interpreted. stdin is redirected from stdin_from when given, and stdout is captured when asked.
    // Throws std::system_error when the program cannot be started.
    result run(const std::vector<std::string> &argv, const std::optional<std::filesystem::path> &stdin_from,
               bool capture_output);
}
