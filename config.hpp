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
#include <string_view>
#include <vector>

namespace config
{
    // Defaults for every invocation. Command-line flags take precedence over these.
    struct settings
    {
        bool strip_ansi = true;
        bool strip_control = true;
        bool crlf = false;
        bool code = false;
        bool header = true;
        // Extra extensions that always travel as file objects.
        std::vector<std::string> asset_extensions;
        std::vector<std::string> clip_command{"clip.exe"};
        std::string powershell = "powershell.exe";
        std::vector<std::string> path_translator{"wslpath", "-w"};
        // Logger namespaces to enable.
        std::vector<std::string> debug;
    };

    settings parse(std::string_view json);
    settings load_file(const std::filesystem::path &path);

    // Loads the explicit file when given, else the first existing default location, else the built-in defaults.
    settings load(const std::string &explicit_path);
}
