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
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "paths.hpp"
#include "payload.hpp"

namespace clipboard
{
    // Host programs doing the actual clipboard work.
    struct commands
    {
        std::vector<std::string> clip{"clip.exe"};
        std::string powershell = "powershell.exe";
    };

    enum class host_action : int
    {
        set_images,
        set_file_drop_list,
    };

    // Fixed PowerShell script for an action. It reads the host paths from stdin, one per line, so no path is ever
    // part of the command text.
    std::string_view host_script(host_action action);

    std::vector<std::string> build_command(const commands &cmds, host_action action);

    // Hands a fully assembled payload to the host. Every path is translated before anything is set.
    void set(const payload::payload &p, const commands &cmds, paths::translator &translator);
}
