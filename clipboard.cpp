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

#include "clipboard.hpp"

#include <format>
#include <optional>
#include <stdexcept>
#include <system_error>

#include "common.hpp"
#include "errors.hpp"
#include "file_handle.hpp"
#include "log.hpp"
#include "process.hpp"

namespace
{
    constexpr logging::logger LOG("clipboard");

    constexpr std::string_view SCRIPT_PRELUDE =
        R"ps($ErrorActionPreference = 'Stop'; [Console]::InputEncoding = [System.Text.Encoding]::UTF8; )ps"
        R"ps(Add-Type -AssemblyName System.Windows.Forms; Add-Type -AssemblyName System.Drawing; )ps"
        R"ps($paths = @([Console]::In.ReadToEnd() -split "`r?`n" | Where-Object { $_ }); )ps";

    constexpr std::string_view SET_IMAGES_SCRIPT =
        R"ps(foreach ($p in $paths) { $img = [System.Drawing.Image]::FromFile($p); )ps"
        R"ps(try { [System.Windows.Forms.Clipboard]::SetImage($img) } finally { $img.Dispose() } })ps";

    constexpr std::string_view SET_FILE_DROP_LIST_SCRIPT =
        R"ps($files = New-Object System.Collections.Specialized.StringCollection; )ps"
        R"ps(foreach ($p in $paths) { [void]$files.Add($p) }; )ps"
        R"ps([System.Windows.Forms.Clipboard]::SetFileDropList($files))ps";

    void run_host(const std::vector<std::string> &argv, const std::filesystem::path &stdin_from)
    {
        process::result res;
        try
        {
            res = process::run(argv, stdin_from, false);
        }
        catch (const std::system_error &e)
        {
            throw errors::external_setter_error(std::format("{}: {}", argv.front(), e.what()));
        }
        if (res.exit_code != 0)
        {
            LOG.error("{} exited with status {}", argv.front(), res.exit_code);
            throw errors::external_setter_error(std::format("{} exited with status {}", argv.front(), res.exit_code));
        }
    }

    void set_paths(const clipboard::commands &cmds, const clipboard::host_action action,
                   const std::vector<std::filesystem::path> &posix_paths, paths::translator &translator)
    {
        spool_file list;
        for (const auto &path : posix_paths)
        {
            const auto host = translator.to_host(path);
            list.write(host);
            list.write("\n");
        }
        list.flush();
        LOG.debug("setting {} path(s) through {}", posix_paths.size(), cmds.powershell);
        run_host(clipboard::build_command(cmds, action), list.path());
    }
}

std::string_view clipboard::host_script(const host_action action)
{
    switch (action)
    {
    case host_action::set_images:
        return SET_IMAGES_SCRIPT;
    case host_action::set_file_drop_list:
        return SET_FILE_DROP_LIST_SCRIPT;
    default:
        throw std::logic_error("unknown host action");
    }
}

std::vector<std::string> clipboard::build_command(const commands &cmds, const host_action action)
{
    std::string script(SCRIPT_PRELUDE);
    script += host_script(action);
    return {cmds.powershell, "-NoProfile", "-NonInteractive", "-STA", "-Command", std::move(script)};
}

void clipboard::set(const payload::payload &p, const commands &cmds, paths::translator &translator)
{
    std::visit(common::overloaded{
                   [&cmds](const payload::text_payload &text)
                   {
                       LOG.debug("setting {} byte(s) of text", text.spool.size());
                       run_host(cmds.clip, text.spool.path());
                   },
                   [&cmds, &translator](const payload::image_payload &image)
                   { set_paths(cmds, host_action::set_images, image.paths, translator); },
                   [&cmds, &translator](const payload::file_object_payload &files)
                   { set_paths(cmds, host_action::set_file_drop_list, files.paths, translator); },
                   [&cmds, &translator](const payload::path_payload &path)
                   {
                       spool_file text;
                       text.write(translator.to_host(path.path));
                       text.flush();
                       run_host(cmds.clip, text.path());
                   },
               },
               p);
}
