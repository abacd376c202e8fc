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

#include "paths.hpp"

#include <format>
#include <system_error>

#include "errors.hpp"
#include "log.hpp"
#include "process.hpp"
#include "util.hpp"

namespace
{
    constexpr logging::logger LOG("paths");
}

paths::command_translator::command_translator(std::vector<std::string> command) : _command(std::move(command))
{
    if (_command.empty())
    {
        throw errors::translation_error("no path translator configured");
    }
}

std::string paths::command_translator::to_host(const std::filesystem::path &path)
{
    std::error_code ec;
    const auto absolute = std::filesystem::canonical(path, ec);
    if (ec)
    {
        throw errors::translation_error(std::format("unable to resolve {}: {}", path.string(), ec.message()));
    }
    LOG.debug("canonical path {}", absolute.string());

    auto argv = _command;
    argv.push_back(absolute.string());
    process::result res;
    try
    {
        res = process::run(argv, std::nullopt, true);
    }
    catch (const std::system_error &e)
    {
        throw errors::translation_error(std::format("{}: {}", _command.front(), e.what()));
    }
    if (res.exit_code != 0)
    {
        LOG.error("{} failed for {} with status {}", _command.front(), absolute.string(), res.exit_code);
        throw errors::translation_error(
            std::format("{} exited with status {} for {}", _command.front(), res.exit_code, absolute.string()));
    }

    const auto host = util::trim_space(std::string_view(res.output));
    if (host.empty() || host.find_first_of("\r\n") != std::string_view::npos)
    {
        throw errors::translation_error(
            std::format("{} returned no usable path for {}", _command.front(), absolute.string()));
    }
    LOG.debug("host path {}", host);
    return std::string(host);
}
