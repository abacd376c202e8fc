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

#include "config.hpp"

#include <cstdlib>
#include <format>
#include <optional>

#include "errors.hpp"
#include "log.hpp"
#include "simdjson.h"
#include "util.hpp"

namespace sjo = simdjson::ondemand;

namespace
{
    constexpr logging::logger LOG("config");

    std::vector<std::string> to_string_list(sjo::value value)
    {
        std::vector<std::string> list;
        for (auto elem : value.get_array())
        {
            list.emplace_back(std::string_view(elem.value().get_string().value()));
        }
        return list;
    }

    std::optional<std::filesystem::path> env_path(const char *name)
    {
        const char *value = std::getenv(name);
        if (value == nullptr || *value == '\0')
        {
            return std::nullopt;
        }
        return std::filesystem::path(value);
    }
}

config::settings config::parse(const std::string_view json)
{
    settings s;
    const simdjson::padded_string padded(json);
    sjo::parser parser;
    try
    {
        sjo::document doc = parser.iterate(padded);
        for (auto elem : doc.get_object())
        {
            sjo::field field = elem.value();
            const std::string key(std::string_view(field.unescaped_key().value()));
            sjo::value value = field.value();
            if (key == "strip_ansi")
            {
                s.strip_ansi = value.get_bool().value();
            }
            else if (key == "strip_control")
            {
                s.strip_control = value.get_bool().value();
            }
            else if (key == "crlf")
            {
                s.crlf = value.get_bool().value();
            }
            else if (key == "code")
            {
                s.code = value.get_bool().value();
            }
            else if (key == "header")
            {
                s.header = value.get_bool().value();
            }
            else if (key == "asset_extensions")
            {
                s.asset_extensions.clear();
                for (auto &ext : to_string_list(value))
                {
                    std::string_view trimmed = ext;
                    if (trimmed.starts_with('.'))
                    {
                        trimmed.remove_prefix(1);
                    }
                    s.asset_extensions.push_back(util::to_lower(trimmed));
                }
            }
            else if (key == "clip_command")
            {
                s.clip_command = to_string_list(value);
            }
            else if (key == "powershell")
            {
                s.powershell = std::string(std::string_view(value.get_string().value()));
            }
            else if (key == "path_translator")
            {
                s.path_translator = to_string_list(value);
            }
            else if (key == "debug")
            {
                s.debug = to_string_list(value);
            }
            else
            {
                LOG.warn("ignoring unknown configuration key '{}'", key);
            }
        }
        if (!doc.at_end())
        {
            throw errors::config_error("malformed configuration: trailing content after the top-level object");
        }
    }
    catch (const simdjson::simdjson_error &e)
    {
        throw errors::config_error(std::format("malformed configuration: {}", e.what()));
    }

    if (s.clip_command.empty() || s.path_translator.empty() || s.powershell.empty())
    {
        throw errors::config_error("malformed configuration: commands must not be empty");
    }
    return s;
}

config::settings config::load_file(const std::filesystem::path &path)
{
    simdjson::padded_string content;
    if (simdjson::padded_string::load(path.string()).get(content))
    {
        throw errors::config_error(std::format("unable to read configuration {}", path.string()));
    }
    LOG.debug("loading configuration from {}", path.string());
    try
    {
        return parse(std::string_view(content));
    }
    catch (const errors::config_error &e)
    {
        throw errors::config_error(std::format("{}: {}", path.string(), e.what()));
    }
}

config::settings config::load(const std::string &explicit_path)
{
    if (!explicit_path.empty())
    {
        return load_file(explicit_path);
    }
    if (const auto path = env_path("WSL_CLIP_CONFIG"))
    {
        return load_file(*path);
    }

    std::vector<std::filesystem::path> candidates;
    if (const auto xdg = env_path("XDG_CONFIG_HOME"))
    {
        candidates.push_back(*xdg / "wsl-clip" / "config.json");
    }
    if (const auto home = env_path("HOME"))
    {
        candidates.push_back(*home / ".config" / "wsl-clip" / "config.json");
    }
    for (const auto &candidate : candidates)
    {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec))
        {
            return load_file(candidate);
        }
    }
    LOG.debug("no configuration file found, using defaults");
    return settings{};
}
