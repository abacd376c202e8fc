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

#include "payload.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

#include "common.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util.hpp"

namespace
{
    constexpr logging::logger LOG("payload");

    input_file open_input(const mode::input_descriptor &input)
    {
        if (input.is_stdin())
        {
            return input_file::standard_input();
        }
        return input_file(input.source());
    }

    std::vector<const mode::input_descriptor *> file_inputs(const std::span<const mode::input_descriptor> inputs)
    {
        std::vector<const mode::input_descriptor *> files;
        for (const auto &input : inputs)
        {
            if (!input.is_stdin())
            {
                files.push_back(&input);
            }
        }
        return files;
    }

    std::filesystem::path absolute_path(const mode::input_descriptor &input)
    {
        std::error_code ec;
        auto resolved = std::filesystem::canonical(input.source(), ec);
        if (ec)
        {
            throw errors::unreadable_input_error(std::format("unable to resolve {}: {}", input.display_name(),
                                                             ec.message()));
        }
        return resolved;
    }

    std::vector<std::filesystem::path> absolute_paths(const std::span<const mode::input_descriptor> inputs,
                                                      const bool deduplicate)
    {
        std::vector<std::filesystem::path> paths;
        for (const auto &input : inputs)
        {
            auto resolved = absolute_path(input);
            if (deduplicate && std::find(paths.begin(), paths.end(), resolved) != paths.end())
            {
                LOG.debug("dropping duplicate {}", resolved.string());
                continue;
            }
            paths.push_back(std::move(resolved));
        }
        return paths;
    }

    void require_files(const mode::output_mode mode, const std::span<const mode::input_descriptor> inputs,
                       const bool exactly_one)
    {
        const auto files = file_inputs(inputs);
        if (files.size() != inputs.size() || files.empty())
        {
            throw errors::ambiguous_input_error(std::format("{} mode needs file arguments", mode::to_string(mode)));
        }
        if (exactly_one && files.size() != 1)
        {
            throw errors::ambiguous_input_error(
                std::format("{} mode takes exactly one file, got {}", mode::to_string(mode), files.size()));
        }
    }
}

std::string payload::header_line(const mode::input_descriptor &input)
{
    return std::format("# FILE: {}\n", util::clean_display_name(input.display_name()));
}

std::string payload::footer_line(const std::span<const mode::input_descriptor> inputs)
{
    std::string names;
    for (const auto &input : inputs)
    {
        if (!names.empty())
        {
            names += ' ';
        }
        names += util::clean_display_name(input.display_name());
    }
    return std::format("\n# END OF FILES: {}\n", names);
}

void payload::assemble_text(const std::span<const mode::input_descriptor> inputs, const sanitizer::config &config,
                            spool_file &spool)
{
    const bool multi = inputs.size() > 1;
    const bool headers = multi && config.emit_file_headers;
    const auto write = [&spool](const std::string_view data) { spool.write(data); };
    const auto footer = headers ? footer_line(inputs) : std::string();

    for (size_t i = 0; i < inputs.size(); ++i)
    {
        const auto &input = inputs[i];
        const bool last = i + 1 == inputs.size();
        LOG.debug("sanitizing {}", input.display_name());

        auto in = open_input(input);
        sanitizer::stream stream(config, i == 0, last);
        const auto read = [&in](char *buffer, const size_t size) { return in.read(buffer, size); };
        sanitizer::sanitize(read, write, stream, headers ? header_line(input) : std::string(),
                            last ? std::string_view(footer) : std::string_view());

        if (multi && !last)
        {
            // Keep the next file's header off this file's last line, then leave a blank spacer.
            std::string tail;
            if (!stream.at_line_start())
            {
                tail += sanitizer::newline(config);
            }
            if (headers)
            {
                tail += sanitizer::newline(config);
            }
            spool.write(tail);
        }
    }
    spool.flush();
    LOG.debug("spooled {} byte(s) of text", spool.size());
}

payload::payload payload::assemble(const mode::output_mode mode, const std::span<const mode::input_descriptor> inputs,
                                   const sanitizer::config &config)
{
    if (inputs.empty())
    {
        throw errors::ambiguous_input_error("no input provided; pipe data or specify files");
    }

    switch (mode)
    {
    case mode::output_mode::text:
    {
        // The fence info string is the language hint of a lone file.
        sanitizer::config effective = config;
        if (effective.wrap_code_fence && effective.fence_info.empty() && inputs.size() == 1 &&
            !inputs.front().is_stdin())
        {
            effective.fence_info = inputs.front().declared_extension();
        }
        text_payload text{spool_file(), inputs.size(), !config.strip_ansi, config.convert_crlf};
        assemble_text(inputs, effective, text.spool);
        return payload{std::move(text)};
    }
    case mode::output_mode::image:
        require_files(mode, inputs, false);
        return image_payload{absolute_paths(inputs, true)};
    case mode::output_mode::file_object:
        require_files(mode, inputs, false);
        return file_object_payload{absolute_paths(inputs, true)};
    case mode::output_mode::path:
        require_files(mode, inputs, true);
        return path_payload{inputs.front().source()};
    default:
        throw std::logic_error("unknown output mode");
    }
}

std::string payload::describe(const payload &p)
{
    return std::visit(
        common::overloaded{
            [](const text_payload &text)
            {
                std::string msg = "[OK] Copied Text";
                if (text.file_count > 1)
                {
                    msg += std::format(" from {} files", text.file_count);
                }
                if (text.raw)
                {
                    msg += " (Raw ANSI)";
                }
                if (text.crlf)
                {
                    msg += " (CRLF)";
                }
                return msg;
            },
            [](const image_payload &image)
            {
                return image.paths.size() == 1 ? std::string("[OK] Copied Image to Clipboard")
                                               : std::format("[OK] Copied {} Images to Clipboard", image.paths.size());
            },
            [](const file_object_payload &files)
            { return std::format("[OK] Copied {} File Object(s) to Clipboard", files.paths.size()); },
            [](const path_payload &) { return std::string("[OK] Copied Path to Clipboard"); },
        },
        p);
}
