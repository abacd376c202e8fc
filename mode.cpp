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

#include "mode.hpp"

#include <algorithm>
#include <stdexcept>

#include "common.hpp"
#include "errors.hpp"
#include "file_handle.hpp"
#include "log.hpp"
#include "signature.hpp"
#include "util.hpp"

namespace
{
    constexpr logging::logger LOG("classifier");
}

mode::input_descriptor mode::input_descriptor::from_file(std::filesystem::path path)
{
    input_descriptor d;
    d._extension = util::extension_of(path);
    d._source = std::move(path);
    return d;
}

mode::input_descriptor mode::input_descriptor::from_stdin()
{
    input_descriptor d;
    d._stdin = true;
    return d;
}

std::string mode::input_descriptor::display_name() const { return _stdin ? "<STDIN>" : _source.string(); }

std::string_view mode::input_descriptor::sniffed_header() const
{
    if (_stdin)
    {
        throw std::logic_error("stdin is never sniffed");
    }
    if (!_header)
    {
        input_file in(_source);
        std::string header(common::HEADER_SIZE, '\0');
        size_t filled = 0;
        try
        {
            while (filled < header.size())
            {
                const size_t bytes = in.read(header.data() + filled, header.size() - filled);
                if (bytes == 0)
                {
                    break;
                }
                filled += bytes;
            }
        }
        catch (const errors::io_error &e)
        {
            throw errors::unreadable_input_error(e.what());
        }
        header.resize(filled);
        _header = std::move(header);
    }
    return *_header;
}

mode::file_kind mode::classify_file(const input_descriptor &input, const std::span<const std::string> extra_extensions)
{
    if (input.is_stdin())
    {
        return file_kind::text;
    }

    // A missing path falls through to the sniff, which reports it as unreadable.
    std::error_code ec;
    const auto status = std::filesystem::status(input.source(), ec);
    if (!ec && std::filesystem::is_directory(status))
    {
        LOG.debug("{}: directory, travels as a file object", input.display_name());
        return file_kind::asset;
    }
    if (!ec && !std::filesystem::is_regular_file(status))
    {
        // Pipes and character devices can be read only once, so the sniff would eat the payload.
        LOG.debug("{}: not a regular file, read as a text stream", input.display_name());
        return file_kind::text;
    }

    const auto header = input.sniffed_header();
    if (const auto *match = signature::find(header))
    {
        LOG.debug("{}: {} signature ({})", input.display_name(), match->label, signature::to_string(match->kind));
        return match->kind == signature::category::image ? file_kind::image : file_kind::asset;
    }
    if (signature::is_denylisted_extension(input.declared_extension(), extra_extensions))
    {
        LOG.debug("{}: binary extension .{}", input.display_name(), input.declared_extension());
        return file_kind::asset;
    }
    if (header.find('\0') != std::string_view::npos)
    {
        LOG.debug("{}: NUL bytes in header, treating as binary", input.display_name());
        return file_kind::asset;
    }
    LOG.debug("{}: text", input.display_name());
    return file_kind::text;
}

mode::output_mode mode::resolve(const std::span<const input_descriptor> inputs,
                                const std::optional<output_mode> override_mode,
                                const std::span<const std::string> extra_extensions)
{
    if (inputs.empty())
    {
        throw errors::ambiguous_input_error("no input provided; pipe data or specify files");
    }
    if (override_mode)
    {
        LOG.debug("explicit mode {}", to_string(*override_mode));
        return *override_mode;
    }

    bool any_text = false;
    bool any_image = false;
    bool any_asset = false;
    for (const auto &input : inputs)
    {
        switch (classify_file(input, extra_extensions))
        {
        case file_kind::text:
            any_text = true;
            break;
        case file_kind::image:
            any_image = true;
            break;
        case file_kind::asset:
            any_asset = true;
            break;
        }
    }

    output_mode resolved = output_mode::text;
    if (any_asset || (any_image && any_text))
    {
        resolved = output_mode::file_object;
    }
    else if (any_image)
    {
        resolved = output_mode::image;
    }
    LOG.debug("resolved {} input(s) to {}", inputs.size(), to_string(resolved));
    return resolved;
}

std::string_view mode::to_string(const output_mode m)
{
    switch (m)
    {
    case output_mode::text:
        return "text";
    case output_mode::image:
        return "image";
    case output_mode::file_object:
        return "file-object";
    case output_mode::path:
        return "path";
    default:
        throw std::logic_error("unknown output mode");
    }
}

std::string_view mode::to_string(const file_kind k)
{
    switch (k)
    {
    case file_kind::text:
        return "text";
    case file_kind::image:
        return "image";
    case file_kind::asset:
        return "asset";
    default:
        throw std::logic_error("unknown file kind");
    }
}
