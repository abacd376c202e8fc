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
#include <span>
#include <string>
#include <string_view>

namespace mode
{
    enum class output_mode : int
    {
        text,
        image,
        file_object,
        path,
    };

    // Per-file verdict before the batch is combined into one output mode.
    enum class file_kind : int
    {
        text,
        image,
        asset,
    };

    class input_descriptor
    {
        std::filesystem::path _source;
        std::string _extension;
        bool _stdin = false;
        // Filled on first use and never re-read.
        mutable std::optional<std::string> _header;

        input_descriptor() = default;

    public:
        static input_descriptor from_file(std::filesystem::path path);
        static input_descriptor from_stdin();

        [[nodiscard]] bool is_stdin() const { return _stdin; }
        [[nodiscard]] bool size_known() const { return !_stdin; }
        [[nodiscard]] const std::filesystem::path &source() const { return _source; }
        [[nodiscard]] const std::string &declared_extension() const { return _extension; }
        [[nodiscard]] bool header_loaded() const { return _header.has_value(); }
        [[nodiscard]] std::string display_name() const;

        // First bytes of the file, at most common::HEADER_SIZE. Throws unreadable_input_error.
        [[nodiscard]] std::string_view sniffed_header() const;
    };

    [[nodiscard]] file_kind classify_file(const input_descriptor &input, std::span<const std::string> extra_extensions = {});

    // Resolves the single output mode of an invocation. An override wins without any file being read. The result
    // depends only on which kinds are present, never on their order.
    [[nodiscard]] output_mode resolve(std::span<const input_descriptor> inputs, std::optional<output_mode> override_mode,
                                      std::span<const std::string> extra_extensions = {});

    std::string_view to_string(output_mode m);
    std::string_view to_string(file_kind k);
}
