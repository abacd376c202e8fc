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
#include <variant>
#include <vector>

#include "file_handle.hpp"
#include "mode.hpp"
#include "sanitizer.hpp"

namespace payload
{
    // Sanitized text, spooled so memory stays bounded and the clipboard only ever sees a complete payload.
    struct text_payload
    {
        spool_file spool;
        size_t file_count = 0;
        bool raw = false;
        bool crlf = false;
    };

    // Absolute image paths. More than one are placed one after another in command-line order.
    struct image_payload
    {
        std::vector<std::filesystem::path> paths;
    };

    // Absolute paths, deduplicated, in command-line order.
    struct file_object_payload
    {
        std::vector<std::filesystem::path> paths;
    };

    // The file's path as given; the path translator resolves it.
    struct path_payload
    {
        std::filesystem::path path;
    };

    using payload = std::variant<text_payload, image_payload, file_object_payload, path_payload>;

    payload assemble(mode::output_mode mode, std::span<const mode::input_descriptor> inputs,
                     const sanitizer::config &config);

    // Writes the sanitized concatenation of all inputs to the spool.
    void assemble_text(std::span<const mode::input_descriptor> inputs, const sanitizer::config &config,
                       spool_file &spool);

    std::string header_line(const mode::input_descriptor &input);

    // Closes a multi-file batch, preceded by a blank line, naming every file sent.
    std::string footer_line(std::span<const mode::input_descriptor> inputs);

    std::string describe(const payload &p);
}
