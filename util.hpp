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

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "common.hpp"

namespace util
{
    std::string_view trim_space(std::string_view &&input);
    std::string_view &trim_space(std::string_view &input);

    std::string to_lower(std::string_view s);

    // Lowercase extension of the file name, without the leading dot.
    std::string extension_of(const std::filesystem::path &path);

    // Makes a file name safe to embed in clipboard text: invalid UTF-8 is replaced and control characters are
    // removed, so a hostile name cannot smuggle escapes into the payload.
    std::string clean_display_name(std::string_view name);

    inline bool is_control_code_point(const uint32_t cp) { return cp < 0x20 || (cp >= 0x7f && cp <= 0x9f); }
}
