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

#include <span>
#include <string>
#include <string_view>

namespace signature
{
    enum class category : int
    {
        none,
        image,
        document,
        archive,
        asset_3d,
    };

    struct entry
    {
        std::string_view magic;
        category kind;
        std::string_view label;
    };

    std::span<const entry> table();

    // Matches the leading bytes of a file against the table. Short or empty headers simply match nothing.
    [[nodiscard]] category classify(std::string_view header);

    [[nodiscard]] const entry *find(std::string_view header);

    // No signature may be a prefix of another, so at most one entry can match any header.
    [[nodiscard]] bool table_is_prefix_free();

    // Extensions (lowercase, no dot) of binary formats that always travel as file objects.
    [[nodiscard]] bool is_denylisted_extension(std::string_view ext, std::span<const std::string> extra = {});

    std::string_view to_string(category kind);
}
