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

#include "util.hpp"

#include <algorithm>
#include <iterator>

#include "utf8.h"

constexpr auto WHITESPACES = " \t\r\n";

std::string_view util::trim_space(std::string_view &&input)
{
    auto idx = input.find_last_not_of(WHITESPACES);
    if (idx != std::string_view::npos)
    {
        input.remove_suffix(input.length() - idx - 1);
    }
    else
    {
        input.remove_suffix(input.length());
    }
    idx = input.find_first_not_of(WHITESPACES);
    if (idx != std::string_view::npos)
    {
        input.remove_prefix(idx);
    }
    return input;
}

std::string_view &util::trim_space(std::string_view &input)
{
    input = trim_space(std::string_view(input));
    return input;
}

std::string util::to_lower(const std::string_view s)
{
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](const unsigned char c) { return static_cast<char>(c >= 'A' && c <= 'Z' ? c + 32 : c); });
    return lower;
}

std::string util::extension_of(const std::filesystem::path &path)
{
    auto ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.')
    {
        ext.erase(0, 1);
    }
    return to_lower(ext);
}

std::string util::clean_display_name(const std::string_view name)
{
    std::string valid;
    valid.reserve(name.size());
    utf8::replace_invalid(name.begin(), name.end(), std::back_inserter(valid));

    std::string cleaned;
    cleaned.reserve(valid.size());
    auto it = valid.cbegin();
    const auto end = valid.cend();
    while (it != end)
    {
        const uint32_t cp = utf8::next(it, end);
        if (!is_control_code_point(cp))
        {
            utf8::append(cp, std::back_inserter(cleaned));
        }
    }
    return cleaned;
}
