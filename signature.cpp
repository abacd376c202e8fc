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

#include "signature.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

using namespace std::string_view_literals;

namespace
{
    using signature::category;

    constexpr std::array TABLE = {
        signature::entry{"\x89PNG\r\n\x1A\n"sv, category::image, "png"},
        signature::entry{"\xFF\xD8\xFF"sv, category::image, "jpeg"},
        signature::entry{"GIF87a"sv, category::image, "gif"},
        signature::entry{"GIF89a"sv, category::image, "gif"},
        signature::entry{"II*\0"sv, category::image, "tiff"},
        signature::entry{"MM\0*"sv, category::image, "tiff"},
        signature::entry{"\x00\x00\x01\x00"sv, category::image, "ico"},

        signature::entry{"%PDF-"sv, category::document, "pdf"},
        signature::entry{"\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1"sv, category::document, "ole2"},
        signature::entry{"{\\rtf"sv, category::document, "rtf"},
        signature::entry{"%!PS"sv, category::document, "postscript"},

        signature::entry{"PK\x03\x04"sv, category::archive, "zip"},
        signature::entry{"PK\x05\x06"sv, category::archive, "zip"},
        signature::entry{"PK\x07\x08"sv, category::archive, "zip"},
        signature::entry{"\x1F\x8B"sv, category::archive, "gzip"},
        signature::entry{"7z\xBC\xAF\x27\x1C"sv, category::archive, "7z"},
        signature::entry{"Rar!\x1A\x07"sv, category::archive, "rar"},
        signature::entry{"BZh1"sv, category::archive, "bzip2"},
        signature::entry{"BZh2"sv, category::archive, "bzip2"},
        signature::entry{"BZh3"sv, category::archive, "bzip2"},
        signature::entry{"BZh4"sv, category::archive, "bzip2"},
        signature::entry{"BZh5"sv, category::archive, "bzip2"},
        signature::entry{"BZh6"sv, category::archive, "bzip2"},
        signature::entry{"BZh7"sv, category::archive, "bzip2"},
        signature::entry{"BZh8"sv, category::archive, "bzip2"},
        signature::entry{"BZh9"sv, category::archive, "bzip2"},
        signature::entry{"\xFD" "7zXZ\x00"sv, category::archive, "xz"},
        signature::entry{"\x28\xB5\x2F\xFD"sv, category::archive, "zstd"},

        signature::entry{"solid "sv, category::asset_3d, "stl"},
        signature::entry{"AutoCAD Binary DXF"sv, category::asset_3d, "dxf"},
        signature::entry{"0\nSECTION"sv, category::asset_3d, "dxf"},
        signature::entry{"0\r\nSECTION"sv, category::asset_3d, "dxf"},
        signature::entry{"  0\nSECTION"sv, category::asset_3d, "dxf"},
        signature::entry{"  0\r\nSECTION"sv, category::asset_3d, "dxf"},
        signature::entry{"ply\n"sv, category::asset_3d, "ply"},
        signature::entry{"ply\r\n"sv, category::asset_3d, "ply"},
        signature::entry{"glTF"sv, category::asset_3d, "glb"},
        signature::entry{"Kaydara FBX Binary"sv, category::asset_3d, "fbx"},
    };

    constexpr std::array DENYLIST = {
        "dxf"sv, "obj"sv,  "stl"sv,  "ply"sv,  "gcode"sv, "svg"sv,  "eps"sv,  "ai"sv,   "psd"sv,  "pdf"sv,
        "zip"sv, "7z"sv,   "tar"sv,  "gz"sv,   "tgz"sv,   "bz2"sv,  "xz"sv,   "zst"sv,  "rar"sv,  "iso"sv,
        "img"sv, "dll"sv,  "so"sv,   "o"sv,    "a"sv,     "bin"sv,  "exe"sv,  "msi"sv,  "jar"sv,  "class"sv,
        "doc"sv, "docx"sv, "xls"sv,  "xlsx"sv, "ppt"sv,   "pptx"sv, "odt"sv,  "ods"sv,  "odp"sv,  "blend"sv,
        "fbx"sv, "glb"sv,  "3mf"sv,  "step"sv, "stp"sv,
    };
}

std::span<const signature::entry> signature::table() { return TABLE; }

const signature::entry *signature::find(const std::string_view header)
{
    const auto it =
        std::find_if(TABLE.begin(), TABLE.end(), [header](const entry &e) { return header.starts_with(e.magic); });
    return it != TABLE.end() ? &*it : nullptr;
}

signature::category signature::classify(const std::string_view header)
{
    const auto *match = find(header);
    return match ? match->kind : category::none;
}

bool signature::table_is_prefix_free()
{
    for (size_t i = 0; i < TABLE.size(); ++i)
    {
        for (size_t j = 0; j < TABLE.size(); ++j)
        {
            if (i != j && TABLE[j].magic.starts_with(TABLE[i].magic))
            {
                return false;
            }
        }
    }
    return true;
}

bool signature::is_denylisted_extension(const std::string_view ext, const std::span<const std::string> extra)
{
    if (ext.empty())
    {
        return false;
    }
    return std::find(DENYLIST.begin(), DENYLIST.end(), ext) != DENYLIST.end() ||
           std::find(extra.begin(), extra.end(), ext) != extra.end();
}

std::string_view signature::to_string(const category kind)
{
    switch (kind)
    {
    case category::none:
        return "none";
    case category::image:
        return "image";
    case category::document:
        return "document";
    case category::archive:
        return "archive";
    case category::asset_3d:
        return "3d-asset";
    default:
        throw std::logic_error("unknown signature category");
    }
}
