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

#include "utf8.h"
#include "util.hpp"
#include <catch2/catch_test_macros.hpp>

TEST_CASE("Trim space successfully", "[trim_space]")
{
    REQUIRE(util::trim_space("  abc  ") == "abc");
    REQUIRE(util::trim_space("abc  ") == "abc");
    REQUIRE(util::trim_space("   abc") == "abc");
    REQUIRE(util::trim_space("C:\\Users\\me\\a.txt\r\n") == "C:\\Users\\me\\a.txt");
}

TEST_CASE("Trim all-space string successfully", "[trim_space]")
{
    REQUIRE(util::trim_space("     ") == "");
    REQUIRE(util::trim_space("  \t\n    ") == "");
}

TEST_CASE("Trim space in place", "[trim_space]")
{
    std::string_view s = "\tkeep me \n";
    util::trim_space(s);
    REQUIRE(s == "keep me");
}

TEST_CASE("Extensions are lowercased without the dot", "[extension_of]")
{
    REQUIRE(util::extension_of("scan.PNG") == "png");
    REQUIRE(util::extension_of("/tmp/archive.tar.gz") == "gz");
    REQUIRE(util::extension_of("Makefile") == "");
    REQUIRE(util::extension_of("dir.d/noext") == "");
    REQUIRE(util::to_lower("MiXeD-123") == "mixed-123");
}

TEST_CASE("Display names lose control characters", "[clean_display_name]")
{
    REQUIRE(util::clean_display_name("notes.txt") == "notes.txt");
    REQUIRE(util::clean_display_name("evil\x1B[31m\n.txt") == "evil[31m.txt");
    REQUIRE(util::clean_display_name("c1\xC2\x9B" "x") == "c1x");
    REQUIRE(util::clean_display_name("\xE6\xB5\x8B\xE8\xAF\x95.md") == "\xE6\xB5\x8B\xE8\xAF\x95.md");
}

TEST_CASE("Display names are always valid UTF-8", "[clean_display_name]")
{
    const std::string broken = "bad\xFF\xFE name\xC3";
    REQUIRE_FALSE(utf8::is_valid(broken.begin(), broken.end()));
    const auto cleaned = util::clean_display_name(broken);
    REQUIRE(utf8::is_valid(cleaned.begin(), cleaned.end()));
    REQUIRE(cleaned.starts_with("bad"));
}
