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
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace std::string_literals;

TEST_CASE("Signature table is prefix free", "[signature]")
{
    REQUIRE(signature::table_is_prefix_free());
    for (const auto &e : signature::table())
    {
        REQUIRE_FALSE(e.magic.empty());
        REQUIRE(signature::classify(e.magic) == e.kind);
    }
}

TEST_CASE("Identifies common file headers", "[signature]")
{
    REQUIRE(signature::classify("\x89PNG\r\n\x1A\n\0\0\0\rIHDR"s) == signature::category::image);
    REQUIRE(signature::classify("\xFF\xD8\xFF\xE0\0\x10JFIF"s) == signature::category::image);
    REQUIRE(signature::classify("GIF89a\x01\x00") == signature::category::image);
    REQUIRE(signature::classify("%PDF-1.7\n%") == signature::category::document);
    REQUIRE(signature::classify("PK\x03\x04\x14\0"s) == signature::category::archive);
    REQUIRE(signature::classify("\x1F\x8B\x08") == signature::category::archive);
    REQUIRE(signature::classify("BZh91AY&SY") == signature::category::archive);
    REQUIRE(signature::classify("solid cube\n  facet normal") == signature::category::asset_3d);
    REQUIRE(signature::classify("  0\nSECTION\n  2\nHEADER") == signature::category::asset_3d);
    REQUIRE(signature::classify("glTF\x02\0\0\0"s) == signature::category::asset_3d);
}

TEST_CASE("Short and plain headers match nothing", "[signature]")
{
    REQUIRE(signature::classify("") == signature::category::none);
    REQUIRE(signature::classify("\x89PN") == signature::category::none);
    REQUIRE(signature::classify("%PD") == signature::category::none);
    REQUIRE(signature::classify("hello world\n") == signature::category::none);
    REQUIRE(signature::classify("solidarity") == signature::category::none);
    REQUIRE(signature::classify("BZh is how the notes begin\n") == signature::category::none);
    REQUIRE(signature::classify("BZh0") == signature::category::none);
    REQUIRE(signature::find("plain") == nullptr);
}

TEST_CASE("Find reports the matching label", "[signature]")
{
    const auto *match = signature::find("Rar!\x1A\x07\x01\x00");
    REQUIRE(match != nullptr);
    REQUIRE(match->label == "rar");
    REQUIRE(signature::to_string(match->kind) == "archive");
}

TEST_CASE("Binary extensions are denylisted", "[signature]")
{
    REQUIRE(signature::is_denylisted_extension("svg"));
    REQUIRE(signature::is_denylisted_extension("stl"));
    REQUIRE(signature::is_denylisted_extension("pdf"));
    REQUIRE_FALSE(signature::is_denylisted_extension("txt"));
    REQUIRE_FALSE(signature::is_denylisted_extension("cpp"));
    REQUIRE_FALSE(signature::is_denylisted_extension(""));

    const std::vector<std::string> extra = {"step2", "skp"};
    REQUIRE(signature::is_denylisted_extension("skp", extra));
    REQUIRE_FALSE(signature::is_denylisted_extension("md", extra));
}
