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

#include "clipboard.hpp"
#include "errors.hpp"
#include "test_util.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

namespace
{
    class fake_translator final : public paths::translator
    {
    public:
        std::vector<std::filesystem::path> seen;

        std::string to_host(const std::filesystem::path &path) override
        {
            seen.push_back(path);
            return "C:\\fake\\" + path.filename().string();
        }
    };

    class failing_translator final : public paths::translator
    {
    public:
        std::string to_host(const std::filesystem::path &path) override
        {
            throw errors::translation_error("cannot translate " + path.string());
        }
    };

    clipboard::commands copy_to(const std::filesystem::path &out)
    {
        clipboard::commands cmds;
        cmds.clip = {"cp", "/dev/stdin", out.string()};
        return cmds;
    }
}

TEST_CASE("Host command never embeds paths", "[clipboard]")
{
    const clipboard::commands cmds;
    const auto argv = clipboard::build_command(cmds, clipboard::host_action::set_file_drop_list);
    REQUIRE(argv.size() == 6);
    REQUIRE(argv[0] == "powershell.exe");
    REQUIRE(argv[1] == "-NoProfile");
    REQUIRE(argv[4] == "-Command");
    REQUIRE(argv[5].find("[Console]::In.ReadToEnd()") != std::string::npos);
    REQUIRE(argv[5].find("SetFileDropList") != std::string::npos);
    REQUIRE(clipboard::host_script(clipboard::host_action::set_images).find("SetImage") != std::string_view::npos);
}

TEST_CASE("Text goes to the clip command on standard input", "[clipboard]")
{
    const testutil::temp_dir dir;
    const auto source = dir.write("a.txt", "\x1B[32mok\x1B[0m\n");
    const auto out = dir.path() / "clipboard.txt";
    const auto p = payload::assemble(mode::output_mode::text, testutil::inputs({source}), {});
    fake_translator translator;

    clipboard::set(p, copy_to(out), translator);
    REQUIRE(testutil::load_file(out) == "ok\n");
    REQUIRE(translator.seen.empty());
}

TEST_CASE("Path mode copies the translated path", "[clipboard]")
{
    const testutil::temp_dir dir;
    const auto source = dir.write("report.txt", "");
    const auto out = dir.path() / "clipboard.txt";
    const auto p = payload::assemble(mode::output_mode::path, testutil::inputs({source}), {});
    fake_translator translator;

    clipboard::set(p, copy_to(out), translator);
    REQUIRE(testutil::load_file(out) == "C:\\fake\\report.txt");
    REQUIRE(translator.seen == std::vector{source});
}

TEST_CASE("File objects translate every path before the host runs", "[clipboard]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("a.pdf", "");
    const auto b = dir.write("b.zip", "");
    const auto p = payload::assemble(mode::output_mode::file_object, testutil::inputs({a, b}), {});

    clipboard::commands cmds;
    cmds.powershell = "true";
    fake_translator translator;
    clipboard::set(p, cmds, translator);
    REQUIRE(translator.seen.size() == 2);

    failing_translator failing;
    cmds.powershell = "wsl-clip-no-such-host";
    REQUIRE_THROWS_AS(clipboard::set(p, cmds, failing), errors::translation_error);
}

TEST_CASE("Host failures are reported", "[clipboard]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("a.png", "");
    const auto p = payload::assemble(mode::output_mode::image, testutil::inputs({a}), {});
    fake_translator translator;

    clipboard::commands cmds;
    cmds.powershell = "false";
    REQUIRE_THROWS_AS(clipboard::set(p, cmds, translator), errors::external_setter_error);

    cmds.powershell = "wsl-clip-no-such-host";
    REQUIRE_THROWS_AS(clipboard::set(p, cmds, translator), errors::external_setter_error);

    const auto text = payload::assemble(mode::output_mode::text, testutil::inputs({a}), {});
    cmds.clip = {"false"};
    REQUIRE_THROWS_AS(clipboard::set(text, cmds, translator), errors::external_setter_error);
}
