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

#include "errors.hpp"
#include "payload.hpp"
#include "test_util.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <variant>
#include <vector>

namespace
{
    std::string text_of(const payload::payload &p)
    {
        const auto *text = std::get_if<payload::text_payload>(&p);
        REQUIRE(text != nullptr);
        return testutil::load_file(text->spool.path());
    }

    std::string header(const std::filesystem::path &path) { return "# FILE: " + path.string() + "\n"; }

    std::string footer(const std::filesystem::path &a, const std::filesystem::path &b)
    {
        return "\n# END OF FILES: " + a.string() + " " + b.string() + "\n";
    }
}

TEST_CASE("Multiple files get headers, a spacer and a footer", "[payload]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("a.txt", "alpha\n");
    const auto b = dir.write("b.txt", "beta\n");
    const auto p = payload::assemble(mode::output_mode::text, testutil::inputs({a, b}), {});
    REQUIRE(text_of(p) == header(a) + "alpha\n\n" + header(b) + "beta\n" + footer(a, b));
    REQUIRE(payload::describe(p) == "[OK] Copied Text from 2 files");
}

TEST_CASE("Headers can be turned off", "[payload]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("a.txt", "alpha\n");
    const auto b = dir.write("b.txt", "beta\n");
    sanitizer::config cfg;
    cfg.emit_file_headers = false;
    REQUIRE(text_of(payload::assemble(mode::output_mode::text, testutil::inputs({a, b}), cfg)) == "alpha\nbeta\n");
}

TEST_CASE("A file without a final newline does not swallow the next header", "[payload]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("a.txt", "alpha");
    const auto b = dir.write("b.txt", "beta");
    REQUIRE(text_of(payload::assemble(mode::output_mode::text, testutil::inputs({a, b}), {})) ==
            header(a) + "alpha\n\n" + header(b) + "beta\n" + footer(a, b));

    sanitizer::config cfg;
    cfg.emit_file_headers = false;
    REQUIRE(text_of(payload::assemble(mode::output_mode::text, testutil::inputs({a, b}), cfg)) == "alpha\nbeta");
}

TEST_CASE("A single file has no header", "[payload]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("a.txt", "\x1B[1mbold\x1B[0m\n");
    const auto p = payload::assemble(mode::output_mode::text, testutil::inputs({a}), {});
    REQUIRE(text_of(p) == "bold\n");
    REQUIRE(payload::describe(p) == "[OK] Copied Text");
}

TEST_CASE("Code fence uses the file extension as info string", "[payload]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("main.py", "print('hi')\n");
    sanitizer::config cfg;
    cfg.wrap_code_fence = true;
    REQUIRE(text_of(payload::assemble(mode::output_mode::text, testutil::inputs({a}), cfg)) ==
            "```py\nprint('hi')\n```\n");
}

TEST_CASE("Code fence surrounds all files once", "[payload]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("a.txt", "one");
    const auto b = dir.write("b.txt", "two\n");
    sanitizer::config cfg;
    cfg.wrap_code_fence = true;
    cfg.convert_crlf = true;
    const auto p = payload::assemble(mode::output_mode::text, testutil::inputs({a, b}), cfg);
    const auto crlf_header = [](const std::filesystem::path &path) { return "# FILE: " + path.string() + "\r\n"; };
    REQUIRE(text_of(p) == "```\r\n" + crlf_header(a) + "one\r\n\r\n" + crlf_header(b) + "two\r\n\r\n# END OF FILES: " +
                              a.string() + " " + b.string() + "\r\n```\r\n");
    REQUIRE(payload::describe(p) == "[OK] Copied Text from 2 files (CRLF)");
}

TEST_CASE("Hostile file names cannot inject control bytes", "[payload]")
{
    const testutil::temp_dir dir;
    const auto evil = dir.write("evil\x1B]0;pwned\x07.txt", "x\n");
    const auto plain = dir.write("plain.txt", "y\n");
    const auto text = text_of(payload::assemble(mode::output_mode::text, testutil::inputs({evil, plain}), {}));
    REQUIRE(text.find('\x1B') == std::string::npos);
    REQUIRE(text.find('\x07') == std::string::npos);
    REQUIRE(text.find("evil]0;pwned.txt") != std::string::npos);
}

TEST_CASE("Raw output is reported", "[payload]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("a.log", "\x1B[31mred\x1B[0m\n");
    sanitizer::config cfg;
    cfg.strip_ansi = false;
    cfg.strip_control = false;
    const auto p = payload::assemble(mode::output_mode::text, testutil::inputs({a}), cfg);
    REQUIRE(text_of(p) == "\x1B[31mred\x1B[0m\n");
    REQUIRE(payload::describe(p) == "[OK] Copied Text (Raw ANSI)");
}

TEST_CASE("A missing file fails text assembly", "[payload]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("a.txt", "alpha\n");
    REQUIRE_THROWS_AS(payload::assemble(mode::output_mode::text, testutil::inputs({a, dir.path() / "gone.txt"}), {}),
                      errors::unreadable_input_error);
}

TEST_CASE("Image paths are absolute, ordered and unique", "[payload]")
{
    const testutil::temp_dir dir;
    const auto b = dir.write("b.png", "");
    const auto a = dir.write("a.png", "");
    const auto roundabout = dir.path() / "." / "b.png";
    const auto p = payload::assemble(mode::output_mode::image, testutil::inputs({b, a, roundabout}), {});
    const auto &image = std::get<payload::image_payload>(p);
    REQUIRE(image.paths == std::vector{std::filesystem::canonical(b), std::filesystem::canonical(a)});
    REQUIRE(payload::describe(p) == "[OK] Copied 2 Images to Clipboard");
}

TEST_CASE("File objects keep every distinct file", "[payload]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("a.pdf", "%PDF-");
    const auto p = payload::assemble(mode::output_mode::file_object, testutil::inputs({a, dir.path()}), {});
    REQUIRE(std::get<payload::file_object_payload>(p).paths.size() == 2);
    REQUIRE(payload::describe(p) == "[OK] Copied 2 File Object(s) to Clipboard");
}

TEST_CASE("Path mode takes the path as given", "[payload]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("a.txt", "");
    const auto p = payload::assemble(mode::output_mode::path, testutil::inputs({a}), {});
    REQUIRE(std::get<payload::path_payload>(p).path == a);
    REQUIRE(payload::describe(p) == "[OK] Copied Path to Clipboard");
}

TEST_CASE("Overrides that need files reject unsuitable input", "[payload]")
{
    const testutil::temp_dir dir;
    const auto a = dir.write("a.png", "");
    const auto b = dir.write("b.png", "");
    const std::vector stdin_only = {mode::input_descriptor::from_stdin()};

    REQUIRE_THROWS_AS(payload::assemble(mode::output_mode::image, stdin_only, {}), errors::ambiguous_input_error);
    REQUIRE_THROWS_AS(payload::assemble(mode::output_mode::file_object, stdin_only, {}),
                      errors::ambiguous_input_error);
    REQUIRE_THROWS_AS(payload::assemble(mode::output_mode::path, testutil::inputs({a, b}), {}),
                      errors::ambiguous_input_error);
    REQUIRE_THROWS_AS(payload::assemble(mode::output_mode::image, testutil::inputs({dir.path() / "gone.png"}), {}),
                      errors::unreadable_input_error);
    REQUIRE_THROWS_AS(payload::assemble(mode::output_mode::text, std::vector<mode::input_descriptor>{}, {}),
                      errors::ambiguous_input_error);
}

TEST_CASE("A pipe given as a file argument is copied whole", "[payload]")
{
    const std::string content = std::string(5000, 'p') + "\n";
    const testutil::pipe_source source(content);
    const auto inputs = testutil::inputs({source.path()});
    const auto resolved = mode::resolve(inputs, std::nullopt);
    REQUIRE(resolved == mode::output_mode::text);
    REQUIRE(text_of(payload::assemble(resolved, inputs, {})) == content);
}
