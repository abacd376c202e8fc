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

#include <clocale>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <variant>

#include <unistd.h>

#include <CLI/CLI.hpp>

#include "clipboard.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "mode.hpp"
#include "paths.hpp"
#include "payload.hpp"
#include "sanitizer.hpp"

namespace
{
    constexpr logging::logger LOG("main");

    constexpr auto EXAMPLES = R"(EXAMPLES:
  wsl-clip image.png       # Auto-detects Image mode
  wsl-clip doc.pdf         # Auto-detects File object
  wsl-clip src/*.cpp       # Copies text (ANSI stripped by default)
  ls --color | wsl-clip    # Pipes clean text (colors removed)
  ls --color | wsl-clip --no-strip  # Pipes raw text (colors preserved)
  wsl-clip path notes.md   # Copies the Windows path of a file)";
}

struct cli_options
{
    cli_options() = default;
    DEFAULT_MOVE(cli_options)
    DISABLE_COPY(cli_options)

    std::vector<std::string> files;
    std::optional<mode::output_mode> override_mode;
    bool no_strip = false;
    bool crlf = false;
    bool code = false;
    bool no_header = false;
    bool debug = false;
    std::string config_path;
};

static std::variant<cli_options, int> parse_cli(int argc, char **argv)
{
    cli_options opts;
    CLI::App cli{"wsl-clip - smart clipboard integration for WSL2"};
    cli.footer(EXAMPLES);
    cli.fallthrough();
    cli.require_subcommand(0, 1);

    cli.add_option("files", opts.files, "Files to copy; reads stdin when omitted");
    cli.add_flag("-n,--no-header", opts.no_header, "Suppress file headers in text mode");
    cli.add_flag("--no-strip", opts.no_strip, "Keep ANSI escapes and control characters");
    cli.add_flag("--crlf", opts.crlf, "Convert LF line endings to CRLF");
    cli.add_flag("--code", opts.code, "Wrap text in a Markdown code fence");
    cli.add_flag("--debug", opts.debug, "Enable debug logging");
    cli.add_option("--config", opts.config_path, "Configuration file");

    std::vector<std::string> file_objects;
    auto *file_cmd = cli.add_subcommand("file", "Force file object mode (copy as attachment)");
    file_cmd->add_option("files", file_objects, "Files to copy")->required();

    std::string image;
    auto *img_cmd = cli.add_subcommand("img", "Force image mode (copy pixels)");
    img_cmd->add_option("file", image, "Image file")->required();

    std::string path;
    auto *path_cmd = cli.add_subcommand("path", "Copy the Windows path string");
    path_cmd->add_option("file", path, "File whose path to copy")->required();

    try
    {
        cli.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return cli.exit(e);
    }

    if (*file_cmd)
    {
        opts.override_mode = mode::output_mode::file_object;
        opts.files = std::move(file_objects);
    }
    else if (*img_cmd)
    {
        opts.override_mode = mode::output_mode::image;
        opts.files = {image};
    }
    else if (*path_cmd)
    {
        opts.override_mode = mode::output_mode::path;
        opts.files = {path};
    }
    return opts;
}

static std::vector<mode::input_descriptor> make_inputs(const cli_options &opts)
{
    std::vector<mode::input_descriptor> inputs;
    if (opts.files.empty())
    {
        // A terminal on stdin means nothing was piped.
        if (!isatty(STDIN_FILENO))
        {
            inputs.push_back(mode::input_descriptor::from_stdin());
        }
        return inputs;
    }
    inputs.reserve(opts.files.size());
    for (const auto &file : opts.files)
    {
        inputs.push_back(mode::input_descriptor::from_file(file));
    }
    return inputs;
}

static sanitizer::config make_sanitizer_config(const cli_options &opts, const config::settings &settings)
{
    sanitizer::config cfg;
    cfg.strip_ansi = settings.strip_ansi && !opts.no_strip;
    cfg.strip_control = settings.strip_control && !opts.no_strip;
    cfg.convert_crlf = settings.crlf || opts.crlf;
    cfg.wrap_code_fence = settings.code || opts.code;
    cfg.emit_file_headers = settings.header && !opts.no_header;
    return cfg;
}

static void run(const cli_options &opts)
{
    if (opts.debug)
    {
        logging::enable("*");
    }
    if (const char *env = std::getenv("WSL_CLIP_DEBUG"))
    {
        logging::enable_list(env);
    }

    const auto settings = config::load(opts.config_path);
    for (const auto &ns : settings.debug)
    {
        logging::enable(ns);
    }
    LOG.debug("wsl-clip started with {} file argument(s)", opts.files.size());

    const auto inputs = make_inputs(opts);
    const auto resolved = mode::resolve(inputs, opts.override_mode, settings.asset_extensions);
    const auto sanitize_config = make_sanitizer_config(opts, settings);
    const auto assembled = payload::assemble(resolved, inputs, sanitize_config);

    paths::command_translator translator(settings.path_translator);
    clipboard::set(assembled, clipboard::commands{settings.clip_command, settings.powershell}, translator);
    std::cout << payload::describe(assembled) << '\n';
}

int main(int argc, char **argv)
{
    std::setlocale(LC_ALL, "");

    auto opts_or_ret = parse_cli(argc, argv);
    if (std::holds_alternative<int>(opts_or_ret))
    {
        return std::get<int>(opts_or_ret);
    }
    auto opts = std::move(std::get<cli_options>(opts_or_ret));

    try
    {
        run(opts);
    }
    catch (const errors::error &e)
    {
        std::cerr << "Encountered an error: " << e.what() << '\n';
        return e.exit_code();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Encountered an error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
