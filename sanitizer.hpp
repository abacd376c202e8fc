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
#include <string>
#include <string_view>
#include <vector>

#include "common.hpp"

namespace sanitizer
{
    struct config
    {
        bool strip_ansi = true;
        // Tab, LF and CR survive regardless.
        bool strip_control = true;
        bool convert_crlf = false;
        bool wrap_code_fence = false;
        bool emit_file_headers = true;
        // Info string after the opening fence, e.g. a language name.
        std::string fence_info;
    };

    constexpr std::string_view FENCE = "```";

    // Longest body accepted after ESC before the sequence is abandoned.
    constexpr size_t MAX_CONTROL_SEQUENCE = 256;
    constexpr size_t MAX_STRING_SEQUENCE = 4096;

    enum class escape_state : uint8_t
    {
        normal,
        saw_escape,
        in_sequence,
    };

    enum class sequence_kind : uint8_t
    {
        // ESC [ params intermediates final
        csi,
        // ESC ] P X ^ _ ... terminated by BEL or ESC backslash
        string,
        // ESC intermediates final
        nf,
    };

    // Everything carried from one chunk to the next. Never shared between inputs.
    struct state
    {
        escape_state escape = escape_state::normal;
        sequence_kind kind = sequence_kind::csi;
        bool string_saw_escape = false;
        // Bytes of the sequence in progress, after the ESC.
        std::string sequence;
        // A 0xC2 lead byte waiting to see whether it starts a C1 control.
        bool pending_c2 = false;
        char last_emitted = '\0';
        bool at_line_start = true;
    };

    // Sanitizes one input. first_unit and last_unit place it within the invocation so the code fence opens once
    // before everything and closes once after everything.
    class stream
    {
        const config &_config;
        state _state;
        bool _first_unit;
        bool _last_unit;

        void scan(char c, std::string &out);
        void start_sequence(sequence_kind kind, char c);
        void continue_sequence(char c, std::string &out);
        void abandon_sequence(std::string &out);
        void filter(char c, std::string &out);
        void emit(char c, std::string &out);

    public:
        stream(const config &cfg, bool first_unit, bool last_unit);
        DISABLE_COPY(stream)

        // Opening fence (first unit only), then the preamble, which must already be clean.
        void begin(std::string &out, std::string_view preamble = {});
        void feed(std::string_view chunk, std::string &out);
        // Resolves carried state, puts the epilogue (already clean) on a line of its own, and writes the closing
        // fence after the last unit.
        void finish(std::string &out, std::string_view epilogue = {});

        [[nodiscard]] const state &current_state() const { return _state; }
        [[nodiscard]] bool at_line_start() const { return _state.at_line_start; }
    };

    std::string_view newline(const config &cfg);

    // Pulls bounded chunks with read(buffer, size), which returns 0 at end of input, and pushes sanitized bytes to
    // write(std::string_view). Memory stays at one chunk plus the carried state however long the input is.
    template <typename Reader, typename Writer>
    void sanitize(Reader &&read, Writer &&write, stream &s, const std::string_view preamble = {},
                  const std::string_view epilogue = {})
    {
        std::vector<char> chunk(common::CHUNK_SIZE);
        std::string out;
        out.reserve(common::CHUNK_SIZE * 2);

        s.begin(out, preamble);
        for (;;)
        {
            const size_t bytes = read(chunk.data(), chunk.size());
            if (bytes == 0)
            {
                break;
            }
            s.feed(std::string_view(chunk.data(), bytes), out);
            write(std::string_view(out));
            out.clear();
        }
        s.finish(out, epilogue);
        write(std::string_view(out));
    }
}
