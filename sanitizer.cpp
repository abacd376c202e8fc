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

#include "sanitizer.hpp"

namespace
{
    constexpr unsigned char ESC = 0x1b;
    constexpr unsigned char BEL = 0x07;
    constexpr unsigned char C1_LEAD = 0xc2;

    inline bool in_range(const unsigned char b, const unsigned char lo, const unsigned char hi)
    {
        return b >= lo && b <= hi;
    }

    inline bool is_string_introducer(const unsigned char b)
    {
        return b == ']' || b == 'P' || b == 'X' || b == '^' || b == '_';
    }
}

std::string_view sanitizer::newline(const config &cfg) { return cfg.convert_crlf ? "\r\n" : "\n"; }

sanitizer::stream::stream(const config &cfg, const bool first_unit, const bool last_unit)
    : _config(cfg), _first_unit(first_unit), _last_unit(last_unit)
{
}

void sanitizer::stream::begin(std::string &out, const std::string_view preamble)
{
    if (_first_unit && _config.wrap_code_fence)
    {
        for (const char c : FENCE)
        {
            emit(c, out);
        }
        for (const char c : _config.fence_info)
        {
            emit(c, out);
        }
        emit('\n', out);
    }
    for (const char c : preamble)
    {
        emit(c, out);
    }
}

void sanitizer::stream::feed(const std::string_view chunk, std::string &out)
{
    for (const char c : chunk)
    {
        scan(c, out);
    }
}

void sanitizer::stream::finish(std::string &out, const std::string_view epilogue)
{
    switch (_state.escape)
    {
    case escape_state::saw_escape:
        // Stray ESC at the very end.
        _state.escape = escape_state::normal;
        break;
    case escape_state::in_sequence:
        abandon_sequence(out);
        break;
    case escape_state::normal:
        break;
    }
    if (_state.pending_c2)
    {
        _state.pending_c2 = false;
        emit(static_cast<char>(C1_LEAD), out);
    }
    if (!epilogue.empty())
    {
        if (!_state.at_line_start)
        {
            emit('\n', out);
        }
        for (const char c : epilogue)
        {
            emit(c, out);
        }
    }
    if (_last_unit && _config.wrap_code_fence)
    {
        if (!_state.at_line_start)
        {
            emit('\n', out);
        }
        for (const char c : FENCE)
        {
            emit(c, out);
        }
        emit('\n', out);
    }
}

void sanitizer::stream::scan(const char c, std::string &out)
{
    if (!_config.strip_ansi)
    {
        filter(c, out);
        return;
    }

    const auto b = static_cast<unsigned char>(c);
    switch (_state.escape)
    {
    case escape_state::normal:
        if (b == ESC)
        {
            _state.escape = escape_state::saw_escape;
        }
        else
        {
            filter(c, out);
        }
        break;

    case escape_state::saw_escape:
        if (b == '[')
        {
            start_sequence(sequence_kind::csi, c);
        }
        else if (is_string_introducer(b))
        {
            start_sequence(sequence_kind::string, c);
        }
        else if (in_range(b, 0x20, 0x2f))
        {
            start_sequence(sequence_kind::nf, c);
        }
        else if (in_range(b, 0x30, 0x7e))
        {
            // Two-byte sequence such as ESC 7 or ESC c.
            _state.escape = escape_state::normal;
        }
        else
        {
            // The ESC introduces nothing. Drop it and look at this byte afresh.
            _state.escape = escape_state::normal;
            scan(c, out);
        }
        break;

    case escape_state::in_sequence:
        continue_sequence(c, out);
        break;
    }
}

void sanitizer::stream::start_sequence(const sequence_kind kind, const char c)
{
    _state.escape = escape_state::in_sequence;
    _state.kind = kind;
    _state.string_saw_escape = false;
    _state.sequence.clear();
    _state.sequence.push_back(c);
}

void sanitizer::stream::continue_sequence(const char c, std::string &out)
{
    const auto b = static_cast<unsigned char>(c);
    bool complete = false;
    bool malformed = false;

    switch (_state.kind)
    {
    case sequence_kind::csi:
        if (in_range(b, 0x40, 0x7e))
        {
            complete = true;
        }
        else if (!in_range(b, 0x20, 0x3f))
        {
            malformed = true;
        }
        break;

    case sequence_kind::nf:
        if (in_range(b, 0x30, 0x7e))
        {
            complete = true;
        }
        else if (!in_range(b, 0x20, 0x2f))
        {
            malformed = true;
        }
        break;

    case sequence_kind::string:
        if (_state.string_saw_escape)
        {
            if (b == '\\')
            {
                complete = true;
                break;
            }
            // ESC not followed by ST: the string is cut short and that ESC starts a new sequence.
            abandon_sequence(out);
            _state.escape = escape_state::saw_escape;
            scan(c, out);
            return;
        }
        if (b == BEL)
        {
            complete = true;
        }
        else if (b == ESC)
        {
            _state.string_saw_escape = true;
            return;
        }
        else if (b < 0x20)
        {
            malformed = true;
        }
        break;
    }

    if (complete)
    {
        _state.escape = escape_state::normal;
        _state.string_saw_escape = false;
        _state.sequence.clear();
        return;
    }
    if (malformed)
    {
        abandon_sequence(out);
        scan(c, out);
        return;
    }

    _state.sequence.push_back(c);
    const size_t limit = _state.kind == sequence_kind::string ? MAX_STRING_SEQUENCE : MAX_CONTROL_SEQUENCE;
    if (_state.sequence.size() > limit)
    {
        abandon_sequence(out);
    }
}

void sanitizer::stream::abandon_sequence(std::string &out)
{
    // The ESC is dropped as a stray byte; whatever followed it is ordinary text after all. The gathered bytes never
    // contain ESC, so rescanning them cannot start another sequence.
    std::string gathered;
    gathered.swap(_state.sequence);
    _state.escape = escape_state::normal;
    _state.string_saw_escape = false;
    for (const char g : gathered)
    {
        scan(g, out);
    }
}

void sanitizer::stream::filter(const char c, std::string &out)
{
    if (!_config.strip_control)
    {
        emit(c, out);
        return;
    }

    const auto b = static_cast<unsigned char>(c);
    if (_state.pending_c2)
    {
        _state.pending_c2 = false;
        if (in_range(b, 0x80, 0x9f))
        {
            // UTF-8 encoded C1 control, e.g. U+009B which terminals treat as CSI.
            return;
        }
        emit(static_cast<char>(C1_LEAD), out);
    }
    if (b == C1_LEAD)
    {
        _state.pending_c2 = true;
        return;
    }
    if (b == '\t' || b == '\n' || b == '\r')
    {
        emit(c, out);
        return;
    }
    if (b < 0x20 || b == 0x7f)
    {
        return;
    }
    emit(c, out);
}

void sanitizer::stream::emit(const char c, std::string &out)
{
    if (_config.convert_crlf && c == '\n' && _state.last_emitted != '\r')
    {
        out.push_back('\r');
    }
    out.push_back(c);
    _state.last_emitted = c;
    _state.at_line_start = c == '\n';
}
