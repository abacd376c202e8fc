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

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <utility>

#include <stdlib.h>
#include <unistd.h>

#include "errors.hpp"
#include "util.hpp"

// Read side of one input: a regular file opened here, or the process's stdin which is borrowed and never closed.
class input_file
{
    FILE *_file = nullptr;
    bool _owned = false;
    std::string _name;

    input_file(FILE *file, const bool owned, std::string name) : _file(file), _owned(owned), _name(std::move(name)) {}

public:
    explicit input_file(const std::filesystem::path &path) : _owned(true), _name(path.string())
    {
        _file = std::fopen(path.c_str(), "rb");
        if (!_file)
        {
            throw errors::unreadable_input_error(std::format("unable to open {}: {}", _name, std::strerror(errno)));
        }
    }

    ~input_file()
    {
        if (_file && _owned)
        {
            std::fclose(_file);
        }
    }

    DISABLE_COPY(input_file)

    static input_file standard_input() { return input_file(stdin, false, "<STDIN>"); }

    // Returns 0 only at end of input.
    size_t read(char *buffer, const size_t size)
    {
        const size_t bytes = std::fread(buffer, 1, size, _file);
        if (bytes == 0 && std::ferror(_file))
        {
            throw errors::io_error(std::format("unable to read {}", _name));
        }
        return bytes;
    }

    const std::string &name() const { return _name; }
};

// Private temporary file holding an assembled payload until it is handed over in one piece. Removed on destruction.
class spool_file
{
    FILE *_file = nullptr;
    std::filesystem::path _path;
    size_t _size = 0;

    void _cleanup()
    {
        if (_file)
        {
            std::fclose(_file);
            _file = nullptr;
        }
        if (!_path.empty())
        {
            std::error_code ec;
            std::filesystem::remove(_path, ec);
            _path.clear();
        }
    }

public:
    spool_file()
    {
        auto pattern = (std::filesystem::temp_directory_path() / "wsl-clip-XXXXXX").string();
        const int fd = mkstemp(pattern.data());
        if (fd < 0)
        {
            throw errors::io_error(std::format("unable to create spool file: {}", std::strerror(errno)));
        }
        _path = pattern;
        _file = fdopen(fd, "w+b");
        if (!_file)
        {
            close(fd);
            _cleanup();
            throw errors::io_error("unable to open spool file");
        }
    }

    ~spool_file() { _cleanup(); }

    spool_file(spool_file &&other) noexcept
        : _file(std::exchange(other._file, nullptr)), _path(std::exchange(other._path, {})),
          _size(std::exchange(other._size, 0))
    {
    }

    spool_file &operator=(spool_file &&other) noexcept
    {
        if (this != &other)
        {
            _cleanup();
            _file = std::exchange(other._file, nullptr);
            _path = std::exchange(other._path, {});
            _size = std::exchange(other._size, 0);
        }
        return *this;
    }

    DISABLE_COPY(spool_file)

    void write(const std::string_view data)
    {
        if (data.empty())
        {
            return;
        }
        if (std::fwrite(data.data(), 1, data.size(), _file) != data.size())
        {
            throw errors::io_error(std::format("unable to write spool file {}", _path.string()));
        }
        _size += data.size();
    }

    // Must be called before another process reads the file.
    void flush()
    {
        if (std::fflush(_file) != 0)
        {
            throw errors::io_error(std::format("unable to flush spool file {}", _path.string()));
        }
    }

    const std::filesystem::path &path() const { return _path; }
    size_t size() const { return _size; }
};
