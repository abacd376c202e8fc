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

#include "process.hpp"

#include <cerrno>
#include <format>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "common.hpp"
#include "log.hpp"

extern char **environ;

namespace
{
    constexpr logging::logger LOG("process");

    void check(const int rc, const char *what)
    {
        if (rc != 0)
        {
            throw std::system_error(rc, std::generic_category(), what);
        }
    }

    class spawn_actions
    {
        posix_spawn_file_actions_t _actions;

    public:
        spawn_actions() { check(posix_spawn_file_actions_init(&_actions), "posix_spawn_file_actions_init"); }
        ~spawn_actions() { posix_spawn_file_actions_destroy(&_actions); }
        DISABLE_COPY(spawn_actions)

        posix_spawn_file_actions_t *get() { return &_actions; }
    };

    class output_pipe
    {
        int _fds[2] = {-1, -1};

    public:
        output_pipe()
        {
            if (pipe2(_fds, O_CLOEXEC) != 0)
            {
                throw std::system_error(errno, std::generic_category(), "pipe2");
            }
        }

        ~output_pipe()
        {
            close_read();
            close_write();
        }

        DISABLE_COPY(output_pipe)

        int read_end() const { return _fds[0]; }
        int write_end() const { return _fds[1]; }

        void close_read()
        {
            if (_fds[0] >= 0)
            {
                ::close(_fds[0]);
                _fds[0] = -1;
            }
        }

        void close_write()
        {
            if (_fds[1] >= 0)
            {
                ::close(_fds[1]);
                _fds[1] = -1;
            }
        }
    };

    int wait_for(const pid_t pid)
    {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
            {
                throw std::system_error(errno, std::generic_category(), "waitpid");
            }
        }
        if (WIFEXITED(status))
        {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status))
        {
            return 128 + WTERMSIG(status);
        }
        return -1;
    }
}

process::result process::run(const std::vector<std::string> &argv,
                             const std::optional<std::filesystem::path> &stdin_from, const bool capture_output)
{
    if (argv.empty())
    {
        throw std::invalid_argument("empty command line");
    }

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv)
    {
        args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    spawn_actions actions;
    if (stdin_from)
    {
        check(posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, stdin_from->c_str(), O_RDONLY, 0),
              "posix_spawn_file_actions_addopen");
    }

    std::optional<output_pipe> out;
    if (capture_output)
    {
        out.emplace();
        check(posix_spawn_file_actions_adddup2(actions.get(), out->write_end(), STDOUT_FILENO),
              "posix_spawn_file_actions_adddup2");
    }

    LOG.debug("spawning {} with {} argument(s)", argv.front(), argv.size() - 1);
    pid_t pid = 0;
    const int rc = posix_spawnp(&pid, args[0], actions.get(), nullptr, args.data(), environ);
    if (rc != 0)
    {
        throw std::system_error(rc, std::generic_category(), std::format("unable to start {}", argv.front()));
    }

    result res;
    int read_errno = 0;
    if (out)
    {
        out->close_write();
        char buffer[4096];
        for (;;)
        {
            const ssize_t bytes = ::read(out->read_end(), buffer, sizeof(buffer));
            if (bytes > 0)
            {
                res.output.append(buffer, static_cast<size_t>(bytes));
            }
            else if (bytes == 0)
            {
                break;
            }
            else if (errno != EINTR)
            {
                read_errno = errno;
                break;
            }
        }
        out->close_read();
    }

    res.exit_code = wait_for(pid);
    LOG.debug("{} exited with status {}", argv.front(), res.exit_code);
    if (read_errno != 0)
    {
        throw std::system_error(read_errno, std::generic_category(),
                                std::format("unable to read output of {}", argv.front()));
    }
    return res;
}
