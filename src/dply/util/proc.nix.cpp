#ifndef _WIN32
#include "./proc.hpp"

#include <dply/util/log.hpp>

#include <fmt/core.h>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

using namespace dply;

namespace {

void check_rc(bool b, std::string_view s) {
    if (!b) {
        throw std::system_error(std::error_code(errno, std::system_category()), std::string(s));
    }
}

/// Exit code of a child that could not exec its program, as used by shells
constexpr int exec_failed_rc = 127;

/**
 * Fork and exec the command. The child's stdout and stderr go to `output_fd`. In the parent,
 * returns the child's PID, or -1 if fork() failed.
 */
::pid_t spawn_child(const proc_options& opts, int output_fd, int close_me) noexcept {
    // Everything the child needs is allocated before fork(): the child may not malloc().
    std::vector<const char*> argv;
    argv.reserve(opts.command.size() + 1);
    for (auto& s : opts.command) {
        argv.push_back(s.c_str());
    }
    argv.push_back(nullptr);

    std::optional<std::string> workdir;
    if (opts.cwd) {
        workdir = opts.cwd->string();
    }
    auto not_found_err = fmt::format("[dply] The program [{}] could not be found\n", argv[0]);

    auto child_pid = ::fork();
    if (child_pid != 0) {
        return child_pid;
    }
    // Child:
    if (close_me >= 0) {
        ::close(close_me);
    }
    if (::dup2(output_fd, STDOUT_FILENO) == -1 || ::dup2(output_fd, STDERR_FILENO) == -1
        || (workdir && ::chdir(workdir->c_str()) == -1)) {
        std::_Exit(exec_failed_rc);
    }
    ::close(output_fd);
    ::execvp(argv[0], const_cast<char* const*>(argv.data()));

    if (errno == ENOENT) {
        auto r = ::write(STDERR_FILENO, not_found_err.data(), not_found_err.size());
        (void)r;
    }
    std::_Exit(exec_failed_rc);
}

std::string collect_output(int read_fd) {
    std::string output;
    pollfd      pfd{.fd = read_fd, .events = POLLIN, .revents = 0};
    char        buffer[1024];
    while (true) {
        auto rc = ::poll(&pfd, 1, -1);
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        check_rc(rc >= 0, "Failed in poll()");
        auto nread = ::read(read_fd, buffer, sizeof buffer);
        if (nread == 0) {
            break;
        }
        if (nread < 0 && errno == EINTR) {
            continue;
        }
        check_rc(nread > 0, "Failed in read()");
        output.append(buffer, static_cast<std::size_t>(nread));
    }
    return output;
}

}  // namespace

proc_result dply::run_proc(const proc_options& opts) {
    dply_log(debug, "Spawning subprocess: {}", quote_command(opts.command));
    if (opts.command.empty()) {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "Cannot spawn an empty command");
    }

    proc_result res;
    ::pid_t     child = -1;
    if (opts.capture_output) {
        int fds[2] = {};
        check_rc(::pipe(fds) == 0, "Failed to create an output pipe for a subprocess");
        child = spawn_child(opts, fds[1], fds[0]);
        ::close(fds[1]);
        if (child == -1) {
            ::close(fds[0]);
        }
        check_rc(child != -1, "Failed to fork() a subprocess");
        res.output = collect_output(fds[0]);
        ::close(fds[0]);
    } else {
        int devnull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
        check_rc(devnull != -1, "Failed to open /dev/null for a subprocess");
        child = spawn_child(opts, devnull, -1);
        ::close(devnull);
        check_rc(child != -1, "Failed to fork() a subprocess");
    }

    int status = 0;
    int rc     = 0;
    do {
        rc = ::waitpid(child, &status, 0);
    } while (rc < 0 && errno == EINTR);
    check_rc(rc >= 0, "Failed in waitpid()");

    if (WIFEXITED(status)) {
        res.retc = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.signal = WTERMSIG(status);
    }
    return res;
}

#endif  // _WIN32
