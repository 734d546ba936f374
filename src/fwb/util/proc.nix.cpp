#ifndef _WIN32
#include "./proc.hpp"

#include <fwb/util/log.hpp>

#include <fmt/core.h>

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <optional>
#include <system_error>

using namespace fwb;

namespace {

void check_rc(bool b, std::string_view s) {
    if (!b) {
        throw std::system_error(std::error_code(errno, std::system_category()), std::string(s));
    }
}

::pid_t spawn_child(const proc_options& opts, int stdout_pipe, int close_me) noexcept {
    // We must allocate BEFORE fork(), since the CRT might stumble with malloc()-related locks that
    // are held during the fork().
    std::vector<const char*> strings;
    strings.reserve(opts.command.size() + 1);
    for (auto& s : opts.command) {
        strings.push_back(s.data());
    }
    strings.push_back(nullptr);

    std::string workdir = opts.cwd.value_or(std::filesystem::current_path()).string();
    auto        not_found_err
        = fmt::format("[fwb child executor] The requested executable [{}] could not be found.\n",
                      strings[0]);

    auto child_pid = ::fork();
    if (child_pid != 0) {
        return child_pid;
    }
    // We are child
    ::close(close_me);
    if (opts.timeout && ::setpgid(0, 0) == -1) {
        std::fputs("[fwb child executor] Failed to create a process group\n", stderr);
        std::_Exit(-1);
    }
    if (::dup2(stdout_pipe, STDOUT_FILENO) == -1 || ::dup2(stdout_pipe, STDERR_FILENO) == -1) {
        std::fputs("[fwb child executor] Failed to redirect output\n", stderr);
        std::_Exit(-1);
    }
    if (::chdir(workdir.data()) == -1) {
        std::fputs("[fwb child executor] Failed to chdir() for subprocess\n", stderr);
        std::_Exit(-1);
    }

    ::execvp(strings[0], (char* const*)strings.data());

    if (errno == ENOENT) {
        std::fputs(not_found_err.c_str(), stderr);
        std::_Exit(-1);
    }

    std::fputs("[fwb child executor] execvp returned! This is a fatal error: ", stderr);
    std::fputs(std::strerror(errno), stderr);
    std::fputs("\n", stderr);
    std::_Exit(-1);
}

}  // namespace

proc_result fwb::run_proc(const proc_options& opts) {
    fwb_log(trace, "Spawning subprocess: {}", quote_command(opts.command));
    int  stdio_pipe[2] = {};
    auto rc            = ::pipe(stdio_pipe);
    check_rc(rc == 0, "Create stdio pipe for subprocess");

    int read_pipe  = stdio_pipe[0];
    int write_pipe = stdio_pipe[1];

    auto child = spawn_child(opts, write_pipe, read_pipe);
    check_rc(child != -1, "Failed to fork() subprocess");

    ::close(write_pipe);
    if (opts.timeout) {
        // The child does the same. Whichever runs first wins, so a failure here is expected.
        static_cast<void>(::setpgid(child, child));
    }

    pollfd stdio_fd;
    stdio_fd.fd     = read_pipe;
    stdio_fd.events = POLLIN;

    proc_result res;

    using namespace std::chrono_literals;
    using clock = std::chrono::steady_clock;

    // On timeout the child's process group is sent SIGINT. If it has not gone away after
    // `kill_grace`, it is sent SIGKILL, and after another `kill_grace` we stop waiting for
    // output from descendants that left the group.
    constexpr auto kill_grace = 1s;
    enum class stop_stage { running, interrupted, killed };

    auto                             stage = stop_stage::running;
    std::optional<clock::time_point> deadline;
    if (opts.timeout) {
        deadline = clock::now() + *opts.timeout;
    }

    while (true) {
        if (deadline && clock::now() >= *deadline) {
            if (stage == stop_stage::running) {
                fwb_log(debug, "Subprocess [{}] timed out", quote_command(opts.command));
                res.timed_out = true;
                ::kill(-child, SIGINT);
                stage = stop_stage::interrupted;
            } else if (stage == stop_stage::interrupted) {
                fwb_log(debug,
                        "Subprocess [{}] did not stop after SIGINT. Sending SIGKILL",
                        quote_command(opts.command));
                ::kill(-child, SIGKILL);
                stage = stop_stage::killed;
            } else {
                break;
            }
            deadline = clock::now() + kill_grace;
        }

        int poll_ms = -1;
        if (deadline) {
            auto remaining
                = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - clock::now());
            poll_ms = static_cast<int>(std::max(remaining, 0ms).count());
        }
        rc = ::poll(&stdio_fd, 1, poll_ms);
        if (rc < 0 && errno == EINTR) {
            errno = 0;
            continue;
        }
        check_rc(rc >= 0, "Failed in poll()");
        if (rc == 0) {
            // The deadline passed. Handled at the top of the loop.
            continue;
        }
        std::string buffer;
        buffer.resize(1024);
        auto nread = ::read(stdio_fd.fd, buffer.data(), buffer.size());
        if (nread == 0) {
            break;
        }
        if (nread < 0 && errno == EINTR) {
            continue;
        }
        check_rc(nread > 0, "Failed in read()");
        res.output.append(buffer.begin(), buffer.begin() + nread);
    }
    ::close(read_pipe);

    int status = 0;
    rc         = ::waitpid(child, &status, 0);
    check_rc(rc >= 0, "Failed in waitpid()");

    if (WIFEXITED(status)) {
        res.retc = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.signal = WTERMSIG(status);
    }

    return res;
}

#endif  // _WIN32
