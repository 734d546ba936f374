#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fwb {

bool needs_quoting(std::string_view);

std::string quote_argument(std::string_view);

template <typename Container>
std::string quote_command(const Container& c) {
    std::string acc;
    for (const auto& arg : c) {
        acc += quote_argument(arg) + " ";
    }
    if (!acc.empty()) {
        acc.pop_back();
    }
    return acc;
}

struct proc_result {
    int         signal    = 0;
    int         retc      = 0;
    bool        timed_out = false;
    std::string output;

    bool okay() const noexcept { return retc == 0 && signal == 0 && !timed_out; }
};

struct proc_options {
    std::vector<std::string> command;

    /**
     * Working directory of the child. The parent's working directory is never changed.
     */
    std::optional<std::filesystem::path> cwd = std::nullopt;

    /**
     * Limit on the run time of the subprocess, counted from its start. If unset, will wait
     * forever. On expiry the child and its descendants are sent SIGINT, then SIGKILL if they
     * are still running a second later, and the result is marked as timed out.
     */
    std::optional<std::chrono::milliseconds> timeout = std::nullopt;
};

/**
 * Run a subprocess to completion, capturing its stdout and stderr together.
 */
proc_result run_proc(const proc_options& opts);

inline proc_result run_proc(std::vector<std::string> args) {
    return run_proc(proc_options{.command = std::move(args)});
}

}  // namespace fwb
