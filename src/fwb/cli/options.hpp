#pragma once

#include <fwb/util/fs/path.hpp>
#include <fwb/util/log.hpp>

#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fwb::cli {

/**
 * @brief Top-level fwb subcommands
 */
enum class subcommand {
    _none_,
    build,
    test,
    clean,
};

/// `--help` was given. Holds the help text of the command it was given to.
struct help_request : std::exception {
    std::string help_text;

    explicit help_request(std::string text)
        : help_text(std::move(text)) {}

    const char* what() const noexcept override { return "Help was requested"; }
};

/// The command line could not be understood. Carries an `e_arg_spelling` where one applies.
struct invalid_arguments : std::runtime_error {
    using runtime_error::runtime_error;
};

/// A subcommand or one of its required arguments was not given
struct missing_required : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

struct e_arg_spelling {
    std::string value;
};

/**
 * @brief Complete aggregate of all fwb command-line options
 */
struct options {
    // -v, -vv, or -q
    log::level log_level = log::level::info;

    // The '--project' argument. Defaults to the working directory.
    fs::path project_dir = fs::current_path();
    // The '--out' argument. Defaults to '<project>/bin'.
    std::optional<fs::path> out_dir;
    // The '--tool-timeout' argument, in seconds
    std::optional<std::chrono::seconds> tool_timeout;
    // The '--test-timeout' argument, in seconds
    std::chrono::seconds test_timeout{10};

    enum subcommand subcommand = subcommand::_none_;

    // Name of the target package to operate on
    std::string target;
    // 'test' only: the packages to test, each in a build of its own
    std::vector<std::string> test_packages;

    /// The root of all build output
    fs::path out_root() const noexcept;

    /**
     * Fill the options from the program arguments (excluding the program name). Throws
     * `invalid_arguments` for malformed input, or `help_request` if help was asked for.
     */
    void parse_argv(const std::vector<std::string>& argv);
};

/// Help text of the top-level command
std::string help_string();

}  // namespace fwb::cli
