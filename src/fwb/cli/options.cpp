#include "./options.hpp"

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>

#include <args.hxx>

#include <sstream>

using namespace fwb;
using namespace fwb::cli;

namespace {

using path_flag    = args::ValueFlag<fs::path>;
using seconds_flag = args::ValueFlag<int>;

/**
 * Base class holds the actual argument parser
 */
struct cli_base {
    args::ArgumentParser& parser;
    args::HelpFlag _help{parser, "help", "Display this help message and exit", {'h', "help"}};

    args::Group cmd_group{parser, "Available Commands"};
};

/**
 * Flags common to all subcommands
 */
struct common_flags {
    args::Command& cmd;

    args::HelpFlag _help{cmd, "help", "Print this help message and exit", {'h', "help"}};

    args::CounterFlag verbose{cmd,
                              "verbose",
                              "Print debug messages. Given twice, also print trace messages",
                              {'v', "verbose"}};
    args::Flag        quiet{cmd, "quiet", "Print only warnings and errors", {'q', "quiet"}};

    path_flag project{cmd,
                      "project_dir",
                      "Root of the package tree",
                      {'p', "project"},
                      fs::current_path()};
    path_flag out{cmd, "out", "Root of the build output [default: <project>/bin]", {"out"}};

    seconds_flag tool_timeout{cmd,
                              "seconds",
                              "Limit each compiler, archiver, and linker run",
                              {"tool-timeout"}};

    args::Positional<std::string> target{cmd,
                                         "target",
                                         "Name of the target package",
                                         args::Options::Required};
};

struct cli_build {
    cli_base&     base;
    args::Command cmd{base.cmd_group, "build", "Build the target's application"};

    common_flags common{cmd};
};

struct cli_test {
    cli_base&     base;
    args::Command cmd{base.cmd_group,
                      "test",
                      "Build each package in self-test mode and run its test executable"};

    common_flags common{cmd};

    seconds_flag test_timeout{cmd,
                              "seconds",
                              "Limit each test executable [default: 10]",
                              {"test-timeout"}};

    args::PositionalList<std::string> packages{cmd,
                                               "package",
                                               "Names of the packages to test",
                                               args::Options::Required};
};

struct cli_clean {
    cli_base&     base;
    args::Command cmd{base.cmd_group, "clean", "Remove the target's build output"};

    common_flags common{cmd};
};

struct fwb_cli {
    args::ArgumentParser parser{"fwb - Build firmware images from a tree of packages"};

    cli_base  base{parser};
    cli_build build{base};
    cli_test  test{base};
    cli_clean clean{base};

    fwb_cli() { parser.Prog("fwb"); }
};

std::chrono::seconds get_seconds(seconds_flag& flag, std::string_view spelling) {
    auto n = args::get(flag);
    if (n <= 0) {
        BOOST_LEAF_THROW_EXCEPTION(
            invalid_arguments(
                fmt::format("Invalid number of seconds '{}' given for '{}'", n, spelling)),
            e_arg_spelling{std::string(spelling)});
    }
    return std::chrono::seconds(n);
}

}  // namespace

fs::path options::out_root() const noexcept {
    if (out_dir) {
        return fs::absolute(*out_dir);
    }
    return fs::absolute(project_dir) / "bin";
}

void options::parse_argv(const std::vector<std::string>& argv) {
    fwb_cli c;
    try {
        c.parser.ParseArgs(argv);
    } catch (const args::Help&) {
        std::ostringstream help;
        help << c.parser;
        BOOST_LEAF_THROW_EXCEPTION(help_request(help.str()));
    } catch (const args::ValidationError& e) {
        BOOST_LEAF_THROW_EXCEPTION(missing_required(e.what()));
    } catch (const args::Error& e) {
        BOOST_LEAF_THROW_EXCEPTION(invalid_arguments(e.what()));
    }

    common_flags* common = nullptr;
    if (c.build.cmd) {
        subcommand = subcommand::build;
        common     = &c.build.common;
    } else if (c.test.cmd) {
        subcommand    = subcommand::test;
        common        = &c.test.common;
        test_packages = args::get(c.test.packages);
        if (c.test.test_timeout) {
            test_timeout = get_seconds(c.test.test_timeout, "--test-timeout");
        }
    } else if (c.clean.cmd) {
        subcommand = subcommand::clean;
        common     = &c.clean.common;
    } else {
        BOOST_LEAF_THROW_EXCEPTION(missing_required("A subcommand is required"));
    }

    if (common->quiet) {
        log_level = log::level::warn;
    } else if (args::get(common->verbose) == 1) {
        log_level = log::level::debug;
    } else if (args::get(common->verbose) > 1) {
        log_level = log::level::trace;
    }
    project_dir = args::get(common->project);
    if (common->out) {
        out_dir = args::get(common->out);
    }
    if (common->tool_timeout) {
        tool_timeout = get_seconds(common->tool_timeout, "--tool-timeout");
    }
    target = args::get(common->target);
}

std::string fwb::cli::help_string() {
    fwb_cli            c;
    std::ostringstream help;
    help << c.parser;
    return help.str();
}
