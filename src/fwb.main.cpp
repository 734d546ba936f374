#include <fwb/cli/dispatch_main.hpp>
#include <fwb/cli/options.hpp>
#include <fwb/util/log.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fmt/core.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

int main_fn(const std::vector<std::string>& argv) {
    fwb::log::init_logger();

    fwb::cli::options opts;

    auto result = boost::leaf::try_catch(
        [&]() -> std::optional<int> {
            opts.parse_argv(argv);
            return std::nullopt;
        },
        [&](const fwb::cli::help_request& req) -> std::optional<int> {
            std::cout << req.help_text;
            return 0;
        },
        [&](const fwb::cli::invalid_arguments& err,
            fwb::cli::e_arg_spelling           spell) -> std::optional<int> {
            std::cerr << fwb::cli::help_string();
            std::cerr << fmt::format("{} (at '{}')\n", err.what(), spell.value);
            return 2;
        },
        [&](const fwb::cli::invalid_arguments& err) -> std::optional<int> {
            std::cerr << fwb::cli::help_string();
            std::cerr << fmt::format("Error: {}\n", err.what());
            return 2;
        });
    if (result) {
        // Non-null result from argument parsing, return that value immediately.
        return *result;
    }
    fwb::log::current_log_level = opts.log_level;
    return fwb::cli::dispatch_main(opts);
}

int main(int argc, char** argv) { return main_fn({argv + 1, argv + argc}); }
