#include "./dispatch_main.hpp"

#include "./error_handler.hpp"
#include "./options.hpp"

#include <stdexcept>

using namespace fwb;

namespace fwb::cli {

namespace cmd {
using command = int(const options&);

command build;
command test;
command clean;

}  // namespace cmd

int dispatch_main(const options& opts) noexcept {
    return fwb::handle_build_errors([&] {
        switch (opts.subcommand) {
        case subcommand::build:
            return cmd::build(opts);
        case subcommand::test:
            return cmd::test(opts);
        case subcommand::clean:
            return cmd::clean(opts);
        case subcommand::_none_:;
        }
        throw std::logic_error("No subcommand was selected");
    });
}

}  // namespace fwb::cli
