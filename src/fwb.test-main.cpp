#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <fwb/util/log.hpp>

int main(int argc, char** argv) {
    fwb::log::init_logger();
    // Expected failures are logged at error level. Keep them out of the test report.
    fwb::log::current_log_level = fwb::log::level::critical;
    return Catch::Session().run(argc, argv);
}
