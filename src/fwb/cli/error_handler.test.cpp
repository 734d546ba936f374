#include <fwb/cli/error_handler.hpp>

#include <fwb/build/errors.hpp>
#include <fwb/error/errors.hpp>
#include <fwb/error/on_error.hpp>
#include <fwb/pkg/errors.hpp>
#include <fwb/toolchain/errors.hpp>
#include <fwb/util/parse_enum.hpp>
#include <fwb/util/yaml/errors.hpp>
#include <fwb/util/yaml/parse.hpp>

#include <boost/leaf/exception.hpp>
#include <catch2/catch.hpp>

#include <stdexcept>

namespace {

enum class color { red, green };

}  // namespace

TEST_CASE("Successful runs keep their exit code") {
    CHECK(fwb::handle_build_errors([] { return 0; }) == 0);
    CHECK(fwb::handle_build_errors([] { return 3; }) == 3);
}

TEST_CASE("Problems in the project exit with 1") {
    CHECK(fwb::handle_build_errors([]() -> int {
              FWB_E_SCOPE(fwb::e_target_name{"targets/blinky"});
              BOOST_LEAF_THROW_EXCEPTION(fwb::make_user_error<fwb::errc::configuration_error>(
                                             "Package not found: {}",
                                             "libs/nope"),
                                         fwb::e_dependency_name{"libs/nope"});
          })
          == 1);

    CHECK(fwb::handle_build_errors([]() -> int {
              BOOST_LEAF_THROW_EXCEPTION(fwb::make_user_error<fwb::errc::unsatisfied_api>(
                                             "Unsatisfied APIs detected:"),
                                         fwb::e_unsatisfied_apis{{{"apps/blinky", "console"}}});
          })
          == 1);

    CHECK(fwb::handle_build_errors([]() -> int {
              BOOST_LEAF_THROW_EXCEPTION(fwb::make_user_error<fwb::errc::test_failure>(
                                             "Test failure (libs/os)"),
                                         fwb::e_package_name{"libs/os"},
                                         fwb::e_test_output{"FAIL: os_test_sem"});
          })
          == 1);

    CHECK(fwb::handle_build_errors([]() -> int {
              fwb::parse_yaml_string("pkg.deps: [");
              return 0;
          })
          == 1);

    CHECK(fwb::handle_build_errors([]() -> int {
              FWB_E_SCOPE(fwb::e_manifest_key{"compiler.color"});
              fwb::parse_enum_str<color>("blue");
              return 0;
          })
          == 1);
}

TEST_CASE("Tool failures exit with 1") {
    CHECK(fwb::handle_build_errors([]() -> int {
              FWB_E_SCOPE(fwb::e_package_name{"libs/os"});
              BOOST_LEAF_THROW_EXCEPTION(fwb::make_external_error<fwb::errc::compile_failure>(
                                             "Compilation failed for [{}]",
                                             "src/os.c"),
                                         fwb::e_tool_command{"cc -c src/os.c -o os.c.o"},
                                         fwb::e_tool_output{"src/os.c:1:1: error"});
          })
          == 1);
}

TEST_CASE("Unexpected errors exit with 42") {
    CHECK(fwb::handle_build_errors([]() -> int { throw std::logic_error("oops"); }) == 42);
    CHECK(fwb::handle_build_errors([]() -> int {
              throw std::system_error(std::make_error_code(std::errc::io_error));
          })
          == 42);
    CHECK(fwb::handle_build_errors([]() -> int { throw 12; }) == 42);
}
