#include "./errors.hpp"

#include <exception>

using namespace fwb;

std::string_view fwb::explanation_of(fwb::errc ec) noexcept {
    switch (ec) {
    case errc::configuration_error:
        return R"(
The target, its BSP, or its compiler could not be resolved. Check that the target
names a BSP (`target.bsp`), that the BSP names a compiler (`bsp.compiler`), and
that every package named in `pkg.deps` exists in the project.
)";
    case errc::unsatisfied_api:
        return R"(
One or more packages require an API (`pkg.req_apis`) that no package in the build
provides (`pkg.apis`). Every unsatisfied package/API pair is listed above. Add a
dependency on a package that provides the API, or enable the feature that pulls
one in.
)";
    case errc::filesystem_error:
        return R"(
A filesystem operation failed while preparing or cleaning the build output. Refer
to the operating system error shown above.
)";
    case errc::compile_failure:
        return R"(
Source compilation failed. Refer to the compiler output.
)";
    case errc::archive_failure:
        return R"(
Creating a package's static library archive failed. It is unlikely that regular
user action can cause archiving to fail. Refer to the output of the archiving tool.
)";
    case errc::link_failure:
        return R"(
Linking the output binary failed. Refer to the linker output. Missing symbols
usually mean a package dependency or a required API was not declared.
)";
    case errc::test_failure:
        return R"(
The test executable exited with a non-zero status. Its output is shown above.
)";
    case errc::invalid_manifest:
        return R"(
A package, BSP, target, or compiler manifest could not be read. Refer to the
message above for the offending file and key.
)";
    case errc::none:
        break;
    }
    return "(No explanation is available for this error)";
}
