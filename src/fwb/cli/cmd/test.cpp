#include "./build_common.hpp"

#include <fwb/error/errors.hpp>
#include <fwb/pkg/errors.hpp>
#include <fwb/util/log.hpp>

#include <boost/leaf/exception.hpp>

#include <vector>

using namespace fwb;

namespace fwb::cli::cmd {

int test(const options& opts) {
    auto proj   = load_project_target(opts);
    auto params = build_params_from(opts);

    // Resolve every name up front so that a typo fails before anything is built
    std::vector<const local_package*> pkgs;
    for (auto& name : opts.test_packages) {
        auto pkg = proj.repo.find(name);
        if (pkg == nullptr) {
            BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::configuration_error>(
                                           "Package to test not found: {}",
                                           name),
                                       e_dependency_name{name});
        }
        pkgs.push_back(pkg);
    }

    // Each test is a build of its own: the package under test changes the feature set
    for (auto pkg : pkgs) {
        builder b{proj.repo, proj.target, params};
        b.test(*pkg);
    }
    fwb_log(info, "Passed tests: {}", pkgs.size());
    return 0;
}

}  // namespace fwb::cli::cmd
