#include "./build_common.hpp"

using namespace fwb;

namespace fwb::cli::cmd {

int build(const options& opts) {
    auto proj = load_project_target(opts);
    builder b{proj.repo, proj.target, build_params_from(opts)};
    b.build();
    return 0;
}

}  // namespace fwb::cli::cmd
