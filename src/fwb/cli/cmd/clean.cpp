#include "./build_common.hpp"

#include <fwb/util/log.hpp>

using namespace fwb;

namespace fwb::cli::cmd {

int clean(const options& opts) {
    auto proj = load_project_target(opts);
    builder b{proj.repo, proj.target, build_params_from(opts)};
    b.clean();
    fwb_log(info,
            "Removed the build output of [{}]: {}",
            proj.target.full_name(),
            b.bin_dir().string());
    return 0;
}

}  // namespace fwb::cli::cmd
