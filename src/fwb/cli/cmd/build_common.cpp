#include "./build_common.hpp"

#include <fwb/util/log.hpp>

using namespace fwb;

cli::project_target cli::load_project_target(const options& opts) {
    auto repo = package_repository::load(opts.project_dir);
    fwb_log(debug,
            "Loaded {} package(s) from [{}]",
            repo.packages().size(),
            repo.root().string());
    auto tgt = target::load(repo, opts.target);
    return project_target{std::move(repo), std::move(tgt)};
}

build_params cli::build_params_from(const options& opts) {
    return build_params{
        .out_root     = opts.out_root(),
        .tool_timeout = opts.tool_timeout,
        .test_timeout = opts.test_timeout,
    };
}
