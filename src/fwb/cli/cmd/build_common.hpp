#pragma once

#include "../options.hpp"

#include <fwb/build/builder.hpp>
#include <fwb/build/params.hpp>
#include <fwb/pkg/repository.hpp>
#include <fwb/pkg/target.hpp>

namespace fwb::cli {

/**
 * The package tree named by '--project' and the target named on the command line.
 */
struct project_target {
    package_repository repo;
    fwb::target        target;
};

project_target load_project_target(const options& opts);

build_params build_params_from(const options& opts);

}  // namespace fwb::cli
