#pragma once

#include <fwb/util/fs/path.hpp>

#include <chrono>
#include <optional>

namespace fwb {

struct build_params {
    /// Root of all build output. Each target builds into a subdirectory named after it.
    fs::path out_root;
    /// Limit on each compile, archive and link invocation
    std::optional<std::chrono::milliseconds> tool_timeout = std::nullopt;
    /// Limit on the execution of a test executable
    std::chrono::milliseconds test_timeout = std::chrono::seconds(10);
};

}  // namespace fwb
