#pragma once

#include <filesystem>
#include <string>

namespace fwb {

struct e_toolchain_filepath {
    std::filesystem::path value;
};

struct e_build_profile {
    std::string value;
};

/// The command line of a failed tool invocation, rendered for display
struct e_tool_command {
    std::string value;
};

/// The combined stdout/stderr of a failed tool invocation
struct e_tool_output {
    std::string value;
};

}  // namespace fwb
