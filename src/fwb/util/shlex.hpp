#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fwb {

std::vector<std::string> split_shell_string(std::string_view s);

}  // namespace fwb
