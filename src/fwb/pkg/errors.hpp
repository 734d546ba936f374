#pragma once

#include <string>

namespace fwb {

struct e_package_name {
    std::string value;
};

struct e_target_name {
    std::string value;
};

struct e_dependency_name {
    std::string value;
};

}  // namespace fwb
