#pragma once

#include <filesystem>
#include <string>

namespace fwb {

struct e_yaml_parse_error {
    std::string value;
};

struct e_manifest_path {
    std::filesystem::path value;
};

struct e_manifest_key {
    std::string value;
};

}  // namespace fwb
