#pragma once

#include <yaml-cpp/node/node.h>

#include <filesystem>
#include <string_view>

namespace fwb {

/**
 * @brief Parse the YAML file at the given path.
 *
 * Syntax errors throw `user_error<errc::invalid_manifest>` with an `e_yaml_parse_error` and the
 * `e_manifest_path` attached.
 */
YAML::Node parse_yaml_file(const std::filesystem::path& fpath);

YAML::Node parse_yaml_string(std::string_view);

}  // namespace fwb
