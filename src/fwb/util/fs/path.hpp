#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace fwb {

namespace fs = std::filesystem;

/**
 * @brief Alias of a const& to a std::filesystem::path
 */
using path_ref = const fs::path&;

/**
 * @brief Render `file` relative to `base` if that is shorter than its normalized absolute form.
 */
[[nodiscard]] fs::path shortest_path_from(path_ref file, path_ref base) noexcept;

/**
 * @brief Obtain the final path component of a slash-separated package name.
 *
 * "hw/bsp/native" has the basename "native".
 */
[[nodiscard]] std::string name_basename(std::string_view name) noexcept;

}  // namespace fwb
