#pragma once

#include "./settings.hpp"

#include <fwb/util/fs/path.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace fwb {

/**
 * Name of the repository that holds the packages of the project being built.
 */
inline constexpr std::string_view local_repo_name = "local";

/**
 * A source package on disk: a directory holding a `pkg.yml` and, depending on its role, a
 * `bsp.yml`, `target.yml` or `compiler.yml`.
 */
class local_package {
    std::string           _name;
    std::string           _repo;
    fs::path              _base_path;
    settings              _manifest;
    std::vector<fs::path> _cfg_files;

public:
    local_package() = default;

    /**
     * Load the package in `dir`. If `pkg.yml` declares no `pkg.name`, `default_name` is used.
     */
    static local_package load(path_ref         dir,
                              std::string_view default_name,
                              std::string_view repo = local_repo_name);

    auto& name() const noexcept { return _name; }
    auto& repo_name() const noexcept { return _repo; }
    auto& base_path() const noexcept { return _base_path; }

    /// The `pkg.yml` settings
    auto& manifest() const noexcept { return _manifest; }

    /**
     * Every manifest file belonging to this package. A change to any of them invalidates every
     * object built from the package set.
     */
    auto& cfg_files() const noexcept { return _cfg_files; }

    /// `name()` for the local repository, `@repo/name` otherwise
    std::string full_name() const;

    /// The final component of `name()`
    std::string basename() const noexcept { return name_basename(_name); }

    /// The `pkg.type` declared by the manifest, or "lib"
    std::string type() const;
};

}  // namespace fwb
