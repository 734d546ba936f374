#pragma once

#include "./local_package.hpp"

#include <fwb/util/fs/path.hpp>

#include <map>
#include <string>
#include <string_view>

namespace fwb {

/**
 * The set of packages found beneath a project root.
 */
class package_repository {
    std::string                                       _name;
    fs::path                                          _root;
    std::map<std::string, local_package, std::less<>> _packages;

public:
    package_repository() = default;

    /**
     * Discover every package below `root`. Hidden directories and `bin/` directories are not
     * searched. Two packages declaring the same name is a `configuration_error`.
     */
    static package_repository load(path_ref root, std::string_view name = local_repo_name);

    auto& name() const noexcept { return _name; }
    auto& root() const noexcept { return _root; }
    auto& packages() const noexcept { return _packages; }

    /**
     * Find a package by name. An `@repo/` prefix naming this repository is accepted. Returns
     * `nullptr` if there is no such package.
     */
    const local_package* find(std::string_view name) const noexcept;
};

}  // namespace fwb
