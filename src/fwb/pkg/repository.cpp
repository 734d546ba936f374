#include "./repository.hpp"

#include "./errors.hpp"

#include <fwb/error/errors.hpp>
#include <fwb/util/log.hpp>
#include <fwb/util/string.hpp>

#include <boost/leaf/exception.hpp>

using namespace fwb;

namespace {

bool skip_directory(path_ref dir) {
    auto fname = dir.filename().string();
    return fname == "bin" || starts_with(fname, ".");
}

}  // namespace

package_repository package_repository::load(path_ref root, std::string_view name) {
    package_repository ret;
    ret._name = std::string(name);
    ret._root = fs::weakly_canonical(root);

    fwb_log(debug, "Scanning for packages in [{}]", ret._root.string());

    auto add_dir = [&](path_ref dir) {
        auto rel_name = fs::relative(dir, ret._root).generic_string();
        if (rel_name == ".") {
            rel_name = ret._root.filename().string();
        }
        auto pkg = local_package::load(dir, rel_name, ret._name);
        auto it  = ret._packages.find(pkg.name());
        if (it != ret._packages.end()) {
            BOOST_LEAF_THROW_EXCEPTION(
                make_user_error<errc::configuration_error>(
                    "Duplicate package name '{}' declared in [{}] and [{}]",
                    pkg.name(),
                    it->second.base_path().string(),
                    dir.string()),
                e_package_name{pkg.name()});
        }
        auto pkg_name = pkg.name();
        ret._packages.emplace(std::move(pkg_name), std::move(pkg));
    };

    if (fs::is_regular_file(ret._root / "pkg.yml")) {
        add_dir(ret._root);
    }

    auto iter = fs::recursive_directory_iterator(ret._root);
    for (; iter != fs::recursive_directory_iterator(); ++iter) {
        if (!iter->is_directory()) {
            continue;
        }
        if (skip_directory(iter->path())) {
            iter.disable_recursion_pending();
            continue;
        }
        if (fs::is_regular_file(iter->path() / "pkg.yml")) {
            add_dir(iter->path());
        }
    }

    fwb_log(debug, "Found {} package(s)", ret._packages.size());
    return ret;
}

const local_package* package_repository::find(std::string_view name) const noexcept {
    if (starts_with(name, "@")) {
        auto slash = name.find('/');
        if (slash == name.npos || name.substr(1, slash - 1) != _name) {
            return nullptr;
        }
        name = name.substr(slash + 1);
    }
    auto it = _packages.find(name);
    if (it == _packages.end()) {
        return nullptr;
    }
    return &it->second;
}
