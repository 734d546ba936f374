#include "./build_package.hpp"

#include "./builder.hpp"

#include <fwb/error/errors.hpp>
#include <fwb/error/on_error.hpp>
#include <fwb/pkg/errors.hpp>
#include <fwb/util/log.hpp>

#include <boost/leaf/exception.hpp>

using namespace fwb;

bool build_package::_load_deps(builder& b, resolve_result& res) {
    auto& manifest = _pkg->manifest();

    for (auto& feature : manifest.string_seq("pkg.features", b.features(*_pkg))) {
        if (!b.has_feature(feature)) {
            fwb_log(debug, "Package [{}] enables feature '{}'", full_name(), feature);
            b.add_feature(feature);
            res.new_features = true;
        }
    }

    // Features enabled above may gate additional settings
    auto features = b.features(*_pkg);

    for (auto& dep_name : manifest.string_seq("pkg.deps", features)) {
        auto dep = b.repo().find(dep_name);
        if (dep == nullptr) {
            BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::configuration_error>(
                                           "Could not resolve package dependency {}; depender: {}",
                                           dep_name,
                                           full_name()),
                                       e_dependency_name{dep_name});
        }
        if (_deps.insert(dep->full_name()).second) {
            fwb_log(trace, "[{}] depends on [{}]", full_name(), dep->full_name());
            b.add_package(*dep);
            res.new_deps = true;
        }
    }

    _apis = manifest.string_seq("pkg.apis", features);
    for (auto& api : _apis) {
        if (b.add_api(api, full_name())) {
            res.new_deps = true;
        }
    }

    _req_apis = manifest.string_seq("pkg.req_apis", features);
    _src_dirs = manifest.string_seq("pkg.src_dirs", features);

    return !res.new_deps && !res.new_features;
}

void build_package::_satisfy_apis(builder& b, resolve_result& res) {
    bool all_satisfied = true;
    for (auto& api : _req_apis) {
        auto owner = b.api_owner(api);
        if (owner == nullptr) {
            fwb_log(trace, "[{}] requires API '{}', not yet provided", full_name(), api);
            all_satisfied = false;
            continue;
        }
        if (*owner != full_name() && _deps.insert(*owner).second) {
            fwb_log(trace, "[{}] uses API '{}' from [{}]", full_name(), api, *owner);
            res.new_deps = true;
        }
    }
    if (all_satisfied) {
        _apis_satisfied_gen = b.generation();
    }
}

resolve_result build_package::resolve(builder& b) {
    FWB_E_SCOPE(e_package_name{full_name()});
    resolve_result res;

    if (!deps_resolved(b.generation())) {
        if (_load_deps(b, res)) {
            _deps_resolved_gen = b.generation();
        }
    }
    if (!apis_satisfied(b.generation())) {
        _satisfy_apis(b, res);
    }
    return res;
}

fwb::compiler_info& build_package::compiler_info(builder& b) {
    if (_ci) {
        return *_ci;
    }
    FWB_E_SCOPE(e_package_name{full_name()});

    auto  features = b.features(*_pkg);
    auto& manifest = _pkg->manifest();

    fwb::compiler_info ci;
    ci.cflags       = manifest.string_seq("pkg.cflags", features);
    ci.lflags       = manifest.string_seq("pkg.lflags", features);
    ci.aflags       = manifest.string_seq("pkg.aflags", features);
    ci.ignore_dirs  = manifest.string_seq("pkg.ign_dirs", features);
    ci.ignore_files = manifest.string_seq("pkg.ign_files", features);

    for (auto& [feature, enabled] : features) {
        if (enabled) {
            ci.cflags.push_back("-DFEATURE_" + feature);
        }
    }

    const auto& arch     = b.bsp().arch();
    auto        add_incl = [&](fs::path dir) {
        if (fs::is_directory(dir)) {
            ci.includes.push_back(std::move(dir));
        }
    };
    add_incl(base_path() / "include");
    add_incl(base_path() / "src");
    add_incl(base_path() / "include" / _pkg->basename() / "arch" / arch);
    for (auto& dep_name : b.transitive_deps(full_name())) {
        auto& dep = b.get_package(dep_name).package();
        add_incl(dep.base_path() / "include");
        add_incl(dep.base_path() / "include" / dep.basename() / "arch" / arch);
    }

    _ci = std::move(ci);
    return *_ci;
}
