#include "./target.hpp"

#include "./errors.hpp"

#include <fwb/error/errors.hpp>
#include <fwb/error/on_error.hpp>

#include <boost/leaf/exception.hpp>

using namespace fwb;

target target::load(const package_repository& repo, std::string_view name) {
    FWB_E_SCOPE(e_target_name{std::string(name)});

    auto pkg = repo.find(name);
    if (pkg == nullptr) {
        throw_user_error<errc::configuration_error>("Target package not found: {}", name);
    }
    auto target_yml = pkg->base_path() / "target.yml";
    if (!fs::is_regular_file(target_yml)) {
        throw_user_error<errc::configuration_error>("Package '{}' is not a target (no target.yml)",
                                                    pkg->full_name());
    }

    target ret;
    ret._pkg             = pkg;
    ret._target_settings = settings::from_file(target_yml);
    ret._app             = ret._target_settings.string("target.app");
    ret._bsp             = ret._target_settings.string("target.bsp");
    ret._build_profile = ret._target_settings.string("target.build_profile").value_or("default");
    return ret;
}

const local_package* target::app(const package_repository& repo) const noexcept {
    return _app ? repo.find(*_app) : nullptr;
}

const local_package* target::bsp(const package_repository& repo) const noexcept {
    return _bsp ? repo.find(*_bsp) : nullptr;
}

void target::validate(const package_repository& repo, bool require_app) const {
    FWB_E_SCOPE(e_target_name{full_name()});

    if (!_bsp) {
        throw_user_error<errc::configuration_error>("BSP package not specified by target");
    }
    if (bsp(repo) == nullptr) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::configuration_error>(
                                       "BSP package not found: {}",
                                       *_bsp),
                                   e_dependency_name{*_bsp});
    }
    if (!_app) {
        if (require_app) {
            throw_user_error<errc::configuration_error>("Target '{}' does not specify an app",
                                                        full_name());
        }
        return;
    }
    if (app(repo) == nullptr) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::configuration_error>(
                                       "App package not found: {}",
                                       *_app),
                                   e_dependency_name{*_app});
    }
}
