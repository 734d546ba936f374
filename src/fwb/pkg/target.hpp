#pragma once

#include "./local_package.hpp"
#include "./repository.hpp"
#include "./settings.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace fwb {

/**
 * A build target: a package with a `target.yml` that binds an application to a BSP.
 */
class target {
    const local_package*       _pkg = nullptr;
    settings                   _target_settings;
    std::optional<std::string> _app;
    std::optional<std::string> _bsp;
    std::string                _build_profile;

public:
    /**
     * Load the target package `name` from `repo`. The package must exist and hold a `target.yml`.
     */
    static target load(const package_repository& repo, std::string_view name);

    const local_package& package() const noexcept { return *_pkg; }
    std::string          full_name() const { return _pkg->full_name(); }

    auto& app_name() const noexcept { return _app; }
    auto& bsp_name() const noexcept { return _bsp; }
    auto& build_profile() const noexcept { return _build_profile; }

    const local_package* app(const package_repository& repo) const noexcept;
    const local_package* bsp(const package_repository& repo) const noexcept;

    /**
     * Check that the packages named by this target exist in `repo`. An application is only
     * needed if `require_app` is set.
     */
    void validate(const package_repository& repo, bool require_app) const;
};

}  // namespace fwb
