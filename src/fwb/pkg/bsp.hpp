#pragma once

#include "./local_package.hpp"
#include "./settings.hpp"

#include <optional>
#include <string>

namespace fwb {

/**
 * The board support package named by a target, with the contents of its `bsp.yml`.
 */
class bsp_package {
    const local_package*    _pkg = nullptr;
    settings                _bsp_settings;
    std::string             _arch;
    std::string             _compiler;
    std::optional<fs::path> _linker_script;

public:
    /**
     * Load `bsp.yml` from the given package. A missing file is a `configuration_error`.
     */
    static bsp_package load(const local_package& pkg);

    /**
     * Re-read the feature-gated BSP settings using the final feature set of the BSP package.
     */
    void reload(const feature_set& features);

    const local_package& package() const noexcept { return *_pkg; }

    auto& arch() const noexcept { return _arch; }
    auto& compiler_name() const noexcept { return _compiler; }

    /// The linker script, relative to the BSP's base path
    auto& linker_script() const noexcept { return _linker_script; }
};

}  // namespace fwb
