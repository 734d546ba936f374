#include "./bsp.hpp"

#include "./errors.hpp"

#include <fwb/error/errors.hpp>
#include <fwb/util/log.hpp>

#include <boost/leaf/exception.hpp>

using namespace fwb;

bsp_package bsp_package::load(const local_package& pkg) {
    auto bsp_yml = pkg.base_path() / "bsp.yml";
    if (!fs::is_regular_file(bsp_yml)) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::configuration_error>(
                                       "BSP package '{}' has no bsp.yml",
                                       pkg.full_name()),
                                   e_package_name{pkg.full_name()});
    }
    bsp_package ret;
    ret._pkg          = &pkg;
    ret._bsp_settings = settings::from_file(bsp_yml);
    ret.reload({});
    return ret;
}

void bsp_package::reload(const feature_set& features) {
    _arch     = _bsp_settings.string("bsp.arch", features).value_or("");
    _compiler = _bsp_settings.string("bsp.compiler", features).value_or("");
    _linker_script.reset();
    if (auto script = _bsp_settings.string("bsp.linkerscript", features)) {
        _linker_script = fs::path(*script);
    }
    fwb_log(trace,
            "BSP [{}]: arch={}, compiler={}, linker script={}",
            _pkg->full_name(),
            _arch,
            _compiler,
            _linker_script ? _linker_script->string() : std::string("(none)"));
}
