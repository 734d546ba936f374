#include "./local_package.hpp"

#include <fwb/util/log.hpp>

using namespace fwb;

namespace {

constexpr std::string_view manifest_filenames[] = {
    "pkg.yml",
    "bsp.yml",
    "target.yml",
    "compiler.yml",
};

}  // namespace

local_package local_package::load(path_ref         dir,
                                  std::string_view default_name,
                                  std::string_view repo) {
    local_package ret;
    ret._base_path = dir;
    ret._repo      = std::string(repo);
    ret._manifest  = settings::from_file(dir / "pkg.yml");
    ret._name      = ret._manifest.string("pkg.name").value_or(std::string(default_name));

    for (auto fname : manifest_filenames) {
        auto cfg = dir / fname;
        if (fs::is_regular_file(cfg)) {
            ret._cfg_files.push_back(cfg);
        }
    }
    fwb_log(trace, "Loaded package [{}] from [{}]", ret.full_name(), dir.string());
    return ret;
}

std::string local_package::full_name() const {
    if (_repo == local_repo_name) {
        return _name;
    }
    return "@" + _repo + "/" + _name;
}

std::string local_package::type() const { return _manifest.string("pkg.type").value_or("lib"); }
