#include "./builder.hpp"

#include "./errors.hpp"

#include <fwb/error/errors.hpp>
#include <fwb/error/on_error.hpp>
#include <fwb/pkg/errors.hpp>
#include <fwb/util/fs/shutil.hpp>
#include <fwb/util/log.hpp>
#include <fwb/util/proc.hpp>
#include <fwb/util/time.hpp>

#include <boost/leaf/exception.hpp>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/map.hpp>
#include <range/v3/view/transform.hpp>

#include <stdexcept>

using namespace fwb;

builder::builder(const package_repository& repo,
                 target                    tgt,
                 build_params              params,
                 compiler_factory          factory)
    : _repo(repo)
    , _target(std::move(tgt))
    , _params(std::move(params))
    , _new_compiler(std::move(factory)) {}

template <typename Func>
decltype(auto) builder::_run_step(Func&& fn) {
    if (_state == build_state::failed) {
        throw std::logic_error("The builder is unusable after a failed build step");
    }
    try {
        return fn();
    } catch (...) {
        _state = build_state::failed;
        throw;
    }
}

build_package& builder::add_package(const local_package& pkg) {
    auto full_name = pkg.full_name();
    auto it        = _packages.find(full_name);
    if (it == _packages.end()) {
        fwb_log(trace, "Adding package [{}] to the build", full_name);
        it = _packages.emplace(full_name, build_package(pkg)).first;
    }
    return it->second;
}

build_package& builder::get_package(std::string_view full_name) {
    auto it = _packages.find(std::string(full_name));
    if (it == _packages.end()) {
        throw std::out_of_range("No such package in the build: " + std::string(full_name));
    }
    return it->second;
}

std::vector<build_package*> builder::sorted_build_packages() {
    auto ret = _packages | ranges::views::values
        | ranges::views::transform([](build_package& bp) { return &bp; }) | ranges::to_vector;
    ranges::sort(ret, [](auto lhs, auto rhs) { return lhs->name() < rhs->name(); });
    return ret;
}

bool builder::add_api(std::string_view api, std::string_view owner) {
    auto [it, inserted] = _apis.emplace(std::string(api), std::string(owner));
    if (inserted) {
        fwb_log(trace, "API '{}' is provided by [{}]", api, owner);
        return true;
    }
    if (it->second != owner) {
        fwb_log(warn, "API conflict: {} ({} <-> {})", api, it->second, owner);
    }
    return false;
}

const std::string* builder::api_owner(std::string_view api) const noexcept {
    auto it = _apis.find(std::string(api));
    if (it == _apis.end()) {
        return nullptr;
    }
    return &it->second;
}

void builder::add_feature(std::string_view feature) { _features[std::string(feature)] = true; }

bool builder::has_feature(std::string_view feature) const noexcept {
    auto it = _features.find(std::string(feature));
    return it != _features.end() && it->second;
}

bool builder::is_feature_valid(const local_package& pkg, std::string_view feature) const {
    return fwb::is_feature_valid(_blacklist, _whitelist, pkg.full_name(), feature);
}

feature_set builder::features(const local_package& pkg) const {
    feature_set ret;
    for (auto& [name, enabled] : _features) {
        if (enabled && is_feature_valid(pkg, name)) {
            ret.emplace(name, true);
        }
    }
    return ret;
}

std::set<std::string> builder::transitive_deps(std::string_view full_name) {
    std::set<std::string>    ret;
    std::vector<std::string> queue = {std::string(full_name)};
    while (!queue.empty()) {
        auto cur = std::move(queue.back());
        queue.pop_back();
        for (auto& dep : get_package(cur).deps()) {
            if (dep != full_name && ret.insert(dep).second) {
                queue.push_back(dep);
            }
        }
    }
    return ret;
}

const bsp_package& builder::bsp() const {
    if (!_bsp) {
        throw std::logic_error("The BSP is only available once the build is prepared");
    }
    return *_bsp;
}

fs::path builder::bin_dir() const { return _params.out_root / _target.package().basename(); }

fs::path builder::pkg_bin_dir(std::string_view pkg_name) const { return bin_dir() / pkg_name; }

fs::path builder::archive_path(std::string_view pkg_name) const {
    return pkg_bin_dir(pkg_name) / (name_basename(pkg_name) + ".a");
}

fs::path builder::app_elf_path() const {
    auto app = _target.app(_repo);
    if (app == nullptr) {
        throw std::logic_error("The target has no application to link");
    }
    return pkg_bin_dir(app->name()) / (app->basename() + ".elf");
}

fs::path builder::test_exe_path(std::string_view pkg_name) const {
    return pkg_bin_dir(pkg_name) / ("test_" + name_basename(pkg_name));
}

void builder::_load_deps() {
    // Circularly resolve dependencies, features, APIs, and required APIs until nothing new is
    // found.
    while (true) {
        ++_pass_count;
        bool reprocess = false;
        auto snapshot  = _packages | ranges::views::keys | ranges::to_vector;
        for (auto& name : snapshot) {
            auto res = get_package(name).resolve(*this);
            if (res.new_features) {
                // The new feature may change any package's dependencies and APIs. Every package
                // must be processed again.
                ++_generation;
                reprocess = true;
                break;
            }
            if (res.new_deps) {
                reprocess = true;
            }
        }
        if (!reprocess) {
            break;
        }
    }
    fwb_log(debug,
            "Resolved {} package(s) with {} feature(s) after {} pass(es)",
            _packages.size(),
            _features.size(),
            _pass_count);
}

void builder::_log_dep_info() const {
    if (!fwb::log::level_enabled(fwb::log::level::debug)) {
        return;
    }
    fwb_log(debug, "Dependency graph of [{}]:", _target.full_name());
    for (auto& [name, bpkg] : _packages) {
        fwb_log(debug, "  * {}", name);
        for (auto& dep : bpkg.deps()) {
            fwb_log(debug, "      -> {}", dep);
        }
        for (auto& api : bpkg.apis()) {
            fwb_log(debug, "      provides API '{}'", api);
        }
        for (auto& api : bpkg.req_apis()) {
            fwb_log(debug, "      requires API '{}'", api);
        }
    }
    for (auto& [feature, enabled] : _features) {
        fwb_log(debug, "  Feature: {}", feature);
    }
}

void builder::_verify_apis_satisfied() const {
    std::vector<unsatisfied_api> missing;
    for (auto& [name, bpkg] : _packages) {
        for (auto& api : bpkg.req_apis()) {
            if (api_owner(api) == nullptr) {
                missing.push_back({name, api});
            }
        }
    }
    if (missing.empty()) {
        return;
    }
    std::string listing;
    for (auto& m : missing) {
        fwb_log(error, "Unsatisfied API: package [{}] requires '{}'", m.package, m.api);
        listing += fmt::format("\n    * {}, API: {}", m.package, m.api);
    }
    BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::unsatisfied_api>(
                                   "Unsatisfied APIs detected:{}",
                                   listing),
                               e_unsatisfied_apis{std::move(missing)});
}

void builder::prepare() {
    _run_step([&] { _prepare(); });
}

void builder::_prepare() {
    if (_state != build_state::uninitialized) {
        // Already prepped
        return;
    }
    FWB_E_SCOPE(e_target_name{_target.full_name()});

    auto bsp_pkg = _target.bsp(_repo);
    if (bsp_pkg == nullptr) {
        if (!_target.bsp_name()) {
            throw_user_error<errc::configuration_error>("BSP package not specified by target");
        }
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::configuration_error>(
                                       "BSP package not found: {}",
                                       *_target.bsp_name()),
                                   e_dependency_name{*_target.bsp_name()});
    }
    _blacklist.append(bsp_pkg->manifest().filter_entries("pkg.feature_blacklist"));
    _whitelist.append(bsp_pkg->manifest().filter_entries("pkg.feature_whitelist"));

    _bsp              = bsp_package::load(*bsp_pkg);
    auto compiler_pkg = _bsp->compiler_name().empty() ? nullptr
                                                      : _repo.find(_bsp->compiler_name());
    if (compiler_pkg == nullptr) {
        if (_bsp->compiler_name().empty()) {
            throw_user_error<errc::configuration_error>("Compiler package not specified by BSP");
        }
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::configuration_error>(
                                       "Compiler package not found: {}",
                                       _bsp->compiler_name()),
                                   e_dependency_name{_bsp->compiler_name()});
    }

    // Seed the builder with the app (if present), bsp, and target packages. An app is not
    // required (e.g., unit tests).
    build_package* app_bpkg = nullptr;
    if (auto app_pkg = _target.app(_repo)) {
        app_bpkg  = &add_package(*app_pkg);
        _app_name = app_pkg->full_name();
        _blacklist.append(app_pkg->manifest().filter_entries("pkg.feature_blacklist"));
        _whitelist.append(app_pkg->manifest().filter_entries("pkg.feature_whitelist"));
    }
    auto& bsp_bpkg    = add_package(*bsp_pkg);
    auto& target_bpkg = add_package(_target.package());
    _blacklist.append(_target.package().manifest().filter_entries("pkg.feature_blacklist"));
    _whitelist.append(_target.package().manifest().filter_entries("pkg.feature_whitelist"));

    _load_deps();
    _log_dep_info();
    _verify_apis_satisfied();

    // Flags from the target, the app and the BSP are applied to every source file, in that
    // order. The compiler package's own flags come from its toolchain.
    compiler_info base;

    fwb_log(debug, "Generating build flags for target [{}]", target_bpkg.full_name());
    base.merge(target_bpkg.compiler_info(*this));

    if (app_bpkg) {
        fwb_log(debug, "Generating build flags for app [{}]", app_bpkg->full_name());
        base.merge(app_bpkg->compiler_info(*this));
    }

    fwb_log(debug, "Generating build flags for bsp [{}]", bsp_bpkg.full_name());
    auto bsp_ci = bsp_bpkg.compiler_info(*this);
    bsp_ci.cflags.push_back("-DARCH_" + _bsp->arch());
    bsp_ci.cflags.push_back(fmt::format("-DBSP_NAME=\"{}\"", bsp_pkg->basename()));
    if (app_bpkg) {
        bsp_ci.cflags.push_back(
            fmt::format("-DAPP_NAME=\"{}\"", app_bpkg->package().basename()));
    }
    base.merge(bsp_ci);

    // The link step needs the linker script selected by the BSP's final feature set
    _bsp->reload(features(*bsp_pkg));

    _compiler_pkg = compiler_pkg;
    _base_info    = std::move(base);
    _state        = build_state::prepped;
}

std::unique_ptr<compiler> builder::_make_compiler(build_package* bpkg, path_ref dst_dir) {
    auto c = _new_compiler(compiler_params{
        .compiler_dir  = _compiler_pkg->base_path(),
        .build_profile = _target.build_profile(),
        .dst_dir       = dst_dir,
        .base_dir      = bpkg ? bpkg->base_path() : _repo.root(),
        .timeout       = _params.tool_timeout,
    });
    c->add_info(_base_info);
    if (bpkg) {
        fwb_log(debug, "Generating build flags for package [{}]", bpkg->full_name());
        c->add_info(bpkg->compiler_info(*this));
    }
    // A change to any manifest requires a full rebuild
    for (auto& [name, bp] : _packages) {
        c->add_deps(bp.package().cfg_files());
    }
    return c;
}

void builder::_build_dir(path_ref                 src_dir,
                         compiler&                c,
                         std::vector<std::string> ignore_dirs) const {
    if (!fs::exists(src_dir)) {
        return;
    }
    fwb_log(debug, "Compiling src in base directory: {}", src_dir.string());

    // Architecture-specific sources are compiled separately below
    auto non_arch_ignore = ignore_dirs;
    non_arch_ignore.push_back("arch");
    c.recursive_compile(src_dir, unit_kind::c, non_arch_ignore);

    auto arch_dir = src_dir / "arch" / _bsp->arch();
    if (fs::is_directory(arch_dir)) {
        fwb_log(debug,
                "Compiling architecture specific src pkgs in directory: {}",
                arch_dir.string());
        c.recursive_compile(arch_dir, unit_kind::c, ignore_dirs);
        c.recursive_compile(arch_dir, unit_kind::assembly, ignore_dirs);
    }
}

void builder::compile_package(build_package& bpkg) {
    _run_step([&] {
        if (_state == build_state::uninitialized) {
            throw std::logic_error("compile_package() requires a prepared build");
        }
        FWB_E_SCOPE(e_package_name{bpkg.full_name()});

        std::vector<fs::path> src_dirs;
        if (!bpkg.source_dirs().empty()) {
            for (auto& rel_dir : bpkg.source_dirs()) {
                auto dir = bpkg.base_path() / rel_dir;
                if (!fs::is_directory(dir)) {
                    throw_user_error<errc::configuration_error>(
                        "Specified source directory {} does not exist",
                        dir.string());
                }
                src_dirs.push_back(dir);
            }
        } else {
            auto src_dir = bpkg.base_path() / "src";
            if (!fs::exists(src_dir)) {
                fwb_log(debug, "Nothing to compile for [{}]", bpkg.full_name());
                return;
            }
            src_dirs.push_back(src_dir);
        }

        auto c = _make_compiler(&bpkg, pkg_bin_dir(bpkg.name()));

        // Test code has its own arch directories (src/test/arch/<arch>), so it is compiled in a
        // separate phase.
        for (auto& dir : src_dirs) {
            _build_dir(dir, *c, {"test"});
            if (has_feature("TEST")) {
                _build_dir(dir / "test", *c, {});
            }
        }

        c->compile_archive(archive_path(bpkg.name()));
    });
}

void builder::_compile_all() {
    // Build the packages alphabetically to ensure a consistent order
    for (auto bpkg : sorted_build_packages()) {
        compile_package(*bpkg);
    }
    _state = build_state::compiled;
}

void builder::link(path_ref output) {
    _run_step([&] {
        if (_state == build_state::uninitialized) {
            throw std::logic_error("link() requires a prepared build");
        }
        _link(output);
    });
}

void builder::_link(path_ref output) {
    auto app_bpkg = _app_name ? &get_package(*_app_name) : nullptr;
    auto c        = _make_compiler(app_bpkg, output.parent_path());

    std::vector<fs::path> archives;
    for (auto& [name, bpkg] : _packages) {
        auto archive = archive_path(bpkg.name());
        if (fs::exists(archive)) {
            archives.push_back(archive);
        }
    }

    std::optional<fs::path> linker_script;
    if (_bsp->linker_script()) {
        linker_script = _bsp->package().base_path() / *_bsp->linker_script();
    }
    c->compile_elf(output, archives, linker_script);
    _state = build_state::linked;
}

void builder::build() {
    _run_step([&] {
        _target.validate(_repo, true);
        _prepare();
        _compile_all();
        _link(app_elf_path());
        fwb_log(info,
                "Target [{}] successfully built: {}",
                _target.full_name(),
                app_elf_path().string());
    });
}

void builder::test(const local_package& pkg) {
    _run_step([&] {
        if (_state != build_state::uninitialized) {
            throw std::logic_error("test() requires a builder that has not been prepared");
        }
        _target.validate(_repo, false);

        // Seed the builder with the package under test
        auto& test_bpkg = add_package(pkg);

        // TEST ensures that the test code gets compiled. SELFTEST indicates that there is no app.
        add_feature("TEST");
        add_feature("SELFTEST");

        _prepare();

        // The package under test provides the main() that usually comes from an app
        test_bpkg.compiler_info(*this).cflags.push_back("-DFWB_SELFTEST");

        _compile_all();

        auto test_exe = test_exe_path(pkg.name());
        _link(test_exe);

        fwb_log(info, "Executing test: {}", test_exe.string());
        auto&& [dur_ms, res] = timed<std::chrono::milliseconds>([&] {
            return run_proc(proc_options{
                .command = {test_exe.string()},
                .cwd     = test_exe.parent_path(),
                .timeout = _params.test_timeout,
            });
        });
        if (!res.okay()) {
            fwb_log(error, "Test executable [{}] failed:\n{}", test_exe.string(), res.output);
            BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::test_failure>(
                                           "Test failure ({}){}:\n{}",
                                           pkg.name(),
                                           res.timed_out ? " [timed out]" : "",
                                           res.output),
                                       e_package_name{pkg.full_name()},
                                       e_test_output{res.output});
        }
        fwb_log(info, "Test [{}] passed - {}ms", pkg.name(), dur_ms.count());
        if (!res.output.empty()) {
            fwb_log(debug, "Test output:\n{}", res.output);
        }
    });
}

void builder::clean() {
    _run_step([&] {
        auto path = bin_dir();
        fwb_log(debug, "Cleaning directory {}", path.string());
        ensure_absent(path);
    });
}
