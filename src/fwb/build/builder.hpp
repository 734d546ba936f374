#pragma once

#include "./build_package.hpp"
#include "./feature_filter.hpp"
#include "./params.hpp"

#include <fwb/pkg/bsp.hpp>
#include <fwb/pkg/repository.hpp>
#include <fwb/pkg/target.hpp>
#include <fwb/toolchain/compiler.hpp>
#include <fwb/toolchain/gnu_compiler.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace fwb {

enum class build_state {
    uninitialized,
    prepped,
    compiled,
    linked,
    /// A step failed. No further operations are permitted.
    failed,
};

/**
 * Builds one target: resolves its packages, features and APIs, then compiles, archives and links
 * them. All state belongs to the builder and lives as long as it does.
 */
class builder {
    const package_repository& _repo;
    target                    _target;
    build_params              _params;
    compiler_factory          _new_compiler;

    std::map<std::string, build_package> _packages;
    feature_set                          _features;
    std::map<std::string, std::string>   _apis;

    std::uint64_t _generation = 1;
    int           _pass_count = 0;

    feature_filter _blacklist;
    feature_filter _whitelist;

    std::optional<std::string> _app_name;
    std::optional<bsp_package> _bsp;
    const local_package*       _compiler_pkg = nullptr;
    compiler_info              _base_info;

    build_state _state = build_state::uninitialized;

    template <typename Func>
    decltype(auto) _run_step(Func&& fn);

    void _prepare();
    void _load_deps();
    void _log_dep_info() const;
    void _verify_apis_satisfied() const;
    void _compile_all();
    void _build_dir(path_ref src_dir, compiler& c, std::vector<std::string> ignore_dirs) const;
    void _link(path_ref output);

    std::unique_ptr<compiler> _make_compiler(build_package* bpkg, path_ref dst_dir);

public:
    builder(const package_repository& repo,
            target                    tgt,
            build_params              params,
            compiler_factory          factory = &gnu_compiler::create);

    auto& repo() const noexcept { return _repo; }
    auto& get_target() const noexcept { return _target; }
    auto  state() const noexcept { return _state; }

    /**
     * Add a package to the build. If it is already present, the existing build package is
     * returned.
     */
    build_package& add_package(const local_package& pkg);

    /// Lookup a build package by full name. Throws `std::out_of_range` if absent.
    build_package& get_package(std::string_view full_name);

    auto& packages() const noexcept { return _packages; }

    /// The build packages ordered by `name()`
    std::vector<build_package*> sorted_build_packages();

    /**
     * Register `owner` as the provider of `api`. Returns `true` if this is the first
     * registration of the API. A later registration by a different package is ignored with a
     * warning.
     */
    bool add_api(std::string_view api, std::string_view owner);

    /// Full name of the provider of `api`, or `nullptr`
    const std::string* api_owner(std::string_view api) const noexcept;

    auto& apis() const noexcept { return _apis; }

    void add_feature(std::string_view feature);
    bool has_feature(std::string_view feature) const noexcept;

    auto& all_features() const noexcept { return _features; }

    /// The subset of the build's features that are valid for `pkg`
    feature_set features(const local_package& pkg) const;

    bool is_feature_valid(const local_package& pkg, std::string_view feature) const;

    auto& feature_blacklist() const noexcept { return _blacklist; }
    auto& feature_whitelist() const noexcept { return _whitelist; }

    /// The current resolution generation. Advancing it invalidates all resolution markers.
    auto generation() const noexcept { return _generation; }

    /// Number of resolution passes run so far
    auto resolve_pass_count() const noexcept { return _pass_count; }

    /// Full names of every package reachable from `full_name`, excluding itself
    std::set<std::string> transitive_deps(std::string_view full_name);

    /// Only available after `prepare()`
    const bsp_package& bsp() const;

    auto& base_compiler_info() const noexcept { return _base_info; }

    fs::path bin_dir() const;
    fs::path pkg_bin_dir(std::string_view pkg_name) const;
    fs::path archive_path(std::string_view pkg_name) const;
    fs::path app_elf_path() const;
    fs::path test_exe_path(std::string_view pkg_name) const;

    /**
     * Resolve the full package and feature sets and compute the base compiler flags.
     * Calling this again after it has succeeded does nothing.
     */
    void prepare();

    /// Compile and archive a single package
    void compile_package(build_package& bpkg);

    /// Link every existing package archive into `output`
    void link(path_ref output);

    /// Build the target's application
    void build();

    /// Build `pkg` in self-test mode and run the resulting executable
    void test(const local_package& pkg);

    /// Remove the target's build output
    void clean();
};

}  // namespace fwb
