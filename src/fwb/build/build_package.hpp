#pragma once

#include <fwb/pkg/local_package.hpp>
#include <fwb/toolchain/compiler_info.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fwb {

class builder;

struct resolve_result {
    /// The package set or the API registry grew
    bool new_deps = false;
    /// The build's feature set grew
    bool new_features = false;
};

/**
 * The build-time state of one package: what it depends on, which APIs it provides and requires,
 * and the flags it is compiled with.
 *
 * "Dependencies resolved" and "APIs satisfied" are recorded as the builder generation in which
 * they were reached, so bumping the builder's generation clears them for every package at once.
 */
class build_package {
    const local_package* _pkg = nullptr;

    std::uint64_t _deps_resolved_gen  = 0;
    std::uint64_t _apis_satisfied_gen = 0;

    std::set<std::string>    _deps;
    std::vector<std::string> _apis;
    std::vector<std::string> _req_apis;
    std::vector<std::string> _src_dirs;

    std::optional<fwb::compiler_info> _ci;

    bool _load_deps(builder& b, resolve_result& res);
    void _satisfy_apis(builder& b, resolve_result& res);

public:
    explicit build_package(const local_package& pkg)
        : _pkg(&pkg) {}

    const local_package& package() const noexcept { return *_pkg; }

    auto&       name() const noexcept { return _pkg->name(); }
    std::string full_name() const { return _pkg->full_name(); }
    auto&       base_path() const noexcept { return _pkg->base_path(); }

    /// Full names of the direct dependencies, including the providers of required APIs
    auto& deps() const noexcept { return _deps; }
    auto& apis() const noexcept { return _apis; }
    auto& req_apis() const noexcept { return _req_apis; }

    /// Source directories declared by `pkg.src_dirs`, relative to the package
    auto& source_dirs() const noexcept { return _src_dirs; }

    bool deps_resolved(std::uint64_t generation) const noexcept {
        return _deps_resolved_gen == generation;
    }
    bool apis_satisfied(std::uint64_t generation) const noexcept {
        return _apis_satisfied_gen == generation;
    }

    /**
     * Bring this package up to date with the builder: discover features, dependencies and
     * APIs, and attach providers of required APIs. Steps already completed in the current
     * generation are not repeated.
     */
    resolve_result resolve(builder& b);

    /**
     * The flags this package contributes to its own compilation. Computed on first use with the
     * features valid for this package, then cached for the rest of the build.
     */
    fwb::compiler_info& compiler_info(builder& b);
};

}  // namespace fwb
