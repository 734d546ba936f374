#pragma once

#include "./compiler_info.hpp"

#include <fwb/util/fs/path.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fwb {

enum class unit_kind {
    c,
    assembly,
};

/**
 * Drives a toolchain for the objects of one destination directory.
 *
 * Sources are compiled into objects below the destination, every object compiled so far is
 * archived together, and archives are linked into an executable.
 */
class compiler {
public:
    virtual ~compiler() = default;

    /// Merge additional flags on top of those already held
    virtual void add_info(const compiler_info&) = 0;

    /// Register files that every compiled object depends upon
    virtual void add_deps(const std::vector<fs::path>&) = 0;

    /**
     * Compile every source of the given kind below `source_root`, skipping any directory whose
     * name appears in `ignore_dirs`.
     */
    virtual void recursive_compile(path_ref                        source_root,
                                   unit_kind                       kind,
                                   const std::vector<std::string>& ignore_dirs)
        = 0;

    /**
     * Archive every object this compiler has produced into a static library at `archive`.
     * If no object was produced, no archive is created.
     */
    virtual void compile_archive(path_ref archive) = 0;

    /**
     * Link the given archives into an executable at `output`.
     */
    virtual void compile_elf(path_ref                       output,
                             const std::vector<fs::path>&   archives,
                             const std::optional<fs::path>& linker_script)
        = 0;
};

struct compiler_params {
    /// Directory of the compiler package (holding `compiler.yml`)
    fs::path compiler_dir;
    /// Build profile selected by the target
    std::string build_profile;
    /// Directory receiving objects and archives
    fs::path dst_dir;
    /// Working directory for every tool invocation
    fs::path base_dir;
    /// Timeout applied to each tool invocation
    std::optional<std::chrono::milliseconds> timeout;
};

using compiler_factory = std::function<std::unique_ptr<compiler>(const compiler_params&)>;

}  // namespace fwb
