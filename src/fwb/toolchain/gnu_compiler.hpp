#pragma once

#include "./compiler.hpp"
#include "./toolchain.hpp"

#include <memory>
#include <vector>

namespace fwb {

/**
 * A `compiler` that runs the commands of a `toolchain` as subprocesses.
 *
 * Every tool runs with `compiler_params::base_dir` as its working directory. Objects are written
 * to `dst_dir` at the source's path relative to `base_dir`, with the toolchain's object suffix
 * appended.
 */
class gnu_compiler : public compiler {
    toolchain             _toolchain;
    compiler_params       _params;
    compiler_info         _info;
    std::vector<fs::path> _extra_deps;
    std::vector<fs::path> _objects;

    bool _needs_compile(path_ref source, path_ref object) const;
    void _compile_one(path_ref source, unit_kind kind);

public:
    gnu_compiler(toolchain tc, compiler_params params)
        : _toolchain(std::move(tc))
        , _params(std::move(params)) {}

    /**
     * Load the toolchain of `params.compiler_dir` and create a compiler for it.
     */
    static std::unique_ptr<compiler> create(const compiler_params& params);

    auto& info() const noexcept { return _info; }
    auto& objects() const noexcept { return _objects; }

    /// The object file that `source` is compiled to
    fs::path object_path(path_ref source) const;

    void add_info(const compiler_info&) override;
    void add_deps(const std::vector<fs::path>&) override;
    void recursive_compile(path_ref                        source_root,
                           unit_kind                       kind,
                           const std::vector<std::string>& ignore_dirs) override;
    void compile_archive(path_ref archive) override;
    void compile_elf(path_ref                       output,
                     const std::vector<fs::path>&   archives,
                     const std::optional<fs::path>& linker_script) override;
};

/**
 * Collect the sources of the given kind below `root`, in path order. Directories whose name is
 * in `ignore_dirs` and files whose name is in `ignore_files` are skipped.
 */
std::vector<fs::path> collect_sources(path_ref                        root,
                                      unit_kind                       kind,
                                      const std::vector<std::string>& ignore_dirs,
                                      const std::vector<std::string>& ignore_files);

}  // namespace fwb
