#pragma once

#include "./compiler.hpp"
#include "./file_deps.hpp"

#include <fwb/pkg/settings.hpp>
#include <fwb/util/fs/path.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fwb {

struct compile_file_spec {
    fs::path                 source_path;
    fs::path                 out_path;
    unit_kind                kind         = unit_kind::c;
    std::vector<std::string> flags        = {};
    std::vector<fs::path>    include_dirs = {};
};

struct compile_command_info {
    std::vector<std::string> command;
    std::optional<fs::path>  gnu_depfile_path;
};

struct archive_spec {
    std::vector<fs::path> input_files;
    fs::path              out_path;
};

struct link_exe_spec {
    std::vector<fs::path>    inputs;
    fs::path                 output;
    std::vector<std::string> flags         = {};
    std::optional<fs::path>  linker_script = std::nullopt;
};

/**
 * The command templates of a compiler package, read from its `compiler.yml`.
 */
class toolchain {
    using string_seq = std::vector<std::string>;

    string_seq _c_compile;
    string_seq _asm_compile;
    string_seq _archive;
    string_seq _profile_flags;
    string_seq _as_flags;
    string_seq _ld_flags;

    std::string    _object_suffix = ".o";
    file_deps_mode _deps_mode     = file_deps_mode::gnu;

public:
    toolchain() = default;

    /**
     * Load `compiler.yml` from `compiler_dir`, selecting the flags of `profile`.
     */
    static toolchain load(path_ref compiler_dir, std::string_view profile);

    static toolchain from_settings(const settings& cfg, std::string_view profile);

    auto& object_suffix() const noexcept { return _object_suffix; }
    auto  deps_mode() const noexcept { return _deps_mode; }

    std::vector<std::string> include_args(const fs::path& p) const noexcept;

    compile_command_info create_compile_command(const compile_file_spec&,
                                                path_ref cwd) const noexcept;

    std::vector<std::string> create_archive_command(const archive_spec&,
                                                    path_ref cwd) const noexcept;

    std::vector<std::string> create_link_executable_command(const link_exe_spec&,
                                                            path_ref cwd) const noexcept;
};

}  // namespace fwb
