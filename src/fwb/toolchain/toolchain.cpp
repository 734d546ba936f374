#include "./toolchain.hpp"

#include "./errors.hpp"

#include <fwb/error/errors.hpp>
#include <fwb/error/on_error.hpp>
#include <fwb/util/algo.hpp>
#include <fwb/util/log.hpp>
#include <fwb/util/parse_enum.hpp>
#include <fwb/util/shlex.hpp>
#include <fwb/util/yaml/errors.hpp>

#include <boost/leaf/exception.hpp>
#include <range/v3/view/all.hpp>
#include <range/v3/view/transform.hpp>

using namespace fwb;

using std::string;
using std::vector;

namespace {

template <typename R>
auto shortest_path_args(path_ref base, R&& r) {
    return ranges::views::all(r)  //
        | ranges::views::transform(
               [base](auto&& path) { return shortest_path_from(path, base).string(); });  //
}

vector<string> command_of(const settings& cfg, std::string_view key) {
    auto str = cfg.string(key);
    if (!str) {
        return {};
    }
    return split_shell_string(*str);
}

}  // namespace

toolchain toolchain::load(path_ref compiler_dir, std::string_view profile) {
    auto fpath = compiler_dir / "compiler.yml";
    FWB_E_SCOPE(e_toolchain_filepath{fpath});
    if (!fs::is_regular_file(fpath)) {
        throw_user_error<errc::configuration_error>("Compiler package [{}] has no compiler.yml",
                                                    compiler_dir.string());
    }
    return from_settings(settings::from_file(fpath), profile);
}

toolchain toolchain::from_settings(const settings& cfg, std::string_view profile) {
    FWB_E_SCOPE(e_build_profile{string(profile)});
    toolchain ret;

    ret._c_compile = command_of(cfg, "compiler.path.cc");
    if (ret._c_compile.empty()) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::configuration_error>(
                                       "Compiler [{}] does not define compiler.path.cc",
                                       cfg.source_path().string()),
                                   e_manifest_key{"compiler.path.cc"});
    }
    ret._asm_compile = command_of(cfg, "compiler.path.as");
    if (ret._asm_compile.empty()) {
        ret._asm_compile = ret._c_compile;
        extend(ret._asm_compile, {"-x", "assembler-with-cpp"});
    }
    ret._archive = command_of(cfg, "compiler.path.archive");
    if (ret._archive.empty()) {
        ret._archive = {"ar"};
    }

    auto profile_key = "compiler.flags." + string(profile);
    if (profile != "default" && !cfg.has(profile_key)) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::configuration_error>(
                                       "Build profile '{}' is not defined by compiler [{}]",
                                       profile,
                                       cfg.source_path().string()),
                                   e_manifest_key{profile_key});
    }
    ret._profile_flags = cfg.string_seq("compiler.flags.base");
    extend(ret._profile_flags, cfg.string_seq(profile_key));
    ret._as_flags = cfg.string_seq("compiler.as.flags");
    ret._ld_flags = cfg.string_seq("compiler.ld.flags");

    if (auto suffix = cfg.string("compiler.object_suffix")) {
        ret._object_suffix = *suffix;
    }
    if (auto mode = cfg.string("compiler.deps_mode")) {
        FWB_E_SCOPE(e_manifest_key{"compiler.deps_mode"});
        FWB_E_SCOPE(e_manifest_path{cfg.source_path()});
        ret._deps_mode = parse_enum_str<file_deps_mode>(*mode);
    }

    fwb_log(trace,
            "Loaded toolchain from [{}] with profile '{}'",
            cfg.source_path().string(),
            profile);
    return ret;
}

vector<string> toolchain::include_args(const fs::path& p) const noexcept {
    return {"-I" + p.string()};
}

compile_command_info
toolchain::create_compile_command(const compile_file_spec& spec, path_ref cwd) const noexcept {
    fwb_log(trace,
            "Calculate compile command for source file [{}] to object file [{}]",
            spec.source_path.string(),
            spec.out_path.string());

    vector<string> command = spec.kind == unit_kind::c ? _c_compile : _asm_compile;
    extend(command, _profile_flags);
    if (spec.kind == unit_kind::assembly) {
        extend(command, _as_flags);
    }
    extend(command, spec.flags);

    fwb_log(trace, "#include search-dirs:");
    for (auto&& inc_dir : spec.include_dirs) {
        fwb_log(trace, "  - search: {}", inc_dir.string());
        extend(command, include_args(shortest_path_from(inc_dir, cwd)));
    }

    auto out_arg = shortest_path_from(spec.out_path, cwd).string();

    std::optional<fs::path> gnu_depfile_path;
    if (_deps_mode == file_deps_mode::gnu) {
        gnu_depfile_path = spec.out_path;
        gnu_depfile_path->replace_extension(gnu_depfile_path->extension().string() + ".d");
        extend(command, {string("-MMD"), string("-MF"), out_arg + ".d"});
    }

    extend(command,
           {string("-c"),
            shortest_path_from(spec.source_path, cwd).string(),
            string("-o"),
            out_arg});
    return {std::move(command), std::move(gnu_depfile_path)};
}

vector<string> toolchain::create_archive_command(const archive_spec& spec,
                                                 path_ref            cwd) const noexcept {
    fwb_log(trace, "Creating archive command [output: {}]", spec.out_path.string());
    vector<string> cmd = _archive;
    cmd.push_back("rcs");
    cmd.push_back(shortest_path_from(spec.out_path, cwd).string());
    for (auto&& in : spec.input_files) {
        fwb_log(trace, "  - input: [{}]", in.string());
    }
    extend(cmd, shortest_path_args(cwd, spec.input_files));
    return cmd;
}

vector<string> toolchain::create_link_executable_command(const link_exe_spec& spec,
                                                         path_ref cwd) const noexcept {
    fwb_log(trace, "Creating link command [output: {}]", spec.output.string());
    vector<string> cmd = _c_compile;
    cmd.push_back("-o");
    cmd.push_back(shortest_path_from(spec.output, cwd).string());
    extend(cmd, _ld_flags);
    extend(cmd, spec.flags);
    cmd.push_back("-Wl,--start-group");
    extend(cmd, shortest_path_args(cwd, spec.inputs));
    cmd.push_back("-Wl,--end-group");
    if (spec.linker_script) {
        cmd.push_back("-T" + shortest_path_from(*spec.linker_script, cwd).string());
    }
    return cmd;
}
