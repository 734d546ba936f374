#include "./gnu_compiler.hpp"

#include "./errors.hpp"
#include "./file_deps.hpp"

#include <fwb/error/errors.hpp>
#include <fwb/util/algo.hpp>
#include <fwb/util/fs/shutil.hpp>
#include <fwb/util/log.hpp>
#include <fwb/util/proc.hpp>
#include <fwb/util/time.hpp>

#include <boost/leaf/exception.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>

using namespace fwb;

namespace {

bool is_source_of(path_ref file, unit_kind kind) {
    auto ext = file.extension().string();
    switch (kind) {
    case unit_kind::c:
        return ext == ".c";
    case unit_kind::assembly:
        return ext == ".s" || ext == ".S";
    }
    return false;
}

bool name_in(const std::vector<std::string>& names, const fs::path& p) {
    auto fname = p.filename().string();
    return ranges::any_of(names, [&](const std::string& n) { return n == fname; });
}

}  // namespace

std::vector<fs::path> fwb::collect_sources(path_ref                        root,
                                           unit_kind                       kind,
                                           const std::vector<std::string>& ignore_dirs,
                                           const std::vector<std::string>& ignore_files) {
    std::vector<fs::path> ret;
    if (!fs::is_directory(root)) {
        return ret;
    }
    auto iter = fs::recursive_directory_iterator(root);
    for (; iter != fs::recursive_directory_iterator(); ++iter) {
        auto& path = iter->path();
        if (iter->is_directory()) {
            if (name_in(ignore_dirs, path)) {
                fwb_log(trace, "Ignoring directory [{}]", path.string());
                iter.disable_recursion_pending();
            }
            continue;
        }
        if (!iter->is_regular_file() || !is_source_of(path, kind)) {
            continue;
        }
        if (name_in(ignore_files, path)) {
            fwb_log(trace, "Ignoring file [{}]", path.string());
            continue;
        }
        ret.push_back(path);
    }
    std::sort(ret.begin(), ret.end());
    return ret;
}

std::unique_ptr<compiler> gnu_compiler::create(const compiler_params& params) {
    auto tc = toolchain::load(params.compiler_dir, params.build_profile);
    return std::make_unique<gnu_compiler>(std::move(tc), params);
}

fs::path gnu_compiler::object_path(path_ref source) const {
    auto relpath = source.lexically_normal().lexically_proximate(_params.base_dir);
    auto ret     = _params.dst_dir / relpath;
    ret.replace_filename(relpath.filename().string() + _toolchain.object_suffix());
    return ret;
}

void gnu_compiler::add_info(const compiler_info& info) { _info.merge(info); }

void gnu_compiler::add_deps(const std::vector<fs::path>& deps) { extend(_extra_deps, deps); }

bool gnu_compiler::_needs_compile(path_ref source, path_ref object) const {
    if (!fs::exists(object)) {
        return true;
    }
    std::vector<fs::path> inputs = {source};
    extend(inputs, _extra_deps);
    if (_toolchain.deps_mode() == file_deps_mode::gnu) {
        auto depfile = object;
        depfile += ".d";
        if (!fs::exists(depfile)) {
            // Without a dependency listing we cannot know what the object was built from
            return true;
        }
        auto deps = parse_mkfile_deps_file(depfile);
        extend(inputs,
               deps.inputs | ranges::views::transform([&](path_ref p) {
                   return p.is_absolute() ? p : _params.base_dir / p;
               }) | ranges::to_vector);
    }
    auto newer = newer_inputs(object, inputs);
    for (auto& in : newer) {
        fwb_log(trace, "  Input [{}] is newer than [{}]", in.string(), object.string());
    }
    return !newer.empty();
}

void gnu_compiler::_compile_one(path_ref source, unit_kind kind) {
    auto object = object_path(source);
    _objects.push_back(object);

    auto rel_source = shortest_path_from(source, _params.base_dir).string();
    if (!_needs_compile(source, object)) {
        fwb_log(debug, "Up-to-date: {}", rel_source);
        return;
    }

    compile_file_spec spec{
        .source_path  = source,
        .out_path     = object,
        .kind         = kind,
        .flags        = _info.cflags,
        .include_dirs = _info.includes,
    };
    if (kind == unit_kind::assembly) {
        extend(spec.flags, _info.aflags);
    }
    auto cmd = _toolchain.create_compile_command(spec, _params.base_dir);

    ensure_directory(object.parent_path());
    fwb_log(info, "Compiling {}", rel_source);
    auto&& [dur_ms, res] = timed<std::chrono::milliseconds>([&] {
        return run_proc(proc_options{
            .command = cmd.command,
            .cwd     = _params.base_dir,
            .timeout = _params.timeout,
        });
    });
    fwb_log(debug, "Compiled {} - {}ms", rel_source, dur_ms.count());

    if (!res.okay()) {
        fwb_log(error, "Compilation failed: {}", rel_source);
        fwb_log(error, "Subcommand FAILED: {}\n{}", quote_command(cmd.command), res.output);
        BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::compile_failure>(
                                       "Compilation failed for [{}]{}",
                                       rel_source,
                                       res.timed_out ? " (timed out)" : ""),
                                   e_tool_command{quote_command(cmd.command)},
                                   e_tool_output{res.output});
    }
    if (!res.output.empty()) {
        fwb_log(warn, "While compiling {}:\n{}", rel_source, res.output);
    }
}

void gnu_compiler::recursive_compile(path_ref                        source_root,
                                     unit_kind                       kind,
                                     const std::vector<std::string>& ignore_dirs) {
    auto all_ignore_dirs = ignore_dirs;
    extend(all_ignore_dirs, _info.ignore_dirs);
    auto sources = collect_sources(source_root, kind, all_ignore_dirs, _info.ignore_files);
    for (auto& src : sources) {
        _compile_one(src, kind);
    }
}

void gnu_compiler::compile_archive(path_ref archive) {
    // Different archiving tools behave differently depending on whether the archive file exists.
    // Make it uniform by simply removing the prior copy.
    if (fs::exists(archive)) {
        fwb_log(debug, "Remove prior archive file [{}]", archive.string());
        ensure_absent(archive);
    }
    if (_objects.empty()) {
        fwb_log(debug, "No objects for [{}]; no archive is created", archive.string());
        return;
    }

    auto cmd = _toolchain.create_archive_command(
        archive_spec{
            .input_files = _objects,
            .out_path    = archive,
        },
        _params.base_dir);

    ensure_directory(archive.parent_path());
    auto rel_archive = shortest_path_from(archive, _params.base_dir).string();
    fwb_log(info, "Archiving {}", rel_archive);
    auto&& [dur_ms, res] = timed<std::chrono::milliseconds>([&] {
        return run_proc(proc_options{
            .command = cmd,
            .cwd     = _params.base_dir,
            .timeout = _params.timeout,
        });
    });
    fwb_log(debug, "Archived {} - {}ms", rel_archive, dur_ms.count());

    if (!res.okay()) {
        fwb_log(error, "Creating static library archive [{}] failed", rel_archive);
        fwb_log(error, "Subcommand FAILED: {}\n{}", quote_command(cmd), res.output);
        BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::archive_failure>(
                                       "Creating static library archive [{}] failed",
                                       rel_archive),
                                   e_tool_command{quote_command(cmd)},
                                   e_tool_output{res.output});
    }
}

void gnu_compiler::compile_elf(path_ref                       output,
                               const std::vector<fs::path>&   archives,
                               const std::optional<fs::path>& linker_script) {
    auto cmd = _toolchain.create_link_executable_command(
        link_exe_spec{
            .inputs        = archives,
            .output        = output,
            .flags         = _info.lflags,
            .linker_script = linker_script ? linker_script : _info.linker_script,
        },
        _params.base_dir);

    ensure_directory(output.parent_path());
    auto rel_output = shortest_path_from(output, _params.base_dir).string();
    fwb_log(info, "Linking {}", rel_output);
    auto&& [dur_ms, res] = timed<std::chrono::milliseconds>([&] {
        return run_proc(proc_options{
            .command = cmd,
            .cwd     = _params.base_dir,
            .timeout = _params.timeout,
        });
    });
    fwb_log(debug, "Linked {} - {}ms", rel_output, dur_ms.count());

    if (!res.okay()) {
        fwb_log(error, "Linking executable [{}] failed", rel_output);
        fwb_log(error, "Subcommand FAILED: {}\n{}", quote_command(cmd), res.output);
        BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::link_failure>(
                                       "Linking executable [{}] failed",
                                       rel_output),
                                   e_tool_command{quote_command(cmd)},
                                   e_tool_output{res.output});
    }
}
