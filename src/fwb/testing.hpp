#pragma once

#include <fwb/toolchain/compiler.hpp>
#include <fwb/toolchain/gnu_compiler.hpp>
#include <fwb/util/fs/io.hpp>
#include <fwb/util/fs/shutil.hpp>
#include <fwb/util/temp.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <boost/leaf/result.hpp>
#include <catch2/catch.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fwb::testing {

template <typename Fn>
constexpr auto leaf_handle_nofail(Fn&& fn) {
    using rtype = decltype(fn());
    if constexpr (boost::leaf::is_result_type<rtype>::value) {
        return boost::leaf::try_handle_all(  //
            fn,
            [](const boost::leaf::verbose_diagnostic_info& info) -> decltype(fn().value()) {
                FAIL("Operation failed: " << info);
                std::terminate();
            });
    } else {
        return boost::leaf::try_catch(  //
            fn,
            [](const boost::leaf::verbose_diagnostic_info& info) -> decltype(fn()) {
                FAIL("Operation failed: " << info);
                std::terminate();
            });
    }
}
#define REQUIRES_LEAF_NOFAIL(...)                                                                  \
    (::fwb::testing::leaf_handle_nofail([&] { return (__VA_ARGS__); }))

/**
 * A scratch project directory that is deleted at the end of the test.
 */
class temp_project {
    temporary_dir _dir = temporary_dir::create();

public:
    path_ref root() const noexcept { return _dir.path(); }

    /// Write a file relative to the project root, creating parent directories
    fs::path write(std::string_view relpath, std::string_view content) const {
        auto fpath = root() / relpath;
        ensure_directory(fpath.parent_path());
        write_file(fpath, content);
        return fpath;
    }

    fs::path mkdir(std::string_view relpath) const {
        auto dir = root() / relpath;
        ensure_directory(dir);
        return dir;
    }
};

/// One source handed to a `recording_compiler`
struct recorded_compile {
    fs::path      source;
    unit_kind     kind;
    fs::path      dst_dir;
    compiler_info info;
};

struct recorded_link {
    fs::path                output;
    std::vector<fs::path>   archives;
    std::optional<fs::path> linker_script;
    compiler_info           info;
};

/**
 * Everything the compilers of one factory were asked to do, in order.
 */
struct compile_log {
    std::vector<compiler_params>  created;
    std::vector<recorded_compile> compiles;
    std::vector<fs::path>         archives;
    std::vector<recorded_link>    links;
    std::vector<fs::path>         extra_deps;

    /// Body of the shell script written as the "linked executable"
    std::string exe_script = "#!/bin/sh\necho \"All tests passed\"\n";

    const recorded_compile* find_compile(path_ref source) const noexcept {
        for (auto& c : compiles) {
            if (c.source == source) {
                return &c;
            }
        }
        return nullptr;
    }
};

/**
 * A `compiler` that records its calls and writes placeholder outputs instead of running tools.
 *
 * Sources are discovered on disk exactly as `gnu_compiler` discovers them.
 */
class recording_compiler : public compiler {
    compiler_params              _params;
    std::shared_ptr<compile_log> _log;
    compiler_info                _info;
    std::vector<fs::path>        _objects;

public:
    recording_compiler(compiler_params params, std::shared_ptr<compile_log> log)
        : _params(std::move(params))
        , _log(std::move(log)) {}

    void add_info(const compiler_info& info) override { _info.merge(info); }

    void add_deps(const std::vector<fs::path>& deps) override {
        _log->extra_deps.insert(_log->extra_deps.end(), deps.begin(), deps.end());
    }

    void recursive_compile(path_ref                        source_root,
                           unit_kind                       kind,
                           const std::vector<std::string>& ignore_dirs) override {
        auto all_ignore = ignore_dirs;
        all_ignore.insert(all_ignore.end(), _info.ignore_dirs.begin(), _info.ignore_dirs.end());
        for (auto& src : collect_sources(source_root, kind, all_ignore, _info.ignore_files)) {
            auto obj = _params.dst_dir / src.lexically_proximate(_params.base_dir);
            obj += ".o";
            ensure_directory(obj.parent_path());
            write_file(obj, "object");
            _objects.push_back(obj);
            _log->compiles.push_back({src, kind, _params.dst_dir, _info});
        }
    }

    void compile_archive(path_ref archive) override {
        ensure_absent(archive);
        if (_objects.empty()) {
            return;
        }
        ensure_directory(archive.parent_path());
        std::string content;
        for (auto& obj : _objects) {
            content += obj.string() + "\n";
        }
        write_file(archive, content);
        _log->archives.push_back(archive);
    }

    void compile_elf(path_ref                       output,
                     const std::vector<fs::path>&   archives,
                     const std::optional<fs::path>& linker_script) override {
        ensure_directory(output.parent_path());
        write_file(output, _log->exe_script);
        fs::permissions(output,
                        fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add);
        _log->links.push_back({output, archives, linker_script, _info});
    }
};

inline compiler_factory recording_compiler_factory(std::shared_ptr<compile_log> log) {
    return [log](const compiler_params& params) -> std::unique_ptr<compiler> {
        log->created.push_back(params);
        return std::make_unique<recording_compiler>(params, log);
    };
}

}  // namespace fwb::testing
