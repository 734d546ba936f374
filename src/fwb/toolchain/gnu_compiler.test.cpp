#include <fwb/toolchain/gnu_compiler.hpp>

#include <fwb/error/errors.hpp>
#include <fwb/error/try_catch.hpp>
#include <fwb/testing.hpp>
#include <fwb/toolchain/errors.hpp>
#include <fwb/util/fs/io.hpp>
#include <fwb/util/string.hpp>

#include <catch2/catch.hpp>
#include <fmt/core.h>

#include <chrono>
#include <sstream>

using namespace std::literals;
namespace fs = fwb::fs;

namespace {

/**
 * A project whose compiler package runs shell scripts that log their arguments, create their
 * outputs, and reject any source named `bad.c`.
 */
struct script_project {
    fwb::testing::temp_project proj;
    fs::path                   root = fs::canonical(proj.root());
    fs::path                   calls_log = root / "calls.log";

    explicit script_project(std::string_view deps_mode = "gnu") {
        proj.write("tools/cc.sh",
                   "#!/bin/sh\n"
                   "echo \"cc $*\" >> " + calls_log.string() + "\n"
                   "out=''\n"
                   "src=''\n"
                   "mf=''\n"
                   "while [ $# -gt 0 ]; do\n"
                   "    case \"$1\" in\n"
                   "        -o) out=\"$2\"; shift ;;\n"
                   "        -c) src=\"$2\"; shift ;;\n"
                   "        -MF) mf=\"$2\"; shift ;;\n"
                   "    esac\n"
                   "    shift\n"
                   "done\n"
                   "case \"$src\" in\n"
                   "    *bad.c)\n"
                   "        echo \"$src:1:1: error: expected ';' before '}' token\"\n"
                   "        exit 1 ;;\n"
                   "esac\n"
                   ": > \"$out\"\n"
                   "if [ -n \"$mf\" ]; then\n"
                   "    echo \"$out: $src include/config.h\" > \"$mf\"\n"
                   "fi\n");
        proj.write("tools/ar.sh",
                   "#!/bin/sh\n"
                   "echo \"ar $*\" >> " + calls_log.string() + "\n"
                   "shift\n"
                   "out=\"$1\"\n"
                   "shift\n"
                   "cat \"$@\" > \"$out\"\n");
        proj.write("compiler/pkg.yml", "pkg.type: compiler\n");
        proj.write("compiler/compiler.yml",
                   fmt::format("compiler.path.cc: sh {0}/tools/cc.sh\n"
                               "compiler.path.archive: sh {0}/tools/ar.sh\n"
                               "compiler.flags.default: -Os\n"
                               "compiler.deps_mode: {1}\n",
                               root.string(),
                               deps_mode));
        proj.write("include/config.h", "");
        proj.write("src/a.c", "");
        proj.write("src/b.c", "");
        proj.write("src/arch/x86/start.s", "");
    }

    fwb::compiler_params params() const {
        return fwb::compiler_params{
            .compiler_dir  = root / "compiler",
            .build_profile = "default",
            .dst_dir       = root / "bin/obj",
            .base_dir      = root,
            .timeout       = std::chrono::seconds(10),
        };
    }

    fwb::gnu_compiler make_compiler() const {
        return fwb::gnu_compiler{fwb::toolchain::load(root / "compiler", "default"), params()};
    }

    /// The logged invocations of the given tool
    std::vector<std::string> calls(std::string_view tool) const {
        std::vector<std::string> ret;
        if (!fs::exists(calls_log)) {
            return ret;
        }
        std::istringstream lines{fwb::read_file(calls_log)};
        std::string        line;
        while (std::getline(lines, line)) {
            if (fwb::starts_with(line, std::string(tool) + " ")) {
                ret.push_back(line);
            }
        }
        return ret;
    }

    std::size_t compile_count() const {
        auto        cc_calls = calls("cc");
        std::size_t n        = 0;
        for (auto& c : cc_calls) {
            if (c.find(" -c ") != c.npos) {
                ++n;
            }
        }
        return n;
    }

    /// Move every file of the project an hour into the past
    void age_all() const {
        auto past = fs::file_time_type::clock::now() - std::chrono::hours(1);
        for (auto& entry : fs::recursive_directory_iterator(root)) {
            if (entry.is_regular_file()) {
                fs::last_write_time(entry.path(), past);
            }
        }
    }

    /// Mark a file as modified after every aged file, but before anything written from now on
    void touch(const fs::path& file) const {
        fs::last_write_time(file, fs::file_time_type::clock::now() - std::chrono::minutes(1));
    }
};

}  // namespace

TEST_CASE("Collect sources") {
    fwb::testing::temp_project proj;
    proj.write("src/main.c", "");
    proj.write("src/util/strings.c", "");
    proj.write("src/util/strings.h", "");
    proj.write("src/util/legacy.c", "");
    proj.write("src/test/test_main.c", "");
    proj.write("src/arch/arm/vectors.s", "");
    proj.write("src/arch/arm/reset.S", "");
    proj.write("src/arch/arm/clock.c", "");
    auto src = proj.root() / "src";

    CHECK(fwb::collect_sources(src, fwb::unit_kind::c, {"test", "arch"}, {})
          == std::vector<fs::path>{
              src / "main.c",
              src / "util/legacy.c",
              src / "util/strings.c",
          });
    CHECK(fwb::collect_sources(src, fwb::unit_kind::c, {"test", "arch"}, {"legacy.c"})
          == std::vector<fs::path>{src / "main.c", src / "util/strings.c"});
    CHECK(fwb::collect_sources(src / "arch/arm", fwb::unit_kind::assembly, {}, {})
          == std::vector<fs::path>{src / "arch/arm/reset.S", src / "arch/arm/vectors.s"});
    CHECK(fwb::collect_sources(src / "nowhere", fwb::unit_kind::c, {}, {}).empty());
}

TEST_CASE("Compile, archive and link with the toolchain's commands") {
    script_project p;
    auto           c = p.make_compiler();
    c.add_info(fwb::compiler_info{.includes = {p.root / "include"}, .cflags = {"-DARCH_x86"}});

    CHECK(c.object_path(p.root / "src/a.c") == p.root / "bin/obj/src/a.c.o");

    REQUIRES_LEAF_NOFAIL(c.recursive_compile(p.root / "src", fwb::unit_kind::c, {"arch"}));
    REQUIRES_LEAF_NOFAIL(
        c.recursive_compile(p.root / "src/arch/x86", fwb::unit_kind::assembly, {}));
    CHECK(c.objects()
          == std::vector<fs::path>{
              p.root / "bin/obj/src/a.c.o",
              p.root / "bin/obj/src/b.c.o",
              p.root / "bin/obj/src/arch/x86/start.s.o",
          });
    for (auto& obj : c.objects()) {
        CHECK(fs::exists(obj));
    }

    auto cc_calls = p.calls("cc");
    REQUIRE(cc_calls.size() == 3);
    CHECK(cc_calls[0]
          == "cc -Os -DARCH_x86 -Iinclude -MMD -MF bin/obj/src/a.c.o.d -c src/a.c -o "
             "bin/obj/src/a.c.o");
    CHECK(cc_calls[2]
          == "cc -x assembler-with-cpp -Os -DARCH_x86 -Iinclude -MMD -MF "
             "bin/obj/src/arch/x86/start.s.o.d -c src/arch/x86/start.s -o "
             "bin/obj/src/arch/x86/start.s.o");

    auto archive = p.root / "bin/obj/pkg.a";
    REQUIRES_LEAF_NOFAIL(c.compile_archive(archive));
    CHECK(fs::exists(archive));
    CHECK(p.calls("ar")
          == std::vector<std::string>{
              "ar rcs bin/obj/pkg.a bin/obj/src/a.c.o bin/obj/src/b.c.o "
              "bin/obj/src/arch/x86/start.s.o"});

    auto elf = p.root / "bin/app.elf";
    REQUIRES_LEAF_NOFAIL(c.compile_elf(elf, {archive}, p.root / "link.ld"));
    CHECK(fs::exists(elf));
    CHECK(p.calls("cc").back()
          == "cc -o bin/app.elf -Wl,--start-group bin/obj/pkg.a -Wl,--end-group -Tlink.ld");
}

TEST_CASE("Up-to-date objects are not rebuilt") {
    script_project p;
    {
        auto c = p.make_compiler();
        REQUIRES_LEAF_NOFAIL(c.recursive_compile(p.root / "src", fwb::unit_kind::c, {"arch"}));
    }
    REQUIRE(p.compile_count() == 2);
    auto a_obj = p.root / "bin/obj/src/a.c.o";
    auto b_obj = p.root / "bin/obj/src/b.c.o";
    REQUIRE(fs::exists(fs::path(a_obj) += ".d"));

    auto recompile = [&](std::vector<fs::path> extra_deps = {}) {
        auto before = p.compile_count();
        auto c      = p.make_compiler();
        c.add_deps(extra_deps);
        REQUIRES_LEAF_NOFAIL(c.recursive_compile(p.root / "src", fwb::unit_kind::c, {"arch"}));
        // Skipped objects still belong in the archive
        CHECK(c.objects().size() == 2);
        return p.compile_count() - before;
    };

    p.age_all();
    CHECK(recompile() == 0);

    p.age_all();
    p.touch(p.root / "src/b.c");
    CHECK(recompile() == 1);
    CHECK(recompile() == 0);

    // A header named by the dependency listing
    p.age_all();
    p.touch(p.root / "include/config.h");
    CHECK(recompile() == 2);

    auto manifest = p.proj.write("pkg.yml", "pkg.cflags: -DNEW\n");
    p.age_all();
    p.touch(manifest);
    CHECK(recompile({manifest}) == 2);
    CHECK(recompile({manifest}) == 0);

    fs::remove(a_obj);
    CHECK(recompile() == 1);
}

TEST_CASE("Without dependency tracking only the source is checked") {
    script_project p{"none"};
    {
        auto c = p.make_compiler();
        REQUIRES_LEAF_NOFAIL(c.recursive_compile(p.root / "src", fwb::unit_kind::c, {"arch"}));
    }
    CHECK_THAT(p.calls("cc")[0], !Catch::Contains("-MMD"));
    CHECK_FALSE(fs::exists(p.root / "bin/obj/src/a.c.o.d"));

    p.age_all();
    p.touch(p.root / "include/config.h");
    auto c = p.make_compiler();
    REQUIRES_LEAF_NOFAIL(c.recursive_compile(p.root / "src", fwb::unit_kind::c, {"arch"}));
    CHECK(p.compile_count() == 2);
}

TEST_CASE("A failing compile reports the command and its output") {
    script_project p;
    p.proj.write("src/bad.c", "");
    auto c = p.make_compiler();

    auto r = fwb_leaf_try {
        c.recursive_compile(p.root / "src", fwb::unit_kind::c, {"arch"});
        return 0;
    }
    fwb_leaf_catch(const fwb::compile_error& exc,
                   fwb::e_tool_command          cmd,
                   fwb::e_tool_output           output)
        ->int {
        CHECK_THAT(exc.what(), Catch::Contains("src/bad.c"));
        CHECK_THAT(cmd.value, Catch::EndsWith("-c src/bad.c -o bin/obj/src/bad.c.o"));
        CHECK_THAT(output.value, Catch::Contains("error: expected ';'"));
        return 1;
    }
    fwb_leaf_catch_all->int {
        FAIL_CHECK("Unexpected error: " << diagnostic_info);
        return 2;
    };
    CHECK(r == 1);
    // Sources are compiled in path order up to the failure
    CHECK(fs::exists(p.root / "bin/obj/src/a.c.o"));
    CHECK(fs::exists(p.root / "bin/obj/src/b.c.o"));
    CHECK_FALSE(fs::exists(p.root / "bin/obj/src/bad.c.o"));
}

TEST_CASE("Archiving without objects removes the prior archive") {
    script_project p;
    auto           archive = p.proj.write("bin/obj/empty.a", "stale");

    auto c = p.make_compiler();
    REQUIRES_LEAF_NOFAIL(c.recursive_compile(p.root / "nowhere", fwb::unit_kind::c, {}));
    REQUIRES_LEAF_NOFAIL(c.compile_archive(archive));
    CHECK_FALSE(fs::exists(archive));
    CHECK(p.calls("ar").empty());
}
