#include <fwb/toolchain/toolchain.hpp>

#include <fwb/error/errors.hpp>
#include <fwb/error/try_catch.hpp>
#include <fwb/util/yaml/errors.hpp>

#include <catch2/catch.hpp>

using namespace std::literals;
using strings = std::vector<std::string>;

namespace {

fwb::toolchain make_toolchain(std::string_view yaml, std::string_view profile = "default") {
    return fwb::toolchain::from_settings(fwb::settings::from_string(yaml, "compiler.yml"),
                                         profile);
}

constexpr auto arm_gcc = R"(
compiler.path.cc: arm-none-eabi-gcc
compiler.path.archive: arm-none-eabi-ar
compiler.flags.base: -mcpu=cortex-m4 -mthumb
compiler.flags.default: [-Os, -ggdb]
compiler.flags.debug: -O0 -ggdb
compiler.as.flags: -DASSEMBLER
compiler.ld.flags: -static -nostartfiles
)";

}  // namespace

TEST_CASE("Create a C compile command") {
    auto tc  = make_toolchain(arm_gcc);
    auto cmd = tc.create_compile_command(
        fwb::compile_file_spec{
            .source_path  = "/proj/libs/os/src/os.c",
            .out_path     = "/proj/bin/t/libs/os/src/os.c.o",
            .kind         = fwb::unit_kind::c,
            .flags        = {"-DARCH_cortex_m4"},
            .include_dirs = {"/proj/libs/os/include"},
        },
        "/proj");
    CHECK(cmd.command
          == strings{"arm-none-eabi-gcc",
                     "-mcpu=cortex-m4",
                     "-mthumb",
                     "-Os",
                     "-ggdb",
                     "-DARCH_cortex_m4",
                     "-Ilibs/os/include",
                     "-MMD",
                     "-MF",
                     "bin/t/libs/os/src/os.c.o.d",
                     "-c",
                     "libs/os/src/os.c",
                     "-o",
                     "bin/t/libs/os/src/os.c.o"});
    REQUIRE(cmd.gnu_depfile_path.has_value());
    CHECK(*cmd.gnu_depfile_path == "/proj/bin/t/libs/os/src/os.c.o.d");
}

TEST_CASE("Assembly sources use the assembler command and flags") {
    auto tc  = make_toolchain(arm_gcc, "debug");
    auto cmd = tc.create_compile_command(
        fwb::compile_file_spec{
            .source_path = "/p/src/arch/cortex_m4/startup.s",
            .out_path    = "/p/obj/startup.s.o",
            .kind        = fwb::unit_kind::assembly,
        },
        "/p");
    CHECK(cmd.command
          == strings{"arm-none-eabi-gcc",
                     "-x",
                     "assembler-with-cpp",
                     "-mcpu=cortex-m4",
                     "-mthumb",
                     "-O0",
                     "-ggdb",
                     "-DASSEMBLER",
                     "-MMD",
                     "-MF",
                     "obj/startup.s.o.d",
                     "-c",
                     "src/arch/cortex_m4/startup.s",
                     "-o",
                     "obj/startup.s.o"});
}

TEST_CASE("Create archive and link commands") {
    auto tc = make_toolchain(arm_gcc);
    CHECK(tc.create_archive_command({.input_files = {"/p/obj/a.c.o", "/p/obj/b.c.o"},
                                     .out_path    = "/p/obj/lib.a"},
                                    "/p")
          == strings{"arm-none-eabi-ar", "rcs", "obj/lib.a", "obj/a.c.o", "obj/b.c.o"});

    auto link = tc.create_link_executable_command(
        fwb::link_exe_spec{
            .inputs        = {"/p/bin/os/os.a", "/p/bin/app/app.a"},
            .output        = "/p/bin/app/app.elf",
            .flags         = {"-lm"},
            .linker_script = "/p/hw/bsp/boot.ld",
        },
        "/p");
    CHECK(link
          == strings{"arm-none-eabi-gcc",
                     "-o",
                     "bin/app/app.elf",
                     "-static",
                     "-nostartfiles",
                     "-lm",
                     "-Wl,--start-group",
                     "bin/os/os.a",
                     "bin/app/app.a",
                     "-Wl,--end-group",
                     "-Thw/bsp/boot.ld"});
}

TEST_CASE("Dependency tracking can be disabled") {
    auto tc = make_toolchain("compiler.path.cc: cc\ncompiler.deps_mode: none\n"
                             "compiler.object_suffix: .obj\n");
    CHECK(tc.deps_mode() == fwb::file_deps_mode::none);
    CHECK(tc.object_suffix() == ".obj");
    auto cmd = tc.create_compile_command({.source_path = "/p/a.c", .out_path = "/p/a.c.obj"},
                                         "/p");
    CHECK(cmd.command == strings{"cc", "-c", "a.c", "-o", "a.c.obj"});
    CHECK_FALSE(cmd.gnu_depfile_path.has_value());
}

TEST_CASE("Undefined build profiles are rejected") {
    auto r = fwb_leaf_try {
        make_toolchain(arm_gcc, "optimized");
        return 0;
    }
    fwb_leaf_catch(const fwb::configuration_error&, fwb::e_manifest_key key)->int {
        CHECK(key.value == "compiler.flags.optimized");
        return 1;
    }
    fwb_leaf_catch_all->int {
        FAIL_CHECK("Unexpected error: " << diagnostic_info);
        return 2;
    };
    CHECK(r == 1);
}

TEST_CASE("A toolchain needs a C compiler") {
    CHECK_THROWS_AS(make_toolchain("compiler.path.archive: ar\n"), fwb::configuration_error);
}
