#include <fwb/toolchain/compiler_info.hpp>

#include <catch2/catch.hpp>

using namespace std::literals;

TEST_CASE("Merge appends additive categories in order") {
    fwb::compiler_info base;
    base.cflags   = {"-DTARGET"};
    base.includes = {"target/include"};

    fwb::compiler_info app;
    app.cflags      = {"-DAPP", "-DTARGET"};
    app.lflags      = {"-lm"};
    app.ignore_dirs = {"sim"};

    base.merge(app);
    CHECK(base.cflags == std::vector{"-DTARGET"s, "-DAPP"s, "-DTARGET"s});
    CHECK(base.lflags == std::vector{"-lm"s});
    CHECK(base.includes == std::vector<fwb::fs::path>{"target/include"});
    CHECK(base.ignore_dirs == std::vector{"sim"s});
    CHECK(base.aflags.empty());
    CHECK_FALSE(base.linker_script.has_value());
}

TEST_CASE("Merge replaces the linker script only when the incoming one is set") {
    fwb::compiler_info base;
    base.linker_script = "boot.ld";

    fwb::compiler_info no_script;
    no_script.cflags = {"-O2"};
    base.merge(no_script);
    REQUIRE(base.linker_script.has_value());
    CHECK(*base.linker_script == "boot.ld");

    fwb::compiler_info with_script;
    with_script.linker_script = "app.ld";
    base.merge(with_script);
    CHECK(*base.linker_script == "app.ld");
}
