#include <fwb/pkg/settings.hpp>

#include <fwb/error/errors.hpp>
#include <fwb/error/try_catch.hpp>
#include <fwb/util/yaml/errors.hpp>

#include <catch2/catch.hpp>

using namespace std::literals;

namespace {

fwb::settings load(std::string_view content) {
    return fwb::settings::from_string(content, "pkg.yml");
}

}  // namespace

TEST_CASE("Read list settings") {
    auto s = load(R"(
pkg.deps:
    - libs/os
    - libs/util
pkg.cflags: -Wall   -Werror
pkg.apis: console
pkg.empty:
)");
    CHECK(s.string_seq("pkg.deps") == std::vector{"libs/os"s, "libs/util"s});
    CHECK(s.string_seq("pkg.cflags") == std::vector{"-Wall"s, "-Werror"s});
    CHECK(s.string_seq("pkg.apis") == std::vector{"console"s});
    CHECK(s.string_seq("pkg.empty").empty());
    CHECK(s.string_seq("pkg.missing").empty());
    CHECK(s.has("pkg.deps"));
    CHECK_FALSE(s.has("pkg.empty"));
    CHECK_FALSE(s.has("pkg.missing"));
}

TEST_CASE("Feature-gated list settings append in feature order") {
    auto s = load(R"(
pkg.deps: [libs/os]
pkg.deps.TEST: [libs/testutil]
pkg.deps.SHELL: [libs/shell]
)");
    CHECK(s.string_seq("pkg.deps") == std::vector{"libs/os"s});
    CHECK(s.string_seq("pkg.deps", {{"TEST", true}}) == std::vector{"libs/os"s, "libs/testutil"s});
    CHECK(s.string_seq("pkg.deps", {{"TEST", true}, {"SHELL", true}})
          == std::vector{"libs/os"s, "libs/shell"s, "libs/testutil"s});
    CHECK(s.string_seq("pkg.deps", {{"TEST", false}}) == std::vector{"libs/os"s});
}

TEST_CASE("Feature-gated scalar settings override the base value") {
    auto s = load(R"(
bsp.linkerscript: flash.ld
bsp.linkerscript.BOOT: boot.ld
bsp.linkerscript.RAM: ram.ld
)");
    CHECK(s.string("bsp.linkerscript") == "flash.ld");
    CHECK(s.string("bsp.linkerscript", {{"BOOT", true}}) == "boot.ld");
    CHECK(s.string("bsp.linkerscript", {{"BOOT", true}, {"RAM", true}}) == "ram.ld");
    CHECK(s.string("bsp.arch") == std::nullopt);
    CHECK(s.string("bsp.arch", {{"BOOT", true}}) == std::nullopt);
}

TEST_CASE("Read feature filters in document order") {
    auto s = load(R"(
pkg.feature_blacklist:
    "libs/.*": LOGGING
    "^hw/": SHELL
)");
    CHECK(s.filter_entries("pkg.feature_blacklist")
          == std::vector<fwb::feature_filter_entry>{
              {"libs/.*", "LOGGING"},
              {"^hw/", "SHELL"},
          });
    CHECK(s.filter_entries("pkg.feature_whitelist").empty());
}

TEST_CASE("Malformed settings") {
    struct case_ {
        std::string_view content;
        std::string_view key;
    };
    auto c = GENERATE(Catch::Generators::values<case_>({
        {"pkg.deps: {a: b}", "pkg.deps"},
        {"pkg.deps: [[a, b]]", "pkg.deps"},
        {"pkg.feature_blacklist: [LOGGING]", "pkg.feature_blacklist"},
    }));
    INFO(c.content);
    auto s = load(c.content);

    auto bad_key = fwb_leaf_try {
        if (c.key == "pkg.deps") {
            s.string_seq(c.key);
        } else {
            s.filter_entries(c.key);
        }
        return "no error"s;
    }
    fwb_leaf_catch(const fwb::user_error<fwb::errc::invalid_manifest>&,
                   fwb::e_manifest_key  bad,
                   fwb::e_manifest_path path) {
        CHECK(path.value == "pkg.yml");
        return bad.value;
    }
    fwb_leaf_catch_all {
        FAIL_CHECK("Unexpected error: " << diagnostic_info);
        return "wrong error"s;
    };
    CHECK(bad_key == c.key);
}

TEST_CASE("Invalid YAML") {
    auto r = fwb_leaf_try {
        load("pkg.deps: [unterminated");
        return 0;
    }
    fwb_leaf_catch(const fwb::user_error<fwb::errc::invalid_manifest>&,
                   fwb::e_yaml_parse_error,
                   fwb::e_manifest_path path)
        ->int {
        CHECK(path.value == "pkg.yml");
        return 1;
    }
    fwb_leaf_catch_all->int {
        FAIL_CHECK("Unexpected error: " << diagnostic_info);
        return 2;
    };
    CHECK(r == 1);
}
