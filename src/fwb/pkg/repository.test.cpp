#include <fwb/pkg/repository.hpp>
#include <fwb/pkg/target.hpp>

#include <fwb/error/errors.hpp>
#include <fwb/error/try_catch.hpp>
#include <fwb/pkg/errors.hpp>
#include <fwb/testing.hpp>

#include <catch2/catch.hpp>

using namespace std::literals;
namespace fs = fwb::fs;

TEST_CASE("Discover packages") {
    fwb::testing::temp_project proj;
    proj.write("libs/os/pkg.yml", "pkg.type: lib\n");
    proj.write("libs/os/src/os.c", "");
    proj.write("hw/bsp/sim/pkg.yml", "pkg.type: bsp\n");
    proj.write("hw/bsp/sim/bsp.yml", "bsp.arch: sim\n");
    proj.write("apps/blinky/pkg.yml", "pkg.name: apps/blinky_renamed\n");
    // Not packages
    proj.write("docs/README.md", "");
    proj.write("bin/old/pkg.yml", "");
    proj.write(".git/pkg.yml", "");

    auto repo = REQUIRES_LEAF_NOFAIL(fwb::package_repository::load(proj.root()));
    CHECK(repo.name() == "local");
    CHECK(repo.packages().size() == 3);

    auto os = repo.find("libs/os");
    REQUIRE(os);
    CHECK(os->name() == "libs/os");
    CHECK(os->full_name() == "libs/os");
    CHECK(os->basename() == "os");
    CHECK(os->type() == "lib");
    CHECK(os->base_path() == repo.root() / "libs/os");
    CHECK(os->cfg_files() == std::vector<fs::path>{repo.root() / "libs/os/pkg.yml"});

    auto bsp = repo.find("hw/bsp/sim");
    REQUIRE(bsp);
    CHECK(bsp->type() == "bsp");
    CHECK(bsp->cfg_files()
          == std::vector<fs::path>{
              repo.root() / "hw/bsp/sim/pkg.yml",
              repo.root() / "hw/bsp/sim/bsp.yml",
          });

    CHECK(repo.find("apps/blinky") == nullptr);
    CHECK(repo.find("apps/blinky_renamed"));
    CHECK(repo.find("@local/libs/os") == os);
    CHECK(repo.find("@other/libs/os") == nullptr);
    CHECK(repo.find("libs") == nullptr);
}

TEST_CASE("Packages in other repositories have qualified names") {
    fwb::testing::temp_project proj;
    proj.write("hw/mcu/pkg.yml", "");

    auto repo = REQUIRES_LEAF_NOFAIL(fwb::package_repository::load(proj.root(), "vendor"));
    auto pkg  = repo.find("@vendor/hw/mcu");
    REQUIRE(pkg);
    CHECK(pkg->name() == "hw/mcu");
    CHECK(pkg->full_name() == "@vendor/hw/mcu");
    CHECK(pkg->basename() == "mcu");
    CHECK(repo.find("hw/mcu") == pkg);
}

TEST_CASE("Duplicate package names are rejected") {
    fwb::testing::temp_project proj;
    proj.write("libs/a/pkg.yml", "pkg.name: libs/util\n");
    proj.write("libs/util/pkg.yml", "");

    auto dup = fwb_leaf_try {
        fwb::package_repository::load(proj.root());
        return ""s;
    }
    fwb_leaf_catch(const fwb::configuration_error&, fwb::e_package_name pkg) {
        return pkg.value;
    }
    fwb_leaf_catch_all {
        FAIL_CHECK("Unexpected error: " << diagnostic_info);
        return ""s;
    };
    CHECK(dup == "libs/util");
}

TEST_CASE("Load a target") {
    fwb::testing::temp_project proj;
    proj.write("apps/blinky/pkg.yml", "pkg.type: app\n");
    proj.write("hw/bsp/sim/pkg.yml", "pkg.type: bsp\n");
    proj.write("targets/sim_blinky/pkg.yml", "pkg.type: target\n");
    proj.write("targets/sim_blinky/target.yml",
               "target.app: apps/blinky\n"
               "target.bsp: hw/bsp/sim\n"
               "target.build_profile: debug\n");
    proj.write("targets/sim_test/pkg.yml", "pkg.type: target\n");
    proj.write("targets/sim_test/target.yml", "target.bsp: hw/bsp/sim\n");
    proj.write("targets/broken/pkg.yml", "pkg.type: target\n");
    proj.write("targets/broken/target.yml",
               "target.app: apps/nowhere\n"
               "target.bsp: hw/bsp/sim\n");
    auto repo = fwb::package_repository::load(proj.root());

    SECTION("Complete") {
        auto t = REQUIRES_LEAF_NOFAIL(fwb::target::load(repo, "targets/sim_blinky"));
        CHECK(t.full_name() == "targets/sim_blinky");
        CHECK(t.app_name() == "apps/blinky");
        CHECK(t.bsp_name() == "hw/bsp/sim");
        CHECK(t.build_profile() == "debug");
        CHECK(t.app(repo) == repo.find("apps/blinky"));
        CHECK(t.bsp(repo) == repo.find("hw/bsp/sim"));
        REQUIRES_LEAF_NOFAIL(t.validate(repo, true));
    }

    SECTION("Without an app") {
        auto t = REQUIRES_LEAF_NOFAIL(fwb::target::load(repo, "targets/sim_test"));
        CHECK(t.build_profile() == "default");
        CHECK(t.app(repo) == nullptr);
        REQUIRES_LEAF_NOFAIL(t.validate(repo, false));
        CHECK_THROWS_WITH(t.validate(repo, true),
                          "Target 'targets/sim_test' does not specify an app");
    }

    SECTION("Naming a missing app") {
        auto t = REQUIRES_LEAF_NOFAIL(fwb::target::load(repo, "targets/broken"));
        auto missing = fwb_leaf_try {
            t.validate(repo, false);
            return ""s;
        }
        fwb_leaf_catch(const fwb::configuration_error&, fwb::e_dependency_name dep) {
            return dep.value;
        }
        fwb_leaf_catch_all {
            FAIL_CHECK("Unexpected error: " << diagnostic_info);
            return ""s;
        };
        CHECK(missing == "apps/nowhere");
    }

    SECTION("Not a target") {
        CHECK_THROWS_WITH(fwb::target::load(repo, "apps/blinky"),
                          "Package 'apps/blinky' is not a target (no target.yml)");
        CHECK_THROWS_WITH(fwb::target::load(repo, "targets/nope"),
                          "Target package not found: targets/nope");
    }
}
