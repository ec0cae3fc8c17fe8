// forge_release Addon and AddonLocation tests

#include <catch2/catch_test_macros.hpp>
#include <addon_forge/release/addon.hpp>

#include "test_support.hpp"

#include <set>

using namespace forge_release;
using forge_core::ReleaseError;

namespace {

Addon make_addon(const std::string& name, AddonLocation location = AddonLocation::core()) {
    auto addon = Addon::create(name, std::move(location));
    REQUIRE(addon.is_ok());
    return std::move(addon).value();
}

} // namespace

// =============================================================================
// AddonLocation
// =============================================================================

TEST_CASE("AddonLocation folders", "[release][addon]") {
    REQUIRE(AddonLocation::core().folder() == "addons");
    REQUIRE(AddonLocation::optional().folder() == "optionals");
    REQUIRE(AddonLocation::compat().folder() == "compats");
    REQUIRE(AddonLocation::custom("extras").folder() == "extras");

    REQUIRE(AddonLocation::from_folder("optionals") == AddonLocation::optional());
    REQUIRE(AddonLocation::from_folder("extras") == AddonLocation::custom("extras"));
    REQUIRE_FALSE(AddonLocation::custom("extras").is_first_class());
}

TEST_CASE("AddonLocation reserved custom folders", "[release][addon]") {
    REQUIRE(AddonLocation::custom("addons") == AddonLocation::core());
    REQUIRE(AddonLocation::custom("optionals") == AddonLocation::optional());
    REQUIRE(AddonLocation::custom("compats") == AddonLocation::compat());
    REQUIRE(AddonLocation::custom("addons").is_first_class());
}

TEST_CASE("Custom locations stay inside the project", "[release][addon]") {
    for (const char* folder : {"", ".", "..", "../../escape", "a/b", "a\\b"}) {
        auto location = AddonLocation::custom(folder);
        REQUIRE_FALSE(location.is_valid());

        auto addon = Addon::create("main", location);
        REQUIRE(addon.is_err());
        REQUIRE(addon.error().code() == forge_core::ErrorCode::InvalidArgument);

        auto discovered = discover_addons("root", location);
        REQUIRE(discovered.is_err());
    }

    REQUIRE(AddonLocation::custom("extras").is_valid());
    REQUIRE(AddonLocation::core().is_valid());
}

TEST_CASE("AddonLocation ordering", "[release][addon]") {
    REQUIRE(AddonLocation::core() < AddonLocation::optional());
    REQUIRE(AddonLocation::optional() < AddonLocation::compat());
    REQUIRE(AddonLocation::compat() < AddonLocation::custom("a"));
    REQUIRE(AddonLocation::custom("a") < AddonLocation::custom("b"));
    REQUIRE(AddonLocation() == AddonLocation::core());
}

// =============================================================================
// Name validation
// =============================================================================

TEST_CASE("Addon name validation", "[release][addon]") {
    SECTION("standard names are accepted without warnings") {
        forge_test::LogCapture capture(forge_core::release_logger());
        auto addon = Addon::create("my_addon_2", AddonLocation::core());
        REQUIRE(addon.is_ok());
        REQUIRE(addon->name() == "my_addon_2");
        REQUIRE(addon->location() == AddonLocation::core());
        REQUIRE(capture.count("Invalid character") == 0);
    }

    SECTION("discouraged characters warn once per occurrence") {
        forge_test::LogCapture capture(forge_core::release_logger());
        auto addon = Addon::create("My-Addon", AddonLocation::core());
        REQUIRE(addon.is_ok());
        REQUIRE(capture.count("Invalid character") == 3);
        REQUIRE((addon_name_warnings("My-Addon") == std::vector<char>{'M', '-', 'A'}));
    }

    SECTION("other characters are rejected") {
        for (const char* name : {"my addon", "my.addon", "addon!", "ädd", ""}) {
            auto addon = Addon::create(name, AddonLocation::optional());
            REQUIRE(addon.is_err());
            REQUIRE(addon.error().is_release_error(ReleaseError::Kind::InvalidName));
            REQUIRE_FALSE(is_valid_addon_name(name));
        }
    }

    SECTION("rejection carries the location") {
        auto addon = Addon::create("bad name", AddonLocation::compat());
        REQUIRE(addon.is_err());
        auto* location = addon.error().get_context("location");
        REQUIRE(location != nullptr);
        REQUIRE(*location == "compats");
    }
}

// =============================================================================
// Derived paths
// =============================================================================

TEST_CASE("Addon derived paths", "[release][addon]") {
    const std::filesystem::path root = "root";

    SECTION("source") {
        REQUIRE(make_addon("my_addon").source() == std::filesystem::path("addons") / "my_addon");
        REQUIRE(make_addon("x", AddonLocation::custom("extras")).source()
            == std::filesystem::path("extras") / "x");
    }

    SECTION("archive name") {
        auto addon = make_addon("my_addon");
        REQUIRE(addon.archive_name() == "my_addon.pbo");
        REQUIRE(addon.archive_name("ace") == "ace_my_addon.pbo");
    }

    SECTION("core destination") {
        REQUIRE(make_addon("my_addon").destination(root)
            == root / "addons" / "my_addon.pbo");
    }

    SECTION("standalone optional destination") {
        auto addon = make_addon("my_addon", AddonLocation::optional());
        REQUIRE(addon.destination(root, "ace", "ACE3")
            == root / "optionals" / "@ACE3_my_addon" / "addons" / "ace_my_addon.pbo");
    }

    SECTION("standalone core warns but is honoured") {
        forge_test::LogCapture capture(forge_core::release_logger());
        auto parent = make_addon("main").destination_parent(root, "mod");
        REQUIRE(parent == root / "addons" / "@mod_main" / "addons");
        REQUIRE(capture.count("Standalone addons should be in optionals or compats") == 1);
    }

    SECTION("destinations are distinct across location, name, prefix and standalone") {
        std::set<std::filesystem::path> seen;
        std::size_t combinations = 0;
        for (const auto& location : {AddonLocation::core(), AddonLocation::optional(),
                                     AddonLocation::compat(), AddonLocation::custom("extras")}) {
            for (const char* name : {"alpha", "beta"}) {
                auto addon = make_addon(name, location);
                seen.insert(addon.destination(root));
                seen.insert(addon.destination(root, "pre"));
                seen.insert(addon.destination(root, std::nullopt, "mod"));
                seen.insert(addon.destination(root, "pre", "mod"));
                combinations += 4;
            }
        }
        REQUIRE(seen.size() == combinations);
    }

    SECTION("a custom folder named like a category shares that category's identity") {
        auto core = make_addon("main");
        auto aliased = make_addon("main", AddonLocation::custom("addons"));
        REQUIRE(aliased.location() == core.location());
        REQUIRE(aliased == core);
        REQUIRE(aliased.destination(root) == core.destination(root));

        auto extras = make_addon("main", AddonLocation::custom("extras"));
        REQUIRE(extras.location() != core.location());
        REQUIRE(extras.destination(root) != core.destination(root));
        REQUIRE(extras.destination(root).parent_path() == root / "extras");
    }

    SECTION("template variables") {
        auto json = make_addon("main").to_json();
        REQUIRE(json["addon"]["name"] == "main");
        REQUIRE(json["addon"]["source"] == "addons/main");
    }
}

// =============================================================================
// Lookup and discovery
// =============================================================================

TEST_CASE("Addon lookup on disk", "[release][addon]") {
    forge_test::TempDir project("forge_addon");
    std::filesystem::create_directories(project / "addons" / "main");
    std::filesystem::create_directories(project / "optionals" / "extra");
    std::filesystem::create_directories(project / "optionals" / "main");
    std::filesystem::create_directories(project / "compats" / "cba");

    SECTION("locate prefers core, then optional, then compat") {
        auto main = Addon::locate("main", project.path());
        REQUIRE(main.has_value());
        REQUIRE(main->location() == AddonLocation::core());

        auto extra = Addon::locate("extra", project.path());
        REQUIRE(extra.has_value());
        REQUIRE(extra->location() == AddonLocation::optional());

        auto cba = Addon::locate("cba", project.path());
        REQUIRE(cba.has_value());
        REQUIRE(cba->location() == AddonLocation::compat());
        REQUIRE(cba->exists(project.path()));
    }

    SECTION("missing addon") {
        REQUIRE_FALSE(Addon::locate("ghost", project.path()).has_value());
        auto required = Addon::require("ghost", project.path());
        REQUIRE(required.is_err());
        REQUIRE(required.error().is_release_error(ReleaseError::Kind::LocationNotFound));
    }

    SECTION("discover one location") {
        auto optionals = discover_addons(project.path(), AddonLocation::optional());
        REQUIRE(optionals.is_ok());
        REQUIRE(optionals->size() == 2);
        REQUIRE((*optionals)[0].name() == "extra");
        REQUIRE((*optionals)[1].name() == "main");
    }

    SECTION("missing folder yields no addons") {
        auto custom = discover_addons(project.path(), AddonLocation::custom("extras"));
        REQUIRE(custom.is_ok());
        REQUIRE(custom->empty());
    }

    SECTION("discover everything sorted by location then name") {
        auto all = discover_all_addons(project.path());
        REQUIRE(all.is_ok());
        REQUIRE(all->size() == 4);
        REQUIRE((*all)[0] == make_addon("main"));
        REQUIRE((*all)[1] == make_addon("extra", AddonLocation::optional()));
        REQUIRE((*all)[3] == make_addon("cba", AddonLocation::compat()));
    }

    SECTION("invalid folder name fails discovery") {
        std::filesystem::create_directories(project / "addons" / "bad name");
        auto all = discover_addons(project.path(), AddonLocation::core());
        REQUIRE(all.is_err());
        REQUIRE(all.error().is_release_error(ReleaseError::Kind::InvalidName));
    }
}
