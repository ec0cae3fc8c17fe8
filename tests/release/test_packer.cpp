// forge_release pack stage tests

#include <catch2/catch_test_macros.hpp>
#include <addon_forge/release/addon.hpp>
#include <addon_forge/release/overlay.hpp>
#include <addon_forge/release/packer.hpp>
#include <addon_forge/release/project.hpp>

#include "test_support.hpp"

#include <atomic>
#include <stdexcept>

using namespace forge_release;
using forge_core::ReleaseError;

namespace {

/// Concatenates every file of the addon folder, failing for one named addon
class ConcatPacker : public IPacker {
public:
    explicit ConcatPacker(std::string fail_on = {}) : m_fail_on(std::move(fail_on)) {}

    forge_core::Result<void> pack(
        const VirtualFileOverlay& overlay,
        const Addon& addon,
        const std::filesystem::path& output_path) override {

        ++calls;
        if (addon.name() == m_fail_on) {
            return forge_core::Err(ReleaseError::packing_failure(addon.name(), "rapify error"));
        }

        const auto source = addon.source().generic_string();
        std::string archive;
        for (const auto& file : overlay.list(source)) {
            auto contents = overlay.read(source + "/" + file);
            if (!contents) {
                return forge_core::Err(contents.error());
            }
            archive += file + "=" + *contents + ";";
        }
        forge_test::write_file(output_path, archive);
        return forge_core::Ok();
    }

    const char* name() const noexcept override { return "ConcatPacker"; }

    std::atomic<int> calls{0};

private:
    std::string m_fail_on;
};

} // namespace

TEST_CASE("pack_addons selection", "[release][packer]") {
    forge_test::TempDir project("forge_pack");
    forge_test::write_file(project / "addons" / "main" / "config.cpp", "main");
    forge_test::write_file(project / "addons" / "debug" / "config.cpp", "debug");
    forge_test::write_file(project / "optionals" / "tracers" / "config.cpp", "tracers");
    forge_test::write_file(project / "optionals" / "unused" / "config.cpp", "unused");
    forge_test::write_file(project / "compats" / "cba" / "config.cpp", "cba");
    forge_test::write_file(project / "addons" / "stray.txt", "not an addon");

    ProjectDescriptor descriptor;
    descriptor.name = "Sample";
    descriptor.add_skips({"debug"});

    auto overlay = VirtualFileOverlay::over(project.path());

    SECTION("core minus skip, selected optionals, all compats") {
        descriptor.add_optionals({"tracers"});
        ConcatPacker packer;

        auto summary = pack_addons(descriptor, project.path(), overlay, packer, 2);
        REQUIRE(summary.ok());
        REQUIRE(summary.packed_count == 3);
        REQUIRE(packer.calls.load() == 3);
        REQUIRE(std::filesystem::exists(project / "addons" / "main.pbo"));
        REQUIRE_FALSE(std::filesystem::exists(project / "addons" / "debug.pbo"));
        REQUIRE(std::filesystem::exists(project / "optionals" / "tracers.pbo"));
        REQUIRE_FALSE(std::filesystem::exists(project / "optionals" / "unused.pbo"));
        REQUIRE(std::filesystem::exists(project / "compats" / "cba.pbo"));
    }

    SECTION("all selects every optional") {
        descriptor.add_optionals({"all"});
        ConcatPacker packer;

        auto summary = pack_addons(descriptor, project.path(), overlay, packer);
        REQUIRE(summary.packed_count == 4);
        REQUIRE(std::filesystem::exists(project / "optionals" / "unused.pbo"));
    }

    SECTION("packer reads staged sources") {
        REQUIRE(overlay.write("addons/main/config.cpp", "patched").is_ok());
        ConcatPacker packer;

        auto summary = pack_addons(descriptor, project.path(), overlay, packer, 1);
        REQUIRE(summary.ok());
        REQUIRE(forge_test::read_file(project / "addons" / "main.pbo") == "config.cpp=patched;");
        REQUIRE(forge_test::read_file(project / "addons" / "main" / "config.cpp") == "main");
    }

    SECTION("one failing addon does not stop the others") {
        ConcatPacker packer("main");

        auto summary = pack_addons(descriptor, project.path(), overlay, packer, 4);
        REQUIRE(summary.packed_count == 1);
        REQUIRE(summary.failures.size() == 1);
        REQUIRE(summary.failures[0].addon == "main");
        REQUIRE(summary.failures[0].stage == BuildStage::Pack);
        REQUIRE(summary.failures[0].error.is_release_error(ReleaseError::Kind::PackingFailure));
        REQUIRE(*summary.failures[0].error.get_context("stage") == "pack");
    }

    SECTION("a throwing packer is recorded as a failure") {
        class ThrowingPacker : public ConcatPacker {
        public:
            forge_core::Result<void> pack(
                const VirtualFileOverlay& overlay,
                const Addon& addon,
                const std::filesystem::path& output_path) override {
                if (addon.name() == "cba") {
                    throw std::runtime_error("archive writer crashed");
                }
                return ConcatPacker::pack(overlay, addon, output_path);
            }
        } packer;

        auto summary = pack_addons(descriptor, project.path(), overlay, packer, 2);
        REQUIRE(summary.packed_count == 1);
        REQUIRE(summary.failures.size() == 1);
        REQUIRE(summary.failures[0].addon == "cba");
        REQUIRE(summary.failures[0].location == AddonLocation::compat());
        REQUIRE(summary.failures[0].stage == BuildStage::Pack);
        REQUIRE(summary.failures[0].error.is_release_error(ReleaseError::Kind::PackingFailure));
        REQUIRE(summary.failures[0].error.message().find("archive writer crashed") != std::string::npos);
    }

    SECTION("invalid addon folder names are reported") {
        forge_test::write_file(project / "addons" / "bad name" / "config.cpp", "x");
        ConcatPacker packer;

        auto summary = pack_addons(descriptor, project.path(), overlay, packer);
        REQUIRE(summary.packed_count == 2);
        REQUIRE(summary.failures.size() == 1);
        REQUIRE(summary.failures[0].stage == BuildStage::Validate);
    }
}
