/// @file packer.cpp
/// @brief Parallel pack stage

#include <addon_forge/release/packer.hpp>
#include <addon_forge/release/addon.hpp>
#include <addon_forge/release/overlay.hpp>
#include <addon_forge/release/project.hpp>
#include <addon_forge/release/worker_pool.hpp>
#include <addon_forge/core/log.hpp>

#include "file_io.hpp"

#include <exception>
#include <mutex>

namespace forge_release {

namespace {

bool selected_for_packing(const ProjectDescriptor& project, const AddonLocation& location,
                          const std::string& name) {
    switch (location.kind()) {
        case AddonLocation::Kind::Core:
            return !project.is_skipped(name);
        case AddonLocation::Kind::Optional:
            return project.is_optional_selected(name);
        case AddonLocation::Kind::Compat:
            return true;
        default:
            return false;
    }
}

Failure make_failure(std::string addon, AddonLocation location, BuildStage stage,
                     forge_core::Error error) {
    error.with_context("addon", addon)
         .with_context("location", location.folder())
         .with_context("stage", build_stage_to_string(stage));
    return Failure{std::move(addon), std::move(location), stage, std::move(error)};
}

} // anonymous namespace

PackSummary pack_addons(
    const ProjectDescriptor& project,
    const std::filesystem::path& project_root,
    const VirtualFileOverlay& overlay,
    IPacker& packer,
    std::size_t job_count) {

    auto logger = forge_core::release_logger();

    PackSummary summary;
    std::mutex summary_mutex;

    WorkerPool pool(job_count);

    for (const auto& location : AddonLocation::first_class()) {
        const auto folder = location.folder();
        if (!overlay.is_directory(folder)) {
            continue;
        }

        for (const auto& entry : overlay.list(folder)) {
            if (!overlay.is_directory(folder + "/" + entry)) {
                continue;
            }

            auto created = Addon::create(entry, location);
            if (!created) {
                std::lock_guard lock(summary_mutex);
                summary.failures.push_back(
                    make_failure(entry, location, BuildStage::Validate, created.error()));
                continue;
            }
            if (!selected_for_packing(project, location, entry)) {
                logger->debug("Not packing {}/{}", folder, entry);
                continue;
            }

            auto output_dir = location.path(project_root);
            if (auto r = detail::ensure_directory(output_dir); !r) {
                std::lock_guard lock(summary_mutex);
                summary.failures.push_back(
                    make_failure(entry, location, BuildStage::Pack, r.error()));
                continue;
            }

            pool.submit([&, addon = std::move(*created), output_dir]() {
                auto output = output_dir / addon.archive_name();
                forge_core::Result<void> result = forge_core::Ok();
                try {
                    result = packer.pack(overlay, addon, output);
                } catch (const std::exception& e) {
                    result = forge_core::Err(forge_core::ReleaseError::packing_failure(addon.name(), e.what()));
                } catch (...) {
                    result = forge_core::Err(
                        forge_core::ReleaseError::packing_failure(addon.name(), "unknown exception"));
                }

                std::lock_guard lock(summary_mutex);
                if (result) {
                    ++summary.packed_count;
                    logger->trace("Packed {}", output.filename().string());
                } else {
                    logger->error("Failed to pack {}: {}", addon.name(), result.error().message());
                    summary.failures.push_back(make_failure(
                        addon.name(), addon.location(), BuildStage::Pack, result.error()));
                }
            });
        }
    }

    pool.wait_all();

    sort_failures(summary.failures);
    logger->info("Packed {} addon(s), {} failure(s) using {}",
        summary.packed_count, summary.failures.size(), packer.name());
    return summary;
}

} // namespace forge_release
