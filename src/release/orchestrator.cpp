/// @file orchestrator.cpp
/// @brief BuildOrchestrator implementation

#include <addon_forge/release/orchestrator.hpp>
#include <addon_forge/release/addon.hpp>
#include <addon_forge/release/keys.hpp>
#include <addon_forge/release/signer.hpp>
#include <addon_forge/release/worker_pool.hpp>
#include <addon_forge/core/log.hpp>

#include "file_io.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <vector>

namespace forge_release {

namespace {

BuildResult failed(BuildResult result, BuildStage stage, forge_core::Error error) {
    error.with_context("addon", result.addon_name)
         .with_context("location", result.location.folder())
         .with_context("stage", build_stage_to_string(stage));
    forge_core::debug::record_error(error);
    result.outcome = BuildOutcome::Failed;
    result.failure = Failure{result.addon_name, result.location, stage, std::move(error)};
    forge_core::release_logger()->error("{}", result.failure->describe());
    return result;
}

/// Unit for an archive whose processing threw
BuildResult thrown(const AddonLocation& location, const std::filesystem::path& archive,
                   const std::string& reason) {
    BuildResult result;
    result.location = location;
    result.source = archive;
    result.addon_name = archive.stem().string();
    return failed(std::move(result), BuildStage::Sign,
        forge_core::ReleaseError::signing_failure(archive.string(), reason));
}

/// Entries of a category folder, sorted by path
forge_core::Result<std::vector<std::filesystem::path>> list_category(const std::filesystem::path& folder) {
    std::vector<std::filesystem::path> entries;
    std::error_code ec;
    std::filesystem::directory_iterator it(folder, ec);
    for (const std::filesystem::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        return forge_core::Err<std::vector<std::filesystem::path>>(
            forge_core::ReleaseError::io_failure(folder.string(), ec.message()));
    }
    std::sort(entries.begin(), entries.end());
    return forge_core::Ok(std::move(entries));
}

} // anonymous namespace

BuildOrchestrator::BuildOrchestrator(ProjectDescriptor project, ISigner& signer)
    : m_project(std::move(project))
    , m_signer(signer) {}

std::optional<std::string> BuildOrchestrator::standalone_for(
    const AddonLocation& location,
    const ReleaseContext& context) const {

    if (!m_project.folder_optionals) {
        return std::nullopt;
    }
    if (location.kind() == AddonLocation::Kind::Optional
        || location.kind() == AddonLocation::Kind::Compat) {
        return context.mod_name;
    }
    return std::nullopt;
}

BuildResult BuildOrchestrator::process_archive(
    const ReleaseContext& context,
    const KeyPair& key,
    const AddonLocation& location,
    const std::filesystem::path& archive) {

    BuildResult result;
    result.location = location;
    result.source = archive;
    result.addon_name = archive.stem().string();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(archive, ec)
        || archive.extension() != k_archive_extension) {
        result.addon_name = archive.filename().string();
        result.outcome = BuildOutcome::SkippedNotAFile;
        return result;
    }

    auto addon = Addon::create(result.addon_name, location);
    if (!addon) {
        return failed(std::move(result), BuildStage::Validate, addon.error());
    }

    if (m_project.is_skipped(addon->name())) {
        forge_core::release_logger()->debug("Skipping excluded addon {}", addon->name());
        result.outcome = BuildOutcome::SkippedExcluded;
        return result;
    }

    const auto prefix = m_project.archive_prefix();
    const auto standalone = standalone_for(location, context);
    std::optional<std::string_view> prefix_view;
    std::optional<std::string_view> standalone_view;
    if (prefix) {
        prefix_view = *prefix;
    }
    if (standalone) {
        standalone_view = *standalone;
    }

    result.destination = addon->destination(context.release_root, prefix_view, standalone_view);

    if (auto r = ReleaseLayout::ensure_destination_parent(context.release_root, *addon, standalone_view); !r) {
        return failed(std::move(result), BuildStage::Copy, r.error());
    }
    if (auto r = detail::copy_file_overwrite(archive, result.destination); !r) {
        return failed(std::move(result), BuildStage::Copy, r.error());
    }
    if (auto r = m_signer.sign(result.destination, key); !r) {
        return failed(std::move(result), BuildStage::Sign, r.error());
    }

    forge_core::release_logger()->trace("Signed {}", result.destination.filename().string());
    result.outcome = BuildOutcome::Signed;
    return result;
}

ReleaseSummary BuildOrchestrator::sign_all(
    const ReleaseContext& context,
    const KeyPair& key,
    std::size_t job_count) {

    auto logger = forge_core::release_logger();
    ReleaseAccumulator accumulator;

    {
        WorkerPool pool(job_count);
        logger->debug("Signing with {} worker(s)", pool.thread_count());

        for (const auto& location : AddonLocation::first_class()) {
            const auto folder = location.path(context.project_root);
            std::error_code ec;
            if (std::filesystem::status(folder, ec).type() == std::filesystem::file_type::not_found) {
                if (location.kind() == AddonLocation::Kind::Core) {
                    logger->warn("Core folder '{}' does not exist", folder.string());
                }
                continue;
            }

            auto entries = list_category(folder);
            if (!entries) {
                BuildResult unlisted;
                unlisted.location = location;
                unlisted.source = folder;
                accumulator.record(failed(std::move(unlisted), BuildStage::Copy, entries.error()));
                continue;
            }

            for (auto& entry : *entries) {
                pool.submit([this, &context, &key, &accumulator, location, entry = std::move(entry)]() {
                    BuildResult result;
                    try {
                        result = process_archive(context, key, location, entry);
                    } catch (const std::exception& e) {
                        result = thrown(location, entry, e.what());
                    } catch (...) {
                        result = thrown(location, entry, "unknown exception");
                    }
                    accumulator.record(std::move(result));
                });
            }
        }

        pool.wait_all();
    }

    auto summary = accumulator.summary();
    logger->info("Signed {} archive(s), skipped {}, {} failure(s)",
        summary.signed_count, summary.skipped_count, summary.failures.size());
    return summary;
}

forge_core::Result<ReleaseSummary> BuildOrchestrator::run(
    const ReleaseContext& context,
    std::size_t job_count) {

    FORGE_LOG_SCOPE("release build");
    auto logger = forge_core::release_logger();
    logger->info("Building release {} of @{}", context.version, context.mod_name);

    if (auto r = ReleaseLayout::prepare(context.release_root); !r) {
        return forge_core::Err<ReleaseSummary>(r.error());
    }

    auto copied = ReleaseLayout::copy_auxiliary_files(
        context.project_root, context.release_root, m_project.files);
    if (!copied) {
        return forge_core::Err<ReleaseSummary>(copied.error());
    }
    logger->debug("Copied {} auxiliary file(s)", *copied);

    KeyStore store(context.project_keys_folder());
    auto key = store.obtain(m_project.get_keyname(), m_project.reuse_private_key);
    if (!key) {
        logger->error("Unable to obtain signing key: {}", key.error().message());
        return forge_core::Err<ReleaseSummary>(key.error());
    }
    if (auto r = store.publish_public_key(*key, ReleaseLayout::keys_folder(context.release_root)); !r) {
        return forge_core::Err<ReleaseSummary>(r.error());
    }

    return forge_core::Ok(sign_all(context, *key, job_count));
}

forge_core::Result<ReleaseContext> prepare_release(
    const ProjectDescriptor& project,
    const std::filesystem::path& project_root,
    const std::optional<std::string>& version) {

    auto resolved = version ? version : project.version;
    if (!resolved || resolved->empty()) {
        return forge_core::Err<ReleaseContext>(forge_core::ReleaseError::config_error(
            (project_root / k_project_file_name).string(), "no release version given"));
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(project_root, ec)) {
        return forge_core::Err<ReleaseContext>(forge_core::ReleaseError::io_failure(
            project_root.string(), "project root is not a directory"));
    }

    return forge_core::Ok(ReleaseContext::make(project_root, *resolved, project.get_modname()));
}

forge_core::Result<ReleaseSummary> build_release(
    const ReleaseContext& context,
    const ProjectDescriptor& project,
    ISigner& signer,
    std::size_t job_count) {

    BuildOrchestrator orchestrator(project, signer);
    return orchestrator.run(context, job_count);
}

} // namespace forge_release
