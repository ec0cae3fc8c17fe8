#pragma once

/// @file orchestrator.hpp
/// @brief Parallel release orchestration: relocate and sign packed archives
///
/// A release build runs in two phases:
/// 1. Setup: release folders, auxiliary files, signing key. Any failure here
///    aborts the build before a single archive is touched.
/// 2. Dispatch: one unit of work per packed archive on a WorkerPool. A unit
///    copies its archive to the release tree and signs it. Unit failures are
///    collected into the ReleaseSummary and never cancel other units.

#include "fwd.hpp"
#include "layout.hpp"
#include "project.hpp"
#include "summary.hpp"
#include <addon_forge/core/error.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace forge_release {

/// Runs the release of one project
class BuildOrchestrator {
public:
    /// @param project Project settings, copied
    /// @param signer Signer used for every archive, must outlive the orchestrator
    BuildOrchestrator(ProjectDescriptor project, ISigner& signer);

    /// Prepare the release and sign every packed archive
    [[nodiscard]] forge_core::Result<ReleaseSummary> run(
        const ReleaseContext& context,
        std::size_t job_count = 0);

    /// Relocate and sign packed archives with an already obtained key
    [[nodiscard]] ReleaseSummary sign_all(
        const ReleaseContext& context,
        const KeyPair& key,
        std::size_t job_count = 0);

    /// Process one archive (a single unit of work)
    [[nodiscard]] BuildResult process_archive(
        const ReleaseContext& context,
        const KeyPair& key,
        const AddonLocation& location,
        const std::filesystem::path& archive);

    [[nodiscard]] const ProjectDescriptor& project() const noexcept { return m_project; }

    /// Mod name an addon of @p location is nested under, if any
    [[nodiscard]] std::optional<std::string> standalone_for(
        const AddonLocation& location,
        const ReleaseContext& context) const;

private:
    ProjectDescriptor m_project;
    ISigner& m_signer;
};

/// Resolve the release paths for @p version (falls back to the project version)
[[nodiscard]] forge_core::Result<ReleaseContext> prepare_release(
    const ProjectDescriptor& project,
    const std::filesystem::path& project_root,
    const std::optional<std::string>& version = std::nullopt);

/// Run a BuildOrchestrator for @p context
[[nodiscard]] forge_core::Result<ReleaseSummary> build_release(
    const ReleaseContext& context,
    const ProjectDescriptor& project,
    ISigner& signer,
    std::size_t job_count = 0);

} // namespace forge_release
