#pragma once

/// @file packer.hpp
/// @brief Packer capability and the parallel pack stage

#include "fwd.hpp"
#include "summary.hpp"
#include <addon_forge/core/error.hpp>

#include <cstddef>
#include <filesystem>

namespace forge_release {

/// Turns an addon's source folder into an archive file
///
/// pack() is called concurrently for distinct addons and must produce the
/// same archive for the same inputs. Failures are reported as
/// ReleaseError::packing_failure.
class IPacker {
public:
    virtual ~IPacker() = default;

    /// Pack @p addon, reading its sources through @p overlay, into @p output_path
    [[nodiscard]] virtual forge_core::Result<void> pack(
        const VirtualFileOverlay& overlay,
        const Addon& addon,
        const std::filesystem::path& output_path) = 0;

    /// Get packer name
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

/// Pack every addon selected by @p project into {project_root}/{folder}/{name}.pbo
///
/// Core addons minus the skip list, the selected optionals and every compat
/// addon are packed on @p job_count workers (0 selects the hardware
/// concurrency). Addon folders are enumerated through @p overlay.
[[nodiscard]] PackSummary pack_addons(
    const ProjectDescriptor& project,
    const std::filesystem::path& project_root,
    const VirtualFileOverlay& overlay,
    IPacker& packer,
    std::size_t job_count = 0);

} // namespace forge_release
