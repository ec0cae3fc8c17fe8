#pragma once

/// @file layout.hpp
/// @brief Release directory skeleton and auxiliary file copying

#include "fwd.hpp"
#include <addon_forge/core/error.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace forge_release {

// =============================================================================
// ReleaseContext
// =============================================================================

/// Paths of one release, fixed for the duration of a build
///
/// releases_root = {project_root}/releases
/// release_root  = {releases_root}/{version}/@{mod_name}
struct ReleaseContext {
    std::filesystem::path project_root;
    std::filesystem::path release_root;
    std::filesystem::path releases_root;
    std::string version;
    std::string mod_name;

    /// Build the context for @p version of @p mod_name under @p project_root
    [[nodiscard]] static ReleaseContext make(
        const std::filesystem::path& project_root,
        const std::string& version,
        const std::string& mod_name);

    /// Project-wide key folder ({releases_root}/keys)
    [[nodiscard]] std::filesystem::path project_keys_folder() const {
        return releases_root / "keys";
    }
};

// =============================================================================
// ReleaseLayout
// =============================================================================

/// Creates the folders a release is written into
///
/// Every operation is idempotent and tolerates another thread creating the
/// same folder at the same time.
class ReleaseLayout {
public:
    /// Ensure {release_root}/addons and {release_root}/keys exist
    [[nodiscard]] static forge_core::Result<void> prepare(const std::filesystem::path& release_root);

    /// Ensure the folder of @p location exists under @p release_root
    [[nodiscard]] static forge_core::Result<std::filesystem::path> ensure_category_folder(
        const std::filesystem::path& release_root,
        const AddonLocation& location);

    /// Ensure the parent folder of @p addon's released archive exists
    [[nodiscard]] static forge_core::Result<std::filesystem::path> ensure_destination_parent(
        const std::filesystem::path& release_root,
        const Addon& addon,
        std::optional<std::string_view> standalone = std::nullopt);

    /// Key folder of a release
    [[nodiscard]] static std::filesystem::path keys_folder(const std::filesystem::path& release_root) {
        return release_root / "keys";
    }

    /// Copy every file matched by @p patterns into @p release_root
    ///
    /// Patterns are relative to @p project_root and matched per path
    /// component ('*', '?' and '[...]'). Files keep their name only.
    /// @return Number of files copied
    [[nodiscard]] static forge_core::Result<std::size_t> copy_auxiliary_files(
        const std::filesystem::path& project_root,
        const std::filesystem::path& release_root,
        const std::vector<std::string>& patterns);

    /// Expand one glob pattern relative to @p base, sorted
    [[nodiscard]] static std::vector<std::filesystem::path> expand_glob(
        const std::filesystem::path& base,
        std::string_view pattern);

    /// Remove {releases_root}/{version}
    /// @return Number of filesystem entries removed (0 when absent)
    [[nodiscard]] static forge_core::Result<std::size_t> clear_release(
        const std::filesystem::path& releases_root,
        const std::string& version);
};

} // namespace forge_release
