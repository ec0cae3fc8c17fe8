#pragma once

/// @file addon.hpp
/// @brief Addon identity, category locations and derived release paths
///
/// An Addon is one packageable unit of content: a validated name plus the
/// category folder it lives in. Every path method here is pure computation;
/// creating directories is left to ReleaseLayout.
///
/// ```
/// project/
///   addons/      Core addons
///   optionals/   Optional addons
///   compats/     Compatibility addons
///   <custom>/    Custom category
/// ```

#include "fwd.hpp"
#include <addon_forge/core/error.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <compare>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace forge_release {

// =============================================================================
// AddonLocation
// =============================================================================

/// Category an addon belongs to
///
/// Ordering follows declaration order (Core < Optional < Compat < Custom),
/// custom categories are ordered by folder name.
class AddonLocation {
public:
    enum class Kind : std::uint8_t {
        Core,      ///< addons/
        Optional,  ///< optionals/
        Compat,    ///< compats/
        Custom     ///< caller-named folder
    };

    /// Defaults to Core
    AddonLocation() = default;

    [[nodiscard]] static AddonLocation core() { return AddonLocation(Kind::Core); }
    [[nodiscard]] static AddonLocation optional() { return AddonLocation(Kind::Optional); }
    [[nodiscard]] static AddonLocation compat() { return AddonLocation(Kind::Compat); }
    /// Caller-named category; "addons", "optionals" and "compats" resolve to their first-class location
    [[nodiscard]] static AddonLocation custom(std::string folder);

    /// Locations searched by Addon::locate, in priority order
    [[nodiscard]] static std::array<AddonLocation, 3> first_class() {
        return {core(), optional(), compat()};
    }

    /// Map a folder name back to a location ("addons" -> Core, others -> Custom)
    [[nodiscard]] static AddonLocation from_folder(const std::string& folder);

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }

    /// Conventional folder name ("addons", "optionals", "compats" or the custom name)
    [[nodiscard]] std::string folder() const;

    [[nodiscard]] bool is_first_class() const noexcept { return m_kind != Kind::Custom; }

    /// A custom folder must be one non-empty path component other than "." and ".."
    [[nodiscard]] bool is_valid() const noexcept;

    /// Folder of this category inside a project
    [[nodiscard]] std::filesystem::path path(const std::filesystem::path& project_root) const {
        return project_root / folder();
    }

    /// Check whether the category folder exists inside a project
    [[nodiscard]] bool exists(const std::filesystem::path& project_root) const;

    auto operator<=>(const AddonLocation&) const = default;

private:
    explicit AddonLocation(Kind kind, std::string custom = {})
        : m_kind(kind), m_custom(std::move(custom)) {}

    Kind m_kind = Kind::Core;
    std::string m_custom;
};

// =============================================================================
// Addon
// =============================================================================

/// One unit of mod content, identified by name and location
class Addon {
public:
    /// Create an addon, validating its name and location
    ///
    /// Lowercase letters, digits and underscore are standard. Uppercase letters
    /// and hyphen are accepted with one warning per occurrence. Anything else
    /// fails with ReleaseError::InvalidName. An invalid custom location fails
    /// with ErrorCode::InvalidArgument.
    [[nodiscard]] static forge_core::Result<Addon> create(std::string name, AddonLocation location);

    /// Find the first first-class location containing a folder named @p name
    [[nodiscard]] static std::optional<Addon> locate(
        const std::string& name,
        const std::filesystem::path& project_root);

    /// As locate(), failing with ReleaseError::LocationNotFound
    [[nodiscard]] static forge_core::Result<Addon> require(
        const std::string& name,
        const std::filesystem::path& project_root);

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const AddonLocation& location() const noexcept { return m_location; }

    /// Path to the addon folder, relative to the project root
    [[nodiscard]] std::filesystem::path source() const;

    /// Check if the addon folder exists
    [[nodiscard]] bool exists(const std::filesystem::path& project_root) const;

    /// Filename of the archive
    ///
    /// Some(prefix) => {prefix}_{name}.pbo, None => {name}.pbo
    [[nodiscard]] std::string archive_name(std::optional<std::string_view> prefix = std::nullopt) const;

    /// Folder containing the released addon
    ///
    /// @param release_root Root folder of the release
    /// @param standalone Mod name when the addon ships as its own nested mod
    [[nodiscard]] std::filesystem::path destination_parent(
        const std::filesystem::path& release_root,
        std::optional<std::string_view> standalone = std::nullopt) const;

    /// File path of the released addon
    [[nodiscard]] std::filesystem::path destination(
        const std::filesystem::path& release_root,
        std::optional<std::string_view> prefix = std::nullopt,
        std::optional<std::string_view> standalone = std::nullopt) const;

    /// Template variables: {"addon": {"name": ..., "source": ...}}
    [[nodiscard]] nlohmann::json to_json() const;

    auto operator<=>(const Addon& other) const {
        if (auto cmp = m_location <=> other.m_location; cmp != 0) {
            return cmp;
        }
        return m_name <=> other.m_name;
    }
    bool operator==(const Addon&) const = default;

private:
    Addon(std::string name, AddonLocation location)
        : m_name(std::move(name)), m_location(std::move(location)) {}

    std::string m_name;
    AddonLocation m_location;
};

// =============================================================================
// Name Validation
// =============================================================================

/// Check if every character of @p name is standard or discouraged-but-allowed
[[nodiscard]] bool is_valid_addon_name(std::string_view name) noexcept;

/// Discouraged characters found in @p name, one entry per occurrence
[[nodiscard]] std::vector<char> addon_name_warnings(std::string_view name);

// =============================================================================
// Discovery
// =============================================================================

/// Scan a category folder for addon subfolders, sorted by name
///
/// A missing category folder yields an empty list.
[[nodiscard]] forge_core::Result<std::vector<Addon>> discover_addons(
    const std::filesystem::path& project_root,
    const AddonLocation& location);

/// Addons of all first-class locations, sorted by (location, name)
[[nodiscard]] forge_core::Result<std::vector<Addon>> discover_all_addons(
    const std::filesystem::path& project_root);

} // namespace forge_release
