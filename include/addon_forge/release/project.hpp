#pragma once

/// @file project.hpp
/// @brief Project descriptor (forge.json) loading and defaults
///
/// ```json
/// {
///   "name": "Advanced Combat Environment",
///   "prefix": "ace",
///   "author": "ACE Team",
///   "version": "3.13.0",
///   "modname": "ace",
///   "keyname": "ace_3.13.0",
///   "files": ["mod.cpp", "*.md", "logo_ace3_ca.paa"],
///   "optionals": ["tracers"],
///   "skip": ["debug_console"],
///   "reuse_private_key": false,
///   "folder_optionals": true
/// }
/// ```

#include "fwd.hpp"
#include <addon_forge/core/error.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace forge_release {

/// Project-wide release settings
struct ProjectDescriptor {
    std::string name;                    ///< Human-readable project name
    std::string prefix;                  ///< Archive prefix (e.g., "ace")
    std::string author;                  ///< Project author (optional)
    std::optional<std::string> version;  ///< Release version
    std::string modname;                 ///< Mod folder name (defaults to prefix, then name)
    std::string keyname;                 ///< Signing key name (defaults to modname)
    std::vector<std::string> files;      ///< Glob patterns copied into the release root
    std::vector<std::string> optionals;  ///< Optional addons to pack ("all" selects every one)
    std::vector<std::string> skip;       ///< Addons excluded from packing and signing
    bool reuse_private_key = false;      ///< Persist and reuse the signing key
    bool folder_optionals = false;       ///< Nest optional/compat addons into their own mods

    /// Load descriptor from a JSON file
    [[nodiscard]] static forge_core::Result<ProjectDescriptor> load(
        const std::filesystem::path& path);

    /// Parse descriptor from JSON string
    [[nodiscard]] static forge_core::Result<ProjectDescriptor> from_json_string(
        const std::string& json_str,
        const std::filesystem::path& source_path = {});

    /// Serialize back to JSON text
    [[nodiscard]] std::string to_json_string() const;

    /// Mod name with defaults applied
    [[nodiscard]] std::string get_modname() const;

    /// Key name with defaults applied
    [[nodiscard]] std::string get_keyname() const;

    /// Archive prefix, if one is configured
    [[nodiscard]] std::optional<std::string> archive_prefix() const;

    /// Check whether an optional addon is selected for packing
    [[nodiscard]] bool is_optional_selected(const std::string& addon_name) const;

    /// Check whether an addon is on the skip list
    [[nodiscard]] bool is_skipped(const std::string& addon_name) const;

    /// Merge extra optional addon names (sorted, deduplicated)
    void add_optionals(const std::vector<std::string>& names);

    /// Merge extra skipped addon names (sorted, deduplicated)
    void add_skips(const std::vector<std::string>& names);
};

/// Walk up from @p start to the directory containing forge.json
[[nodiscard]] forge_core::Result<std::filesystem::path> find_project_root(
    const std::filesystem::path& start);

/// Split a comma separated list ("a,b,,c" -> {"a", "b", "c"})
[[nodiscard]] std::vector<std::string> split_name_list(const std::string& list);

} // namespace forge_release
