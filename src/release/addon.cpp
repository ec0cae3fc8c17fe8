/// @file addon.cpp
/// @brief Addon model implementation

#include <addon_forge/release/addon.hpp>
#include <addon_forge/core/log.hpp>

#include <algorithm>
#include <system_error>

namespace forge_release {

namespace {

[[nodiscard]] constexpr bool is_standard_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

[[nodiscard]] constexpr bool is_discouraged_char(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || c == '-';
}

forge_core::Error invalid_location(const AddonLocation& location) {
    return forge_core::Error(forge_core::ErrorCode::InvalidArgument,
        "Invalid addon location folder: '" + location.folder() + "'")
        .with_context("location", location.folder());
}

} // anonymous namespace

// =============================================================================
// AddonLocation Implementation
// =============================================================================

AddonLocation AddonLocation::custom(std::string folder) {
    for (const auto& location : first_class()) {
        if (location.folder() == folder) {
            return location;
        }
    }
    return AddonLocation(Kind::Custom, std::move(folder));
}

AddonLocation AddonLocation::from_folder(const std::string& folder) {
    return custom(folder);
}

std::string AddonLocation::folder() const {
    switch (m_kind) {
        case Kind::Core:     return "addons";
        case Kind::Optional: return "optionals";
        case Kind::Compat:   return "compats";
        case Kind::Custom:   return m_custom;
        default:             return m_custom;
    }
}

bool AddonLocation::is_valid() const noexcept {
    if (m_kind != Kind::Custom) {
        return true;
    }
    if (m_custom.empty() || m_custom == "." || m_custom == "..") {
        return false;
    }
    return m_custom.find_first_of("/\\") == std::string::npos;
}

bool AddonLocation::exists(const std::filesystem::path& project_root) const {
    std::error_code ec;
    return std::filesystem::is_directory(path(project_root), ec);
}

// =============================================================================
// Name Validation
// =============================================================================

bool is_valid_addon_name(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return is_standard_char(c) || is_discouraged_char(c);
    });
}

std::vector<char> addon_name_warnings(std::string_view name) {
    std::vector<char> found;
    for (char c : name) {
        if (is_discouraged_char(c)) {
            found.push_back(c);
        }
    }
    return found;
}

// =============================================================================
// Addon Implementation
// =============================================================================

forge_core::Result<Addon> Addon::create(std::string name, AddonLocation location) {
    if (!location.is_valid()) {
        return forge_core::Err<Addon>(invalid_location(location));
    }
    if (!is_valid_addon_name(name)) {
        return forge_core::Err<Addon>(forge_core::Error(forge_core::ReleaseError::invalid_name(name))
            .with_context("location", location.folder()));
    }

    for (char c : addon_name_warnings(name)) {
        forge_core::release_logger()->warn("Invalid character `{}` in addon `{}`", c, name);
    }

    return forge_core::Ok(Addon(std::move(name), std::move(location)));
}

std::optional<Addon> Addon::locate(
    const std::string& name,
    const std::filesystem::path& project_root) {

    for (const auto& location : AddonLocation::first_class()) {
        if (!location.exists(project_root)) {
            continue;
        }
        std::error_code ec;
        if (std::filesystem::exists(location.path(project_root) / name, ec)) {
            return Addon(name, location);
        }
    }
    return std::nullopt;
}

forge_core::Result<Addon> Addon::require(
    const std::string& name,
    const std::filesystem::path& project_root) {

    auto found = locate(name, project_root);
    if (!found) {
        return forge_core::Err<Addon>(forge_core::ReleaseError::location_not_found(name));
    }
    return forge_core::Ok(std::move(*found));
}

std::filesystem::path Addon::source() const {
    return std::filesystem::path(m_location.folder()) / m_name;
}

bool Addon::exists(const std::filesystem::path& project_root) const {
    std::error_code ec;
    return std::filesystem::exists(project_root / source(), ec);
}

std::string Addon::archive_name(std::optional<std::string_view> prefix) const {
    if (prefix) {
        return std::string(*prefix) + "_" + m_name + k_archive_extension;
    }
    return m_name + k_archive_extension;
}

std::filesystem::path Addon::destination_parent(
    const std::filesystem::path& release_root,
    std::optional<std::string_view> standalone) const {

    auto parent = release_root / m_location.folder();

    if (standalone) {
        if (m_location.kind() == AddonLocation::Kind::Core) {
            forge_core::release_logger()->warn(
                "Standalone addons should be in optionals or compats (addon `{}`)", m_name);
        }
        parent /= "@" + std::string(*standalone) + "_" + m_name;
        parent /= "addons";
    }

    return parent;
}

std::filesystem::path Addon::destination(
    const std::filesystem::path& release_root,
    std::optional<std::string_view> prefix,
    std::optional<std::string_view> standalone) const {

    return destination_parent(release_root, standalone) / archive_name(prefix);
}

nlohmann::json Addon::to_json() const {
    return nlohmann::json{
        {"addon", {
            {"name", m_name},
            {"source", source().generic_string()},
        }},
    };
}

// =============================================================================
// Discovery
// =============================================================================

forge_core::Result<std::vector<Addon>> discover_addons(
    const std::filesystem::path& project_root,
    const AddonLocation& location) {

    if (!location.is_valid()) {
        return forge_core::Err<std::vector<Addon>>(invalid_location(location));
    }

    std::vector<Addon> addons;
    if (!location.exists(project_root)) {
        return forge_core::Ok(std::move(addons));
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(location.path(project_root), ec);
    if (ec) {
        return forge_core::Err<std::vector<Addon>>(
            forge_core::ReleaseError::io_failure(location.path(project_root).string(), ec.message()));
    }

    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) {
            continue;
        }
        auto addon = Addon::create(entry.path().filename().string(), location);
        if (!addon) {
            return forge_core::Err<std::vector<Addon>>(addon.error());
        }
        addons.push_back(std::move(*addon));
    }

    std::sort(addons.begin(), addons.end());
    return forge_core::Ok(std::move(addons));
}

forge_core::Result<std::vector<Addon>> discover_all_addons(const std::filesystem::path& project_root) {
    std::vector<Addon> all;
    for (const auto& location : AddonLocation::first_class()) {
        auto found = discover_addons(project_root, location);
        if (!found) {
            return found;
        }
        all.insert(all.end(), found->begin(), found->end());
    }
    std::sort(all.begin(), all.end());
    return forge_core::Ok(std::move(all));
}

} // namespace forge_release
