/// @file layout.cpp
/// @brief ReleaseLayout implementation

#include <addon_forge/release/layout.hpp>
#include <addon_forge/release/addon.hpp>
#include <addon_forge/core/log.hpp>

#include "file_io.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <system_error>

namespace forge_release {

namespace {

bool has_wildcard(const std::string& component) {
    return component.find_first_of("*?[") != std::string::npos;
}

std::vector<std::string> split_components(std::string_view pattern) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : pattern) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) {
                parts.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

} // anonymous namespace

ReleaseContext ReleaseContext::make(
    const std::filesystem::path& project_root,
    const std::string& version,
    const std::string& mod_name) {

    ReleaseContext ctx;
    ctx.project_root = project_root;
    ctx.releases_root = project_root / "releases";
    ctx.release_root = ctx.releases_root / version / ("@" + mod_name);
    ctx.version = version;
    ctx.mod_name = mod_name;
    return ctx;
}

forge_core::Result<void> ReleaseLayout::prepare(const std::filesystem::path& release_root) {
    if (auto r = detail::ensure_directory(release_root / "addons"); !r) {
        return r;
    }
    return detail::ensure_directory(keys_folder(release_root));
}

forge_core::Result<std::filesystem::path> ReleaseLayout::ensure_category_folder(
    const std::filesystem::path& release_root,
    const AddonLocation& location) {

    auto folder = location.path(release_root);
    if (auto r = detail::ensure_directory(folder); !r) {
        return forge_core::Err<std::filesystem::path>(r.error());
    }
    return forge_core::Ok(std::move(folder));
}

forge_core::Result<std::filesystem::path> ReleaseLayout::ensure_destination_parent(
    const std::filesystem::path& release_root,
    const Addon& addon,
    std::optional<std::string_view> standalone) {

    auto parent = addon.destination_parent(release_root, standalone);
    if (auto r = detail::ensure_directory(parent); !r) {
        return forge_core::Err<std::filesystem::path>(r.error());
    }
    return forge_core::Ok(std::move(parent));
}

std::vector<std::filesystem::path> ReleaseLayout::expand_glob(
    const std::filesystem::path& base,
    std::string_view pattern) {

    std::vector<std::filesystem::path> current{base};
    for (const auto& component : split_components(pattern)) {
        std::vector<std::filesystem::path> next;
        for (const auto& dir : current) {
            if (!has_wildcard(component)) {
                auto candidate = dir / component;
                std::error_code ec;
                if (std::filesystem::exists(candidate, ec)) {
                    next.push_back(std::move(candidate));
                }
                continue;
            }

            std::error_code ec;
            std::filesystem::directory_iterator it(dir, ec);
            if (ec) {
                continue;
            }
            for (const auto& entry : it) {
                auto name = entry.path().filename().string();
                if (fnmatch(component.c_str(), name.c_str(), FNM_PERIOD) == 0) {
                    next.push_back(entry.path());
                }
            }
        }
        current = std::move(next);
        if (current.empty()) {
            break;
        }
    }

    if (current.size() == 1 && current.front() == base) {
        return {};
    }
    std::sort(current.begin(), current.end());
    return current;
}

forge_core::Result<std::size_t> ReleaseLayout::copy_auxiliary_files(
    const std::filesystem::path& project_root,
    const std::filesystem::path& release_root,
    const std::vector<std::string>& patterns) {

    std::size_t copied = 0;
    for (const auto& pattern : patterns) {
        auto matches = expand_glob(project_root, pattern);
        if (matches.empty()) {
            forge_core::release_logger()->debug("Pattern '{}' matched no files", pattern);
        }
        for (const auto& match : matches) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(match, ec)) {
                continue;
            }
            auto target = release_root / match.filename();
            if (auto r = detail::copy_file_overwrite(match, target); !r) {
                return forge_core::Err<std::size_t>(r.error());
            }
            forge_core::release_logger()->trace("Copied {} into release", match.filename().string());
            ++copied;
        }
    }
    return forge_core::Ok(copied);
}

forge_core::Result<std::size_t> ReleaseLayout::clear_release(
    const std::filesystem::path& releases_root,
    const std::string& version) {

    if (version.empty()) {
        return forge_core::Err<std::size_t>(forge_core::Error(
            forge_core::ErrorCode::InvalidArgument, "release version is empty"));
    }

    auto target = releases_root / version;
    std::error_code ec;
    auto removed = std::filesystem::remove_all(target, ec);
    if (ec) {
        return forge_core::Err<std::size_t>(
            forge_core::ReleaseError::io_failure(target.string(), ec.message()));
    }
    if (removed > 0) {
        forge_core::release_logger()->info("Cleared release {} ({} entries)", version, removed);
    }
    return forge_core::Ok(static_cast<std::size_t>(removed));
}

} // namespace forge_release
