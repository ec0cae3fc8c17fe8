/// @file overlay.cpp
/// @brief VirtualFileOverlay and layer implementations

#include <addon_forge/release/overlay.hpp>
#include <addon_forge/core/log.hpp>

#include "file_io.hpp"

#include <algorithm>
#include <mutex>
#include <set>
#include <system_error>

namespace forge_release {

namespace {

forge_core::Error not_found(const std::string& path) {
    return forge_core::Error(forge_core::ErrorCode::NotFound, "no such file: '" + path + "'")
        .with_context("path", path);
}

bool has_prefix(const std::string& path, const std::string& dir) {
    if (dir.empty()) {
        return true;
    }
    return path.size() > dir.size()
        && path.compare(0, dir.size(), dir) == 0
        && path[dir.size()] == '/';
}

std::string first_component_after(const std::string& path, const std::string& dir) {
    std::string rest = dir.empty() ? path : path.substr(dir.size() + 1);
    auto slash = rest.find('/');
    return slash == std::string::npos ? rest : rest.substr(0, slash);
}

} // anonymous namespace

forge_core::Result<std::string> normalize_overlay_path(std::string_view path) {
    std::filesystem::path p{std::string(path)};
    if (p.has_root_path()) {
        return forge_core::Err<std::string>(forge_core::Error(forge_core::ErrorCode::InvalidArgument,
            "absolute path not allowed in overlay: '" + std::string(path) + "'"));
    }

    auto normal = p.lexically_normal().generic_string();
    if (normal == "." || normal == "./") {
        normal.clear();
    }
    while (!normal.empty() && normal.back() == '/') {
        normal.pop_back();
    }
    if (normal == ".." || normal.rfind("../", 0) == 0) {
        return forge_core::Err<std::string>(forge_core::Error(forge_core::ErrorCode::InvalidArgument,
            "path escapes overlay root: '" + std::string(path) + "'"));
    }
    return forge_core::Ok(std::move(normal));
}

// =============================================================================
// MemoryLayer
// =============================================================================

bool MemoryLayer::exists(const std::string& path) const {
    std::shared_lock lock(m_mutex);
    return m_files.count(path) > 0 || is_directory_locked(path);
}

bool MemoryLayer::is_file(const std::string& path) const {
    std::shared_lock lock(m_mutex);
    return m_files.count(path) > 0;
}

bool MemoryLayer::is_directory(const std::string& path) const {
    std::shared_lock lock(m_mutex);
    return is_directory_locked(path);
}

bool MemoryLayer::is_directory_locked(const std::string& path) const {
    if (path.empty()) {
        return true;
    }
    auto it = m_files.lower_bound(path + "/");
    return it != m_files.end() && has_prefix(it->first, path);
}

forge_core::Result<std::string> MemoryLayer::read(const std::string& path) const {
    std::shared_lock lock(m_mutex);
    auto it = m_files.find(path);
    if (it == m_files.end()) {
        return forge_core::Err<std::string>(not_found(path));
    }
    return forge_core::Ok(it->second);
}

forge_core::Result<void> MemoryLayer::write(const std::string& path, std::string contents) {
    if (path.empty()) {
        return forge_core::Err(forge_core::Error(forge_core::ErrorCode::InvalidArgument,
            "cannot write to the overlay root"));
    }
    std::unique_lock lock(m_mutex);
    if (is_directory_locked(path)) {
        return forge_core::Err(forge_core::Error(forge_core::ErrorCode::InvalidState,
            "path is a directory: '" + path + "'"));
    }
    m_files[path] = std::move(contents);
    return forge_core::Ok();
}

forge_core::Result<void> MemoryLayer::remove(const std::string& path) {
    std::unique_lock lock(m_mutex);
    if (m_files.erase(path) == 0) {
        return forge_core::Err(not_found(path));
    }
    return forge_core::Ok();
}

std::vector<std::string> MemoryLayer::list(const std::string& dir) const {
    std::shared_lock lock(m_mutex);
    std::set<std::string> names;
    for (const auto& [path, _] : m_files) {
        if (has_prefix(path, dir)) {
            names.insert(first_component_after(path, dir));
        }
    }
    return {names.begin(), names.end()};
}

std::vector<std::string> MemoryLayer::files() const {
    std::shared_lock lock(m_mutex);
    std::vector<std::string> result;
    result.reserve(m_files.size());
    for (const auto& [path, _] : m_files) {
        result.push_back(path);
    }
    return result;
}

void MemoryLayer::clear() {
    std::unique_lock lock(m_mutex);
    m_files.clear();
}

std::size_t MemoryLayer::size() const {
    std::shared_lock lock(m_mutex);
    return m_files.size();
}

// =============================================================================
// PhysicalLayer
// =============================================================================

PhysicalLayer::PhysicalLayer(std::filesystem::path root)
    : m_root(std::move(root)) {}

std::filesystem::path PhysicalLayer::resolve(const std::string& path) const {
    return path.empty() ? m_root : m_root / path;
}

bool PhysicalLayer::exists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::exists(resolve(path), ec);
}

bool PhysicalLayer::is_file(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(resolve(path), ec);
}

bool PhysicalLayer::is_directory(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::is_directory(resolve(path), ec);
}

forge_core::Result<std::string> PhysicalLayer::read(const std::string& path) const {
    if (!is_file(path)) {
        return forge_core::Err<std::string>(not_found(path));
    }
    return detail::read_text_file(resolve(path));
}

forge_core::Result<void> PhysicalLayer::write(const std::string& path, std::string /*contents*/) {
    return forge_core::Err(forge_core::Error(forge_core::ErrorCode::PermissionDenied,
        "physical layer is read-only: '" + path + "'"));
}

forge_core::Result<void> PhysicalLayer::remove(const std::string& path) {
    return forge_core::Err(forge_core::Error(forge_core::ErrorCode::PermissionDenied,
        "physical layer is read-only: '" + path + "'"));
}

std::vector<std::string> PhysicalLayer::list(const std::string& dir) const {
    std::vector<std::string> names;
    std::error_code ec;
    std::filesystem::directory_iterator it(resolve(dir), ec);
    if (ec) {
        return names;
    }
    for (const auto& entry : it) {
        names.push_back(entry.path().filename().generic_string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

// =============================================================================
// VirtualFileOverlay
// =============================================================================

VirtualFileOverlay::VirtualFileOverlay(std::vector<std::shared_ptr<IFileLayer>> layers)
    : m_layers(std::move(layers)) {}

VirtualFileOverlay VirtualFileOverlay::over(const std::filesystem::path& root) {
    std::vector<std::shared_ptr<IFileLayer>> layers;
    layers.push_back(std::make_shared<MemoryLayer>());
    layers.push_back(std::make_shared<PhysicalLayer>(root));
    return VirtualFileOverlay(std::move(layers));
}

const IFileLayer* VirtualFileOverlay::find_layer(const std::string& path) const {
    for (const auto& layer : m_layers) {
        if (layer->is_file(path)) {
            return layer.get();
        }
    }
    return nullptr;
}

bool VirtualFileOverlay::exists(std::string_view path) const {
    auto normal = normalize_overlay_path(path);
    if (!normal) {
        return false;
    }
    return std::any_of(m_layers.begin(), m_layers.end(),
        [&](const auto& layer) { return layer->exists(*normal); });
}

bool VirtualFileOverlay::is_file(std::string_view path) const {
    auto normal = normalize_overlay_path(path);
    return normal && find_layer(*normal) != nullptr;
}

bool VirtualFileOverlay::is_directory(std::string_view path) const {
    auto normal = normalize_overlay_path(path);
    if (!normal) {
        return false;
    }
    return std::any_of(m_layers.begin(), m_layers.end(),
        [&](const auto& layer) { return layer->is_directory(*normal); });
}

forge_core::Result<std::string> VirtualFileOverlay::read(std::string_view path) const {
    auto normal = normalize_overlay_path(path);
    if (!normal) {
        return forge_core::Err<std::string>(normal.error());
    }
    const auto* layer = find_layer(*normal);
    if (!layer) {
        return forge_core::Err<std::string>(not_found(*normal));
    }
    return layer->read(*normal);
}

forge_core::Result<void> VirtualFileOverlay::write(std::string_view path, std::string contents) {
    auto normal = normalize_overlay_path(path);
    if (!normal) {
        return forge_core::Err(normal.error());
    }
    for (auto& layer : m_layers) {
        if (layer->writable()) {
            return layer->write(*normal, std::move(contents));
        }
    }
    return forge_core::Err(forge_core::Error(forge_core::ErrorCode::PermissionDenied,
        "overlay has no writable layer"));
}

forge_core::Result<void> VirtualFileOverlay::remove(std::string_view path) {
    auto normal = normalize_overlay_path(path);
    if (!normal) {
        return forge_core::Err(normal.error());
    }
    for (auto& layer : m_layers) {
        if (!layer->is_file(*normal)) {
            continue;
        }
        if (!layer->writable()) {
            return forge_core::Err(forge_core::Error(forge_core::ErrorCode::PermissionDenied,
                "file is not staged in a writable layer: '" + *normal + "'"));
        }
        return layer->remove(*normal);
    }
    return forge_core::Err(not_found(*normal));
}

std::vector<std::string> VirtualFileOverlay::list(std::string_view dir) const {
    auto normal = normalize_overlay_path(dir);
    if (!normal) {
        return {};
    }
    std::set<std::string> names;
    for (const auto& layer : m_layers) {
        for (auto& name : layer->list(*normal)) {
            names.insert(std::move(name));
        }
    }
    return {names.begin(), names.end()};
}

std::vector<std::string> VirtualFileOverlay::modified_paths() const {
    std::set<std::string> paths;
    for (const auto& layer : m_layers) {
        if (!layer->writable()) {
            continue;
        }
        for (auto& path : layer->files()) {
            paths.insert(std::move(path));
        }
    }
    return {paths.begin(), paths.end()};
}

void VirtualFileOverlay::discard() {
    std::size_t dropped = 0;
    for (auto& layer : m_layers) {
        if (!layer->writable()) {
            continue;
        }
        for (const auto& path : layer->files()) {
            if (layer->remove(path)) {
                ++dropped;
            }
        }
    }
    FORGE_LOG_DEBUG("Discarded {} staged file(s)", dropped);
}

forge_core::Result<std::size_t> VirtualFileOverlay::export_to(const std::filesystem::path& destination) const {
    std::size_t written = 0;
    for (const auto& path : modified_paths()) {
        auto contents = read(path);
        if (!contents) {
            return forge_core::Err<std::size_t>(contents.error());
        }
        auto target = destination / path;
        if (auto r = detail::ensure_directory(target.parent_path()); !r) {
            return forge_core::Err<std::size_t>(r.error());
        }
        if (auto r = detail::write_text_file(target, *contents); !r) {
            return forge_core::Err<std::size_t>(r.error());
        }
        ++written;
    }
    forge_core::release_logger()->debug("Exported {} staged file(s) to {}", written, destination.string());
    return forge_core::Ok(written);
}

const char* VirtualFileOverlay::resolving_layer(std::string_view path) const {
    auto normal = normalize_overlay_path(path);
    if (!normal) {
        return nullptr;
    }
    const auto* layer = find_layer(*normal);
    return layer ? layer->name() : nullptr;
}

} // namespace forge_release
