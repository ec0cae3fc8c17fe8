#pragma once

/// @file overlay.hpp
/// @brief Layered file view: in-memory writable layer over the project tree
///
/// Build steps read and stage files through a VirtualFileOverlay so that
/// rewritten files never touch the source tree until exported.
///
/// ```cpp
/// auto fs = VirtualFileOverlay::over(project_root);
/// auto config = fs.read("addons/main/config.cpp");      // physical layer
/// fs.write("addons/main/config.cpp", patched);          // memory layer only
/// fs.export_to(staging_dir);                            // explicit export
/// fs.discard();                                         // drop staged files
/// ```
///
/// Paths are relative to the overlay root and use '/' separators. Absolute
/// paths and paths escaping the root are rejected.

#include "fwd.hpp"
#include <addon_forge/core/error.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace forge_release {

// =============================================================================
// IFileLayer
// =============================================================================

/// Storage backend of a VirtualFileOverlay
///
/// All paths passed to a layer are already normalized ("" is the root).
class IFileLayer {
public:
    virtual ~IFileLayer() = default;

    [[nodiscard]] virtual bool exists(const std::string& path) const = 0;
    [[nodiscard]] virtual bool is_file(const std::string& path) const = 0;
    [[nodiscard]] virtual bool is_directory(const std::string& path) const = 0;

    /// Read a whole file
    [[nodiscard]] virtual forge_core::Result<std::string> read(const std::string& path) const = 0;

    /// Create or replace a file (parent directories are implicit)
    [[nodiscard]] virtual forge_core::Result<void> write(const std::string& path, std::string contents) = 0;

    /// Remove a file
    [[nodiscard]] virtual forge_core::Result<void> remove(const std::string& path) = 0;

    /// Names of the direct children of a directory
    [[nodiscard]] virtual std::vector<std::string> list(const std::string& dir) const = 0;

    /// All file paths held by this layer (writable layers only)
    [[nodiscard]] virtual std::vector<std::string> files() const = 0;

    [[nodiscard]] virtual bool writable() const noexcept = 0;
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

// =============================================================================
// MemoryLayer
// =============================================================================

/// Volatile, thread-safe in-memory file store
class MemoryLayer : public IFileLayer {
public:
    MemoryLayer() = default;

    [[nodiscard]] bool exists(const std::string& path) const override;
    [[nodiscard]] bool is_file(const std::string& path) const override;
    [[nodiscard]] bool is_directory(const std::string& path) const override;
    [[nodiscard]] forge_core::Result<std::string> read(const std::string& path) const override;
    [[nodiscard]] forge_core::Result<void> write(const std::string& path, std::string contents) override;
    [[nodiscard]] forge_core::Result<void> remove(const std::string& path) override;
    [[nodiscard]] std::vector<std::string> list(const std::string& dir) const override;
    [[nodiscard]] std::vector<std::string> files() const override;
    [[nodiscard]] bool writable() const noexcept override { return true; }
    [[nodiscard]] const char* name() const noexcept override { return "memory"; }

    /// Drop every file
    void clear();

    [[nodiscard]] std::size_t size() const;

private:
    [[nodiscard]] bool is_directory_locked(const std::string& path) const;

    mutable std::shared_mutex m_mutex;
    std::map<std::string, std::string> m_files;
};

// =============================================================================
// PhysicalLayer
// =============================================================================

/// Read-only view of a directory on disk
class PhysicalLayer : public IFileLayer {
public:
    explicit PhysicalLayer(std::filesystem::path root);

    [[nodiscard]] bool exists(const std::string& path) const override;
    [[nodiscard]] bool is_file(const std::string& path) const override;
    [[nodiscard]] bool is_directory(const std::string& path) const override;
    [[nodiscard]] forge_core::Result<std::string> read(const std::string& path) const override;
    [[nodiscard]] forge_core::Result<void> write(const std::string& path, std::string contents) override;
    [[nodiscard]] forge_core::Result<void> remove(const std::string& path) override;
    [[nodiscard]] std::vector<std::string> list(const std::string& dir) const override;
    [[nodiscard]] std::vector<std::string> files() const override { return {}; }
    [[nodiscard]] bool writable() const noexcept override { return false; }
    [[nodiscard]] const char* name() const noexcept override { return "physical"; }

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }

private:
    [[nodiscard]] std::filesystem::path resolve(const std::string& path) const;

    std::filesystem::path m_root;
};

// =============================================================================
// VirtualFileOverlay
// =============================================================================

/// Stack of file layers resolved top to bottom
class VirtualFileOverlay {
public:
    /// Compose layers, first entry on top
    explicit VirtualFileOverlay(std::vector<std::shared_ptr<IFileLayer>> layers);

    /// Memory layer over the physical tree rooted at @p root
    [[nodiscard]] static VirtualFileOverlay over(const std::filesystem::path& root);

    [[nodiscard]] bool exists(std::string_view path) const;
    [[nodiscard]] bool is_file(std::string_view path) const;
    [[nodiscard]] bool is_directory(std::string_view path) const;

    /// Read from the topmost layer holding the file
    [[nodiscard]] forge_core::Result<std::string> read(std::string_view path) const;

    /// Write into the topmost writable layer
    [[nodiscard]] forge_core::Result<void> write(std::string_view path, std::string contents);

    /// Remove a staged file (files only present in read-only layers cannot be removed)
    [[nodiscard]] forge_core::Result<void> remove(std::string_view path);

    /// Sorted union of the children of @p dir over all layers
    [[nodiscard]] std::vector<std::string> list(std::string_view dir) const;

    /// Files staged in writable layers, sorted
    [[nodiscard]] std::vector<std::string> modified_paths() const;

    /// Drop all staged files
    void discard();

    /// Write staged files under @p destination, returning how many were written
    [[nodiscard]] forge_core::Result<std::size_t> export_to(const std::filesystem::path& destination) const;

    /// Name of the layer that currently serves @p path, or nullptr
    [[nodiscard]] const char* resolving_layer(std::string_view path) const;

    [[nodiscard]] std::size_t layer_count() const noexcept { return m_layers.size(); }

private:
    [[nodiscard]] const IFileLayer* find_layer(const std::string& path) const;

    std::vector<std::shared_ptr<IFileLayer>> m_layers;
};

/// Normalize an overlay path ("./a//b/../c" -> "a/c"), rejecting absolute and escaping paths
[[nodiscard]] forge_core::Result<std::string> normalize_overlay_path(std::string_view path);

} // namespace forge_release
