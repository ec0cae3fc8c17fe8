#pragma once

/// @file file_io.hpp
/// @brief Internal file helpers shared by the release module

#include <addon_forge/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace forge_release::detail {

/// Create a directory and its parents
///
/// A directory that already exists, including one created by a concurrent
/// caller between the check and the create, counts as success.
[[nodiscard]] inline forge_core::Result<void> ensure_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec && !std::filesystem::is_directory(dir)) {
        return forge_core::Err(forge_core::ReleaseError::io_failure(dir.string(), ec.message()));
    }
    return forge_core::Ok();
}

[[nodiscard]] inline forge_core::Result<std::vector<std::uint8_t>> read_binary_file(
    const std::filesystem::path& path) {

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return forge_core::Err<std::vector<std::uint8_t>>(
            forge_core::ReleaseError::io_failure(path.string(), "failed to open for reading"));
    }
    std::vector<std::uint8_t> data(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return forge_core::Err<std::vector<std::uint8_t>>(
            forge_core::ReleaseError::io_failure(path.string(), "read error"));
    }
    return forge_core::Ok(std::move(data));
}

[[nodiscard]] inline forge_core::Result<std::string> read_text_file(const std::filesystem::path& path) {
    auto bytes = read_binary_file(path);
    if (!bytes) {
        return forge_core::Err<std::string>(bytes.error());
    }
    return forge_core::Ok(std::string(bytes->begin(), bytes->end()));
}

[[nodiscard]] inline forge_core::Result<void> write_file(
    const std::filesystem::path& path, const char* data, std::size_t size) {

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return forge_core::Err(forge_core::ReleaseError::io_failure(path.string(), "failed to open for writing"));
    }
    file.write(data, static_cast<std::streamsize>(size));
    if (!file) {
        return forge_core::Err(forge_core::ReleaseError::io_failure(path.string(), "write error"));
    }
    return forge_core::Ok();
}

[[nodiscard]] inline forge_core::Result<void> write_text_file(
    const std::filesystem::path& path, const std::string& content) {
    return write_file(path, content.data(), content.size());
}

[[nodiscard]] inline forge_core::Result<void> write_binary_file(
    const std::filesystem::path& path, const std::vector<std::uint8_t>& content) {
    return write_file(path, reinterpret_cast<const char*>(content.data()), content.size());
}

/// Copy a file, replacing any existing destination
[[nodiscard]] inline forge_core::Result<void> copy_file_overwrite(
    const std::filesystem::path& from, const std::filesystem::path& to) {

    std::error_code ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return forge_core::Err(forge_core::ReleaseError::io_failure(to.string(),
            "copy from '" + from.string() + "' failed: " + ec.message()));
    }
    return forge_core::Ok();
}

} // namespace forge_release::detail
