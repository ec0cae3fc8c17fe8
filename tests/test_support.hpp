#pragma once

// Shared helpers for addon_forge tests

#include <addon_forge/core/log.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>

namespace forge_test {

/// Unique scratch directory removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& tag = "forge") {
        static std::atomic<unsigned> s_counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path()
            / (tag + "_" + std::to_string(stamp) + "_" + std::to_string(s_counter++));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }
    [[nodiscard]] std::filesystem::path operator/(const std::filesystem::path& rel) const { return m_path / rel; }

private:
    std::filesystem::path m_path;
};

/// Write @p content to @p path, creating parent folders
inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/// Capture everything a logger emits while in scope
class LogCapture {
public:
    explicit LogCapture(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger))
        , m_sink(std::make_shared<spdlog::sinks::ostream_sink_mt>(m_stream)) {
        m_sink->set_pattern("%l|%v");
        m_logger->sinks().push_back(m_sink);
    }

    ~LogCapture() {
        auto& sinks = m_logger->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), m_sink), sinks.end());
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] std::string text() const {
        m_logger->flush();
        return m_stream.str();
    }

    /// Number of lines containing @p needle
    [[nodiscard]] std::size_t count(const std::string& needle) const {
        std::istringstream lines(text());
        std::size_t n = 0;
        for (std::string line; std::getline(lines, line);) {
            if (line.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::ostringstream m_stream;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> m_sink;
};

} // namespace forge_test
