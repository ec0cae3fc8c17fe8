#pragma once

/// @file log.hpp
/// @brief Logging utilities for addon_forge

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define FORGE_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define FORGE_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define FORGE_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define FORGE_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define FORGE_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define FORGE_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace forge_core {

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the core module logger
std::shared_ptr<spdlog::logger> core_logger();

/// Get the release pipeline logger (addons, layout, orchestration)
std::shared_ptr<spdlog::logger> release_logger();

/// Get the key management and signing logger
std::shared_ptr<spdlog::logger> signing_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log entry with structured data
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "forge_core");
    ~LogScope();

    // Non-copyable, non-movable
    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define FORGE_LOG_CONCAT_INNER(a, b) a##b
#define FORGE_LOG_CONCAT(a, b) FORGE_LOG_CONCAT_INNER(a, b)

/// Macro for easy scope logging, one scope per line
#define FORGE_LOG_SCOPE(name) ::forge_core::LogScope FORGE_LOG_CONCAT(_log_scope_, __LINE__)(name)

} // namespace forge_core
