/// @file log.cpp
/// @brief Logging system implementation for forge_core
///
/// Extends the spdlog-based logging with:
/// - Multiple named loggers for the release subsystems
/// - Log level configuration
/// - Structured logging support

#include <addon_forge/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <map>
#include <memory>
#include <sstream>
#include <vector>

namespace forge_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

/// Registry of named loggers
struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum global_level = spdlog::level::info;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Sinks for a newly created named logger
std::vector<spdlog::sink_ptr> create_sinks() {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
    return {console_sink};
}

} // anonymous namespace

// =============================================================================
// Named Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    // A logger registered directly with spdlog (e.g. by a test) takes precedence
    if (auto existing = spdlog::get(name)) {
        reg.loggers[name] = existing;
        return existing;
    }

    auto sinks = create_sinks();
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.global_level);

    reg.loggers[name] = logger;
    spdlog::register_logger(logger);

    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("forge_core");
    return logger;
}

std::shared_ptr<spdlog::logger> release_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("release");
    return logger;
}

std::shared_ptr<spdlog::logger> signing_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("signing");
    return logger;
}

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.global_level = level;
    spdlog::set_level(level);

    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.global_level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Structured Logging Support
// =============================================================================

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    auto logger = get_logger(logger_name);

    std::ostringstream oss;
    oss << message;

    if (!fields.empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : fields) {
            if (!first) oss << ", ";
            oss << key << "=\"" << value << "\"";
            first = false;
        }
        oss << "}";
    }

    logger->log(level, oss.str());
}

// =============================================================================
// Log Scoping
// =============================================================================

LogScope::LogScope(const std::string& name, const std::string& logger_name)
    : m_name(name)
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> Entering {}", m_name);
}

LogScope::~LogScope() {
    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - m_start);
    m_logger->debug("<<< {} finished in {}ms", m_name, duration.count());
}

} // namespace forge_core
