/// @file error.cpp
/// @brief Error handling implementation for forge_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics

#include <addon_forge/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace forge_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format release error with full context
std::string format_release_error(const ReleaseError& err) {
    std::ostringstream oss;
    oss << "[" << release_error_kind_name(err.kind) << "] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ReleaseError>) {
            oss << detail::format_release_error(err);
        }
    }, error.variant());

    const auto& context = error.context();
    if (!context.empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : context) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> release_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<ReleaseError>()) {
        s_error_stats.release_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.release_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Release: " << s_error_stats.release_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace forge_core
