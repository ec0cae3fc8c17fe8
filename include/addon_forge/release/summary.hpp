#pragma once

/// @file summary.hpp
/// @brief Per-unit build results and their thread-safe aggregation

#include "fwd.hpp"
#include "addon.hpp"
#include <addon_forge/core/error.hpp>

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace forge_release {

/// A unit of work that did not complete
struct Failure {
    std::string addon;  ///< Empty when a whole category folder failed
    AddonLocation location;
    BuildStage stage = BuildStage::Validate;
    forge_core::Error error;

    /// "{location}/{addon} failed at {stage}: {message}", or "{location} failed ..." without an addon
    [[nodiscard]] std::string describe() const;
};

/// Result of one archive's unit of work
struct BuildResult {
    std::string addon_name;
    AddonLocation location;
    std::filesystem::path source;
    std::filesystem::path destination;
    BuildOutcome outcome = BuildOutcome::SkippedNotAFile;
    std::optional<Failure> failure;
};

/// Aggregate of a release build
struct ReleaseSummary {
    std::size_t signed_count = 0;
    std::size_t skipped_count = 0;
    std::vector<Failure> failures;  ///< Sorted by (location, addon)

    [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
};

/// Aggregate of the pack stage
struct PackSummary {
    std::size_t packed_count = 0;
    std::vector<Failure> failures;  ///< Sorted by (location, addon)

    [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
};

/// Sort failures by (location, addon)
void sort_failures(std::vector<Failure>& failures);

// =============================================================================
// ReleaseAccumulator
// =============================================================================

/// Collects BuildResults from concurrent units
class ReleaseAccumulator {
public:
    ReleaseAccumulator() = default;

    ReleaseAccumulator(const ReleaseAccumulator&) = delete;
    ReleaseAccumulator& operator=(const ReleaseAccumulator&) = delete;

    /// Record one unit's result
    void record(BuildResult result);

    /// Summary of everything recorded so far
    [[nodiscard]] ReleaseSummary summary() const;

private:
    mutable std::mutex m_mutex;
    std::size_t m_signed = 0;
    std::size_t m_skipped = 0;
    std::vector<Failure> m_failures;
};

} // namespace forge_release
