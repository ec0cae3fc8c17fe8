#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for forge_release module

#include <cstdint>
#include <string>

namespace forge_release {

// =============================================================================
// Addon Types
// =============================================================================

class AddonLocation;
class Addon;

// =============================================================================
// Project Types
// =============================================================================

struct ProjectDescriptor;

// =============================================================================
// Key Types
// =============================================================================

class KeyPair;
class KeyStore;

// =============================================================================
// Capability Types
// =============================================================================

class ISigner;
class DigestSigner;
class IPacker;

// =============================================================================
// Filesystem Types
// =============================================================================

class IFileLayer;
class MemoryLayer;
class PhysicalLayer;
class VirtualFileOverlay;

// =============================================================================
// Release Types
// =============================================================================

struct ReleaseContext;
class ReleaseLayout;
class WorkerPool;
class ReleaseAccumulator;
class BuildOrchestrator;

/// Outcome of one archive's unit of work
enum class BuildOutcome : std::uint8_t {
    Signed,           ///< Copied into the release and signed
    SkippedNotAFile,  ///< Entry is not a regular archive file
    SkippedExcluded,  ///< Addon is on the project's skip list
    Failed            ///< Validation, copy or signing failed
};

/// Stage at which a unit of work failed
enum class BuildStage : std::uint8_t {
    Validate,  ///< Addon name validation
    Copy,      ///< Destination folder creation or archive copy
    Sign,      ///< Signer invocation
    Pack       ///< Packer invocation
};

// =============================================================================
// Utility Functions
// =============================================================================

/// Convert BuildOutcome to string
[[nodiscard]] const char* build_outcome_to_string(BuildOutcome outcome) noexcept;

/// Convert BuildStage to string
[[nodiscard]] const char* build_stage_to_string(BuildStage stage) noexcept;

/// File extension of packed archives (including the dot)
inline constexpr const char* k_archive_extension = ".pbo";

/// File name of the project descriptor
inline constexpr const char* k_project_file_name = "forge.json";

} // namespace forge_release
