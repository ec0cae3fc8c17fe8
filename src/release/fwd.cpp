/// @file fwd.cpp
/// @brief Implementation of forward declaration utilities

#include <addon_forge/release/fwd.hpp>

namespace forge_release {

const char* build_outcome_to_string(BuildOutcome outcome) noexcept {
    switch (outcome) {
        case BuildOutcome::Signed:          return "Signed";
        case BuildOutcome::SkippedNotAFile: return "SkippedNotAFile";
        case BuildOutcome::SkippedExcluded: return "SkippedExcluded";
        case BuildOutcome::Failed:          return "Failed";
        default:                            return "Unknown";
    }
}

const char* build_stage_to_string(BuildStage stage) noexcept {
    switch (stage) {
        case BuildStage::Validate: return "validate";
        case BuildStage::Copy:     return "copy";
        case BuildStage::Sign:     return "sign";
        case BuildStage::Pack:     return "pack";
        default:                   return "unknown";
    }
}

} // namespace forge_release
