/// @file summary.cpp
/// @brief ReleaseAccumulator implementation

#include <addon_forge/release/summary.hpp>

#include <algorithm>

namespace forge_release {

std::string Failure::describe() const {
    auto subject = addon.empty() ? location.folder() : location.folder() + "/" + addon;
    return subject + " failed at " + build_stage_to_string(stage) + ": " + error.message();
}

void sort_failures(std::vector<Failure>& failures) {
    std::stable_sort(failures.begin(), failures.end(), [](const Failure& a, const Failure& b) {
        if (a.location != b.location) {
            return a.location < b.location;
        }
        return a.addon < b.addon;
    });
}

void ReleaseAccumulator::record(BuildResult result) {
    std::lock_guard lock(m_mutex);
    switch (result.outcome) {
        case BuildOutcome::Signed:
            ++m_signed;
            break;
        case BuildOutcome::SkippedNotAFile:
        case BuildOutcome::SkippedExcluded:
            ++m_skipped;
            break;
        case BuildOutcome::Failed:
            if (result.failure) {
                m_failures.push_back(std::move(*result.failure));
            }
            break;
    }
}

ReleaseSummary ReleaseAccumulator::summary() const {
    std::lock_guard lock(m_mutex);
    ReleaseSummary summary;
    summary.signed_count = m_signed;
    summary.skipped_count = m_skipped;
    summary.failures = m_failures;
    sort_failures(summary.failures);
    return summary;
}

} // namespace forge_release
