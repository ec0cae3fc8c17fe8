#pragma once

/// @file signer.hpp
/// @brief Signer capability and the default digest signer

#include "fwd.hpp"
#include <addon_forge/core/error.hpp>

#include <filesystem>
#include <string>

namespace forge_release {

// =============================================================================
// ISigner
// =============================================================================

/// Attaches a signature to a packed archive
///
/// Implementations must be safe to call concurrently on distinct archives and
/// re-signing an archive with the same key must be harmless.
class ISigner {
public:
    virtual ~ISigner() = default;

    /// Sign @p archive with @p key
    [[nodiscard]] virtual forge_core::Result<void> sign(
        const std::filesystem::path& archive,
        const KeyPair& key) = 0;

    /// Path of the signature written for @p archive
    [[nodiscard]] virtual std::filesystem::path signature_path(
        const std::filesystem::path& archive,
        const KeyPair& key) const = 0;

    /// Get signer name
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

// =============================================================================
// DigestSigner
// =============================================================================

/// Writes an RSA/SHA-256 signature beside the archive as
/// {archive}.{key_name}.sig
class DigestSigner : public ISigner {
public:
    DigestSigner() = default;

    [[nodiscard]] forge_core::Result<void> sign(
        const std::filesystem::path& archive,
        const KeyPair& key) override;

    [[nodiscard]] std::filesystem::path signature_path(
        const std::filesystem::path& archive,
        const KeyPair& key) const override;

    [[nodiscard]] const char* name() const noexcept override { return "DigestSigner"; }

    /// Check the signature written by sign() against the archive contents
    [[nodiscard]] forge_core::Result<bool> verify(
        const std::filesystem::path& archive,
        const KeyPair& key) const;
};

} // namespace forge_release
