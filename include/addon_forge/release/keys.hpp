#pragma once

/// @file keys.hpp
/// @brief Signing keypairs and their on-disk lifecycle
///
/// Layout of the project-wide keys folder:
/// ```
/// releases/keys/{key_name}.privkey   PKCS#8 PEM, only when keys are reused
/// releases/keys/{key_name}.pubkey    SubjectPublicKeyInfo PEM
/// ```

#include "fwd.hpp"
#include <addon_forge/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace forge_release {

/// Default RSA modulus size
inline constexpr int k_default_key_bits = 1024;

// =============================================================================
// KeyPair
// =============================================================================

/// RSA keypair held as PEM text
///
/// Immutable once created; safe to share by const reference across threads.
class KeyPair {
public:
    /// Generate a fresh keypair in memory
    [[nodiscard]] static forge_core::Result<KeyPair> generate(
        const std::string& name, int bits = k_default_key_bits);

    /// Rebuild a keypair from private PEM material (public half is derived)
    [[nodiscard]] static forge_core::Result<KeyPair> from_private_pem(
        const std::string& name, const std::string& private_pem);

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const std::string& private_pem() const noexcept { return m_private_pem; }
    [[nodiscard]] const std::string& public_pem() const noexcept { return m_public_pem; }

    /// Sign @p data with SHA-256
    [[nodiscard]] forge_core::Result<std::vector<std::uint8_t>> sign(
        const std::vector<std::uint8_t>& data) const;

    /// Verify a signature produced by sign()
    [[nodiscard]] bool verify(
        const std::vector<std::uint8_t>& data,
        const std::vector<std::uint8_t>& signature) const;

private:
    KeyPair(std::string name, std::string private_pem, std::string public_pem)
        : m_name(std::move(name))
        , m_private_pem(std::move(private_pem))
        , m_public_pem(std::move(public_pem)) {}

    std::string m_name;
    std::string m_private_pem;
    std::string m_public_pem;
};

// =============================================================================
// KeyStore
// =============================================================================

/// Obtains keypairs and publishes their public halves
class KeyStore {
public:
    explicit KeyStore(std::filesystem::path keys_dir, int key_bits = k_default_key_bits);

    /// Obtain a keypair
    ///
    /// @param key_name Name of the key (file stem on disk)
    /// @param reuse false: ephemeral key, never written to disk.
    ///              true: read {key_name}.privkey, or generate and persist it
    ///              when absent. An unreadable key is ReleaseError::KeyReadFailure.
    [[nodiscard]] forge_core::Result<KeyPair> obtain(const std::string& key_name, bool reuse) const;

    /// Rewrite the project-wide public key and copy it into a release keys folder
    [[nodiscard]] forge_core::Result<void> publish_public_key(
        const KeyPair& key,
        const std::filesystem::path& release_keys_dir) const;

    [[nodiscard]] const std::filesystem::path& keys_dir() const noexcept { return m_keys_dir; }

    [[nodiscard]] std::filesystem::path private_key_path(const std::string& key_name) const {
        return m_keys_dir / (key_name + ".privkey");
    }

    [[nodiscard]] std::filesystem::path public_key_path(const std::string& key_name) const {
        return m_keys_dir / (key_name + ".pubkey");
    }

private:
    [[nodiscard]] forge_core::Result<KeyPair> generate_and_persist(const std::string& key_name) const;

    std::filesystem::path m_keys_dir;
    int m_key_bits;
};

} // namespace forge_release
