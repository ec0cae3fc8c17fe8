/// @file signer.cpp
/// @brief Default signer implementation

#include <addon_forge/release/signer.hpp>
#include <addon_forge/release/keys.hpp>
#include <addon_forge/core/log.hpp>

#include "file_io.hpp"

namespace forge_release {

std::filesystem::path DigestSigner::signature_path(
    const std::filesystem::path& archive,
    const KeyPair& key) const {

    auto path = archive;
    path += "." + key.name() + ".sig";
    return path;
}

forge_core::Result<void> DigestSigner::sign(
    const std::filesystem::path& archive,
    const KeyPair& key) {

    auto data = detail::read_binary_file(archive);
    if (!data) {
        return forge_core::Err(forge_core::ReleaseError::signing_failure(
            archive.string(), data.error().message()));
    }

    auto signature = key.sign(*data);
    if (!signature) {
        return forge_core::Err(forge_core::ReleaseError::signing_failure(
            archive.string(), signature.error().message()));
    }

    auto sig_path = signature_path(archive, key);
    if (auto r = detail::write_binary_file(sig_path, *signature); !r) {
        return forge_core::Err(forge_core::ReleaseError::signing_failure(
            archive.string(), r.error().message()));
    }

    forge_core::signing_logger()->trace("Signed {} -> {}", archive.string(), sig_path.filename().string());
    return forge_core::Ok();
}

forge_core::Result<bool> DigestSigner::verify(
    const std::filesystem::path& archive,
    const KeyPair& key) const {

    auto data = detail::read_binary_file(archive);
    if (!data) {
        return forge_core::Err<bool>(data.error());
    }
    auto signature = detail::read_binary_file(signature_path(archive, key));
    if (!signature) {
        return forge_core::Err<bool>(signature.error());
    }
    return forge_core::Ok(key.verify(*data, *signature));
}

} // namespace forge_release
