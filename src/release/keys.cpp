/// @file keys.cpp
/// @brief KeyPair and KeyStore implementation (OpenSSL)

#include <addon_forge/release/keys.hpp>
#include <addon_forge/core/log.hpp>

#include "file_io.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <memory>

namespace forge_release {

namespace {

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;

/// Last OpenSSL error as text (clears the error queue)
std::string openssl_error(const char* what) {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return what;
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return std::string(what) + ": " + buffer;
}

forge_core::Error crypto_error(const std::string& message) {
    return forge_core::Error(forge_core::ErrorCode::CryptoError, message);
}

std::string bio_to_string(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || data == nullptr) {
        return {};
    }
    return std::string(data, static_cast<std::size_t>(len));
}

forge_core::Result<std::string> private_to_pem(EVP_PKEY* pkey) {
    BioPtr bio(BIO_new(BIO_s_mem()), &BIO_free);
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return forge_core::Err<std::string>(crypto_error(openssl_error("PEM_write_bio_PrivateKey")));
    }
    return forge_core::Ok(bio_to_string(bio.get()));
}

forge_core::Result<std::string> public_to_pem(EVP_PKEY* pkey) {
    BioPtr bio(BIO_new(BIO_s_mem()), &BIO_free);
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), pkey) != 1) {
        return forge_core::Err<std::string>(crypto_error(openssl_error("PEM_write_bio_PUBKEY")));
    }
    return forge_core::Ok(bio_to_string(bio.get()));
}

PkeyPtr read_private(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
    if (!bio) {
        return PkeyPtr(nullptr, &EVP_PKEY_free);
    }
    return PkeyPtr(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), &EVP_PKEY_free);
}

PkeyPtr read_public(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
    if (!bio) {
        return PkeyPtr(nullptr, &EVP_PKEY_free);
    }
    return PkeyPtr(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr), &EVP_PKEY_free);
}

} // anonymous namespace

// =============================================================================
// KeyPair Implementation
// =============================================================================

forge_core::Result<KeyPair> KeyPair::generate(const std::string& name, int bits) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), &EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return forge_core::Err<KeyPair>(crypto_error(openssl_error("EVP_PKEY_keygen_init")));
    }
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
        return forge_core::Err<KeyPair>(crypto_error(openssl_error("EVP_PKEY_CTX_set_rsa_keygen_bits")));
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        return forge_core::Err<KeyPair>(crypto_error(openssl_error("EVP_PKEY_keygen")));
    }
    PkeyPtr pkey(raw, &EVP_PKEY_free);

    auto private_pem = private_to_pem(pkey.get());
    if (!private_pem) {
        return forge_core::Err<KeyPair>(private_pem.error());
    }
    auto public_pem = public_to_pem(pkey.get());
    if (!public_pem) {
        return forge_core::Err<KeyPair>(public_pem.error());
    }

    forge_core::signing_logger()->debug("Generated {}-bit keypair '{}'", bits, name);
    return forge_core::Ok(KeyPair(name, std::move(*private_pem), std::move(*public_pem)));
}

forge_core::Result<KeyPair> KeyPair::from_private_pem(const std::string& name, const std::string& private_pem) {
    auto pkey = read_private(private_pem);
    if (!pkey) {
        return forge_core::Err<KeyPair>(crypto_error(openssl_error("PEM_read_bio_PrivateKey")));
    }

    auto public_pem = public_to_pem(pkey.get());
    if (!public_pem) {
        return forge_core::Err<KeyPair>(public_pem.error());
    }

    return forge_core::Ok(KeyPair(name, private_pem, std::move(*public_pem)));
}

forge_core::Result<std::vector<std::uint8_t>> KeyPair::sign(const std::vector<std::uint8_t>& data) const {
    using Bytes = std::vector<std::uint8_t>;

    auto pkey = read_private(m_private_pem);
    if (!pkey) {
        return forge_core::Err<Bytes>(crypto_error(openssl_error("PEM_read_bio_PrivateKey")));
    }

    MdCtxPtr mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!mdctx) {
        return forge_core::Err<Bytes>(crypto_error(openssl_error("EVP_MD_CTX_new")));
    }
    if (EVP_DigestSignInit(mdctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1) {
        return forge_core::Err<Bytes>(crypto_error(openssl_error("EVP_DigestSignInit")));
    }
    if (EVP_DigestSignUpdate(mdctx.get(), data.data(), data.size()) != 1) {
        return forge_core::Err<Bytes>(crypto_error(openssl_error("EVP_DigestSignUpdate")));
    }

    // First call obtains the signature length
    std::size_t sig_len = 0;
    if (EVP_DigestSignFinal(mdctx.get(), nullptr, &sig_len) != 1) {
        return forge_core::Err<Bytes>(crypto_error(openssl_error("EVP_DigestSignFinal")));
    }
    Bytes signature(sig_len);
    if (EVP_DigestSignFinal(mdctx.get(), signature.data(), &sig_len) != 1) {
        return forge_core::Err<Bytes>(crypto_error(openssl_error("EVP_DigestSignFinal")));
    }
    signature.resize(sig_len);

    return forge_core::Ok(std::move(signature));
}

bool KeyPair::verify(const std::vector<std::uint8_t>& data, const std::vector<std::uint8_t>& signature) const {
    auto pkey = read_public(m_public_pem);
    if (!pkey) {
        ERR_clear_error();
        return false;
    }

    MdCtxPtr mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!mdctx ||
        EVP_DigestVerifyInit(mdctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1 ||
        EVP_DigestVerifyUpdate(mdctx.get(), data.data(), data.size()) != 1) {
        ERR_clear_error();
        return false;
    }

    bool ok = EVP_DigestVerifyFinal(mdctx.get(), signature.data(), signature.size()) == 1;
    ERR_clear_error();
    return ok;
}

// =============================================================================
// KeyStore Implementation
// =============================================================================

KeyStore::KeyStore(std::filesystem::path keys_dir, int key_bits)
    : m_keys_dir(std::move(keys_dir))
    , m_key_bits(key_bits) {
}

forge_core::Result<KeyPair> KeyStore::obtain(const std::string& key_name, bool reuse) const {
    if (!reuse) {
        // Ephemeral key, private half stays in memory
        return KeyPair::generate(key_name, m_key_bits);
    }

    auto private_path = private_key_path(key_name);
    std::error_code ec;
    if (!std::filesystem::exists(private_path, ec)) {
        forge_core::signing_logger()->info("KeyGen {}.privkey", key_name);
        return generate_and_persist(key_name);
    }

    // An existing key must never be silently replaced
    auto pem = detail::read_text_file(private_path);
    if (!pem) {
        return forge_core::Err<KeyPair>(
            forge_core::ReleaseError::key_read_failure(private_path.string(), pem.error().message()));
    }

    auto key = KeyPair::from_private_pem(key_name, *pem);
    if (!key) {
        return forge_core::Err<KeyPair>(
            forge_core::ReleaseError::key_read_failure(private_path.string(), key.error().message()));
    }

    forge_core::signing_logger()->debug("Reusing private key {}", private_path.string());
    return key;
}

forge_core::Result<KeyPair> KeyStore::generate_and_persist(const std::string& key_name) const {
    auto key = KeyPair::generate(key_name, m_key_bits);
    if (!key) {
        return key;
    }

    if (auto r = detail::ensure_directory(m_keys_dir); !r) {
        return forge_core::Err<KeyPair>(r.error());
    }
    if (auto r = detail::write_text_file(private_key_path(key_name), key->private_pem()); !r) {
        return forge_core::Err<KeyPair>(r.error());
    }
    if (auto r = detail::write_text_file(public_key_path(key_name), key->public_pem()); !r) {
        return forge_core::Err<KeyPair>(r.error());
    }

    return key;
}

forge_core::Result<void> KeyStore::publish_public_key(
    const KeyPair& key,
    const std::filesystem::path& release_keys_dir) const {

    if (auto r = detail::ensure_directory(m_keys_dir); !r) {
        return r;
    }

    auto project_public = public_key_path(key.name());
    if (auto r = detail::write_text_file(project_public, key.public_pem()); !r) {
        return r;
    }

    if (auto r = detail::ensure_directory(release_keys_dir); !r) {
        return r;
    }
    if (auto r = detail::copy_file_overwrite(project_public, release_keys_dir / project_public.filename()); !r) {
        return r;
    }

    forge_core::signing_logger()->debug("Published {} to {}", project_public.filename().string(),
        release_keys_dir.string());
    return forge_core::Ok();
}

} // namespace forge_release
