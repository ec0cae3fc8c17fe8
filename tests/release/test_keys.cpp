// forge_release KeyPair, KeyStore and DigestSigner tests

#include <catch2/catch_test_macros.hpp>
#include <addon_forge/release/keys.hpp>
#include <addon_forge/release/signer.hpp>

#include "test_support.hpp"

using namespace forge_release;
using forge_core::ReleaseError;

namespace {

std::vector<std::uint8_t> bytes(const std::string& s) {
    return {s.begin(), s.end()};
}

} // namespace

TEST_CASE("KeyPair generation and signatures", "[release][keys]") {
    auto key = KeyPair::generate("test_key");
    REQUIRE(key.is_ok());
    REQUIRE(key->name() == "test_key");
    REQUIRE(key->private_pem().find("PRIVATE KEY") != std::string::npos);
    REQUIRE(key->public_pem().find("PUBLIC KEY") != std::string::npos);

    SECTION("signature verifies against the signed data only") {
        auto signature = key->sign(bytes("archive contents"));
        REQUIRE(signature.is_ok());
        REQUIRE_FALSE(signature->empty());
        REQUIRE(key->verify(bytes("archive contents"), *signature));
        REQUIRE_FALSE(key->verify(bytes("tampered contents"), *signature));
    }

    SECTION("private material round-trips") {
        auto restored = KeyPair::from_private_pem("test_key", key->private_pem());
        REQUIRE(restored.is_ok());
        REQUIRE(restored->public_pem() == key->public_pem());

        auto signature = restored->sign(bytes("data"));
        REQUIRE(signature.is_ok());
        REQUIRE(key->verify(bytes("data"), *signature));
    }

    SECTION("garbage private material is rejected") {
        auto restored = KeyPair::from_private_pem("test_key", "not a key");
        REQUIRE(restored.is_err());
        REQUIRE(restored.error().code() == forge_core::ErrorCode::CryptoError);
    }
}

TEST_CASE("KeyStore obtain", "[release][keys]") {
    forge_test::TempDir dir("forge_keys");
    KeyStore store(dir / "keys");

    SECTION("ephemeral keys are never persisted and always differ") {
        auto first = store.obtain("ace", false);
        auto second = store.obtain("ace", false);
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        REQUIRE(first->private_pem() != second->private_pem());
        REQUIRE_FALSE(std::filesystem::exists(store.private_key_path("ace")));
    }

    SECTION("reused keys are persisted and read back unchanged") {
        auto first = store.obtain("ace", true);
        REQUIRE(first.is_ok());
        REQUIRE(std::filesystem::exists(store.private_key_path("ace")));
        REQUIRE(std::filesystem::exists(store.public_key_path("ace")));
        REQUIRE(store.private_key_path("ace").filename() == "ace.privkey");

        auto second = store.obtain("ace", true);
        REQUIRE(second.is_ok());
        REQUIRE(second->private_pem() == first->private_pem());
    }

    SECTION("deleted private key is regenerated") {
        auto first = store.obtain("ace", true);
        REQUIRE(first.is_ok());
        std::filesystem::remove(store.private_key_path("ace"));

        auto second = store.obtain("ace", true);
        REQUIRE(second.is_ok());
        REQUIRE(second->private_pem() != first->private_pem());
        REQUIRE(forge_test::read_file(store.public_key_path("ace")) == second->public_pem());
    }

    SECTION("corrupt private key is fatal") {
        forge_test::write_file(store.private_key_path("ace"), "corrupted");

        auto key = store.obtain("ace", true);
        REQUIRE(key.is_err());
        REQUIRE(key.error().is_release_error(ReleaseError::Kind::KeyReadFailure));
        REQUIRE(forge_test::read_file(store.private_key_path("ace")) == "corrupted");
    }
}

TEST_CASE("KeyStore publishes public keys", "[release][keys]") {
    forge_test::TempDir dir("forge_publish");
    KeyStore store(dir / "releases" / "keys");
    auto release_keys = dir / "releases" / "1.0.0" / "@mod" / "keys";

    auto key = store.obtain("mod", false);
    REQUIRE(key.is_ok());

    REQUIRE(store.publish_public_key(*key, release_keys).is_ok());
    REQUIRE(forge_test::read_file(release_keys / "mod.pubkey") == key->public_pem());
    REQUIRE(forge_test::read_file(store.public_key_path("mod")) == key->public_pem());

    SECTION("publishing twice is harmless") {
        REQUIRE(store.publish_public_key(*key, release_keys).is_ok());
        REQUIRE(forge_test::read_file(release_keys / "mod.pubkey") == key->public_pem());
    }
}

TEST_CASE("DigestSigner", "[release][signer]") {
    forge_test::TempDir dir("forge_signer");
    auto key = KeyPair::generate("mod");
    REQUIRE(key.is_ok());

    DigestSigner signer;
    auto archive = dir / "ace_main.pbo";
    forge_test::write_file(archive, "packed archive");

    SECTION("writes a verifiable signature beside the archive") {
        REQUIRE(signer.sign(archive, *key).is_ok());
        REQUIRE(signer.signature_path(archive, *key) == dir / "ace_main.pbo.mod.sig");
        REQUIRE(std::filesystem::exists(dir / "ace_main.pbo.mod.sig"));

        auto verified = signer.verify(archive, *key);
        REQUIRE(verified.is_ok());
        REQUIRE(*verified);
    }

    SECTION("re-signing overwrites") {
        REQUIRE(signer.sign(archive, *key).is_ok());
        forge_test::write_file(archive, "repacked archive");
        REQUIRE(signer.sign(archive, *key).is_ok());

        auto verified = signer.verify(archive, *key);
        REQUIRE(verified.is_ok());
        REQUIRE(*verified);
    }

    SECTION("missing archive fails") {
        auto result = signer.sign(dir / "missing.pbo", *key);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_release_error(ReleaseError::Kind::SigningFailure));
    }
}
