#include <catch2/catch_test_macros.hpp>
#include "keyward/crypto/key_material_factory.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include <set>
using namespace keyward::e2ee;
using namespace keyward::e2ee::crypto;
using namespace keyward::e2ee::models;
TEST_CASE("KeyMaterialFactory - Identity key pairs", "[key_material_factory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto generated = KeyMaterialFactory::GenerateIdentityKeyPair();
    REQUIRE(generated.IsOk());
    const auto& pair = generated.Unwrap();
    REQUIRE(pair.GetId() == 0);
    REQUIRE(pair.GetPublicKey().AsSpan().size() == kEd25519PublicKeyBytes);
    REQUIRE(pair.GetPrivateKey().GetHandle().Size() == kEd25519SecretKeyBytes);
    SECTION("Two identities never share a public key") {
        auto other = KeyMaterialFactory::GenerateIdentityKeyPair();
        REQUIRE(other.IsOk());
        REQUIRE_FALSE(other.Unwrap().GetPublicKey() == pair.GetPublicKey());
    }
    SECTION("Agreement forms are consistent") {
        auto x_public = KeyMaterialFactory::IdentityAgreementPublicKey(pair.GetPublicKey());
        REQUIRE(x_public.IsOk());
        auto x_private = KeyMaterialFactory::IdentityAgreementPrivateKey(pair.GetPrivateKey());
        REQUIRE(x_private.IsOk());
        auto x_private_bytes = x_private.Unwrap().ReadBytes(kX25519PrivateKeyBytes).Unwrap();
        REQUIRE(SodiumInterop::DeriveX25519PublicKey(x_private_bytes).Unwrap() == x_public.Unwrap());
    }
}
TEST_CASE("KeyMaterialFactory - Pre-key generation", "[key_material_factory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Signed pre-key keeps the requested id") {
        auto pair = KeyMaterialFactory::GenerateKeyPair<SignedPreKeyPurpose>(7);
        REQUIRE(pair.IsOk());
        REQUIRE(pair.Unwrap().GetId() == 7);
        REQUIRE(pair.Unwrap().GetPublicKey().AsSpan().size() == kX25519PublicKeyBytes);
        REQUIRE(pair.Unwrap().GetPrivateKey().GetHandle().Size() == kX25519PrivateKeyBytes);
    }
    SECTION("Batch ids are consecutive and keys distinct") {
        auto batch = KeyMaterialFactory::GenerateBatch(20, 101);
        REQUIRE(batch.IsOk());
        REQUIRE(batch.Unwrap().size() == 20);
        std::set<std::vector<uint8_t>> public_keys;
        for (size_t i = 0; i < batch.Unwrap().size(); ++i) {
            REQUIRE(batch.Unwrap()[i].GetId() == 101 + i);
            public_keys.insert(batch.Unwrap()[i].GetPublicKey().GetBytesCopy());
        }
        REQUIRE(public_keys.size() == 20);
    }
    SECTION("Empty batch") {
        auto batch = KeyMaterialFactory::GenerateBatch(0);
        REQUIRE(batch.IsOk());
        REQUIRE(batch.Unwrap().empty());
    }
    SECTION("Oversized batch is rejected") {
        auto batch = KeyMaterialFactory::GenerateBatch(kMaxPreKeyBatchSize + 1);
        REQUIRE(batch.IsErr());
        REQUIRE(batch.UnwrapErr().type == KeywardFailureType::InvalidInput);
    }
    SECTION("Batch that would overflow the id space is rejected") {
        auto batch = KeyMaterialFactory::GenerateBatch(2, UINT32_MAX);
        REQUIRE(batch.IsErr());
    }
}
TEST_CASE("KeyMaterialFactory - Signing pre-keys with the identity", "[key_material_factory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto identity = KeyMaterialFactory::GenerateIdentityKeyPair().Unwrap();
    auto pre_key = KeyMaterialFactory::GenerateKeyPair<SignedPreKeyPurpose>(1).Unwrap();
    auto signature = KeyMaterialFactory::Sign(pre_key.GetPublicKey().AsSpan(), identity.GetPrivateKey());
    REQUIRE(signature.IsOk());
    REQUIRE(signature.Unwrap().size() == kEd25519SignatureBytes);
    SECTION("Signature verifies") {
        auto verified = KeyMaterialFactory::Verify(
            pre_key.GetPublicKey().AsSpan(), signature.Unwrap(), identity.GetPublicKey());
        REQUIRE(verified.IsOk());
        REQUIRE(verified.Unwrap());
    }
    SECTION("Signing is deterministic") {
        auto again = KeyMaterialFactory::Sign(pre_key.GetPublicKey().AsSpan(), identity.GetPrivateKey());
        REQUIRE(again.Unwrap() == signature.Unwrap());
    }
    SECTION("Tampered public key fails verification") {
        auto tampered = pre_key.GetPublicKey().GetBytesCopy();
        tampered[5] ^= 0x40;
        auto verified = KeyMaterialFactory::Verify(tampered, signature.Unwrap(), identity.GetPublicKey());
        REQUIRE(verified.IsOk());
        REQUIRE_FALSE(verified.Unwrap());
    }
    SECTION("Another identity does not verify") {
        auto stranger = KeyMaterialFactory::GenerateIdentityKeyPair().Unwrap();
        auto verified = KeyMaterialFactory::Verify(
            pre_key.GetPublicKey().AsSpan(), signature.Unwrap(), stranger.GetPublicKey());
        REQUIRE_FALSE(verified.Unwrap());
    }
}
TEST_CASE("KeyMaterialFactory - Registration ids", "[key_material_factory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    for (int i = 0; i < 2000; ++i) {
        const uint32_t id = KeyMaterialFactory::GenerateRegistrationId();
        REQUIRE(id >= kMinRegistrationId);
        REQUIRE(id <= kMaxRegistrationId);
    }
}
TEST_CASE("Typed keys - Size checks and cloning", "[typed_keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Public key of the wrong size is rejected") {
        std::vector<uint8_t> bytes(kX25519PublicKeyBytes - 1, 0x01);
        REQUIRE(OneTimePreKeyPublicKey::FromBytes(bytes).IsErr());
    }
    SECTION("Identity private key needs the full 64-byte secret") {
        auto handle = SecureMemoryHandle::Allocate(kX25519PrivateKeyBytes).Unwrap();
        auto key = IdentityPrivateKey::FromHandle(std::move(handle));
        REQUIRE(key.IsErr());
        REQUIRE(key.UnwrapErr().type == KeywardFailureType::InvalidInput);
    }
    SECTION("Cloned pair holds the same secret") {
        auto pair = KeyMaterialFactory::GenerateKeyPair<OneTimePreKeyPurpose>(3).Unwrap();
        auto copy = pair.Clone();
        REQUIRE(copy.IsOk());
        REQUIRE(copy.Unwrap().GetId() == 3);
        REQUIRE(copy.Unwrap().GetPrivateKey().ReadBytes().Unwrap() == pair.GetPrivateKey().ReadBytes().Unwrap());
    }
}
