#include <catch2/catch_test_macros.hpp>
#include "keyward/models/bundles/key_bundle.hpp"
#include "keyward/crypto/key_material_factory.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "e2ee/key_bundle.pb.h"
using namespace keyward::e2ee;
using namespace keyward::e2ee::crypto;
using namespace keyward::e2ee::models;
namespace {
KeyBundle MakeBundle(size_t one_time_count) {
    auto identity = KeyMaterialFactory::GenerateIdentityKeyPair().Unwrap();
    auto signed_pre_key = KeyMaterialFactory::GenerateKeyPair<SignedPreKeyPurpose>(3).Unwrap();
    auto signature = KeyMaterialFactory::Sign(signed_pre_key.GetPublicKey().AsSpan(), identity.GetPrivateKey()).Unwrap();
    auto identity_x25519 = KeyMaterialFactory::IdentityAgreementPublicKey(identity.GetPublicKey()).Unwrap();
    std::vector<OneTimePreKeyPublic> one_time;
    auto batch = KeyMaterialFactory::GenerateBatch(static_cast<uint32_t>(one_time_count), 11).Unwrap();
    for (const auto& pair : batch) {
        one_time.push_back(OneTimePreKeyPublic{pair.GetId(), pair.GetPublicKey().GetBytesCopy()});
    }
    return KeyBundle(
        identity.GetPublicKey().GetBytesCopy(),
        identity_x25519,
        1234,
        signed_pre_key.GetId(),
        signed_pre_key.GetPublicKey().GetBytesCopy(),
        signature,
        std::move(one_time),
        std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now()));
}
}
TEST_CASE("KeyBundle - Signed pre-key verification", "[key_bundle]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto bundle = MakeBundle(2);
    SECTION("Genuine bundle verifies") {
        auto verified = bundle.VerifySignedPreKey();
        REQUIRE(verified.IsOk());
        REQUIRE(verified.Unwrap());
    }
    SECTION("Swapped signed pre-key does not verify") {
        auto proto = bundle.ToProto();
        std::string key = proto.signed_pre_key().public_key();
        key[0] = static_cast<char>(key[0] ^ 0x01);
        proto.mutable_signed_pre_key()->set_public_key(key);
        auto forged = KeyBundle::FromProto(proto);
        REQUIRE(forged.IsOk());
        REQUIRE_FALSE(forged.Unwrap().VerifySignedPreKey().Unwrap());
    }
}
TEST_CASE("KeyBundle - Wire format", "[key_bundle]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto bundle = MakeBundle(4);
    SECTION("Serialized bundle parses back to the same fields") {
        auto bytes = bundle.Serialize();
        REQUIRE(bytes.IsOk());
        auto parsed = KeyBundle::Parse(bytes.Unwrap());
        REQUIRE(parsed.IsOk());
        const auto& copy = parsed.Unwrap();
        REQUIRE(copy.GetIdentityPublicKey() == bundle.GetIdentityPublicKey());
        REQUIRE(copy.GetRegistrationId() == 1234);
        REQUIRE(copy.GetSignedPreKeyId() == 3);
        REQUIRE(copy.GetSignedPreKeySignature() == bundle.GetSignedPreKeySignature());
        REQUIRE(copy.GetOneTimePreKeyCount() == 4);
        REQUIRE(copy.GetOneTimePreKeys().front().id == 11);
        REQUIRE(copy.GetGeneratedAt() == bundle.GetGeneratedAt());
        REQUIRE(copy.VerifySignedPreKey().Unwrap());
    }
    SECTION("Bundle without one-time pre-keys") {
        auto empty = MakeBundle(0);
        auto parsed = KeyBundle::Parse(empty.Serialize().Unwrap());
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().GetOneTimePreKeyCount() == 0);
    }
    SECTION("Garbage bytes") {
        std::vector<uint8_t> garbage = {0xFF, 0xFF, 0xFF, 0xFF, 0x0F};
        auto parsed = KeyBundle::Parse(garbage);
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().type == KeywardFailureType::Decode);
    }
    SECTION("Truncated identity key") {
        auto proto = bundle.ToProto();
        proto.set_identity_public_key(proto.identity_public_key().substr(0, 31));
        auto result = KeyBundle::FromProto(proto);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == KeywardFailureType::Decode);
    }
    SECTION("Missing signed pre-key") {
        auto proto = bundle.ToProto();
        proto.clear_signed_pre_key();
        REQUIRE(KeyBundle::FromProto(proto).IsErr());
    }
    SECTION("Short one-time pre-key") {
        auto proto = bundle.ToProto();
        proto.mutable_one_time_pre_keys(1)->set_public_key("short");
        REQUIRE(KeyBundle::FromProto(proto).IsErr());
    }
}
