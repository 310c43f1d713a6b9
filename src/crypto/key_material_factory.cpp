#include "keyward/crypto/key_material_factory.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/core/log.hpp"

namespace keyward::e2ee::crypto {

Result<Unit, KeywardFailure> KeyMaterialFactory::EnsureEntropy() {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        log::Get(log::CRYPTO_LOGGER)->critical("CSPRNG unavailable: {}", init.UnwrapErr().message);
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::KeyGeneration(init.UnwrapErr().message));
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}

KeywardFailure KeyMaterialFactory::AsGenerationFailure(KeywardFailure failure) {
    if (failure.type == KeywardFailureType::KeyGeneration) {
        return failure;
    }
    return KeywardFailure::KeyGeneration(std::move(failure.message));
}

Result<models::IdentityKeyPair, KeywardFailure> KeyMaterialFactory::GenerateIdentityKeyPair() {
    using ResultType = Result<models::IdentityKeyPair, KeywardFailure>;

    if (auto ready = EnsureEntropy(); ready.IsErr()) {
        return ResultType::Err(std::move(ready).UnwrapErr());
    }
    auto generated = SodiumInterop::GenerateEd25519KeyPair();
    if (generated.IsErr()) {
        return ResultType::Err(AsGenerationFailure(std::move(generated).UnwrapErr()));
    }
    auto [secret_handle, public_bytes] = std::move(generated).Unwrap();

    auto public_key = models::IdentityPublicKey::FromBytes(public_bytes);
    if (public_key.IsErr()) {
        return ResultType::Err(AsGenerationFailure(std::move(public_key).UnwrapErr()));
    }
    auto private_key = models::IdentityPrivateKey::FromHandle(std::move(secret_handle));
    if (private_key.IsErr()) {
        return ResultType::Err(AsGenerationFailure(std::move(private_key).UnwrapErr()));
    }
    return ResultType::Ok(models::IdentityKeyPair(
        0, std::move(public_key).Unwrap(), std::move(private_key).Unwrap()));
}

Result<std::vector<models::OneTimePreKeyPair>, KeywardFailure>
KeyMaterialFactory::GenerateBatch(const uint32_t count, const uint32_t first_id) {
    using ResultType = Result<std::vector<models::OneTimePreKeyPair>, KeywardFailure>;

    if (count > kMaxPreKeyBatchSize) {
        return ResultType::Err(KeywardFailure::InvalidInput(
            compat::format("Batch of {} exceeds maximum {}", count, kMaxPreKeyBatchSize)));
    }
    if (count > 0 && first_id > UINT32_MAX - (count - 1)) {
        return ResultType::Err(KeywardFailure::InvalidInput("Pre-key id space exhausted"));
    }

    std::vector<models::OneTimePreKeyPair> batch;
    batch.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        auto pair = GenerateKeyPair<models::OneTimePreKeyPurpose>(first_id + i);
        if (pair.IsErr()) {
            return ResultType::Err(std::move(pair).UnwrapErr());
        }
        batch.push_back(std::move(pair).Unwrap());
    }
    return ResultType::Ok(std::move(batch));
}

Result<std::vector<uint8_t>, KeywardFailure> KeyMaterialFactory::Sign(
    std::span<const uint8_t> message,
    const models::IdentityPrivateKey& signing_key) {

    auto signed_result = signing_key.GetHandle().WithReadAccess(
        [&message](std::span<const uint8_t> secret_key) {
            return SodiumInterop::SignDetached(message, secret_key);
        });
    if (signed_result.IsErr()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("Signing key unusable: {}", signed_result.UnwrapErr().message)));
    }
    return std::move(signed_result).Unwrap();
}

Result<bool, KeywardFailure> KeyMaterialFactory::Verify(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature,
    const models::IdentityPublicKey& verifying_key) {
    return SodiumInterop::VerifyDetached(message, signature, verifying_key.AsSpan());
}

uint32_t KeyMaterialFactory::GenerateRegistrationId() {
    return kMinRegistrationId +
           SodiumInterop::RandomUniform(kMaxRegistrationId - kMinRegistrationId + 1);
}

Result<std::vector<uint8_t>, KeywardFailure> KeyMaterialFactory::IdentityAgreementPublicKey(
    const models::IdentityPublicKey& identity_public_key) {
    return SodiumInterop::Ed25519PublicKeyToX25519(identity_public_key.AsSpan());
}

Result<SecureMemoryHandle, KeywardFailure> KeyMaterialFactory::IdentityAgreementPrivateKey(
    const models::IdentityPrivateKey& identity_private_key) {
    auto converted = identity_private_key.GetHandle().WithReadAccess(
        [](std::span<const uint8_t> secret_key) {
            return SodiumInterop::Ed25519SecretKeyToX25519(secret_key);
        });
    if (converted.IsErr()) {
        return Result<SecureMemoryHandle, KeywardFailure>::Err(
            KeywardFailure::FromSodiumFailure(converted.UnwrapErr()));
    }
    return std::move(converted).Unwrap();
}

}
