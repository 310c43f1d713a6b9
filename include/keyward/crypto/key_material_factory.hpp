#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/crypto/sodium_secure_memory_handle.hpp"
#include "keyward/models/keys/typed_keys.hpp"

#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace keyward::e2ee::crypto {

/**
 * @brief Stateless generator of Curve25519 key material
 *
 * Identity keys are Ed25519 (signing form) and can be converted to X25519
 * for Diffie-Hellman. Signed and one-time pre-keys are X25519.
 *
 * Entropy comes from libsodium's CSPRNG. Any generation failure is reported
 * as KeyGeneration, which callers treat as fatal.
 */
class KeyMaterialFactory {
public:
    [[nodiscard]] static Result<models::IdentityKeyPair, KeywardFailure> GenerateIdentityKeyPair();

    template<typename Purpose>
    [[nodiscard]] static Result<models::KeyPair<Purpose>, KeywardFailure> GenerateKeyPair(uint32_t id = 0) {
        static_assert(!std::is_same_v<Purpose, models::IdentityPurpose>,
                      "identity keys are Ed25519; use GenerateIdentityKeyPair()");
        using ResultType = Result<models::KeyPair<Purpose>, KeywardFailure>;

        if (auto ready = EnsureEntropy(); ready.IsErr()) {
            return ResultType::Err(std::move(ready).UnwrapErr());
        }
        auto generated = SodiumInterop::GenerateX25519KeyPair(Purpose::kName);
        if (generated.IsErr()) {
            return ResultType::Err(AsGenerationFailure(std::move(generated).UnwrapErr()));
        }
        auto [secret_handle, public_bytes] = std::move(generated).Unwrap();

        auto public_key = models::PublicKey<Purpose>::FromBytes(public_bytes);
        if (public_key.IsErr()) {
            return ResultType::Err(AsGenerationFailure(std::move(public_key).UnwrapErr()));
        }
        auto private_key = models::PrivateKey<Purpose>::FromHandle(std::move(secret_handle));
        if (private_key.IsErr()) {
            return ResultType::Err(AsGenerationFailure(std::move(private_key).UnwrapErr()));
        }
        return ResultType::Ok(models::KeyPair<Purpose>(
            id, std::move(public_key).Unwrap(), std::move(private_key).Unwrap()));
    }

    /**
     * @brief Generate @p count one-time pre-keys with ids first_id, first_id+1, ...
     *
     * A count of zero yields an empty batch. Either every key is generated
     * or the call fails.
     */
    [[nodiscard]] static Result<std::vector<models::OneTimePreKeyPair>, KeywardFailure>
    GenerateBatch(uint32_t count, uint32_t first_id = 1);

    /**
     * @brief Ed25519 signature over @p message under the identity key
     *
     * Deterministic: signing the same message twice yields the same bytes.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, KeywardFailure> Sign(
        std::span<const uint8_t> message,
        const models::IdentityPrivateKey& signing_key);

    [[nodiscard]] static Result<bool, KeywardFailure> Verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature,
        const models::IdentityPublicKey& verifying_key);

    /**
     * @brief 14-bit registration id, uniform in [1, 16383]
     */
    [[nodiscard]] static uint32_t GenerateRegistrationId();

    // X25519 forms of the identity key, for the X3DH DH computations
    [[nodiscard]] static Result<std::vector<uint8_t>, KeywardFailure> IdentityAgreementPublicKey(
        const models::IdentityPublicKey& identity_public_key);

    [[nodiscard]] static Result<SecureMemoryHandle, KeywardFailure> IdentityAgreementPrivateKey(
        const models::IdentityPrivateKey& identity_private_key);

private:
    static Result<Unit, KeywardFailure> EnsureEntropy();
    static KeywardFailure AsGenerationFailure(KeywardFailure failure);

    KeyMaterialFactory() = delete;
};

}
