#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/models/records/identity_bundle_record.hpp"
#include <vector>
#include <cstdint>
#include <span>

namespace keyward::proto::e2ee {
class PublicKeyBundle;
}

namespace keyward::e2ee::models {

struct OneTimePreKeyPublic {
    uint32_t id;
    std::vector<uint8_t> public_key;
};

/**
 * Public-only bundle handed to the publication channel. Derived on demand
 * from the store, never persisted. Either complete or not produced at all.
 */
class KeyBundle {
public:
    KeyBundle(
        std::vector<uint8_t> identity_public_key,
        std::vector<uint8_t> identity_x25519_public_key,
        uint32_t registration_id,
        uint32_t signed_pre_key_id,
        std::vector<uint8_t> signed_pre_key_public,
        std::vector<uint8_t> signed_pre_key_signature,
        std::vector<OneTimePreKeyPublic> one_time_pre_keys,
        Timestamp generated_at);
    KeyBundle(const KeyBundle&) = default;
    KeyBundle(KeyBundle&&) noexcept = default;
    KeyBundle& operator=(const KeyBundle&) = default;
    KeyBundle& operator=(KeyBundle&&) noexcept = default;
    ~KeyBundle() = default;
    [[nodiscard]] const std::vector<uint8_t>& GetIdentityPublicKey() const noexcept {
        return identity_public_key_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetIdentityX25519PublicKey() const noexcept {
        return identity_x25519_public_key_;
    }
    [[nodiscard]] uint32_t GetRegistrationId() const noexcept {
        return registration_id_;
    }
    [[nodiscard]] uint32_t GetSignedPreKeyId() const noexcept {
        return signed_pre_key_id_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetSignedPreKeyPublic() const noexcept {
        return signed_pre_key_public_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetSignedPreKeySignature() const noexcept {
        return signed_pre_key_signature_;
    }
    [[nodiscard]] const std::vector<OneTimePreKeyPublic>& GetOneTimePreKeys() const noexcept {
        return one_time_pre_keys_;
    }
    [[nodiscard]] size_t GetOneTimePreKeyCount() const noexcept {
        return one_time_pre_keys_.size();
    }
    [[nodiscard]] Timestamp GetGeneratedAt() const noexcept {
        return generated_at_;
    }

    // Counterpart-side check: signed pre-key signature under the identity key
    [[nodiscard]] Result<bool, KeywardFailure> VerifySignedPreKey() const;

    [[nodiscard]] proto::e2ee::PublicKeyBundle ToProto() const;
    [[nodiscard]] static Result<KeyBundle, KeywardFailure> FromProto(const proto::e2ee::PublicKeyBundle& message);

    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> Serialize() const;
    [[nodiscard]] static Result<KeyBundle, KeywardFailure> Parse(std::span<const uint8_t> bytes);
private:
    std::vector<uint8_t> identity_public_key_;
    std::vector<uint8_t> identity_x25519_public_key_;
    uint32_t registration_id_;
    uint32_t signed_pre_key_id_;
    std::vector<uint8_t> signed_pre_key_public_;
    std::vector<uint8_t> signed_pre_key_signature_;
    std::vector<OneTimePreKeyPublic> one_time_pre_keys_;
    Timestamp generated_at_;
};
}
