#pragma once
#include <vector>
#include <cstdint>
#include <chrono>
#include <span>
namespace keyward::e2ee::models {
using Timestamp = std::chrono::system_clock::time_point;
class IdentityBundleRecord {
public:
    IdentityBundleRecord(
        std::vector<uint8_t> identity_public_key,
        std::vector<uint8_t> encrypted_identity_private_key,
        uint32_t registration_id,
        Timestamp created_at);
    IdentityBundleRecord(const IdentityBundleRecord&) = default;
    IdentityBundleRecord(IdentityBundleRecord&&) noexcept = default;
    IdentityBundleRecord& operator=(const IdentityBundleRecord&) = default;
    IdentityBundleRecord& operator=(IdentityBundleRecord&&) noexcept = default;
    ~IdentityBundleRecord() = default;
    [[nodiscard]] const std::vector<uint8_t>& GetIdentityPublicKey() const noexcept {
        return identity_public_key_;
    }
    [[nodiscard]] std::span<const uint8_t> GetIdentityPublicKeySpan() const noexcept {
        return identity_public_key_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetEncryptedIdentityPrivateKey() const noexcept {
        return encrypted_identity_private_key_;
    }
    [[nodiscard]] uint32_t GetRegistrationId() const noexcept {
        return registration_id_;
    }
    [[nodiscard]] Timestamp GetCreatedAt() const noexcept {
        return created_at_;
    }
private:
    std::vector<uint8_t> identity_public_key_;
    std::vector<uint8_t> encrypted_identity_private_key_;
    uint32_t registration_id_;
    Timestamp created_at_;
};
}
