#pragma once
#include "keyward/models/records/identity_bundle_record.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace keyward::e2ee::models {
class OneTimePreKeyRecord {
public:
    OneTimePreKeyRecord(
        uint32_t id,
        std::vector<uint8_t> public_key,
        std::vector<uint8_t> encrypted_private_key,
        Timestamp created_at,
        bool used = false);
    OneTimePreKeyRecord(const OneTimePreKeyRecord&) = default;
    OneTimePreKeyRecord(OneTimePreKeyRecord&&) noexcept = default;
    OneTimePreKeyRecord& operator=(const OneTimePreKeyRecord&) = default;
    OneTimePreKeyRecord& operator=(OneTimePreKeyRecord&&) noexcept = default;
    ~OneTimePreKeyRecord() = default;
    [[nodiscard]] uint32_t GetId() const noexcept {
        return id_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] std::span<const uint8_t> GetPublicKeySpan() const noexcept {
        return public_key_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetEncryptedPrivateKey() const noexcept {
        return encrypted_private_key_;
    }
    [[nodiscard]] Timestamp GetCreatedAt() const noexcept {
        return created_at_;
    }
    [[nodiscard]] bool IsUsed() const noexcept {
        return used_;
    }
    void MarkUsed() noexcept {
        used_ = true;
    }
private:
    uint32_t id_;
    std::vector<uint8_t> public_key_;
    std::vector<uint8_t> encrypted_private_key_;
    Timestamp created_at_;
    bool used_;
};
}
