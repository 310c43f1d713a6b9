#pragma once
#include "keyward/models/records/identity_bundle_record.hpp"
#include <vector>
#include <cstdint>
#include <chrono>
#include <optional>
#include <span>
namespace keyward::e2ee::models {
/**
 * Persisted signed pre-key. At most one record per account is active;
 * superseded records stay readable for the grace period counted from the
 * moment they were replaced, then get pruned.
 */
class SignedPreKeyRecord {
public:
    SignedPreKeyRecord(
        uint32_t id,
        std::vector<uint8_t> public_key,
        std::vector<uint8_t> encrypted_private_key,
        std::vector<uint8_t> signature,
        Timestamp created_at,
        std::chrono::seconds rotation_interval,
        bool active = true,
        std::optional<Timestamp> superseded_at = std::nullopt);
    SignedPreKeyRecord(const SignedPreKeyRecord&) = default;
    SignedPreKeyRecord(SignedPreKeyRecord&&) noexcept = default;
    SignedPreKeyRecord& operator=(const SignedPreKeyRecord&) = default;
    SignedPreKeyRecord& operator=(SignedPreKeyRecord&&) noexcept = default;
    ~SignedPreKeyRecord() = default;
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
    [[nodiscard]] const std::vector<uint8_t>& GetSignature() const noexcept {
        return signature_;
    }
    [[nodiscard]] Timestamp GetCreatedAt() const noexcept {
        return created_at_;
    }
    [[nodiscard]] std::chrono::seconds GetRotationInterval() const noexcept {
        return rotation_interval_;
    }
    [[nodiscard]] Timestamp GetNextRotationAt() const noexcept {
        return created_at_ + rotation_interval_;
    }
    [[nodiscard]] bool IsActive() const noexcept {
        return active_;
    }
    [[nodiscard]] bool IsDueForRotation(Timestamp now) const noexcept;
    // Unset while active
    [[nodiscard]] const std::optional<Timestamp>& GetSupersededAt() const noexcept {
        return superseded_at_;
    }
    /**
     * Start of the grace window: the replacement time, or the scheduled
     * rotation time for inactive rows written before that was recorded.
     */
    [[nodiscard]] Timestamp GetGraceStartsAt() const noexcept {
        return superseded_at_.value_or(GetNextRotationAt());
    }
    // Superseded records are usable for in-flight handshakes until superseded_at + grace
    [[nodiscard]] bool IsWithinGracePeriod(Timestamp now, std::chrono::seconds grace_period) const noexcept;
    void Activate() noexcept {
        active_ = true;
        superseded_at_.reset();
    }
    void Supersede(const Timestamp at) noexcept {
        active_ = false;
        superseded_at_ = at;
    }
private:
    uint32_t id_;
    std::vector<uint8_t> public_key_;
    std::vector<uint8_t> encrypted_private_key_;
    std::vector<uint8_t> signature_;
    Timestamp created_at_;
    std::chrono::seconds rotation_interval_;
    bool active_;
    std::optional<Timestamp> superseded_at_;
};
}
