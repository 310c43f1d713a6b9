#include "keyward/models/records/signed_pre_key_record.hpp"
namespace keyward::e2ee::models {
SignedPreKeyRecord::SignedPreKeyRecord(
    const uint32_t id,
    std::vector<uint8_t> public_key,
    std::vector<uint8_t> encrypted_private_key,
    std::vector<uint8_t> signature,
    const Timestamp created_at,
    const std::chrono::seconds rotation_interval,
    const bool active,
    const std::optional<Timestamp> superseded_at)
    : id_(id)
    , public_key_(std::move(public_key))
    , encrypted_private_key_(std::move(encrypted_private_key))
    , signature_(std::move(signature))
    , created_at_(created_at)
    , rotation_interval_(rotation_interval)
    , active_(active)
    , superseded_at_(active ? std::optional<Timestamp>{} : superseded_at) {
}
bool SignedPreKeyRecord::IsDueForRotation(const Timestamp now) const noexcept {
    return now >= GetNextRotationAt();
}
bool SignedPreKeyRecord::IsWithinGracePeriod(
    const Timestamp now,
    const std::chrono::seconds grace_period) const noexcept {
    if (active_) {
        return true;
    }
    return now < GetGraceStartsAt() + grace_period;
}
}
