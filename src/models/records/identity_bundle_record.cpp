#include "keyward/models/records/identity_bundle_record.hpp"
namespace keyward::e2ee::models {
IdentityBundleRecord::IdentityBundleRecord(
    std::vector<uint8_t> identity_public_key,
    std::vector<uint8_t> encrypted_identity_private_key,
    const uint32_t registration_id,
    const Timestamp created_at)
    : identity_public_key_(std::move(identity_public_key))
    , encrypted_identity_private_key_(std::move(encrypted_identity_private_key))
    , registration_id_(registration_id)
    , created_at_(created_at) {
}
}
