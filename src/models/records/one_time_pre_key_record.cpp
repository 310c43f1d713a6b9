#include "keyward/models/records/one_time_pre_key_record.hpp"
namespace keyward::e2ee::models {
OneTimePreKeyRecord::OneTimePreKeyRecord(
    const uint32_t id,
    std::vector<uint8_t> public_key,
    std::vector<uint8_t> encrypted_private_key,
    const Timestamp created_at,
    const bool used)
    : id_(id)
    , public_key_(std::move(public_key))
    , encrypted_private_key_(std::move(encrypted_private_key))
    , created_at_(created_at)
    , used_(used) {
}
}
