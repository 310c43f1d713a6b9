#include "keyward/models/bundles/key_bundle.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "e2ee/key_bundle.pb.h"
#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>
#include <string>
namespace keyward::e2ee::models {
namespace {
std::vector<uint8_t> ToBytes(const std::string& field) {
    return std::vector<uint8_t>(field.begin(), field.end());
}
Result<Unit, KeywardFailure> ExpectSize(
    const std::string& field,
    const size_t expected,
    const std::string_view name) {
    if (field.size() != expected) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::Decode(
                compat::format("{} must be {} bytes, got {}", name, expected, field.size())));
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}
}
KeyBundle::KeyBundle(
    std::vector<uint8_t> identity_public_key,
    std::vector<uint8_t> identity_x25519_public_key,
    const uint32_t registration_id,
    const uint32_t signed_pre_key_id,
    std::vector<uint8_t> signed_pre_key_public,
    std::vector<uint8_t> signed_pre_key_signature,
    std::vector<OneTimePreKeyPublic> one_time_pre_keys,
    const Timestamp generated_at)
    : identity_public_key_(std::move(identity_public_key))
    , identity_x25519_public_key_(std::move(identity_x25519_public_key))
    , registration_id_(registration_id)
    , signed_pre_key_id_(signed_pre_key_id)
    , signed_pre_key_public_(std::move(signed_pre_key_public))
    , signed_pre_key_signature_(std::move(signed_pre_key_signature))
    , one_time_pre_keys_(std::move(one_time_pre_keys))
    , generated_at_(generated_at) {
}
Result<bool, KeywardFailure> KeyBundle::VerifySignedPreKey() const {
    return crypto::SodiumInterop::VerifyDetached(
        signed_pre_key_public_, signed_pre_key_signature_, identity_public_key_);
}
proto::e2ee::PublicKeyBundle KeyBundle::ToProto() const {
    proto::e2ee::PublicKeyBundle message;
    message.set_identity_public_key(identity_public_key_.data(), identity_public_key_.size());
    message.set_identity_x25519_public_key(identity_x25519_public_key_.data(), identity_x25519_public_key_.size());
    message.set_registration_id(registration_id_);
    auto* signed_pre_key = message.mutable_signed_pre_key();
    signed_pre_key->set_id(signed_pre_key_id_);
    signed_pre_key->set_public_key(signed_pre_key_public_.data(), signed_pre_key_public_.size());
    signed_pre_key->set_signature(signed_pre_key_signature_.data(), signed_pre_key_signature_.size());
    for (const auto& [id, public_key] : one_time_pre_keys_) {
        auto* entry = message.add_one_time_pre_keys();
        entry->set_id(id);
        entry->set_public_key(public_key.data(), public_key.size());
    }
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        generated_at_.time_since_epoch()).count();
    *message.mutable_generated_at() = google::protobuf::util::TimeUtil::MillisecondsToTimestamp(millis);
    return message;
}
Result<KeyBundle, KeywardFailure> KeyBundle::FromProto(const proto::e2ee::PublicKeyBundle& message) {
    if (auto check = ExpectSize(message.identity_public_key(), kEd25519PublicKeyBytes, "identity_public_key");
        check.IsErr()) {
        return Result<KeyBundle, KeywardFailure>::Err(std::move(check).UnwrapErr());
    }
    if (auto check = ExpectSize(message.identity_x25519_public_key(), kX25519PublicKeyBytes, "identity_x25519_public_key");
        check.IsErr()) {
        return Result<KeyBundle, KeywardFailure>::Err(std::move(check).UnwrapErr());
    }
    if (!message.has_signed_pre_key()) {
        return Result<KeyBundle, KeywardFailure>::Err(
            KeywardFailure::Decode("Bundle has no signed pre-key"));
    }
    const auto& signed_pre_key = message.signed_pre_key();
    if (auto check = ExpectSize(signed_pre_key.public_key(), kX25519PublicKeyBytes, "signed_pre_key.public_key");
        check.IsErr()) {
        return Result<KeyBundle, KeywardFailure>::Err(std::move(check).UnwrapErr());
    }
    if (auto check = ExpectSize(signed_pre_key.signature(), kEd25519SignatureBytes, "signed_pre_key.signature");
        check.IsErr()) {
        return Result<KeyBundle, KeywardFailure>::Err(std::move(check).UnwrapErr());
    }
    std::vector<OneTimePreKeyPublic> one_time_pre_keys;
    one_time_pre_keys.reserve(static_cast<size_t>(message.one_time_pre_keys_size()));
    for (const auto& entry : message.one_time_pre_keys()) {
        if (auto check = ExpectSize(entry.public_key(), kX25519PublicKeyBytes, "one_time_pre_key.public_key");
            check.IsErr()) {
            return Result<KeyBundle, KeywardFailure>::Err(std::move(check).UnwrapErr());
        }
        one_time_pre_keys.push_back(OneTimePreKeyPublic{entry.id(), ToBytes(entry.public_key())});
    }
    const auto millis = google::protobuf::util::TimeUtil::TimestampToMilliseconds(message.generated_at());
    return Result<KeyBundle, KeywardFailure>::Ok(KeyBundle(
        ToBytes(message.identity_public_key()),
        ToBytes(message.identity_x25519_public_key()),
        message.registration_id(),
        signed_pre_key.id(),
        ToBytes(signed_pre_key.public_key()),
        ToBytes(signed_pre_key.signature()),
        std::move(one_time_pre_keys),
        Timestamp(std::chrono::milliseconds(millis))));
}
Result<std::vector<uint8_t>, KeywardFailure> KeyBundle::Serialize() const {
    std::string serialized;
    if (!ToProto().SerializeToString(&serialized)) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Encode("Failed to serialize PublicKeyBundle"));
    }
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(ToBytes(serialized));
}
Result<KeyBundle, KeywardFailure> KeyBundle::Parse(std::span<const uint8_t> bytes) {
    proto::e2ee::PublicKeyBundle message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<KeyBundle, KeywardFailure>::Err(
            KeywardFailure::Decode("Failed to parse PublicKeyBundle"));
    }
    return FromProto(message);
}
}
