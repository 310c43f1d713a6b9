#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/crypto/sodium_secure_memory_handle.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace keyward::e2ee::models {

/**
 * Purpose tags. A key carries its purpose in its type so an identity key
 * cannot be handed to an operation expecting a pre-key, and vice versa.
 */
struct IdentityPurpose {
    static constexpr std::string_view kName = kPurposeIdentity;
    static constexpr size_t kPublicKeyBytes = kEd25519PublicKeyBytes;
    static constexpr size_t kPrivateKeyBytes = kEd25519SecretKeyBytes;
};

struct SignedPreKeyPurpose {
    static constexpr std::string_view kName = kPurposeSignedPreKey;
    static constexpr size_t kPublicKeyBytes = kX25519PublicKeyBytes;
    static constexpr size_t kPrivateKeyBytes = kX25519PrivateKeyBytes;
};

struct OneTimePreKeyPurpose {
    static constexpr std::string_view kName = kPurposeOneTimePreKey;
    static constexpr size_t kPublicKeyBytes = kX25519PublicKeyBytes;
    static constexpr size_t kPrivateKeyBytes = kX25519PrivateKeyBytes;
};

template<typename Purpose>
class PublicKey {
public:
    static Result<PublicKey, KeywardFailure> FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.size() != Purpose::kPublicKeyBytes) {
            return Result<PublicKey, KeywardFailure>::Err(
                KeywardFailure::InvalidInput(
                    compat::format("{} public key must be {} bytes, got {}",
                        Purpose::kName, Purpose::kPublicKeyBytes, bytes.size())));
        }
        return Result<PublicKey, KeywardFailure>::Ok(
            PublicKey(std::vector<uint8_t>(bytes.begin(), bytes.end())));
    }

    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept { return bytes_; }
    [[nodiscard]] std::vector<uint8_t> GetBytesCopy() const { return bytes_; }

    bool operator==(const PublicKey& other) const { return bytes_ == other.bytes_; }

private:
    explicit PublicKey(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    std::vector<uint8_t> bytes_;
};

/**
 * Private half of a key pair, resident only in secure memory.
 * Move-only; copies are explicit through Clone().
 */
template<typename Purpose>
class PrivateKey {
public:
    static Result<PrivateKey, KeywardFailure> FromHandle(crypto::SecureMemoryHandle handle) {
        if (handle.IsInvalid() || handle.Size() != Purpose::kPrivateKeyBytes) {
            return Result<PrivateKey, KeywardFailure>::Err(
                KeywardFailure::InvalidInput(
                    compat::format("{} private key must be {} bytes, got {}",
                        Purpose::kName, Purpose::kPrivateKeyBytes, handle.Size())));
        }
        return Result<PrivateKey, KeywardFailure>::Ok(PrivateKey(std::move(handle)));
    }

    PrivateKey(PrivateKey&&) noexcept = default;
    PrivateKey& operator=(PrivateKey&&) noexcept = default;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    [[nodiscard]] Result<PrivateKey, KeywardFailure> Clone() const {
        auto copy = handle_.Clone();
        if (copy.IsErr()) {
            return Result<PrivateKey, KeywardFailure>::Err(
                KeywardFailure::FromSodiumFailure(copy.UnwrapErr()));
        }
        return Result<PrivateKey, KeywardFailure>::Ok(PrivateKey(std::move(copy).Unwrap()));
    }

    [[nodiscard]] const crypto::SecureMemoryHandle& GetHandle() const noexcept { return handle_; }

    // The returned bytes are ordinary heap memory; wipe them after use.
    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> ReadBytes() const {
        auto bytes = handle_.ReadBytes(handle_.Size());
        if (bytes.IsErr()) {
            return Result<std::vector<uint8_t>, KeywardFailure>::Err(
                KeywardFailure::FromSodiumFailure(bytes.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(bytes).Unwrap());
    }

private:
    explicit PrivateKey(crypto::SecureMemoryHandle handle) : handle_(std::move(handle)) {}

    crypto::SecureMemoryHandle handle_;
};

template<typename Purpose>
class KeyPair {
public:
    KeyPair(const uint32_t id, PublicKey<Purpose> public_key, PrivateKey<Purpose> private_key)
        : id_(id)
        , public_key_(std::move(public_key))
        , private_key_(std::move(private_key)) {}

    KeyPair(KeyPair&&) noexcept = default;
    KeyPair& operator=(KeyPair&&) noexcept = default;
    KeyPair(const KeyPair&) = delete;
    KeyPair& operator=(const KeyPair&) = delete;

    // Identity key pairs carry id 0; pre-keys carry their store id.
    [[nodiscard]] uint32_t GetId() const noexcept { return id_; }
    [[nodiscard]] const PublicKey<Purpose>& GetPublicKey() const noexcept { return public_key_; }
    [[nodiscard]] const PrivateKey<Purpose>& GetPrivateKey() const noexcept { return private_key_; }

    [[nodiscard]] Result<KeyPair, KeywardFailure> Clone() const {
        auto private_copy = private_key_.Clone();
        if (private_copy.IsErr()) {
            return Result<KeyPair, KeywardFailure>::Err(std::move(private_copy).UnwrapErr());
        }
        return Result<KeyPair, KeywardFailure>::Ok(
            KeyPair(id_, public_key_, std::move(private_copy).Unwrap()));
    }

private:
    uint32_t id_;
    PublicKey<Purpose> public_key_;
    PrivateKey<Purpose> private_key_;
};

using IdentityPublicKey = PublicKey<IdentityPurpose>;
using IdentityPrivateKey = PrivateKey<IdentityPurpose>;
using IdentityKeyPair = KeyPair<IdentityPurpose>;

using SignedPreKeyPublicKey = PublicKey<SignedPreKeyPurpose>;
using SignedPreKeyPrivateKey = PrivateKey<SignedPreKeyPurpose>;
using SignedPreKeyPair = KeyPair<SignedPreKeyPurpose>;

using OneTimePreKeyPublicKey = PublicKey<OneTimePreKeyPurpose>;
using OneTimePreKeyPrivateKey = PrivateKey<OneTimePreKeyPurpose>;
using OneTimePreKeyPair = KeyPair<OneTimePreKeyPurpose>;

}
