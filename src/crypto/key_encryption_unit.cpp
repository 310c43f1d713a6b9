#include "keyward/crypto/key_encryption_unit.hpp"
#include "keyward/crypto/aes_gcm.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/core/log.hpp"

#include <algorithm>

namespace keyward::e2ee::crypto {

namespace {

void DiscardPlaintext(std::vector<uint8_t>& buffer) {
    if (SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsErr()) {
        std::fill(buffer.begin(), buffer.end(), uint8_t{0});
    }
}

// The GCM tag covers the version byte as well as the caller's context
std::vector<uint8_t> BindHeader(const uint8_t version, std::span<const uint8_t> associated_data) {
    std::vector<uint8_t> bound;
    bound.reserve(kSealedKeyVersionBytes + associated_data.size());
    bound.push_back(version);
    bound.insert(bound.end(), associated_data.begin(), associated_data.end());
    return bound;
}

}

KeywardFailure KeyEncryptionUnit::RejectSealedKey(std::string message) {
    authentication_failures_.fetch_add(1, std::memory_order_relaxed);
    log::Get(log::CRYPTO_LOGGER)->error("Sealed key rejected: {}", message);
    return KeywardFailure::Authentication(std::move(message));
}

KeyEncryptionUnit::KeyEncryptionUnit(SecureMemoryHandle master_key)
    : master_key_(std::move(master_key)) {
}

Result<std::unique_ptr<KeyEncryptionUnit>, KeywardFailure>
KeyEncryptionUnit::Create(interfaces::IMasterKeyProvider& provider) {
    using ResultType = Result<std::unique_ptr<KeyEncryptionUnit>, KeywardFailure>;

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return ResultType::Err(KeywardFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto key_result = provider.GetMasterKey();
    if (key_result.IsErr()) {
        log::Get(log::CRYPTO_LOGGER)->error(
            "Master key provider failed: {}", key_result.UnwrapErr().message);
        return ResultType::Err(std::move(key_result).UnwrapErr());
    }
    SecureMemoryHandle master_key = std::move(key_result).Unwrap();
    if (master_key.Size() != kMasterKeyBytes) {
        return ResultType::Err(KeywardFailure::InvalidInput(
            compat::format("Master key must be {} bytes, got {}", kMasterKeyBytes, master_key.Size())));
    }
    return ResultType::Ok(std::unique_ptr<KeyEncryptionUnit>(new KeyEncryptionUnit(std::move(master_key))));
}

Result<std::unique_ptr<KeyEncryptionUnit>, KeywardFailure>
KeyEncryptionUnit::CreateWithMasterKey(std::span<const uint8_t> master_key) {
    using ResultType = Result<std::unique_ptr<KeyEncryptionUnit>, KeywardFailure>;

    if (master_key.size() != kMasterKeyBytes) {
        return ResultType::Err(KeywardFailure::InvalidInput(
            compat::format("Master key must be {} bytes, got {}", kMasterKeyBytes, master_key.size())));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return ResultType::Err(KeywardFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto handle = SecureMemoryHandle::FromBytes(master_key);
    if (handle.IsErr()) {
        return ResultType::Err(KeywardFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return ResultType::Ok(std::unique_ptr<KeyEncryptionUnit>(
        new KeyEncryptionUnit(std::move(handle).Unwrap())));
}

Result<std::unique_ptr<KeyEncryptionUnit>, KeywardFailure>
KeyEncryptionUnit::CreateEphemeral(const configuration::KeyManagerConfig& config) {
    using ResultType = Result<std::unique_ptr<KeyEncryptionUnit>, KeywardFailure>;

    if (!config.allow_ephemeral_master_key) {
        log::Get(log::CRYPTO_LOGGER)->error(
            "No master key injected and ephemeral master keys are disabled; refusing to start");
        return ResultType::Err(KeywardFailure::InvalidState(
            "Ephemeral master key not allowed by configuration; inject a master key"));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return ResultType::Err(KeywardFailure::KeyGeneration(init.UnwrapErr().message));
    }
    auto handle_result = SecureMemoryHandle::Allocate(kMasterKeyBytes);
    if (handle_result.IsErr()) {
        return ResultType::Err(KeywardFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();
    auto fill = handle.WithWriteAccess([](std::span<uint8_t> key) {
        randombytes_buf(key.data(), key.size());
        return unit;
    });
    if (fill.IsErr()) {
        return ResultType::Err(KeywardFailure::FromSodiumFailure(fill.UnwrapErr()));
    }
    log::Get(log::CRYPTO_LOGGER)->warn(
        "Using an ephemeral master key; sealed keys will not survive a restart");
    return ResultType::Ok(std::unique_ptr<KeyEncryptionUnit>(new KeyEncryptionUnit(std::move(handle))));
}

Result<std::vector<uint8_t>, KeywardFailure> KeyEncryptionUnit::Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    using ResultType = Result<std::vector<uint8_t>, KeywardFailure>;

    const uint64_t previous = encryptions_.fetch_add(1, std::memory_order_relaxed);
    if (previous >= kMaxEncryptionsPerMasterKey) {
        encryptions_.fetch_sub(1, std::memory_order_relaxed);
        log::Get(log::CRYPTO_LOGGER)->error("Master key reached its encryption limit; rotate it");
        return ResultType::Err(KeywardFailure::InvalidState(
            "Master key encryption limit reached (2^32); master key rotation required"));
    }

    const std::vector<uint8_t> nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
    auto sealed = master_key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return AesGcm::Encrypt(key, nonce, plaintext, BindHeader(kSealedKeyVersion, associated_data));
    });
    if (sealed.IsErr()) {
        return ResultType::Err(KeywardFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    auto ciphertext_result = std::move(sealed).Unwrap();
    if (ciphertext_result.IsErr()) {
        return ciphertext_result;
    }
    const std::vector<uint8_t> ciphertext_with_tag = std::move(ciphertext_result).Unwrap();
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;

    std::vector<uint8_t> blob;
    blob.reserve(kSealedKeyHeaderBytes + ciphertext_len);
    blob.push_back(kSealedKeyVersion);
    blob.insert(blob.end(), nonce.begin(), nonce.end());
    blob.insert(blob.end(), ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                ciphertext_with_tag.end());
    blob.insert(blob.end(), ciphertext_with_tag.begin(),
                ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len));
    return ResultType::Ok(std::move(blob));
}

Result<std::vector<uint8_t>, KeywardFailure> KeyEncryptionUnit::Encrypt(
    const SecureMemoryHandle& plaintext,
    std::span<const uint8_t> associated_data) {
    auto sealed = plaintext.WithReadAccess([&](std::span<const uint8_t> bytes) {
        return Encrypt(bytes, associated_data);
    });
    if (sealed.IsErr()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    return std::move(sealed).Unwrap();
}

Result<SecureMemoryHandle, KeywardFailure> KeyEncryptionUnit::Decrypt(
    std::span<const uint8_t> sealed,
    std::span<const uint8_t> associated_data) {
    using ResultType = Result<SecureMemoryHandle, KeywardFailure>;

    // A short or unknown header is indistinguishable from tampering
    if (sealed.size() < kSealedKeyHeaderBytes) {
        return ResultType::Err(RejectSealedKey(
            compat::format("{}: {} bytes, header is {}",
                ErrorMessages::SEALED_KEY_TOO_SMALL, sealed.size(), kSealedKeyHeaderBytes)));
    }
    if (sealed[0] != kSealedKeyVersion) {
        return ResultType::Err(RejectSealedKey(
            compat::format("Unsupported sealed key version {}", sealed[0])));
    }

    const auto nonce = sealed.subspan(kSealedKeyVersionBytes, kAesGcmNonceBytes);
    const auto tag = sealed.subspan(kSealedKeyVersionBytes + kAesGcmNonceBytes, kAesGcmTagBytes);
    const auto ciphertext = sealed.subspan(kSealedKeyHeaderBytes);

    std::vector<uint8_t> ciphertext_with_tag;
    ciphertext_with_tag.reserve(ciphertext.size() + tag.size());
    ciphertext_with_tag.insert(ciphertext_with_tag.end(), ciphertext.begin(), ciphertext.end());
    ciphertext_with_tag.insert(ciphertext_with_tag.end(), tag.begin(), tag.end());

    decryptions_.fetch_add(1, std::memory_order_relaxed);
    auto opened = master_key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return AesGcm::Decrypt(key, nonce, ciphertext_with_tag, BindHeader(sealed[0], associated_data));
    });
    if (opened.IsErr()) {
        return ResultType::Err(KeywardFailure::FromSodiumFailure(opened.UnwrapErr()));
    }
    auto plaintext_result = std::move(opened).Unwrap();
    if (plaintext_result.IsErr()) {
        KeywardFailure failure = std::move(plaintext_result).UnwrapErr();
        if (failure.Is(KeywardFailureType::Authentication)) {
            return ResultType::Err(RejectSealedKey("tag mismatch; record tampered or corrupt"));
        }
        return ResultType::Err(std::move(failure));
    }

    std::vector<uint8_t> plaintext = std::move(plaintext_result).Unwrap();
    if (plaintext.empty()) {
        return ResultType::Err(KeywardFailure::Decode("Sealed key carries no key material"));
    }
    auto handle = SecureMemoryHandle::FromBytes(plaintext);
    DiscardPlaintext(plaintext);
    if (handle.IsErr()) {
        return ResultType::Err(KeywardFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return ResultType::Ok(std::move(handle).Unwrap());
}

KeyEncryptionStatistics KeyEncryptionUnit::GetStatistics() const noexcept {
    return KeyEncryptionStatistics{
        .encryptions = encryptions_.load(std::memory_order_relaxed),
        .decryptions = decryptions_.load(std::memory_order_relaxed),
        .authentication_failures = authentication_failures_.load(std::memory_order_relaxed)};
}

}
