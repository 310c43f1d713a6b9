#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/crypto/sodium_secure_memory_handle.hpp"
#include "keyward/core/format.hpp"

#include <cstring>

namespace keyward::e2ee::crypto {

namespace {

template<typename T>
Result<T, KeywardFailure> FromSodium(const SodiumFailure& failure) {
    return Result<T, KeywardFailure>::Err(KeywardFailure::FromSodiumFailure(failure));
}

}

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > SodiumConstants::MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                compat::format("Buffer size {} exceeds maximum {}",
                    buffer.size(), SodiumConstants::MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= SodiumConstants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<const uint8_t> buffer) {
    return SecureWipe(std::span<uint8_t>(
        const_cast<uint8_t*>(buffer.data()),
        buffer.size()));
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                compat::format("{}: {}", ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED,
                    ErrorMessages::NOT_INITIALIZED)));
    }

    return Result<bool, SodiumFailure>::Ok(sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

// ============================================================================
// Key Generation
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, KeywardFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using ResultType = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, KeywardFailure>;

    if (!IsInitialized()) {
        return ResultType::Err(KeywardFailure::KeyGeneration(
            compat::format("Cannot generate {} key pair: {}", key_purpose,
                ErrorMessages::NOT_INITIALIZED)));
    }

    auto sk_handle_result = SecureMemoryHandle::Allocate(kX25519PrivateKeyBytes);
    if (sk_handle_result.IsErr()) {
        return FromSodium<ResultType::value_type>(sk_handle_result.UnwrapErr());
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk_bytes(kX25519PublicKeyBytes);
    auto derive_result = sk_handle.WithWriteAccess([&pk_bytes](std::span<uint8_t> sk) {
        randombytes_buf(sk.data(), sk.size());
        return crypto_scalarmult_base(pk_bytes.data(), sk.data());
    });
    if (derive_result.IsErr()) {
        return FromSodium<ResultType::value_type>(derive_result.UnwrapErr());
    }
    if (derive_result.Unwrap() != SodiumConstants::SUCCESS) {
        return ResultType::Err(KeywardFailure::KeyGeneration(
            compat::format("Failed to derive {} public key", key_purpose)));
    }

    return ResultType::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, KeywardFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    using ResultType = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, KeywardFailure>;

    if (!IsInitialized()) {
        return ResultType::Err(KeywardFailure::KeyGeneration(
            compat::format("Cannot generate Ed25519 key pair: {}", ErrorMessages::NOT_INITIALIZED)));
    }

    auto sk_handle_result = SecureMemoryHandle::Allocate(kEd25519SecretKeyBytes);
    if (sk_handle_result.IsErr()) {
        return FromSodium<ResultType::value_type>(sk_handle_result.UnwrapErr());
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk(kEd25519PublicKeyBytes);
    auto keypair_result = sk_handle.WithWriteAccess([&pk](std::span<uint8_t> sk) {
        return crypto_sign_keypair(pk.data(), sk.data());
    });
    if (keypair_result.IsErr()) {
        return FromSodium<ResultType::value_type>(keypair_result.UnwrapErr());
    }
    if (keypair_result.Unwrap() != SodiumConstants::SUCCESS) {
        return ResultType::Err(KeywardFailure::KeyGeneration(
            "Failed to generate Ed25519 key pair"));
    }

    return ResultType::Ok(std::make_pair(std::move(sk_handle), std::move(pk)));
}

// ============================================================================
// Signatures
// ============================================================================

Result<std::vector<uint8_t>, KeywardFailure> SodiumInterop::SignDetached(
    std::span<const uint8_t> message,
    std::span<const uint8_t> secret_key) {

    if (secret_key.size() != kEd25519SecretKeyBytes) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("Ed25519 secret key must be {} bytes, got {}",
                    kEd25519SecretKeyBytes, secret_key.size())));
    }
    if (!IsInitialized()) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::NotInitialized(std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    std::vector<uint8_t> signature(kEd25519SignatureBytes);
    unsigned long long signature_len = 0;
    if (crypto_sign_detached(signature.data(), &signature_len,
                             message.data(), message.size(),
                             secret_key.data()) != SodiumConstants::SUCCESS ||
        signature_len != kEd25519SignatureBytes) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::Generic("Ed25519 signing failed"));
    }

    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(signature));
}

Result<bool, KeywardFailure> SodiumInterop::VerifyDetached(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature,
    std::span<const uint8_t> public_key) {

    if (public_key.size() != kEd25519PublicKeyBytes) {
        return Result<bool, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("Ed25519 public key must be {} bytes, got {}",
                    kEd25519PublicKeyBytes, public_key.size())));
    }
    if (signature.size() != kEd25519SignatureBytes) {
        return Result<bool, KeywardFailure>::Ok(false);
    }
    if (!IsInitialized()) {
        return Result<bool, KeywardFailure>::Err(
            KeywardFailure::NotInitialized(std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    const int rc = crypto_sign_verify_detached(
        signature.data(), message.data(), message.size(), public_key.data());
    return Result<bool, KeywardFailure>::Ok(rc == SodiumConstants::SUCCESS);
}

// ============================================================================
// Curve Conversion
// ============================================================================

Result<std::vector<uint8_t>, KeywardFailure> SodiumInterop::Ed25519PublicKeyToX25519(
    std::span<const uint8_t> ed25519_public_key) {

    if (ed25519_public_key.size() != kEd25519PublicKeyBytes) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("Ed25519 public key must be {} bytes, got {}",
                    kEd25519PublicKeyBytes, ed25519_public_key.size())));
    }

    std::vector<uint8_t> x25519_pk(kX25519PublicKeyBytes);
    if (crypto_sign_ed25519_pk_to_curve25519(x25519_pk.data(), ed25519_public_key.data()) !=
        SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("Ed25519 public key is not a valid curve point"));
    }
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(x25519_pk));
}

Result<SecureMemoryHandle, KeywardFailure> SodiumInterop::Ed25519SecretKeyToX25519(
    std::span<const uint8_t> ed25519_secret_key) {

    if (ed25519_secret_key.size() != kEd25519SecretKeyBytes) {
        return Result<SecureMemoryHandle, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("Ed25519 secret key must be {} bytes, got {}",
                    kEd25519SecretKeyBytes, ed25519_secret_key.size())));
    }

    auto handle_result = SecureMemoryHandle::Allocate(kX25519PrivateKeyBytes);
    if (handle_result.IsErr()) {
        return FromSodium<SecureMemoryHandle>(handle_result.UnwrapErr());
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();

    auto convert_result = handle.WithWriteAccess([&ed25519_secret_key](std::span<uint8_t> out) {
        return crypto_sign_ed25519_sk_to_curve25519(out.data(), ed25519_secret_key.data());
    });
    if (convert_result.IsErr()) {
        return FromSodium<SecureMemoryHandle>(convert_result.UnwrapErr());
    }
    if (convert_result.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<SecureMemoryHandle, KeywardFailure>::Err(
            KeywardFailure::Generic("Ed25519 to X25519 secret key conversion failed"));
    }
    return Result<SecureMemoryHandle, KeywardFailure>::Ok(std::move(handle));
}

Result<std::vector<uint8_t>, KeywardFailure> SodiumInterop::DeriveX25519PublicKey(
    std::span<const uint8_t> x25519_private_key) {

    if (x25519_private_key.size() != kX25519PrivateKeyBytes) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("X25519 private key must be {} bytes, got {}",
                    kX25519PrivateKeyBytes, x25519_private_key.size())));
    }

    std::vector<uint8_t> pk(kX25519PublicKeyBytes);
    if (crypto_scalarmult_base(pk.data(), x25519_private_key.data()) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("Failed to derive X25519 public key"));
    }
    return Result<std::vector<uint8_t>, KeywardFailure>::Ok(std::move(pk));
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

uint32_t SodiumInterop::GenerateRandomUInt32(bool ensure_non_zero) {
    uint32_t value;
    do {
        value = randombytes_random();
    } while (ensure_non_zero && value == 0);
    return value;
}

uint32_t SodiumInterop::RandomUniform(uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
