#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <mutex>
#include <span>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace keyward::e2ee::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium cryptographic operations
 *
 * Provides RAII wrappers and safe interfaces to libsodium functionality.
 * Every key type in Keyward lives on Curve25519: Ed25519 for identity
 * signing, X25519 for pre-keys.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Uses sodium_memzero for large buffers and a volatile loop for small ones.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different (including size mismatch)
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate X25519 (Curve25519) key pair
     *
     * Secret key is written straight into secure memory.
     *
     * @param key_purpose Description for error messages
     * @return Ok((secret_key_handle, public_key_bytes)) or KeyGeneration failure
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, KeywardFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Generate Ed25519 key pair
     *
     * The 64-byte libsodium secret key (seed || public key) is stored in
     * secure memory.
     *
     * @return Ok((secret_key_handle, public_key_bytes)) or KeyGeneration failure
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, KeywardFailure>
    GenerateEd25519KeyPair();

    // ========================================================================
    // Signatures
    // ========================================================================

    /**
     * @brief Ed25519 detached signature (deterministic)
     *
     * @param message Bytes to sign
     * @param secret_key 64-byte Ed25519 secret key
     * @return 64-byte signature, or InvalidInput if the key is malformed
     */
    static Result<std::vector<uint8_t>, KeywardFailure> SignDetached(
        std::span<const uint8_t> message,
        std::span<const uint8_t> secret_key);

    /**
     * @brief Verify an Ed25519 detached signature
     *
     * @return Ok(false) for a bad signature, Err only for malformed inputs
     */
    static Result<bool, KeywardFailure> VerifyDetached(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature,
        std::span<const uint8_t> public_key);

    // ========================================================================
    // Curve Conversion
    // ========================================================================

    static Result<std::vector<uint8_t>, KeywardFailure> Ed25519PublicKeyToX25519(
        std::span<const uint8_t> ed25519_public_key);

    static Result<SecureMemoryHandle, KeywardFailure> Ed25519SecretKeyToX25519(
        std::span<const uint8_t> ed25519_secret_key);

    static Result<std::vector<uint8_t>, KeywardFailure> DeriveX25519PublicKey(
        std::span<const uint8_t> x25519_private_key);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Generate random uint32_t
     *
     * @param ensure_non_zero If true, guarantees result != 0
     */
    static uint32_t GenerateRandomUInt32(bool ensure_non_zero = false);

    /**
     * @brief Uniform random value in [0, upper_bound) without modulo bias
     */
    static uint32_t RandomUniform(uint32_t upper_bound);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate secure memory using sodium_malloc
     *
     * Memory is guard-paged, locked in RAM and zeroed on free.
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
