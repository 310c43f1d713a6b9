#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/crypto/sodium_secure_memory_handle.hpp"
#include "keyward/interfaces/i_master_key_provider.hpp"
#include "keyward/configuration/key_manager_config.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace keyward::e2ee::crypto {

struct KeyEncryptionStatistics {
    uint64_t encryptions{0};
    uint64_t decryptions{0};
    uint64_t authentication_failures{0};
};

/**
 * @brief Seals private key bytes for storage at rest
 *
 * AES-256-GCM under a process-wide 32-byte master key. Each Encrypt draws a
 * fresh random 96-bit nonce, so the blob is self-contained:
 *
 *   version(1) || nonce(12) || tag(16) || ciphertext
 *
 * The version byte is authenticated together with the associated data.
 * Associated data is not stored; the caller supplies the same bytes on
 * Decrypt. Binding it to (account, key kind, key id) stops a sealed blob
 * from being swapped into another record.
 *
 * The master key is read-only after construction; Encrypt and Decrypt may
 * be called concurrently.
 */
class KeyEncryptionUnit {
public:
    [[nodiscard]] static Result<std::unique_ptr<KeyEncryptionUnit>, KeywardFailure>
    Create(interfaces::IMasterKeyProvider& provider);

    [[nodiscard]] static Result<std::unique_ptr<KeyEncryptionUnit>, KeywardFailure>
    CreateWithMasterKey(std::span<const uint8_t> master_key);

    /**
     * @brief Random master key, for development only
     *
     * Fails with InvalidState unless config.allow_ephemeral_master_key is set.
     * Everything sealed with it is unreadable after the process exits.
     */
    [[nodiscard]] static Result<std::unique_ptr<KeyEncryptionUnit>, KeywardFailure>
    CreateEphemeral(const configuration::KeyManagerConfig& config);

    KeyEncryptionUnit(const KeyEncryptionUnit&) = delete;
    KeyEncryptionUnit& operator=(const KeyEncryptionUnit&) = delete;
    KeyEncryptionUnit(KeyEncryptionUnit&&) = delete;
    KeyEncryptionUnit& operator=(KeyEncryptionUnit&&) = delete;
    ~KeyEncryptionUnit() = default;

    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    /**
     * @return plaintext in secure memory; Authentication for a truncated
     *         blob, an unknown version or a tag that does not verify
     */
    [[nodiscard]] Result<SecureMemoryHandle, KeywardFailure> Decrypt(
        std::span<const uint8_t> sealed,
        std::span<const uint8_t> associated_data = {});

    [[nodiscard]] Result<std::vector<uint8_t>, KeywardFailure> Encrypt(
        const SecureMemoryHandle& plaintext,
        std::span<const uint8_t> associated_data = {});

    [[nodiscard]] KeyEncryptionStatistics GetStatistics() const noexcept;

private:
    explicit KeyEncryptionUnit(SecureMemoryHandle master_key);

    KeywardFailure RejectSealedKey(std::string message);

    SecureMemoryHandle master_key_;
    std::atomic<uint64_t> encryptions_{0};
    std::atomic<uint64_t> decryptions_{0};
    std::atomic<uint64_t> authentication_failures_{0};
};

}
