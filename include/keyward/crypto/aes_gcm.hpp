#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace keyward::e2ee::crypto {

/**
 * AES-256-GCM authenticated encryption with associated data (OpenSSL EVP).
 *
 * Stateless primitive: the caller MUST never reuse a (key, nonce) pair.
 * KeyEncryptionUnit draws a fresh 96-bit random nonce per call and caps the
 * number of encryptions under one master key at 2^32 (NIST SP 800-38D).
 *
 * Output of Encrypt is ciphertext || tag(16). Decrypt fails with an
 * Authentication failure when the tag does not verify and never returns
 * partially decrypted bytes.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, KeywardFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, KeywardFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
