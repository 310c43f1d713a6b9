#pragma once
#include "keyward/interfaces/i_master_key_provider.hpp"
#include "keyward/crypto/sodium_secure_memory_handle.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <optional>
#include <vector>
#include <span>

namespace keyward::e2ee::test_helpers {

using crypto::SecureMemoryHandle;
using interfaces::IMasterKeyProvider;

class FixedMasterKeyProvider : public IMasterKeyProvider {
public:
    explicit FixedMasterKeyProvider(const uint8_t fill = 0x42)
        : key_(kMasterKeyBytes, fill) {}

    explicit FixedMasterKeyProvider(std::vector<uint8_t> key)
        : key_(std::move(key)) {}

    void FailWith(KeywardFailure failure) {
        failure_ = std::move(failure);
    }

    [[nodiscard]] Result<SecureMemoryHandle, KeywardFailure> GetMasterKey() override {
        ++calls_;
        if (failure_) {
            return Result<SecureMemoryHandle, KeywardFailure>::Err(*failure_);
        }
        auto handle = SecureMemoryHandle::FromBytes(key_);
        if (handle.IsErr()) {
            return Result<SecureMemoryHandle, KeywardFailure>::Err(
                KeywardFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return Result<SecureMemoryHandle, KeywardFailure>::Ok(std::move(handle).Unwrap());
    }

    [[nodiscard]] size_t GetCallCount() const { return calls_; }
    [[nodiscard]] std::span<const uint8_t> GetKeyBytes() const { return key_; }

private:
    std::vector<uint8_t> key_;
    std::optional<KeywardFailure> failure_;
    size_t calls_ = 0;
};

}
