#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/crypto/sodium_secure_memory_handle.hpp"

namespace keyward::e2ee::interfaces {

// Source of the process-wide key-encryption master key (HSM, KMS, secret store)
class IMasterKeyProvider {
public:
    virtual ~IMasterKeyProvider() = default;

    [[nodiscard]] virtual Result<crypto::SecureMemoryHandle, KeywardFailure> GetMasterKey() = 0;
};

}
