#include "keyward/providers/environment_master_key_provider.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/format.hpp"

#include <sodium.h>
#include <cstdlib>
#include <cstring>

namespace keyward::e2ee::providers {

EnvironmentMasterKeyProvider::EnvironmentMasterKeyProvider(const std::string_view variable_name)
    : variable_name_(variable_name) {
}

Result<crypto::SecureMemoryHandle, KeywardFailure> EnvironmentMasterKeyProvider::GetMasterKey() {
    using ResultType = Result<crypto::SecureMemoryHandle, KeywardFailure>;

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return ResultType::Err(KeywardFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    const char* hex = std::getenv(variable_name_.c_str());
    if (hex == nullptr || hex[0] == '\0') {
        return ResultType::Err(KeywardFailure::NotFound(
            compat::format("{} is not set", variable_name_)));
    }
    const size_t hex_len = std::strlen(hex);
    if (hex_len != kMasterKeyBytes * 2) {
        return ResultType::Err(KeywardFailure::InvalidInput(
            compat::format("{} must be {} hex characters, got {}",
                variable_name_, kMasterKeyBytes * 2, hex_len)));
    }

    auto handle_result = crypto::SecureMemoryHandle::Allocate(kMasterKeyBytes);
    if (handle_result.IsErr()) {
        return ResultType::Err(KeywardFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    crypto::SecureMemoryHandle handle = std::move(handle_result).Unwrap();

    auto decoded = handle.WithWriteAccess([hex, hex_len](std::span<uint8_t> key) {
        size_t bin_len = 0;
        const char* hex_end = nullptr;
        const int rc = sodium_hex2bin(key.data(), key.size(), hex, hex_len, nullptr, &bin_len, &hex_end);
        return rc == 0 && bin_len == key.size() && hex_end == hex + hex_len;
    });
    if (decoded.IsErr()) {
        return ResultType::Err(KeywardFailure::FromSodiumFailure(decoded.UnwrapErr()));
    }
    if (!decoded.Unwrap()) {
        return ResultType::Err(KeywardFailure::InvalidInput(
            compat::format("{} is not valid hex", variable_name_)));
    }
    return ResultType::Ok(std::move(handle));
}

}
