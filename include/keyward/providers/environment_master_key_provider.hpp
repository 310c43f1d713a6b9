#pragma once
#include "keyward/interfaces/i_master_key_provider.hpp"
#include "keyward/core/constants.hpp"

#include <string>
#include <string_view>

namespace keyward::e2ee::providers {

/**
 * Reads the master key as 64 hex characters from an environment variable
 * (KEYWARD_MASTER_KEY unless overridden). NotFound when unset, InvalidInput
 * when malformed. Intended for deployments where a secret manager injects
 * the key into the process environment.
 */
class EnvironmentMasterKeyProvider final : public interfaces::IMasterKeyProvider {
public:
    explicit EnvironmentMasterKeyProvider(std::string_view variable_name = kEnvMasterKey);

    [[nodiscard]] Result<crypto::SecureMemoryHandle, KeywardFailure> GetMasterKey() override;

    [[nodiscard]] const std::string& GetVariableName() const noexcept {
        return variable_name_;
    }

private:
    std::string variable_name_;
};

}
