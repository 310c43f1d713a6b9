#pragma once
#include "keyward/manager/key_manager.hpp"
#include "keyward/crypto/key_encryption_unit.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/storage/in_memory_key_store.hpp"
#include "keyward/configuration/key_manager_config.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace keyward::e2ee::test_helpers {

// Shared, manually advanced time source; copies observe the same instant
class ManualClock {
public:
    ManualClock()
        : state_(std::make_shared<State>()) {
        state_->now = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }

    [[nodiscard]] models::Timestamp Now() const {
        std::lock_guard lock(state_->mutex);
        return state_->now;
    }

    template<typename Duration>
    void Advance(const Duration by) {
        std::lock_guard lock(state_->mutex);
        state_->now += std::chrono::duration_cast<models::Timestamp::duration>(by);
    }

    [[nodiscard]] manager::Clock AsClock() const {
        auto state = state_;
        return [state] {
            std::lock_guard lock(state->mutex);
            return state->now;
        };
    }

private:
    struct State {
        std::mutex mutex;
        models::Timestamp now;
    };
    std::shared_ptr<State> state_;
};

inline std::vector<uint8_t> TestMasterKey(const uint8_t fill = 0x5A) {
    return std::vector<uint8_t>(kMasterKeyBytes, fill);
}

inline std::unique_ptr<crypto::KeyEncryptionUnit> MakeEncryptionUnit(const uint8_t fill = 0x5A) {
    auto unit = crypto::KeyEncryptionUnit::CreateWithMasterKey(TestMasterKey(fill));
    if (unit.IsErr()) {
        throw std::runtime_error("test master key rejected: " + unit.UnwrapErr().message);
    }
    return std::move(unit).Unwrap();
}

// Small pools keep the tests fast; the shape mirrors the defaults
inline configuration::KeyManagerConfig SmallPoolConfig() {
    auto config = configuration::KeyManagerConfig::Default();
    config.pre_key_low_water_mark = 5;
    config.pre_key_target_pool_size = 10;
    config.publication_cap = 4;
    return config;
}

inline std::unique_ptr<manager::KeyManager> MakeManager(
    std::shared_ptr<interfaces::IKeyStore> store,
    const configuration::KeyManagerConfig& config,
    const ManualClock& clock,
    const uint8_t master_key_fill = 0x5A) {
    auto created = manager::KeyManager::Create(
        config, std::move(store), MakeEncryptionUnit(master_key_fill), clock.AsClock());
    if (created.IsErr()) {
        throw std::runtime_error("KeyManager::Create failed: " + created.UnwrapErr().message);
    }
    return std::move(created).Unwrap();
}

}
