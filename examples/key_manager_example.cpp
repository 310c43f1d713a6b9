/**
 * @file key_manager_example.cpp
 * @brief Bootstraps an account, publishes its bundle and consumes a pre-key
 *
 * Usage: key_manager_example [database-path]
 *
 * Reads the master key from KEYWARD_MASTER_KEY (64 hex characters). Without
 * it the example falls back to an ephemeral master key, which is only
 * allowed with the development configuration.
 */

#include "keyward/configuration/key_manager_config.hpp"
#include "keyward/core/log.hpp"
#include "keyward/crypto/key_encryption_unit.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/manager/key_maintenance_scheduler.hpp"
#include "keyward/manager/key_manager.hpp"
#include "keyward/providers/environment_master_key_provider.hpp"
#include "keyward/storage/sqlite_key_store.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

using namespace keyward::e2ee;

namespace {

std::string ToHex(const std::vector<uint8_t>& data) {
    std::ostringstream out;
    for (auto byte : data) {
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return out.str();
}

int Fail(const std::string& step, const KeywardFailure& failure) {
    std::cerr << step << " failed: [" << FailureTypeName(failure.type) << "] "
              << failure.message << std::endl;
    return 1;
}

}

int main(int argc, char** argv) {
    keyward::log::InitFromEnv();

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        std::cerr << "Failed to initialize libsodium: " << init.UnwrapErr().message << std::endl;
        return 1;
    }

    providers::EnvironmentMasterKeyProvider provider;
    auto encryption_unit = crypto::KeyEncryptionUnit::Create(provider);
    auto config = configuration::KeyManagerConfig::Default();
    if (encryption_unit.IsErr() && encryption_unit.UnwrapErr().Is(KeywardFailureType::NotFound)) {
        std::cout << provider.GetVariableName() << " is not set; using an ephemeral master key" << std::endl;
        config = configuration::KeyManagerConfig::Development();
        encryption_unit = crypto::KeyEncryptionUnit::CreateEphemeral(config);
    }
    if (encryption_unit.IsErr()) {
        return Fail("Loading master key", encryption_unit.UnwrapErr());
    }

    auto store = storage::SqliteKeyStore::Open(
        storage::SqliteKeyStoreConfig::For(config, argc > 1 ? argv[1] : ":memory:"));
    if (store.IsErr()) {
        return Fail("Opening key store", store.UnwrapErr());
    }

    auto manager_result = manager::KeyManager::Create(
        config,
        std::shared_ptr<interfaces::IKeyStore>(std::move(store).Unwrap()),
        std::move(encryption_unit).Unwrap());
    if (manager_result.IsErr()) {
        return Fail("Creating key manager", manager_result.UnwrapErr());
    }
    auto key_manager = std::move(manager_result).Unwrap();

    const std::string account_id = "alice";
    std::cout << "1. Initializing account " << account_id << std::endl;
    if (auto init = key_manager->Initialize(account_id); init.IsErr()) {
        return Fail("Initialize", init.UnwrapErr());
    }

    std::cout << "2. Building the publication bundle" << std::endl;
    auto bundle_result = key_manager->GetPublicBundleForPublishing(account_id);
    if (bundle_result.IsErr()) {
        return Fail("GetPublicBundleForPublishing", bundle_result.UnwrapErr());
    }
    const auto& bundle = bundle_result.Unwrap();
    std::cout << "   Registration id:   " << bundle.GetRegistrationId() << std::endl;
    std::cout << "   Identity key:      " << ToHex(bundle.GetIdentityPublicKey()) << std::endl;
    std::cout << "   Signed pre-key:    #" << bundle.GetSignedPreKeyId() << " "
              << ToHex(bundle.GetSignedPreKeyPublic()) << std::endl;
    std::cout << "   One-time pre-keys: " << bundle.GetOneTimePreKeyCount() << std::endl;

    auto verified = bundle.VerifySignedPreKey();
    std::cout << "   Signature valid:   " << (verified.IsOk() && verified.Unwrap() ? "yes" : "no") << std::endl;

    auto wire = bundle.Serialize();
    if (wire.IsErr()) {
        return Fail("Serialize", wire.UnwrapErr());
    }
    std::cout << "   Wire size:         " << wire.Unwrap().size() << " bytes" << std::endl;

    if (bundle.GetOneTimePreKeyCount() > 0) {
        const uint32_t pre_key_id = bundle.GetOneTimePreKeys().front().id;
        std::cout << "3. Consuming one-time pre-key #" << pre_key_id << std::endl;
        auto consumed = key_manager->ConsumePreKey(account_id, pre_key_id);
        if (consumed.IsErr()) {
            return Fail("ConsumePreKey", consumed.UnwrapErr());
        }
        auto again = key_manager->ConsumePreKey(account_id, pre_key_id);
        std::cout << "   Second consume:    "
                  << (again.IsErr() ? FailureTypeName(again.UnwrapErr().type) : "unexpected success")
                  << std::endl;
    }

    std::cout << "4. Running one maintenance pass" << std::endl;
    manager::KeyMaintenanceScheduler scheduler(*key_manager);
    scheduler.Track(account_id);
    for (const auto& outcome : scheduler.RunOnce()) {
        if (outcome.result.IsErr()) {
            return Fail("Maintenance", outcome.result.UnwrapErr());
        }
        std::cout << "   " << outcome.account_id << ": unused pre-keys "
                  << outcome.result.Unwrap().unused_pre_key_count << ", active signed pre-key #"
                  << outcome.result.Unwrap().active_signed_pre_key_id << std::endl;
    }

    const auto stats = key_manager->GetStatistics();
    std::cout << std::endl << "Pre-keys generated: " << stats.pre_keys_generated
              << ", consumed: " << stats.pre_keys_consumed
              << ", conflicts: " << stats.pre_key_consume_conflicts << std::endl;

    key_manager->ClearSensitiveData();
    keyward::log::Shutdown();
    return 0;
}
