#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/configuration/key_manager_config.hpp"
#include "keyward/crypto/key_encryption_unit.hpp"
#include "keyward/interfaces/i_key_store.hpp"
#include "keyward/models/keys/typed_keys.hpp"
#include "keyward/models/bundles/key_bundle.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace keyward::e2ee::manager {

enum class AccountState : uint8_t {
    Uninitialized,
    Bootstrapping,
    Ready
};

enum class PreKeyPoolHealth : uint8_t {
    Healthy,
    Low
};

enum class SignedPreKeyFreshness : uint8_t {
    Current,
    DueForRotation
};

struct RotationCheckResult {
    bool signed_pre_key_rotated{false};
    uint32_t active_signed_pre_key_id{0};
    uint32_t pre_keys_generated{0};
    uint32_t unused_pre_key_count{0};
};

struct AccountKeyHealth {
    AccountState state{AccountState::Uninitialized};
    PreKeyPoolHealth pool_health{PreKeyPoolHealth::Low};
    SignedPreKeyFreshness freshness{SignedPreKeyFreshness::DueForRotation};
    uint32_t unused_pre_key_count{0};
    uint32_t active_signed_pre_key_id{0};
    models::Timestamp next_rotation_at{};
};

struct KeyManagerStatistics {
    uint64_t identity_keys_generated{0};
    uint64_t pre_keys_generated{0};
    uint64_t pre_keys_consumed{0};
    uint64_t pre_key_consume_conflicts{0};
    uint64_t signed_pre_keys_rotated{0};
    uint64_t encryption_operations{0};
    uint64_t decryption_operations{0};
    uint64_t authentication_failures{0};
};

using Clock = std::function<models::Timestamp()>;

/**
 * @brief Per-account owner of the X3DH key lifecycle
 *
 * One instance per service process, passed to callers by reference.
 * Per-account state is created on first use and kept in a map guarded by
 * a shared mutex; each account then serializes its own initialization,
 * maintenance (rotation, replenishment) and, for stores without atomic
 * conditional updates, pre-key consumption.
 *
 * Storage is the source of truth. In-memory caches hold decrypted identity
 * and signed pre-key pairs and are filled only after the store confirms a
 * write. A cached signed pre-key older than the configured TTL is checked
 * against the store's active id before use, so a rotation performed by
 * another instance is picked up.
 *
 * Accessors never bootstrap: Initialize() must run first, otherwise they
 * fail with NotInitialized.
 */
class KeyManager {
public:
    [[nodiscard]] static Result<std::unique_ptr<KeyManager>, KeywardFailure> Create(
        const configuration::KeyManagerConfig& config,
        std::shared_ptr<interfaces::IKeyStore> store,
        std::unique_ptr<crypto::KeyEncryptionUnit> encryption_unit,
        Clock clock = {});

    ~KeyManager();

    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;
    KeyManager(KeyManager&&) = delete;
    KeyManager& operator=(KeyManager&&) = delete;

    /**
     * @brief Load or create the account's keys and bring it to Ready
     *
     * Creates the identity key pair and registration id only if the store has
     * none, refills the one-time pre-key pool when below the low-water mark,
     * and makes sure an active signed pre-key exists and is not due. Safe to
     * call repeatedly and concurrently. Any failure leaves the account
     * Uninitialized and is returned to the caller.
     */
    [[nodiscard]] Result<Unit, KeywardFailure> Initialize(std::string_view account_id);

    [[nodiscard]] Result<models::IdentityKeyPair, KeywardFailure> GetIdentityKeyPair(std::string_view account_id);

    [[nodiscard]] Result<models::SignedPreKeyPair, KeywardFailure> GetSignedPreKeyPair(std::string_view account_id);

    /**
     * @brief Active signed pre-key or a superseded one still inside the grace period
     *
     * Used by the responder when the initiator's handshake names a signed
     * pre-key id that was rotated out after the bundle was fetched.
     */
    [[nodiscard]] Result<models::SignedPreKeyPair, KeywardFailure> GetSignedPreKeyPairById(
        std::string_view account_id,
        uint32_t signed_pre_key_id);

    /**
     * @brief Public bundle for the publication channel
     *
     * Unavailable when the identity or the active signed pre-key is missing;
     * a partial bundle is never returned. Carries at most publication_cap
     * unused one-time pre-keys, which stay unused.
     */
    [[nodiscard]] Result<models::KeyBundle, KeywardFailure> GetPublicBundleForPublishing(std::string_view account_id);

    // Returns the new active signed pre-key id
    [[nodiscard]] Result<uint32_t, KeywardFailure> RotateSignedPreKey(std::string_view account_id);

    // Returns the number of pre-keys generated; 0 when the pool is at or above the low-water mark
    [[nodiscard]] Result<uint32_t, KeywardFailure> ReplenishPreKeysIfNeeded(std::string_view account_id);

    /**
     * @brief Hand out a one-time pre-key's private half exactly once
     *
     * Decrypts first and marks used second, so a decryption failure leaves the
     * key unused. AlreadyUsed when the key was consumed before or a
     * concurrent caller won the conditional update; NotFound for unknown ids.
     */
    [[nodiscard]] Result<models::OneTimePreKeyPair, KeywardFailure> ConsumePreKey(
        std::string_view account_id,
        uint32_t pre_key_id);

    // Rotate when due, then replenish; meant for periodic maintenance
    [[nodiscard]] Result<RotationCheckResult, KeywardFailure> PerformKeyRotationCheck(std::string_view account_id);

    [[nodiscard]] Result<AccountKeyHealth, KeywardFailure> GetAccountHealth(std::string_view account_id);

    // Deletes superseded signed pre-keys past the grace period; returns how many
    [[nodiscard]] Result<size_t, KeywardFailure> PruneExpiredSignedPreKeys(std::string_view account_id);

    [[nodiscard]] Result<uint32_t, KeywardFailure> GetRegistrationId(std::string_view account_id);

    [[nodiscard]] AccountState GetAccountState(std::string_view account_id) const;

    // Drops cached private keys for one account; the account returns to Uninitialized
    void EvictAccount(std::string_view account_id);

    void ClearSensitiveData();

    [[nodiscard]] KeyManagerStatistics GetStatistics() const noexcept;

    [[nodiscard]] const configuration::KeyManagerConfig& GetConfig() const noexcept {
        return config_;
    }

private:
    struct AccountSlot;

    KeyManager(
        const configuration::KeyManagerConfig& config,
        std::shared_ptr<interfaces::IKeyStore> store,
        std::unique_ptr<crypto::KeyEncryptionUnit> encryption_unit,
        Clock clock);

    [[nodiscard]] std::shared_ptr<AccountSlot> SlotFor(std::string_view account_id);
    [[nodiscard]] std::shared_ptr<AccountSlot> FindSlot(std::string_view account_id) const;

    Result<Unit, KeywardFailure> EnsureIdentity(std::string_view account_id, AccountSlot& slot);
    Result<Unit, KeywardFailure> EnsureSignedPreKey(std::string_view account_id, AccountSlot& slot);
    Result<uint32_t, KeywardFailure> RotateLocked(std::string_view account_id, AccountSlot& slot);
    Result<uint32_t, KeywardFailure> ReplenishLocked(std::string_view account_id);

    Result<models::IdentityKeyPair, KeywardFailure> OpenIdentity(
        std::string_view account_id,
        const models::IdentityBundleRecord& record);
    Result<models::SignedPreKeyPair, KeywardFailure> OpenSignedPreKey(
        std::string_view account_id,
        const models::SignedPreKeyRecord& record);

    configuration::KeyManagerConfig config_;
    std::shared_ptr<interfaces::IKeyStore> store_;
    std::unique_ptr<crypto::KeyEncryptionUnit> encryption_unit_;
    Clock clock_;

    std::unordered_map<std::string, std::shared_ptr<AccountSlot>> accounts_;
    mutable std::unique_ptr<std::shared_mutex> accounts_lock_;

    std::atomic<uint64_t> identity_keys_generated_{0};
    std::atomic<uint64_t> pre_keys_generated_{0};
    std::atomic<uint64_t> pre_keys_consumed_{0};
    std::atomic<uint64_t> pre_key_consume_conflicts_{0};
    std::atomic<uint64_t> signed_pre_keys_rotated_{0};
};

[[nodiscard]] std::string_view AccountStateName(AccountState state) noexcept;

}
