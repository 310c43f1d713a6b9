#pragma once
#include "keyward/interfaces/i_key_store.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/configuration/key_manager_config.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

struct sqlite3;

namespace keyward::e2ee::storage {

struct SqliteKeyStoreConfig {
    std::string database_path{":memory:"};
    /// SQLITE_BUSY retries stop after this; the operation then fails with Timeout
    std::chrono::milliseconds busy_timeout{kDefaultStorageTimeout};

    /// Store settings bounded by the manager's storage_timeout
    [[nodiscard]] static SqliteKeyStoreConfig For(
        const configuration::KeyManagerConfig& config,
        std::string database_path = ":memory:") {
        SqliteKeyStoreConfig store_config;
        store_config.database_path = std::move(database_path);
        store_config.busy_timeout = config.storage_timeout;
        return store_config;
    }
};

/**
 * @brief IKeyStore on SQLite3
 *
 * WAL journal, busy timeout from config. Multi-statement writes (signed
 * pre-key swap, pre-key batch) run inside BEGIN IMMEDIATE transactions.
 * MarkPreKeyUsed is a single conditional UPDATE, so consumption stays
 * linearizable across processes sharing the database file.
 *
 * Error mapping: SQLITE_BUSY/SQLITE_LOCKED -> Timeout, unique constraint
 * violations -> Conflict, anything else -> Storage.
 */
class SqliteKeyStore final : public interfaces::IKeyStore {
public:
    [[nodiscard]] static Result<std::unique_ptr<SqliteKeyStore>, KeywardFailure>
    Open(const SqliteKeyStoreConfig& config);

    ~SqliteKeyStore() override;

    SqliteKeyStore(const SqliteKeyStore&) = delete;
    SqliteKeyStore& operator=(const SqliteKeyStore&) = delete;

    [[nodiscard]] Result<std::optional<models::IdentityBundleRecord>, KeywardFailure>
    LoadIdentityBundle(std::string_view account_id) override;

    [[nodiscard]] Result<Unit, KeywardFailure>
    UpsertIdentityBundle(std::string_view account_id, const models::IdentityBundleRecord& bundle) override;

    [[nodiscard]] Result<std::optional<models::SignedPreKeyRecord>, KeywardFailure>
    LoadActiveSignedPreKey(std::string_view account_id) override;

    [[nodiscard]] Result<std::optional<models::SignedPreKeyRecord>, KeywardFailure>
    LoadSignedPreKey(std::string_view account_id, uint32_t signed_pre_key_id) override;

    [[nodiscard]] Result<Unit, KeywardFailure>
    StoreSignedPreKey(std::string_view account_id, const models::SignedPreKeyRecord& record) override;

    [[nodiscard]] Result<size_t, KeywardFailure>
    PruneSignedPreKeys(std::string_view account_id, models::Timestamp superseded_before) override;

    [[nodiscard]] Result<uint32_t, KeywardFailure>
    CountUnusedPreKeys(std::string_view account_id) override;

    [[nodiscard]] Result<Unit, KeywardFailure>
    StorePreKeyBatch(std::string_view account_id, const std::vector<models::OneTimePreKeyRecord>& records) override;

    [[nodiscard]] Result<std::optional<models::OneTimePreKeyRecord>, KeywardFailure>
    LoadPreKey(std::string_view account_id, uint32_t pre_key_id) override;

    [[nodiscard]] Result<std::vector<models::OneTimePreKeyRecord>, KeywardFailure>
    LoadUnusedPreKeys(std::string_view account_id, uint32_t limit) override;

    [[nodiscard]] Result<bool, KeywardFailure>
    MarkPreKeyUsed(std::string_view account_id, uint32_t pre_key_id) override;

    [[nodiscard]] Result<uint32_t, KeywardFailure> MaxPreKeyId(std::string_view account_id) override;

    [[nodiscard]] Result<uint32_t, KeywardFailure> MaxSignedPreKeyId(std::string_view account_id) override;

    [[nodiscard]] Result<Unit, KeywardFailure> DeleteAccount(std::string_view account_id) override;

    [[nodiscard]] bool SupportsAtomicConditionalUpdate() const noexcept override {
        return true;
    }

private:
    explicit SqliteKeyStore(sqlite3* db);

    Result<Unit, KeywardFailure> Execute(const char* sql);
    Result<Unit, KeywardFailure> InitializeSchema();

    sqlite3* db_;
    // Serializes statement use and transaction scope on the shared connection
    std::mutex mutex_;
};

}
