#include "keyward/storage/sqlite_key_store.hpp"
#include "keyward/core/format.hpp"
#include "keyward/core/log.hpp"

#include <sqlite3.h>
#include <span>

namespace keyward::e2ee::storage {

using models::IdentityBundleRecord;
using models::OneTimePreKeyRecord;
using models::SignedPreKeyRecord;
using models::Timestamp;

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS identity_bundles (
    account_id TEXT PRIMARY KEY,
    identity_public_key BLOB NOT NULL,
    encrypted_private_key BLOB NOT NULL,
    registration_id INTEGER NOT NULL,
    created_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS signed_pre_keys (
    account_id TEXT NOT NULL,
    id INTEGER NOT NULL,
    public_key BLOB NOT NULL,
    encrypted_private_key BLOB NOT NULL,
    signature BLOB NOT NULL,
    created_at INTEGER NOT NULL,
    rotation_interval INTEGER NOT NULL,
    active INTEGER NOT NULL DEFAULT 0,
    superseded_at INTEGER,
    PRIMARY KEY (account_id, id)
);
CREATE UNIQUE INDEX IF NOT EXISTS idx_signed_pre_keys_active
    ON signed_pre_keys(account_id) WHERE active = 1;
CREATE TABLE IF NOT EXISTS one_time_pre_keys (
    account_id TEXT NOT NULL,
    id INTEGER NOT NULL,
    public_key BLOB NOT NULL,
    encrypted_private_key BLOB NOT NULL,
    used INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL,
    PRIMARY KEY (account_id, id)
);
CREATE INDEX IF NOT EXISTS idx_one_time_pre_keys_unused
    ON one_time_pre_keys(account_id, used, id);
)sql";

int64_t ToMillis(const Timestamp at) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
}

Timestamp FromMillis(const int64_t millis) {
    return Timestamp(std::chrono::milliseconds(millis));
}

KeywardFailure MapError(sqlite3* db, const int rc, const std::string_view operation) {
    const int primary = rc & 0xFF;
    const std::string message = compat::format("{}: {} ({})", operation, sqlite3_errmsg(db), rc);
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
        log::Get(log::KEY_STORE_LOGGER)->warn("{}", message);
        return KeywardFailure::Timeout(message);
    }
    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return KeywardFailure::Conflict(message);
    }
    log::Get(log::KEY_STORE_LOGGER)->error("{}", message);
    return KeywardFailure::Storage(message);
}

class Statement {
public:
    Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }
    Statement(Statement&& other) noexcept : db_(other.db_), stmt_(other.stmt_) {
        other.stmt_ = nullptr;
    }
    Statement& operator=(Statement&&) = delete;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    static Result<Statement, KeywardFailure> Prepare(sqlite3* db, const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        const int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return Result<Statement, KeywardFailure>::Err(MapError(db, rc, "prepare"));
        }
        return Result<Statement, KeywardFailure>::Ok(Statement(db, stmt));
    }

    Statement& Bind(const int index, const std::string_view text) {
        Check(sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT));
        return *this;
    }
    Statement& Bind(const int index, const int64_t value) {
        Check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }
    Statement& Bind(const int index, std::span<const uint8_t> data) {
        Check(sqlite3_bind_blob(stmt_, index, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT));
        return *this;
    }

    // SQLITE_ROW -> Ok(true), SQLITE_DONE -> Ok(false)
    Result<bool, KeywardFailure> Step(const std::string_view operation) {
        if (bind_rc_ != SQLITE_OK) {
            return Result<bool, KeywardFailure>::Err(MapError(db_, bind_rc_, operation));
        }
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return Result<bool, KeywardFailure>::Ok(true);
        }
        if (rc == SQLITE_DONE) {
            return Result<bool, KeywardFailure>::Ok(false);
        }
        return Result<bool, KeywardFailure>::Err(MapError(db_, sqlite3_extended_errcode(db_), operation));
    }

    void Reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    bool ColumnIsNull(const int index) const {
        return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
    }
    int64_t ColumnInt64(const int index) const {
        return sqlite3_column_int64(stmt_, index);
    }
    std::vector<uint8_t> ColumnBlob(const int index) const {
        const void* data = sqlite3_column_blob(stmt_, index);
        const int size = sqlite3_column_bytes(stmt_, index);
        if (data && size > 0) {
            const auto* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        return {};
    }

private:
    void Check(const int rc) {
        if (rc != SQLITE_OK && bind_rc_ == SQLITE_OK) {
            bind_rc_ = rc;
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_;
    int bind_rc_{SQLITE_OK};
};

// Rolls back unless committed
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {}
    ~Transaction() {
        if (open_ && !committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Result<Unit, KeywardFailure> Begin() {
        const int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            return Result<Unit, KeywardFailure>::Err(MapError(db_, sqlite3_extended_errcode(db_), "begin"));
        }
        open_ = true;
        return Result<Unit, KeywardFailure>::Ok(unit);
    }

    Result<Unit, KeywardFailure> Commit() {
        const int rc = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            return Result<Unit, KeywardFailure>::Err(MapError(db_, sqlite3_extended_errcode(db_), "commit"));
        }
        committed_ = true;
        return Result<Unit, KeywardFailure>::Ok(unit);
    }

private:
    sqlite3* db_;
    bool open_{false};
    bool committed_{false};
};

SignedPreKeyRecord ReadSignedPreKey(const Statement& stmt) {
    return SignedPreKeyRecord(
        static_cast<uint32_t>(stmt.ColumnInt64(0)),
        stmt.ColumnBlob(1),
        stmt.ColumnBlob(2),
        stmt.ColumnBlob(3),
        FromMillis(stmt.ColumnInt64(4)),
        std::chrono::seconds(stmt.ColumnInt64(5)),
        stmt.ColumnInt64(6) != 0,
        stmt.ColumnIsNull(7) ? std::nullopt : std::optional<Timestamp>(FromMillis(stmt.ColumnInt64(7))));
}

OneTimePreKeyRecord ReadPreKey(const Statement& stmt) {
    return OneTimePreKeyRecord(
        static_cast<uint32_t>(stmt.ColumnInt64(0)),
        stmt.ColumnBlob(1),
        stmt.ColumnBlob(2),
        FromMillis(stmt.ColumnInt64(4)),
        stmt.ColumnInt64(3) != 0);
}

constexpr const char* kSelectSignedPreKeyColumns =
    "SELECT id, public_key, encrypted_private_key, signature, created_at, rotation_interval, active, superseded_at "
    "FROM signed_pre_keys ";

}

SqliteKeyStore::SqliteKeyStore(sqlite3* db) : db_(db) {
}

SqliteKeyStore::~SqliteKeyStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<std::unique_ptr<SqliteKeyStore>, KeywardFailure> SqliteKeyStore::Open(const SqliteKeyStoreConfig& config) {
    using ResultType = Result<std::unique_ptr<SqliteKeyStore>, KeywardFailure>;

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(config.database_path.c_str(), &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr);
    if (rc != SQLITE_OK) {
        const std::string message = compat::format("Failed to open key store {}: {}",
            config.database_path, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        log::Get(log::KEY_STORE_LOGGER)->error("{}", message);
        sqlite3_close(db);
        return ResultType::Err(KeywardFailure::Storage(message));
    }
    sqlite3_extended_result_codes(db, 1);
    sqlite3_busy_timeout(db, static_cast<int>(config.busy_timeout.count()));

    std::unique_ptr<SqliteKeyStore> store(new SqliteKeyStore(db));
    if (config.database_path != ":memory:") {
        if (auto wal = store->Execute("PRAGMA journal_mode=WAL"); wal.IsErr()) {
            return ResultType::Err(std::move(wal).UnwrapErr());
        }
    }
    if (auto sync = store->Execute("PRAGMA synchronous=NORMAL"); sync.IsErr()) {
        return ResultType::Err(std::move(sync).UnwrapErr());
    }
    if (auto schema = store->InitializeSchema(); schema.IsErr()) {
        return ResultType::Err(std::move(schema).UnwrapErr());
    }
    log::Get(log::KEY_STORE_LOGGER)->info("Key store opened: {}", config.database_path);
    return ResultType::Ok(std::move(store));
}

Result<Unit, KeywardFailure> SqliteKeyStore::Execute(const char* sql) {
    char* error = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        sqlite3_free(error);
        return Result<Unit, KeywardFailure>::Err(MapError(db_, sqlite3_extended_errcode(db_), "exec"));
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<Unit, KeywardFailure> SqliteKeyStore::InitializeSchema() {
    if (auto created = Execute(kSchema); created.IsErr()) {
        return created;
    }

    // Databases created before superseded_at was tracked
    auto columns_result = Statement::Prepare(db_,
        "SELECT COUNT(*) FROM pragma_table_info('signed_pre_keys') WHERE name = 'superseded_at'");
    if (columns_result.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(columns_result).UnwrapErr());
    }
    auto columns = std::move(columns_result).Unwrap();
    auto row = columns.Step("inspect signed_pre_keys");
    if (row.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(row).UnwrapErr());
    }
    if (row.Unwrap() && columns.ColumnInt64(0) > 0) {
        return Result<Unit, KeywardFailure>::Ok(unit);
    }
    log::Get(log::KEY_STORE_LOGGER)->info("Adding superseded_at column to signed_pre_keys");
    return Execute("ALTER TABLE signed_pre_keys ADD COLUMN superseded_at INTEGER");
}

Result<std::optional<IdentityBundleRecord>, KeywardFailure>
SqliteKeyStore::LoadIdentityBundle(const std::string_view account_id) {
    using ResultType = Result<std::optional<IdentityBundleRecord>, KeywardFailure>;
    std::lock_guard lock(mutex_);

    auto stmt_result = Statement::Prepare(db_,
        "SELECT identity_public_key, encrypted_private_key, registration_id, created_at "
        "FROM identity_bundles WHERE account_id = ?");
    if (stmt_result.IsErr()) {
        return ResultType::Err(std::move(stmt_result).UnwrapErr());
    }
    auto stmt = std::move(stmt_result).Unwrap();
    stmt.Bind(1, account_id);
    auto row = stmt.Step("load identity bundle");
    if (row.IsErr()) {
        return ResultType::Err(std::move(row).UnwrapErr());
    }
    if (!row.Unwrap()) {
        return ResultType::Ok(std::nullopt);
    }
    return ResultType::Ok(IdentityBundleRecord(
        stmt.ColumnBlob(0),
        stmt.ColumnBlob(1),
        static_cast<uint32_t>(stmt.ColumnInt64(2)),
        FromMillis(stmt.ColumnInt64(3))));
}

Result<Unit, KeywardFailure>
SqliteKeyStore::UpsertIdentityBundle(const std::string_view account_id, const IdentityBundleRecord& bundle) {
    std::lock_guard lock(mutex_);

    auto stmt_result = Statement::Prepare(db_,
        "INSERT INTO identity_bundles (account_id, identity_public_key, encrypted_private_key, registration_id, created_at) "
        "VALUES (?, ?, ?, ?, ?) "
        "ON CONFLICT(account_id) DO UPDATE SET "
        "identity_public_key = excluded.identity_public_key, "
        "encrypted_private_key = excluded.encrypted_private_key, "
        "registration_id = excluded.registration_id, "
        "created_at = excluded.created_at");
    if (stmt_result.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(stmt_result).UnwrapErr());
    }
    auto stmt = std::move(stmt_result).Unwrap();
    stmt.Bind(1, account_id)
        .Bind(2, std::span<const uint8_t>(bundle.GetIdentityPublicKey()))
        .Bind(3, std::span<const uint8_t>(bundle.GetEncryptedIdentityPrivateKey()))
        .Bind(4, static_cast<int64_t>(bundle.GetRegistrationId()))
        .Bind(5, ToMillis(bundle.GetCreatedAt()));
    auto done = stmt.Step("upsert identity bundle");
    if (done.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(done).UnwrapErr());
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<std::optional<SignedPreKeyRecord>, KeywardFailure>
SqliteKeyStore::LoadActiveSignedPreKey(const std::string_view account_id) {
    using ResultType = Result<std::optional<SignedPreKeyRecord>, KeywardFailure>;
    std::lock_guard lock(mutex_);

    const std::string sql = std::string(kSelectSignedPreKeyColumns) + "WHERE account_id = ? AND active = 1";
    auto stmt_result = Statement::Prepare(db_, sql.c_str());
    if (stmt_result.IsErr()) {
        return ResultType::Err(std::move(stmt_result).UnwrapErr());
    }
    auto stmt = std::move(stmt_result).Unwrap();
    stmt.Bind(1, account_id);
    auto row = stmt.Step("load active signed pre-key");
    if (row.IsErr()) {
        return ResultType::Err(std::move(row).UnwrapErr());
    }
    if (!row.Unwrap()) {
        return ResultType::Ok(std::nullopt);
    }
    return ResultType::Ok(ReadSignedPreKey(stmt));
}

Result<std::optional<SignedPreKeyRecord>, KeywardFailure>
SqliteKeyStore::LoadSignedPreKey(const std::string_view account_id, const uint32_t signed_pre_key_id) {
    using ResultType = Result<std::optional<SignedPreKeyRecord>, KeywardFailure>;
    std::lock_guard lock(mutex_);

    const std::string sql = std::string(kSelectSignedPreKeyColumns) + "WHERE account_id = ? AND id = ?";
    auto stmt_result = Statement::Prepare(db_, sql.c_str());
    if (stmt_result.IsErr()) {
        return ResultType::Err(std::move(stmt_result).UnwrapErr());
    }
    auto stmt = std::move(stmt_result).Unwrap();
    stmt.Bind(1, account_id).Bind(2, static_cast<int64_t>(signed_pre_key_id));
    auto row = stmt.Step("load signed pre-key");
    if (row.IsErr()) {
        return ResultType::Err(std::move(row).UnwrapErr());
    }
    if (!row.Unwrap()) {
        return ResultType::Ok(std::nullopt);
    }
    return ResultType::Ok(ReadSignedPreKey(stmt));
}

Result<Unit, KeywardFailure>
SqliteKeyStore::StoreSignedPreKey(const std::string_view account_id, const SignedPreKeyRecord& record) {
    std::lock_guard lock(mutex_);

    Transaction tx(db_);
    if (auto begin = tx.Begin(); begin.IsErr()) {
        return begin;
    }

    auto deactivate_result = Statement::Prepare(db_,
        "UPDATE signed_pre_keys SET active = 0, superseded_at = ? WHERE account_id = ? AND active = 1");
    if (deactivate_result.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(deactivate_result).UnwrapErr());
    }
    auto deactivate = std::move(deactivate_result).Unwrap();
    deactivate.Bind(1, ToMillis(record.GetCreatedAt())).Bind(2, account_id);
    if (auto done = deactivate.Step("deactivate signed pre-key"); done.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(done).UnwrapErr());
    }

    auto insert_result = Statement::Prepare(db_,
        "INSERT INTO signed_pre_keys "
        "(account_id, id, public_key, encrypted_private_key, signature, created_at, rotation_interval, active) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, 1)");
    if (insert_result.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(insert_result).UnwrapErr());
    }
    auto insert = std::move(insert_result).Unwrap();
    insert.Bind(1, account_id)
        .Bind(2, static_cast<int64_t>(record.GetId()))
        .Bind(3, std::span<const uint8_t>(record.GetPublicKey()))
        .Bind(4, std::span<const uint8_t>(record.GetEncryptedPrivateKey()))
        .Bind(5, std::span<const uint8_t>(record.GetSignature()))
        .Bind(6, ToMillis(record.GetCreatedAt()))
        .Bind(7, static_cast<int64_t>(record.GetRotationInterval().count()));
    if (auto done = insert.Step("insert signed pre-key"); done.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(done).UnwrapErr());
    }

    return tx.Commit();
}

Result<size_t, KeywardFailure>
SqliteKeyStore::PruneSignedPreKeys(const std::string_view account_id, const Timestamp superseded_before) {
    std::lock_guard lock(mutex_);

    auto stmt_result = Statement::Prepare(db_,
        "DELETE FROM signed_pre_keys WHERE account_id = ? AND active = 0 "
        "AND COALESCE(superseded_at, created_at + rotation_interval * 1000) < ?");
    if (stmt_result.IsErr()) {
        return Result<size_t, KeywardFailure>::Err(std::move(stmt_result).UnwrapErr());
    }
    auto stmt = std::move(stmt_result).Unwrap();
    stmt.Bind(1, account_id).Bind(2, ToMillis(superseded_before));
    if (auto done = stmt.Step("prune signed pre-keys"); done.IsErr()) {
        return Result<size_t, KeywardFailure>::Err(std::move(done).UnwrapErr());
    }
    return Result<size_t, KeywardFailure>::Ok(static_cast<size_t>(sqlite3_changes(db_)));
}

Result<uint32_t, KeywardFailure> SqliteKeyStore::CountUnusedPreKeys(const std::string_view account_id) {
    std::lock_guard lock(mutex_);

    auto stmt_result = Statement::Prepare(db_,
        "SELECT COUNT(*) FROM one_time_pre_keys WHERE account_id = ? AND used = 0");
    if (stmt_result.IsErr()) {
        return Result<uint32_t, KeywardFailure>::Err(std::move(stmt_result).UnwrapErr());
    }
    auto stmt = std::move(stmt_result).Unwrap();
    stmt.Bind(1, account_id);
    auto row = stmt.Step("count unused pre-keys");
    if (row.IsErr()) {
        return Result<uint32_t, KeywardFailure>::Err(std::move(row).UnwrapErr());
    }
    return Result<uint32_t, KeywardFailure>::Ok(static_cast<uint32_t>(stmt.ColumnInt64(0)));
}

Result<Unit, KeywardFailure>
SqliteKeyStore::StorePreKeyBatch(const std::string_view account_id, const std::vector<OneTimePreKeyRecord>& records) {
    std::lock_guard lock(mutex_);

    if (records.empty()) {
        return Result<Unit, KeywardFailure>::Ok(unit);
    }

    Transaction tx(db_);
    if (auto begin = tx.Begin(); begin.IsErr()) {
        return begin;
    }

    auto insert_result = Statement::Prepare(db_,
        "INSERT INTO one_time_pre_keys (account_id, id, public_key, encrypted_private_key, used, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?)");
    if (insert_result.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(insert_result).UnwrapErr());
    }
    auto insert = std::move(insert_result).Unwrap();
    for (const auto& record : records) {
        insert.Bind(1, account_id)
            .Bind(2, static_cast<int64_t>(record.GetId()))
            .Bind(3, std::span<const uint8_t>(record.GetPublicKey()))
            .Bind(4, std::span<const uint8_t>(record.GetEncryptedPrivateKey()))
            .Bind(5, static_cast<int64_t>(record.IsUsed() ? 1 : 0))
            .Bind(6, ToMillis(record.GetCreatedAt()));
        if (auto done = insert.Step("insert one-time pre-key"); done.IsErr()) {
            return Result<Unit, KeywardFailure>::Err(std::move(done).UnwrapErr());
        }
        insert.Reset();
    }

    return tx.Commit();
}

Result<std::optional<OneTimePreKeyRecord>, KeywardFailure>
SqliteKeyStore::LoadPreKey(const std::string_view account_id, const uint32_t pre_key_id) {
    using ResultType = Result<std::optional<OneTimePreKeyRecord>, KeywardFailure>;
    std::lock_guard lock(mutex_);

    auto stmt_result = Statement::Prepare(db_,
        "SELECT id, public_key, encrypted_private_key, used, created_at "
        "FROM one_time_pre_keys WHERE account_id = ? AND id = ?");
    if (stmt_result.IsErr()) {
        return ResultType::Err(std::move(stmt_result).UnwrapErr());
    }
    auto stmt = std::move(stmt_result).Unwrap();
    stmt.Bind(1, account_id).Bind(2, static_cast<int64_t>(pre_key_id));
    auto row = stmt.Step("load pre-key");
    if (row.IsErr()) {
        return ResultType::Err(std::move(row).UnwrapErr());
    }
    if (!row.Unwrap()) {
        return ResultType::Ok(std::nullopt);
    }
    return ResultType::Ok(ReadPreKey(stmt));
}

Result<std::vector<OneTimePreKeyRecord>, KeywardFailure>
SqliteKeyStore::LoadUnusedPreKeys(const std::string_view account_id, const uint32_t limit) {
    using ResultType = Result<std::vector<OneTimePreKeyRecord>, KeywardFailure>;
    std::lock_guard lock(mutex_);

    auto stmt_result = Statement::Prepare(db_,
        "SELECT id, public_key, encrypted_private_key, used, created_at "
        "FROM one_time_pre_keys WHERE account_id = ? AND used = 0 ORDER BY id ASC LIMIT ?");
    if (stmt_result.IsErr()) {
        return ResultType::Err(std::move(stmt_result).UnwrapErr());
    }
    auto stmt = std::move(stmt_result).Unwrap();
    stmt.Bind(1, account_id).Bind(2, static_cast<int64_t>(limit));

    std::vector<OneTimePreKeyRecord> records;
    while (true) {
        auto row = stmt.Step("load unused pre-keys");
        if (row.IsErr()) {
            return ResultType::Err(std::move(row).UnwrapErr());
        }
        if (!row.Unwrap()) {
            break;
        }
        records.push_back(ReadPreKey(stmt));
    }
    return ResultType::Ok(std::move(records));
}

Result<bool, KeywardFailure>
SqliteKeyStore::MarkPreKeyUsed(const std::string_view account_id, const uint32_t pre_key_id) {
    std::lock_guard lock(mutex_);

    auto update_result = Statement::Prepare(db_,
        "UPDATE one_time_pre_keys SET used = 1 WHERE account_id = ? AND id = ? AND used = 0");
    if (update_result.IsErr()) {
        return Result<bool, KeywardFailure>::Err(std::move(update_result).UnwrapErr());
    }
    auto update = std::move(update_result).Unwrap();
    update.Bind(1, account_id).Bind(2, static_cast<int64_t>(pre_key_id));
    if (auto done = update.Step("mark pre-key used"); done.IsErr()) {
        return Result<bool, KeywardFailure>::Err(std::move(done).UnwrapErr());
    }
    if (sqlite3_changes(db_) == 1) {
        return Result<bool, KeywardFailure>::Ok(true);
    }

    auto exists_result = Statement::Prepare(db_,
        "SELECT 1 FROM one_time_pre_keys WHERE account_id = ? AND id = ?");
    if (exists_result.IsErr()) {
        return Result<bool, KeywardFailure>::Err(std::move(exists_result).UnwrapErr());
    }
    auto exists = std::move(exists_result).Unwrap();
    exists.Bind(1, account_id).Bind(2, static_cast<int64_t>(pre_key_id));
    auto row = exists.Step("check pre-key");
    if (row.IsErr()) {
        return Result<bool, KeywardFailure>::Err(std::move(row).UnwrapErr());
    }
    if (!row.Unwrap()) {
        return Result<bool, KeywardFailure>::Err(
            KeywardFailure::NotFound(compat::format("{} (id {})", ErrorMessages::PRE_KEY_UNKNOWN, pre_key_id)));
    }
    return Result<bool, KeywardFailure>::Ok(false);
}

Result<uint32_t, KeywardFailure> SqliteKeyStore::MaxPreKeyId(const std::string_view account_id) {
    std::lock_guard lock(mutex_);

    auto stmt_result = Statement::Prepare(db_,
        "SELECT COALESCE(MAX(id), 0) FROM one_time_pre_keys WHERE account_id = ?");
    if (stmt_result.IsErr()) {
        return Result<uint32_t, KeywardFailure>::Err(std::move(stmt_result).UnwrapErr());
    }
    auto stmt = std::move(stmt_result).Unwrap();
    stmt.Bind(1, account_id);
    auto row = stmt.Step("max pre-key id");
    if (row.IsErr()) {
        return Result<uint32_t, KeywardFailure>::Err(std::move(row).UnwrapErr());
    }
    return Result<uint32_t, KeywardFailure>::Ok(static_cast<uint32_t>(stmt.ColumnInt64(0)));
}

Result<uint32_t, KeywardFailure> SqliteKeyStore::MaxSignedPreKeyId(const std::string_view account_id) {
    std::lock_guard lock(mutex_);

    auto stmt_result = Statement::Prepare(db_,
        "SELECT COALESCE(MAX(id), 0) FROM signed_pre_keys WHERE account_id = ?");
    if (stmt_result.IsErr()) {
        return Result<uint32_t, KeywardFailure>::Err(std::move(stmt_result).UnwrapErr());
    }
    auto stmt = std::move(stmt_result).Unwrap();
    stmt.Bind(1, account_id);
    auto row = stmt.Step("max signed pre-key id");
    if (row.IsErr()) {
        return Result<uint32_t, KeywardFailure>::Err(std::move(row).UnwrapErr());
    }
    return Result<uint32_t, KeywardFailure>::Ok(static_cast<uint32_t>(stmt.ColumnInt64(0)));
}

Result<Unit, KeywardFailure> SqliteKeyStore::DeleteAccount(const std::string_view account_id) {
    std::lock_guard lock(mutex_);

    Transaction tx(db_);
    if (auto begin = tx.Begin(); begin.IsErr()) {
        return begin;
    }
    for (const char* sql : {"DELETE FROM one_time_pre_keys WHERE account_id = ?",
                            "DELETE FROM signed_pre_keys WHERE account_id = ?",
                            "DELETE FROM identity_bundles WHERE account_id = ?"}) {
        auto stmt_result = Statement::Prepare(db_, sql);
        if (stmt_result.IsErr()) {
            return Result<Unit, KeywardFailure>::Err(std::move(stmt_result).UnwrapErr());
        }
        auto stmt = std::move(stmt_result).Unwrap();
        stmt.Bind(1, account_id);
        if (auto done = stmt.Step("delete account"); done.IsErr()) {
            return Result<Unit, KeywardFailure>::Err(std::move(done).UnwrapErr());
        }
    }
    if (auto commit = tx.Commit(); commit.IsErr()) {
        return commit;
    }
    log::Get(log::KEY_STORE_LOGGER)->info("Deleted all key records for account {}", account_id);
    return Result<Unit, KeywardFailure>::Ok(unit);
}

}
