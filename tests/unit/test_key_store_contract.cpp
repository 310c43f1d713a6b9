#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include "keyward/storage/in_memory_key_store.hpp"
#include "keyward/storage/sqlite_key_store.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/configuration/key_manager_config.hpp"
#include <sqlite3.h>
#include <chrono>
#include <filesystem>
using namespace keyward::e2ee;
using namespace keyward::e2ee::models;
using namespace keyward::e2ee::storage;
namespace {
struct InMemoryStoreFactory {
    static std::shared_ptr<interfaces::IKeyStore> Make() {
        return std::make_shared<InMemoryKeyStore>();
    }
};
struct SqliteStoreFactory {
    static std::shared_ptr<interfaces::IKeyStore> Make() {
        auto store = SqliteKeyStore::Open(SqliteKeyStoreConfig{});
        REQUIRE(store.IsOk());
        return std::shared_ptr<interfaces::IKeyStore>(std::move(store).Unwrap());
    }
};
Timestamp Now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}
std::vector<uint8_t> Bytes(size_t size, uint8_t fill) {
    return std::vector<uint8_t>(size, fill);
}
SignedPreKeyRecord SignedRecord(uint32_t id, Timestamp created_at) {
    return SignedPreKeyRecord(id, Bytes(kX25519PublicKeyBytes, static_cast<uint8_t>(id)),
                              Bytes(kSealedKeyHeaderBytes + kX25519PrivateKeyBytes, 0xE0),
                              Bytes(kEd25519SignatureBytes, 0x51), created_at, kWeeklyRotation, true);
}
std::vector<OneTimePreKeyRecord> PreKeyBatch(uint32_t first_id, uint32_t count, Timestamp created_at) {
    std::vector<OneTimePreKeyRecord> records;
    for (uint32_t id = first_id; id < first_id + count; ++id) {
        records.emplace_back(id, Bytes(kX25519PublicKeyBytes, static_cast<uint8_t>(id)),
                             Bytes(kSealedKeyHeaderBytes + kX25519PrivateKeyBytes, 0xC0), created_at);
    }
    return records;
}
}
TEMPLATE_TEST_CASE("KeyStore - Identity bundles", "[key_store]", InMemoryStoreFactory, SqliteStoreFactory) {
    auto store = TestType::Make();
    const auto now = Now();
    SECTION("Absent identity loads as empty") {
        auto loaded = store->LoadIdentityBundle("alice");
        REQUIRE(loaded.IsOk());
        REQUIRE_FALSE(loaded.Unwrap().has_value());
    }
    SECTION("Upsert then load") {
        IdentityBundleRecord record(Bytes(32, 0x01), Bytes(93, 0x02), 77, now);
        REQUIRE(store->UpsertIdentityBundle("alice", record).IsOk());
        auto loaded = store->LoadIdentityBundle("alice");
        REQUIRE(loaded.Unwrap().has_value());
        REQUIRE(loaded.Unwrap()->GetIdentityPublicKey() == Bytes(32, 0x01));
        REQUIRE(loaded.Unwrap()->GetEncryptedIdentityPrivateKey() == Bytes(93, 0x02));
        REQUIRE(loaded.Unwrap()->GetRegistrationId() == 77);
        REQUIRE(loaded.Unwrap()->GetCreatedAt() == now);
    }
    SECTION("Second upsert replaces the first") {
        REQUIRE(store->UpsertIdentityBundle("alice", IdentityBundleRecord(Bytes(32, 0x01), Bytes(93, 0x02), 1, now)).IsOk());
        REQUIRE(store->UpsertIdentityBundle("alice", IdentityBundleRecord(Bytes(32, 0x03), Bytes(93, 0x04), 2, now)).IsOk());
        REQUIRE(store->LoadIdentityBundle("alice").Unwrap()->GetRegistrationId() == 2);
    }
    SECTION("Accounts are isolated") {
        REQUIRE(store->UpsertIdentityBundle("alice", IdentityBundleRecord(Bytes(32, 0x01), Bytes(93, 0x02), 1, now)).IsOk());
        REQUIRE_FALSE(store->LoadIdentityBundle("bob").Unwrap().has_value());
    }
}
TEMPLATE_TEST_CASE("KeyStore - Signed pre-keys", "[key_store]", InMemoryStoreFactory, SqliteStoreFactory) {
    auto store = TestType::Make();
    const auto now = Now();
    SECTION("Storing a new key deactivates the previous one") {
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(1, now)).IsOk());
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(2, now)).IsOk());
        auto active = store->LoadActiveSignedPreKey("alice");
        REQUIRE(active.Unwrap()->GetId() == 2);
        REQUIRE(active.Unwrap()->IsActive());
        auto previous = store->LoadSignedPreKey("alice", 1);
        REQUIRE(previous.Unwrap().has_value());
        REQUIRE_FALSE(previous.Unwrap()->IsActive());
        REQUIRE(store->MaxSignedPreKeyId("alice").Unwrap() == 2);
    }
    SECTION("Reusing an id is a conflict and leaves state unchanged") {
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(1, now)).IsOk());
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(2, now)).IsOk());
        auto result = store->StoreSignedPreKey("alice", SignedRecord(1, now));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == KeywardFailureType::Conflict);
        REQUIRE(store->LoadActiveSignedPreKey("alice").Unwrap()->GetId() == 2);
    }
    SECTION("Stored fields survive") {
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(5, now)).IsOk());
        auto loaded = store->LoadSignedPreKey("alice", 5).Unwrap();
        REQUIRE(loaded->GetSignature() == Bytes(kEd25519SignatureBytes, 0x51));
        REQUIRE(loaded->GetCreatedAt() == now);
        REQUIRE(loaded->GetRotationInterval() == kWeeklyRotation);
    }
    SECTION("Swap records when the previous key was superseded") {
        const auto replaced_at = now + std::chrono::hours(24 * 30);
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(1, now)).IsOk());
        REQUIRE_FALSE(store->LoadSignedPreKey("alice", 1).Unwrap()->GetSupersededAt().has_value());
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(2, replaced_at)).IsOk());
        auto previous = store->LoadSignedPreKey("alice", 1).Unwrap();
        REQUIRE(previous->GetSupersededAt() == replaced_at);
        REQUIRE(previous->GetGraceStartsAt() == replaced_at);
        REQUIRE_FALSE(store->LoadActiveSignedPreKey("alice").Unwrap()->GetSupersededAt().has_value());
    }
    SECTION("Prune goes by replacement time, not creation time") {
        const auto day = std::chrono::hours(24);
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(1, now - 30 * day)).IsOk());
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(2, now - 20 * day)).IsOk());
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(3, now - 3 * day)).IsOk());
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(4, now)).IsOk());
        // 1 was replaced 20 days ago; 2 was created 20 days ago but replaced only 3 days ago
        auto pruned = store->PruneSignedPreKeys("alice", now - 14 * day);
        REQUIRE(pruned.Unwrap() == 1);
        REQUIRE_FALSE(store->LoadSignedPreKey("alice", 1).Unwrap().has_value());
        REQUIRE(store->LoadSignedPreKey("alice", 2).Unwrap().has_value());
        REQUIRE(store->LoadSignedPreKey("alice", 3).Unwrap().has_value());
        REQUIRE(store->LoadActiveSignedPreKey("alice").Unwrap()->GetId() == 4);
        REQUIRE(store->PruneSignedPreKeys("alice", now - 3 * day).Unwrap() == 0);
        REQUIRE(store->PruneSignedPreKeys("alice", now).Unwrap() == 2);
    }
    SECTION("Active key is never pruned") {
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(1, now - std::chrono::hours(24 * 60))).IsOk());
        REQUIRE(store->PruneSignedPreKeys("alice", now).Unwrap() == 0);
        REQUIRE(store->LoadActiveSignedPreKey("alice").Unwrap().has_value());
    }
}
TEMPLATE_TEST_CASE("KeyStore - One-time pre-keys", "[key_store]", InMemoryStoreFactory, SqliteStoreFactory) {
    auto store = TestType::Make();
    const auto now = Now();
    REQUIRE(store->StorePreKeyBatch("alice", PreKeyBatch(1, 20, now)).IsOk());
    SECTION("Counting and listing") {
        REQUIRE(store->CountUnusedPreKeys("alice").Unwrap() == 20);
        REQUIRE(store->MaxPreKeyId("alice").Unwrap() == 20);
        auto listed = store->LoadUnusedPreKeys("alice", 5);
        REQUIRE(listed.Unwrap().size() == 5);
        REQUIRE(listed.Unwrap().front().GetId() == 1);
        REQUIRE(listed.Unwrap().back().GetId() == 5);
    }
    SECTION("Mark used succeeds exactly once") {
        REQUIRE(store->MarkPreKeyUsed("alice", 4).Unwrap());
        REQUIRE_FALSE(store->MarkPreKeyUsed("alice", 4).Unwrap());
        REQUIRE(store->LoadPreKey("alice", 4).Unwrap()->IsUsed());
        REQUIRE(store->CountUnusedPreKeys("alice").Unwrap() == 19);
        for (const auto& record : store->LoadUnusedPreKeys("alice", 100).Unwrap()) {
            REQUIRE(record.GetId() != 4);
        }
    }
    SECTION("Unknown id") {
        auto result = store->MarkPreKeyUsed("alice", 999);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == KeywardFailureType::NotFound);
        REQUIRE_FALSE(store->LoadPreKey("alice", 999).Unwrap().has_value());
    }
    SECTION("Batch with a duplicate id stores nothing") {
        auto overlapping = PreKeyBatch(18, 5, now);
        auto result = store->StorePreKeyBatch("alice", overlapping);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == KeywardFailureType::Conflict);
        REQUIRE(store->CountUnusedPreKeys("alice").Unwrap() == 20);
        REQUIRE_FALSE(store->LoadPreKey("alice", 21).Unwrap().has_value());
    }
    SECTION("Empty account") {
        REQUIRE(store->CountUnusedPreKeys("bob").Unwrap() == 0);
        REQUIRE(store->MaxPreKeyId("bob").Unwrap() == 0);
        REQUIRE(store->LoadUnusedPreKeys("bob", 10).Unwrap().empty());
    }
    SECTION("Delete account removes everything") {
        REQUIRE(store->StoreSignedPreKey("alice", SignedRecord(1, now)).IsOk());
        REQUIRE(store->DeleteAccount("alice").IsOk());
        REQUIRE(store->CountUnusedPreKeys("alice").Unwrap() == 0);
        REQUIRE_FALSE(store->LoadActiveSignedPreKey("alice").Unwrap().has_value());
    }
    SECTION("Conditional update is atomic") {
        REQUIRE(store->SupportsAtomicConditionalUpdate());
    }
}
TEST_CASE("SqliteKeyStore - Persistence across connections", "[key_store][sqlite]") {
    const auto path = std::filesystem::temp_directory_path() / "keyward_store_persistence_test.db";
    std::filesystem::remove(path);
    SqliteKeyStoreConfig config;
    config.database_path = path.string();
    const auto now = Now();
    {
        auto store = SqliteKeyStore::Open(config);
        REQUIRE(store.IsOk());
        REQUIRE(store.Unwrap()->StorePreKeyBatch("alice", PreKeyBatch(1, 3, now)).IsOk());
        REQUIRE(store.Unwrap()->MarkPreKeyUsed("alice", 2).Unwrap());
    }
    {
        auto store = SqliteKeyStore::Open(config);
        REQUIRE(store.IsOk());
        REQUIRE(store.Unwrap()->CountUnusedPreKeys("alice").Unwrap() == 2);
        REQUIRE_FALSE(store.Unwrap()->MarkPreKeyUsed("alice", 2).Unwrap());
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
}
TEST_CASE("SqliteKeyStore - Unusable path", "[key_store][sqlite]") {
    SqliteKeyStoreConfig config;
    config.database_path = "/nonexistent-directory/keyward/keys.db";
    auto store = SqliteKeyStore::Open(config);
    REQUIRE(store.IsErr());
    REQUIRE(store.UnwrapErr().type == KeywardFailureType::Storage);
}
TEST_CASE("SqliteKeyStore - Writes blocked past storage_timeout fail with Timeout", "[key_store][sqlite]") {
    const auto path = std::filesystem::temp_directory_path() / "keyward_store_timeout_test.db";
    std::filesystem::remove(path);
    auto manager_config = configuration::KeyManagerConfig::Default();
    manager_config.storage_timeout = std::chrono::milliseconds{50};
    const auto config = SqliteKeyStoreConfig::For(manager_config, path.string());
    REQUIRE(config.busy_timeout == manager_config.storage_timeout);
    REQUIRE(config.database_path == path.string());

    auto opened = SqliteKeyStore::Open(config);
    REQUIRE(opened.IsOk());
    auto store = std::move(opened).Unwrap();
    REQUIRE(store->StorePreKeyBatch("alice", PreKeyBatch(1, 2, Now())).IsOk());

    // Another process holding the write lock
    sqlite3* other = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &other) == SQLITE_OK);
    REQUIRE(sqlite3_exec(other, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK);

    const auto started = std::chrono::steady_clock::now();
    auto blocked = store->StorePreKeyBatch("alice", PreKeyBatch(3, 2, Now()));
    const auto waited = std::chrono::steady_clock::now() - started;
    REQUIRE(blocked.IsErr());
    REQUIRE(blocked.UnwrapErr().type == KeywardFailureType::Timeout);
    REQUIRE(blocked.UnwrapErr().IsRetryable());
    REQUIRE(waited >= std::chrono::milliseconds{40});
    REQUIRE(waited < std::chrono::seconds{2});

    REQUIRE(sqlite3_exec(other, "ROLLBACK", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(other);
    REQUIRE(store->StorePreKeyBatch("alice", PreKeyBatch(3, 2, Now())).IsOk());
    REQUIRE(store->CountUnusedPreKeys("alice").Unwrap() == 4);

    store.reset();
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
}
