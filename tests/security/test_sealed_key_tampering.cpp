#include <catch2/catch_test_macros.hpp>
#include "keyward/manager/key_manager.hpp"
#include "keyward/storage/in_memory_key_store.hpp"
#include "keyward/core/constants.hpp"
#include "helpers/key_manager_fixture.hpp"
#include <vector>

using namespace keyward::e2ee;
using namespace keyward::e2ee::manager;
using namespace keyward::e2ee::test_helpers;
using keyward::e2ee::models::IdentityBundleRecord;
using keyward::e2ee::models::OneTimePreKeyRecord;
using keyward::e2ee::models::SignedPreKeyRecord;
using keyward::e2ee::storage::InMemoryKeyStore;

namespace {

std::vector<uint8_t> Flip(std::vector<uint8_t> bytes, const size_t index) {
    bytes[index] ^= 0x01;
    return bytes;
}

OneTimePreKeyRecord WithBlob(const OneTimePreKeyRecord& record, std::vector<uint8_t> blob) {
    return OneTimePreKeyRecord(record.GetId(), record.GetPublicKey(), std::move(blob), record.GetCreatedAt());
}

OneTimePreKeyRecord LoadPreKey(InMemoryKeyStore& store, const std::string& account, const uint32_t id) {
    auto loaded = store.LoadPreKey(account, id);
    REQUIRE(loaded.IsOk());
    REQUIRE(loaded.Unwrap().has_value());
    return *loaded.Unwrap();
}

}

TEST_CASE("Security - Tampered one-time pre-key blobs never open", "[security][tampering]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto config = SmallPoolConfig();
    config.pre_key_target_pool_size = 64;
    auto source_store = std::make_shared<InMemoryKeyStore>();
    auto source = MakeManager(source_store, config, clock);
    REQUIRE(source->Initialize("alice").IsOk());

    const size_t blob_size = LoadPreKey(*source_store, "alice", 1).GetEncryptedPrivateKey().size();
    REQUIRE(blob_size == kSealedKeyHeaderBytes + kX25519PrivateKeyBytes);
    REQUIRE(blob_size <= config.pre_key_target_pool_size);

    // Pre-key n carries its own blob with byte n-1 flipped, version byte included
    std::vector<OneTimePreKeyRecord> tampered;
    for (uint32_t id = 1; id <= blob_size; ++id) {
        const auto original = LoadPreKey(*source_store, "alice", id);
        tampered.push_back(WithBlob(original, Flip(original.GetEncryptedPrivateKey(), id - 1)));
    }
    auto target_store = std::make_shared<InMemoryKeyStore>();
    REQUIRE(target_store->StorePreKeyBatch("alice", tampered).IsOk());
    auto target = MakeManager(target_store, config, clock);

    for (uint32_t id = 1; id <= blob_size; ++id) {
        auto consumed = target->ConsumePreKey("alice", id);
        REQUIRE(consumed.IsErr());
        REQUIRE(consumed.UnwrapErr().type == KeywardFailureType::Authentication);
        REQUIRE(consumed.UnwrapErr().IsFatal());
    }

    REQUIRE(target_store->CountUnusedPreKeys("alice").Unwrap() == blob_size);
    const auto stats = target->GetStatistics();
    REQUIRE(stats.authentication_failures == blob_size);
    REQUIRE(stats.pre_keys_consumed == 0);
}

TEST_CASE("Security - Truncated one-time pre-key blob is an authentication failure", "[security][tampering]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto source_store = std::make_shared<InMemoryKeyStore>();
    auto source = MakeManager(source_store, SmallPoolConfig(), clock);
    REQUIRE(source->Initialize("alice").IsOk());

    const auto original = LoadPreKey(*source_store, "alice", 1);
    std::vector<uint8_t> truncated(
        original.GetEncryptedPrivateKey().begin(),
        original.GetEncryptedPrivateKey().begin() + kSealedKeyHeaderBytes - 1);
    auto target_store = std::make_shared<InMemoryKeyStore>();
    REQUIRE(target_store->StorePreKeyBatch("alice", {WithBlob(original, std::move(truncated))}).IsOk());
    auto target = MakeManager(target_store, SmallPoolConfig(), clock);

    auto consumed = target->ConsumePreKey("alice", 1);
    REQUIRE(consumed.IsErr());
    REQUIRE(consumed.UnwrapErr().type == KeywardFailureType::Authentication);
    REQUIRE(target->GetStatistics().authentication_failures == 1);
    REQUIRE(target_store->LoadPreKey("alice", 1).Unwrap()->IsUsed() == false);
}

TEST_CASE("Security - Sealed blobs are bound to their record", "[security][tampering]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto source_store = std::make_shared<InMemoryKeyStore>();
    auto source = MakeManager(source_store, SmallPoolConfig(), clock);
    REQUIRE(source->Initialize("alice").IsOk());
    REQUIRE(source->Initialize("bob").IsOk());

    auto target_store = std::make_shared<InMemoryKeyStore>();
    auto target = MakeManager(target_store, SmallPoolConfig(), clock);

    SECTION("One-time pre-key blob moved to another id") {
        const auto first = LoadPreKey(*source_store, "alice", 1);
        const auto second = LoadPreKey(*source_store, "alice", 2);
        REQUIRE(target_store->StorePreKeyBatch("alice", {WithBlob(first, second.GetEncryptedPrivateKey())}).IsOk());

        auto consumed = target->ConsumePreKey("alice", 1);
        REQUIRE(consumed.IsErr());
        REQUIRE(consumed.UnwrapErr().type == KeywardFailureType::Authentication);
        REQUIRE(target_store->LoadPreKey("alice", 1).Unwrap()->IsUsed() == false);
    }

    SECTION("One-time pre-key blob moved to another account") {
        const auto bobs = LoadPreKey(*source_store, "bob", 3);
        REQUIRE(target_store->StorePreKeyBatch("alice", {bobs}).IsOk());

        auto consumed = target->ConsumePreKey("alice", 3);
        REQUIRE(consumed.IsErr());
        REQUIRE(consumed.UnwrapErr().type == KeywardFailureType::Authentication);
    }

    SECTION("Signed pre-key blob moved to another id") {
        REQUIRE(source->RotateSignedPreKey("alice").IsOk());
        const auto newer = source_store->LoadActiveSignedPreKey("alice").Unwrap();
        REQUIRE(newer.has_value());
        const auto older = source_store->LoadSignedPreKey("alice", newer->GetId() - 1).Unwrap();
        REQUIRE(older.has_value());

        const SignedPreKeyRecord forged(
            older->GetId(),
            older->GetPublicKey(),
            newer->GetEncryptedPrivateKey(),
            older->GetSignature(),
            older->GetCreatedAt(),
            older->GetRotationInterval());
        REQUIRE(target_store->StoreSignedPreKey("alice", forged).IsOk());

        auto by_id = target->GetSignedPreKeyPairById("alice", older->GetId());
        REQUIRE(by_id.IsErr());
        REQUIRE(by_id.UnwrapErr().type == KeywardFailureType::Authentication);
    }

    SECTION("Identity blob moved to another account") {
        const auto bobs = source_store->LoadIdentityBundle("bob").Unwrap();
        REQUIRE(bobs.has_value());
        REQUIRE(target_store->UpsertIdentityBundle("alice", *bobs).IsOk());

        auto initialized = target->Initialize("alice");
        REQUIRE(initialized.IsErr());
        REQUIRE(initialized.UnwrapErr().type == KeywardFailureType::Authentication);
        REQUIRE(target->GetAccountState("alice") == AccountState::Uninitialized);
        // The unreadable identity is reported, never silently replaced
        REQUIRE(target->GetStatistics().identity_keys_generated == 0);
        REQUIRE(target_store->LoadIdentityBundle("alice").Unwrap()->GetIdentityPublicKey() ==
                bobs->GetIdentityPublicKey());
    }
}

TEST_CASE("Security - Identity record with mismatched halves", "[security][tampering]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto source_store = std::make_shared<InMemoryKeyStore>();
    auto source = MakeManager(source_store, SmallPoolConfig(), clock);
    REQUIRE(source->Initialize("alice").IsOk());
    REQUIRE(source->Initialize("bob").IsOk());

    const auto alices = source_store->LoadIdentityBundle("alice").Unwrap();
    const auto bobs = source_store->LoadIdentityBundle("bob").Unwrap();
    REQUIRE(alices.has_value());
    REQUIRE(bobs.has_value());

    // Alice's sealed private key still opens under her account, but the published half is Bob's
    const IdentityBundleRecord forged(
        bobs->GetIdentityPublicKey(),
        alices->GetEncryptedIdentityPrivateKey(),
        alices->GetRegistrationId(),
        alices->GetCreatedAt());
    auto target_store = std::make_shared<InMemoryKeyStore>();
    REQUIRE(target_store->UpsertIdentityBundle("alice", forged).IsOk());
    auto target = MakeManager(target_store, SmallPoolConfig(), clock);

    auto identity = target->GetIdentityKeyPair("alice");
    REQUIRE(identity.IsErr());
    REQUIRE(identity.UnwrapErr().type == KeywardFailureType::InvalidState);

    auto initialized = target->Initialize("alice");
    REQUIRE(initialized.IsErr());
    REQUIRE(initialized.UnwrapErr().type == KeywardFailureType::InvalidState);
    REQUIRE(target->GetStatistics().authentication_failures == 0);
}

TEST_CASE("Security - Wrong master key leaves stored keys untouched", "[security][tampering]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto store = std::make_shared<InMemoryKeyStore>();
    auto owner = MakeManager(store, SmallPoolConfig(), clock, 0x11);
    REQUIRE(owner->Initialize("alice").IsOk());
    const auto unused_before = store->CountUnusedPreKeys("alice").Unwrap();

    auto intruder = MakeManager(store, SmallPoolConfig(), clock, 0x22);
    auto consumed = intruder->ConsumePreKey("alice", 1);
    REQUIRE(consumed.IsErr());
    REQUIRE(consumed.UnwrapErr().type == KeywardFailureType::Authentication);
    REQUIRE(store->CountUnusedPreKeys("alice").Unwrap() == unused_before);

    REQUIRE(owner->ConsumePreKey("alice", 1).IsOk());
}
