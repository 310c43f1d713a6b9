#pragma once
#include "keyward/interfaces/i_key_store.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace keyward::e2ee::storage {

/**
 * Process-local IKeyStore. Conditional updates run under an exclusive lock,
 * so MarkPreKeyUsed is linearizable within the process.
 */
class InMemoryKeyStore final : public interfaces::IKeyStore {
public:
    InMemoryKeyStore();
    ~InMemoryKeyStore() override = default;

    InMemoryKeyStore(const InMemoryKeyStore&) = delete;
    InMemoryKeyStore& operator=(const InMemoryKeyStore&) = delete;

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

    [[nodiscard]] size_t GetAccountCount() const;

private:
    struct AccountRecords {
        std::optional<models::IdentityBundleRecord> identity;
        std::map<uint32_t, models::SignedPreKeyRecord> signed_pre_keys;
        std::map<uint32_t, models::OneTimePreKeyRecord> pre_keys;
    };

    // Null when the account has no records
    const AccountRecords* FindAccount(std::string_view account_id) const;
    AccountRecords& AccountFor(std::string_view account_id);

    std::unordered_map<std::string, AccountRecords> accounts_;
    mutable std::unique_ptr<std::shared_mutex> lock_;
};

}
