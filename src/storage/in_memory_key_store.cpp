#include "keyward/storage/in_memory_key_store.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/core/log.hpp"

#include <mutex>

namespace keyward::e2ee::storage {

using models::IdentityBundleRecord;
using models::OneTimePreKeyRecord;
using models::SignedPreKeyRecord;

InMemoryKeyStore::InMemoryKeyStore()
    : lock_(std::make_unique<std::shared_mutex>()) {
}

const InMemoryKeyStore::AccountRecords* InMemoryKeyStore::FindAccount(const std::string_view account_id) const {
    const auto it = accounts_.find(std::string(account_id));
    return it == accounts_.end() ? nullptr : &it->second;
}

InMemoryKeyStore::AccountRecords& InMemoryKeyStore::AccountFor(const std::string_view account_id) {
    return accounts_[std::string(account_id)];
}

Result<std::optional<IdentityBundleRecord>, KeywardFailure>
InMemoryKeyStore::LoadIdentityBundle(const std::string_view account_id) {
    std::shared_lock lock(*lock_);
    const auto* account = FindAccount(account_id);
    if (account == nullptr) {
        return Result<std::optional<IdentityBundleRecord>, KeywardFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<IdentityBundleRecord>, KeywardFailure>::Ok(account->identity);
}

Result<Unit, KeywardFailure>
InMemoryKeyStore::UpsertIdentityBundle(const std::string_view account_id, const IdentityBundleRecord& bundle) {
    std::unique_lock lock(*lock_);
    AccountFor(account_id).identity = bundle;
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<std::optional<SignedPreKeyRecord>, KeywardFailure>
InMemoryKeyStore::LoadActiveSignedPreKey(const std::string_view account_id) {
    std::shared_lock lock(*lock_);
    if (const auto* account = FindAccount(account_id)) {
        for (const auto& [id, record] : account->signed_pre_keys) {
            if (record.IsActive()) {
                return Result<std::optional<SignedPreKeyRecord>, KeywardFailure>::Ok(record);
            }
        }
    }
    return Result<std::optional<SignedPreKeyRecord>, KeywardFailure>::Ok(std::nullopt);
}

Result<std::optional<SignedPreKeyRecord>, KeywardFailure>
InMemoryKeyStore::LoadSignedPreKey(const std::string_view account_id, const uint32_t signed_pre_key_id) {
    std::shared_lock lock(*lock_);
    if (const auto* account = FindAccount(account_id)) {
        if (const auto it = account->signed_pre_keys.find(signed_pre_key_id);
            it != account->signed_pre_keys.end()) {
            return Result<std::optional<SignedPreKeyRecord>, KeywardFailure>::Ok(it->second);
        }
    }
    return Result<std::optional<SignedPreKeyRecord>, KeywardFailure>::Ok(std::nullopt);
}

Result<Unit, KeywardFailure>
InMemoryKeyStore::StoreSignedPreKey(const std::string_view account_id, const SignedPreKeyRecord& record) {
    std::unique_lock lock(*lock_);
    auto& account = AccountFor(account_id);
    if (account.signed_pre_keys.contains(record.GetId())) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::Conflict(
                compat::format("Signed pre-key {} already exists", record.GetId())));
    }
    for (auto& [id, existing] : account.signed_pre_keys) {
        if (existing.IsActive()) {
            existing.Supersede(record.GetCreatedAt());
        }
    }
    SignedPreKeyRecord stored = record;
    stored.Activate();
    account.signed_pre_keys.emplace(stored.GetId(), std::move(stored));
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<size_t, KeywardFailure>
InMemoryKeyStore::PruneSignedPreKeys(const std::string_view account_id, const models::Timestamp superseded_before) {
    std::unique_lock lock(*lock_);
    const auto it = accounts_.find(std::string(account_id));
    if (it == accounts_.end()) {
        return Result<size_t, KeywardFailure>::Ok(0);
    }
    const size_t removed = std::erase_if(it->second.signed_pre_keys, [superseded_before](const auto& entry) {
        return !entry.second.IsActive() && entry.second.GetGraceStartsAt() < superseded_before;
    });
    return Result<size_t, KeywardFailure>::Ok(removed);
}

Result<uint32_t, KeywardFailure>
InMemoryKeyStore::CountUnusedPreKeys(const std::string_view account_id) {
    std::shared_lock lock(*lock_);
    uint32_t count = 0;
    if (const auto* account = FindAccount(account_id)) {
        for (const auto& [id, record] : account->pre_keys) {
            if (!record.IsUsed()) {
                ++count;
            }
        }
    }
    return Result<uint32_t, KeywardFailure>::Ok(count);
}

Result<Unit, KeywardFailure>
InMemoryKeyStore::StorePreKeyBatch(const std::string_view account_id, const std::vector<OneTimePreKeyRecord>& records) {
    std::unique_lock lock(*lock_);
    auto& account = AccountFor(account_id);
    std::map<uint32_t, OneTimePreKeyRecord> staged;
    for (const auto& record : records) {
        if (account.pre_keys.contains(record.GetId()) || staged.contains(record.GetId())) {
            return Result<Unit, KeywardFailure>::Err(
                KeywardFailure::Conflict(
                    compat::format("One-time pre-key {} already exists", record.GetId())));
        }
        staged.emplace(record.GetId(), record);
    }
    account.pre_keys.merge(staged);
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<std::optional<OneTimePreKeyRecord>, KeywardFailure>
InMemoryKeyStore::LoadPreKey(const std::string_view account_id, const uint32_t pre_key_id) {
    std::shared_lock lock(*lock_);
    if (const auto* account = FindAccount(account_id)) {
        if (const auto it = account->pre_keys.find(pre_key_id); it != account->pre_keys.end()) {
            return Result<std::optional<OneTimePreKeyRecord>, KeywardFailure>::Ok(it->second);
        }
    }
    return Result<std::optional<OneTimePreKeyRecord>, KeywardFailure>::Ok(std::nullopt);
}

Result<std::vector<OneTimePreKeyRecord>, KeywardFailure>
InMemoryKeyStore::LoadUnusedPreKeys(const std::string_view account_id, const uint32_t limit) {
    std::shared_lock lock(*lock_);
    std::vector<OneTimePreKeyRecord> unused;
    if (const auto* account = FindAccount(account_id)) {
        for (const auto& [id, record] : account->pre_keys) {
            if (unused.size() >= limit) {
                break;
            }
            if (!record.IsUsed()) {
                unused.push_back(record);
            }
        }
    }
    return Result<std::vector<OneTimePreKeyRecord>, KeywardFailure>::Ok(std::move(unused));
}

Result<bool, KeywardFailure>
InMemoryKeyStore::MarkPreKeyUsed(const std::string_view account_id, const uint32_t pre_key_id) {
    std::unique_lock lock(*lock_);
    const auto account_it = accounts_.find(std::string(account_id));
    if (account_it == accounts_.end()) {
        return Result<bool, KeywardFailure>::Err(
            KeywardFailure::NotFound(compat::format("{} (id {})", ErrorMessages::PRE_KEY_UNKNOWN, pre_key_id)));
    }
    const auto it = account_it->second.pre_keys.find(pre_key_id);
    if (it == account_it->second.pre_keys.end()) {
        return Result<bool, KeywardFailure>::Err(
            KeywardFailure::NotFound(compat::format("{} (id {})", ErrorMessages::PRE_KEY_UNKNOWN, pre_key_id)));
    }
    if (it->second.IsUsed()) {
        return Result<bool, KeywardFailure>::Ok(false);
    }
    it->second.MarkUsed();
    return Result<bool, KeywardFailure>::Ok(true);
}

Result<uint32_t, KeywardFailure> InMemoryKeyStore::MaxPreKeyId(const std::string_view account_id) {
    std::shared_lock lock(*lock_);
    const auto* account = FindAccount(account_id);
    if (account == nullptr || account->pre_keys.empty()) {
        return Result<uint32_t, KeywardFailure>::Ok(0);
    }
    return Result<uint32_t, KeywardFailure>::Ok(account->pre_keys.rbegin()->first);
}

Result<uint32_t, KeywardFailure> InMemoryKeyStore::MaxSignedPreKeyId(const std::string_view account_id) {
    std::shared_lock lock(*lock_);
    const auto* account = FindAccount(account_id);
    if (account == nullptr || account->signed_pre_keys.empty()) {
        return Result<uint32_t, KeywardFailure>::Ok(0);
    }
    return Result<uint32_t, KeywardFailure>::Ok(account->signed_pre_keys.rbegin()->first);
}

Result<Unit, KeywardFailure> InMemoryKeyStore::DeleteAccount(const std::string_view account_id) {
    std::unique_lock lock(*lock_);
    if (accounts_.erase(std::string(account_id)) > 0) {
        log::Get(log::KEY_STORE_LOGGER)->info("Deleted all key records for account {}", account_id);
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}

size_t InMemoryKeyStore::GetAccountCount() const {
    std::shared_lock lock(*lock_);
    return accounts_.size();
}

}
