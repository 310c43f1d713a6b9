#include "keyward/manager/key_manager.hpp"
#include "keyward/crypto/key_material_factory.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"
#include "keyward/core/log.hpp"

#include <algorithm>
#include <mutex>
#include <optional>

namespace keyward::e2ee::manager {

using crypto::KeyMaterialFactory;
using models::IdentityBundleRecord;
using models::IdentityKeyPair;
using models::OneTimePreKeyPair;
using models::OneTimePreKeyRecord;
using models::SignedPreKeyPair;
using models::SignedPreKeyRecord;

struct KeyManager::AccountSlot {
    std::mutex init_mutex;
    std::mutex maintenance_mutex;
    // Only taken when the store cannot mark a pre-key used atomically
    std::mutex consume_mutex;

    std::atomic<AccountState> state{AccountState::Uninitialized};

    std::mutex cache_mutex;
    std::optional<IdentityKeyPair> identity;
    std::optional<uint32_t> registration_id;
    std::optional<SignedPreKeyPair> signed_pre_key;
    models::Timestamp signed_pre_key_checked_at{};

    void ClearCache() {
        identity.reset();
        registration_id.reset();
        signed_pre_key.reset();
        signed_pre_key_checked_at = {};
    }
};

namespace {

std::shared_ptr<spdlog::logger> Logger() {
    return log::Get(log::KEY_MANAGER_LOGGER);
}

Result<Unit, KeywardFailure> ValidateAccountId(const std::string_view account_id) {
    if (account_id.empty()) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(std::string(ErrorMessages::ACCOUNT_ID_EMPTY)));
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}

// label || 0x00 || account id || 0x00 || key id (big-endian)
std::vector<uint8_t> SealContext(
    const std::string_view label,
    const std::string_view account_id,
    const uint32_t key_id) {
    std::vector<uint8_t> context;
    context.reserve(label.size() + account_id.size() + 6);
    context.insert(context.end(), label.begin(), label.end());
    context.push_back(0);
    context.insert(context.end(), account_id.begin(), account_id.end());
    context.push_back(0);
    for (int shift = 24; shift >= 0; shift -= 8) {
        context.push_back(static_cast<uint8_t>(key_id >> shift));
    }
    return context;
}

void LogFailure(const std::string_view operation, const std::string_view account_id, const KeywardFailure& failure) {
    if (failure.IsFatal()) {
        Logger()->error("{} failed for account {}: [{}] {}",
            operation, account_id, FailureTypeName(failure.type), failure.message);
    } else if (failure.IsRetryable()) {
        Logger()->warn("{} failed for account {}: [{}] {}",
            operation, account_id, FailureTypeName(failure.type), failure.message);
    } else {
        Logger()->debug("{} failed for account {}: [{}] {}",
            operation, account_id, FailureTypeName(failure.type), failure.message);
    }
}

}

std::string_view AccountStateName(const AccountState state) noexcept {
    switch (state) {
        case AccountState::Uninitialized: return "uninitialized";
        case AccountState::Bootstrapping: return "bootstrapping";
        case AccountState::Ready: return "ready";
    }
    return "unknown";
}

// ============================================================================
// Construction
// ============================================================================

KeyManager::KeyManager(
    const configuration::KeyManagerConfig& config,
    std::shared_ptr<interfaces::IKeyStore> store,
    std::unique_ptr<crypto::KeyEncryptionUnit> encryption_unit,
    Clock clock)
    : config_(config)
    , store_(std::move(store))
    , encryption_unit_(std::move(encryption_unit))
    , clock_(std::move(clock))
    , accounts_lock_(std::make_unique<std::shared_mutex>()) {
}

KeyManager::~KeyManager() = default;

Result<std::unique_ptr<KeyManager>, KeywardFailure> KeyManager::Create(
    const configuration::KeyManagerConfig& config,
    std::shared_ptr<interfaces::IKeyStore> store,
    std::unique_ptr<crypto::KeyEncryptionUnit> encryption_unit,
    Clock clock) {
    using ResultType = Result<std::unique_ptr<KeyManager>, KeywardFailure>;

    if (auto valid = config.Validate(); valid.IsErr()) {
        return ResultType::Err(std::move(valid).UnwrapErr());
    }
    if (!store) {
        return ResultType::Err(KeywardFailure::InvalidInput("Key store is required"));
    }
    if (!encryption_unit) {
        return ResultType::Err(KeywardFailure::InvalidInput("Key encryption unit is required"));
    }
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return ResultType::Err(KeywardFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    if (!clock) {
        clock = [] { return std::chrono::system_clock::now(); };
    }
    if (!store->SupportsAtomicConditionalUpdate()) {
        Logger()->warn("Key store lacks atomic conditional updates; pre-key consumption is "
                       "serialized in-process only and is unsafe across multiple processes");
    }
    return ResultType::Ok(std::unique_ptr<KeyManager>(
        new KeyManager(config, std::move(store), std::move(encryption_unit), std::move(clock))));
}

std::shared_ptr<KeyManager::AccountSlot> KeyManager::FindSlot(const std::string_view account_id) const {
    std::shared_lock lock(*accounts_lock_);
    const auto it = accounts_.find(std::string(account_id));
    return it == accounts_.end() ? nullptr : it->second;
}

std::shared_ptr<KeyManager::AccountSlot> KeyManager::SlotFor(const std::string_view account_id) {
    if (auto existing = FindSlot(account_id)) {
        return existing;
    }
    std::unique_lock lock(*accounts_lock_);
    auto [it, inserted] = accounts_.try_emplace(std::string(account_id), nullptr);
    if (inserted) {
        it->second = std::make_shared<AccountSlot>();
    }
    return it->second;
}

// ============================================================================
// Record decryption
// ============================================================================

Result<IdentityKeyPair, KeywardFailure> KeyManager::OpenIdentity(
    const std::string_view account_id,
    const IdentityBundleRecord& record) {
    using ResultType = Result<IdentityKeyPair, KeywardFailure>;

    auto public_key = models::IdentityPublicKey::FromBytes(record.GetIdentityPublicKeySpan());
    if (public_key.IsErr()) {
        return ResultType::Err(KeywardFailure::Decode(public_key.UnwrapErr().message));
    }
    auto opened = encryption_unit_->Decrypt(
        record.GetEncryptedIdentityPrivateKey(),
        SealContext(kSealLabelIdentity, account_id, 0));
    if (opened.IsErr()) {
        return ResultType::Err(std::move(opened).UnwrapErr());
    }
    auto private_key = models::IdentityPrivateKey::FromHandle(std::move(opened).Unwrap());
    if (private_key.IsErr()) {
        return ResultType::Err(KeywardFailure::Decode(private_key.UnwrapErr().message));
    }

    // The Ed25519 secret key embeds its public key in the upper 32 bytes
    const auto& expected_public = public_key.Unwrap();
    auto matches = private_key.Unwrap().GetHandle().WithReadAccess(
        [&expected_public](std::span<const uint8_t> secret_key) {
            auto eq = crypto::SodiumInterop::ConstantTimeEquals(
                secret_key.subspan(kEd25519SecretKeyBytes - kEd25519PublicKeyBytes),
                expected_public.AsSpan());
            return eq.IsOk() && eq.Unwrap();
        });
    if (matches.IsErr() || !matches.Unwrap()) {
        return ResultType::Err(KeywardFailure::InvalidState(
            compat::format("Identity record for account {} holds mismatched key halves", account_id)));
    }

    return ResultType::Ok(IdentityKeyPair(
        0, std::move(public_key).Unwrap(), std::move(private_key).Unwrap()));
}

Result<SignedPreKeyPair, KeywardFailure> KeyManager::OpenSignedPreKey(
    const std::string_view account_id,
    const SignedPreKeyRecord& record) {
    using ResultType = Result<SignedPreKeyPair, KeywardFailure>;

    auto public_key = models::SignedPreKeyPublicKey::FromBytes(record.GetPublicKeySpan());
    if (public_key.IsErr()) {
        return ResultType::Err(KeywardFailure::Decode(public_key.UnwrapErr().message));
    }
    auto opened = encryption_unit_->Decrypt(
        record.GetEncryptedPrivateKey(),
        SealContext(kSealLabelSignedPreKey, account_id, record.GetId()));
    if (opened.IsErr()) {
        return ResultType::Err(std::move(opened).UnwrapErr());
    }
    auto private_key = models::SignedPreKeyPrivateKey::FromHandle(std::move(opened).Unwrap());
    if (private_key.IsErr()) {
        return ResultType::Err(KeywardFailure::Decode(private_key.UnwrapErr().message));
    }
    return ResultType::Ok(SignedPreKeyPair(
        record.GetId(), std::move(public_key).Unwrap(), std::move(private_key).Unwrap()));
}

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, KeywardFailure> KeyManager::EnsureIdentity(const std::string_view account_id, AccountSlot& slot) {
    {
        std::lock_guard cache(slot.cache_mutex);
        if (slot.identity) {
            return Result<Unit, KeywardFailure>::Ok(unit);
        }
    }

    auto loaded = store_->LoadIdentityBundle(account_id);
    if (loaded.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(loaded).UnwrapErr());
    }
    if (const auto& record = loaded.Unwrap()) {
        auto pair = OpenIdentity(account_id, *record);
        if (pair.IsErr()) {
            return Result<Unit, KeywardFailure>::Err(std::move(pair).UnwrapErr());
        }
        std::lock_guard cache(slot.cache_mutex);
        slot.identity.emplace(std::move(pair).Unwrap());
        slot.registration_id = record->GetRegistrationId();
        return Result<Unit, KeywardFailure>::Ok(unit);
    }

    Logger()->debug("No identity stored for account {}; generating one", account_id);
    auto generated = KeyMaterialFactory::GenerateIdentityKeyPair();
    if (generated.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(generated).UnwrapErr());
    }
    IdentityKeyPair pair = std::move(generated).Unwrap();
    const uint32_t registration_id = KeyMaterialFactory::GenerateRegistrationId();

    auto sealed = encryption_unit_->Encrypt(
        pair.GetPrivateKey().GetHandle(),
        SealContext(kSealLabelIdentity, account_id, 0));
    if (sealed.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(sealed).UnwrapErr());
    }
    const IdentityBundleRecord record(
        pair.GetPublicKey().GetBytesCopy(),
        std::move(sealed).Unwrap(),
        registration_id,
        clock_());
    if (auto stored = store_->UpsertIdentityBundle(account_id, record); stored.IsErr()) {
        return stored;
    }
    identity_keys_generated_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard cache(slot.cache_mutex);
    slot.identity.emplace(std::move(pair));
    slot.registration_id = registration_id;
    Logger()->info("Created identity key for account {} (registration id {})", account_id, registration_id);
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<Unit, KeywardFailure> KeyManager::EnsureSignedPreKey(const std::string_view account_id, AccountSlot& slot) {
    std::lock_guard maintenance(slot.maintenance_mutex);

    auto active = store_->LoadActiveSignedPreKey(account_id);
    if (active.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(active).UnwrapErr());
    }
    const auto now = clock_();
    const auto& record = active.Unwrap();
    if (!record || record->IsDueForRotation(now)) {
        Logger()->debug("Account {} has no current signed pre-key; rotating", account_id);
        auto rotated = RotateLocked(account_id, slot);
        if (rotated.IsErr()) {
            return Result<Unit, KeywardFailure>::Err(std::move(rotated).UnwrapErr());
        }
        return Result<Unit, KeywardFailure>::Ok(unit);
    }

    {
        std::lock_guard cache(slot.cache_mutex);
        if (slot.signed_pre_key && slot.signed_pre_key->GetId() == record->GetId()) {
            slot.signed_pre_key_checked_at = now;
            return Result<Unit, KeywardFailure>::Ok(unit);
        }
    }
    auto pair = OpenSignedPreKey(account_id, *record);
    if (pair.IsErr()) {
        return Result<Unit, KeywardFailure>::Err(std::move(pair).UnwrapErr());
    }
    std::lock_guard cache(slot.cache_mutex);
    slot.signed_pre_key.emplace(std::move(pair).Unwrap());
    slot.signed_pre_key_checked_at = now;
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<Unit, KeywardFailure> KeyManager::Initialize(const std::string_view account_id) {
    if (auto valid = ValidateAccountId(account_id); valid.IsErr()) {
        return valid;
    }
    const auto slot = SlotFor(account_id);
    std::lock_guard init(slot->init_mutex);
    slot->state.store(AccountState::Bootstrapping, std::memory_order_release);

    auto fail = [&](KeywardFailure failure) {
        slot->state.store(AccountState::Uninitialized, std::memory_order_release);
        LogFailure("Initialize", account_id, failure);
        return Result<Unit, KeywardFailure>::Err(std::move(failure));
    };

    if (auto identity = EnsureIdentity(account_id, *slot); identity.IsErr()) {
        return fail(std::move(identity).UnwrapErr());
    }
    {
        std::lock_guard maintenance(slot->maintenance_mutex);
        if (auto replenished = ReplenishLocked(account_id); replenished.IsErr()) {
            return fail(std::move(replenished).UnwrapErr());
        }
    }
    if (auto signed_pre_key = EnsureSignedPreKey(account_id, *slot); signed_pre_key.IsErr()) {
        return fail(std::move(signed_pre_key).UnwrapErr());
    }

    slot->state.store(AccountState::Ready, std::memory_order_release);
    Logger()->debug("Account {} ready", account_id);
    return Result<Unit, KeywardFailure>::Ok(unit);
}

// ============================================================================
// Accessors
// ============================================================================

Result<IdentityKeyPair, KeywardFailure> KeyManager::GetIdentityKeyPair(const std::string_view account_id) {
    using ResultType = Result<IdentityKeyPair, KeywardFailure>;
    if (auto valid = ValidateAccountId(account_id); valid.IsErr()) {
        return ResultType::Err(std::move(valid).UnwrapErr());
    }
    const auto slot = SlotFor(account_id);
    {
        std::lock_guard cache(slot->cache_mutex);
        if (slot->identity) {
            return slot->identity->Clone();
        }
    }

    auto loaded = store_->LoadIdentityBundle(account_id);
    if (loaded.IsErr()) {
        return ResultType::Err(std::move(loaded).UnwrapErr());
    }
    const auto& record = loaded.Unwrap();
    if (!record) {
        return ResultType::Err(KeywardFailure::NotInitialized(std::string(ErrorMessages::IDENTITY_NOT_AVAILABLE)));
    }
    auto pair = OpenIdentity(account_id, *record);
    if (pair.IsErr()) {
        return pair;
    }
    auto copy = pair.Unwrap().Clone();
    if (copy.IsErr()) {
        return copy;
    }
    std::lock_guard cache(slot->cache_mutex);
    if (!slot->identity) {
        slot->identity.emplace(std::move(pair).Unwrap());
        slot->registration_id = record->GetRegistrationId();
    }
    return copy;
}

Result<SignedPreKeyPair, KeywardFailure> KeyManager::GetSignedPreKeyPair(const std::string_view account_id) {
    using ResultType = Result<SignedPreKeyPair, KeywardFailure>;
    if (auto valid = ValidateAccountId(account_id); valid.IsErr()) {
        return ResultType::Err(std::move(valid).UnwrapErr());
    }
    const auto slot = SlotFor(account_id);
    const auto now = clock_();
    {
        std::lock_guard cache(slot->cache_mutex);
        if (slot->signed_pre_key && now - slot->signed_pre_key_checked_at < config_.signed_pre_key_cache_ttl) {
            return slot->signed_pre_key->Clone();
        }
    }

    auto active = store_->LoadActiveSignedPreKey(account_id);
    if (active.IsErr()) {
        return ResultType::Err(std::move(active).UnwrapErr());
    }
    const auto& record = active.Unwrap();
    if (!record) {
        return ResultType::Err(KeywardFailure::NotInitialized(std::string(ErrorMessages::SIGNED_PRE_KEY_NOT_AVAILABLE)));
    }
    {
        std::lock_guard cache(slot->cache_mutex);
        if (slot->signed_pre_key && slot->signed_pre_key->GetId() == record->GetId()) {
            slot->signed_pre_key_checked_at = now;
            return slot->signed_pre_key->Clone();
        }
    }

    auto pair = OpenSignedPreKey(account_id, *record);
    if (pair.IsErr()) {
        return pair;
    }
    auto copy = pair.Unwrap().Clone();
    if (copy.IsErr()) {
        return copy;
    }
    std::lock_guard cache(slot->cache_mutex);
    if (slot->signed_pre_key && slot->signed_pre_key->GetId() != record->GetId()) {
        Logger()->info("Account {} signed pre-key changed in store ({} -> {})",
            account_id, slot->signed_pre_key->GetId(), record->GetId());
    }
    slot->signed_pre_key.emplace(std::move(pair).Unwrap());
    slot->signed_pre_key_checked_at = now;
    return copy;
}

Result<SignedPreKeyPair, KeywardFailure> KeyManager::GetSignedPreKeyPairById(
    const std::string_view account_id,
    const uint32_t signed_pre_key_id) {
    using ResultType = Result<SignedPreKeyPair, KeywardFailure>;
    if (auto valid = ValidateAccountId(account_id); valid.IsErr()) {
        return ResultType::Err(std::move(valid).UnwrapErr());
    }
    const auto slot = SlotFor(account_id);
    const auto now = clock_();
    {
        std::lock_guard cache(slot->cache_mutex);
        if (slot->signed_pre_key && slot->signed_pre_key->GetId() == signed_pre_key_id &&
            now - slot->signed_pre_key_checked_at < config_.signed_pre_key_cache_ttl) {
            return slot->signed_pre_key->Clone();
        }
    }

    auto loaded = store_->LoadSignedPreKey(account_id, signed_pre_key_id);
    if (loaded.IsErr()) {
        return ResultType::Err(std::move(loaded).UnwrapErr());
    }
    const auto& record = loaded.Unwrap();
    if (!record) {
        return ResultType::Err(KeywardFailure::NotFound(
            compat::format("Signed pre-key {} unknown for account {}", signed_pre_key_id, account_id)));
    }
    if (!record->IsWithinGracePeriod(now, config_.signed_pre_key_grace_period)) {
        return ResultType::Err(KeywardFailure::NotFound(
            compat::format("Signed pre-key {} for account {} is past its grace period", signed_pre_key_id, account_id)));
    }
    return OpenSignedPreKey(account_id, *record);
}

Result<uint32_t, KeywardFailure> KeyManager::GetRegistrationId(const std::string_view account_id) {
    if (auto valid = ValidateAccountId(account_id); valid.IsErr()) {
        return Result<uint32_t, KeywardFailure>::Err(std::move(valid).UnwrapErr());
    }
    const auto slot = SlotFor(account_id);
    {
        std::lock_guard cache(slot->cache_mutex);
        if (slot->registration_id) {
            return Result<uint32_t, KeywardFailure>::Ok(*slot->registration_id);
        }
    }
    auto loaded = store_->LoadIdentityBundle(account_id);
    if (loaded.IsErr()) {
        return Result<uint32_t, KeywardFailure>::Err(std::move(loaded).UnwrapErr());
    }
    if (!loaded.Unwrap()) {
        return Result<uint32_t, KeywardFailure>::Err(
            KeywardFailure::NotInitialized(std::string(ErrorMessages::IDENTITY_NOT_AVAILABLE)));
    }
    const uint32_t registration_id = loaded.Unwrap()->GetRegistrationId();
    std::lock_guard cache(slot->cache_mutex);
    slot->registration_id = registration_id;
    return Result<uint32_t, KeywardFailure>::Ok(registration_id);
}

AccountState KeyManager::GetAccountState(const std::string_view account_id) const {
    const auto slot = FindSlot(account_id);
    return slot ? slot->state.load(std::memory_order_acquire) : AccountState::Uninitialized;
}

// ============================================================================
// Publication
// ============================================================================

Result<models::KeyBundle, KeywardFailure> KeyManager::GetPublicBundleForPublishing(const std::string_view account_id) {
    using ResultType = Result<models::KeyBundle, KeywardFailure>;
    if (auto valid = ValidateAccountId(account_id); valid.IsErr()) {
        return ResultType::Err(std::move(valid).UnwrapErr());
    }

    auto identity = store_->LoadIdentityBundle(account_id);
    if (identity.IsErr()) {
        return ResultType::Err(std::move(identity).UnwrapErr());
    }
    if (!identity.Unwrap()) {
        Logger()->debug("Bundle for account {} unavailable: no identity", account_id);
        return ResultType::Err(KeywardFailure::Unavailable(std::string(ErrorMessages::IDENTITY_NOT_AVAILABLE)));
    }
    auto active = store_->LoadActiveSignedPreKey(account_id);
    if (active.IsErr()) {
        return ResultType::Err(std::move(active).UnwrapErr());
    }
    if (!active.Unwrap()) {
        Logger()->debug("Bundle for account {} unavailable: no signed pre-key", account_id);
        return ResultType::Err(KeywardFailure::Unavailable(std::string(ErrorMessages::SIGNED_PRE_KEY_NOT_AVAILABLE)));
    }
    auto unused = store_->LoadUnusedPreKeys(account_id, config_.publication_cap);
    if (unused.IsErr()) {
        return ResultType::Err(std::move(unused).UnwrapErr());
    }

    const IdentityBundleRecord& identity_record = *identity.Unwrap();
    auto identity_public = models::IdentityPublicKey::FromBytes(identity_record.GetIdentityPublicKeySpan());
    if (identity_public.IsErr()) {
        return ResultType::Err(KeywardFailure::Decode(identity_public.UnwrapErr().message));
    }
    auto identity_x25519 = KeyMaterialFactory::IdentityAgreementPublicKey(identity_public.Unwrap());
    if (identity_x25519.IsErr()) {
        return ResultType::Err(std::move(identity_x25519).UnwrapErr());
    }

    std::vector<models::OneTimePreKeyPublic> one_time_pre_keys;
    one_time_pre_keys.reserve(unused.Unwrap().size());
    for (const auto& record : unused.Unwrap()) {
        one_time_pre_keys.push_back(models::OneTimePreKeyPublic{record.GetId(), record.GetPublicKey()});
    }

    const SignedPreKeyRecord& signed_record = *active.Unwrap();
    return ResultType::Ok(models::KeyBundle(
        identity_record.GetIdentityPublicKey(),
        std::move(identity_x25519).Unwrap(),
        identity_record.GetRegistrationId(),
        signed_record.GetId(),
        signed_record.GetPublicKey(),
        signed_record.GetSignature(),
        std::move(one_time_pre_keys),
        clock_()));
}

// ============================================================================
// Maintenance
// ============================================================================

Result<uint32_t, KeywardFailure> KeyManager::RotateLocked(const std::string_view account_id, AccountSlot& slot) {
    using ResultType = Result<uint32_t, KeywardFailure>;

    auto identity = GetIdentityKeyPair(account_id);
    if (identity.IsErr()) {
        return ResultType::Err(std::move(identity).UnwrapErr());
    }
    auto max_id = store_->MaxSignedPreKeyId(account_id);
    if (max_id.IsErr()) {
        return ResultType::Err(std::move(max_id).UnwrapErr());
    }
    uint32_t highest = max_id.Unwrap();
    {
        std::lock_guard cache(slot.cache_mutex);
        if (slot.signed_pre_key) {
            highest = std::max(highest, slot.signed_pre_key->GetId());
        }
    }
    if (highest == UINT32_MAX) {
        return ResultType::Err(KeywardFailure::InvalidState(
            compat::format("Signed pre-key id space exhausted for account {}", account_id)));
    }
    const uint32_t new_id = highest + 1;

    auto generated = KeyMaterialFactory::GenerateKeyPair<models::SignedPreKeyPurpose>(new_id);
    if (generated.IsErr()) {
        return ResultType::Err(std::move(generated).UnwrapErr());
    }
    SignedPreKeyPair pair = std::move(generated).Unwrap();

    auto signature = KeyMaterialFactory::Sign(pair.GetPublicKey().AsSpan(), identity.Unwrap().GetPrivateKey());
    if (signature.IsErr()) {
        return ResultType::Err(std::move(signature).UnwrapErr());
    }
    auto sealed = encryption_unit_->Encrypt(
        pair.GetPrivateKey().GetHandle(),
        SealContext(kSealLabelSignedPreKey, account_id, new_id));
    if (sealed.IsErr()) {
        return ResultType::Err(std::move(sealed).UnwrapErr());
    }

    const auto now = clock_();
    const SignedPreKeyRecord record(
        new_id,
        pair.GetPublicKey().GetBytesCopy(),
        std::move(sealed).Unwrap(),
        std::move(signature).Unwrap(),
        now,
        config_.rotation_interval,
        true);
    if (auto stored = store_->StoreSignedPreKey(account_id, record); stored.IsErr()) {
        return ResultType::Err(std::move(stored).UnwrapErr());
    }
    signed_pre_keys_rotated_.fetch_add(1, std::memory_order_relaxed);

    {
        std::lock_guard cache(slot.cache_mutex);
        slot.signed_pre_key.emplace(std::move(pair));
        slot.signed_pre_key_checked_at = now;
    }
    Logger()->info("Rotated signed pre-key for account {} (new id {})", account_id, new_id);
    return ResultType::Ok(new_id);
}

Result<uint32_t, KeywardFailure> KeyManager::RotateSignedPreKey(const std::string_view account_id) {
    if (auto valid = ValidateAccountId(account_id); valid.IsErr()) {
        return Result<uint32_t, KeywardFailure>::Err(std::move(valid).UnwrapErr());
    }
    const auto slot = SlotFor(account_id);
    std::lock_guard maintenance(slot->maintenance_mutex);
    auto rotated = RotateLocked(account_id, *slot);
    if (rotated.IsErr()) {
        LogFailure("RotateSignedPreKey", account_id, rotated.UnwrapErr());
    }
    return rotated;
}

Result<uint32_t, KeywardFailure> KeyManager::ReplenishLocked(const std::string_view account_id) {
    using ResultType = Result<uint32_t, KeywardFailure>;

    auto count = store_->CountUnusedPreKeys(account_id);
    if (count.IsErr()) {
        return count;
    }
    const uint32_t current = count.Unwrap();
    if (current >= config_.pre_key_low_water_mark) {
        return ResultType::Ok(0);
    }
    const uint32_t needed = config_.pre_key_target_pool_size - current;

    auto max_id = store_->MaxPreKeyId(account_id);
    if (max_id.IsErr()) {
        return max_id;
    }
    if (max_id.Unwrap() > UINT32_MAX - needed) {
        return ResultType::Err(KeywardFailure::InvalidState(
            compat::format("One-time pre-key id space exhausted for account {}", account_id)));
    }

    auto batch = KeyMaterialFactory::GenerateBatch(needed, max_id.Unwrap() + 1);
    if (batch.IsErr()) {
        return ResultType::Err(std::move(batch).UnwrapErr());
    }
    const auto now = clock_();
    std::vector<OneTimePreKeyRecord> records;
    records.reserve(needed);
    for (const auto& pair : batch.Unwrap()) {
        auto sealed = encryption_unit_->Encrypt(
            pair.GetPrivateKey().GetHandle(),
            SealContext(kSealLabelOneTimePreKey, account_id, pair.GetId()));
        if (sealed.IsErr()) {
            return ResultType::Err(std::move(sealed).UnwrapErr());
        }
        records.emplace_back(pair.GetId(), pair.GetPublicKey().GetBytesCopy(), std::move(sealed).Unwrap(), now);
    }
    if (auto stored = store_->StorePreKeyBatch(account_id, records); stored.IsErr()) {
        return ResultType::Err(std::move(stored).UnwrapErr());
    }
    pre_keys_generated_.fetch_add(needed, std::memory_order_relaxed);
    Logger()->info("Replenished {} one-time pre-keys for account {} ({} -> {})",
        needed, account_id, current, config_.pre_key_target_pool_size);
    return ResultType::Ok(needed);
}

Result<uint32_t, KeywardFailure> KeyManager::ReplenishPreKeysIfNeeded(const std::string_view account_id) {
    if (auto valid = ValidateAccountId(account_id); valid.IsErr()) {
        return Result<uint32_t, KeywardFailure>::Err(std::move(valid).UnwrapErr());
    }
    const auto slot = SlotFor(account_id);
    std::lock_guard maintenance(slot->maintenance_mutex);
    auto replenished = ReplenishLocked(account_id);
    if (replenished.IsErr()) {
        LogFailure("ReplenishPreKeysIfNeeded", account_id, replenished.UnwrapErr());
    }
    return replenished;
}

Result<RotationCheckResult, KeywardFailure> KeyManager::PerformKeyRotationCheck(const std::string_view account_id) {
    using ResultType = Result<RotationCheckResult, KeywardFailure>;
    if (auto valid = ValidateAccountId(account_id); valid.IsErr()) {
        return ResultType::Err(std::move(valid).UnwrapErr());
    }
    const auto slot = SlotFor(account_id);
    std::lock_guard maintenance(slot->maintenance_mutex);

    auto fail = [&](KeywardFailure failure) {
        LogFailure("PerformKeyRotationCheck", account_id, failure);
        return ResultType::Err(std::move(failure));
    };

    auto active = store_->LoadActiveSignedPreKey(account_id);
    if (active.IsErr()) {
        return fail(std::move(active).UnwrapErr());
    }
    RotationCheckResult result;
    const auto& record = active.Unwrap();
    if (!record || record->IsDueForRotation(clock_())) {
        auto rotated = RotateLocked(account_id, *slot);
        if (rotated.IsErr()) {
            return fail(std::move(rotated).UnwrapErr());
        }
        result.signed_pre_key_rotated = true;
        result.active_signed_pre_key_id = rotated.Unwrap();
    } else {
        result.active_signed_pre_key_id = record->GetId();
    }

    auto generated = ReplenishLocked(account_id);
    if (generated.IsErr()) {
        return fail(std::move(generated).UnwrapErr());
    }
    result.pre_keys_generated = generated.Unwrap();

    auto count = store_->CountUnusedPreKeys(account_id);
    if (count.IsErr()) {
        return fail(std::move(count).UnwrapErr());
    }
    result.unused_pre_key_count = count.Unwrap();
    return ResultType::Ok(result);
}

Result<size_t, KeywardFailure> KeyManager::PruneExpiredSignedPreKeys(const std::string_view account_id) {
    if (auto valid = ValidateAccountId(account_id); valid.IsErr()) {
        return Result<size_t, KeywardFailure>::Err(std::move(valid).UnwrapErr());
    }
    const auto slot = SlotFor(account_id);
    std::lock_guard maintenance(slot->maintenance_mutex);

    const auto cutoff = clock_() - config_.signed_pre_key_grace_period;
    auto pruned = store_->PruneSignedPreKeys(account_id, cutoff);
    if (pruned.IsOk() && pruned.Unwrap() > 0) {
        Logger()->info("Pruned {} expired signed pre-keys for account {}", pruned.Unwrap(), account_id);
    }
    return pruned;
}

// ============================================================================
// Consumption
// ============================================================================

Result<OneTimePreKeyPair, KeywardFailure> KeyManager::ConsumePreKey(
    const std::string_view account_id,
    const uint32_t pre_key_id) {
    using ResultType = Result<OneTimePreKeyPair, KeywardFailure>;
    if (auto valid = ValidateAccountId(account_id); valid.IsErr()) {
        return ResultType::Err(std::move(valid).UnwrapErr());
    }
    const auto slot = SlotFor(account_id);
    std::unique_lock<std::mutex> consume_guard;
    if (!store_->SupportsAtomicConditionalUpdate()) {
        consume_guard = std::unique_lock(slot->consume_mutex);
    }

    auto loaded = store_->LoadPreKey(account_id, pre_key_id);
    if (loaded.IsErr()) {
        return ResultType::Err(std::move(loaded).UnwrapErr());
    }
    const auto& record = loaded.Unwrap();
    if (!record) {
        Logger()->debug("Account {} asked for unknown pre-key {}", account_id, pre_key_id);
        return ResultType::Err(KeywardFailure::NotFound(
            compat::format("{} (id {})", ErrorMessages::PRE_KEY_UNKNOWN, pre_key_id)));
    }
    if (record->IsUsed()) {
        pre_key_consume_conflicts_.fetch_add(1, std::memory_order_relaxed);
        return ResultType::Err(KeywardFailure::AlreadyUsed(
            compat::format("{} (id {})", ErrorMessages::PRE_KEY_ALREADY_USED, pre_key_id)));
    }

    auto public_key = models::OneTimePreKeyPublicKey::FromBytes(record->GetPublicKeySpan());
    if (public_key.IsErr()) {
        return ResultType::Err(KeywardFailure::Decode(public_key.UnwrapErr().message));
    }
    auto opened = encryption_unit_->Decrypt(
        record->GetEncryptedPrivateKey(),
        SealContext(kSealLabelOneTimePreKey, account_id, pre_key_id));
    if (opened.IsErr()) {
        LogFailure("ConsumePreKey", account_id, opened.UnwrapErr());
        return ResultType::Err(std::move(opened).UnwrapErr());
    }
    auto private_key = models::OneTimePreKeyPrivateKey::FromHandle(std::move(opened).Unwrap());
    if (private_key.IsErr()) {
        return ResultType::Err(KeywardFailure::Decode(private_key.UnwrapErr().message));
    }

    auto marked = store_->MarkPreKeyUsed(account_id, pre_key_id);
    if (marked.IsErr()) {
        LogFailure("ConsumePreKey", account_id, marked.UnwrapErr());
        return ResultType::Err(std::move(marked).UnwrapErr());
    }
    if (!marked.Unwrap()) {
        pre_key_consume_conflicts_.fetch_add(1, std::memory_order_relaxed);
        Logger()->debug("Pre-key {} of account {} consumed concurrently", pre_key_id, account_id);
        return ResultType::Err(KeywardFailure::AlreadyUsed(
            compat::format("{} (id {})", ErrorMessages::PRE_KEY_ALREADY_USED, pre_key_id)));
    }
    pre_keys_consumed_.fetch_add(1, std::memory_order_relaxed);
    return ResultType::Ok(OneTimePreKeyPair(
        pre_key_id, std::move(public_key).Unwrap(), std::move(private_key).Unwrap()));
}

// ============================================================================
// Health and housekeeping
// ============================================================================

Result<AccountKeyHealth, KeywardFailure> KeyManager::GetAccountHealth(const std::string_view account_id) {
    using ResultType = Result<AccountKeyHealth, KeywardFailure>;
    if (auto valid = ValidateAccountId(account_id); valid.IsErr()) {
        return ResultType::Err(std::move(valid).UnwrapErr());
    }

    AccountKeyHealth health;
    health.state = GetAccountState(account_id);

    auto count = store_->CountUnusedPreKeys(account_id);
    if (count.IsErr()) {
        return ResultType::Err(std::move(count).UnwrapErr());
    }
    health.unused_pre_key_count = count.Unwrap();
    health.pool_health = health.unused_pre_key_count < config_.pre_key_low_water_mark
        ? PreKeyPoolHealth::Low
        : PreKeyPoolHealth::Healthy;

    auto active = store_->LoadActiveSignedPreKey(account_id);
    if (active.IsErr()) {
        return ResultType::Err(std::move(active).UnwrapErr());
    }
    if (const auto& record = active.Unwrap()) {
        health.active_signed_pre_key_id = record->GetId();
        health.next_rotation_at = record->GetNextRotationAt();
        health.freshness = record->IsDueForRotation(clock_())
            ? SignedPreKeyFreshness::DueForRotation
            : SignedPreKeyFreshness::Current;
    }
    return ResultType::Ok(health);
}

void KeyManager::EvictAccount(const std::string_view account_id) {
    const auto slot = FindSlot(account_id);
    if (!slot) {
        return;
    }
    std::lock_guard cache(slot->cache_mutex);
    slot->ClearCache();
    slot->state.store(AccountState::Uninitialized, std::memory_order_release);
    Logger()->debug("Evicted cached keys for account {}", account_id);
}

void KeyManager::ClearSensitiveData() {
    std::shared_lock lock(*accounts_lock_);
    for (const auto& [account_id, slot] : accounts_) {
        std::lock_guard cache(slot->cache_mutex);
        slot->ClearCache();
        slot->state.store(AccountState::Uninitialized, std::memory_order_release);
    }
    Logger()->info("Cleared cached key material for {} accounts", accounts_.size());
}

KeyManagerStatistics KeyManager::GetStatistics() const noexcept {
    const auto encryption = encryption_unit_->GetStatistics();
    return KeyManagerStatistics{
        .identity_keys_generated = identity_keys_generated_.load(std::memory_order_relaxed),
        .pre_keys_generated = pre_keys_generated_.load(std::memory_order_relaxed),
        .pre_keys_consumed = pre_keys_consumed_.load(std::memory_order_relaxed),
        .pre_key_consume_conflicts = pre_key_consume_conflicts_.load(std::memory_order_relaxed),
        .signed_pre_keys_rotated = signed_pre_keys_rotated_.load(std::memory_order_relaxed),
        .encryption_operations = encryption.encryptions,
        .decryption_operations = encryption.decryptions,
        .authentication_failures = encryption.authentication_failures};
}

}
