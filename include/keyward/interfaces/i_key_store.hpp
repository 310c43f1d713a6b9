#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include "keyward/models/records/identity_bundle_record.hpp"
#include "keyward/models/records/signed_pre_key_record.hpp"
#include "keyward/models/records/one_time_pre_key_record.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace keyward::e2ee::interfaces {

/**
 * @brief Durable storage for per-account key records
 *
 * Private halves arrive already sealed by the KeyEncryptionUnit; a store
 * never sees plaintext key material.
 *
 * Every operation may fail with Storage or Timeout. Absence is reported as
 * an empty optional, not as an error.
 *
 * Atomicity requirements:
 * - StoreSignedPreKey deactivates the previous active record and activates
 *   the new one as a single unit. The deactivated record's superseded_at is
 *   the new record's created_at.
 * - StorePreKeyBatch is all-or-nothing.
 * - MarkPreKeyUsed is a conditional update: only the call that observes the
 *   record unused flips it, and only that call gets true.
 */
class IKeyStore {
public:
    virtual ~IKeyStore() = default;

    [[nodiscard]] virtual Result<std::optional<models::IdentityBundleRecord>, KeywardFailure>
    LoadIdentityBundle(std::string_view account_id) = 0;

    [[nodiscard]] virtual Result<Unit, KeywardFailure>
    UpsertIdentityBundle(std::string_view account_id, const models::IdentityBundleRecord& bundle) = 0;

    [[nodiscard]] virtual Result<std::optional<models::SignedPreKeyRecord>, KeywardFailure>
    LoadActiveSignedPreKey(std::string_view account_id) = 0;

    // Active or superseded
    [[nodiscard]] virtual Result<std::optional<models::SignedPreKeyRecord>, KeywardFailure>
    LoadSignedPreKey(std::string_view account_id, uint32_t signed_pre_key_id) = 0;

    // Conflict if the id was used before for this account
    [[nodiscard]] virtual Result<Unit, KeywardFailure>
    StoreSignedPreKey(std::string_view account_id, const models::SignedPreKeyRecord& record) = 0;

    // Deletes inactive records superseded before the cutoff; returns how many
    [[nodiscard]] virtual Result<size_t, KeywardFailure>
    PruneSignedPreKeys(std::string_view account_id, models::Timestamp superseded_before) = 0;

    [[nodiscard]] virtual Result<uint32_t, KeywardFailure>
    CountUnusedPreKeys(std::string_view account_id) = 0;

    // Conflict if any id already exists; nothing is stored in that case
    [[nodiscard]] virtual Result<Unit, KeywardFailure>
    StorePreKeyBatch(std::string_view account_id, const std::vector<models::OneTimePreKeyRecord>& records) = 0;

    [[nodiscard]] virtual Result<std::optional<models::OneTimePreKeyRecord>, KeywardFailure>
    LoadPreKey(std::string_view account_id, uint32_t pre_key_id) = 0;

    // Ascending id order
    [[nodiscard]] virtual Result<std::vector<models::OneTimePreKeyRecord>, KeywardFailure>
    LoadUnusedPreKeys(std::string_view account_id, uint32_t limit) = 0;

    /**
     * @return Ok(true) for the call that transitioned unused to used,
     *         Ok(false) if the key was already used,
     *         NotFound if the id is unknown.
     */
    [[nodiscard]] virtual Result<bool, KeywardFailure>
    MarkPreKeyUsed(std::string_view account_id, uint32_t pre_key_id) = 0;

    // 0 when the account has none
    [[nodiscard]] virtual Result<uint32_t, KeywardFailure>
    MaxPreKeyId(std::string_view account_id) = 0;

    [[nodiscard]] virtual Result<uint32_t, KeywardFailure>
    MaxSignedPreKeyId(std::string_view account_id) = 0;

    [[nodiscard]] virtual Result<Unit, KeywardFailure>
    DeleteAccount(std::string_view account_id) = 0;

    // False means MarkPreKeyUsed is not linearizable across concurrent callers
    [[nodiscard]] virtual bool SupportsAtomicConditionalUpdate() const noexcept = 0;
};

}
