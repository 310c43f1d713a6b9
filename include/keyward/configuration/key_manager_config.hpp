#pragma once

#include "keyward/core/constants.hpp"
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace keyward::e2ee::configuration {

/// Signed pre-key rotation cadence
enum class RotationSchedule : uint8_t {
    Daily = 0,
    Weekly = 1,
    Monthly = 2
};

[[nodiscard]] constexpr std::chrono::seconds RotationIntervalFor(const RotationSchedule schedule) noexcept {
    switch (schedule) {
        case RotationSchedule::Daily:
            return kDailyRotation;
        case RotationSchedule::Weekly:
            return kWeeklyRotation;
        case RotationSchedule::Monthly:
            return kMonthlyRotation;
    }
    return kWeeklyRotation;
}

[[nodiscard]] std::optional<RotationSchedule> ParseRotationSchedule(std::string_view text) noexcept;

/// Tunables for KeyManager and KeyEncryptionUnit
///
/// Pool sizing follows the low-water / target model: when the number of
/// unused one-time pre-keys drops below `pre_key_low_water_mark`, the pool
/// is refilled to exactly `pre_key_target_pool_size`. A published bundle
/// carries at most `publication_cap` one-time pre-keys so one publication
/// round cannot drain the pool.
///
/// @example
/// ```cpp
/// auto config = KeyManagerConfig::Default();
/// config.rotation_interval = RotationIntervalFor(RotationSchedule::Daily);
/// if (auto valid = config.Validate(); valid.IsErr()) { ... }
/// ```
struct KeyManagerConfig {
    uint32_t pre_key_low_water_mark{kDefaultPreKeyLowWaterMark};
    uint32_t pre_key_target_pool_size{kDefaultPreKeyTargetPoolSize};
    uint32_t publication_cap{kDefaultPublicationCap};
    std::chrono::seconds rotation_interval{kWeeklyRotation};
    /// How long a superseded signed pre-key keeps answering in-flight handshakes
    std::chrono::seconds signed_pre_key_grace_period{kDefaultSignedPreKeyGracePeriod};
    /// Age after which a cached signed pre-key is re-checked against the store
    std::chrono::seconds signed_pre_key_cache_ttl{kDefaultSignedPreKeyCacheTtl};
    /// Upper bound on a single store operation waiting for a lock; becomes the
    /// SQLite busy timeout through SqliteKeyStoreConfig::For
    std::chrono::milliseconds storage_timeout{kDefaultStorageTimeout};
    /// Random master key fallback; never enable in production
    bool allow_ephemeral_master_key{false};

    /// Production defaults: 25/50 pool, weekly rotation, 7-day grace
    [[nodiscard]] static constexpr KeyManagerConfig Default() noexcept {
        return KeyManagerConfig{};
    }

    /// Default plus a throwaway master key when none is injected
    [[nodiscard]] static constexpr KeyManagerConfig Development() noexcept {
        KeyManagerConfig config{};
        config.allow_ephemeral_master_key = true;
        return config;
    }

    /// Daily rotation, one-day grace, larger pool, short cache TTL
    [[nodiscard]] static constexpr KeyManagerConfig HighSecurity() noexcept {
        KeyManagerConfig config{};
        config.pre_key_low_water_mark = 50;
        config.pre_key_target_pool_size = 100;
        config.rotation_interval = kDailyRotation;
        config.signed_pre_key_grace_period = kDailyRotation;
        config.signed_pre_key_cache_ttl = std::chrono::seconds{10};
        return config;
    }

    [[nodiscard]] KeyManagerConfig WithRotationSchedule(const RotationSchedule schedule) const noexcept {
        KeyManagerConfig copy = *this;
        copy.rotation_interval = RotationIntervalFor(schedule);
        return copy;
    }

    [[nodiscard]] Result<Unit, KeywardFailure> Validate() const;

    /// Overlay KEYWARD_PREKEY_LOW_WATER, KEYWARD_PREKEY_TARGET,
    /// KEYWARD_PUBLICATION_CAP, KEYWARD_ROTATION_SCHEDULE and
    /// KEYWARD_ALLOW_EPHEMERAL_MASTER_KEY onto @p base, then validate.
    [[nodiscard]] static Result<KeyManagerConfig, KeywardFailure> FromEnvironment(
        const KeyManagerConfig& base = Default());
};

}
