#include "keyward/configuration/key_manager_config.hpp"
#include "keyward/core/format.hpp"

#include <charconv>
#include <cstdlib>
#include <string>

namespace keyward::e2ee::configuration {

namespace {

const char* ReadEnv(const std::string_view name) {
    return std::getenv(std::string(name).c_str());
}

Result<std::optional<uint32_t>, KeywardFailure> ReadUInt32(const std::string_view name) {
    const char* raw = ReadEnv(name);
    if (raw == nullptr) {
        return Result<std::optional<uint32_t>, KeywardFailure>::Ok(std::nullopt);
    }
    const std::string_view text(raw);
    uint32_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return Result<std::optional<uint32_t>, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("{} must be an unsigned integer, got '{}'", name, text)));
    }
    return Result<std::optional<uint32_t>, KeywardFailure>::Ok(value);
}

}

std::optional<RotationSchedule> ParseRotationSchedule(const std::string_view text) noexcept {
    if (text == "daily") return RotationSchedule::Daily;
    if (text == "weekly") return RotationSchedule::Weekly;
    if (text == "monthly") return RotationSchedule::Monthly;
    return std::nullopt;
}

Result<Unit, KeywardFailure> KeyManagerConfig::Validate() const {
    if (pre_key_target_pool_size == 0) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("pre_key_target_pool_size must be positive"));
    }
    if (pre_key_target_pool_size > kMaxPreKeyBatchSize) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("pre_key_target_pool_size {} exceeds maximum {}",
                    pre_key_target_pool_size, kMaxPreKeyBatchSize)));
    }
    if (pre_key_low_water_mark > pre_key_target_pool_size) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("pre_key_low_water_mark {} exceeds target pool size {}",
                    pre_key_low_water_mark, pre_key_target_pool_size)));
    }
    if (publication_cap == 0 || publication_cap > pre_key_target_pool_size) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput(
                compat::format("publication_cap must be in [1, {}], got {}",
                    pre_key_target_pool_size, publication_cap)));
    }
    if (rotation_interval.count() <= 0) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("rotation_interval must be positive"));
    }
    if (signed_pre_key_grace_period.count() < 0) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("signed_pre_key_grace_period must not be negative"));
    }
    if (signed_pre_key_cache_ttl.count() < 0) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("signed_pre_key_cache_ttl must not be negative"));
    }
    if (storage_timeout.count() <= 0) {
        return Result<Unit, KeywardFailure>::Err(
            KeywardFailure::InvalidInput("storage_timeout must be positive"));
    }
    return Result<Unit, KeywardFailure>::Ok(unit);
}

Result<KeyManagerConfig, KeywardFailure> KeyManagerConfig::FromEnvironment(const KeyManagerConfig& base) {
    KeyManagerConfig config = base;

    auto low_water = ReadUInt32(kEnvPreKeyLowWater);
    if (low_water.IsErr()) {
        return Result<KeyManagerConfig, KeywardFailure>::Err(std::move(low_water).UnwrapErr());
    }
    if (low_water.Unwrap()) {
        config.pre_key_low_water_mark = *low_water.Unwrap();
    }

    auto target = ReadUInt32(kEnvPreKeyTarget);
    if (target.IsErr()) {
        return Result<KeyManagerConfig, KeywardFailure>::Err(std::move(target).UnwrapErr());
    }
    if (target.Unwrap()) {
        config.pre_key_target_pool_size = *target.Unwrap();
    }

    auto cap = ReadUInt32(kEnvPublicationCap);
    if (cap.IsErr()) {
        return Result<KeyManagerConfig, KeywardFailure>::Err(std::move(cap).UnwrapErr());
    }
    if (cap.Unwrap()) {
        config.publication_cap = *cap.Unwrap();
    }

    if (const char* schedule = ReadEnv(kEnvRotationSchedule)) {
        const auto parsed = ParseRotationSchedule(schedule);
        if (!parsed) {
            return Result<KeyManagerConfig, KeywardFailure>::Err(
                KeywardFailure::InvalidInput(
                    compat::format("{} must be daily, weekly or monthly, got '{}'",
                        kEnvRotationSchedule, schedule)));
        }
        config.rotation_interval = RotationIntervalFor(*parsed);
    }

    if (const char* ephemeral = ReadEnv(kEnvAllowEphemeralMasterKey)) {
        const std::string_view value(ephemeral);
        config.allow_ephemeral_master_key = value == "1" || value == "true" || value == "yes";
    }

    if (auto valid = config.Validate(); valid.IsErr()) {
        return Result<KeyManagerConfig, KeywardFailure>::Err(std::move(valid).UnwrapErr());
    }
    return Result<KeyManagerConfig, KeywardFailure>::Ok(config);
}

}
