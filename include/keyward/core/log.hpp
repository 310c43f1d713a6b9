#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace keyward::log {

inline constexpr const char* MAIN_LOGGER = "keyward";
inline constexpr const char* KEY_MANAGER_LOGGER = "key_manager";
inline constexpr const char* KEY_STORE_LOGGER = "key_store";
inline constexpr const char* CRYPTO_LOGGER = "crypto";
inline constexpr const char* SCHEDULER_LOGGER = "scheduler";

struct LogConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    bool console{true};
    // Empty disables the file sink
    std::string file_path;
    size_t max_file_size{4 * 1024 * 1024};
    size_t max_files{3};
};

/**
 * Build the shared sinks used by every keyward logger. Loggers handed
 * out earlier are moved onto them. Only the first call takes effect.
 */
void Init(const LogConfig& config = LogConfig{});

// Init with KEYWARD_LOG_LEVEL and KEYWARD_LOG_FILE applied
void InitFromEnv();

std::shared_ptr<spdlog::logger> Get(const std::string& name = MAIN_LOGGER);

void SetLevel(spdlog::level::level_enum level);

void Flush();

// Flushes and unregisters the keyward loggers; host loggers are left alone
void Shutdown();

}
