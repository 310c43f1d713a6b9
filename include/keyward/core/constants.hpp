#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace keyward::e2ee {
inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SignatureBytes = 64;

inline constexpr size_t kMasterKeyBytes = 32;
inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

// Encrypted-at-rest blob: version || nonce || tag || ciphertext
inline constexpr uint8_t kSealedKeyVersion = 0x01;
inline constexpr size_t kSealedKeyVersionBytes = 1;
inline constexpr size_t kSealedKeyHeaderBytes = kSealedKeyVersionBytes + kAesGcmNonceBytes + kAesGcmTagBytes;
inline constexpr uint64_t kMaxEncryptionsPerMasterKey = 0xFFFFFFFFull;

inline constexpr uint32_t kMinRegistrationId = 1;
inline constexpr uint32_t kMaxRegistrationId = 16383;

inline constexpr uint32_t kDefaultPreKeyLowWaterMark = 25;
inline constexpr uint32_t kDefaultPreKeyTargetPoolSize = 50;
inline constexpr uint32_t kDefaultPublicationCap = 10;
inline constexpr uint32_t kMaxPreKeyBatchSize = 1000;

inline constexpr std::chrono::seconds kDailyRotation{24 * 60 * 60};
inline constexpr std::chrono::seconds kWeeklyRotation{7 * 24 * 60 * 60};
inline constexpr std::chrono::seconds kMonthlyRotation{30 * 24 * 60 * 60};
inline constexpr std::chrono::seconds kDefaultSignedPreKeyGracePeriod{7 * 24 * 60 * 60};
inline constexpr std::chrono::seconds kDefaultSignedPreKeyCacheTtl{60};
inline constexpr std::chrono::milliseconds kDefaultStorageTimeout{5000};
inline constexpr std::chrono::minutes kDefaultMaintenanceInterval{60};

inline constexpr std::string_view kPurposeIdentity = "identity-ed25519";
inline constexpr std::string_view kPurposeSignedPreKey = "signed-pre-key";
inline constexpr std::string_view kPurposeOneTimePreKey = "one-time-pre-key";

// Associated-data labels binding sealed private keys to their records
inline constexpr std::string_view kSealLabelIdentity = "keyward/identity/v1";
inline constexpr std::string_view kSealLabelSignedPreKey = "keyward/signed-pre-key/v1";
inline constexpr std::string_view kSealLabelOneTimePreKey = "keyward/one-time-pre-key/v1";

inline constexpr std::string_view kEnvMasterKey = "KEYWARD_MASTER_KEY";
inline constexpr std::string_view kEnvLogLevel = "KEYWARD_LOG_LEVEL";
inline constexpr std::string_view kEnvLogFile = "KEYWARD_LOG_FILE";
inline constexpr std::string_view kEnvPreKeyLowWater = "KEYWARD_PREKEY_LOW_WATER";
inline constexpr std::string_view kEnvPreKeyTarget = "KEYWARD_PREKEY_TARGET";
inline constexpr std::string_view kEnvPublicationCap = "KEYWARD_PUBLICATION_CAP";
inline constexpr std::string_view kEnvRotationSchedule = "KEYWARD_ROTATION_SCHEDULE";
inline constexpr std::string_view kEnvAllowEphemeralMasterKey = "KEYWARD_ALLOW_EPHEMERAL_MASTER_KEY";

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr size_t ERROR_BUFFER_SIZE = 256;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view AES_GCM_AUTHENTICATION_FAILED = "Authentication tag verification failed - data may have been tampered with";
    static constexpr std::string_view SEALED_KEY_TOO_SMALL = "Sealed key blob too small";
    static constexpr std::string_view ACCOUNT_ID_EMPTY = "Account id must not be empty";
    static constexpr std::string_view IDENTITY_NOT_AVAILABLE = "Identity key pair not available - call Initialize() first";
    static constexpr std::string_view SIGNED_PRE_KEY_NOT_AVAILABLE = "Signed pre-key pair not available - call Initialize() first";
    static constexpr std::string_view PRE_KEY_ALREADY_USED = "One-time pre-key already used";
    static constexpr std::string_view PRE_KEY_UNKNOWN = "One-time pre-key unknown";
};
}
