#pragma once
#include <string>
#include <string_view>
namespace keyward::e2ee {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class KeywardFailureType {
    Generic,
    KeyGeneration,
    Authentication,
    NotFound,
    AlreadyUsed,
    Storage,
    Timeout,
    NotInitialized,
    Unavailable,
    InvalidInput,
    InvalidState,
    Conflict,
    Encode,
    Decode
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
/**
 * Failure returned by every key-management operation.
 *
 * Callers branch on the type, not the message:
 * - KeyGeneration, Authentication: broken, alert; never retried.
 * - Storage, Timeout: retry with backoff at the caller's discretion.
 * - NotFound, AlreadyUsed, Unavailable: expected, recoverable by the caller
 *   (bootstrap, pick another pre-key, republish).
 * - NotInitialized: Initialize() was not called for the account.
 */
class KeywardFailure {
public:
    KeywardFailureType type;
    std::string message;
    KeywardFailure(const KeywardFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    [[nodiscard]] bool IsRetryable() const noexcept {
        return type == KeywardFailureType::Storage || type == KeywardFailureType::Timeout;
    }
    [[nodiscard]] bool IsFatal() const noexcept {
        return type == KeywardFailureType::KeyGeneration || type == KeywardFailureType::Authentication;
    }
    [[nodiscard]] bool Is(const KeywardFailureType t) const noexcept {
        return type == t;
    }
    static KeywardFailure Generic(std::string msg) {
        return {KeywardFailureType::Generic, std::move(msg)};
    }
    static KeywardFailure KeyGeneration(std::string msg) {
        return {KeywardFailureType::KeyGeneration, std::move(msg)};
    }
    static KeywardFailure Authentication(std::string msg) {
        return {KeywardFailureType::Authentication, std::move(msg)};
    }
    static KeywardFailure NotFound(std::string msg) {
        return {KeywardFailureType::NotFound, std::move(msg)};
    }
    static KeywardFailure AlreadyUsed(std::string msg) {
        return {KeywardFailureType::AlreadyUsed, std::move(msg)};
    }
    static KeywardFailure Storage(std::string msg) {
        return {KeywardFailureType::Storage, std::move(msg)};
    }
    static KeywardFailure Timeout(std::string msg) {
        return {KeywardFailureType::Timeout, std::move(msg)};
    }
    static KeywardFailure NotInitialized(std::string msg) {
        return {KeywardFailureType::NotInitialized, std::move(msg)};
    }
    static KeywardFailure Unavailable(std::string msg) {
        return {KeywardFailureType::Unavailable, std::move(msg)};
    }
    static KeywardFailure InvalidInput(std::string msg) {
        return {KeywardFailureType::InvalidInput, std::move(msg)};
    }
    static KeywardFailure InvalidState(std::string msg) {
        return {KeywardFailureType::InvalidState, std::move(msg)};
    }
    static KeywardFailure Conflict(std::string msg) {
        return {KeywardFailureType::Conflict, std::move(msg)};
    }
    static KeywardFailure Encode(std::string msg) {
        return {KeywardFailureType::Encode, std::move(msg)};
    }
    static KeywardFailure Decode(std::string msg) {
        return {KeywardFailureType::Decode, std::move(msg)};
    }
    static KeywardFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return KeyGeneration(sf.message);
        }
        return Generic(sf.message);
    }
};
std::string_view FailureTypeName(KeywardFailureType type) noexcept;
}
