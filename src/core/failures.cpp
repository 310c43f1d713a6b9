#include "keyward/core/failures.hpp"
namespace keyward::e2ee {
std::string_view FailureTypeName(const KeywardFailureType type) noexcept {
    switch (type) {
        case KeywardFailureType::Generic: return "generic";
        case KeywardFailureType::KeyGeneration: return "key_generation";
        case KeywardFailureType::Authentication: return "authentication";
        case KeywardFailureType::NotFound: return "not_found";
        case KeywardFailureType::AlreadyUsed: return "already_used";
        case KeywardFailureType::Storage: return "storage";
        case KeywardFailureType::Timeout: return "timeout";
        case KeywardFailureType::NotInitialized: return "not_initialized";
        case KeywardFailureType::Unavailable: return "unavailable";
        case KeywardFailureType::InvalidInput: return "invalid_input";
        case KeywardFailureType::InvalidState: return "invalid_state";
        case KeywardFailureType::Conflict: return "conflict";
        case KeywardFailureType::Encode: return "encode";
        case KeywardFailureType::Decode: return "decode";
    }
    return "unknown";
}
}
