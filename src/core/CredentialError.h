// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng
//
// CredentialError.h - Error types for credential storage operations
// C++23 std::expected-based error handling

#ifndef KEYWARDEN_CREDENTIAL_ERROR_H
#define KEYWARDEN_CREDENTIAL_ERROR_H

#include <expected>
#include <string>
#include <string_view>

namespace KeyWarden {

// Error taxonomy for the storage manager and its collaborators
enum class CredentialError {
    // Service readiness
    NotInitialized,
    AlreadyInitialized,
    WeakPassphrase,
    SessionExpired,

    // Record operations
    InvalidFormat,
    DuplicateKey,
    NotFound,
    IntegrityCheckFailed,

    // Cryptography
    EncryptionFailed,
    DecryptionFailed,

    // Persistence
    StorageFailed,
    SerializationFailed,
    InvalidBundle,

    // Live validation
    RateLimited,
    NetworkError,
    Timeout,
    Aborted,

    // Rotation
    RotationFailed
};

// Convert error enum to human-readable string
inline constexpr std::string_view to_string(CredentialError error) noexcept {
    switch (error) {
        case CredentialError::NotInitialized:
            return "API key storage not initialized. Call initialize_storage() first.";
        case CredentialError::AlreadyInitialized:
            return "API key storage already initialized";
        case CredentialError::WeakPassphrase:
            return "Passphrase must be at least 8 characters long";
        case CredentialError::SessionExpired:
            return "Session expired. Please reinitialize the service.";
        case CredentialError::InvalidFormat:
            return "Invalid API key format";
        case CredentialError::DuplicateKey:
            return "API key already exists";
        case CredentialError::NotFound:
            return "API key not found";
        case CredentialError::IntegrityCheckFailed:
            return "Data integrity check failed";
        case CredentialError::EncryptionFailed:
            return "Encryption failed";
        case CredentialError::DecryptionFailed:
            return "Decryption failed";
        case CredentialError::StorageFailed:
            return "Storage operation failed";
        case CredentialError::SerializationFailed:
            return "Failed to serialize credential";
        case CredentialError::InvalidBundle:
            return "Invalid export bundle";
        case CredentialError::RateLimited:
            return "Rate limit exceeded";
        case CredentialError::NetworkError:
            return "Network error";
        case CredentialError::Timeout:
            return "Request timeout";
        case CredentialError::Aborted:
            return "Request aborted";
        case CredentialError::RotationFailed:
            return "Key rotation failed";
    }
    return "Unknown error";
}

// Helper type alias for Result pattern
template<typename T = void>
using CredentialResult = std::expected<T, CredentialError>;

} // namespace KeyWarden

#endif // KEYWARDEN_CREDENTIAL_ERROR_H
