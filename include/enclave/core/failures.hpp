#pragma once
#include "enclave/core/keystore_status.hpp"
#include <optional>
#include <string>
#include <utility>
namespace enclave {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    AllocationFailed,
    BufferTooSmall,
    InvalidOperation
};
enum class EnclaveFailureType {
    KeystoreError,
    KeyUnavailable,
    MessageTooLarge,
    InvalidSigningParameters,
    SigningFailed,
    VerificationFailed,
    EncryptionFailed,
    DecryptionFailed,
    AccessControlFailed,
    InvalidConfiguration
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
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Error value carried by every fallible enclave operation.
///
/// native_status is set whenever the failure originated from a keystore call,
/// so callers can log or display the backend's own code.
class EnclaveFailure {
public:
    EnclaveFailureType type;
    std::string message;
    std::optional<NativeStatus> native_status;
    EnclaveFailure(const EnclaveFailureType t, std::string msg,
                   const std::optional<NativeStatus> status = std::nullopt)
        : type(t), message(std::move(msg)), native_status(status) {}
    static EnclaveFailure KeystoreError(std::string msg,
                                        const std::optional<NativeStatus> status = std::nullopt) {
        return {EnclaveFailureType::KeystoreError, std::move(msg), status};
    }
    static EnclaveFailure KeyUnavailable(std::string msg,
                                         const std::optional<NativeStatus> status = std::nullopt) {
        return {EnclaveFailureType::KeyUnavailable, std::move(msg), status};
    }
    static EnclaveFailure MessageTooLarge(std::string msg) {
        return {EnclaveFailureType::MessageTooLarge, std::move(msg)};
    }
    static EnclaveFailure InvalidSigningParameters(std::string msg, const NativeStatus status) {
        return {EnclaveFailureType::InvalidSigningParameters, std::move(msg), status};
    }
    static EnclaveFailure SigningFailed(std::string msg,
                                        const std::optional<NativeStatus> status = std::nullopt) {
        return {EnclaveFailureType::SigningFailed, std::move(msg), status};
    }
    static EnclaveFailure VerificationFailed(std::string msg, const NativeStatus status) {
        return {EnclaveFailureType::VerificationFailed, std::move(msg), status};
    }
    static EnclaveFailure EncryptionFailed(std::string msg,
                                           const std::optional<NativeStatus> status = std::nullopt) {
        return {EnclaveFailureType::EncryptionFailed, std::move(msg), status};
    }
    static EnclaveFailure DecryptionFailed(std::string msg,
                                           const std::optional<NativeStatus> status = std::nullopt) {
        return {EnclaveFailureType::DecryptionFailed, std::move(msg), status};
    }
    static EnclaveFailure AccessControlFailed(std::string msg) {
        return {EnclaveFailureType::AccessControlFailed, std::move(msg)};
    }
    static EnclaveFailure InvalidConfiguration(std::string msg) {
        return {EnclaveFailureType::InvalidConfiguration, std::move(msg)};
    }
    static EnclaveFailure FromSodiumFailure(const SodiumFailure& sf) {
        return KeystoreError(sf.message);
    }
    [[nodiscard]] bool HasStatus(const NativeStatus status) const noexcept {
        return native_status.has_value() && *native_status == status;
    }
};
}
