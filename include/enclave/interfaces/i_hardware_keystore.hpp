#pragma once
#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"
#include "enclave/keystore/access_policy.hpp"
#include "enclave/keystore/algorithms.hpp"
#include "enclave/keystore/key_attributes.hpp"
#include "enclave/keystore/key_ref.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
namespace enclave::interfaces {

/**
 * @brief Secure-element keystore the key lifecycle runs against
 *
 * Failures are EnclaveFailure::KeystoreError values carrying the backend's
 * native status. Private key material never crosses this interface; callers
 * hold KeyRef values only.
 */
class IHardwareKeystore {
public:
    virtual ~IHardwareKeystore() = default;

    /// Ok(nullopt) when nothing matches the query.
    [[nodiscard]] virtual Result<std::optional<keystore::KeyRef>, EnclaveFailure> Find(
        const keystore::KeyQuery& query) = 0;

    [[nodiscard]] virtual Result<keystore::KeyRef, EnclaveFailure> CreateKey(
        const keystore::KeyAttributes& attributes) = 0;

    /// Removes every entry matching the query.
    [[nodiscard]] virtual Result<Unit, EnclaveFailure> Delete(const keystore::KeyQuery& query) = 0;

    [[nodiscard]] virtual Result<std::vector<uint8_t>, EnclaveFailure> DeriveEncryptedPayload(
        const keystore::KeyRef& public_key,
        keystore::EncryptionAlgorithm algorithm,
        std::span<const uint8_t> plaintext) = 0;

    /// nullopt when the keystore produced no plaintext. An empty vector is a
    /// legitimate zero-length plaintext.
    [[nodiscard]] virtual std::optional<std::vector<uint8_t>> DeriveDecryptedPayload(
        const keystore::KeyRef& private_key,
        keystore::EncryptionAlgorithm algorithm,
        std::span<const uint8_t> ciphertext) = 0;

    /// Writes the signature into out and returns the number of bytes written.
    [[nodiscard]] virtual Result<size_t, EnclaveFailure> RawSign(
        const keystore::KeyRef& private_key,
        keystore::SignatureScheme scheme,
        std::span<const uint8_t> message,
        std::span<uint8_t> out) = 0;

    [[nodiscard]] virtual Result<Unit, EnclaveFailure> RawVerify(
        const keystore::KeyRef& public_key,
        keystore::SignatureScheme scheme,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) = 0;

    [[nodiscard]] virtual Result<keystore::KeyRef, EnclaveFailure> DerivePublicKey(
        const keystore::KeyRef& private_key) = 0;

    [[nodiscard]] virtual Result<keystore::AccessControl, EnclaveFailure> CreateAccessControl(
        keystore::ProtectionClass protection_class,
        keystore::AccessFlags flags) = 0;

    /// Fixed for the lifetime of the keystore.
    [[nodiscard]] virtual bool HasSecureElement() const = 0;
};

}
