#pragma once
#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"
#include <openssl/evp.h>
#include <cstdint>
#include <span>
#include <vector>
namespace enclave::crypto {

/**
 * ECIES over P-256: cofactor ECDH, variable IV, X9.63 KDF with SHA-256,
 * AES-GCM.
 *
 * Encrypt generates an ephemeral key pair, agrees with the recipient's
 * public key and stretches the shared secret with X9.63 (SharedInfo = the
 * ephemeral public point) into a 16-byte AES key followed by a 16-byte IV.
 *
 * Wire format: ephemeral point (65 bytes) || ciphertext || tag (16 bytes).
 */
class Ecies {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, EnclaveFailure> Encrypt(
        EVP_PKEY* recipient_public_key,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] static Result<std::vector<uint8_t>, EnclaveFailure> Decrypt(
        EVP_PKEY* recipient_private_key,
        std::span<const uint8_t> ciphertext);

private:
    Ecies() = delete;
};

}
