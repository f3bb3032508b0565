#pragma once
#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace enclave::crypto {

/**
 * AES-GCM authenticated encryption over OpenSSL EVP.
 *
 * Key length selects the cipher: 16 bytes for AES-128-GCM, 32 bytes for
 * AES-256-GCM. The IV is either the standard 12 bytes or the 16-byte
 * variable IV produced by the ECIES key derivation. Output is
 * ciphertext || 16-byte tag.
 *
 * The (key, iv) pair must never repeat. Inside this library every key comes
 * from a fresh ephemeral agreement, so each key encrypts exactly one message.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, EnclaveFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, EnclaveFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
