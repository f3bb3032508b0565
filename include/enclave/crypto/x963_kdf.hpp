#pragma once

#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace enclave::crypto {

/**
 * @brief ANSI X9.63 key derivation with SHA-256
 *
 * Output = SHA256(Z || counter || SharedInfo) for counter = 1, 2, ...
 * truncated to the requested length. This is the KDF of the ECIES variant
 * used for payload encryption, where Z is the ECDH shared secret and
 * SharedInfo is the ephemeral public key.
 */
class X963Kdf {
public:
    /**
     * @brief Fill output with key material derived from shared_secret
     *
     * @param shared_secret Agreement output (Z), must not be empty
     * @param output Buffer to fill
     * @param shared_info Optional SharedInfo
     */
    static Result<Unit, EnclaveFailure> DeriveKey(
        std::span<const uint8_t> shared_secret,
        std::span<uint8_t> output,
        std::span<const uint8_t> shared_info = {});

    static Result<std::vector<uint8_t>, EnclaveFailure> DeriveKeyBytes(
        std::span<const uint8_t> shared_secret,
        size_t output_size,
        std::span<const uint8_t> shared_info = {});

    static constexpr size_t HASH_LEN = 32;
    // SEC 1 caps the output at hashlen * (2^32 - 1); keep a practical bound.
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    X963Kdf() = delete;
};

} // namespace enclave::crypto
