#pragma once
#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"
#include <openssl/evp.h>
#include <cstdint>
#include <span>
#include <vector>
namespace enclave::crypto {

/// ECDSA P-256 over SHA-256 of the message, DER encoded signatures.
class Ecdsa {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, EnclaveFailure> Sign(
        EVP_PKEY* private_key,
        std::span<const uint8_t> message);

    /// Ok on a valid signature; Err carrying VERIFY_FAILED on mismatch or
    /// malformed input.
    [[nodiscard]] static Result<Unit, EnclaveFailure> Verify(
        EVP_PKEY* public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

private:
    Ecdsa() = delete;
};

}
