#pragma once
#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"
#include <openssl/evp.h>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>
namespace enclave::crypto {

struct EVP_PKEY_Deleter {
    void operator()(EVP_PKEY* key) const {
        if (key) {
            EVP_PKEY_free(key);
        }
    }
};
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;

/**
 * @brief NIST P-256 key helpers over OpenSSL 3 EVP_PKEY
 *
 * Private keys travel as DER (SEC 1 ECPrivateKey), public keys as the
 * 65-byte uncompressed point.
 */
class EcKey {
public:
    [[nodiscard]] static Result<EvpPkeyPtr, EnclaveFailure> GenerateP256();

    [[nodiscard]] static Result<std::vector<uint8_t>, EnclaveFailure> ExportPrivateDer(EVP_PKEY* key);

    [[nodiscard]] static Result<EvpPkeyPtr, EnclaveFailure> ImportPrivateDer(std::span<const uint8_t> der);

    [[nodiscard]] static Result<std::vector<uint8_t>, EnclaveFailure> ExportPublicPoint(EVP_PKEY* key);

    [[nodiscard]] static Result<EvpPkeyPtr, EnclaveFailure> ImportPublicPoint(std::span<const uint8_t> point);

    /**
     * @brief Cofactor Diffie-Hellman between own private key and peer public key
     *
     * Returns the x coordinate of the shared point (32 bytes for P-256).
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, EnclaveFailure> CofactorAgree(
        EVP_PKEY* private_key,
        EVP_PKEY* peer_public_key);

private:
    EcKey() = delete;
};

}
