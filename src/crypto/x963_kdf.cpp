#include "enclave/crypto/x963_kdf.hpp"
#include "enclave/core/constants.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <string>

namespace enclave::crypto {

Result<Unit, EnclaveFailure> X963Kdf::DeriveKey(
    std::span<const uint8_t> shared_secret,
    std::span<uint8_t> output,
    std::span<const uint8_t> shared_info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                "X9.63 KDF output size out of range: " + std::to_string(output.size()),
                KeystoreStatus::PARAM));
    }

    if (shared_secret.empty()) {
        return Result<Unit, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError("X9.63 KDF shared secret cannot be empty",
                                          KeystoreStatus::PARAM));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_X963KDF.data(), nullptr);
    if (!kdf) {
        return Result<Unit, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError("Failed to fetch X9.63 KDF algorithm"));
    }

    EVP_KDF_CTX* kctx = EVP_KDF_CTX_new(kdf);
    EVP_KDF_free(kdf);

    if (!kctx) {
        return Result<Unit, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError("Failed to create X9.63 KDF context"));
    }

    OSSL_PARAM params[4];
    int param_idx = 0;

    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OpenSSLConstants::PARAM_DIGEST.data(),
        const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256.data()), 0);

    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSLConstants::PARAM_KEY.data(),
        const_cast<uint8_t*>(shared_secret.data()), shared_secret.size());

    if (!shared_info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_INFO.data(),
            const_cast<uint8_t*>(shared_info.data()), shared_info.size());
    }

    params[param_idx] = OSSL_PARAM_construct_end();

    const int result = EVP_KDF_derive(kctx, output.data(), output.size(), params);
    EVP_KDF_CTX_free(kctx);

    if (result != OpenSSLConstants::SUCCESS) {
        return Result<Unit, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError("X9.63 key derivation failed"));
    }

    return Result<Unit, EnclaveFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, EnclaveFailure> X963Kdf::DeriveKeyBytes(
    std::span<const uint8_t> shared_secret,
    size_t output_size,
    std::span<const uint8_t> shared_info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(shared_secret, output, shared_info);

    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
            std::move(result).UnwrapErr());
    }

    return Result<std::vector<uint8_t>, EnclaveFailure>::Ok(std::move(output));
}

} // namespace enclave::crypto
