#include "enclave/crypto/ecdsa.hpp"
#include "enclave/crypto/openssl_error.hpp"
#include "enclave/core/constants.hpp"
#include <fmt/core.h>
#include <memory>
namespace enclave::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_MD_CTX_Deleter {
        void operator()(EVP_MD_CTX* ctx) const {
            if (ctx) {
                EVP_MD_CTX_free(ctx);
            }
        }
    };
    using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;
}

Result<std::vector<uint8_t>, EnclaveFailure> Ecdsa::Sign(
    EVP_PKEY* private_key,
    std::span<const uint8_t> message) {
    EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError("Failed to create digest context", KeystoreStatus::ALLOCATE));
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, private_key) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                fmt::format("Failed to initialize signing: {}", GetOpenSSLError()),
                KeystoreStatus::INVALID_KEY));
    }
    size_t signature_len = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &signature_len, message.data(), message.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                fmt::format("Failed to size signature: {}", GetOpenSSLError()),
                KeystoreStatus::PARAM));
    }
    std::vector<uint8_t> signature(signature_len);
    if (EVP_DigestSign(ctx.get(), signature.data(), &signature_len, message.data(), message.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                fmt::format("Signing failed: {}", GetOpenSSLError())));
    }
    signature.resize(signature_len);
    return Result<std::vector<uint8_t>, EnclaveFailure>::Ok(std::move(signature));
}

Result<Unit, EnclaveFailure> Ecdsa::Verify(
    EVP_PKEY* public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {
    EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Result<Unit, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError("Failed to create digest context", KeystoreStatus::ALLOCATE));
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, public_key) != OpenSSL::SUCCESS) {
        return Result<Unit, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                fmt::format("Failed to initialize verification: {}", GetOpenSSLError()),
                KeystoreStatus::INVALID_KEY));
    }
    const int verdict = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                         message.data(), message.size());
    if (verdict != OpenSSL::SUCCESS) {
        ClearOpenSSLErrors();
        return Result<Unit, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError("Signature does not match message", KeystoreStatus::VERIFY_FAILED));
    }
    return Result<Unit, EnclaveFailure>::Ok(unit);
}

}
