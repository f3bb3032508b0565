#include "enclave/crypto/ec_key.hpp"
#include "enclave/crypto/openssl_error.hpp"
#include "enclave/core/constants.hpp"
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/params.h>
#include <openssl/x509.h>
#include <fmt/core.h>
namespace enclave::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_PKEY_CTX_Deleter {
        void operator()(EVP_PKEY_CTX* ctx) const {
            if (ctx) {
                EVP_PKEY_CTX_free(ctx);
            }
        }
    };
    using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;

    template<typename T>
    Result<T, EnclaveFailure> KeyError(const char* stage, const NativeStatus status) {
        return Result<T, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                fmt::format("{}: {}", stage, GetOpenSSLError()), status));
    }
}

Result<EvpPkeyPtr, EnclaveFailure> EcKey::GenerateP256() {
    EvpPkeyPtr key(EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", OpenSSL::CURVE_P256.data()));
    if (!key) {
        return KeyError<EvpPkeyPtr>("Failed to generate P-256 key", KeystoreStatus::ALLOCATE);
    }
    return Result<EvpPkeyPtr, EnclaveFailure>::Ok(std::move(key));
}

Result<std::vector<uint8_t>, EnclaveFailure> EcKey::ExportPrivateDer(EVP_PKEY* key) {
    const int len = i2d_PrivateKey(key, nullptr);
    if (len <= 0) {
        return KeyError<std::vector<uint8_t>>("Failed to size private key encoding", KeystoreStatus::INVALID_KEY);
    }
    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* cursor = der.data();
    if (i2d_PrivateKey(key, &cursor) != len) {
        return KeyError<std::vector<uint8_t>>("Failed to encode private key", KeystoreStatus::INVALID_KEY);
    }
    return Result<std::vector<uint8_t>, EnclaveFailure>::Ok(std::move(der));
}

Result<EvpPkeyPtr, EnclaveFailure> EcKey::ImportPrivateDer(std::span<const uint8_t> der) {
    const unsigned char* cursor = der.data();
    EvpPkeyPtr key(d2i_PrivateKey(EVP_PKEY_EC, nullptr, &cursor, static_cast<long>(der.size())));
    if (!key) {
        return KeyError<EvpPkeyPtr>("Failed to decode private key", KeystoreStatus::DECODE);
    }
    return Result<EvpPkeyPtr, EnclaveFailure>::Ok(std::move(key));
}

Result<std::vector<uint8_t>, EnclaveFailure> EcKey::ExportPublicPoint(EVP_PKEY* key) {
    unsigned char* encoded = nullptr;
    const size_t len = EVP_PKEY_get1_encoded_public_key(key, &encoded);
    if (len == 0 || encoded == nullptr) {
        return KeyError<std::vector<uint8_t>>("Failed to encode public key", KeystoreStatus::INVALID_KEY);
    }
    std::vector<uint8_t> point(encoded, encoded + len);
    OPENSSL_free(encoded);
    if (point.size() != Constants::EC_P256_UNCOMPRESSED_POINT_SIZE ||
        point.front() != Constants::EC_UNCOMPRESSED_POINT_PREFIX) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                fmt::format("Unexpected public key encoding ({} bytes)", point.size()),
                KeystoreStatus::INVALID_KEY));
    }
    return Result<std::vector<uint8_t>, EnclaveFailure>::Ok(std::move(point));
}

Result<EvpPkeyPtr, EnclaveFailure> EcKey::ImportPublicPoint(std::span<const uint8_t> point) {
    if (point.size() != Constants::EC_P256_UNCOMPRESSED_POINT_SIZE ||
        point.front() != Constants::EC_UNCOMPRESSED_POINT_PREFIX) {
        return Result<EvpPkeyPtr, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                fmt::format("Public point must be {} bytes uncompressed, got {}",
                    Constants::EC_P256_UNCOMPRESSED_POINT_SIZE, point.size()),
                KeystoreStatus::DECODE));
    }
    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
    if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != OpenSSL::SUCCESS) {
        return KeyError<EvpPkeyPtr>("Failed to prepare public key import", KeystoreStatus::ALLOCATE);
    }
    OSSL_PARAM params[3];
    params[0] = OSSL_PARAM_construct_utf8_string(
        OSSL_PKEY_PARAM_GROUP_NAME, const_cast<char*>(OpenSSL::CURVE_P256.data()), 0);
    params[1] = OSSL_PARAM_construct_octet_string(
        OSSL_PKEY_PARAM_PUB_KEY, const_cast<uint8_t*>(point.data()), point.size());
    params[2] = OSSL_PARAM_construct_end();
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params) != OpenSSL::SUCCESS) {
        return KeyError<EvpPkeyPtr>("Public point is not on P-256", KeystoreStatus::DECODE);
    }
    return Result<EvpPkeyPtr, EnclaveFailure>::Ok(EvpPkeyPtr(raw));
}

Result<std::vector<uint8_t>, EnclaveFailure> EcKey::CofactorAgree(
    EVP_PKEY* private_key,
    EVP_PKEY* peer_public_key) {
    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new(private_key, nullptr));
    if (!ctx) {
        return KeyError<std::vector<uint8_t>>("Failed to create agreement context", KeystoreStatus::ALLOCATE);
    }
    if (EVP_PKEY_derive_init(ctx.get()) != OpenSSL::SUCCESS) {
        return KeyError<std::vector<uint8_t>>("Failed to initialize agreement", KeystoreStatus::INVALID_KEY);
    }
    if (EVP_PKEY_CTX_set_ecdh_cofactor_mode(ctx.get(), 1) != OpenSSL::SUCCESS) {
        return KeyError<std::vector<uint8_t>>("Failed to enable cofactor mode", KeystoreStatus::PARAM);
    }
    if (EVP_PKEY_derive_set_peer(ctx.get(), peer_public_key) != OpenSSL::SUCCESS) {
        return KeyError<std::vector<uint8_t>>("Failed to set agreement peer", KeystoreStatus::INVALID_KEY);
    }
    size_t secret_len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &secret_len) != OpenSSL::SUCCESS) {
        return KeyError<std::vector<uint8_t>>("Failed to size shared secret", KeystoreStatus::INVALID_KEY);
    }
    std::vector<uint8_t> secret(secret_len);
    if (EVP_PKEY_derive(ctx.get(), secret.data(), &secret_len) != OpenSSL::SUCCESS) {
        return KeyError<std::vector<uint8_t>>("Key agreement failed", KeystoreStatus::INVALID_KEY);
    }
    secret.resize(secret_len);
    return Result<std::vector<uint8_t>, EnclaveFailure>::Ok(std::move(secret));
}

}
