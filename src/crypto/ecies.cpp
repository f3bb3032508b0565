#include "enclave/crypto/ecies.hpp"
#include "enclave/crypto/aes_gcm.hpp"
#include "enclave/crypto/ec_key.hpp"
#include "enclave/crypto/sodium_interop.hpp"
#include "enclave/crypto/x963_kdf.hpp"
#include "enclave/core/constants.hpp"
#include <fmt/core.h>
namespace enclave::crypto {
namespace {
    void Wipe(std::vector<uint8_t>& buffer) {
        auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        (void)wipe;
    }

    Result<std::vector<uint8_t>, EnclaveFailure> DeriveKeyAndIv(
        EVP_PKEY* own_private_key,
        EVP_PKEY* peer_public_key,
        std::span<const uint8_t> ephemeral_point) {
        auto secret_result = EcKey::CofactorAgree(own_private_key, peer_public_key);
        if (secret_result.IsErr()) {
            return secret_result;
        }
        auto shared_secret = std::move(secret_result).Unwrap();
        auto kdf_result = X963Kdf::DeriveKeyBytes(
            shared_secret, Constants::ECIES_KDF_OUTPUT_SIZE, ephemeral_point);
        Wipe(shared_secret);
        return kdf_result;
    }
}

Result<std::vector<uint8_t>, EnclaveFailure> Ecies::Encrypt(
    EVP_PKEY* recipient_public_key,
    std::span<const uint8_t> plaintext) {
    auto ephemeral_result = EcKey::GenerateP256();
    if (ephemeral_result.IsErr()) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(std::move(ephemeral_result).UnwrapErr());
    }
    auto ephemeral = std::move(ephemeral_result).Unwrap();

    auto point_result = EcKey::ExportPublicPoint(ephemeral.get());
    if (point_result.IsErr()) {
        return point_result;
    }
    auto ephemeral_point = std::move(point_result).Unwrap();

    auto key_iv_result = DeriveKeyAndIv(ephemeral.get(), recipient_public_key, ephemeral_point);
    if (key_iv_result.IsErr()) {
        return key_iv_result;
    }
    auto key_iv = std::move(key_iv_result).Unwrap();
    const std::span<const uint8_t> key_iv_view(key_iv);

    auto sealed = AesGcm::Encrypt(
        key_iv_view.first(Constants::AES_128_KEY_SIZE),
        key_iv_view.subspan(Constants::AES_128_KEY_SIZE, Constants::AES_GCM_VARIABLE_IV_SIZE),
        plaintext);
    Wipe(key_iv);
    if (sealed.IsErr()) {
        return sealed;
    }

    std::vector<uint8_t> output;
    output.reserve(ephemeral_point.size() + sealed.Unwrap().size());
    output.insert(output.end(), ephemeral_point.begin(), ephemeral_point.end());
    output.insert(output.end(), sealed.Unwrap().begin(), sealed.Unwrap().end());
    return Result<std::vector<uint8_t>, EnclaveFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, EnclaveFailure> Ecies::Decrypt(
    EVP_PKEY* recipient_private_key,
    std::span<const uint8_t> ciphertext) {
    if (ciphertext.size() < Constants::ECIES_MIN_CIPHERTEXT_SIZE) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                fmt::format("ECIES ciphertext too short: {} bytes (minimum {})",
                    ciphertext.size(), Constants::ECIES_MIN_CIPHERTEXT_SIZE),
                KeystoreStatus::DECODE));
    }
    const auto ephemeral_point = ciphertext.first(Constants::EC_P256_UNCOMPRESSED_POINT_SIZE);
    const auto sealed = ciphertext.subspan(Constants::EC_P256_UNCOMPRESSED_POINT_SIZE);

    auto peer_result = EcKey::ImportPublicPoint(ephemeral_point);
    if (peer_result.IsErr()) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(std::move(peer_result).UnwrapErr());
    }
    auto ephemeral_public = std::move(peer_result).Unwrap();

    auto key_iv_result = DeriveKeyAndIv(recipient_private_key, ephemeral_public.get(), ephemeral_point);
    if (key_iv_result.IsErr()) {
        return key_iv_result;
    }
    auto key_iv = std::move(key_iv_result).Unwrap();
    const std::span<const uint8_t> key_iv_view(key_iv);

    auto opened = AesGcm::Decrypt(
        key_iv_view.first(Constants::AES_128_KEY_SIZE),
        key_iv_view.subspan(Constants::AES_128_KEY_SIZE, Constants::AES_GCM_VARIABLE_IV_SIZE),
        sealed);
    Wipe(key_iv);
    return opened;
}

}
