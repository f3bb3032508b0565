#include "enclave/crypto/aes_gcm.hpp"
#include "enclave/crypto/sodium_interop.hpp"
#include "enclave/crypto/openssl_error.hpp"
#include "enclave/core/constants.hpp"
#include <openssl/evp.h>
#include <fmt/core.h>
#include <memory>
namespace enclave::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;

    const EVP_CIPHER* SelectCipher(const size_t key_size) {
        if (key_size == Constants::AES_128_KEY_SIZE) {
            return EVP_aes_128_gcm();
        }
        if (key_size == Constants::AES_256_KEY_SIZE) {
            return EVP_aes_256_gcm();
        }
        return nullptr;
    }

    bool IsSupportedIvSize(const size_t iv_size) {
        return iv_size == Constants::AES_GCM_STANDARD_NONCE_SIZE ||
               iv_size == Constants::AES_GCM_VARIABLE_IV_SIZE;
    }

    void Wipe(std::vector<uint8_t>& buffer) {
        auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        (void)wipe;
    }

    Result<Unit, EnclaveFailure> ValidateKeyAndIv(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv) {
        if (SelectCipher(key.size()) == nullptr) {
            return Result<Unit, EnclaveFailure>::Err(
                EnclaveFailure::KeystoreError(
                    fmt::format("AES-GCM key must be {} or {} bytes, got {}",
                        Constants::AES_128_KEY_SIZE, Constants::AES_256_KEY_SIZE, key.size()),
                    KeystoreStatus::PARAM));
        }
        if (!IsSupportedIvSize(iv.size())) {
            return Result<Unit, EnclaveFailure>::Err(
                EnclaveFailure::KeystoreError(
                    fmt::format("AES-GCM IV must be {} or {} bytes, got {}",
                        Constants::AES_GCM_STANDARD_NONCE_SIZE,
                        Constants::AES_GCM_VARIABLE_IV_SIZE, iv.size()),
                    KeystoreStatus::PARAM));
        }
        return Result<Unit, EnclaveFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, EnclaveFailure> CipherError(const char* stage) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                fmt::format("{}: {}", stage, GetOpenSSLError())));
    }
}
Result<std::vector<uint8_t>, EnclaveFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto valid = ValidateKeyAndIv(key, iv); valid.IsErr()) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(std::move(valid).UnwrapErr());
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return CipherError("Failed to create cipher context");
    }
    if (EVP_EncryptInit_ex(ctx.get(), SelectCipher(key.size()), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return CipherError("Failed to initialize AES-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(iv.size()), nullptr) != OpenSSL::SUCCESS) {
        return CipherError("Failed to set IV length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != OpenSSL::SUCCESS) {
        return CipherError("Failed to set key and IV");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return CipherError("Failed to add associated data");
        }
    }
    std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(),
                          static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return CipherError("Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return CipherError("Encryption finalization failed");
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return CipherError("Failed to get authentication tag");
    }
    output.resize(static_cast<size_t>(ciphertext_len) + Constants::AES_GCM_TAG_SIZE);
    return Result<std::vector<uint8_t>, EnclaveFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, EnclaveFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto valid = ValidateKeyAndIv(key, iv); valid.IsErr()) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(std::move(valid).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                fmt::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE),
                KeystoreStatus::DECODE));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return CipherError("Failed to create cipher context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), SelectCipher(key.size()), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return CipherError("Failed to initialize AES-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(iv.size()), nullptr) != OpenSSL::SUCCESS) {
        return CipherError("Failed to set IV length");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != OpenSSL::SUCCESS) {
        return CipherError("Failed to set key and IV");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return CipherError("Failed to add associated data");
        }
    }
    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return CipherError("Decryption failed");
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           tag_copy.data()) != OpenSSL::SUCCESS) {
        Wipe(output);
        return CipherError("Failed to set authentication tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                "Authentication tag verification failed - data may have been tampered with",
                KeystoreStatus::DECODE));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, EnclaveFailure>::Ok(std::move(output));
}
}
