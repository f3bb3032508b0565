#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace enclave {
struct Constants {
    static constexpr size_t SIGNATURE_BLOCK_SIZE = 256;
    static constexpr size_t PKCS1_PADDING_OVERHEAD = 11;
    static constexpr size_t MAX_SIGN_INPUT_SIZE = SIGNATURE_BLOCK_SIZE - PKCS1_PADDING_OVERHEAD;
    static constexpr uint32_t EC_KEY_SIZE_BITS = 256;
    static constexpr size_t EC_P256_FIELD_SIZE = 32;
    static constexpr size_t EC_P256_UNCOMPRESSED_POINT_SIZE = 1 + 2 * EC_P256_FIELD_SIZE;
    static constexpr uint8_t EC_UNCOMPRESSED_POINT_PREFIX = 0x04;
    static constexpr size_t AES_128_KEY_SIZE = 16;
    static constexpr size_t AES_256_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_STANDARD_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_VARIABLE_IV_SIZE = 16;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t ECIES_KDF_OUTPUT_SIZE = AES_128_KEY_SIZE + AES_GCM_VARIABLE_IV_SIZE;
    static constexpr size_t ECIES_MIN_CIPHERTEXT_SIZE = EC_P256_UNCOMPRESSED_POINT_SIZE + AES_GCM_TAG_SIZE;
    static constexpr size_t SHA256_DIGEST_SIZE = 32;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr char QUALIFIED_GROUP_SEPARATOR = '.';
};
struct AuthenticationConstants {
    static constexpr std::chrono::seconds DEFAULT_REUSE_DURATION{15};
    static constexpr std::chrono::seconds MAX_REUSE_DURATION{300};
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_X963KDF = "X963KDF";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view CURVE_P256 = "P-256";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view PARAM_KEY = "key";
    static constexpr std::string_view PARAM_INFO = "info";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Secure memory handle has been disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data exceeds secure buffer size";
    static constexpr std::string_view PUBLIC_KEY_UNAVAILABLE = "Public key is not available";
    static constexpr std::string_view PRIVATE_KEY_UNAVAILABLE = "Private key is not available";
    static constexpr std::string_view RESOLUTION_PREVIOUSLY_FAILED =
        "Key resolution failed earlier for this handle; construct a new service to retry";
};
}
