#include "enclave/crypto/openssl_error.hpp"
#include "enclave/core/constants.hpp"
#include <openssl/err.h>
namespace enclave::crypto {
std::string GetOpenSSLError() {
    const unsigned long err = ERR_get_error();
    if (err == OpenSSLConstants::NO_ERROR) {
        return std::string(OpenSSLConstants::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    ERR_clear_error();
    return std::string(buffer);
}
void ClearOpenSSLErrors() noexcept {
    ERR_clear_error();
}
}
