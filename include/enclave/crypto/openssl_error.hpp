#pragma once
#include <string>
namespace enclave::crypto {

/// Pops the oldest entry from the OpenSSL error queue and renders it.
std::string GetOpenSSLError();

/// Drops anything left on the OpenSSL error queue by an expected failure.
void ClearOpenSSLErrors() noexcept;

}
