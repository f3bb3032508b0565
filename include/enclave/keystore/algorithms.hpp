#pragma once
#include <cstdint>
namespace enclave::keystore {

/// ECIES, cofactor ECDH, variable IV, X9.63 KDF over SHA-256, AES-GCM.
enum class EncryptionAlgorithm : uint8_t {
    EciesCofactorVariableIvX963Sha256AesGcm = 0
};

/// Fixed 256-byte signature block with PKCS#1 padding overhead on the input.
/// Elliptic-curve keys answer it with an ECDSA signature over SHA-256.
enum class SignatureScheme : uint8_t {
    Pkcs1Block = 0
};

}
