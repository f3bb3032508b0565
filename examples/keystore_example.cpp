/**
 * @file keystore_example.cpp
 * @brief Sign, verify, encrypt and decrypt with a keystore-held P-256 key
 *
 * Usage: keystore_example [keystore-file]
 * Without a file the key lives in memory and is gone when the example exits.
 */

#include "enclave/service/enclave_crypto_service.hpp"
#include "enclave/keystore/software_keystore.hpp"
#include "enclave/core/result.hpp"

#include <iostream>
#include <iomanip>
#include <string>

using namespace enclave;
using namespace enclave::keystore;
using namespace enclave::service;

void print_hex(const std::string& label, const std::vector<uint8_t>& data) {
    std::cout << label << " (" << data.size() << " bytes): ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

class ConsoleEventHandler : public interfaces::IKeystoreEventHandler {
public:
    void OnSoftwareFallback(const identity::KeyIdentity& identity, const std::string& reason) override {
        std::cout << "   ! " << identity.Describe() << ": " << reason << std::endl;
    }

    void OnKeyCreated(const identity::KeyIdentity& identity, const KeystoreBackend backend) override {
        std::cout << "   + created " << identity.Describe() << " on "
                  << (backend == KeystoreBackend::SecureElement ? "secure element" : "software")
                  << std::endl;
    }
};

int main(int argc, char* argv[]) {
    std::cout << "=== Enclave Keys - Keystore Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Opening keystore..." << std::endl;
    auto keystore_result = argc > 1
        ? SoftwareKeystore::Open(argv[1])
        : SoftwareKeystore::InMemory();
    if (keystore_result.IsErr()) {
        std::cerr << "Failed to open keystore: "
                  << keystore_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::shared_ptr<SoftwareKeystore> keystore = std::move(keystore_result).Unwrap();
    keystore->SetUserPresenceCallback([](std::string_view prompt) {
        std::cout << "   ? " << prompt << " (approved)" << std::endl;
        return true;
    });
    std::cout << "   ✓ " << keystore->PermanentEntryCount() << " stored entries" << std::endl;
    std::cout << std::endl;

    auto config = EnclaveConfig::Create(
        "com.example.key1", "com.example.app", "shared", "Use the example key");
    if (config.IsErr()) {
        std::cerr << "Invalid configuration: " << config.UnwrapErr().message << std::endl;
        return 1;
    }
    auto service_result = EnclaveCryptoService::Create(config.Unwrap(), keystore);
    if (service_result.IsErr()) {
        std::cerr << "Failed to create service: " << service_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto service = std::move(service_result).Unwrap();
    service->SetEventHandler(std::make_shared<ConsoleEventHandler>());

    std::cout << "2. Resolving key..." << std::endl;
    if (auto touched = service->Touch(); touched.IsErr()) {
        std::cerr << "Key resolution failed: " << touched.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Key ready" << std::endl;
    std::cout << std::endl;

    std::cout << "3. Signing..." << std::endl;
    const std::string text = "hello from the keystore";
    const std::vector<uint8_t> message(text.begin(), text.end());
    auto signature = service->Sign(message);
    if (signature.IsErr()) {
        std::cerr << "Signing failed: " << signature.UnwrapErr().message << std::endl;
        return 1;
    }
    print_hex("   Signature", signature.Unwrap());
    auto verified = service->Verify(signature.Unwrap(), message);
    if (verified.IsErr() || !verified.Unwrap()) {
        std::cerr << "Verification failed" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Signature verified" << std::endl;
    std::cout << std::endl;

    std::cout << "4. Encrypting..." << std::endl;
    auto ciphertext = service->Encrypt(message);
    if (ciphertext.IsErr()) {
        std::cerr << "Encryption failed: " << ciphertext.UnwrapErr().message << std::endl;
        return 1;
    }
    print_hex("   Ciphertext", ciphertext.Unwrap());
    auto plaintext = service->Decrypt(ciphertext.Unwrap());
    if (plaintext.IsErr()) {
        std::cerr << "Decryption failed: " << plaintext.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Decrypted: "
              << std::string(plaintext.Unwrap().begin(), plaintext.Unwrap().end()) << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
