#include <catch2/catch_test_macros.hpp>
#include "enclave/service/enclave_crypto_service.hpp"
#include "enclave/keystore/software_keystore.hpp"
#include <atomic>
#include <string>

using namespace enclave;
using namespace enclave::service;
using namespace enclave::keystore;

namespace {
    struct PresenceFixture {
        std::shared_ptr<SoftwareKeystore> keystore;
        std::atomic<int> prompts{0};
        std::atomic<bool> approve{true};
        std::string last_prompt;

        PresenceFixture() : keystore(SoftwareKeystore::InMemory().Unwrap()) {
            keystore->SetUserPresenceCallback([this](std::string_view prompt) {
                ++prompts;
                last_prompt = std::string(prompt);
                return approve.load();
            });
        }

        std::unique_ptr<EnclaveCryptoService> Service(
            const std::chrono::seconds reuse = AuthenticationConstants::DEFAULT_REUSE_DURATION,
            const AccessPolicy policy = AccessPolicy::Default()) {
            auto config = EnclaveConfig::Create("com.example.key1", "com.example.app", "shared", "Sign the document")
                              .Unwrap()
                              .WithAccessPolicy(policy)
                              .WithReuseDuration(reuse)
                              .Unwrap();
            return EnclaveCryptoService::Create(config, keystore).Unwrap();
        }
    };

    const std::vector<uint8_t> MESSAGE = {1, 2, 3};
}

TEST_CASE("Security - User presence gates private key use", "[security][presence]") {
    PresenceFixture fixture;

    SECTION("Approval is requested with the configured prompt") {
        auto service = fixture.Service();
        REQUIRE(service->Sign(MESSAGE).IsOk());
        REQUIRE(fixture.prompts == 1);
        REQUIRE(fixture.last_prompt == "Sign the document");
    }

    SECTION("Declined approval fails the operation") {
        fixture.approve = false;
        auto service = fixture.Service();
        auto signature = service->Sign(MESSAGE);
        REQUIRE(signature.IsErr());
        REQUIRE(signature.UnwrapErr().type == EnclaveFailureType::SigningFailed);
        REQUIRE(signature.UnwrapErr().HasStatus(KeystoreStatus::USER_CANCELED));
        REQUIRE(service->State() == KeyState::Resolved);

        fixture.approve = true;
        REQUIRE(service->Sign(MESSAGE).IsOk());
    }

    SECTION("Declined approval fails decryption") {
        auto service = fixture.Service();
        auto ciphertext = service->Encrypt(MESSAGE).Unwrap();
        REQUIRE(fixture.prompts == 0);
        fixture.approve = false;
        auto plaintext = service->Decrypt(ciphertext);
        REQUIRE(plaintext.IsErr());
        REQUIRE(plaintext.UnwrapErr().type == EnclaveFailureType::DecryptionFailed);
    }

    SECTION("Public key operations never prompt") {
        auto service = fixture.Service();
        auto signature = service->Sign(MESSAGE).Unwrap();
        const int after_sign = fixture.prompts;
        REQUIRE(service->Verify(signature, MESSAGE).Unwrap());
        REQUIRE(service->Encrypt(MESSAGE).IsOk());
        REQUIRE(fixture.prompts == after_sign);
    }
}

TEST_CASE("Security - Authentication reuse window", "[security][presence]") {
    PresenceFixture fixture;

    SECTION("Operations inside the window share one approval") {
        auto service = fixture.Service(std::chrono::seconds{60});
        REQUIRE(service->Sign(MESSAGE).IsOk());
        REQUIRE(service->Sign(MESSAGE).IsOk());
        auto ciphertext = service->Encrypt(MESSAGE).Unwrap();
        REQUIRE(service->Decrypt(ciphertext).IsOk());
        REQUIRE(fixture.prompts == 1);
    }

    SECTION("Zero window prompts for every operation") {
        auto service = fixture.Service(std::chrono::seconds{0});
        REQUIRE(service->Sign(MESSAGE).IsOk());
        REQUIRE(service->Sign(MESSAGE).IsOk());
        REQUIRE(fixture.prompts == 2);
    }

    SECTION("Declined approval does not open the window") {
        auto service = fixture.Service(std::chrono::seconds{60});
        fixture.approve = false;
        REQUIRE(service->Sign(MESSAGE).IsErr());
        REQUIRE(service->Sign(MESSAGE).IsErr());
        REQUIRE(fixture.prompts == 2);
    }

    SECTION("Policy without presence never prompts") {
        const AccessPolicy unattended{
            ProtectionClass::AfterFirstUnlockThisDeviceOnly,
            AccessFlags().With(AccessFlag::PrivateKeyUsage)};
        auto service = fixture.Service(std::chrono::seconds{0}, unattended);
        REQUIRE(service->Sign(MESSAGE).IsOk());
        REQUIRE(fixture.prompts == 0);
    }
}
