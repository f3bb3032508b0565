#include <catch2/catch_test_macros.hpp>
#include "enclave/service/enclave_crypto_service.hpp"
#include "enclave/keystore/software_keystore.hpp"
#include "helpers/counting_keystore.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace enclave;
using namespace enclave::service;
using namespace enclave::keystore;
using namespace enclave::test_helpers;

namespace {
    std::shared_ptr<CountingKeystore> MakeCountingKeystore() {
        std::shared_ptr<interfaces::IHardwareKeystore> inner = SoftwareKeystore::InMemory().Unwrap();
        return std::make_shared<CountingKeystore>(std::move(inner));
    }

    EnclaveConfig ExampleConfig() {
        return EnclaveConfig::Create("com.example.key1", "com.example.app", "shared", "Unlock key").Unwrap();
    }
}

TEST_CASE("Concurrency - First use resolves the key once", "[concurrency][key_handle]") {
    constexpr int THREAD_COUNT = 16;
    auto keystore = MakeCountingKeystore();
    keystore->DelayCreate(std::chrono::milliseconds(50));
    auto service = EnclaveCryptoService::Create(ExampleConfig(), keystore).Unwrap();

    std::atomic<bool> start{false};
    std::atomic<int> successes{0};
    std::vector<std::vector<uint8_t>> signatures(THREAD_COUNT);
    const std::vector<uint8_t> message = {1, 2, 3};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&, t]() {
            while (!start.load()) {
                std::this_thread::yield();
            }
            auto signature = service->Sign(message);
            if (signature.IsOk()) {
                signatures[t] = std::move(signature).Unwrap();
                successes.fetch_add(1);
            }
        });
    }
    start.store(true);
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(successes.load() == THREAD_COUNT);
    REQUIRE(keystore->find_calls == 1);
    REQUIRE(keystore->create_calls == 1);
    REQUIRE(keystore->sign_calls == THREAD_COUNT);
    REQUIRE(service->State() == KeyState::Resolved);
    for (const auto& signature : signatures) {
        REQUIRE(service->Verify(signature, message).Unwrap());
    }
}

TEST_CASE("Concurrency - Failed resolution is shared by all callers", "[concurrency][key_handle]") {
    constexpr int THREAD_COUNT = 8;
    auto keystore = MakeCountingKeystore();
    keystore->DelayCreate(std::chrono::milliseconds(20));
    keystore->FailCreateWith(KeystoreStatus::AUTH_FAILED);
    auto service = EnclaveCryptoService::Create(ExampleConfig(), keystore).Unwrap();

    std::atomic<int> unavailable{0};
    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&]() {
            auto ciphertext = service->Decrypt(std::vector<uint8_t>(100, 0x04));
            if (ciphertext.IsErr() && ciphertext.UnwrapErr().type == EnclaveFailureType::KeyUnavailable) {
                unavailable.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(unavailable.load() == THREAD_COUNT);
    REQUIRE(keystore->create_calls == 1);
    REQUIRE(keystore->decrypt_calls == 0);
    REQUIRE(service->State() == KeyState::Failed);
}

TEST_CASE("Concurrency - Services sharing a keystore converge on one key", "[concurrency][keystore]") {
    constexpr int SERVICE_COUNT = 8;
    auto keystore = MakeCountingKeystore();
    std::vector<std::unique_ptr<EnclaveCryptoService>> services;
    for (int i = 0; i < SERVICE_COUNT; ++i) {
        services.push_back(EnclaveCryptoService::Create(ExampleConfig(), keystore).Unwrap());
    }

    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    threads.reserve(SERVICE_COUNT);
    for (auto& service : services) {
        threads.emplace_back([&successes, &service]() {
            if (service->Touch().IsOk()) {
                successes.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(successes.load() == SERVICE_COUNT);
    const std::vector<uint8_t> message = {5, 5, 5};
    auto signature = services.front()->Sign(message).Unwrap();
    for (const auto& service : services) {
        REQUIRE(service->Verify(signature, message).Unwrap());
    }
}
