#pragma once
#include "enclave/interfaces/i_hardware_keystore.hpp"
#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"
#include <algorithm>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace enclave::test_helpers {

using interfaces::IHardwareKeystore;
using keystore::AccessControl;
using keystore::AccessFlags;
using keystore::AccessPolicy;
using keystore::EncryptionAlgorithm;
using keystore::KeyAttributes;
using keystore::KeyClass;
using keystore::KeyQuery;
using keystore::KeyRef;
using keystore::KeystoreBackend;
using keystore::ProtectionClass;
using keystore::SignatureScheme;

inline EnclaveFailure StatusError(const NativeStatus status) {
    return EnclaveFailure::KeystoreError(
        std::string("scripted status ") + std::to_string(status), status);
}

/**
 * Keystore whose answers are queued up front by the test. An empty queue falls
 * back to a benign default: nothing found, creation and derivation succeed,
 * payloads are echoed back and signatures are a fixed 64-byte pattern.
 * Every query and attribute set received is recorded.
 */
class ScriptedKeystore : public IHardwareKeystore {
public:
    static constexpr uint64_t PRIVATE_ID = 0x1001;
    static constexpr uint64_t PUBLIC_ID = 0x2002;
    static constexpr size_t SIGNATURE_SIZE = 64;

    bool secure_element = true;

    std::deque<Result<std::optional<KeyRef>, EnclaveFailure>> find_results;
    std::deque<Result<KeyRef, EnclaveFailure>> create_results;
    std::deque<Result<Unit, EnclaveFailure>> delete_results;
    std::deque<Result<KeyRef, EnclaveFailure>> derive_public_results;
    std::deque<Result<std::vector<uint8_t>, EnclaveFailure>> encrypt_results;
    std::deque<Result<size_t, EnclaveFailure>> sign_results;
    std::deque<Result<Unit, EnclaveFailure>> verify_results;
    std::deque<std::optional<std::vector<uint8_t>>> decrypt_results;
    std::deque<Result<AccessControl, EnclaveFailure>> access_control_results;

    std::vector<KeyQuery> find_queries;
    std::vector<KeyQuery> delete_queries;
    std::vector<KeyAttributes> created_attributes;
    int sign_calls = 0;
    int verify_calls = 0;
    int decrypt_calls = 0;
    int encrypt_calls = 0;

    [[nodiscard]] KeystoreBackend Backend() const noexcept {
        return secure_element ? KeystoreBackend::SecureElement : KeystoreBackend::Software;
    }

    [[nodiscard]] KeyRef PrivateRef() const noexcept { return KeyRef(PRIVATE_ID, KeyClass::Private, Backend()); }
    [[nodiscard]] KeyRef PublicRef() const noexcept { return KeyRef(PUBLIC_ID, KeyClass::Public, Backend()); }

    [[nodiscard]] Result<std::optional<KeyRef>, EnclaveFailure> Find(const KeyQuery& query) override {
        find_queries.push_back(query);
        return Next(find_results, Result<std::optional<KeyRef>, EnclaveFailure>::Ok(std::nullopt));
    }

    [[nodiscard]] Result<KeyRef, EnclaveFailure> CreateKey(const KeyAttributes& attributes) override {
        created_attributes.push_back(attributes);
        return Next(create_results, Result<KeyRef, EnclaveFailure>::Ok(PrivateRef()));
    }

    [[nodiscard]] Result<Unit, EnclaveFailure> Delete(const KeyQuery& query) override {
        delete_queries.push_back(query);
        return Next(delete_results, Result<Unit, EnclaveFailure>::Ok(unit));
    }

    [[nodiscard]] Result<std::vector<uint8_t>, EnclaveFailure> DeriveEncryptedPayload(
        const KeyRef&,
        EncryptionAlgorithm,
        std::span<const uint8_t> plaintext) override {
        ++encrypt_calls;
        return Next(encrypt_results, Result<std::vector<uint8_t>, EnclaveFailure>::Ok(
            std::vector<uint8_t>(plaintext.begin(), plaintext.end())));
    }

    [[nodiscard]] std::optional<std::vector<uint8_t>> DeriveDecryptedPayload(
        const KeyRef&,
        EncryptionAlgorithm,
        std::span<const uint8_t> ciphertext) override {
        ++decrypt_calls;
        if (!decrypt_results.empty()) {
            auto next = std::move(decrypt_results.front());
            decrypt_results.pop_front();
            return next;
        }
        return std::vector<uint8_t>(ciphertext.begin(), ciphertext.end());
    }

    [[nodiscard]] Result<size_t, EnclaveFailure> RawSign(
        const KeyRef&,
        SignatureScheme,
        std::span<const uint8_t>,
        std::span<uint8_t> out) override {
        ++sign_calls;
        if (!sign_results.empty()) {
            return Next(sign_results, Result<size_t, EnclaveFailure>::Ok(0));
        }
        std::fill_n(out.begin(), std::min(SIGNATURE_SIZE, out.size()), uint8_t{0xAB});
        return Result<size_t, EnclaveFailure>::Ok(SIGNATURE_SIZE);
    }

    [[nodiscard]] Result<Unit, EnclaveFailure> RawVerify(
        const KeyRef&,
        SignatureScheme,
        std::span<const uint8_t>,
        std::span<const uint8_t>) override {
        ++verify_calls;
        return Next(verify_results, Result<Unit, EnclaveFailure>::Ok(unit));
    }

    [[nodiscard]] Result<KeyRef, EnclaveFailure> DerivePublicKey(const KeyRef&) override {
        return Next(derive_public_results, Result<KeyRef, EnclaveFailure>::Ok(PublicRef()));
    }

    [[nodiscard]] Result<AccessControl, EnclaveFailure> CreateAccessControl(
        const ProtectionClass protection_class,
        const AccessFlags flags) override {
        return Next(access_control_results,
            Result<AccessControl, EnclaveFailure>::Ok(AccessControl{AccessPolicy{protection_class, flags}}));
    }

    [[nodiscard]] bool HasSecureElement() const override { return secure_element; }

private:
    template<typename R>
    static R Next(std::deque<R>& queue, R fallback) {
        if (queue.empty()) {
            return fallback;
        }
        R next = std::move(queue.front());
        queue.pop_front();
        return next;
    }
};

}
