#pragma once
#include "enclave/interfaces/i_hardware_keystore.hpp"
#include "enclave/crypto/secure_memory_handle.hpp"
#include "enclave/crypto/ec_key.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
namespace enclave::keystore {

/**
 * @brief OpenSSL keystore implementing the hardware keystore contract in software
 *
 * Used where no secure element exists and as the reference backend in tests.
 * Private keys are held as DER inside libsodium guarded memory. An opened
 * keystore mirrors every permanent entry into a protobuf file so keys survive
 * process restarts; an in-memory keystore forgets them on destruction.
 *
 * Requests bound to the secure-element token are refused with NOT_AVAILABLE.
 * When a user-presence callback is installed, private key operations on keys
 * whose policy requires presence invoke it unless the authentication context
 * the reference was obtained with is still inside its reuse window. The
 * callback runs under the keystore lock and must not call back into it.
 *
 * Thread-safe.
 */
class SoftwareKeystore final : public interfaces::IHardwareKeystore {
public:
    using UserPresenceCallback = std::function<bool(std::string_view prompt)>;

    static constexpr uint32_t STATE_VERSION = 1;

    [[nodiscard]] static Result<std::unique_ptr<SoftwareKeystore>, EnclaveFailure> InMemory();

    /**
     * @brief Open a file-backed keystore, loading existing entries
     *
     * A missing file is an empty keystore; it is created on the first write.
     */
    [[nodiscard]] static Result<std::unique_ptr<SoftwareKeystore>, EnclaveFailure> Open(
        std::filesystem::path path);

    SoftwareKeystore(const SoftwareKeystore&) = delete;
    SoftwareKeystore& operator=(const SoftwareKeystore&) = delete;
    SoftwareKeystore(SoftwareKeystore&&) = delete;
    SoftwareKeystore& operator=(SoftwareKeystore&&) = delete;
    ~SoftwareKeystore() override = default;

    void SetUserPresenceCallback(UserPresenceCallback callback);

    /// Number of permanent entries, private and public.
    [[nodiscard]] size_t PermanentEntryCount() const;

    [[nodiscard]] Result<std::optional<KeyRef>, EnclaveFailure> Find(const KeyQuery& query) override;

    [[nodiscard]] Result<KeyRef, EnclaveFailure> CreateKey(const KeyAttributes& attributes) override;

    [[nodiscard]] Result<Unit, EnclaveFailure> Delete(const KeyQuery& query) override;

    [[nodiscard]] Result<std::vector<uint8_t>, EnclaveFailure> DeriveEncryptedPayload(
        const KeyRef& public_key,
        EncryptionAlgorithm algorithm,
        std::span<const uint8_t> plaintext) override;

    [[nodiscard]] std::optional<std::vector<uint8_t>> DeriveDecryptedPayload(
        const KeyRef& private_key,
        EncryptionAlgorithm algorithm,
        std::span<const uint8_t> ciphertext) override;

    [[nodiscard]] Result<size_t, EnclaveFailure> RawSign(
        const KeyRef& private_key,
        SignatureScheme scheme,
        std::span<const uint8_t> message,
        std::span<uint8_t> out) override;

    [[nodiscard]] Result<Unit, EnclaveFailure> RawVerify(
        const KeyRef& public_key,
        SignatureScheme scheme,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) override;

    [[nodiscard]] Result<KeyRef, EnclaveFailure> DerivePublicKey(const KeyRef& private_key) override;

    [[nodiscard]] Result<AccessControl, EnclaveFailure> CreateAccessControl(
        ProtectionClass protection_class,
        AccessFlags flags) override;

    [[nodiscard]] bool HasSecureElement() const override { return false; }

private:
    struct Entry {
        KeyClass key_class;
        std::string access_group;
        std::vector<uint8_t> application_tag;
        AccessControl access_control;
        bool permanent;
        crypto::SecureMemoryHandle private_der;
        std::vector<uint8_t> public_point;
    };

    struct AuthenticationBinding {
        std::shared_ptr<AuthenticationContext> context;
        std::string prompt;
    };

    explicit SoftwareKeystore(std::optional<std::filesystem::path> path);

    Result<Unit, EnclaveFailure> LoadLocked();
    Result<Unit, EnclaveFailure> SaveLocked() const;

    [[nodiscard]] static bool InScope(const Entry& entry, const KeyQuery& query);

    /// Permanent entries only; transient ones are never found.
    [[nodiscard]] static bool Matches(const Entry& entry, const KeyQuery& query);

    Result<Entry*, EnclaveFailure> LookupLocked(const KeyRef& ref, KeyClass expected_class);

    Result<Unit, EnclaveFailure> AuthorizeLocked(uint64_t id, const Entry& entry);

    static Result<crypto::EvpPkeyPtr, EnclaveFailure> LoadPrivateKey(const Entry& entry);

    void BindAuthenticationLocked(
        uint64_t id,
        const std::shared_ptr<AuthenticationContext>& context,
        const std::string& prompt);

    uint64_t NextIdLocked() const;

    mutable std::mutex mutex_;
    std::optional<std::filesystem::path> path_;
    std::map<uint64_t, Entry> entries_;
    std::unordered_map<uint64_t, AuthenticationBinding> bindings_;
    UserPresenceCallback user_presence_;
};

}
