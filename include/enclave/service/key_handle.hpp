#pragma once
#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"
#include "enclave/identity/key_identity.hpp"
#include "enclave/interfaces/i_hardware_keystore.hpp"
#include "enclave/interfaces/i_keystore_event_handler.hpp"
#include "enclave/keystore/access_policy.hpp"
#include "enclave/keystore/authentication_context.hpp"
#include "enclave/keystore/key_ref.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace enclave::service {
    using identity::KeyIdentity;
    using interfaces::IHardwareKeystore;
    using interfaces::IKeystoreEventHandler;
    using keystore::AccessPolicy;
    using keystore::AuthenticationContext;
    using keystore::KeyRef;
    using keystore::KeystoreBackend;

    enum class KeyState : uint8_t {
        Uninitialized = 0,
        Resolving = 1,
        Resolved = 2,
        Failed = 3
    };

    /**
     * @brief Owns one key identity and its lazily resolved keystore references
     *
     * The first ResolvePrivateKey call looks the key up and creates it when
     * absent; the outcome is terminal for the handle. A resolved reference is
     * reused for the handle's lifetime and a failed resolution makes every
     * later call fail with KeyUnavailable. Concurrent first calls are
     * serialized, so at most one creation is issued per handle.
     *
     * Deleting does not touch the cached references. A handle whose key was
     * deleted keeps returning the stale reference; discard it and build a new
     * one.
     */
    class KeyHandle {
    public:
        [[nodiscard]] static Result<std::unique_ptr<KeyHandle>, EnclaveFailure> Create(
            KeyIdentity identity,
            AccessPolicy policy,
            std::shared_ptr<IHardwareKeystore> keystore,
            std::shared_ptr<AuthenticationContext> authentication_context,
            std::string operation_prompt);

        KeyHandle(const KeyHandle &) = delete;
        KeyHandle &operator=(const KeyHandle &) = delete;

        /// Find-or-create. The first failure carries the keystore error, later
        /// calls return KeyUnavailable without touching the keystore.
        [[nodiscard]] Result<KeyRef, EnclaveFailure> ResolvePrivateKey();

        /// Public counterpart of the resolved private key. Fails with
        /// KeyUnavailable when private resolution failed.
        [[nodiscard]] Result<KeyRef, EnclaveFailure> ResolvePublicKey();

        [[nodiscard]] Result<Unit, EnclaveFailure> DeletePrivateKey();

        [[nodiscard]] Result<Unit, EnclaveFailure> DeletePublicKey();

        /// Private entry first, then public. A missing public entry is tolerated.
        [[nodiscard]] Result<Unit, EnclaveFailure> DeleteKeyPair();

        [[nodiscard]] KeyState State() const noexcept;

        /// Set once the private key is resolved.
        [[nodiscard]] std::optional<KeystoreBackend> Backend() const noexcept;

        [[nodiscard]] const KeyIdentity &Identity() const noexcept { return identity_; }

        [[nodiscard]] const AccessPolicy &Policy() const noexcept { return policy_; }

        [[nodiscard]] IHardwareKeystore &Keystore() const noexcept { return *keystore_; }

        /// Notifications are delivered after the handle's lock is released, so a
        /// handler may call back into the handle.
        void SetEventHandler(std::shared_ptr<IKeystoreEventHandler> handler);

    private:
        struct PendingEvents {
            std::optional<std::string> fallback_reason;
            std::optional<KeystoreBackend> created_backend;
        };

        KeyHandle(
            KeyIdentity identity,
            AccessPolicy policy,
            std::shared_ptr<IHardwareKeystore> keystore,
            std::shared_ptr<AuthenticationContext> authentication_context,
            std::string operation_prompt);

        Result<std::optional<KeyRef>, EnclaveFailure> FindPrivateKey() const;

        Result<KeyRef, EnclaveFailure> CreatePrivateKey(PendingEvents &events);

        Result<KeyRef, EnclaveFailure> FindOrCreatePrivateKey(PendingEvents &events);

        void Dispatch(const std::shared_ptr<IKeystoreEventHandler> &handler, const PendingEvents &events) const;

        Result<Unit, EnclaveFailure> DeleteEntry(keystore::KeyClass key_class) const;

        Result<KeyRef, EnclaveFailure> PreviousFailure() const;

        KeyIdentity identity_;
        AccessPolicy policy_;
        std::shared_ptr<IHardwareKeystore> keystore_;
        std::shared_ptr<AuthenticationContext> authentication_context_;
        std::string operation_prompt_;
        std::shared_ptr<IKeystoreEventHandler> event_handler_;
        mutable std::unique_ptr<std::mutex> lock_;
        std::atomic<KeyState> state_;
        std::optional<KeyRef> private_ref_;
        std::optional<KeyRef> public_ref_;
        std::optional<EnclaveFailure> failure_;
    };
}
