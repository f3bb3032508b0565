#pragma once
#include "enclave/configuration/enclave_config.hpp"
#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"
#include "enclave/interfaces/i_hardware_keystore.hpp"
#include "enclave/interfaces/i_keystore_event_handler.hpp"
#include "enclave/service/key_handle.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace enclave::service {
    using configuration::EnclaveConfig;

    /**
     * @brief Encrypt, decrypt, sign and verify with one keystore-held key pair
     *
     * Every operation resolves the key through the owned KeyHandle; the first
     * call pays the keystore and authentication round trip, later calls reuse
     * the cached reference for the lifetime of the service. Once resolution
     * has failed the service stays unusable; construct a new instance to
     * retry.
     *
     * Signing produces at most Constants::SIGNATURE_BLOCK_SIZE bytes and
     * rejects inputs longer than Constants::MAX_SIGN_INPUT_SIZE before any
     * keystore call.
     */
    class EnclaveCryptoService {
    public:
        [[nodiscard]] static Result<std::unique_ptr<EnclaveCryptoService>, EnclaveFailure> Create(
            const EnclaveConfig &config,
            std::shared_ptr<IHardwareKeystore> keystore);

        EnclaveCryptoService(const EnclaveCryptoService &) = delete;
        EnclaveCryptoService &operator=(const EnclaveCryptoService &) = delete;

        /// Resolve the key now so the authentication prompt appears at a time
        /// of the caller's choosing.
        [[nodiscard]] Result<KeyRef, EnclaveFailure> Touch();

        [[nodiscard]] Result<std::vector<uint8_t>, EnclaveFailure> Encrypt(
            std::span<const uint8_t> plaintext) const;

        /// DecryptionFailed when the keystore yields no plaintext; an empty
        /// plaintext is returned as an empty vector.
        [[nodiscard]] Result<std::vector<uint8_t>, EnclaveFailure> Decrypt(
            std::span<const uint8_t> ciphertext) const;

        [[nodiscard]] Result<std::vector<uint8_t>, EnclaveFailure> Sign(
            std::span<const uint8_t> message) const;

        /**
         * @brief Check a signature produced by Sign
         *
         * Ok(true) on a valid signature and Ok(false) when no public key can be
         * resolved. Any keystore rejection, a mismatch included, is
         * VerificationFailed carrying the native status.
         */
        [[nodiscard]] Result<bool, EnclaveFailure> Verify(
            std::span<const uint8_t> signature,
            std::span<const uint8_t> message) const;

        [[nodiscard]] std::optional<KeystoreBackend> Backend() const noexcept;

        [[nodiscard]] KeyState State() const noexcept;

        [[nodiscard]] KeyHandle &GetKeyHandle() noexcept { return *key_handle_; }

        [[nodiscard]] const EnclaveConfig &Config() const noexcept { return config_; }

        void SetEventHandler(std::shared_ptr<IKeystoreEventHandler> handler);

    private:
        EnclaveCryptoService(EnclaveConfig config, std::unique_ptr<KeyHandle> key_handle);

        [[nodiscard]] Result<KeyRef, EnclaveFailure> RequirePrivateKey() const;

        EnclaveConfig config_;
        std::unique_ptr<KeyHandle> key_handle_;
    };
}
