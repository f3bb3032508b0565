#include "enclave/service/enclave_crypto_service.hpp"
#include "enclave/core/constants.hpp"
#include "enclave/debug/keystore_logger.hpp"
#include <fmt/core.h>

namespace enclave::service {
    using keystore::EncryptionAlgorithm;
    using keystore::SignatureScheme;

    EnclaveCryptoService::EnclaveCryptoService(EnclaveConfig config, std::unique_ptr<KeyHandle> key_handle)
        : config_(std::move(config))
          , key_handle_(std::move(key_handle)) {
    }

    Result<std::unique_ptr<EnclaveCryptoService>, EnclaveFailure> EnclaveCryptoService::Create(
        const EnclaveConfig &config,
        std::shared_ptr<IHardwareKeystore> keystore) {
        auto identity = KeyIdentity::Create(config.Tag(), config.Identifier(), config.Group());
        if (identity.IsErr()) {
            return Result<std::unique_ptr<EnclaveCryptoService>, EnclaveFailure>::Err(identity.UnwrapErr());
        }
        auto context = std::make_shared<AuthenticationContext>();
        if (auto reuse = context->SetAllowableReuseDuration(config.ReuseDuration()); reuse.IsErr()) {
            return Result<std::unique_ptr<EnclaveCryptoService>, EnclaveFailure>::Err(reuse.UnwrapErr());
        }
        auto handle = KeyHandle::Create(
            std::move(identity).Unwrap(),
            config.Policy(),
            std::move(keystore),
            std::move(context),
            config.Prompt());
        if (handle.IsErr()) {
            return Result<std::unique_ptr<EnclaveCryptoService>, EnclaveFailure>::Err(handle.UnwrapErr());
        }
        auto service = std::unique_ptr<EnclaveCryptoService>(
            new EnclaveCryptoService(config, std::move(handle).Unwrap()));
        return Result<std::unique_ptr<EnclaveCryptoService>, EnclaveFailure>::Ok(std::move(service));
    }

    Result<KeyRef, EnclaveFailure> EnclaveCryptoService::Touch() {
        return key_handle_->ResolvePrivateKey();
    }

    Result<KeyRef, EnclaveFailure> EnclaveCryptoService::RequirePrivateKey() const {
        auto private_ref = key_handle_->ResolvePrivateKey();
        if (private_ref.IsErr() && private_ref.UnwrapErr().type != EnclaveFailureType::KeyUnavailable) {
            const auto &failure = private_ref.UnwrapErr();
            return Result<KeyRef, EnclaveFailure>::Err(
                EnclaveFailure::KeyUnavailable(
                    fmt::format("{}: {}", ErrorMessages::PRIVATE_KEY_UNAVAILABLE, failure.message),
                    failure.native_status));
        }
        return private_ref;
    }

    Result<std::vector<uint8_t>, EnclaveFailure> EnclaveCryptoService::Encrypt(
        std::span<const uint8_t> plaintext) const {
        debug::LogOperation("ENCRYPT", plaintext.size());
        auto public_ref = key_handle_->ResolvePublicKey();
        if (public_ref.IsErr()) {
            return Result<std::vector<uint8_t>, EnclaveFailure>::Err(public_ref.UnwrapErr());
        }
        auto encrypted = key_handle_->Keystore().DeriveEncryptedPayload(
            public_ref.Unwrap(),
            EncryptionAlgorithm::EciesCofactorVariableIvX963Sha256AesGcm,
            plaintext);
        if (encrypted.IsErr()) {
            const auto &failure = encrypted.UnwrapErr();
            return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
                EnclaveFailure::EncryptionFailed(failure.message, failure.native_status));
        }
        return encrypted;
    }

    Result<std::vector<uint8_t>, EnclaveFailure> EnclaveCryptoService::Decrypt(
        std::span<const uint8_t> ciphertext) const {
        debug::LogOperation("DECRYPT", ciphertext.size());
        auto private_ref = RequirePrivateKey();
        if (private_ref.IsErr()) {
            return Result<std::vector<uint8_t>, EnclaveFailure>::Err(private_ref.UnwrapErr());
        }
        auto plaintext = key_handle_->Keystore().DeriveDecryptedPayload(
            private_ref.Unwrap(),
            EncryptionAlgorithm::EciesCofactorVariableIvX963Sha256AesGcm,
            ciphertext);
        if (!plaintext.has_value()) {
            return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
                EnclaveFailure::DecryptionFailed("Keystore returned no plaintext"));
        }
        return Result<std::vector<uint8_t>, EnclaveFailure>::Ok(std::move(*plaintext));
    }

    Result<std::vector<uint8_t>, EnclaveFailure> EnclaveCryptoService::Sign(
        std::span<const uint8_t> message) const {
        debug::LogOperation("SIGN", message.size());
        if (message.size() > Constants::MAX_SIGN_INPUT_SIZE) {
            return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
                EnclaveFailure::MessageTooLarge(
                    fmt::format("Message of {} bytes exceeds the {}-byte signing limit",
                                message.size(), Constants::MAX_SIGN_INPUT_SIZE)));
        }
        auto private_ref = RequirePrivateKey();
        if (private_ref.IsErr()) {
            return Result<std::vector<uint8_t>, EnclaveFailure>::Err(private_ref.UnwrapErr());
        }
        std::vector<uint8_t> signature(Constants::SIGNATURE_BLOCK_SIZE);
        auto written = key_handle_->Keystore().RawSign(
            private_ref.Unwrap(), SignatureScheme::Pkcs1Block, message, signature);
        if (written.IsErr()) {
            const auto &failure = written.UnwrapErr();
            debug::LogOperationStatus("SIGN", failure.native_status.value_or(KeystoreStatus::SUCCESS));
            if (failure.HasStatus(KeystoreStatus::PARAM)) {
                return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
                    EnclaveFailure::InvalidSigningParameters(failure.message, KeystoreStatus::PARAM));
            }
            return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
                EnclaveFailure::SigningFailed(failure.message, failure.native_status));
        }
        const size_t length = written.Unwrap();
        if (length > signature.size()) {
            return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
                EnclaveFailure::SigningFailed(
                    fmt::format("Keystore reported {} signature bytes for a {}-byte block",
                                length, signature.size())));
        }
        signature.resize(length);
        return Result<std::vector<uint8_t>, EnclaveFailure>::Ok(std::move(signature));
    }

    Result<bool, EnclaveFailure> EnclaveCryptoService::Verify(
        std::span<const uint8_t> signature,
        std::span<const uint8_t> message) const {
        debug::LogOperation("VERIFY", message.size());
        auto public_ref = key_handle_->ResolvePublicKey();
        if (public_ref.IsErr()) {
            return Result<bool, EnclaveFailure>::Ok(false);
        }
        auto verified = key_handle_->Keystore().RawVerify(
            public_ref.Unwrap(), SignatureScheme::Pkcs1Block, message, signature);
        if (verified.IsErr()) {
            const auto &failure = verified.UnwrapErr();
            return Result<bool, EnclaveFailure>::Err(
                EnclaveFailure::VerificationFailed(
                    failure.message,
                    failure.native_status.value_or(KeystoreStatus::VERIFY_FAILED)));
        }
        return Result<bool, EnclaveFailure>::Ok(true);
    }

    std::optional<KeystoreBackend> EnclaveCryptoService::Backend() const noexcept {
        return key_handle_->Backend();
    }

    KeyState EnclaveCryptoService::State() const noexcept {
        return key_handle_->State();
    }

    void EnclaveCryptoService::SetEventHandler(std::shared_ptr<IKeystoreEventHandler> handler) {
        key_handle_->SetEventHandler(std::move(handler));
    }
}
