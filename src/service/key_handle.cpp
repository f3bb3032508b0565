#include "enclave/service/key_handle.hpp"
#include "enclave/core/constants.hpp"
#include "enclave/debug/keystore_logger.hpp"
#include <fmt/core.h>

namespace enclave::service {
    using keystore::AccessControl;
    using keystore::KeyAttributes;
    using keystore::KeyClass;
    using keystore::KeyQuery;
    using keystore::KeyType;
    using keystore::TokenId;

    namespace {
        std::string StatusSuffix(const EnclaveFailure &failure) {
            if (!failure.native_status.has_value()) {
                return {};
            }
            return fmt::format(" (status {}: {})", *failure.native_status,
                               KeystoreStatus::Describe(*failure.native_status));
        }
    }

    KeyHandle::KeyHandle(
        KeyIdentity identity,
        const AccessPolicy policy,
        std::shared_ptr<IHardwareKeystore> keystore,
        std::shared_ptr<AuthenticationContext> authentication_context,
        std::string operation_prompt)
        : identity_(std::move(identity))
          , policy_(policy)
          , keystore_(std::move(keystore))
          , authentication_context_(std::move(authentication_context))
          , operation_prompt_(std::move(operation_prompt))
          , event_handler_(nullptr)
          , lock_(std::make_unique<std::mutex>())
          , state_(KeyState::Uninitialized) {
    }

    Result<std::unique_ptr<KeyHandle>, EnclaveFailure> KeyHandle::Create(
        KeyIdentity identity,
        const AccessPolicy policy,
        std::shared_ptr<IHardwareKeystore> keystore,
        std::shared_ptr<AuthenticationContext> authentication_context,
        std::string operation_prompt) {
        if (!keystore) {
            return Result<std::unique_ptr<KeyHandle>, EnclaveFailure>::Err(
                EnclaveFailure::InvalidConfiguration("Keystore cannot be null"));
        }
        if (!authentication_context) {
            authentication_context = std::make_shared<AuthenticationContext>();
        }
        auto handle = std::unique_ptr<KeyHandle>(new KeyHandle(
            std::move(identity), policy, std::move(keystore),
            std::move(authentication_context), std::move(operation_prompt)));
        return Result<std::unique_ptr<KeyHandle>, EnclaveFailure>::Ok(std::move(handle));
    }

    KeyState KeyHandle::State() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    std::optional<KeystoreBackend> KeyHandle::Backend() const noexcept {
        if (state_.load(std::memory_order_acquire) != KeyState::Resolved) {
            return std::nullopt;
        }
        return private_ref_->Backend();
    }

    void KeyHandle::SetEventHandler(std::shared_ptr<IKeystoreEventHandler> handler) {
        std::lock_guard lock(*lock_);
        event_handler_ = std::move(handler);
    }

    Result<KeyRef, EnclaveFailure> KeyHandle::PreviousFailure() const {
        std::string cause = failure_.has_value() ? failure_->message : std::string{};
        return Result<KeyRef, EnclaveFailure>::Err(
            EnclaveFailure::KeyUnavailable(
                fmt::format("{}: {}", ErrorMessages::RESOLUTION_PREVIOUSLY_FAILED, cause),
                failure_.has_value() ? failure_->native_status : std::nullopt));
    }

    Result<KeyRef, EnclaveFailure> KeyHandle::ResolvePrivateKey() {
        switch (state_.load(std::memory_order_acquire)) {
            case KeyState::Resolved:
                return Result<KeyRef, EnclaveFailure>::Ok(*private_ref_);
            case KeyState::Failed:
                return PreviousFailure();
            default:
                break;
        }

        std::unique_lock lock(*lock_);
        switch (state_.load(std::memory_order_acquire)) {
            case KeyState::Resolved:
                return Result<KeyRef, EnclaveFailure>::Ok(*private_ref_);
            case KeyState::Failed:
                return PreviousFailure();
            default:
                break;
        }

        state_.store(KeyState::Resolving, std::memory_order_release);
        debug::LogResolutionStart(identity_.Describe());
        PendingEvents events;
        auto resolved = FindOrCreatePrivateKey(events);
        if (resolved.IsErr()) {
            debug::LogResolutionFailed(identity_.Describe(), resolved.UnwrapErr().message);
            failure_ = resolved.UnwrapErr();
            state_.store(KeyState::Failed, std::memory_order_release);
        } else {
            private_ref_ = resolved.Unwrap();
            state_.store(KeyState::Resolved, std::memory_order_release);
        }
        const auto handler = event_handler_;
        lock.unlock();

        Dispatch(handler, events);
        return resolved;
    }

    void KeyHandle::Dispatch(
        const std::shared_ptr<IKeystoreEventHandler> &handler,
        const PendingEvents &events) const {
        if (!handler) {
            return;
        }
        if (events.fallback_reason.has_value()) {
            handler->OnSoftwareFallback(identity_, *events.fallback_reason);
        }
        if (events.created_backend.has_value()) {
            handler->OnKeyCreated(identity_, *events.created_backend);
        }
    }

    Result<std::optional<KeyRef>, EnclaveFailure> KeyHandle::FindPrivateKey() const {
        auto query = KeyQuery::For(KeyClass::Private, identity_)
                         .OfType(KeyType::EcSecPrimeRandom)
                         .ReturningRef()
                         .WithAuthentication(authentication_context_, operation_prompt_);
        auto found = keystore_->Find(query);
        if (found.IsErr()) {
            const auto &failure = found.UnwrapErr();
            if (failure.HasStatus(KeystoreStatus::ITEM_NOT_FOUND)) {
                return Result<std::optional<KeyRef>, EnclaveFailure>::Ok(std::nullopt);
            }
            return Result<std::optional<KeyRef>, EnclaveFailure>::Err(
                EnclaveFailure::KeystoreError(
                    fmt::format("Key lookup failed for {}: {}{}",
                                identity_.Describe(), failure.message, StatusSuffix(failure)),
                    failure.native_status));
        }
        return found;
    }

    Result<KeyRef, EnclaveFailure> KeyHandle::CreatePrivateKey(PendingEvents &events) {
        auto access_control = keystore_->CreateAccessControl(policy_.protection_class, policy_.flags);
        if (access_control.IsErr()) {
            const auto &failure = access_control.UnwrapErr();
            return Result<KeyRef, EnclaveFailure>::Err(
                EnclaveFailure::AccessControlFailed(
                    fmt::format("Access control rejected for {}: {}{}",
                                identity_.Describe(), failure.message, StatusSuffix(failure))));
        }

        TokenId token = TokenId::SecureEnclave;
        if (!keystore_->HasSecureElement()) {
            token = TokenId::None;
            const std::string reason = "No secure element available; key material is software-backed";
            debug::LogSoftwareFallback(identity_.Describe(), reason);
            events.fallback_reason = reason;
        }

        auto attributes = KeyAttributes::ForEcP256(identity_, access_control.Unwrap(), token)
                              .WithAuthentication(authentication_context_, operation_prompt_);
        auto created = keystore_->CreateKey(attributes);
        if (created.IsOk()) {
            const KeyRef &ref = created.Unwrap();
            debug::LogKeyCreated(identity_.Describe(), ref.Id(), ref.Backend() == KeystoreBackend::Software);
            events.created_backend = ref.Backend();
        }
        return created;
    }

    Result<KeyRef, EnclaveFailure> KeyHandle::FindOrCreatePrivateKey(PendingEvents &events) {
        auto found = FindPrivateKey();
        if (found.IsErr()) {
            return Result<KeyRef, EnclaveFailure>::Err(found.UnwrapErr());
        }
        if (found.Unwrap().has_value()) {
            debug::LogKeyFound(identity_.Describe(), found.Unwrap()->Id());
            return Result<KeyRef, EnclaveFailure>::Ok(*found.Unwrap());
        }

        auto created = CreatePrivateKey(events);
        if (created.IsOk()) {
            return created;
        }
        const EnclaveFailure &failure = created.UnwrapErr();
        if (failure.type == EnclaveFailureType::AccessControlFailed) {
            return created;
        }

        // Another process sharing the access group may have won the race.
        if (failure.HasStatus(KeystoreStatus::DUPLICATE_ITEM)) {
            debug::LogDuplicateRetry(identity_.Describe());
            auto retried = FindPrivateKey();
            if (retried.IsErr()) {
                return Result<KeyRef, EnclaveFailure>::Err(retried.UnwrapErr());
            }
            if (retried.Unwrap().has_value()) {
                return Result<KeyRef, EnclaveFailure>::Ok(*retried.Unwrap());
            }
        }
        return Result<KeyRef, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError(
                fmt::format("Key creation failed for {}: {}{}",
                            identity_.Describe(), failure.message, StatusSuffix(failure)),
                failure.native_status));
    }

    Result<KeyRef, EnclaveFailure> KeyHandle::ResolvePublicKey() {
        auto private_ref = ResolvePrivateKey();
        if (private_ref.IsErr()) {
            const auto &failure = private_ref.UnwrapErr();
            if (failure.type == EnclaveFailureType::KeyUnavailable) {
                return private_ref;
            }
            return Result<KeyRef, EnclaveFailure>::Err(
                EnclaveFailure::KeyUnavailable(
                    fmt::format("{}: {}", ErrorMessages::PUBLIC_KEY_UNAVAILABLE, failure.message),
                    failure.native_status));
        }

        std::lock_guard lock(*lock_);
        if (public_ref_.has_value()) {
            return Result<KeyRef, EnclaveFailure>::Ok(*public_ref_);
        }
        auto derived = keystore_->DerivePublicKey(private_ref.Unwrap());
        if (derived.IsErr()) {
            const auto &failure = derived.UnwrapErr();
            return Result<KeyRef, EnclaveFailure>::Err(
                EnclaveFailure::KeyUnavailable(
                    fmt::format("{}: {}", ErrorMessages::PUBLIC_KEY_UNAVAILABLE, failure.message),
                    failure.native_status));
        }
        public_ref_ = derived.Unwrap();
        return derived;
    }

    Result<Unit, EnclaveFailure> KeyHandle::DeleteEntry(const KeyClass key_class) const {
        const char *class_name = key_class == KeyClass::Private ? "private" : "public";
        auto deleted = keystore_->Delete(KeyQuery::For(key_class, identity_));
        if (deleted.IsErr()) {
            const auto &failure = deleted.UnwrapErr();
            return Result<Unit, EnclaveFailure>::Err(
                EnclaveFailure::KeystoreError(
                    fmt::format("Failed to delete {} key for {}: {}{}",
                                class_name, identity_.Describe(), failure.message, StatusSuffix(failure)),
                    failure.native_status));
        }
        debug::LogKeyDeleted(identity_.Describe(), class_name);
        return deleted;
    }

    Result<Unit, EnclaveFailure> KeyHandle::DeletePrivateKey() {
        return DeleteEntry(KeyClass::Private);
    }

    Result<Unit, EnclaveFailure> KeyHandle::DeletePublicKey() {
        return DeleteEntry(KeyClass::Public);
    }

    Result<Unit, EnclaveFailure> KeyHandle::DeleteKeyPair() {
        if (auto deleted = DeleteEntry(KeyClass::Private); deleted.IsErr()) {
            return deleted;
        }
        auto deleted_public = DeleteEntry(KeyClass::Public);
        if (deleted_public.IsErrAnd([](const EnclaveFailure &failure) {
                return failure.HasStatus(KeystoreStatus::ITEM_NOT_FOUND);
            })) {
            return Result<Unit, EnclaveFailure>::Ok(unit);
        }
        return deleted_public;
    }
}
