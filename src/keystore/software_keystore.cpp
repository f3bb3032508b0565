#include "enclave/keystore/software_keystore.hpp"
#include "enclave/crypto/ecdsa.hpp"
#include "enclave/crypto/ecies.hpp"
#include "enclave/crypto/sodium_interop.hpp"
#include "enclave/core/constants.hpp"
#include "enclave/debug/keystore_logger.hpp"
#include "keystore/keystore_state.pb.h"
#include <fmt/core.h>
#include <algorithm>
#include <fstream>
#include <system_error>
namespace enclave::keystore {
using crypto::EcKey;
using crypto::EvpPkeyPtr;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;
namespace {
    constexpr uint32_t KNOWN_ACCESS_FLAGS =
        static_cast<uint32_t>(AccessFlag::UserPresence) |
        static_cast<uint32_t>(AccessFlag::PrivateKeyUsage) |
        static_cast<uint32_t>(AccessFlag::BiometryAny) |
        static_cast<uint32_t>(AccessFlag::BiometryCurrentSet) |
        static_cast<uint32_t>(AccessFlag::DevicePasscode);

    constexpr uint32_t MAX_PROTECTION_CLASS = static_cast<uint32_t>(ProtectionClass::WhenUnlocked);

    EnclaveFailure StatusFailure(std::string message, const NativeStatus status) {
        return EnclaveFailure::KeystoreError(std::move(message), status);
    }

    void WipeString(std::string& value) {
        if (value.empty()) {
            return;
        }
        auto wipe = SodiumInterop::SecureWipe(
            std::span<uint8_t>(reinterpret_cast<uint8_t*>(value.data()), value.size()));
        (void)wipe;
    }
}

SoftwareKeystore::SoftwareKeystore(std::optional<std::filesystem::path> path)
    : path_(std::move(path)) {
}

Result<std::unique_ptr<SoftwareKeystore>, EnclaveFailure> SoftwareKeystore::InMemory() {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<std::unique_ptr<SoftwareKeystore>, EnclaveFailure>::Err(
            EnclaveFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    return Result<std::unique_ptr<SoftwareKeystore>, EnclaveFailure>::Ok(
        std::unique_ptr<SoftwareKeystore>(new SoftwareKeystore(std::nullopt)));
}

Result<std::unique_ptr<SoftwareKeystore>, EnclaveFailure> SoftwareKeystore::Open(
    std::filesystem::path path) {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<std::unique_ptr<SoftwareKeystore>, EnclaveFailure>::Err(
            EnclaveFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    if (path.empty()) {
        return Result<std::unique_ptr<SoftwareKeystore>, EnclaveFailure>::Err(
            EnclaveFailure::InvalidConfiguration("Keystore path must not be empty"));
    }
    std::unique_ptr<SoftwareKeystore> keystore(new SoftwareKeystore(std::move(path)));
    {
        std::lock_guard lock(keystore->mutex_);
        if (auto load = keystore->LoadLocked(); load.IsErr()) {
            return Result<std::unique_ptr<SoftwareKeystore>, EnclaveFailure>::Err(load.UnwrapErr());
        }
    }
    return Result<std::unique_ptr<SoftwareKeystore>, EnclaveFailure>::Ok(std::move(keystore));
}

void SoftwareKeystore::SetUserPresenceCallback(UserPresenceCallback callback) {
    std::lock_guard lock(mutex_);
    user_presence_ = std::move(callback);
}

size_t SoftwareKeystore::PermanentEntryCount() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const auto& item) { return item.second.permanent; }));
}

bool SoftwareKeystore::InScope(const Entry& entry, const KeyQuery& query) {
    return entry.key_class == query.key_class &&
           entry.access_group == query.access_group &&
           entry.application_tag == query.application_tag;
}

bool SoftwareKeystore::Matches(const Entry& entry, const KeyQuery& query) {
    return entry.permanent && InScope(entry, query);
}

uint64_t SoftwareKeystore::NextIdLocked() const {
    uint64_t id = SodiumInterop::GenerateNonZeroHandleId();
    while (entries_.contains(id)) {
        id = SodiumInterop::GenerateNonZeroHandleId();
    }
    return id;
}

void SoftwareKeystore::BindAuthenticationLocked(
    const uint64_t id,
    const std::shared_ptr<AuthenticationContext>& context,
    const std::string& prompt) {
    if (context) {
        bindings_[id] = AuthenticationBinding{context, prompt};
    }
}

Result<std::optional<KeyRef>, EnclaveFailure> SoftwareKeystore::Find(const KeyQuery& query) {
    if (query.key_type.has_value() && *query.key_type != KeyType::EcSecPrimeRandom) {
        return Result<std::optional<KeyRef>, EnclaveFailure>::Ok(std::nullopt);
    }
    std::lock_guard lock(mutex_);
    for (const auto& [id, entry] : entries_) {
        if (Matches(entry, query)) {
            BindAuthenticationLocked(id, query.authentication_context, query.operation_prompt);
            return Result<std::optional<KeyRef>, EnclaveFailure>::Ok(
                KeyRef(id, entry.key_class, KeystoreBackend::Software));
        }
    }
    return Result<std::optional<KeyRef>, EnclaveFailure>::Ok(std::nullopt);
}

Result<KeyRef, EnclaveFailure> SoftwareKeystore::CreateKey(const KeyAttributes& attributes) {
    if (attributes.token == TokenId::SecureEnclave) {
        return Result<KeyRef, EnclaveFailure>::Err(
            StatusFailure("Software keystore has no secure element", KeystoreStatus::NOT_AVAILABLE));
    }
    if (attributes.key_type != KeyType::EcSecPrimeRandom ||
        attributes.key_size_bits != Constants::EC_KEY_SIZE_BITS) {
        return Result<KeyRef, EnclaveFailure>::Err(
            StatusFailure(fmt::format("Unsupported key size {}", attributes.key_size_bits),
                KeystoreStatus::PARAM));
    }
    const auto& private_attributes = attributes.private_key;
    if (private_attributes.access_group.empty() || private_attributes.application_tag.empty()) {
        return Result<KeyRef, EnclaveFailure>::Err(
            StatusFailure("Access group and application tag are required", KeystoreStatus::PARAM));
    }

    auto key_result = EcKey::GenerateP256();
    if (key_result.IsErr()) {
        return Result<KeyRef, EnclaveFailure>::Err(key_result.UnwrapErr());
    }
    auto key = std::move(key_result).Unwrap();
    auto der_result = EcKey::ExportPrivateDer(key.get());
    if (der_result.IsErr()) {
        return Result<KeyRef, EnclaveFailure>::Err(der_result.UnwrapErr());
    }
    auto der = std::move(der_result).Unwrap();
    auto handle_result = SecureMemoryHandle::FromBytes(der);
    auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(der));
    (void)wipe;
    if (handle_result.IsErr()) {
        return Result<KeyRef, EnclaveFailure>::Err(
            StatusFailure(handle_result.UnwrapErr().message, KeystoreStatus::ALLOCATE));
    }
    auto point_result = EcKey::ExportPublicPoint(key.get());
    if (point_result.IsErr()) {
        return Result<KeyRef, EnclaveFailure>::Err(point_result.UnwrapErr());
    }
    auto point = std::move(point_result).Unwrap();

    std::lock_guard lock(mutex_);
    KeyQuery private_query{KeyClass::Private, KeyType::EcSecPrimeRandom,
                           private_attributes.access_group, private_attributes.application_tag};
    if (private_attributes.is_permanent) {
        for (const auto& [id, entry] : entries_) {
            if (Matches(entry, private_query)) {
                return Result<KeyRef, EnclaveFailure>::Err(
                    StatusFailure("A key with this tag already exists in the access group",
                        KeystoreStatus::DUPLICATE_ITEM));
            }
        }
    }

    const uint64_t private_id = NextIdLocked();
    entries_.emplace(private_id, Entry{
        KeyClass::Private,
        private_attributes.access_group,
        private_attributes.application_tag,
        private_attributes.access_control,
        private_attributes.is_permanent,
        std::move(handle_result).Unwrap(),
        point});

    std::optional<uint64_t> public_id;
    if (private_attributes.is_permanent) {
        public_id = NextIdLocked();
        entries_.emplace(*public_id, Entry{
            KeyClass::Public,
            private_attributes.access_group,
            private_attributes.application_tag,
            private_attributes.access_control,
            true,
            SecureMemoryHandle(),
            std::move(point)});
        if (auto save = SaveLocked(); save.IsErr()) {
            entries_.erase(private_id);
            entries_.erase(*public_id);
            return Result<KeyRef, EnclaveFailure>::Err(save.UnwrapErr());
        }
    }
    BindAuthenticationLocked(private_id, attributes.authentication_context, attributes.operation_prompt);
    return Result<KeyRef, EnclaveFailure>::Ok(
        KeyRef(private_id, KeyClass::Private, KeystoreBackend::Software));
}

Result<Unit, EnclaveFailure> SoftwareKeystore::Delete(const KeyQuery& query) {
    std::lock_guard lock(mutex_);
    std::vector<uint64_t> removed;
    // Transient public entries handed out by DerivePublicKey go with the scope.
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (InScope(it->second, query)) {
            removed.push_back(it->first);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    if (removed.empty()) {
        return Result<Unit, EnclaveFailure>::Err(
            StatusFailure("No matching keystore entry", KeystoreStatus::ITEM_NOT_FOUND));
    }
    for (const uint64_t id : removed) {
        bindings_.erase(id);
    }
    return SaveLocked();
}

Result<SoftwareKeystore::Entry*, EnclaveFailure> SoftwareKeystore::LookupLocked(
    const KeyRef& ref,
    const KeyClass expected_class) {
    if (ref.Backend() != KeystoreBackend::Software || ref.Class() != expected_class) {
        return Result<Entry*, EnclaveFailure>::Err(
            StatusFailure("Key reference was not issued for this operation", KeystoreStatus::INVALID_KEY));
    }
    const auto it = entries_.find(ref.Id());
    if (it == entries_.end() || it->second.key_class != expected_class) {
        return Result<Entry*, EnclaveFailure>::Err(
            StatusFailure("Key reference no longer names a keystore entry", KeystoreStatus::INVALID_KEY));
    }
    return Result<Entry*, EnclaveFailure>::Ok(&it->second);
}

Result<Unit, EnclaveFailure> SoftwareKeystore::AuthorizeLocked(const uint64_t id, const Entry& entry) {
    if (!user_presence_ || !entry.access_control.policy.RequiresUserPresence()) {
        return Result<Unit, EnclaveFailure>::Ok(unit);
    }
    const auto binding = bindings_.find(id);
    std::shared_ptr<AuthenticationContext> context;
    std::string prompt;
    if (binding != bindings_.end()) {
        context = binding->second.context;
        prompt = binding->second.prompt;
    }
    if (context && context->IsWithinReuseWindow()) {
        return Result<Unit, EnclaveFailure>::Ok(unit);
    }
    if (!user_presence_(prompt)) {
        return Result<Unit, EnclaveFailure>::Err(
            StatusFailure("User presence check was declined", KeystoreStatus::USER_CANCELED));
    }
    if (context) {
        context->RecordAuthentication();
    }
    return Result<Unit, EnclaveFailure>::Ok(unit);
}

Result<EvpPkeyPtr, EnclaveFailure> SoftwareKeystore::LoadPrivateKey(const Entry& entry) {
    auto read = entry.private_der.WithReadAccess([](std::span<const uint8_t> der) {
        return EcKey::ImportPrivateDer(der);
    });
    if (read.IsErr()) {
        return Result<EvpPkeyPtr, EnclaveFailure>::Err(
            StatusFailure(read.UnwrapErr().message, KeystoreStatus::INVALID_KEY));
    }
    return std::move(read).Unwrap();
}

Result<std::vector<uint8_t>, EnclaveFailure> SoftwareKeystore::DeriveEncryptedPayload(
    const KeyRef& public_key,
    const EncryptionAlgorithm algorithm,
    std::span<const uint8_t> plaintext) {
    if (algorithm != EncryptionAlgorithm::EciesCofactorVariableIvX963Sha256AesGcm) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(
            StatusFailure("Unsupported encryption algorithm", KeystoreStatus::PARAM));
    }
    std::vector<uint8_t> point;
    {
        std::lock_guard lock(mutex_);
        auto entry = LookupLocked(public_key, KeyClass::Public);
        if (entry.IsErr()) {
            return Result<std::vector<uint8_t>, EnclaveFailure>::Err(entry.UnwrapErr());
        }
        point = entry.Unwrap()->public_point;
    }
    auto key = EcKey::ImportPublicPoint(point);
    if (key.IsErr()) {
        return Result<std::vector<uint8_t>, EnclaveFailure>::Err(key.UnwrapErr());
    }
    return crypto::Ecies::Encrypt(key.Unwrap().get(), plaintext);
}

std::optional<std::vector<uint8_t>> SoftwareKeystore::DeriveDecryptedPayload(
    const KeyRef& private_key,
    const EncryptionAlgorithm algorithm,
    std::span<const uint8_t> ciphertext) {
    if (algorithm != EncryptionAlgorithm::EciesCofactorVariableIvX963Sha256AesGcm) {
        return std::nullopt;
    }
    EvpPkeyPtr key;
    {
        std::lock_guard lock(mutex_);
        auto entry = LookupLocked(private_key, KeyClass::Private);
        if (entry.IsErr()) {
            debug::LogOperationStatus("DECRYPT", *entry.UnwrapErr().native_status);
            return std::nullopt;
        }
        if (auto auth = AuthorizeLocked(private_key.Id(), *entry.Unwrap()); auth.IsErr()) {
            debug::LogOperationStatus("DECRYPT", *auth.UnwrapErr().native_status);
            return std::nullopt;
        }
        auto loaded = LoadPrivateKey(*entry.Unwrap());
        if (loaded.IsErr()) {
            return std::nullopt;
        }
        key = std::move(loaded).Unwrap();
    }
    auto plaintext = crypto::Ecies::Decrypt(key.get(), ciphertext);
    if (plaintext.IsErr()) {
        ENCLAVE_LOG_MSG("DECRYPT", plaintext.UnwrapErr().message);
        return std::nullopt;
    }
    return std::move(plaintext).Unwrap();
}

Result<size_t, EnclaveFailure> SoftwareKeystore::RawSign(
    const KeyRef& private_key,
    const SignatureScheme scheme,
    std::span<const uint8_t> message,
    std::span<uint8_t> out) {
    if (scheme != SignatureScheme::Pkcs1Block) {
        return Result<size_t, EnclaveFailure>::Err(
            StatusFailure("Unsupported signature scheme", KeystoreStatus::PARAM));
    }
    if (message.size() > Constants::MAX_SIGN_INPUT_SIZE) {
        return Result<size_t, EnclaveFailure>::Err(
            StatusFailure(fmt::format("Message of {} bytes exceeds the signature block", message.size()),
                KeystoreStatus::PARAM));
    }
    if (out.size() < Constants::SIGNATURE_BLOCK_SIZE) {
        return Result<size_t, EnclaveFailure>::Err(
            StatusFailure("Signature buffer is smaller than the signature block", KeystoreStatus::PARAM));
    }
    EvpPkeyPtr key;
    {
        std::lock_guard lock(mutex_);
        auto entry = LookupLocked(private_key, KeyClass::Private);
        if (entry.IsErr()) {
            return Result<size_t, EnclaveFailure>::Err(entry.UnwrapErr());
        }
        if (auto auth = AuthorizeLocked(private_key.Id(), *entry.Unwrap()); auth.IsErr()) {
            return Result<size_t, EnclaveFailure>::Err(auth.UnwrapErr());
        }
        auto loaded = LoadPrivateKey(*entry.Unwrap());
        if (loaded.IsErr()) {
            return Result<size_t, EnclaveFailure>::Err(loaded.UnwrapErr());
        }
        key = std::move(loaded).Unwrap();
    }
    auto signature = crypto::Ecdsa::Sign(key.get(), message);
    if (signature.IsErr()) {
        return Result<size_t, EnclaveFailure>::Err(signature.UnwrapErr());
    }
    const auto& bytes = signature.Unwrap();
    if (bytes.size() > out.size()) {
        return Result<size_t, EnclaveFailure>::Err(
            StatusFailure("Signature does not fit the output buffer", KeystoreStatus::PARAM));
    }
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return Result<size_t, EnclaveFailure>::Ok(bytes.size());
}

Result<Unit, EnclaveFailure> SoftwareKeystore::RawVerify(
    const KeyRef& public_key,
    const SignatureScheme scheme,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {
    if (scheme != SignatureScheme::Pkcs1Block) {
        return Result<Unit, EnclaveFailure>::Err(
            StatusFailure("Unsupported signature scheme", KeystoreStatus::PARAM));
    }
    std::vector<uint8_t> point;
    {
        std::lock_guard lock(mutex_);
        auto entry = LookupLocked(public_key, KeyClass::Public);
        if (entry.IsErr()) {
            return Result<Unit, EnclaveFailure>::Err(entry.UnwrapErr());
        }
        point = entry.Unwrap()->public_point;
    }
    auto key = EcKey::ImportPublicPoint(point);
    if (key.IsErr()) {
        return Result<Unit, EnclaveFailure>::Err(key.UnwrapErr());
    }
    return crypto::Ecdsa::Verify(key.Unwrap().get(), message, signature);
}

Result<KeyRef, EnclaveFailure> SoftwareKeystore::DerivePublicKey(const KeyRef& private_key) {
    std::lock_guard lock(mutex_);
    auto entry_result = LookupLocked(private_key, KeyClass::Private);
    if (entry_result.IsErr()) {
        return Result<KeyRef, EnclaveFailure>::Err(entry_result.UnwrapErr());
    }
    const Entry& source = *entry_result.Unwrap();
    for (const auto& [id, entry] : entries_) {
        if (entry.key_class == KeyClass::Public &&
            entry.access_group == source.access_group &&
            entry.application_tag == source.application_tag &&
            entry.public_point == source.public_point) {
            return Result<KeyRef, EnclaveFailure>::Ok(KeyRef(id, KeyClass::Public, KeystoreBackend::Software));
        }
    }
    // Public entry was deleted or never stored; hand out a transient one.
    const uint64_t id = NextIdLocked();
    entries_.emplace(id, Entry{
        KeyClass::Public,
        source.access_group,
        source.application_tag,
        source.access_control,
        false,
        SecureMemoryHandle(),
        source.public_point});
    return Result<KeyRef, EnclaveFailure>::Ok(KeyRef(id, KeyClass::Public, KeystoreBackend::Software));
}

Result<AccessControl, EnclaveFailure> SoftwareKeystore::CreateAccessControl(
    const ProtectionClass protection_class,
    const AccessFlags flags) {
    if (static_cast<uint32_t>(protection_class) > MAX_PROTECTION_CLASS) {
        return Result<AccessControl, EnclaveFailure>::Err(
            StatusFailure("Unknown protection class", KeystoreStatus::PARAM));
    }
    if ((flags.Bits() & ~KNOWN_ACCESS_FLAGS) != 0) {
        return Result<AccessControl, EnclaveFailure>::Err(
            StatusFailure(fmt::format("Unknown access flags {:#x}", flags.Bits()), KeystoreStatus::PARAM));
    }
    if (flags.Has(AccessFlag::BiometryAny) && flags.Has(AccessFlag::BiometryCurrentSet)) {
        return Result<AccessControl, EnclaveFailure>::Err(
            StatusFailure("BiometryAny and BiometryCurrentSet are mutually exclusive", KeystoreStatus::PARAM));
    }
    return Result<AccessControl, EnclaveFailure>::Ok(AccessControl{AccessPolicy{protection_class, flags}});
}

Result<Unit, EnclaveFailure> SoftwareKeystore::LoadLocked() {
    std::error_code ec;
    if (!std::filesystem::exists(*path_, ec)) {
        return Result<Unit, EnclaveFailure>::Ok(unit);
    }
    std::ifstream input(*path_, std::ios::binary);
    if (!input) {
        return Result<Unit, EnclaveFailure>::Err(
            StatusFailure(fmt::format("Cannot open keystore file {}", path_->string()), KeystoreStatus::IO));
    }
    proto::keystore::KeystoreState state;
    if (!state.ParseFromIstream(&input)) {
        return Result<Unit, EnclaveFailure>::Err(
            StatusFailure("Keystore file is corrupted", KeystoreStatus::DECODE));
    }
    if (state.version() != STATE_VERSION) {
        return Result<Unit, EnclaveFailure>::Err(
            StatusFailure(fmt::format("Unsupported keystore version {}", state.version()),
                KeystoreStatus::DECODE));
    }
    for (auto& record : *state.mutable_keys()) {
        const auto& access = record.access_control();
        if (access.protection_class() > MAX_PROTECTION_CLASS ||
            (access.flags() & ~KNOWN_ACCESS_FLAGS) != 0 ||
            record.public_point().size() != Constants::EC_P256_UNCOMPRESSED_POINT_SIZE) {
            return Result<Unit, EnclaveFailure>::Err(
                StatusFailure("Keystore record is malformed", KeystoreStatus::DECODE));
        }
        const bool is_private = record.key_class() == proto::keystore::KEY_CLASS_PRIVATE;
        SecureMemoryHandle der;
        if (is_private) {
            const auto& stored = record.private_key_der();
            if (stored.empty()) {
                return Result<Unit, EnclaveFailure>::Err(
                    StatusFailure("Private keystore record has no key material", KeystoreStatus::DECODE));
            }
            auto handle = SecureMemoryHandle::FromBytes(std::span<const uint8_t>(
                reinterpret_cast<const uint8_t*>(stored.data()), stored.size()));
            WipeString(*record.mutable_private_key_der());
            if (handle.IsErr()) {
                return Result<Unit, EnclaveFailure>::Err(
                    StatusFailure(handle.UnwrapErr().message, KeystoreStatus::ALLOCATE));
            }
            der = std::move(handle).Unwrap();
        }
        const auto& tag = record.application_tag();
        const auto& point = record.public_point();
        entries_.emplace(NextIdLocked(), Entry{
            is_private ? KeyClass::Private : KeyClass::Public,
            record.access_group(),
            std::vector<uint8_t>(tag.begin(), tag.end()),
            AccessControl{AccessPolicy{
                static_cast<ProtectionClass>(access.protection_class()),
                AccessFlags::FromBits(access.flags())}},
            true,
            std::move(der),
            std::vector<uint8_t>(point.begin(), point.end())});
    }
    return Result<Unit, EnclaveFailure>::Ok(unit);
}

Result<Unit, EnclaveFailure> SoftwareKeystore::SaveLocked() const {
    if (!path_.has_value()) {
        return Result<Unit, EnclaveFailure>::Ok(unit);
    }
    proto::keystore::KeystoreState state;
    state.set_version(STATE_VERSION);
    for (const auto& [id, entry] : entries_) {
        if (!entry.permanent) {
            continue;
        }
        auto* record = state.add_keys();
        record->set_key_class(entry.key_class == KeyClass::Private
            ? proto::keystore::KEY_CLASS_PRIVATE
            : proto::keystore::KEY_CLASS_PUBLIC);
        record->set_access_group(entry.access_group);
        record->set_application_tag(entry.application_tag.data(), entry.application_tag.size());
        record->mutable_access_control()->set_protection_class(
            static_cast<uint32_t>(entry.access_control.policy.protection_class));
        record->mutable_access_control()->set_flags(entry.access_control.policy.flags.Bits());
        record->set_public_point(entry.public_point.data(), entry.public_point.size());
        if (entry.key_class == KeyClass::Private) {
            auto der = entry.private_der.ReadAll();
            if (der.IsErr()) {
                return Result<Unit, EnclaveFailure>::Err(
                    StatusFailure(der.UnwrapErr().message, KeystoreStatus::INVALID_KEY));
            }
            auto bytes = std::move(der).Unwrap();
            record->set_private_key_der(bytes.data(), bytes.size());
            auto wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
            (void)wipe;
        }
    }

    std::filesystem::path staging = *path_;
    staging += ".tmp";
    bool written = false;
    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        written = output && state.SerializeToOstream(&output);
        output.close();
        written = written && !output.fail();
    }
    for (auto& record : *state.mutable_keys()) {
        WipeString(*record.mutable_private_key_der());
    }
    if (!written) {
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        return Result<Unit, EnclaveFailure>::Err(
            StatusFailure(fmt::format("Failed to write keystore file {}", path_->string()), KeystoreStatus::IO));
    }
    std::error_code ec;
    std::filesystem::rename(staging, *path_, ec);
    if (ec) {
        return Result<Unit, EnclaveFailure>::Err(
            StatusFailure(fmt::format("Failed to replace keystore file: {}", ec.message()), KeystoreStatus::IO));
    }
    return Result<Unit, EnclaveFailure>::Ok(unit);
}

}
