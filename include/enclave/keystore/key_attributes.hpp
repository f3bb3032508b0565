#pragma once
#include "enclave/identity/key_identity.hpp"
#include "enclave/keystore/access_policy.hpp"
#include "enclave/keystore/authentication_context.hpp"
#include "enclave/keystore/key_ref.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
namespace enclave::keystore {

enum class KeyType : uint8_t {
    EcSecPrimeRandom = 0
};

/// Token the key is generated on. None means software-backed.
enum class TokenId : uint8_t {
    None = 0,
    SecureEnclave = 1
};

/**
 * Typed keystore query. Every query is scoped by key class, qualified access
 * group and application tag.
 */
struct KeyQuery {
    KeyClass key_class;
    std::optional<KeyType> key_type;
    std::string access_group;
    std::vector<uint8_t> application_tag;
    bool return_ref = false;
    std::shared_ptr<AuthenticationContext> authentication_context;
    std::string operation_prompt;

    [[nodiscard]] static KeyQuery For(const KeyClass key_class, const identity::KeyIdentity& identity) {
        KeyQuery query{key_class, std::nullopt, identity.QualifiedGroup(), identity.Tag()};
        return query;
    }

    [[nodiscard]] KeyQuery&& OfType(const KeyType type) && {
        key_type = type;
        return std::move(*this);
    }

    [[nodiscard]] KeyQuery&& ReturningRef() && {
        return_ref = true;
        return std::move(*this);
    }

    [[nodiscard]] KeyQuery&& WithAuthentication(
        std::shared_ptr<AuthenticationContext> context,
        std::string prompt) && {
        authentication_context = std::move(context);
        operation_prompt = std::move(prompt);
        return std::move(*this);
    }
};

struct PrivateKeyAttributes {
    std::string access_group;
    std::vector<uint8_t> application_tag;
    bool is_permanent = true;
    AccessControl access_control;
};

/**
 * Typed key generation request.
 */
struct KeyAttributes {
    KeyType key_type;
    uint32_t key_size_bits;
    TokenId token;
    PrivateKeyAttributes private_key;
    std::shared_ptr<AuthenticationContext> authentication_context;
    std::string operation_prompt;

    /// Permanent P-256 key bound to the identity's qualified group and tag.
    [[nodiscard]] static KeyAttributes ForEcP256(
        const identity::KeyIdentity& identity,
        const AccessControl& access_control,
        const TokenId token) {
        return KeyAttributes{
            KeyType::EcSecPrimeRandom,
            Constants::EC_KEY_SIZE_BITS,
            token,
            PrivateKeyAttributes{identity.QualifiedGroup(), identity.Tag(), true, access_control},
            nullptr,
            {}};
    }

    [[nodiscard]] KeyAttributes&& WithAuthentication(
        std::shared_ptr<AuthenticationContext> context,
        std::string prompt) && {
        authentication_context = std::move(context);
        operation_prompt = std::move(prompt);
        return std::move(*this);
    }
};

}
