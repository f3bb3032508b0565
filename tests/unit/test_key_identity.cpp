#include <catch2/catch_test_macros.hpp>
#include "enclave/identity/key_identity.hpp"
#include "enclave/keystore/key_attributes.hpp"
using namespace enclave;
using namespace enclave::identity;
using namespace enclave::keystore;
TEST_CASE("KeyIdentity - Construction", "[identity]") {
    SECTION("Qualified group joins identifier and group") {
        auto identity = KeyIdentity::Create("com.example.key1", "com.example.app", "shared");
        REQUIRE(identity.IsOk());
        REQUIRE(identity.Unwrap().QualifiedGroup() == "com.example.app.shared");
        REQUIRE(identity.Unwrap().Tag() == std::vector<uint8_t>{
            'c', 'o', 'm', '.', 'e', 'x', 'a', 'm', 'p', 'l', 'e', '.', 'k', 'e', 'y', '1'});
    }
    SECTION("Empty parts are rejected") {
        REQUIRE(KeyIdentity::Create("", "id", "group").IsErr());
        REQUIRE(KeyIdentity::Create("tag", "", "group").IsErr());
        auto result = KeyIdentity::Create("tag", "id", "");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == EnclaveFailureType::InvalidConfiguration);
    }
    SECTION("Binary tags are described in hex") {
        const std::vector<uint8_t> tag = {0x00, 0xff, 0x10};
        auto identity = KeyIdentity::Create(std::span<const uint8_t>(tag), "id", "group");
        REQUIRE(identity.IsOk());
        REQUIRE(identity.Unwrap().Describe() == "00ff10@id.group");
    }
    SECTION("Printable tags are described verbatim") {
        auto identity = KeyIdentity::Create("key", "id", "group").Unwrap();
        REQUIRE(identity.Describe() == "key@id.group");
    }
    SECTION("Equality uses tag and qualified group") {
        auto a = KeyIdentity::Create("key", "id", "group").Unwrap();
        auto b = KeyIdentity::Create("key", "id", "group").Unwrap();
        auto c = KeyIdentity::Create("key", "id", "other").Unwrap();
        REQUIRE(a == b);
        REQUIRE_FALSE(a == c);
    }
}
TEST_CASE("KeyQuery and KeyAttributes - Scoping", "[identity][keystore]") {
    auto identity = KeyIdentity::Create("com.example.key1", "com.example.app", "shared").Unwrap();
    SECTION("Queries are scoped by class, qualified group and tag") {
        auto query = KeyQuery::For(KeyClass::Public, identity);
        REQUIRE(query.key_class == KeyClass::Public);
        REQUIRE(query.access_group == "com.example.app.shared");
        REQUIRE(query.application_tag == identity.Tag());
        REQUIRE_FALSE(query.return_ref);
        REQUIRE_FALSE(query.authentication_context);
    }
    SECTION("Builders fill authentication and type") {
        auto context = std::make_shared<AuthenticationContext>();
        auto query = KeyQuery::For(KeyClass::Private, identity)
                         .OfType(KeyType::EcSecPrimeRandom)
                         .ReturningRef()
                         .WithAuthentication(context, "Unlock");
        REQUIRE(query.key_type == KeyType::EcSecPrimeRandom);
        REQUIRE(query.return_ref);
        REQUIRE(query.authentication_context == context);
        REQUIRE(query.operation_prompt == "Unlock");
    }
    SECTION("P-256 attributes are permanent and bound to the identity") {
        const AccessControl access{AccessPolicy::Default()};
        auto attributes = KeyAttributes::ForEcP256(identity, access, TokenId::SecureEnclave);
        REQUIRE(attributes.key_type == KeyType::EcSecPrimeRandom);
        REQUIRE(attributes.key_size_bits == 256);
        REQUIRE(attributes.token == TokenId::SecureEnclave);
        REQUIRE(attributes.private_key.is_permanent);
        REQUIRE(attributes.private_key.access_group == "com.example.app.shared");
        REQUIRE(attributes.private_key.application_tag == identity.Tag());
        REQUIRE(attributes.private_key.access_control.policy == AccessPolicy::Default());
    }
}
TEST_CASE("AccessPolicy - Defaults and flags", "[keystore][policy]") {
    SECTION("Default policy") {
        constexpr auto policy = AccessPolicy::Default();
        STATIC_REQUIRE(policy.protection_class == ProtectionClass::AfterFirstUnlockThisDeviceOnly);
        STATIC_REQUIRE(policy.flags.Has(AccessFlag::UserPresence));
        STATIC_REQUIRE(policy.flags.Has(AccessFlag::PrivateKeyUsage));
        STATIC_REQUIRE_FALSE(policy.flags.Has(AccessFlag::BiometryAny));
        STATIC_REQUIRE(policy.RequiresUserPresence());
    }
    SECTION("Usage-only policy does not need presence") {
        const AccessPolicy policy{ProtectionClass::WhenUnlocked,
                                  AccessFlags().With(AccessFlag::PrivateKeyUsage)};
        REQUIRE_FALSE(policy.RequiresUserPresence());
    }
    SECTION("Flags round-trip through bits") {
        const auto flags = AccessFlags().With(AccessFlag::BiometryCurrentSet).With(AccessFlag::DevicePasscode);
        REQUIRE(AccessFlags::FromBits(flags.Bits()) == flags);
        REQUIRE(AccessFlags().Empty());
    }
}
