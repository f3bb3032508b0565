#include <catch2/catch_test_macros.hpp>
#include "enclave/crypto/ec_key.hpp"
#include "enclave/crypto/ecies.hpp"
#include "enclave/crypto/ecdsa.hpp"
#include "enclave/crypto/sodium_interop.hpp"
#include "enclave/core/constants.hpp"
using namespace enclave;
using namespace enclave::crypto;
TEST_CASE("EcKey - P-256 encodings", "[ec][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto key = EcKey::GenerateP256();
    REQUIRE(key.IsOk());
    SECTION("Public point is uncompressed") {
        auto point = EcKey::ExportPublicPoint(key.Unwrap().get());
        REQUIRE(point.IsOk());
        REQUIRE(point.Unwrap().size() == Constants::EC_P256_UNCOMPRESSED_POINT_SIZE);
        REQUIRE(point.Unwrap().front() == Constants::EC_UNCOMPRESSED_POINT_PREFIX);
    }
    SECTION("Private DER import yields the same public point") {
        auto der = EcKey::ExportPrivateDer(key.Unwrap().get());
        REQUIRE(der.IsOk());
        auto imported = EcKey::ImportPrivateDer(der.Unwrap());
        REQUIRE(imported.IsOk());
        REQUIRE(EcKey::ExportPublicPoint(imported.Unwrap().get()).Unwrap() ==
                EcKey::ExportPublicPoint(key.Unwrap().get()).Unwrap());
    }
    SECTION("Malformed point is rejected") {
        auto point = EcKey::ExportPublicPoint(key.Unwrap().get()).Unwrap();
        auto wrong_prefix = point;
        wrong_prefix[0] = 0x02;
        REQUIRE(EcKey::ImportPublicPoint(wrong_prefix).IsErr());
        std::vector<uint8_t> truncated(point.begin(), point.end() - 1);
        REQUIRE(EcKey::ImportPublicPoint(truncated).IsErr());
    }
    SECTION("Cofactor agreement is symmetric") {
        auto peer = EcKey::GenerateP256().Unwrap();
        auto a = EcKey::CofactorAgree(key.Unwrap().get(), peer.get());
        auto b = EcKey::CofactorAgree(peer.get(), key.Unwrap().get());
        REQUIRE(a.IsOk());
        REQUIRE(b.IsOk());
        REQUIRE(a.Unwrap().size() == Constants::EC_P256_FIELD_SIZE);
        REQUIRE(a.Unwrap() == b.Unwrap());
    }
}
TEST_CASE("ECIES - Cofactor X9.63 SHA-256 AES-GCM", "[ecies][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto recipient = EcKey::GenerateP256().Unwrap();
    const std::vector<uint8_t> plaintext = {'p', 'a', 'y', 'l', 'o', 'a', 'd'};
    SECTION("Round-trip and wire layout") {
        auto sealed = Ecies::Encrypt(recipient.get(), plaintext);
        REQUIRE(sealed.IsOk());
        const auto& bytes = sealed.Unwrap();
        REQUIRE(bytes.size() == Constants::EC_P256_UNCOMPRESSED_POINT_SIZE + plaintext.size() +
                                Constants::AES_GCM_TAG_SIZE);
        REQUIRE(bytes.front() == Constants::EC_UNCOMPRESSED_POINT_PREFIX);
        auto opened = Ecies::Decrypt(recipient.get(), bytes);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext round-trip") {
        const std::vector<uint8_t> empty;
        auto sealed = Ecies::Encrypt(recipient.get(), empty);
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == Constants::ECIES_MIN_CIPHERTEXT_SIZE);
        auto opened = Ecies::Decrypt(recipient.get(), sealed.Unwrap());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap().empty());
    }
    SECTION("Fresh ephemeral key per message") {
        auto first = Ecies::Encrypt(recipient.get(), plaintext).Unwrap();
        auto second = Ecies::Encrypt(recipient.get(), plaintext).Unwrap();
        REQUIRE(first != second);
    }
    SECTION("Wrong recipient fails") {
        auto other = EcKey::GenerateP256().Unwrap();
        auto sealed = Ecies::Encrypt(recipient.get(), plaintext).Unwrap();
        REQUIRE(Ecies::Decrypt(other.get(), sealed).IsErr());
    }
    SECTION("Tampered ciphertext fails") {
        auto sealed = Ecies::Encrypt(recipient.get(), plaintext).Unwrap();
        sealed[Constants::EC_P256_UNCOMPRESSED_POINT_SIZE] ^= 0x80;
        REQUIRE(Ecies::Decrypt(recipient.get(), sealed).IsErr());
    }
    SECTION("Truncated input fails with decode status") {
        std::vector<uint8_t> truncated(Constants::ECIES_MIN_CIPHERTEXT_SIZE - 1, 0x04);
        auto result = Ecies::Decrypt(recipient.get(), truncated);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().HasStatus(KeystoreStatus::DECODE));
    }
}
TEST_CASE("ECDSA - P-256 SHA-256", "[ecdsa][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto key = EcKey::GenerateP256().Unwrap();
    const std::vector<uint8_t> message = {1, 2, 3};
    auto signature = Ecdsa::Sign(key.get(), message);
    REQUIRE(signature.IsOk());
    SECTION("Signature fits the signature block") {
        REQUIRE(signature.Unwrap().size() <= Constants::SIGNATURE_BLOCK_SIZE);
    }
    SECTION("Valid signature verifies") {
        REQUIRE(Ecdsa::Verify(key.get(), message, signature.Unwrap()).IsOk());
    }
    SECTION("Different message reports verify failure") {
        const std::vector<uint8_t> other = {1, 2, 4};
        auto result = Ecdsa::Verify(key.get(), other, signature.Unwrap());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().HasStatus(KeystoreStatus::VERIFY_FAILED));
    }
}
