#include <catch2/catch_test_macros.hpp>
#include "enclave/crypto/x963_kdf.hpp"
#include <algorithm>
#include <string>
using namespace enclave;
using namespace enclave::crypto;
namespace {
    std::vector<uint8_t> FromHex(const std::string& hex) {
        std::vector<uint8_t> bytes;
        for (size_t i = 0; i + 1 < hex.size(); i += 2) {
            bytes.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
        }
        return bytes;
    }
}
TEST_CASE("X9.63 KDF - Known answer", "[x963][kdf]") {
    // NIST CAVS ANSI X9.63 SHA-256, 192-bit Z, no SharedInfo, 128-bit output.
    const auto secret = FromHex("96c05619d56c328ab95fe84b18264b08725b85e33fd34f08");
    const auto expected = FromHex("443024c3dae66b95e6f5670601558f71");
    auto result = X963Kdf::DeriveKeyBytes(secret, expected.size());
    REQUIRE(result.IsOk());
    REQUIRE(result.Unwrap() == expected);
}
TEST_CASE("X9.63 KDF - Properties", "[x963][kdf]") {
    const std::vector<uint8_t> secret(32, 0x42);
    const std::vector<uint8_t> info_a = {0x04, 0x01, 0x02};
    const std::vector<uint8_t> info_b = {0x04, 0x01, 0x03};
    SECTION("Deterministic") {
        auto first = X963Kdf::DeriveKeyBytes(secret, 32, info_a);
        auto second = X963Kdf::DeriveKeyBytes(secret, 32, info_a);
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        REQUIRE(first.Unwrap() == second.Unwrap());
    }
    SECTION("SharedInfo separates outputs") {
        auto first = X963Kdf::DeriveKeyBytes(secret, 32, info_a);
        auto second = X963Kdf::DeriveKeyBytes(secret, 32, info_b);
        REQUIRE(first.Unwrap() != second.Unwrap());
    }
    SECTION("Shorter output is a prefix of longer output") {
        auto short_out = X963Kdf::DeriveKeyBytes(secret, 16, info_a).Unwrap();
        auto long_out = X963Kdf::DeriveKeyBytes(secret, 48, info_a).Unwrap();
        REQUIRE(std::equal(short_out.begin(), short_out.end(), long_out.begin()));
    }
    SECTION("DeriveKey fills caller buffer") {
        std::vector<uint8_t> output(32, 0x00);
        REQUIRE(X963Kdf::DeriveKey(secret, output, info_a).IsOk());
        REQUIRE(output == X963Kdf::DeriveKeyBytes(secret, 32, info_a).Unwrap());
    }
    SECTION("Empty secret is rejected") {
        const std::vector<uint8_t> empty;
        REQUIRE(X963Kdf::DeriveKeyBytes(empty, 16).IsErr());
    }
}
