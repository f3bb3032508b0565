#pragma once
#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace enclave::identity {

/**
 * @brief Names one logical key inside the keystore
 *
 * The tag is an application-scoped label; identifier and group combine into
 * the qualified access group "identifier.group". Every keystore lookup,
 * creation and deletion is scoped by the qualified group and the tag, never
 * by identifier or group alone.
 */
class KeyIdentity {
public:
    [[nodiscard]] static Result<KeyIdentity, EnclaveFailure> Create(
        std::span<const uint8_t> tag,
        std::string identifier,
        std::string group);

    [[nodiscard]] static Result<KeyIdentity, EnclaveFailure> Create(
        std::string_view tag,
        std::string identifier,
        std::string group);

    [[nodiscard]] const std::vector<uint8_t>& Tag() const noexcept { return tag_; }
    [[nodiscard]] const std::string& Identifier() const noexcept { return identifier_; }
    [[nodiscard]] const std::string& Group() const noexcept { return group_; }
    [[nodiscard]] const std::string& QualifiedGroup() const noexcept { return qualified_group_; }

    /// Printable form for diagnostics: "<tag>@<qualified group>".
    [[nodiscard]] std::string Describe() const;

    [[nodiscard]] bool operator==(const KeyIdentity& other) const noexcept {
        return tag_ == other.tag_ && qualified_group_ == other.qualified_group_;
    }

private:
    KeyIdentity(std::vector<uint8_t> tag, std::string identifier, std::string group);

    std::vector<uint8_t> tag_;
    std::string identifier_;
    std::string group_;
    std::string qualified_group_;
};

}
