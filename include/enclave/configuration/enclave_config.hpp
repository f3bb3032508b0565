#pragma once

#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"
#include "enclave/core/constants.hpp"
#include "enclave/keystore/access_policy.hpp"

#include <chrono>
#include <string>

namespace enclave::configuration {

/// Construction parameters for an EnclaveCryptoService
///
/// Four plain strings name the key and the prompt shown when the keystore
/// asks for user presence:
///
/// - **tag**: application-scoped label, unique per logical key
/// - **identifier**: application or bundle scope
/// - **group**: sharing scope; combined with identifier into the qualified
///   access group "identifier.group"
/// - **prompt**: operation prompt carried by the authentication context
///
/// Validation is non-emptiness only. The access policy and authentication
/// reuse window default to AccessPolicy::Default() and 15 seconds.
///
/// @example
/// ```cpp
/// auto config = EnclaveConfig::Create(
///     "com.example.key1", "com.example.app", "shared", "Unlock signing key");
/// if (config.IsOk()) {
///     auto relaxed = config.Unwrap().WithReuseDuration(std::chrono::seconds{60});
/// }
/// ```
class EnclaveConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Validates the four strings; InvalidConfiguration names the first empty one.
    [[nodiscard]] static Result<EnclaveConfig, EnclaveFailure> Create(
        std::string tag,
        std::string identifier,
        std::string group,
        std::string prompt);

    /// Copy with a different access policy.
    [[nodiscard]] EnclaveConfig WithAccessPolicy(const keystore::AccessPolicy& policy) const;

    /// Copy with a different authentication reuse window.
    ///
    /// Fails with InvalidConfiguration outside [0, 300] seconds.
    [[nodiscard]] Result<EnclaveConfig, EnclaveFailure> WithReuseDuration(
        std::chrono::seconds duration) const;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] const std::string& Tag() const noexcept { return tag_; }
    [[nodiscard]] const std::string& Identifier() const noexcept { return identifier_; }
    [[nodiscard]] const std::string& Group() const noexcept { return group_; }
    [[nodiscard]] const std::string& Prompt() const noexcept { return prompt_; }

    /// "identifier.group", the access group every keystore call is scoped by
    [[nodiscard]] std::string QualifiedGroup() const;

    [[nodiscard]] const keystore::AccessPolicy& Policy() const noexcept { return policy_; }

    [[nodiscard]] std::chrono::seconds ReuseDuration() const noexcept { return reuse_duration_; }

private:
    EnclaveConfig(std::string tag, std::string identifier, std::string group, std::string prompt);

    std::string tag_;
    std::string identifier_;
    std::string group_;
    std::string prompt_;
    keystore::AccessPolicy policy_ = keystore::AccessPolicy::Default();
    std::chrono::seconds reuse_duration_ = AuthenticationConstants::DEFAULT_REUSE_DURATION;
};

} // namespace enclave::configuration
