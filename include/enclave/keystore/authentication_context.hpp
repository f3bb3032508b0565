#pragma once
#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"
#include "enclave/core/constants.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
namespace enclave::keystore {

/**
 * @brief Authentication session shared between a key handle and the keystore
 *
 * After a successful user-presence check the keystore records it here; any
 * further private key operation inside the allowable reuse window proceeds
 * without a new prompt. Thread-safe.
 */
class AuthenticationContext {
public:
    using Clock = std::chrono::steady_clock;

    explicit AuthenticationContext(
        std::chrono::seconds reuse_duration = AuthenticationConstants::DEFAULT_REUSE_DURATION);

    /// Fails with InvalidConfiguration above the platform maximum.
    [[nodiscard]] Result<Unit, EnclaveFailure> SetAllowableReuseDuration(std::chrono::seconds duration);

    [[nodiscard]] std::chrono::seconds AllowableReuseDuration() const;

    void RecordAuthentication(Clock::time_point when = Clock::now());

    [[nodiscard]] bool IsWithinReuseWindow(Clock::time_point now = Clock::now()) const;

    /// Forget any earlier authentication so the next operation prompts again.
    void Invalidate();

private:
    mutable std::mutex mutex_;
    std::chrono::seconds reuse_duration_;
    std::optional<Clock::time_point> last_authenticated_;
};

}
