#include "enclave/keystore/authentication_context.hpp"
#include <algorithm>
#include <fmt/core.h>
namespace enclave::keystore {

AuthenticationContext::AuthenticationContext(const std::chrono::seconds reuse_duration)
    : reuse_duration_(std::clamp(reuse_duration, std::chrono::seconds{0},
                                 AuthenticationConstants::MAX_REUSE_DURATION)) {
}

Result<Unit, EnclaveFailure> AuthenticationContext::SetAllowableReuseDuration(
    const std::chrono::seconds duration) {
    if (duration < std::chrono::seconds{0} || duration > AuthenticationConstants::MAX_REUSE_DURATION) {
        return Result<Unit, EnclaveFailure>::Err(
            EnclaveFailure::InvalidConfiguration(
                fmt::format("Authentication reuse duration must be between 0 and {} seconds, got {}",
                    AuthenticationConstants::MAX_REUSE_DURATION.count(), duration.count())));
    }
    std::lock_guard lock(mutex_);
    reuse_duration_ = duration;
    return Result<Unit, EnclaveFailure>::Ok(unit);
}

std::chrono::seconds AuthenticationContext::AllowableReuseDuration() const {
    std::lock_guard lock(mutex_);
    return reuse_duration_;
}

void AuthenticationContext::RecordAuthentication(const Clock::time_point when) {
    std::lock_guard lock(mutex_);
    last_authenticated_ = when;
}

bool AuthenticationContext::IsWithinReuseWindow(const Clock::time_point now) const {
    std::lock_guard lock(mutex_);
    if (!last_authenticated_.has_value() || reuse_duration_.count() == 0) {
        return false;
    }
    return now >= *last_authenticated_ && now - *last_authenticated_ <= reuse_duration_;
}

void AuthenticationContext::Invalidate() {
    std::lock_guard lock(mutex_);
    last_authenticated_.reset();
}

}
