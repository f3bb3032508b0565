#include "enclave/configuration/enclave_config.hpp"
#include <fmt/core.h>
#include <utility>

namespace enclave::configuration {

EnclaveConfig::EnclaveConfig(std::string tag, std::string identifier, std::string group, std::string prompt)
    : tag_(std::move(tag))
    , identifier_(std::move(identifier))
    , group_(std::move(group))
    , prompt_(std::move(prompt)) {
}

Result<EnclaveConfig, EnclaveFailure> EnclaveConfig::Create(
    std::string tag,
    std::string identifier,
    std::string group,
    std::string prompt) {
    const std::pair<const char*, const std::string*> fields[] = {
        {"tag", &tag},
        {"identifier", &identifier},
        {"group", &group},
        {"prompt", &prompt},
    };
    for (const auto& [name, value] : fields) {
        if (value->empty()) {
            return Result<EnclaveConfig, EnclaveFailure>::Err(
                EnclaveFailure::InvalidConfiguration(fmt::format("Configuration {} must not be empty", name)));
        }
    }
    return Result<EnclaveConfig, EnclaveFailure>::Ok(
        EnclaveConfig(std::move(tag), std::move(identifier), std::move(group), std::move(prompt)));
}

EnclaveConfig EnclaveConfig::WithAccessPolicy(const keystore::AccessPolicy& policy) const {
    EnclaveConfig copy = *this;
    copy.policy_ = policy;
    return copy;
}

Result<EnclaveConfig, EnclaveFailure> EnclaveConfig::WithReuseDuration(const std::chrono::seconds duration) const {
    if (duration < std::chrono::seconds{0} || duration > AuthenticationConstants::MAX_REUSE_DURATION) {
        return Result<EnclaveConfig, EnclaveFailure>::Err(
            EnclaveFailure::InvalidConfiguration(
                fmt::format("Reuse duration {}s is outside [0, {}]s",
                    duration.count(), AuthenticationConstants::MAX_REUSE_DURATION.count())));
    }
    EnclaveConfig copy = *this;
    copy.reuse_duration_ = duration;
    return Result<EnclaveConfig, EnclaveFailure>::Ok(std::move(copy));
}

std::string EnclaveConfig::QualifiedGroup() const {
    return identifier_ + Constants::QUALIFIED_GROUP_SEPARATOR + group_;
}

} // namespace enclave::configuration
