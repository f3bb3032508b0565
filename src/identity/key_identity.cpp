#include "enclave/identity/key_identity.hpp"
#include "enclave/core/constants.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/core.h>
namespace enclave::identity {

KeyIdentity::KeyIdentity(std::vector<uint8_t> tag, std::string identifier, std::string group)
    : tag_(std::move(tag))
    , identifier_(std::move(identifier))
    , group_(std::move(group))
    , qualified_group_(identifier_ + Constants::QUALIFIED_GROUP_SEPARATOR + group_) {
}

Result<KeyIdentity, EnclaveFailure> KeyIdentity::Create(
    std::span<const uint8_t> tag,
    std::string identifier,
    std::string group) {
    if (tag.empty()) {
        return Result<KeyIdentity, EnclaveFailure>::Err(
            EnclaveFailure::InvalidConfiguration("Key tag cannot be empty"));
    }
    if (identifier.empty()) {
        return Result<KeyIdentity, EnclaveFailure>::Err(
            EnclaveFailure::InvalidConfiguration("Identifier cannot be empty"));
    }
    if (group.empty()) {
        return Result<KeyIdentity, EnclaveFailure>::Err(
            EnclaveFailure::InvalidConfiguration("Access group cannot be empty"));
    }
    return Result<KeyIdentity, EnclaveFailure>::Ok(KeyIdentity(
        std::vector<uint8_t>(tag.begin(), tag.end()), std::move(identifier), std::move(group)));
}

Result<KeyIdentity, EnclaveFailure> KeyIdentity::Create(
    std::string_view tag,
    std::string identifier,
    std::string group) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(tag.data());
    return Create(std::span<const uint8_t>(bytes, tag.size()), std::move(identifier), std::move(group));
}

std::string KeyIdentity::Describe() const {
    const bool printable = std::all_of(tag_.begin(), tag_.end(), [](const uint8_t c) {
        return std::isprint(c) != 0;
    });
    std::string rendered;
    if (printable) {
        rendered.assign(tag_.begin(), tag_.end());
    } else {
        rendered.reserve(tag_.size() * 2);
        for (const auto byte : tag_) {
            rendered += fmt::format("{:02x}", byte);
        }
    }
    return fmt::format("{}@{}", rendered, qualified_group_);
}

}
