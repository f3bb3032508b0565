#pragma once
#include <cstdint>
namespace enclave::keystore {

/// When the keystore may release the key, mirroring platform keychain
/// accessibility classes. "ThisDeviceOnly" classes never migrate off device.
enum class ProtectionClass : uint8_t {
    AfterFirstUnlockThisDeviceOnly = 0,
    WhenPasscodeSetThisDeviceOnly = 1,
    WhenUnlockedThisDeviceOnly = 2,
    AfterFirstUnlock = 3,
    WhenUnlocked = 4
};

enum class AccessFlag : uint32_t {
    UserPresence = 1u << 0,
    PrivateKeyUsage = 1u << 1,
    BiometryAny = 1u << 2,
    BiometryCurrentSet = 1u << 3,
    DevicePasscode = 1u << 4
};

class AccessFlags {
public:
    constexpr AccessFlags() noexcept = default;

    [[nodiscard]] static constexpr AccessFlags FromBits(const uint32_t bits) noexcept {
        return AccessFlags(bits);
    }

    [[nodiscard]] constexpr AccessFlags With(const AccessFlag flag) const noexcept {
        return AccessFlags(bits_ | static_cast<uint32_t>(flag));
    }

    [[nodiscard]] constexpr bool Has(const AccessFlag flag) const noexcept {
        return (bits_ & static_cast<uint32_t>(flag)) != 0;
    }

    [[nodiscard]] constexpr bool Empty() const noexcept { return bits_ == 0; }

    [[nodiscard]] constexpr uint32_t Bits() const noexcept { return bits_; }

    [[nodiscard]] constexpr bool operator==(const AccessFlags& other) const noexcept {
        return bits_ == other.bits_;
    }

private:
    explicit constexpr AccessFlags(const uint32_t bits) noexcept : bits_(bits) {}

    uint32_t bits_ = 0;
};

/// Protection class plus the authentication flags bound to the private key.
struct AccessPolicy {
    ProtectionClass protection_class;
    AccessFlags flags;

    /// After-first-unlock on this device, user presence required for every
    /// private key operation.
    [[nodiscard]] static constexpr AccessPolicy Default() noexcept {
        return AccessPolicy{
            ProtectionClass::AfterFirstUnlockThisDeviceOnly,
            AccessFlags().With(AccessFlag::UserPresence).With(AccessFlag::PrivateKeyUsage)};
    }

    [[nodiscard]] constexpr bool RequiresUserPresence() const noexcept {
        return flags.Has(AccessFlag::UserPresence) ||
               flags.Has(AccessFlag::BiometryAny) ||
               flags.Has(AccessFlag::BiometryCurrentSet) ||
               flags.Has(AccessFlag::DevicePasscode);
    }

    [[nodiscard]] constexpr bool operator==(const AccessPolicy& other) const noexcept {
        return protection_class == other.protection_class && flags == other.flags;
    }
};

/// Access-control object issued by a keystore for a validated policy.
struct AccessControl {
    AccessPolicy policy;
};

}
