#pragma once
#include <cstdint>
#include <string_view>
namespace enclave {

/// Native status reported by a keystore backend.
///
/// Values line up with the platform keychain's status space so a platform
/// adapter can forward its own codes unchanged.
using NativeStatus = int32_t;

struct KeystoreStatus {
    static constexpr NativeStatus SUCCESS = 0;
    static constexpr NativeStatus IO = -36;
    static constexpr NativeStatus PARAM = -50;
    static constexpr NativeStatus ALLOCATE = -108;
    static constexpr NativeStatus USER_CANCELED = -128;
    static constexpr NativeStatus NOT_AVAILABLE = -25291;
    static constexpr NativeStatus AUTH_FAILED = -25293;
    static constexpr NativeStatus DUPLICATE_ITEM = -25299;
    static constexpr NativeStatus ITEM_NOT_FOUND = -25300;
    static constexpr NativeStatus INTERACTION_NOT_ALLOWED = -25308;
    static constexpr NativeStatus DECODE = -26275;
    static constexpr NativeStatus INVALID_KEY = -67712;
    static constexpr NativeStatus VERIFY_FAILED = -67808;

    [[nodiscard]] static constexpr std::string_view Describe(const NativeStatus status) noexcept {
        switch (status) {
            case SUCCESS: return "success";
            case IO: return "i/o error";
            case PARAM: return "invalid parameter";
            case ALLOCATE: return "allocation failed";
            case USER_CANCELED: return "user canceled";
            case NOT_AVAILABLE: return "keystore not available";
            case AUTH_FAILED: return "authentication failed";
            case DUPLICATE_ITEM: return "item already exists";
            case ITEM_NOT_FOUND: return "item not found";
            case INTERACTION_NOT_ALLOWED: return "interaction not allowed";
            case DECODE: return "unable to decode data";
            case INVALID_KEY: return "invalid key";
            case VERIFY_FAILED: return "signature verification failed";
            default: return "unknown status";
        }
    }
};

}
