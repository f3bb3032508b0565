#pragma once
#include <cstdint>
namespace enclave::keystore {

enum class KeyClass : uint8_t {
    Private = 0,
    Public = 1
};

/// Where the key material actually lives.
enum class KeystoreBackend : uint8_t {
    SecureElement = 0,
    Software = 1
};

/**
 * @brief Opaque reference to a key held by a keystore
 *
 * Only the keystore that issued it can resolve the id. A reference outlives
 * the keystore entry it names: after a delete, operations through it fail
 * with an invalid-key status.
 */
class KeyRef {
public:
    constexpr KeyRef(const uint64_t id, const KeyClass key_class, const KeystoreBackend backend) noexcept
        : id_(id), key_class_(key_class), backend_(backend) {}

    [[nodiscard]] constexpr uint64_t Id() const noexcept { return id_; }
    [[nodiscard]] constexpr KeyClass Class() const noexcept { return key_class_; }
    [[nodiscard]] constexpr KeystoreBackend Backend() const noexcept { return backend_; }

    [[nodiscard]] constexpr bool operator==(const KeyRef& other) const noexcept {
        return id_ == other.id_ && key_class_ == other.key_class_ && backend_ == other.backend_;
    }
    [[nodiscard]] constexpr bool operator!=(const KeyRef& other) const noexcept {
        return !(*this == other);
    }

private:
    uint64_t id_;
    KeyClass key_class_;
    KeystoreBackend backend_;
};

}
