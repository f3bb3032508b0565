#pragma once
#include "enclave/identity/key_identity.hpp"
#include "enclave/keystore/key_ref.hpp"
#include <string>
namespace enclave::interfaces {
/// Key lifecycle notifications. Called outside the handle's lock; a handler
/// may resolve or delete keys through the same handle.
class IKeystoreEventHandler {
public:
    virtual ~IKeystoreEventHandler() = default;
    virtual void OnSoftwareFallback(const identity::KeyIdentity& identity, const std::string& reason) = 0;
    virtual void OnKeyCreated(const identity::KeyIdentity& identity, keystore::KeystoreBackend backend) = 0;
};
}
