#pragma once
#include "enclave/interfaces/i_keystore_event_handler.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace enclave::test_helpers {

class RecordingEventHandler : public interfaces::IKeystoreEventHandler {
public:
    void OnSoftwareFallback(const identity::KeyIdentity& identity, const std::string& reason) override {
        std::lock_guard lock(mutex_);
        fallbacks.push_back(identity.Describe() + ": " + reason);
    }

    void OnKeyCreated(const identity::KeyIdentity&, const keystore::KeystoreBackend backend) override {
        std::lock_guard lock(mutex_);
        created.push_back(backend);
    }

    std::vector<std::string> fallbacks;
    std::vector<keystore::KeystoreBackend> created;

private:
    std::mutex mutex_;
};

}
