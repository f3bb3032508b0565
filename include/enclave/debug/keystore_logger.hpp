#pragma once

/**
 * @file keystore_logger.hpp
 * @brief Diagnostic logging for key lifecycle and keystore statuses.
 *
 * Only identities, statuses and state transitions are logged, never key
 * material. Output goes to stdout and exists only in builds that define
 * ENCLAVE_DEBUG_KEYSTORE.
 *
 * Enable via CMake: -DENCLAVE_DEBUG_KEYSTORE=ON
 */

#include "enclave/core/keystore_status.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

#ifdef ENCLAVE_DEBUG_KEYSTORE
#include <fmt/core.h>
#endif

namespace enclave::debug {

#ifdef ENCLAVE_DEBUG_KEYSTORE

// ============================================================================
// Core logging macros
// ============================================================================

#define ENCLAVE_LOG_MSG(operation, message) \
    do { \
        fprintf(stdout, "[ENCLAVE-DEBUG] %s %s\n", \
            operation, \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

#define ENCLAVE_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[ENCLAVE-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            fmt::format("{}", value).c_str()); \
        fflush(stdout); \
    } while(0)

#define ENCLAVE_LOG_STATUS(operation, status) \
    do { \
        fprintf(stdout, "[ENCLAVE-DEBUG] %s status %d (%s)\n", \
            operation, \
            static_cast<int>(status), \
            std::string(::enclave::KeystoreStatus::Describe(status)).c_str()); \
        fflush(stdout); \
    } while(0)

#define ENCLAVE_LOG_SECTION(section_name) \
    do { \
        fprintf(stdout, "[ENCLAVE-DEBUG] ========== %s ==========\n", section_name); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Key lifecycle
// ============================================================================

inline void LogResolutionStart(const std::string& identity) {
    ENCLAVE_LOG_SECTION("RESOLVE PRIVATE KEY");
    ENCLAVE_LOG_MSG("RESOLVE", fmt::format("identity={}", identity));
}

inline void LogKeyFound(const std::string& identity, const uint64_t ref_id) {
    ENCLAVE_LOG_MSG("RESOLVE", fmt::format("found existing key for {} (ref {:#x})", identity, ref_id));
}

inline void LogKeyCreated(const std::string& identity, const uint64_t ref_id, const bool software) {
    ENCLAVE_LOG_MSG("CREATE", fmt::format("created {} key for {} (ref {:#x})",
        software ? "software" : "secure-element", identity, ref_id));
}

inline void LogSoftwareFallback(const std::string& identity, const std::string& reason) {
    ENCLAVE_LOG_MSG("CREATE", fmt::format("WARNING software fallback for {}: {}", identity, reason));
}

inline void LogDuplicateRetry(const std::string& identity) {
    ENCLAVE_LOG_MSG("CREATE", fmt::format("duplicate item for {}, retrying lookup once", identity));
}

inline void LogResolutionFailed(const std::string& identity, const std::string& reason) {
    ENCLAVE_LOG_MSG("RESOLVE", fmt::format("resolution failed for {}: {}", identity, reason));
}

inline void LogKeyDeleted(const std::string& identity, const char* key_class) {
    ENCLAVE_LOG_MSG("DELETE", fmt::format("deleted {} key for {}", key_class, identity));
}

// ============================================================================
// Operations
// ============================================================================

inline void LogOperation(const char* operation, const size_t input_size) {
    ENCLAVE_LOG_VALUE(operation, "input_size", input_size);
}

inline void LogOperationStatus(const char* operation, const NativeStatus status) {
    ENCLAVE_LOG_STATUS(operation, status);
}

#else // !ENCLAVE_DEBUG_KEYSTORE

#define ENCLAVE_LOG_MSG(operation, message) ((void)0)
#define ENCLAVE_LOG_VALUE(operation, name, value) ((void)0)
#define ENCLAVE_LOG_STATUS(operation, status) ((void)0)
#define ENCLAVE_LOG_SECTION(section_name) ((void)0)

inline void LogResolutionStart(const std::string&) {}
inline void LogKeyFound(const std::string&, uint64_t) {}
inline void LogKeyCreated(const std::string&, uint64_t, bool) {}
inline void LogSoftwareFallback(const std::string&, const std::string&) {}
inline void LogDuplicateRetry(const std::string&) {}
inline void LogResolutionFailed(const std::string&, const std::string&) {}
inline void LogKeyDeleted(const std::string&, const char*) {}
inline void LogOperation(const char*, size_t) {}
inline void LogOperationStatus(const char*, NativeStatus) {}

#endif // ENCLAVE_DEBUG_KEYSTORE

} // namespace enclave::debug
