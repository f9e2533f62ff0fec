#pragma once

/**
 * @file key_logger.hpp
 * @brief Hex dumps of derived keys for cross-implementation debugging.
 *
 * SECURITY WARNING: prints secret keys to stdout. Only enable
 * TESSERA_DEBUG_KEYS (CMake option of the same name) in development builds.
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>

namespace tessera::debug {

enum class Role {
    Initiator,
    Responder,
    Unknown
};

#ifdef TESSERA_DEBUG_KEYS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline const char* RoleToString(Role role) {
    switch (role) {
        case Role::Initiator: return "INITIATOR";
        case Role::Responder: return "RESPONDER";
        default: return "UNKNOWN";
    }
}

#define TESSERA_LOG_KEY(role, operation, key_name, data) \
    do { \
        fprintf(stdout, "[TESSERA-KEYS] %s %s %s: %s\n", \
            ::tessera::debug::RoleToString(role), \
            operation, \
            key_name, \
            ::tessera::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define TESSERA_LOG_KEY_IDX(role, operation, key_name, index, data) \
    do { \
        fprintf(stdout, "[TESSERA-KEYS] %s %s %s[%llu]: %s\n", \
            ::tessera::debug::RoleToString(role), \
            operation, \
            key_name, \
            static_cast<unsigned long long>(index), \
            ::tessera::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

inline void LogX3dhSharedSecret(Role role, std::span<const uint8_t> shared_secret) {
    TESSERA_LOG_KEY(role, "X3DH", "shared_secret", shared_secret);
}

inline void LogDhRatchet(
    Role role,
    std::span<const uint8_t> root_key_after,
    std::span<const uint8_t> local_public,
    std::span<const uint8_t> remote_public) {
    TESSERA_LOG_KEY(role, "RATCHET", "root_key", root_key_after);
    TESSERA_LOG_KEY(role, "RATCHET", "local_public", local_public);
    TESSERA_LOG_KEY(role, "RATCHET", "remote_public", remote_public);
}

inline void LogMessageKey(Role role, const char* direction, uint64_t index, std::span<const uint8_t> message_key) {
    TESSERA_LOG_KEY_IDX(role, direction, "message_key", index, message_key);
}

#else // !TESSERA_DEBUG_KEYS

#define TESSERA_LOG_KEY(role, operation, key_name, data) ((void)0)
#define TESSERA_LOG_KEY_IDX(role, operation, key_name, index, data) ((void)0)

inline void LogX3dhSharedSecret(Role, std::span<const uint8_t>) {}
inline void LogDhRatchet(Role, std::span<const uint8_t>, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogMessageKey(Role, const char*, uint64_t, std::span<const uint8_t>) {}

#endif // TESSERA_DEBUG_KEYS

} // namespace tessera::debug
