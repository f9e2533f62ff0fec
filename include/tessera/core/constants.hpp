#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace tessera::protocol {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t CURVE_25519_FIELD_ELEMENT_SIZE = 32;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view AUTH_TAG_MISMATCH = "Authentication tag verification failed";
    static constexpr std::string_view NO_IDENTITY = "No identity loaded";
    static constexpr std::string_view DID_MISMATCH = "Stored DID does not match the stored public key";
    static constexpr std::string_view SECRET_KEY_MISMATCH = "Stored secret key does not match the stored public key";
    static constexpr std::string_view SIGNED_PRE_KEY_FAILED = "Signed pre-key signature verification failed";
    static constexpr std::string_view ONE_TIME_PRE_KEY_USED = "One-time pre-key unknown or already used";
    static constexpr std::string_view SEND_CHAIN_NOT_READY = "Sending chain not established; a message must be received first";
    static constexpr std::string_view MESSAGE_KEY_UNAVAILABLE = "Message key no longer available";
    static constexpr std::string_view STATE_HMAC_FAILED = "State HMAC verification failed";
};
}
