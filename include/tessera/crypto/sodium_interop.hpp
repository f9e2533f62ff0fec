#pragma once

#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"
#include "tessera/core/constants.hpp"
#include "tessera/crypto/sodium_secure_memory_handle.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace tessera::protocol::crypto {

/**
 * @brief Interop layer for libsodium cryptographic operations
 *
 * Provides safe interfaces to libsodium functionality. Secret keys produced
 * here are returned in SecureMemoryHandle instances, never as plain vectors,
 * except for the Ed25519 generation path which hands them straight to secure
 * storage in IdentityStore.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile loop, larger ones with
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different or of different size
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate X25519 (Curve25519) key pair
     *
     * @param key_purpose Description for error messages
     * @return Ok((secret key handle, public key bytes)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Generate Ed25519 key pair
     *
     * @return Ok((secret key handle, public key bytes)) or Err(KeyGeneration)
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateEd25519KeyPair();

    // ========================================================================
    // Curve Conversion and Agreement
    // ========================================================================

    /**
     * @brief Map an Ed25519 public key onto its Montgomery (X25519) form
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> ConvertEd25519PublicToX25519(
        std::span<const uint8_t> ed25519_public);

    /**
     * @brief Map an Ed25519 secret key onto its X25519 scalar
     *
     * The result never leaves secure memory.
     */
    static Result<SecureMemoryHandle, ProtocolFailure> ConvertEd25519SecretToX25519(
        const SecureMemoryHandle& ed25519_secret);

    /**
     * @brief X25519 scalar multiplication
     *
     * Fails when the output is the all-zero point (low-order input).
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> ComputeSharedSecret(
        const SecureMemoryHandle& private_key,
        std::span<const uint8_t> public_key,
        std::string_view label);

    static Result<std::vector<uint8_t>, ProtocolFailure> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, locked memory using sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace tessera::protocol::crypto
