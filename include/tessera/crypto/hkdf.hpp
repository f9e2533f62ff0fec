#pragma once

#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace tessera::protocol::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) on top of the OpenSSL EVP_KDF interface
 *
 * DeriveKey runs extract and expand in one call; Extract and Expand are
 * exposed separately for callers that reuse a PRK.
 */
class Hkdf {
public:
    /**
     * @brief Fill `output` with HKDF-SHA256(ikm, salt, info)
     *
     * @param ikm Input key material (must be non-empty)
     * @param salt Optional salt; empty means a zero-filled salt of hash length
     * @param info Optional context string
     */
    static Result<Unit, ProtocolFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /**
     * @brief Convenience overload taking the info label as text
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt,
        std::string_view info);

    /**
     * @brief HKDF-Extract: PRK = HMAC-SHA256(salt, ikm), always 32 bytes
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> Extract(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt = {});

    /**
     * @brief HKDF-Expand over a 32-byte PRK
     */
    static Result<Unit, ProtocolFailure> Expand(
        std::span<const uint8_t> prk,
        std::span<uint8_t> output,
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace tessera::protocol::crypto
