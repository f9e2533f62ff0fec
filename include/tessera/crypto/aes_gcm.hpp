#pragma once
#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace tessera::protocol::crypto {

/**
 * AES-256-GCM authenticated encryption.
 *
 * Stateless primitive: output is ciphertext || 16-byte tag. The caller must
 * never reuse a (key, nonce) pair. RatchetSession satisfies this by deriving a
 * fresh key and nonce from every single-use message key.
 *
 * A tag mismatch is reported as ProtocolFailureType::AuthenticationFailed;
 * every other failure is InvalidInput or Generic.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
