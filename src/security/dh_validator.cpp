#include "tessera/security/dh_validator.hpp"
#include "tessera/core/constants.hpp"
#include "tessera/core/format.hpp"

namespace tessera::protocol::security {

namespace {
    constexpr uint8_t kTopBitMask = 0x7F;
    constexpr uint8_t kPrimeLowByte = 0xED;
    constexpr uint8_t kAllOnes = 0xFF;

    bool ConstantTimeEquals(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
        if (a.size() != b.size()) {
            return false;
        }
        uint8_t diff = 0;
        for (size_t i = 0; i < a.size(); ++i) {
            diff |= static_cast<uint8_t>(a[i] ^ b[i]);
        }
        return diff == 0;
    }
}

Result<Unit, ProtocolFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {
    if (public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Invalid X25519 public key size: expected {}, got {}",
                    Constants::X_25519_PUBLIC_KEY_SIZE, public_key.size())));
    }
    if (HasSmallOrder(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("X25519 public key is a small-order point (invalid for DH)"));
    }
    if (!IsCanonicalFieldElement(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("X25519 public key is not a canonical Curve25519 field element"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) noexcept {
    bool found = false;
    for (const auto& point : SMALL_ORDER_POINTS) {
        found |= ConstantTimeEquals(public_key, std::span<const uint8_t>(point.data(), point.size()));
    }
    return found;
}

bool DhValidator::IsCanonicalFieldElement(std::span<const uint8_t> public_key) noexcept {
    if (public_key.size() != Constants::CURVE_25519_FIELD_ELEMENT_SIZE) {
        return false;
    }
    // p = 2^255 - 19 is ed ff .. ff 7f little-endian; anything at or above it is non-canonical.
    const size_t last = public_key.size() - 1;
    if ((public_key[last] & kTopBitMask) != kTopBitMask) {
        return true;
    }
    for (size_t i = 1; i < last; ++i) {
        if (public_key[i] != kAllOnes) {
            return true;
        }
    }
    return public_key[0] < kPrimeLowByte;
}

} // namespace tessera::protocol::security
