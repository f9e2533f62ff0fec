#pragma once

#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::protocol::identity {

/// did:key identifiers for Ed25519 signing keys.
///
/// `did:key:z` + base58(0xED 0x01 || public key). Derivation is a pure
/// function of the key, so a stored DID can always be re-checked.
class Did {
public:
    static Result<std::string, ProtocolFailure> Derive(std::span<const uint8_t> public_key);

    /// Inverse of Derive. Fails with InvalidInput on a wrong prefix, a bad
    /// base58 body, a wrong type tag or a key of the wrong length.
    static Result<std::vector<uint8_t>, ProtocolFailure> ExtractPublicKey(std::string_view did);

    [[nodiscard]] static bool IsValid(std::string_view did);

    /// True when `did` is exactly the identifier derived from `public_key`.
    [[nodiscard]] static bool Matches(std::string_view did, std::span<const uint8_t> public_key);

private:
    Did() = delete;
};

}
