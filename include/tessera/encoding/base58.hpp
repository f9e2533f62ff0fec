#pragma once

#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::protocol::encoding {

/// Base58 over the Bitcoin alphabet, as used by multibase 'z' in did:key.
///
/// Leading zero bytes are preserved as leading '1' characters.
class Base58 {
public:
    static std::string Encode(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, ProtocolFailure> Decode(std::string_view text);

    static constexpr std::string_view ALPHABET =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

private:
    Base58() = delete;
};

}
