#include "tessera/identity/did.hpp"
#include "tessera/encoding/base58.hpp"
#include "tessera/protocol/constants.hpp"
#include "tessera/core/format.hpp"

namespace tessera::protocol::identity {

using encoding::Base58;

namespace {
    constexpr size_t kTypeTagBytes = 2;
}

Result<std::string, ProtocolFailure> Did::Derive(std::span<const uint8_t> public_key) {
    if (public_key.size() != kEd25519PublicKeyBytes) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("DID public key must be {} bytes, got {}",
                    kEd25519PublicKeyBytes, public_key.size())));
    }
    std::vector<uint8_t> tagged;
    tagged.reserve(kTypeTagBytes + public_key.size());
    tagged.push_back(kDidKeyTypeTag0);
    tagged.push_back(kDidKeyTypeTag1);
    tagged.insert(tagged.end(), public_key.begin(), public_key.end());

    std::string did(kDidKeyPrefix);
    did += Base58::Encode(tagged);
    return Result<std::string, ProtocolFailure>::Ok(std::move(did));
}

Result<std::vector<uint8_t>, ProtocolFailure> Did::ExtractPublicKey(std::string_view did) {
    if (did.substr(0, kDidKeyPrefix.size()) != kDidKeyPrefix) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("DID must start with did:key:z"));
    }
    auto decoded_result = Base58::Decode(did.substr(kDidKeyPrefix.size()));
    if (decoded_result.IsErr()) {
        return decoded_result;
    }
    auto decoded = std::move(decoded_result).Unwrap();
    if (decoded.size() != kTypeTagBytes + kEd25519PublicKeyBytes ||
        decoded[0] != kDidKeyTypeTag0 || decoded[1] != kDidKeyTypeTag1) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("DID does not carry an Ed25519 multicodec key"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
        std::vector<uint8_t>(decoded.begin() + kTypeTagBytes, decoded.end()));
}

bool Did::IsValid(std::string_view did) {
    return ExtractPublicKey(did).IsOk();
}

bool Did::Matches(std::string_view did, std::span<const uint8_t> public_key) {
    auto derived = Derive(public_key);
    return derived.IsOk() && derived.Unwrap() == did;
}

}
