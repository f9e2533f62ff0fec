#include "tessera/core/failures.hpp"
#include "tessera/core/format.hpp"

namespace tessera::protocol {

std::string_view ToString(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::Generic: return "Generic";
        case ProtocolFailureType::KeyGeneration: return "KeyGeneration";
        case ProtocolFailureType::IdentityCorrupted: return "IdentityCorrupted";
        case ProtocolFailureType::InvalidBundleSignature: return "InvalidBundleSignature";
        case ProtocolFailureType::AuthenticationFailed: return "AuthenticationFailed";
        case ProtocolFailureType::MessageKeyUnavailable: return "MessageKeyUnavailable";
        case ProtocolFailureType::DeriveKey: return "DeriveKey";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::InvalidState: return "InvalidState";
        case ProtocolFailureType::Handshake: return "Handshake";
        case ProtocolFailureType::Decode: return "Decode";
        case ProtocolFailureType::Encode: return "Encode";
    }
    return "Unknown";
}

std::string ProtocolFailure::ToString() const {
    std::string text = compat::format("{}: {}", protocol::ToString(type), message);
    if (!peer_id.empty()) {
        text += compat::format(" (peer={}", peer_id);
        if (message_number.has_value()) {
            text += compat::format(", message={}", *message_number);
        }
        text += ")";
    } else if (message_number.has_value()) {
        text += compat::format(" (message={})", *message_number);
    }
    return text;
}

}
