#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
namespace tessera::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class ProtocolFailureType {
    Generic,
    KeyGeneration,
    IdentityCorrupted,
    InvalidBundleSignature,
    AuthenticationFailed,
    MessageKeyUnavailable,
    DeriveKey,
    InvalidInput,
    InvalidState,
    Handshake,
    Decode,
    Encode
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Error raised by every protocol-level operation.
///
/// Session-level failures carry the peer and, where one applies, the message
/// number so the caller can log or alert without re-deriving context.
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    std::string peer_id;
    std::optional<uint64_t> message_number;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure IdentityCorrupted(std::string msg) {
        return {ProtocolFailureType::IdentityCorrupted, std::move(msg)};
    }
    static ProtocolFailure InvalidBundleSignature(std::string msg) {
        return {ProtocolFailureType::InvalidBundleSignature, std::move(msg)};
    }
    static ProtocolFailure AuthenticationFailed(std::string msg) {
        return {ProtocolFailureType::AuthenticationFailed, std::move(msg)};
    }
    static ProtocolFailure MessageKeyUnavailable(std::string msg) {
        return {ProtocolFailureType::MessageKeyUnavailable, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure Handshake(std::string msg) {
        return {ProtocolFailureType::Handshake, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return KeyGeneration(sf.message);
        }
        return Generic(sf.message);
    }

    ProtocolFailure WithPeer(std::string_view peer) && {
        peer_id = std::string(peer);
        return std::move(*this);
    }
    ProtocolFailure WithMessageNumber(const uint64_t number) && {
        message_number = number;
        return std::move(*this);
    }

    [[nodiscard]] std::string ToString() const;
};

[[nodiscard]] std::string_view ToString(ProtocolFailureType type) noexcept;
}
