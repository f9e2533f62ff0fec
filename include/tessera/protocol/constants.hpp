#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string_view>

namespace tessera::protocol {

inline constexpr uint32_t kProtocolVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SignatureBytes = 64;

inline constexpr size_t kRootKeyBytes = 32;
inline constexpr size_t kChainKeyBytes = 32;
inline constexpr size_t kMessageKeyBytes = 32;
inline constexpr size_t kSharedSecretBytes = 32;
inline constexpr size_t kHmacBytes = 32;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr size_t kChallengeBytes = 32;

inline constexpr size_t kDefaultMaxSkippedMessageKeys = 1000;
inline constexpr uint64_t kDefaultMaxForwardSkip = 10000;
inline constexpr size_t kDefaultMaxPreviousRatchetKeys = 16;
inline constexpr size_t kDefaultMaxOneTimePreKeys = 100;
inline constexpr size_t kDefaultMaxConsumedRemotePreKeys = 10000;
inline constexpr std::chrono::milliseconds kDefaultChallengeFreshness{5 * 60 * 1000};
inline constexpr std::chrono::milliseconds kMaxChallengeFreshness{7LL * 24 * 60 * 60 * 1000};

// Multicodec tag for Ed25519 public keys in did:key identifiers.
inline constexpr uint8_t kDidKeyTypeTag0 = 0xED;
inline constexpr uint8_t kDidKeyTypeTag1 = 0x01;
inline constexpr std::string_view kDidKeyPrefix = "did:key:z";

// Chain ratchet tags: HMAC(ck, 0x01) -> message key, HMAC(ck, 0x02) -> next chain key.
inline constexpr uint8_t kMessageKeyConstant = 0x01;
inline constexpr uint8_t kChainKeyConstant = 0x02;

inline constexpr uint8_t kX3dhPaddingByte = 0xFF;

inline constexpr std::string_view kX3dhInfo = "Tessera-X3DH";
inline constexpr std::string_view kDhRatchetInfo = "Tessera-DH-Ratchet";
inline constexpr std::string_view kMessageKeysInfo = "Tessera-Message-Keys";
inline constexpr std::string_view kStateHmacInfo = "Tessera-State-HMAC";

inline constexpr std::string_view kSignatureField = "signature";
inline constexpr std::string_view kSignaturesField = "signatures";

}
