#pragma once
#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"
#include "tessera/crypto/sodium_secure_memory_handle.hpp"
#include "tessera/identity/identity_store.hpp"
#include "tessera/protocol/constants.hpp"
#include "protocol/key_exchange.pb.h"
#include <cstdint>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>
namespace tessera::protocol {
using crypto::SecureMemoryHandle;

/// Everything a RatchetSession needs from a completed key exchange.
struct SessionSeed {
    /// X3DH output; becomes the first root key.
    SecureMemoryHandle shared_secret;
    /// Initiator: the responder's signed prekey. Responder: empty until the
    /// first message arrives.
    std::vector<uint8_t> remote_ratchet_public_key;
    /// Responder only: the signed prekey pair, reused as the first sending
    /// ratchet key.
    SecureMemoryHandle local_ratchet_private_key;
    std::vector<uint8_t> local_ratchet_public_key;
    /// IK_initiator || IK_responder (Ed25519 public keys).
    std::vector<uint8_t> associated_data;
    std::string remote_did;
};

namespace detail {
    using Agreement = Result<std::vector<uint8_t>, ProtocolFailure>;

    /// Wipes every successful DH output.
    void WipeAgreements(std::initializer_list<Agreement*> agreements);

    /// First failure among the DH results. Successful outputs are wiped
    /// before it is returned.
    [[nodiscard]] std::optional<ProtocolFailure> FirstAgreementFailure(std::initializer_list<Agreement*> agreements);
}

struct InitiatorHandshake {
    SessionSeed seed;
    proto::protocol::InitialMessage initial_message;
};

/**
 * @brief X3DH-style asynchronous key agreement over the local identity
 *
 * Responder side: keeps one signed prekey and a table of unused one-time
 * prekeys, publishes bundles, and accepts initial messages. Initiator side:
 * verifies a remote bundle and derives the shared secret with a fresh
 * ephemeral key.
 *
 * SK = HKDF(0xFF*32 || DH1 || DH2 || DH3 || DH4, salt = 0*32, info = "Tessera-X3DH")
 * - DH1 = DH(IK_A, SPK_B)
 * - DH2 = DH(EK_A, IK_B)
 * - DH3 = DH(EK_A, SPK_B)
 * - DH4 = DH(EK_A, OPK_B)
 *
 * Identity keys are the Ed25519 signing keys mapped onto Curve25519.
 *
 * Both the unused one-time prekey table and the record of remote one-time
 * prekeys already consumed are bounded; when full, the oldest entry is
 * dropped (its secret wiped). A bundle whose one-time prekey was evicted
 * can no longer start a session.
 *
 * Thread Safety: all public methods are thread-safe.
 */
class KeyExchangeCoordinator {
public:
    /**
     * @param max_one_time_pre_keys Unused one-time prekeys kept for
     *        published bundles
     * @param max_consumed_remote_pre_keys Remote one-time prekeys remembered
     *        to refuse bundle reuse
     */
    explicit KeyExchangeCoordinator(
        identity::IdentityStore& identity,
        size_t max_one_time_pre_keys = kDefaultMaxOneTimePreKeys,
        size_t max_consumed_remote_pre_keys = kDefaultMaxConsumedRemotePreKeys);

    /// Replace the signed prekey. Initial messages addressed to the old one
    /// are refused afterwards.
    [[nodiscard]] Result<Unit, ProtocolFailure> RotateSignedPreKey();

    /// Bundle with a freshly generated one-time prekey.
    [[nodiscard]] Result<proto::protocol::KeyExchangeBundle, ProtocolFailure> PublishBundle();

    /**
     * @brief Verify a remote bundle and derive the initiator's seed
     *
     * No secret is derived unless the signed prekey signature verifies
     * (InvalidBundleSignature otherwise). A bundle whose one-time prekey was
     * already consumed here is refused with Handshake.
     */
    [[nodiscard]] Result<InitiatorHandshake, ProtocolFailure> ConsumeBundle(
        const proto::protocol::KeyExchangeBundle& bundle);

    /**
     * @brief Derive the responder's seed from an initiator's first message
     *
     * The referenced one-time prekey is deleted on success.
     */
    [[nodiscard]] Result<SessionSeed, ProtocolFailure> AcceptInitialMessage(
        const proto::protocol::InitialMessage& message);

    [[nodiscard]] size_t AvailableOneTimePreKeys() const;
    [[nodiscard]] size_t ConsumedRemotePreKeys() const;

    void Wipe();

    [[nodiscard]] static Result<bool, ProtocolFailure> VerifyBundleSignature(
        const proto::protocol::KeyExchangeBundle& bundle);

    KeyExchangeCoordinator(const KeyExchangeCoordinator&) = delete;
    KeyExchangeCoordinator& operator=(const KeyExchangeCoordinator&) = delete;

private:
    struct SignedPreKey {
        SecureMemoryHandle private_key;
        std::vector<uint8_t> public_key;
        std::vector<uint8_t> signature;
    };

    struct OneTimePreKey {
        uint64_t sequence;
        SecureMemoryHandle private_key;
    };

    [[nodiscard]] Result<Unit, ProtocolFailure> RotateSignedPreKeyLocked();
    void RememberConsumedRemoteKeyLocked(std::vector<uint8_t> public_key);

    [[nodiscard]] static Result<SecureMemoryHandle, ProtocolFailure> DeriveSharedSecret(
        std::span<const uint8_t> dh1,
        std::span<const uint8_t> dh2,
        std::span<const uint8_t> dh3,
        std::span<const uint8_t> dh4);

    identity::IdentityStore& identity_;
    std::optional<SignedPreKey> signed_pre_key_;
    size_t max_one_time_pre_keys_;
    size_t max_consumed_remote_pre_keys_;
    uint64_t next_sequence_ = 0;
    std::map<std::vector<uint8_t>, OneTimePreKey> one_time_pre_keys_;
    std::map<uint64_t, std::vector<uint8_t>> one_time_pre_key_order_;
    std::map<std::vector<uint8_t>, uint64_t> consumed_remote_one_time_keys_;
    std::map<uint64_t, std::vector<uint8_t>> consumed_remote_order_;
    mutable std::mutex lock_;
};

}
