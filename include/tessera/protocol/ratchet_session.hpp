#pragma once
#include "tessera/core/failures.hpp"
#include "tessera/core/result.hpp"
#include "tessera/configuration/session_config.hpp"
#include "tessera/interfaces/i_session_event_handler.hpp"
#include "tessera/protocol/key_exchange_coordinator.hpp"
#include "tessera/protocol/skipped_message_key_cache.hpp"
#include "protocol/envelope.pb.h"
#include "protocol/state.pb.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace tessera::protocol {
using configuration::SessionConfig;

/// Double Ratchet session with one remote peer.
///
/// Every envelope is encrypted under a fresh message key from the sending
/// chain; every new remote ratchet key in an inbound header triggers a DH
/// ratchet step. Keys for messages that arrive ahead of their predecessors
/// are parked in a SkippedMessageKeyCache and consumed on arrival.
///
/// Each call works on a copy of the state and commits only when it succeeds,
/// so a failed decrypt (bad tag, unavailable key, malformed header) leaves
/// the session exactly as it was.
///
/// Thread Safety: All public methods are thread-safe; calls on one session
/// are serialized by an internal mutex.
class RatchetSession {
public:
    /// Initiator side: ratchets immediately against the responder's signed
    /// prekey, so it can send before receiving anything.
    [[nodiscard]] static Result<std::unique_ptr<RatchetSession>, ProtocolFailure> InitializeAsInitiator(
        std::string peer_id,
        SessionSeed seed,
        const SessionConfig& config = SessionConfig::Default());

    /// Responder side: has no sending chain until the initiator's first
    /// message arrives; Encrypt fails with InvalidState before that.
    [[nodiscard]] static Result<std::unique_ptr<RatchetSession>, ProtocolFailure> InitializeAsResponder(
        std::string peer_id,
        SessionSeed seed,
        const SessionConfig& config = SessionConfig::Default());

    /// Restore an exported state after checking its HMAC, key sizes and
    /// counters.
    [[nodiscard]] static Result<std::unique_ptr<RatchetSession>, ProtocolFailure> FromState(
        const proto::protocol::RatchetState& state,
        const SessionConfig& config = SessionConfig::Default());

    [[nodiscard]] Result<proto::protocol::RatchetState, ProtocolFailure> ExportState() const;

    [[nodiscard]] Result<proto::protocol::MessageEnvelope, ProtocolFailure> Encrypt(
        std::span<const uint8_t> plaintext);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        const proto::protocol::MessageEnvelope& envelope);

    void SetEventHandler(std::shared_ptr<ISessionEventHandler> handler);

    [[nodiscard]] const std::string& PeerId() const noexcept { return peer_id_; }
    [[nodiscard]] const SessionConfig& Config() const noexcept { return config_; }
    [[nodiscard]] bool IsInitiator() const;
    [[nodiscard]] bool CanSend() const;
    [[nodiscard]] uint64_t SendMessageNumber() const;
    [[nodiscard]] uint64_t ReceiveMessageNumber() const;
    [[nodiscard]] size_t SkippedKeyCount() const;
    [[nodiscard]] std::vector<uint8_t> LocalRatchetPublicKey() const;

    RatchetSession(const RatchetSession&) = delete;
    RatchetSession& operator=(const RatchetSession&) = delete;
    RatchetSession(RatchetSession&&) noexcept = delete;
    RatchetSession& operator=(RatchetSession&&) noexcept = delete;
    ~RatchetSession();

private:
    struct ReceiveOutcome {
        bool ratchet_stepped = false;
        size_t evicted = 0;
    };

    RatchetSession(
        std::string peer_id,
        SessionConfig config,
        proto::protocol::RatchetState state,
        SkippedMessageKeyCache skipped);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DecryptLocked(
        const proto::protocol::MessageEnvelope& envelope,
        ReceiveOutcome& outcome);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DecryptWithKey(
        std::span<const uint8_t> message_key,
        const proto::protocol::MessageEnvelope& envelope,
        std::span<const uint8_t> associated_data) const;

    [[nodiscard]] Result<size_t, ProtocolFailure> SkipMessageKeys(
        proto::protocol::RatchetState& state,
        SkippedMessageKeyCache& skipped,
        uint64_t until) const;

    [[nodiscard]] Result<Unit, ProtocolFailure> DhRatchetStep(
        proto::protocol::RatchetState& state,
        std::span<const uint8_t> remote_public_key) const;

    [[nodiscard]] ProtocolFailure Contextualize(ProtocolFailure failure, uint64_t message_number) const;

    std::string peer_id_;
    SessionConfig config_;
    proto::protocol::RatchetState state_;
    SkippedMessageKeyCache skipped_;
    std::shared_ptr<ISessionEventHandler> event_handler_;
    mutable std::mutex lock_;
};

}
