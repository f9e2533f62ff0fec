#pragma once
#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"
#include "tessera/protocol/ratchet_session.hpp"
#include "protocol/envelope.pb.h"
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

namespace tessera::protocol {

/**
 * @brief Peer id -> RatchetSession map
 *
 * The registry lock only guards the map. Encrypt and Decrypt look the session
 * up under a shared lock and release it before touching the session, which
 * serializes itself; traffic for different peers runs in parallel.
 */
class SessionRegistry {
public:
    SessionRegistry();

    /// Fails with InvalidState if a session for the same peer is registered.
    [[nodiscard]] Result<Unit, ProtocolFailure> Add(std::unique_ptr<RatchetSession> session);

    [[nodiscard]] std::shared_ptr<RatchetSession> Find(const std::string& peer_id) const;

    /// @return true if a session was removed
    bool Remove(const std::string& peer_id);

    [[nodiscard]] bool Contains(const std::string& peer_id) const;
    [[nodiscard]] size_t Size() const;
    [[nodiscard]] std::vector<std::string> PeerIds() const;

    void Clear();

    [[nodiscard]] Result<proto::protocol::MessageEnvelope, ProtocolFailure> Encrypt(
        const std::string& peer_id,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        const std::string& peer_id,
        const proto::protocol::MessageEnvelope& envelope);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

private:
    [[nodiscard]] Result<std::shared_ptr<RatchetSession>, ProtocolFailure> Require(const std::string& peer_id) const;

    std::map<std::string, std::shared_ptr<RatchetSession>> sessions_;
    mutable std::unique_ptr<std::shared_mutex> lock_;
};

}
