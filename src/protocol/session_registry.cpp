#include "tessera/protocol/session_registry.hpp"
#include "tessera/debug/log.hpp"
#include <mutex>

namespace tessera::protocol {

using debug::Log;

namespace {
    constexpr std::string_view kLogTag = "REGISTRY";
}

SessionRegistry::SessionRegistry()
    : lock_(std::make_unique<std::shared_mutex>()) {}

Result<Unit, ProtocolFailure> SessionRegistry::Add(std::unique_ptr<RatchetSession> session) {
    if (!session) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Cannot register a null session"));
    }
    std::string peer_id = session->PeerId();
    std::unique_lock lock(*lock_);
    if (sessions_.contains(peer_id)) {
        auto failure = ProtocolFailure::InvalidState("A session for this peer is already registered");
        return Result<Unit, ProtocolFailure>::Err(std::move(failure).WithPeer(peer_id));
    }
    sessions_.emplace(std::move(peer_id), std::shared_ptr<RatchetSession>(std::move(session)));
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

std::shared_ptr<RatchetSession> SessionRegistry::Find(const std::string& peer_id) const {
    std::shared_lock lock(*lock_);
    const auto it = sessions_.find(peer_id);
    return it == sessions_.end() ? nullptr : it->second;
}

bool SessionRegistry::Remove(const std::string& peer_id) {
    std::unique_lock lock(*lock_);
    return sessions_.erase(peer_id) > 0;
}

bool SessionRegistry::Contains(const std::string& peer_id) const {
    std::shared_lock lock(*lock_);
    return sessions_.contains(peer_id);
}

size_t SessionRegistry::Size() const {
    std::shared_lock lock(*lock_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::PeerIds() const {
    std::shared_lock lock(*lock_);
    std::vector<std::string> peer_ids;
    peer_ids.reserve(sessions_.size());
    for (const auto& [peer_id, session] : sessions_) {
        peer_ids.push_back(peer_id);
    }
    return peer_ids;
}

void SessionRegistry::Clear() {
    std::unique_lock lock(*lock_);
    Log::Debug(kLogTag, "Dropping {} sessions", sessions_.size());
    sessions_.clear();
}

Result<proto::protocol::MessageEnvelope, ProtocolFailure> SessionRegistry::Encrypt(
    const std::string& peer_id,
    std::span<const uint8_t> plaintext) {
    auto session_result = Require(peer_id);
    if (session_result.IsErr()) {
        return Result<proto::protocol::MessageEnvelope, ProtocolFailure>::Err(session_result.UnwrapErr());
    }
    return session_result.Unwrap()->Encrypt(plaintext);
}

Result<std::vector<uint8_t>, ProtocolFailure> SessionRegistry::Decrypt(
    const std::string& peer_id,
    const proto::protocol::MessageEnvelope& envelope) {
    auto session_result = Require(peer_id);
    if (session_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(session_result.UnwrapErr());
    }
    return session_result.Unwrap()->Decrypt(envelope);
}

Result<std::shared_ptr<RatchetSession>, ProtocolFailure> SessionRegistry::Require(const std::string& peer_id) const {
    auto session = Find(peer_id);
    if (!session) {
        return Result<std::shared_ptr<RatchetSession>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("No session registered for peer").WithPeer(peer_id));
    }
    return Result<std::shared_ptr<RatchetSession>, ProtocolFailure>::Ok(std::move(session));
}

}
